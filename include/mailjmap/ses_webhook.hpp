/** SesWebhook [MailJMAP]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SesWebhook_hpp
#define SesWebhook_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailjmap/change_log.hpp"
#include "mailjmap/delivery_status.hpp"
#include "mailjmap/endpoint_response.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/server_config.hpp"
#include "mailjmap/sns_verifier.hpp"

struct SesEventOutcome {
    std::string submissionId;
    std::string queueStatus;
    DeliveryStatusRecord record;
    // Addresses the event is about. Empty means every recipient.
    std::vector<std::string> recipients;
};

/**
 * POST /ses/events. SES publishes delivery, bounce, complaint, reject and
 * failure events to an SNS topic which delivers them here. Each verified
 * event moves the tagged EmailSubmission to its final state.
 */
class SesWebhook {
    MailStore * store;
    ChangeLog * changes;
    ServerConfig * config;
    SnsCertificateCache * certificates;

public:
    SesWebhook(MailStore * store, ChangeLog * changes, ServerConfig * config, SnsCertificateCache * certificates);
    virtual ~SesWebhook() = default;

    EndpointResponse handle(std::string token, const std::string & body);

    // Accepts a bare array of records, {Records: [...]} or one SNS message.
    // Returns the SNS message objects.
    static std::vector<nlohmann::json> normalizeEvents(const nlohmann::json & payload);

    // False when the notification has no submission tag or an unknown eventType.
    static bool mapNotification(const nlohmann::json & message, SesEventOutcome & outcome);

    bool applyOutcome(const SesEventOutcome & outcome);

protected:
    virtual void confirmSubscription(std::string subscribeURL);

private:
    bool processEvent(const nlohmann::json & sns);
};

#endif /* SesWebhook_hpp */
