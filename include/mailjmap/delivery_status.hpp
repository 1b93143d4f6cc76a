/** DeliveryStatus [MailJMAP]
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

#ifndef DeliveryStatus_hpp
#define DeliveryStatus_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#define DELIVERED_QUEUED    "queued"
#define DELIVERED_YES       "yes"
#define DELIVERED_NO        "no"
#define DELIVERED_UNKNOWN   "unknown"

/**
 * One recipient's delivery status, in the shape EmailSubmission/get returns:
 * {smtpReply, delivered, displayed, providerMessageId?, providerRequestId?}.
 * A submission stores a map of these keyed by recipient address.
 */
struct DeliveryStatusRecord {
    std::string smtpReply;
    std::string delivered;
    std::string displayed;
    std::string providerMessageId;
    std::string providerRequestId;

    static DeliveryStatusRecord Make(int code, std::string enhanced, std::string text, std::string delivered, std::string providerMessageId = "", std::string providerRequestId = "");

    static bool IsRecord(const nlohmann::json & value);
    static DeliveryStatusRecord FromJSON(const nlohmann::json & json);
    nlohmann::json toJSON() const;
};

class DeliveryStatus {
public:
    // "250 2.0.0 Accepted"
    static std::string formatSmtpReply(int code, std::string enhanced, std::string text);

    static nlohmann::json initialMap(const std::vector<std::string> & recipients);

    /**
     * Returns a canonical per-recipient map for whatever is stored. Rows
     * written by older builds hold a single {status, lastAttempt, retryCount}
     * record; that record is converted and fanned out to the recipients.
     */
    static nlohmann::json normalize(const nlohmann::json & stored, const std::vector<std::string> & recipients);

    /**
     * Sets `record` for each recipient (matched case-insensitively against
     * existing keys), or for every existing key when recipients is empty.
     */
    static nlohmann::json applyToRecipients(const nlohmann::json & current, const std::vector<std::string> & recipients, const DeliveryStatusRecord & record);
};

#endif /* DeliveryStatus_hpp */
