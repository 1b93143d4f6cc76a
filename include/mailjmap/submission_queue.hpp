/** SubmissionQueue [MailJMAP]
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

#ifndef SubmissionQueue_hpp
#define SubmissionQueue_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"

#include "mailjmap/change_log.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/outbound_transport.hpp"
#include "mailjmap/models/email_submission.hpp"

struct ClaimedSubmission {
    std::string id;
    std::string accountId;
    std::string emailId;
    nlohmann::json envelope;
    int retryCount;
    nlohmann::json deliveryStatus;
    std::string rawBlobSha256;
    size_t size;
};

/**
 * Drives pending EmailSubmissions through the outbound transport.
 *
 * claimSubmission flips a due submission from pending to sending with a
 * conditional UPDATE, so at most one caller ever sends a given submission.
 * The transport runs outside of any transaction; its outcome is written back
 * (status, retry schedule and per-recipient delivery status) afterwards.
 */
class SubmissionQueue {
    MailStore * store;
    ChangeLog * changes;
    OutboundTransport * transport;

public:
    SubmissionQueue(MailStore * store, ChangeLog * changes, OutboundTransport * transport);

    static time_t computeNextAttempt(int retryCount, time_t now);
    static int maxRetryAttempts();

    // Accepts {mailFrom, rcptTo} as plain strings or as JMAP {email} objects.
    static bool parseEnvelope(const nlohmann::json & json, OutboundEnvelope & envelope);

    // Returns nullptr when the submission is not due, already claimed, or was
    // failed permanently because its Email or blob is gone.
    std::shared_ptr<ClaimedSubmission> claimSubmission(std::string submissionId, time_t now);

    void sendClaimed(const ClaimedSubmission & claimed, time_t now);

    bool processSingleSubmission(std::string submissionId, time_t now);

    // Processes up to `limit` due submissions sequentially, oldest first.
    int processQueue(int limit, time_t now);

private:
    void failBeforeSend(std::shared_ptr<EmailSubmission> submission, nlohmann::json statusMap, time_t now);
    void handleSendResult(std::string submissionId, nlohmann::json statusMap, std::string queueStatus, time_t nextAttemptAt, int retryCount, time_t now);
};

#endif /* SubmissionQueue_hpp */
