#include "mailjmap/submission_queue.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/delivery_status.hpp"
#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/sync_exception.hpp"
#include "mailjmap/models/email.hpp"

#include <algorithm>

#include "spdlog/spdlog.h"

static std::vector<std::string> recipientsOf(const nlohmann::json & envelope) {
    OutboundEnvelope parsed;
    if (!SubmissionQueue::parseEnvelope(envelope, parsed)) {
        return {};
    }
    return parsed.rcptTo;
}

SubmissionQueue::SubmissionQueue(MailStore * store, ChangeLog * changes, OutboundTransport * transport) :
    store(store), changes(changes), transport(transport)
{
}

time_t SubmissionQueue::computeNextAttempt(int retryCount, time_t now) {
    // retry N waits SUBMISSION_RETRY_DELAYS[N - 1]
    int idx = std::min(retryCount - 1, (int)SUBMISSION_RETRY_DELAYS.size() - 1);
    if (idx < 0) {
        idx = 0;
    }
    return now + SUBMISSION_RETRY_DELAYS[idx];
}

int SubmissionQueue::maxRetryAttempts() {
    return (int)SUBMISSION_RETRY_DELAYS.size();
}

bool SubmissionQueue::parseEnvelope(const nlohmann::json & json, OutboundEnvelope & envelope) {
    if (!json.is_object() || !json.count("mailFrom") || !json.count("rcptTo") || !json["rcptTo"].is_array()) {
        return false;
    }
    auto addressOf = [](const nlohmann::json & value) -> std::string {
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (value.is_object() && value.count("email") && value["email"].is_string()) {
            return value["email"].get<std::string>();
        }
        return "";
    };

    envelope.mailFrom = addressOf(json["mailFrom"]);
    if (envelope.mailFrom == "") {
        return false;
    }
    envelope.rcptTo.clear();
    for (const auto & rcpt : json["rcptTo"]) {
        std::string address = addressOf(rcpt);
        if (address == "") {
            return false;
        }
        envelope.rcptTo.push_back(address);
    }
    return true;
}

void SubmissionQueue::failBeforeSend(std::shared_ptr<EmailSubmission> submission, nlohmann::json statusMap, time_t now) {
    submission->setStatus(SUBMISSION_STATUS_FAILED);
    submission->setUndoStatus(UNDO_STATUS_FINAL);
    submission->setNextAttemptAt(-1);
    submission->setDeliveryStatus(statusMap);
    submission->setUpdatedAt(now);
    store->save(submission.get());
    changes->recordUpdate(submission->accountId(), TYPE_EMAIL_SUBMISSION, submission->id(), {"status", "nextAttemptAt", "undoStatus", "deliveryStatus"});
}

std::shared_ptr<ClaimedSubmission> SubmissionQueue::claimSubmission(std::string submissionId, time_t now) {
    auto logger = spdlog::get("logger");
    MailStoreTransaction transaction{store, "claimSubmission"};

    auto submission = store->find<EmailSubmission>(Query().equal("id", submissionId));
    if (submission == nullptr) {
        return nullptr;
    }
    nlohmann::json statusMap = DeliveryStatus::normalize(submission->deliveryStatus(), recipientsOf(submission->envelope()));

    if (submission->status() != SUBMISSION_STATUS_PENDING) {
        return nullptr;
    }
    if (submission->nextAttemptAt() > now) {
        return nullptr;
    }
    if (submission->undoStatus() == UNDO_STATUS_CANCELED) {
        return nullptr;
    }

    auto email = store->find<Email>(Query().equal("id", submission->emailId()));
    if (email == nullptr || email->isDeleted()) {
        auto record = DeliveryStatusRecord::Make(550, "5.2.0", "Email deleted before sending", DELIVERED_NO);
        failBeforeSend(submission, DeliveryStatus::applyToRecipients(statusMap, {}, record), now);
        transaction.commit();
        logger->warn("Submission {} failed: email {} is gone", submissionId, submission->emailId());
        return nullptr;
    }

    SQLite::Statement message(store->db(), "SELECT Message.rawBlobSha256, Message.size FROM Message INNER JOIN Blob ON Blob.sha256 = Message.rawBlobSha256 WHERE Message.id = ?");
    message.bind(1, email->messageId());
    if (!message.executeStep() || message.getColumn(0).isNull() || message.getColumn(1).isNull()) {
        auto record = DeliveryStatusRecord::Make(550, "5.3.0", "Email blob missing before sending", DELIVERED_NO);
        failBeforeSend(submission, DeliveryStatus::applyToRecipients(statusMap, {}, record), now);
        transaction.commit();
        logger->warn("Submission {} failed: blob for email {} is missing", submissionId, submission->emailId());
        return nullptr;
    }
    std::string rawBlobSha256 = message.getColumn(0).getString();
    size_t size = (size_t)message.getColumn(1).getInt64();

    SQLite::Statement cas(store->db(), "UPDATE EmailSubmission SET status = ?, undoStatus = ?, updatedAt = ?, data = json_set(data, '$.status', ?, '$.undoStatus', ?, '$.updatedAt', ?) WHERE id = ? AND status = ?");
    cas.bind(1, SUBMISSION_STATUS_SENDING);
    cas.bind(2, UNDO_STATUS_FINAL);
    cas.bind(3, (long long)now);
    cas.bind(4, SUBMISSION_STATUS_SENDING);
    cas.bind(5, UNDO_STATUS_FINAL);
    cas.bind(6, (long long)now);
    cas.bind(7, submissionId);
    cas.bind(8, SUBMISSION_STATUS_PENDING);
    if (cas.exec() == 0) {
        logger->info("Submission {} was claimed by another worker", submissionId);
        return nullptr;
    }
    changes->recordUpdate(submission->accountId(), TYPE_EMAIL_SUBMISSION, submissionId, {"status", "undoStatus"});
    transaction.commit();

    return std::make_shared<ClaimedSubmission>(ClaimedSubmission{
        submissionId,
        submission->accountId(),
        submission->emailId(),
        submission->envelope(),
        submission->retryCount(),
        statusMap,
        rawBlobSha256,
        size,
    });
}

void SubmissionQueue::handleSendResult(std::string submissionId, nlohmann::json statusMap, std::string queueStatus, time_t nextAttemptAt, int retryCount, time_t now) {
    MailStoreTransaction transaction{store, "submissionResult"};

    auto submission = store->find<EmailSubmission>(Query().equal("id", submissionId));
    if (submission == nullptr) {
        // destroyed while the send was in flight
        return;
    }
    if (submission->status() != SUBMISSION_STATUS_SENDING) {
        // an SES event already settled it
        spdlog::get("logger")->info("Submission {} is already {}, not recording transport outcome {}", submissionId, submission->status(), queueStatus);
        return;
    }
    submission->setStatus(queueStatus);
    submission->setNextAttemptAt(nextAttemptAt);
    submission->setRetryCount(retryCount);
    submission->setDeliveryStatus(statusMap);
    submission->setUpdatedAt(now);
    store->save(submission.get());
    changes->recordUpdate(submission->accountId(), TYPE_EMAIL_SUBMISSION, submissionId, {"status", "nextAttemptAt", "retryCount", "deliveryStatus"});

    transaction.commit();
}

void SubmissionQueue::sendClaimed(const ClaimedSubmission & claimed, time_t now) {
    auto logger = spdlog::get("logger");

    OutboundEnvelope envelope;
    if (!parseEnvelope(claimed.envelope, envelope) || envelope.rcptTo.size() == 0) {
        auto record = DeliveryStatusRecord::Make(550, "5.5.4", "Invalid envelope", DELIVERED_NO);
        handleSendResult(claimed.id, DeliveryStatus::applyToRecipients(claimed.deliveryStatus, {}, record), SUBMISSION_STATUS_FAILED, -1, claimed.retryCount, now);
        logger->error("Submission {} failed: invalid envelope", claimed.id);
        return;
    }

    OutboundMessage message{
        claimed.accountId,
        claimed.id,
        claimed.emailId,
        envelope,
        OutboundMimeRef{false, "", claimed.rawBlobSha256, claimed.size},
    };

    int nextRetryCount = claimed.retryCount + 1;
    OutboundDeliveryResult outcome;
    try {
        outcome = transport->send(message);
    } catch (std::exception & ex) {
        if (nextRetryCount > maxRetryAttempts()) {
            auto record = DeliveryStatusRecord::Make(550, "5.4.4", "Transport error", DELIVERED_NO);
            handleSendResult(claimed.id, DeliveryStatus::applyToRecipients(claimed.deliveryStatus, envelope.rcptTo, record), SUBMISSION_STATUS_FAILED, -1, nextRetryCount, now);
            logger->error("Submission {} failed permanently after {} attempts: {}", claimed.id, nextRetryCount, ex.what());
            return;
        }
        auto record = DeliveryStatusRecord::Make(451, "4.4.0", ex.what(), DELIVERED_QUEUED);
        time_t nextAttempt = computeNextAttempt(nextRetryCount, now);
        handleSendResult(claimed.id, DeliveryStatus::applyToRecipients(claimed.deliveryStatus, envelope.rcptTo, record), SUBMISSION_STATUS_PENDING, nextAttempt, nextRetryCount, now);
        logger->warn("Submission {} transport error (attempt {}), retrying at {}: {}", claimed.id, nextRetryCount, nextAttempt, ex.what());
        return;
    }

    if (outcome.status == OUTBOUND_STATUS_ACCEPTED) {
        auto record = DeliveryStatusRecord::Make(250, "2.0.0", outcome.reason != "" ? outcome.reason : "Accepted by outbound transport", DELIVERED_QUEUED, outcome.providerMessageId, outcome.providerRequestId);
        handleSendResult(claimed.id, DeliveryStatus::applyToRecipients(claimed.deliveryStatus, envelope.rcptTo, record), SUBMISSION_STATUS_SENT, -1, nextRetryCount, now);
        logger->info("Submission {} accepted by transport ({})", claimed.id, outcome.providerMessageId);
        return;
    }

    if (outcome.status == OUTBOUND_STATUS_REJECTED && outcome.permanent) {
        auto record = DeliveryStatusRecord::Make(550, "5.7.1", outcome.reason != "" ? outcome.reason : "Message rejected by outbound transport", DELIVERED_NO, outcome.providerMessageId, outcome.providerRequestId);
        handleSendResult(claimed.id, DeliveryStatus::applyToRecipients(claimed.deliveryStatus, envelope.rcptTo, record), SUBMISSION_STATUS_FAILED, -1, nextRetryCount, now);
        logger->warn("Submission {} rejected permanently: {}", claimed.id, outcome.reason);
        return;
    }

    if (nextRetryCount > maxRetryAttempts()) {
        auto record = DeliveryStatusRecord::Make(550, "5.4.1", outcome.reason != "" ? outcome.reason : "Delivery failed after retries", DELIVERED_NO, outcome.providerMessageId, outcome.providerRequestId);
        handleSendResult(claimed.id, DeliveryStatus::applyToRecipients(claimed.deliveryStatus, envelope.rcptTo, record), SUBMISSION_STATUS_FAILED, -1, nextRetryCount, now);
        logger->error("Submission {} failed after {} attempts: {}", claimed.id, nextRetryCount, outcome.reason);
        return;
    }

    auto record = DeliveryStatusRecord::Make(451, "4.4.0", outcome.reason != "" ? outcome.reason : "Temporary delivery issue", DELIVERED_QUEUED, outcome.providerMessageId, outcome.providerRequestId);
    time_t nextAttempt = computeNextAttempt(nextRetryCount, now);
    handleSendResult(claimed.id, DeliveryStatus::applyToRecipients(claimed.deliveryStatus, envelope.rcptTo, record), SUBMISSION_STATUS_PENDING, nextAttempt, nextRetryCount, now);
    logger->warn("Submission {} not accepted (attempt {}), retrying at {}: {}", claimed.id, nextRetryCount, nextAttempt, outcome.reason);
}

bool SubmissionQueue::processSingleSubmission(std::string submissionId, time_t now) {
    auto claimed = claimSubmission(submissionId, now);
    if (claimed == nullptr) {
        return false;
    }
    sendClaimed(*claimed, now);
    return true;
}

int SubmissionQueue::processQueue(int limit, time_t now) {
    std::vector<std::string> ids;
    {
        SQLite::Statement query(store->db(), "SELECT id FROM EmailSubmission WHERE status = ? AND (nextAttemptAt IS NULL OR nextAttemptAt <= ?) ORDER BY createdAt ASC LIMIT ?");
        query.bind(1, SUBMISSION_STATUS_PENDING);
        query.bind(2, (long long)now);
        query.bind(3, limit);
        while (query.executeStep()) {
            ids.push_back(query.getColumn(0).getString());
        }
    }

    int processed = 0;
    for (const auto & id : ids) {
        try {
            if (processSingleSubmission(id, now)) {
                processed++;
            }
        } catch (SQLite::Exception & ex) {
            spdlog::get("logger")->error("Submission {} could not be processed: {}", id, ex.what());
        } catch (SyncException & ex) {
            spdlog::get("logger")->error("Submission {} could not be processed: {}", id, ex.debuginfo);
        }
    }
    return processed;
}
