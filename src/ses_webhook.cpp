#include "mailjmap/ses_webhook.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/network_request_utils.hpp"
#include "mailjmap/submission_queue.hpp"
#include "mailjmap/sync_exception.hpp"
#include "mailjmap/models/email_submission.hpp"

#include "spdlog/spdlog.h"

static bool isSnsMessage(const nlohmann::json & value) {
    return value.is_object() && value.count("Message") && value["Message"].is_string();
}

static std::string stringAt(const nlohmann::json & object, const char * key) {
    if (object.is_object() && object.count(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

static std::vector<std::string> addressesIn(const nlohmann::json & list, const char * key) {
    std::vector<std::string> result;
    if (!list.is_array()) {
        return result;
    }
    for (const auto & item : list) {
        if (key == nullptr && item.is_string()) {
            result.push_back(item.get<std::string>());
        } else if (key != nullptr && stringAt(item, key) != "") {
            result.push_back(stringAt(item, key));
        }
    }
    return result;
}

SesWebhook::SesWebhook(MailStore * store, ChangeLog * changes, ServerConfig * config, SnsCertificateCache * certificates) :
    store(store), changes(changes), config(config), certificates(certificates)
{
}

std::vector<nlohmann::json> SesWebhook::normalizeEvents(const nlohmann::json & payload) {
    std::vector<nlohmann::json> events;
    auto addRecord = [&](const nlohmann::json & record) {
        if (record.is_object() && record.count("Sns") && isSnsMessage(record["Sns"])) {
            events.push_back(record["Sns"]);
        }
    };

    if (payload.is_array()) {
        for (const auto & record : payload) {
            addRecord(record);
        }
    } else if (payload.is_object() && payload.count("Records") && payload["Records"].is_array()) {
        for (const auto & record : payload["Records"]) {
            addRecord(record);
        }
    } else if (isSnsMessage(payload) && payload.count("Type")) {
        events.push_back(payload);
    }
    return events;
}

bool SesWebhook::mapNotification(const nlohmann::json & message, SesEventOutcome & outcome) {
    if (!message.is_object()) {
        return false;
    }
    std::string eventType = MailUtils::toUpper(stringAt(message, "eventType"));
    if (eventType == "") {
        eventType = MailUtils::toUpper(stringAt(message, "notificationType"));
    }

    const nlohmann::json & mail = message.count("mail") ? message["mail"] : nlohmann::json::object();
    outcome.submissionId = "";
    if (mail.is_object() && mail.count("tags") && mail["tags"].is_object()) {
        const nlohmann::json & tags = mail["tags"];
        for (const char * key : {"submissionId", "SubmissionId"}) {
            if (tags.count(key) && tags[key].is_array() && tags[key].size() > 0 && tags[key][0].is_string()) {
                outcome.submissionId = tags[key][0].get<std::string>();
                break;
            }
        }
    }
    if (outcome.submissionId == "") {
        return false;
    }
    std::string providerMessageId = stringAt(mail, "messageId");
    outcome.recipients.clear();

    if (eventType == "DELIVERY") {
        const nlohmann::json & delivery = message.count("delivery") ? message["delivery"] : nlohmann::json::object();
        std::string smtpResponse = stringAt(delivery, "smtpResponse");
        outcome.queueStatus = SUBMISSION_STATUS_SENT;
        outcome.record = DeliveryStatusRecord::Make(250, "2.0.0", "Delivered", DELIVERED_YES, providerMessageId);
        if (smtpResponse != "") {
            outcome.record.smtpReply = smtpResponse;
        }
        if (delivery.is_object() && delivery.count("recipients")) {
            outcome.recipients = addressesIn(delivery["recipients"], nullptr);
        }
        return true;
    }
    if (eventType == "BOUNCE") {
        const nlohmann::json & bounce = message.count("bounce") ? message["bounce"] : nlohmann::json::object();
        std::string diagnostic = "Bounce";
        if (bounce.is_object() && bounce.count("bouncedRecipients") && bounce["bouncedRecipients"].is_array()) {
            outcome.recipients = addressesIn(bounce["bouncedRecipients"], "emailAddress");
            if (bounce["bouncedRecipients"].size() > 0 && stringAt(bounce["bouncedRecipients"][0], "diagnosticCode") != "") {
                diagnostic = stringAt(bounce["bouncedRecipients"][0], "diagnosticCode");
            }
        }
        outcome.queueStatus = SUBMISSION_STATUS_FAILED;
        outcome.record = DeliveryStatusRecord::Make(550, "5.1.1", diagnostic, DELIVERED_NO, providerMessageId);
        return true;
    }
    if (eventType == "REJECT") {
        std::string reason = message.count("reject") ? stringAt(message["reject"], "reason") : "";
        outcome.queueStatus = SUBMISSION_STATUS_FAILED;
        outcome.record = DeliveryStatusRecord::Make(550, "5.7.1", reason == "" ? "Rejected" : reason, DELIVERED_NO, providerMessageId);
        return true;
    }
    if (eventType == "COMPLAINT") {
        const nlohmann::json & complaint = message.count("complaint") ? message["complaint"] : nlohmann::json::object();
        std::string feedback = stringAt(complaint, "complaintFeedbackType");
        if (complaint.is_object() && complaint.count("complainedRecipients")) {
            outcome.recipients = addressesIn(complaint["complainedRecipients"], "emailAddress");
        }
        outcome.queueStatus = SUBMISSION_STATUS_FAILED;
        outcome.record = DeliveryStatusRecord::Make(550, "5.7.1", feedback == "" ? "Complaint" : feedback, DELIVERED_NO, providerMessageId);
        return true;
    }
    if (eventType == "FAILURE" || eventType == "RENDERING FAILURE") {
        std::string reason = message.count("failure") ? stringAt(message["failure"], "errorMessage") : "";
        outcome.queueStatus = SUBMISSION_STATUS_FAILED;
        outcome.record = DeliveryStatusRecord::Make(554, "5.3.0", reason == "" ? "Failure" : reason, DELIVERED_NO, providerMessageId);
        return true;
    }
    return false;
}

bool SesWebhook::applyOutcome(const SesEventOutcome & outcome) {
    auto logger = spdlog::get("logger");
    MailStoreTransaction transaction{store, "sesWebhookApply"};

    auto submission = store->find<EmailSubmission>(Query().equal("id", outcome.submissionId));
    if (submission == nullptr) {
        logger->warn("SES event for unknown submission {}", outcome.submissionId);
        return false;
    }
    if (submission->status() == SUBMISSION_STATUS_CANCELED) {
        logger->info("Ignoring SES event for canceled submission {}", outcome.submissionId);
        return false;
    }

    OutboundEnvelope envelope;
    SubmissionQueue::parseEnvelope(submission->envelope(), envelope);
    nlohmann::json statusMap = DeliveryStatus::normalize(submission->deliveryStatus(), envelope.rcptTo);

    submission->setStatus(outcome.queueStatus);
    submission->setUndoStatus(UNDO_STATUS_FINAL);
    submission->setNextAttemptAt(-1);
    submission->setDeliveryStatus(DeliveryStatus::applyToRecipients(statusMap, outcome.recipients, outcome.record));
    submission->setUpdatedAt(time(0));
    store->save(submission.get());
    changes->recordUpdate(submission->accountId(), TYPE_EMAIL_SUBMISSION, submission->id(), {"status", "nextAttemptAt", "undoStatus", "deliveryStatus"});

    transaction.commit();
    logger->info("Submission {} is now {} ({})", submission->id(), outcome.queueStatus, outcome.record.smtpReply);
    return true;
}

void SesWebhook::confirmSubscription(std::string subscribeURL) {
    auto logger = spdlog::get("logger");
    try {
        CURL * curl = CreateRequest(subscribeURL, "GET", nullptr);
        HTTPResponse response = PerformHTTPRequest(curl);
        if (response.status < 200 || response.status >= 300) {
            logger->error("Failed to confirm SNS subscription: HTTP {}", response.status);
        } else {
            logger->info("Confirmed SNS subscription");
        }
    } catch (SyncException & ex) {
        logger->error("Error confirming SNS subscription: {}", ex.debuginfo);
    }
}

bool SesWebhook::processEvent(const nlohmann::json & sns) {
    auto logger = spdlog::get("logger");

    if (!SnsVerifier::verify(sns, certificates)) {
        logger->warn("Dropping SES event: SNS signature verification failed");
        return false;
    }
    std::string topicArn = stringAt(sns, "TopicArn");
    if (topicArn == "" || topicArn != config->sesTopicArn) {
        logger->warn("Dropping SNS message from unexpected topic {}", topicArn);
        return false;
    }

    std::string type = stringAt(sns, "Type");
    if (type == "SubscriptionConfirmation") {
        std::string url = stringAt(sns, "SubscribeURL");
        if (url != "") {
            confirmSubscription(url);
        }
        return false;
    }
    if (type != "" && type != "Notification") {
        return false;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(sns["Message"].get<std::string>());
    } catch (nlohmann::json::exception & ex) {
        logger->warn("Dropping SES event with unparseable message: {}", ex.what());
        return false;
    }

    SesEventOutcome outcome;
    if (!mapNotification(message, outcome)) {
        return false;
    }
    return applyOutcome(outcome);
}

EndpointResponse SesWebhook::handle(std::string token, const std::string & body) {
    if (config->sesWebhookToken == "") {
        return EndpointResponse::JSON(500, {{"error", "Webhook token not configured"}});
    }
    if (token != config->sesWebhookToken) {
        return EndpointResponse::JSON(401, {{"error", "Unauthorized"}});
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(body);
    } catch (nlohmann::json::exception &) {
        return EndpointResponse::JSON(400, {{"error", "Invalid JSON"}});
    }

    int processed = 0;
    for (const auto & sns : normalizeEvents(payload)) {
        if (processEvent(sns)) {
            processed++;
        }
    }
    return EndpointResponse::JSON(200, {{"processed", processed}});
}
