#include "mailjmap/ses_transport.hpp"
#include "mailjmap/aws_sigv4.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/network_request_utils.hpp"
#include "mailjmap/sync_exception.hpp"

#include "spdlog/spdlog.h"

static std::string firstStringValue(const nlohmann::json & payload, std::vector<std::string> keys) {
    if (!payload.is_object()) {
        return "";
    }
    for (const auto & key : keys) {
        if (payload.count(key) && payload[key].is_string()) {
            return payload[key].get<std::string>();
        }
    }
    return "";
}

SesTransport::SesTransport(ServerConfig * config, BlobStore * blobs) :
    config(config), blobs(blobs)
{
}

nlohmann::json SesTransport::buildPayload(const OutboundMessage & message, const std::string & rawBytes) {
    return {
        {"FromEmailAddress", message.envelope.mailFrom},
        {"Destination", {
            {"ToAddresses", message.envelope.rcptTo},
        }},
        {"Content", {
            {"Raw", {
                {"Data", MailUtils::toBase64(rawBytes.data(), rawBytes.size())},
            }},
        }},
        {"EmailTags", {
            {{"Name", "accountId"}, {"Value", message.accountId}},
            {{"Name", "submissionId"}, {"Value", message.submissionId}},
            {{"Name", "emailId"}, {"Value", message.emailId}},
        }},
    };
}

OutboundDeliveryResult SesTransport::send(const OutboundMessage & message) {
    auto logger = spdlog::get("logger");

    std::string raw;
    if (message.mime.isInline) {
        raw = message.mime.raw;
    } else {
        auto stored = blobs->get(message.mime.sha256);
        if (stored == nullptr) {
            return OutboundDeliveryResult{OUTBOUND_STATUS_FAILED, "", "", "Raw MIME blob not found for sha256=" + message.mime.sha256, false};
        }
        raw = *stored;
    }

    std::string body = buildPayload(message, raw).dump();
    std::string url = config->sesOutboundURL();

    AwsCredentials credentials{config->sesAccessKeyId, config->sesSecretAccessKey, config->sesRegion, "ses"};
    std::map<std::string, std::string> signedHeaders;
    try {
        signedHeaders = AwsSigV4::sign("POST", url, body, credentials, time(0));
    } catch (SyncException & ex) {
        logger->error("SES signing error: {}", ex.debuginfo);
        return OutboundDeliveryResult{OUTBOUND_STATUS_FAILED, "", "", "Failed to sign SES request", false};
    }

    struct curl_slist * headers = nullptr;
    for (const auto & pair : signedHeaders) {
        if (pair.first == "host") {
            continue;
        }
        headers = curl_slist_append(headers, (pair.first + ": " + pair.second).c_str());
    }

    HTTPResponse response;
    try {
        CURL * curl_handle = CreateRequest(url, "POST", headers, &body);
        response = PerformHTTPRequest(curl_handle, headers);
    } catch (SyncException & ex) {
        logger->error("SES network error: {}", ex.debuginfo);
        return OutboundDeliveryResult{OUTBOUND_STATUS_FAILED, "", "", "Network error talking to SES", false};
    }

    std::string requestId = response.headers.count("x-amzn-requestid") ? response.headers["x-amzn-requestid"] : "";
    nlohmann::json json = nlohmann::json::parse(response.body, nullptr, false);

    if (response.status >= 200 && response.status < 300) {
        std::string messageId = firstStringValue(json, {"MessageId", "messageId", "message_id"});
        logger->info("SES accepted submission {} as {}", message.submissionId, messageId);
        return OutboundDeliveryResult{OUTBOUND_STATUS_ACCEPTED, messageId, requestId, "", false};
    }

    bool permanent = response.status >= 400 && response.status < 500;
    std::string reason = firstStringValue(json, {"message", "Message", "error"});
    if (reason == "") {
        reason = "SES error " + std::to_string(response.status) + ": " + MailUtils::utf8Prefix(response.body, 512);
    }
    logger->warn("SES rejected submission {} ({}): {}", message.submissionId, response.status, reason);
    return OutboundDeliveryResult{OUTBOUND_STATUS_REJECTED, "", requestId, reason, permanent};
}
