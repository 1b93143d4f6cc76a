#include "mailjmap/delivery_status.hpp"
#include "mailjmap/mail_utils.hpp"

#include <map>

static DeliveryStatusRecord pendingRecord() {
    return DeliveryStatusRecord{"", DELIVERED_QUEUED, "unknown", "", ""};
}

static bool isLegacyRecord(const nlohmann::json & value) {
    if (!value.is_object() || !value.count("status") || !value["status"].is_string()) {
        return false;
    }
    std::string status = value["status"].get<std::string>();
    if (status != "pending" && status != "accepted" && status != "rejected" && status != "failed") {
        return false;
    }
    return value.count("lastAttempt") && value["lastAttempt"].is_number() && value.count("retryCount") && value["retryCount"].is_number();
}

static DeliveryStatusRecord convertLegacyRecord(const nlohmann::json & value) {
    std::string status = value["status"].get<std::string>();
    std::string reason = value.count("reason") && value["reason"].is_string() ? value["reason"].get<std::string>() : "";
    std::string providerMessageId = value.count("providerMessageId") && value["providerMessageId"].is_string() ? value["providerMessageId"].get<std::string>() : "";

    if (status == "accepted") {
        return DeliveryStatusRecord::Make(250, "2.0.0", reason != "" ? reason : "Accepted", DELIVERED_QUEUED, providerMessageId);
    }
    if (status == "rejected") {
        return DeliveryStatusRecord::Make(550, "5.7.1", reason != "" ? reason : "Rejected", DELIVERED_NO, providerMessageId);
    }
    if (status == "failed") {
        bool permanent = value.count("permanent") && value["permanent"] == true;
        if (permanent) {
            return DeliveryStatusRecord::Make(550, "5.4.1", reason != "" ? reason : "Delivery failed", DELIVERED_NO, providerMessageId);
        }
        return DeliveryStatusRecord::Make(451, "4.4.0", reason != "" ? reason : "Temporary delivery issue", DELIVERED_QUEUED, providerMessageId);
    }
    return pendingRecord();
}

DeliveryStatusRecord DeliveryStatusRecord::Make(int code, std::string enhanced, std::string text, std::string delivered, std::string providerMessageId, std::string providerRequestId) {
    return DeliveryStatusRecord{DeliveryStatus::formatSmtpReply(code, enhanced, text), delivered, "unknown", providerMessageId, providerRequestId};
}

bool DeliveryStatusRecord::IsRecord(const nlohmann::json & value) {
    if (!value.is_object() || !value.count("delivered") || !value["delivered"].is_string()) {
        return false;
    }
    std::string delivered = value["delivered"].get<std::string>();
    if (delivered != DELIVERED_QUEUED && delivered != DELIVERED_YES && delivered != DELIVERED_NO && delivered != DELIVERED_UNKNOWN) {
        return false;
    }
    return value.count("smtpReply") && (value["smtpReply"].is_string() || value["smtpReply"].is_null());
}

DeliveryStatusRecord DeliveryStatusRecord::FromJSON(const nlohmann::json & json) {
    DeliveryStatusRecord record;
    record.smtpReply = json["smtpReply"].is_string() ? json["smtpReply"].get<std::string>() : "";
    record.delivered = json["delivered"].get<std::string>();
    record.displayed = json.count("displayed") && json["displayed"].is_string() ? json["displayed"].get<std::string>() : "unknown";
    record.providerMessageId = json.count("providerMessageId") && json["providerMessageId"].is_string() ? json["providerMessageId"].get<std::string>() : "";
    record.providerRequestId = json.count("providerRequestId") && json["providerRequestId"].is_string() ? json["providerRequestId"].get<std::string>() : "";
    return record;
}

nlohmann::json DeliveryStatusRecord::toJSON() const {
    nlohmann::json json = {
        {"smtpReply", smtpReply != "" ? nlohmann::json(smtpReply) : nlohmann::json()},
        {"delivered", delivered},
        {"displayed", displayed},
    };
    if (providerMessageId != "") {
        json["providerMessageId"] = providerMessageId;
    }
    if (providerRequestId != "") {
        json["providerRequestId"] = providerRequestId;
    }
    return json;
}

std::string DeliveryStatus::formatSmtpReply(int code, std::string enhanced, std::string text) {
    std::string reply = std::to_string(code);
    if (enhanced != "") {
        reply += " " + enhanced;
    }
    // Multi-line provider text would break the single reply line
    std::string flat = text;
    for (auto & c : flat) {
        if (c == '\r' || c == '\n') {
            c = ' ';
        }
    }
    flat = MailUtils::trim(flat);
    if (flat != "") {
        reply += " " + flat;
    }
    return reply;
}

nlohmann::json DeliveryStatus::initialMap(const std::vector<std::string> & recipients) {
    nlohmann::json map = nlohmann::json::object();
    for (const auto & recipient : recipients) {
        std::string clean = MailUtils::trim(recipient);
        if (clean != "") {
            map[clean] = pendingRecord().toJSON();
        }
    }
    if (map.size() == 0) {
        map["unknown"] = pendingRecord().toJSON();
    }
    return map;
}

nlohmann::json DeliveryStatus::normalize(const nlohmann::json & stored, const std::vector<std::string> & recipients) {
    if (stored.is_object() && stored.size() == 0) {
        return initialMap(recipients);
    }

    if (stored.is_object() && !isLegacyRecord(stored)) {
        bool allRecords = true;
        bool allLegacy = true;
        for (auto it = stored.begin(); it != stored.end(); ++it) {
            allRecords = allRecords && DeliveryStatusRecord::IsRecord(it.value());
            allLegacy = allLegacy && isLegacyRecord(it.value());
        }
        if (allRecords) {
            nlohmann::json map = nlohmann::json::object();
            for (auto it = stored.begin(); it != stored.end(); ++it) {
                map[it.key()] = DeliveryStatusRecord::FromJSON(it.value()).toJSON();
            }
            return map;
        }
        if (allLegacy) {
            nlohmann::json map = nlohmann::json::object();
            for (auto it = stored.begin(); it != stored.end(); ++it) {
                map[it.key()] = convertLegacyRecord(it.value()).toJSON();
            }
            return map;
        }
    }

    if (isLegacyRecord(stored)) {
        DeliveryStatusRecord converted = convertLegacyRecord(stored);
        nlohmann::json map = nlohmann::json::object();
        for (const auto & recipient : recipients) {
            std::string clean = MailUtils::trim(recipient);
            if (clean != "") {
                map[clean] = converted.toJSON();
            }
        }
        if (map.size() == 0) {
            map["unknown"] = converted.toJSON();
        }
        return map;
    }

    return initialMap(recipients);
}

nlohmann::json DeliveryStatus::applyToRecipients(const nlohmann::json & current, const std::vector<std::string> & recipients, const DeliveryStatusRecord & record) {
    nlohmann::json map = current.is_object() ? current : nlohmann::json::object();

    std::map<std::string, std::string> keysByLowercase;
    for (auto it = map.begin(); it != map.end(); ++it) {
        keysByLowercase[MailUtils::toLower(it.key())] = it.key();
    }

    std::vector<std::string> targets;
    for (const auto & recipient : recipients) {
        std::string clean = MailUtils::trim(recipient);
        if (clean == "") {
            continue;
        }
        std::string lower = MailUtils::toLower(clean);
        if (!keysByLowercase.count(lower)) {
            keysByLowercase[lower] = clean;
        }
        targets.push_back(keysByLowercase[lower]);
    }
    if (recipients.size() == 0) {
        for (auto it = map.begin(); it != map.end(); ++it) {
            targets.push_back(it.key());
        }
        if (targets.size() == 0) {
            targets.push_back("unknown");
        }
    }

    for (const auto & key : targets) {
        map[key] = record.toJSON();
    }
    return map;
}
