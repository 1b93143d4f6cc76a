#include "mailjmap/server_config.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/sync_exception.hpp"

#include <fstream>

ServerConfig::ServerConfig() :
    dataDir(""),
    blobDir(""),
    databaseFile("mailjmap.db"),
    maxSizeUpload(JMAP_MAX_SIZE_UPLOAD),
    maxSizeAttachmentsPerEmail(JMAP_MAX_SIZE_ATTACHMENTS_PER_EMAIL),
    maxMailboxesPerEmail(JMAP_MAX_MAILBOXES_PER_EMAIL),
    schedulerBatchSize(25),
    orphanBlobGraceSeconds(24 * 60 * 60),
    mailDomain("localhost"),
    sesRegion("us-east-1"),
    sesAccessKeyId(""),
    sesSecretAccessKey(""),
    sesEndpoint(""),
    sesWebhookToken(""),
    sesTopicArn("")
{
}

ServerConfig ServerConfig::FromFile(std::string path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw SyncException("config", "Unable to open configuration file " + path, false);
    }
    nlohmann::json json;
    try {
        input >> json;
    } catch (nlohmann::json::exception & ex) {
        throw SyncException("config", "Invalid configuration file " + path + ": " + ex.what(), false);
    }

    std::string dir = path;
    size_t sep = dir.find_last_of(FS_PATH_SEP);
    dir = sep == std::string::npos ? "." : dir.substr(0, sep);
    return ServerConfig::FromJSON(json, dir);
}

ServerConfig ServerConfig::FromJSON(const nlohmann::json & json, std::string dataDir) {
    if (!json.is_object()) {
        throw SyncException("config", "Configuration must be a JSON object", false);
    }
    ServerConfig config;
    config.dataDir = json.value("dataDir", dataDir);
    config.blobDir = json.value("blobDir", config.dataDir + FS_PATH_SEP + "blobs");
    config.databaseFile = json.value("databaseFile", config.databaseFile);
    config.maxSizeUpload = json.value("maxSizeUpload", config.maxSizeUpload);
    config.maxSizeAttachmentsPerEmail = json.value("maxSizeAttachmentsPerEmail", config.maxSizeAttachmentsPerEmail);
    config.maxMailboxesPerEmail = json.value("maxMailboxesPerEmail", config.maxMailboxesPerEmail);
    config.schedulerBatchSize = json.value("schedulerBatchSize", config.schedulerBatchSize);
    config.orphanBlobGraceSeconds = json.value("orphanBlobGraceSeconds", config.orphanBlobGraceSeconds);
    config.mailDomain = json.value("mailDomain", config.mailDomain);
    config.sesRegion = json.value("sesRegion", config.sesRegion);
    config.sesAccessKeyId = json.value("sesAccessKeyId", config.sesAccessKeyId);
    config.sesSecretAccessKey = json.value("sesSecretAccessKey", config.sesSecretAccessKey);
    config.sesEndpoint = json.value("sesEndpoint", config.sesEndpoint);
    config.sesWebhookToken = json.value("sesWebhookToken", config.sesWebhookToken);
    config.sesTopicArn = json.value("sesTopicArn", config.sesTopicArn);

    if (config.maxMailboxesPerEmail < 1) {
        throw SyncException("config", "maxMailboxesPerEmail must be at least 1", false);
    }
    if (config.schedulerBatchSize < 1) {
        throw SyncException("config", "schedulerBatchSize must be at least 1", false);
    }
    return config;
}

void ServerConfig::applyEnvironment() {
    std::string val;
    if ((val = MailUtils::getEnvUTF8("MAILJMAP_SES_REGION")) != "") sesRegion = val;
    if ((val = MailUtils::getEnvUTF8("MAILJMAP_SES_ACCESS_KEY_ID")) != "") sesAccessKeyId = val;
    if ((val = MailUtils::getEnvUTF8("MAILJMAP_SES_SECRET_ACCESS_KEY")) != "") sesSecretAccessKey = val;
    if ((val = MailUtils::getEnvUTF8("MAILJMAP_SES_WEBHOOK_TOKEN")) != "") sesWebhookToken = val;
    if ((val = MailUtils::getEnvUTF8("MAILJMAP_SES_TOPIC_ARN")) != "") sesTopicArn = val;
}

std::string ServerConfig::databasePath() {
    if (databaseFile.size() && databaseFile[0] == FS_PATH_SEP[0]) {
        return databaseFile;
    }
    return dataDir + FS_PATH_SEP + databaseFile;
}

std::string ServerConfig::sesOutboundURL() {
    if (sesEndpoint != "") {
        return sesEndpoint;
    }
    return "https://email." + sesRegion + ".amazonaws.com/v2/email/outbound-emails";
}

nlohmann::json ServerConfig::toJSON() {
    // Secrets are never echoed back
    return {
        {"dataDir", dataDir},
        {"blobDir", blobDir},
        {"databaseFile", databaseFile},
        {"maxSizeUpload", maxSizeUpload},
        {"maxSizeAttachmentsPerEmail", maxSizeAttachmentsPerEmail},
        {"maxMailboxesPerEmail", maxMailboxesPerEmail},
        {"schedulerBatchSize", schedulerBatchSize},
        {"orphanBlobGraceSeconds", orphanBlobGraceSeconds},
        {"mailDomain", mailDomain},
        {"sesRegion", sesRegion},
        {"sesConfigured", sesAccessKeyId != "" && sesSecretAccessKey != ""},
        {"sesTopicArn", sesTopicArn},
    };
}
