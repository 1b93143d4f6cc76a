#include "mailjmap/jmap/session.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/models/account.hpp"

JMAPSession::JMAPSession(MailStore * store, ChangeLog * changes, ServerConfig * config) :
    store(store), changes(changes), config(config)
{
}

nlohmann::json JMAPSession::capabilities() {
    return {
        {JMAP_CAPABILITY_CORE, {
            {"maxSizeUpload", config->maxSizeUpload},
            {"maxConcurrentUpload", JMAP_MAX_CONCURRENT_UPLOAD},
            {"maxSizeRequest", JMAP_MAX_SIZE_REQUEST},
            {"maxConcurrentRequests", JMAP_MAX_CONCURRENT_REQUESTS},
            {"maxCallsInRequest", JMAP_MAX_CALLS_IN_REQUEST},
            {"maxObjectsInGet", JMAP_MAX_OBJECTS_IN_GET},
            {"maxObjectsInSet", JMAP_MAX_OBJECTS_IN_SET},
            {"collationAlgorithms", nlohmann::json::array({"i;ascii-numeric"})},
        }},
        {JMAP_CAPABILITY_MAIL, {
            {"maxMailboxesPerEmail", config->maxMailboxesPerEmail},
            {"maxMailboxDepth", nullptr},
            {"maxSizeMailboxName", JMAP_MAX_SIZE_MAILBOX_NAME},
            {"maxSizeAttachmentsPerEmail", config->maxSizeAttachmentsPerEmail},
            {"emailQuerySortOptions", nlohmann::json::array({"receivedAt", "sentAt", "size", "subject"})},
            {"mayCreateTopLevelMailbox", true},
        }},
        {JMAP_CAPABILITY_SUBMISSION, {
            {"maxDelayedSend", 0},
            {"submissionExtensions", nlohmann::json::object()},
        }},
    };
}

nlohmann::json JMAPSession::build(std::string accountId, std::string baseURL) {
    while (baseURL.size() && baseURL.back() == '/') {
        baseURL.pop_back();
    }

    std::string name = accountId;
    auto account = store->find<Account>(Query().equal("id", accountId));
    if (account != nullptr) {
        name = account->emailAddress();
    }

    nlohmann::json caps = capabilities();
    nlohmann::json accountCapabilities = nlohmann::json::object();
    nlohmann::json primaryAccounts = nlohmann::json::object();
    for (auto it = caps.begin(); it != caps.end(); ++it) {
        accountCapabilities[it.key()] = nlohmann::json::object();
        primaryAccounts[it.key()] = accountId;
    }

    return {
        {"capabilities", caps},
        {"accounts", {
            {accountId, {
                {"name", name},
                {"isPersonal", true},
                {"isReadOnly", false},
                {"accountCapabilities", accountCapabilities},
            }},
        }},
        {"primaryAccounts", primaryAccounts},
        {"username", name},
        {"apiUrl", baseURL + "/jmap"},
        {"downloadUrl", baseURL + "/blobs/download/{accountId}/{blobId}/{name}?type={type}"},
        {"uploadUrl", baseURL + "/blobs/upload/{accountId}/{type}"},
        {"eventSourceUrl", nullptr},
        {"state", changes->getSessionState(accountId)},
    };
}
