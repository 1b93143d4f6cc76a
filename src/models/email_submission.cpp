#include "mailjmap/models/email_submission.hpp"
#include "mailjmap/mail_utils.hpp"

std::string EmailSubmission::TABLE_NAME = "EmailSubmission";

EmailSubmission::EmailSubmission(std::string id, std::string accountId, std::string emailId, std::string threadId, std::string identityId, nlohmann::json envelope, time_t sendAt) :
    MailModel(id, accountId, 0)
{
    _data["emailId"] = emailId;
    _data["threadId"] = threadId;
    _data["identityId"] = identityId;
    _data["envelope"] = envelope;
    _data["status"] = SUBMISSION_STATUS_PENDING;
    _data["undoStatus"] = UNDO_STATUS_PENDING;
    _data["retryCount"] = 0;
    _data["nextAttemptAt"] = sendAt;
    _data["sendAt"] = sendAt;
    _data["createdAt"] = time(0);
    _data["updatedAt"] = time(0);
    _data["deliveryStatus"] = nlohmann::json::object();
}

EmailSubmission::EmailSubmission(SQLite::Statement & query) :
    MailModel(query)
{
}

std::string EmailSubmission::emailId() {
    return _data["emailId"].get<std::string>();
}

std::string EmailSubmission::threadId() {
    return _data["threadId"].get<std::string>();
}

std::string EmailSubmission::identityId() {
    return _data["identityId"].get<std::string>();
}

nlohmann::json EmailSubmission::envelope() {
    return _data["envelope"];
}

std::string EmailSubmission::status() {
    return _data["status"].get<std::string>();
}

void EmailSubmission::setStatus(std::string status) {
    _data["status"] = status;
}

std::string EmailSubmission::undoStatus() {
    return _data["undoStatus"].get<std::string>();
}

void EmailSubmission::setUndoStatus(std::string undoStatus) {
    _data["undoStatus"] = undoStatus;
}

int EmailSubmission::retryCount() {
    return _data["retryCount"].get<int>();
}

void EmailSubmission::setRetryCount(int retryCount) {
    _data["retryCount"] = retryCount;
}

time_t EmailSubmission::nextAttemptAt() {
    return _data["nextAttemptAt"].is_number() ? _data["nextAttemptAt"].get<time_t>() : -1;
}

void EmailSubmission::setNextAttemptAt(time_t t) {
    if (t < 0) {
        _data["nextAttemptAt"] = nullptr;
    } else {
        _data["nextAttemptAt"] = t;
    }
}

time_t EmailSubmission::sendAt() {
    return _data["sendAt"].get<time_t>();
}

time_t EmailSubmission::createdAt() {
    return _data["createdAt"].get<time_t>();
}

nlohmann::json EmailSubmission::deliveryStatus() {
    return _data.count("deliveryStatus") ? _data["deliveryStatus"] : nlohmann::json::object();
}

void EmailSubmission::setDeliveryStatus(nlohmann::json ds) {
    _data["deliveryStatus"] = ds;
}

std::string EmailSubmission::tableName() {
    return EmailSubmission::TABLE_NAME;
}

std::vector<std::string> EmailSubmission::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "emailId", "threadId", "identityId", "status", "undoStatus", "retryCount", "nextAttemptAt", "sendAt", "createdAt", "updatedAt"};
}

void EmailSubmission::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":emailId", emailId());
    query->bind(":threadId", threadId());
    query->bind(":identityId", identityId());
    query->bind(":status", status());
    query->bind(":undoStatus", undoStatus());
    query->bind(":retryCount", retryCount());
    if (nextAttemptAt() < 0) {
        query->bind(":nextAttemptAt");
    } else {
        query->bind(":nextAttemptAt", (long long)nextAttemptAt());
    }
    query->bind(":sendAt", (long long)sendAt());
    query->bind(":createdAt", (long long)createdAt());
    query->bind(":updatedAt", (long long)updatedAt());
}
