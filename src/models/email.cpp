#include "mailjmap/models/email.hpp"
#include "mailjmap/mail_utils.hpp"

std::string Email::TABLE_NAME = "Email";

Email::Email(std::string id, std::string accountId, std::string messageId, std::string threadId, time_t internalDate) :
    MailModel(id, accountId, 0)
{
    _data["messageId"] = messageId;
    _data["threadId"] = threadId;
    _data["internalDate"] = internalDate;
    _data["isSeen"] = false;
    _data["isFlagged"] = false;
    _data["isAnswered"] = false;
    _data["isDraft"] = false;
    _data["isDeleted"] = false;
    _data["createdAt"] = time(0);
    _data["updatedAt"] = time(0);
}

Email::Email(SQLite::Statement & query) :
    MailModel(query)
{
}

std::string Email::messageId() {
    return _data["messageId"].get<std::string>();
}

std::string Email::threadId() {
    return _data["threadId"].get<std::string>();
}

time_t Email::internalDate() {
    return _data["internalDate"].get<time_t>();
}

bool Email::isSeen() {
    return _data["isSeen"].get<bool>();
}

void Email::setIsSeen(bool v) {
    _data["isSeen"] = v;
}

bool Email::isFlagged() {
    return _data["isFlagged"].get<bool>();
}

void Email::setIsFlagged(bool v) {
    _data["isFlagged"] = v;
}

bool Email::isAnswered() {
    return _data["isAnswered"].get<bool>();
}

void Email::setIsAnswered(bool v) {
    _data["isAnswered"] = v;
}

bool Email::isDraft() {
    return _data["isDraft"].get<bool>();
}

void Email::setIsDraft(bool v) {
    _data["isDraft"] = v;
}

bool Email::isDeleted() {
    return _data["isDeleted"].get<bool>();
}

void Email::setIsDeleted(bool v) {
    _data["isDeleted"] = v;
}

time_t Email::createdAt() {
    return _data["createdAt"].get<time_t>();
}

std::string Email::tableName() {
    return Email::TABLE_NAME;
}

std::vector<std::string> Email::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "messageId", "threadId", "internalDate", "isSeen", "isFlagged", "isAnswered", "isDraft", "isDeleted", "createdAt", "updatedAt"};
}

void Email::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":messageId", messageId());
    query->bind(":threadId", threadId());
    query->bind(":internalDate", (long long)internalDate());
    query->bind(":isSeen", isSeen() ? 1 : 0);
    query->bind(":isFlagged", isFlagged() ? 1 : 0);
    query->bind(":isAnswered", isAnswered() ? 1 : 0);
    query->bind(":isDraft", isDraft() ? 1 : 0);
    query->bind(":isDeleted", isDeleted() ? 1 : 0);
    query->bind(":createdAt", (long long)createdAt());
    query->bind(":updatedAt", (long long)updatedAt());
}
