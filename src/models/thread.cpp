#include "mailjmap/models/thread.hpp"
#include "mailjmap/mail_utils.hpp"

std::string Thread::TABLE_NAME = "Thread";

Thread::Thread(std::string id, std::string accountId, std::string subject, time_t createdAt) :
    MailModel(id, accountId, 0)
{
    _data["subject"] = subject;
    _data["createdAt"] = createdAt;
    _data["latestMessageAt"] = createdAt;
}

Thread::Thread(SQLite::Statement & query) :
    MailModel(query)
{
}

std::string Thread::subject() {
    return _data["subject"].get<std::string>();
}

time_t Thread::createdAt() {
    return _data["createdAt"].get<time_t>();
}

time_t Thread::latestMessageAt() {
    return _data["latestMessageAt"].get<time_t>();
}

void Thread::setLatestMessageAt(time_t t) {
    _data["latestMessageAt"] = t;
}

std::string Thread::tableName() {
    return Thread::TABLE_NAME;
}

std::vector<std::string> Thread::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "subject", "createdAt", "latestMessageAt"};
}

void Thread::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":subject", subject());
    query->bind(":createdAt", (long long)createdAt());
    query->bind(":latestMessageAt", (long long)latestMessageAt());
}
