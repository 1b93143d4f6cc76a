#include "mailjmap/models/account.hpp"
#include "mailjmap/mail_utils.hpp"

std::string Account::TABLE_NAME = "Account";

// Accounts own themselves, so accountId == id
Account::Account(std::string id, std::string emailAddress, std::string name) :
    MailModel(id, id, 0)
{
    _data["emailAddress"] = MailUtils::normalizeEmail(emailAddress);
    _data["name"] = name;
    _data["createdAt"] = time(0);
}

Account::Account(SQLite::Statement & query) :
    MailModel(query)
{
}

std::string Account::emailAddress() {
    return _data["emailAddress"].get<std::string>();
}

std::string Account::name() {
    return _data["name"].get<std::string>();
}

time_t Account::createdAt() {
    return _data["createdAt"].get<time_t>();
}

std::string Account::tableName() {
    return Account::TABLE_NAME;
}

std::vector<std::string> Account::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "emailAddress"};
}

void Account::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":emailAddress", emailAddress());
}
