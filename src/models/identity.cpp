#include "mailjmap/models/identity.hpp"
#include "mailjmap/mail_utils.hpp"

std::string Identity::TABLE_NAME = "Identity";

Identity::Identity(std::string id, std::string accountId, std::string email, std::string name) :
    MailModel(id, accountId, 0)
{
    _data["email"] = MailUtils::normalizeEmail(email);
    _data["name"] = name;
}

Identity::Identity(SQLite::Statement & query) :
    MailModel(query)
{
}

std::string Identity::email() {
    return _data["email"].get<std::string>();
}

std::string Identity::name() {
    return _data["name"].get<std::string>();
}

std::string Identity::tableName() {
    return Identity::TABLE_NAME;
}

std::vector<std::string> Identity::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "email"};
}

void Identity::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":email", email());
}
