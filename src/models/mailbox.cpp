#include "mailjmap/models/mailbox.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/mail_store.hpp"

std::string Mailbox::TABLE_NAME = "Mailbox";

Mailbox::Mailbox(std::string id, std::string accountId, int version) :
    MailModel(id, accountId, version)
{
    _data["name"] = "";
    _data["parentId"] = nullptr;
    _data["role"] = nullptr;
    _data["sortOrder"] = 0;
    _data["createdAt"] = time(0);
    _data["updatedAt"] = time(0);
}

Mailbox::Mailbox(SQLite::Statement & query) :
    MailModel(query)
{
}

std::string Mailbox::name() {
    return _data["name"].get<std::string>();
}

void Mailbox::setName(std::string name) {
    _data["name"] = name;
}

std::string Mailbox::parentId() {
    return _data["parentId"].is_string() ? _data["parentId"].get<std::string>() : "";
}

void Mailbox::setParentId(std::string parentId) {
    if (parentId == "") {
        _data["parentId"] = nullptr;
    } else {
        _data["parentId"] = parentId;
    }
}

std::string Mailbox::role() {
    return _data["role"].is_string() ? _data["role"].get<std::string>() : "";
}

void Mailbox::setRole(std::string role) {
    if (role == "") {
        _data["role"] = nullptr;
    } else {
        _data["role"] = role;
    }
}

int Mailbox::sortOrder() {
    return _data["sortOrder"].get<int>();
}

void Mailbox::setSortOrder(int sortOrder) {
    _data["sortOrder"] = sortOrder;
}

std::string Mailbox::tableName() {
    return Mailbox::TABLE_NAME;
}

std::vector<std::string> Mailbox::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "name", "parentId", "role", "sortOrder", "createdAt", "updatedAt"};
}

void Mailbox::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":name", name());
    if (parentId() == "") {
        query->bind(":parentId");
    } else {
        query->bind(":parentId", parentId());
    }
    if (role() == "") {
        query->bind(":role");
    } else {
        query->bind(":role", role());
    }
    query->bind(":sortOrder", sortOrder());
    query->bind(":createdAt", (long long)_data["createdAt"].get<time_t>());
    query->bind(":updatedAt", (long long)updatedAt());
}

void Mailbox::afterRemove(MailStore * store) {
    MailModel::afterRemove(store);

    SQLite::Statement members(store->db(), "DELETE FROM MailboxMessage WHERE mailboxId = ?");
    members.bind(1, id());
    members.exec();
}
