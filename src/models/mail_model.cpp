#include "mailjmap/models/mail_model.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/sync_exception.hpp"

std::string MailModel::TABLE_NAME = "MailModel";

MailModel::MailModel(std::string id, std::string accountId, int version) :
    _data({{"id", id}, {"aid", accountId}, {"v", version}})
{
}

MailModel::MailModel(SQLite::Statement & query) :
    _data(nlohmann::json::parse(query.getColumn("data").getString()))
{
}

MailModel::MailModel(nlohmann::json json) :
    _data(json)
{
    if (!_data.is_object() || !_data.count("id") || !_data["id"].is_string()) {
        throw SyncException("invalid-model", "Model data must be a JSON object with a string id", false);
    }
}

std::string MailModel::tableName()
{
    return TABLE_NAME;
}

std::string MailModel::id()
{
    return _data["id"].get<std::string>();
}

std::string MailModel::accountId()
{
    return _data["aid"].get<std::string>();
}

int MailModel::version()
{
    return _data["v"].get<int>();
}

void MailModel::incrementVersion()
{
    _data["v"] = version() + 1;
}

time_t MailModel::updatedAt()
{
    return _data.count("updatedAt") ? _data["updatedAt"].get<time_t>() : 0;
}

void MailModel::setUpdatedAt(time_t t)
{
    _data["updatedAt"] = t;
}

void MailModel::bindToQuery(SQLite::Statement * query)
{
    query->bind(":id", id());
    query->bind(":data", this->toJSON().dump());
    query->bind(":accountId", accountId());
    query->bind(":version", version());
}

void MailModel::afterRemove(MailStore * store)
{
}

nlohmann::json MailModel::toJSON()
{
    if (!_data.count("__cls")) {
        _data["__cls"] = this->tableName();
    }
    return _data;
}
