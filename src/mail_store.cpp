#include "mailjmap/mail_store.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/sync_exception.hpp"


#define SCHEMA_VERSION 1

static std::string joined(const std::vector<std::string> & parts, std::string prefix, std::string suffix) {
    std::string out;
    for (const auto & part : parts) {
        if (out.size()) {
            out += ", ";
        }
        out += prefix + part + suffix;
    }
    return out;
}

std::string MailStore::DefaultDatabasePath() {
    std::string dir = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (dir == "") {
        throw SyncException("no-config-dir", "CONFIG_DIR_PATH is not set and no database path was provided.", false);
    }
    return dir + FS_PATH_SEP + "mailjmap.db";
}

MailStore::MailStore() :
    MailStore(MailStore::DefaultDatabasePath())
{
}

MailStore::MailStore(std::string path) :
    _db(path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
    _transactionOpen(false)
{
    _db.setBusyTimeout(10 * 1000);

    // Connection settings, applied whether or not migrate() runs.
    _db.exec("PRAGMA journal_mode = WAL");
    _db.exec("PRAGMA synchronous = NORMAL");
    _db.exec("PRAGMA foreign_keys = OFF");
}

int MailStore::schemaVersion() {
    return _db.execAndGet("PRAGMA user_version").getInt();
}

void MailStore::migrate() {
    if (schemaVersion() >= SCHEMA_VERSION) {
        return;
    }
    for (const std::string & sql : SETUP_QUERIES) {
        _db.exec(sql);
    }
    _db.exec("PRAGMA user_version = " + std::to_string(SCHEMA_VERSION));
}

SQLite::Database & MailStore::db()
{
    return _db;
}

SQLite::Statement & MailStore::prepared(const std::string & sql) {
    auto it = _prepared.find(sql);
    if (it == _prepared.end()) {
        it = _prepared.emplace(sql, std::make_shared<SQLite::Statement>(_db, sql)).first;
    }
    it->second->reset();
    it->second->clearBindings();
    return *it->second;
}

void MailStore::forgetPrepared() {
    _prepared.clear();
}

void MailStore::beginTransaction() {
    _db.exec("BEGIN IMMEDIATE TRANSACTION");
    _transactionOpen = true;
    _afterCommit.clear();
    _afterRollback.clear();
}

void MailStore::rollbackTransaction() {
    forgetPrepared();
    _afterCommit.clear();
    _transactionOpen = false;

    std::vector<std::function<void()>> undo;
    undo.swap(_afterRollback);
    _db.exec("ROLLBACK");
    for (auto & fn : undo) {
        fn();
    }
}

void MailStore::commitTransaction() {
    _db.exec("COMMIT");
    _transactionOpen = false;
    _afterRollback.clear();

    std::vector<std::function<void()>> pending;
    pending.swap(_afterCommit);
    for (auto & fn : pending) {
        fn();
    }
}

void MailStore::runAfterCommit(std::function<void()> fn) {
    if (_transactionOpen) {
        _afterCommit.push_back(fn);
    } else {
        fn();
    }
}

void MailStore::runAfterRollback(std::function<void()> fn) {
    if (_transactionOpen) {
        _afterRollback.push_back(fn);
    }
}

void MailStore::save(MailModel * model) {
    model->incrementVersion();

    std::string table = model->tableName();
    std::vector<std::string> columns = model->columnsForQuery();
    std::string sql;

    if (model->version() == 1) {
        sql = "INSERT INTO " + table + " (" + joined(columns, "", "") + ") VALUES (" + joined(columns, ":", "") + ")";
    } else {
        std::vector<std::string> assignments;
        for (const auto & col : columns) {
            if (col != "id") {
                assignments.push_back(col + " = :" + col);
            }
        }
        sql = "UPDATE " + table + " SET " + joined(assignments, "", "") + " WHERE id = :id";
    }

    SQLite::Statement & statement = prepared(sql);
    model->bindToQuery(&statement);
    statement.exec();
}

void MailStore::remove(MailModel * model) {
    SQLite::Statement & statement = prepared("DELETE FROM " + model->tableName() + " WHERE id = ?");
    statement.bind(1, model->id());
    statement.exec();

    model->afterRemove(this);
}
