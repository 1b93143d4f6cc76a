/** MailStore [MailJMAP]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef MailStore_hpp
#define MailStore_hpp

#include <stdint.h>
#include <stdio.h>
#include <string>
#include <map>
#include <memory>
#include <vector>
#include <functional>

#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"

#include "mailjmap/models/mail_model.hpp"
#include "mailjmap/query.hpp"
#include "mailjmap/mail_utils.hpp"

/**
 * The SQLite database behind every account. Models are written with
 * save / remove and read back with the find templates below; engines run
 * their own SQL through db() for joins and aggregates.
 *
 * One MailStore is one connection. Writers wrap their work in a
 * MailStoreTransaction.
 */
class MailStore {
    SQLite::Database _db;
    bool _transactionOpen;
    std::vector<std::function<void()>> _afterCommit;
    std::vector<std::function<void()>> _afterRollback;

    // Prepared INSERT / UPDATE / DELETE statements keyed by their SQL.
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _prepared;

    SQLite::Statement & prepared(const std::string & sql);
    void forgetPrepared();

    template<typename ModelClass>
    void eachRow(Query & query, std::string columns, std::string suffix, std::function<void(SQLite::Statement &)> fn) {
        SQLite::Statement statement(_db, "SELECT " + columns + " FROM " + ModelClass::TABLE_NAME + query.getSQL() + suffix);
        query.bind(statement);
        while (statement.executeStep()) {
            fn(statement);
        }
    }

public:
    // CONFIG_DIR_PATH/mailjmap.db
    static std::string DefaultDatabasePath();

    MailStore();
    MailStore(std::string path);

    // Creates the schema on an empty database. Runs before logging is set up.
    void migrate();
    int schemaVersion();

    SQLite::Database & db();

    void beginTransaction();
    void rollbackTransaction();
    void commitTransaction();

    /**
     * Registers work (usually blob storage deletes) that must only happen
     * once the current transaction has committed. Discarded on rollback.
     * Runs immediately when no transaction is open.
     */
    void runAfterCommit(std::function<void()> fn);

    /**
     * Registers an undo for work outside the database (usually a blob written
     * to storage) that only the current transaction refers to. Runs after a
     * rollback and is discarded on commit. `fn` must not throw.
     */
    void runAfterRollback(std::function<void()> fn);

    // INSERT on the first save of a model, UPDATE afterwards.
    void save(MailModel * model);
    void remove(MailModel * model);

    template<typename ModelClass>
    std::shared_ptr<ModelClass> find(Query & query) {
        std::shared_ptr<ModelClass> result = nullptr;
        eachRow<ModelClass>(query, "data", " LIMIT 1", [&](SQLite::Statement & row) {
            result = std::make_shared<ModelClass>(row);
        });
        return result;
    }

    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findAll(Query & query) {
        std::vector<std::shared_ptr<ModelClass>> results;
        eachRow<ModelClass>(query, "data", "", [&](SQLite::Statement & row) {
            results.push_back(std::make_shared<ModelClass>(row));
        });
        return results;
    }

    // Keyed by the value of `keyField`, which must be a real column.
    template<typename ModelClass>
    std::map<std::string, std::shared_ptr<ModelClass>> findAllMap(Query & query, std::string keyField) {
        std::map<std::string, std::shared_ptr<ModelClass>> results;
        eachRow<ModelClass>(query, keyField + ", data", "", [&](SQLite::Statement & row) {
            results[row.getColumn(0).getString()] = std::make_shared<ModelClass>(row);
        });
        return results;
    }
};

#endif /* MailStore_hpp */
