/** MailModel [MailJMAP]
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

#ifndef MailModel_hpp
#define MailModel_hpp

#include <stdio.h>
#include <time.h>
#include <vector>
#include <string>

#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"

class MailStore;

/**
 * Base class for rows persisted through MailStore::save. The full object is
 * kept as JSON in the `data` column; subclasses copy the fields they filter
 * or sort on into real columns in bindToQuery.
 *
 * `version` counts saves and decides between INSERT and UPDATE. It is not
 * the JMAP state string, which the ChangeLog owns per account and type.
 */
class MailModel {
public:
    nlohmann::json _data;

    static std::string TABLE_NAME;
    virtual std::string tableName();

    MailModel(std::string id, std::string accountId, int version = 0);
    MailModel(SQLite::Statement & query);
    MailModel(nlohmann::json json);
    virtual ~MailModel() = default;

    std::string id();
    std::string accountId();
    int version();
    void incrementVersion();

    // 0 for models that do not track modification time
    time_t updatedAt();
    void setUpdatedAt(time_t t);

    virtual std::vector<std::string> columnsForQuery() = 0;
    virtual void bindToQuery(SQLite::Statement * query);

    // Runs inside the same transaction as the DELETE.
    virtual void afterRemove(MailStore * store);

    virtual nlohmann::json toJSON();
};

#endif /* MailModel_hpp */
