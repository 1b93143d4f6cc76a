/** Query [MailJMAP]
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

#ifndef Query_hpp
#define Query_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"

/**
 * WHERE / ORDER BY builder for MailStore::find and friends. Clauses are
 * ANDed together in the order they were added; setting the same column twice
 * replaces the earlier clause.
 */
class Query {
    struct Clause {
        std::string column;
        nlohmann::json rhs;
    };

    std::vector<Clause> _clauses;
    std::vector<std::pair<std::string, bool>> _order;

    void set(std::string col, nlohmann::json rhs);

public:
    Query() noexcept;

    // Every JMAP object lives in exactly one account.
    static Query InAccount(std::string accountId);

    Query & equal(std::string col, std::string val);
    Query & equal(std::string col, double val);

    // Excludes soft-deleted Email rows.
    Query & live();

    Query & orderBy(std::string col, bool ascending = true);

    std::string getSQL();

    void bind(SQLite::Statement & query);
};

#endif /* Query_hpp */
