/** Mailbox [MailJMAP]
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

#ifndef Mailbox_hpp
#define Mailbox_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailjmap/models/mail_model.hpp"

class Mailbox : public MailModel {

public:
    static std::string TABLE_NAME;

    Mailbox(std::string id, std::string accountId, int version);
    Mailbox(SQLite::Statement & query);

    std::string name();
    void setName(std::string name);

    // Empty string when the mailbox is at the top level
    std::string parentId();
    void setParentId(std::string parentId);

    // Empty string when the mailbox has no role
    std::string role();
    void setRole(std::string role);

    int sortOrder();
    void setSortOrder(int sortOrder);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);

    void afterRemove(MailStore * store);
};

#endif /* Mailbox_hpp */
