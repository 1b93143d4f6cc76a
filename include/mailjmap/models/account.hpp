/** Account [MailJMAP]
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

#ifndef Account_hpp
#define Account_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailjmap/models/mail_model.hpp"

// A registered mailbox owner. The address is fixed at registration.
class Account : public MailModel {

public:
    static std::string TABLE_NAME;

    Account(std::string id, std::string emailAddress, std::string name = "");
    Account(SQLite::Statement & query);

    std::string emailAddress();
    std::string name();
    time_t createdAt();

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* Account_hpp */
