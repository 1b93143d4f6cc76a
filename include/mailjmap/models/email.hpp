/** Email [MailJMAP]
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

#ifndef Email_hpp
#define Email_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailjmap/models/mail_model.hpp"

/**
 * An account's view of a canonical Message. Several Email rows (one per
 * account, or several after Email/copy) may point at the same Message.
 * Mailbox membership and keywords live in MailboxMessage and EmailKeyword.
 */
class Email : public MailModel {

public:
    static std::string TABLE_NAME;

    Email(std::string id, std::string accountId, std::string messageId, std::string threadId, time_t internalDate);
    Email(SQLite::Statement & query);

    std::string messageId();
    std::string threadId();
    time_t internalDate();

    bool isSeen();
    void setIsSeen(bool v);
    bool isFlagged();
    void setIsFlagged(bool v);
    bool isAnswered();
    void setIsAnswered(bool v);
    bool isDraft();
    void setIsDraft(bool v);

    bool isDeleted();
    void setIsDeleted(bool v);

    time_t createdAt();

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* Email_hpp */
