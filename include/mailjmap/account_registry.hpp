/** AccountRegistry [MailJMAP]
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

#ifndef AccountRegistry_hpp
#define AccountRegistry_hpp

#include <stdio.h>
#include <map>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailjmap/email_engine.hpp"
#include "mailjmap/mail_store.hpp"

struct RegisteredAccount {
    std::string accountId;
    std::string emailAddress;
    std::string identityId;
    // role => mailbox id
    std::map<std::string, std::string> mailboxIds;

    nlohmann::json toJSON() const;
};

/**
 * Creates an Account together with its primary sending Identity and the
 * default role mailboxes, in one transaction. Authentication lives in the
 * HTTP front end; this is the point where an authenticated user first gets
 * JMAP data.
 */
class AccountRegistry {
    MailStore * store;
    EmailEngine * emails;

public:
    AccountRegistry(MailStore * store, EmailEngine * emails);

    static const std::vector<std::string> & DefaultMailboxRoles();

    // Throws JMAPError invalidArguments for malformed ids or addresses and
    // alreadyExists when the id or address is taken.
    RegisteredAccount registerAccount(std::string accountId, std::string emailAddress, std::string name);
};

#endif /* AccountRegistry_hpp */
