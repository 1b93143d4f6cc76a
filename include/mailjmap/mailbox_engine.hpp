/** MailboxEngine [MailJMAP]
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

#ifndef MailboxEngine_hpp
#define MailboxEngine_hpp

#include <stdio.h>
#include <string>
#include <map>
#include <memory>

#include "nlohmann/json.hpp"

#include "mailjmap/mail_store.hpp"
#include "mailjmap/change_log.hpp"
#include "mailjmap/models/mailbox.hpp"
#include "mailjmap/jmap/method_args.hpp"

class EmailEngine;

struct MailboxCounts {
    int totalEmails;
    int unreadEmails;
    int totalThreads;
    int unreadThreads;
};

/**
 * Mailbox/get, /set, /changes and /query. A mailbox tree is kept free of
 * cycles, each role is held by at most one mailbox per account, and a
 * mailbox is only destroyed once it has no children and no live Emails
 * (or the caller asked for its Emails to be removed).
 */
class MailboxEngine {
    MailStore * store;
    ChangeLog * changes;
    EmailEngine * emails;

public:
    MailboxEngine(MailStore * store, ChangeLog * changes, EmailEngine * emails);

    nlohmann::json get(const GetArgs & args);
    nlohmann::json set(const SetArgs & args, CreationIdMap & creationIds);
    nlohmann::json getChanges(const ChangesArgs & args);
    nlohmann::json query(const QueryArgs & args);

    std::shared_ptr<Mailbox> findByRole(std::string accountId, std::string role);

    std::map<std::string, MailboxCounts> countsForAccount(std::string accountId);

    static nlohmann::json toJMAP(Mailbox * mailbox, MailboxCounts counts);

private:
    typedef std::map<std::string, std::shared_ptr<Mailbox>> MailboxMap;

    std::string createMailbox(std::string accountId, const nlohmann::json & create, MailboxMap & mailboxes, CreationIdMap & creationIds);
    std::vector<std::string> updateMailbox(std::string accountId, std::shared_ptr<Mailbox> mailbox, const nlohmann::json & patch, MailboxMap & mailboxes, const CreationIdMap & creationIds);
    void destroyMailbox(std::string accountId, std::shared_ptr<Mailbox> mailbox, bool removeEmails, MailboxMap & mailboxes);

    void ensureRoleAvailable(MailboxMap & mailboxes, std::string role, std::string mailboxId);
    void ensureParentValid(MailboxMap & mailboxes, std::string parentId, std::string childId);
};

#endif /* MailboxEngine_hpp */
