/** JMAPDispatcher [MailJMAP]
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

#ifndef JMAPDispatcher_hpp
#define JMAPDispatcher_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailjmap/change_log.hpp"
#include "mailjmap/email_engine.hpp"
#include "mailjmap/endpoint_response.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/mailbox_engine.hpp"
#include "mailjmap/submission_engine.hpp"
#include "mailjmap/jmap/method_args.hpp"

/**
 * Runs a JMAP request body {using, methodCalls} for an authenticated account.
 * Calls execute in order and share one creation id map; each call commits or
 * rolls back on its own. A failing call becomes ["error", {...}, callId] and
 * does not stop the calls after it.
 */
class JMAPDispatcher {
    ChangeLog * changes;
    EmailEngine * emails;
    MailboxEngine * mailboxes;
    SubmissionEngine * submissions;

public:
    JMAPDispatcher(ChangeLog * changes, EmailEngine * emails, MailboxEngine * mailboxes, SubmissionEngine * submissions);

    static const std::vector<std::string> & SupportedCapabilities();

    EndpointResponse handle(std::string accountId, const nlohmann::json & request);

private:
    void dispatch(std::string accountId, const std::string & name, const nlohmann::json & args, const std::string & callId, CreationIdMap & creationIds, nlohmann::json & responses);
    // Returns [[name, arguments], ...]. Email/copy with onSuccessDestroyOriginal
    // answers with a second "Email/set" entry.
    nlohmann::json invoke(MethodCall & call, CreationIdMap & creationIds);
};

#endif /* JMAPDispatcher_hpp */
