/** SubmissionEngine [MailJMAP]
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

#ifndef SubmissionEngine_hpp
#define SubmissionEngine_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailjmap/change_log.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/jmap/method_args.hpp"
#include "mailjmap/models/email_submission.hpp"

/**
 * EmailSubmission/get, /set, /changes and /query. Creating a submission only
 * queues it; the SubmissionQueue performs the send.
 */
class SubmissionEngine {
    MailStore * store;
    ChangeLog * changes;

public:
    SubmissionEngine(MailStore * store, ChangeLog * changes);

    nlohmann::json get(const GetArgs & args);
    nlohmann::json set(const SetArgs & args, CreationIdMap & creationIds);
    nlohmann::json getChanges(const ChangesArgs & args);
    nlohmann::json query(const QueryArgs & args);

    static nlohmann::json toJMAP(EmailSubmission * submission);

    // to, cc then bcc addresses of the message, without duplicates.
    std::vector<std::string> defaultRecipients(std::string canonicalMessageId);

private:
    std::shared_ptr<EmailSubmission> createSubmission(std::string accountId, const nlohmann::json & create, const CreationIdMap & creationIds);
    std::vector<std::string> updateSubmission(std::shared_ptr<EmailSubmission> submission, const nlohmann::json & patch);
};

#endif /* SubmissionEngine_hpp */
