/** EmailSubmission [MailJMAP]
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

#ifndef EmailSubmission_hpp
#define EmailSubmission_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailjmap/models/mail_model.hpp"

#define SUBMISSION_STATUS_PENDING   "pending"
#define SUBMISSION_STATUS_SENDING   "sending"
#define SUBMISSION_STATUS_SENT      "sent"
#define SUBMISSION_STATUS_FAILED    "failed"
#define SUBMISSION_STATUS_CANCELED  "canceled"

#define UNDO_STATUS_PENDING   "pending"
#define UNDO_STATUS_FINAL     "final"
#define UNDO_STATUS_CANCELED  "canceled"

class EmailSubmission : public MailModel {

public:
    static std::string TABLE_NAME;

    EmailSubmission(std::string id, std::string accountId, std::string emailId, std::string threadId, std::string identityId, nlohmann::json envelope, time_t sendAt);
    EmailSubmission(SQLite::Statement & query);

    std::string emailId();
    std::string threadId();
    std::string identityId();

    // {mailFrom: {email}, rcptTo: [{email}]}
    nlohmann::json envelope();

    std::string status();
    void setStatus(std::string status);

    std::string undoStatus();
    void setUndoStatus(std::string undoStatus);

    int retryCount();
    void setRetryCount(int retryCount);

    // -1 when the submission is not scheduled for another attempt
    time_t nextAttemptAt();
    void setNextAttemptAt(time_t t);

    time_t sendAt();
    time_t createdAt();

    // Keyed by recipient email address
    nlohmann::json deliveryStatus();
    void setDeliveryStatus(nlohmann::json ds);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* EmailSubmission_hpp */
