/** ChangeLog [MailJMAP]
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

#ifndef ChangeLog_hpp
#define ChangeLog_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "mailjmap/mail_store.hpp"

#define CHANGE_OP_CREATE  "create"
#define CHANGE_OP_UPDATE  "update"
#define CHANGE_OP_DESTROY "destroy"

struct ChangesResult {
    std::string oldState;
    std::string newState;
    bool hasMoreChanges;
    std::vector<std::string> created;
    std::vector<std::string> updated;
    std::vector<std::string> destroyed;
    // Empty unless includeUpdatedProperties was requested and every update
    // in the window recorded the properties it touched.
    std::vector<std::string> updatedProperties;
};

/**
 * Per (account, object type) state counters and the append-only change log
 * clients use to sync incrementally. All writes happen on the caller's
 * transaction: a client that observes a new state is guaranteed to see
 * every row written alongside it.
 */
class ChangeLog {
    MailStore * store;

public:
    ChangeLog(MailStore * store);

    long long bumpState(std::string accountId, std::string type);

    long long recordCreate(std::string accountId, std::string type, std::string objectId);
    long long recordUpdate(std::string accountId, std::string type, std::string objectId, std::vector<std::string> updatedProperties = {});
    long long recordDestroy(std::string accountId, std::string type, std::string objectId);

    std::string getState(std::string accountId, std::string type);

    // Throws JMAPError(stateMismatch) unless ifInState equals the current state.
    void assertInState(std::string accountId, std::string type, std::string ifInState);

    ChangesResult getChanges(std::string accountId, std::string type, std::string sinceState, int maxChanges, std::string upToId = "", bool includeUpdatedProperties = false);

    // Largest modSeq across every tracked type, "0" for a fresh account.
    std::string getSessionState(std::string accountId);

private:
    long long record(std::string accountId, std::string type, std::string objectId, std::string op, std::vector<std::string> updatedProperties);
    long long currentModSeq(std::string accountId, std::string type);
};

#endif /* ChangeLog_hpp */
