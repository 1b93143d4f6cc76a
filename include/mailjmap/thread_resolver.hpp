/** ThreadResolver [MailJMAP]
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

#ifndef ThreadResolver_hpp
#define ThreadResolver_hpp

#include <stdio.h>
#include <string>

#include "mailjmap/mail_store.hpp"

struct ThreadResolution {
    std::string threadId;
    bool created;
};

/**
 * Best-effort conversation grouping. A new message joins the thread of the
 * message it replies to (In-Reply-To), or the thread of the earliest known
 * message named in its References header. Otherwise it starts a new Thread.
 *
 * Only live (non-deleted) Emails in the same account are considered.
 */
class ThreadResolver {
    MailStore * store;

public:
    ThreadResolver(MailStore * store);

    ThreadResolution resolveOrCreateThreadId(std::string accountId, std::string subject, time_t internalDate, std::string inReplyTo, std::string referencesHeader);

private:
    std::string findThreadForMessageIds(std::string accountId, std::vector<std::string> & messageIds);
    bool touchThread(std::string threadId, time_t internalDate);
};

#endif /* ThreadResolver_hpp */
