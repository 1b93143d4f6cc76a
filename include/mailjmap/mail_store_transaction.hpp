/** MailStoreTransaction [MailJMAP]
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

#ifndef MailStoreTransaction_hpp
#define MailStoreTransaction_hpp

#include <chrono>
#include <string>

#include "mailjmap/mail_store.hpp"

/**
 * Scoped BEGIN IMMEDIATE / COMMIT around one JMAP mutation, queue claim or
 * maintenance step. Destroying an uncommitted transaction rolls it back and
 * discards the store's post-commit work, so a JMAPError thrown halfway
 * through a /set leaves no rows and no state bump behind.
 */
class MailStoreTransaction
{
public:
    explicit MailStoreTransaction(MailStore * store, std::string name = "");

    ~MailStoreTransaction() noexcept;

    // Throws SQLite::Exception when called twice.
    void commit();

private:
    MailStoreTransaction(const MailStoreTransaction&);
    MailStoreTransaction& operator=(const MailStoreTransaction&);

    void logIfSlow();

    MailStore * _store;
    std::string _name;
    bool _committed;

    // Acquiring the write lock can wait on another writer for up to the busy timeout
    std::chrono::steady_clock::time_point _requested;
    std::chrono::steady_clock::time_point _acquired;
};

#endif /* MailStoreTransaction_hpp */
