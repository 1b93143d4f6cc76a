/** SyncException [MailJMAP]
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

#ifndef SyncException_hpp
#define SyncException_hpp

#include <stdio.h>
#include <string>
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "mailjmap/generic_exception.hpp"

/**
 * Infrastructure failures: storage, configuration, MIME parsing and outbound
 * HTTP. JMAP-level problems are reported with JMAPError instead. `key` is a
 * short machine-readable category, `debuginfo` the human-readable detail.
 */
class SyncException : public GenericException {
    bool retryable = false;

public:
    SyncException(std::string key, std::string di, bool retryable);

    // Network failures (DNS, connect, timeouts, TLS) are retryable.
    SyncException(CURLcode c, std::string di);

    std::string key;
    std::string debuginfo;

    bool isRetryable();
    // 400 for undecodable input, 503 when a retry may succeed.
    int httpStatus() override;
    const char * what() const noexcept override;
    nlohmann::json toJSON() override;
};

#endif /* SyncException_hpp */
