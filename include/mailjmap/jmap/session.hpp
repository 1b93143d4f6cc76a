/** JMAPSession [MailJMAP]
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

#ifndef JMAPSession_hpp
#define JMAPSession_hpp

#include <stdio.h>
#include <string>

#include "nlohmann/json.hpp"

#include "mailjmap/change_log.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/server_config.hpp"

// The JMAP Session resource served at /.well-known/jmap.
class JMAPSession {
    MailStore * store;
    ChangeLog * changes;
    ServerConfig * config;

public:
    JMAPSession(MailStore * store, ChangeLog * changes, ServerConfig * config);

    nlohmann::json capabilities();
    nlohmann::json build(std::string accountId, std::string baseURL);
};

#endif /* JMAPSession_hpp */
