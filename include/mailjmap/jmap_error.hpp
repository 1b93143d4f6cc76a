/** JMAPError [MailJMAP]
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

#ifndef JMAPError_hpp
#define JMAPError_hpp

#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "mailjmap/generic_exception.hpp"

/**
 * A problem that is reported to the client using the JMAP error vocabulary
 * (accountNotFound, stateMismatch, invalidProperties, notFound, ...).
 *
 * Engines throw it for a single object inside a /set loop, where it is caught
 * and placed into notCreated / notUpdated / notDestroyed. When it escapes a
 * method handler the dispatcher turns it into an ["error", ...] response.
 */
class JMAPError : public GenericException {
public:
    JMAPError(std::string type, std::string description = "", std::vector<std::string> properties = {});

    std::string type;
    std::string description;
    std::vector<std::string> properties;

    // Request-level errors are 400, except alreadyExists (409) and
    // accountNotFound (404).
    int httpStatus() override;
    const char * what() const noexcept override;
    nlohmann::json toJSON() override;
};

#endif /* JMAPError_hpp */
