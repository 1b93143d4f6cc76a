/** EndpointResponse [MailJMAP]
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

#ifndef EndpointResponse_hpp
#define EndpointResponse_hpp

#include <stdio.h>
#include <map>
#include <string>

#include "nlohmann/json.hpp"

// What the HTTP front end writes back for one packet.
struct EndpointResponse {
    int status = 200;
    nlohmann::json body = nullptr;
    std::map<std::string, std::string> headers;

    // Raw response bytes (downloads). Sent base64 encoded on the wire.
    bool hasData = false;
    std::string data;

    static EndpointResponse JSON(int status, nlohmann::json body) {
        EndpointResponse response;
        response.status = status;
        response.body = body;
        return response;
    }

    nlohmann::json toJSON() const;
};

#endif /* EndpointResponse_hpp */
