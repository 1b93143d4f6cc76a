/** NetworkRequestUtils [MailJMAP]
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

#ifndef NetworkRequestUtils_hpp
#define NetworkRequestUtils_hpp

#include <curl/curl.h>
#include <stdio.h>
#include <map>
#include <string>
#include "nlohmann/json.hpp"

struct HTTPResponse {
    long status;
    std::string body;
    // Header names are lowercased
    std::map<std::string, std::string> headers;
};

std::string FindLinuxCertsBundle();

// The payload pointer must stay valid until the request is performed.
CURL * CreateRequest(std::string url, std::string method, struct curl_slist * headers, const std::string * payload = nullptr);

// Performs the request and returns the response regardless of its status code.
// Transport failures throw SyncException. Cleans up the handle and header list.
HTTPResponse PerformHTTPRequest(CURL * curl_handle, struct curl_slist * headers = nullptr);

#endif /* NetworkRequestUtils_hpp */
