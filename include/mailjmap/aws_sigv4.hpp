/** AwsSigV4 [MailJMAP]
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

#ifndef AwsSigV4_hpp
#define AwsSigV4_hpp

#include <stdio.h>
#include <time.h>
#include <map>
#include <string>

struct AwsCredentials {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string region;
    std::string service;
};

/**
 * AWS Signature Version 4 for JSON POST requests without a query string.
 * Signs the content-type, host and x-amz-date headers.
 */
class AwsSigV4 {
public:
    // Returns the headers to send, including Authorization and
    // x-amz-content-sha256.
    static std::map<std::string, std::string> sign(std::string method, std::string url, const std::string & body, const AwsCredentials & credentials, time_t now);

    static std::string hmacSha256(const std::string & key, const std::string & data);

    // "https://host:443/a/b?x" => host "host:443", path "/a/b"
    static void splitURL(std::string url, std::string & host, std::string & path);
};

#endif /* AwsSigV4_hpp */
