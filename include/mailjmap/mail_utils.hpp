/** MailUtils [MailJMAP]
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

#ifndef MailUtils_hpp
#define MailUtils_hpp

#include <memory>
#include <string>
#include <vector>
#include <iterator>

#include <stdio.h>
#include <time.h>
#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"

class MailUtils {

public:
    static std::string toBase64(const char * pbegin, size_t len);
    static std::string fromBase64(const std::string & encoded);

    static std::string sha256Hex(const std::string & bytes);
    static std::string toHex(const unsigned char * bytes, size_t len);

    static std::string getEnvUTF8(std::string key);

    static std::string timestampForTime(time_t time);
    static time_t timeForTimestamp(std::string timestamp);

    static std::string idRandomlyGenerated();

    static std::string trim(std::string str);
    static std::string toLower(std::string str);
    static std::string toUpper(std::string str);
    static std::string normalizeEmail(std::string email);
    static std::string urlEncode(std::string str);

    static bool isBlobId(const std::string & str);
    static bool isAccountId(const std::string & str);

    // Cuts at a byte offset without splitting a UTF-8 sequence.
    static std::string utf8Prefix(const std::string & str, size_t maxBytes);

    // "<abc@host>" => "abc@host"
    static std::string normalizeMessageId(std::string id);
    // Extracts <...> ids, falling back to whitespace separated tokens.
    static std::vector<std::string> parseReferences(std::string header);

    static std::string qmarks(size_t count);
};

#endif /* MailUtils_hpp */
