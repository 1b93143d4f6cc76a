/** Keywords [MailJMAP]
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

#ifndef Keywords_hpp
#define Keywords_hpp

#include <stdio.h>
#include <string>
#include <map>

#include "nlohmann/json.hpp"

struct KeywordFlags {
    bool isSeen;
    bool isFlagged;
    bool isAnswered;
    bool isDraft;
};

bool operator==(const KeywordFlags & a, const KeywordFlags & b);
bool operator!=(const KeywordFlags & a, const KeywordFlags & b);

class Keywords {
public:
    // "$Seen" => "$seen", "\Flagged" => "\flagged", "Work" => "work"
    static std::string normalizeKeywordName(std::string keyword);

    // Printable ASCII, no JMAP-forbidden characters, at most 255 characters.
    static bool isValidCustomKeyword(std::string keyword);

    /**
     * Splits a {keyword: bool} map into the four system flags (applied on top
     * of `base`) and a map of custom keyword mutations. Throws JMAPError
     * invalidProperties for non-boolean values or invalid keyword names.
     */
    static KeywordFlags split(const nlohmann::json & patch, KeywordFlags base, std::map<std::string, bool> & custom);

    // Applies one "keywords/<name>" patch pointer.
    static KeywordFlags applyOne(std::string keyword, bool value, KeywordFlags base, std::map<std::string, bool> & custom);

    static nlohmann::json toJMAP(KeywordFlags flags, const std::vector<std::string> & custom);
};

#endif /* Keywords_hpp */
