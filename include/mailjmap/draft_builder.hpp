/** DraftBuilder [MailJMAP]
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

#ifndef DraftBuilder_hpp
#define DraftBuilder_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailjmap/ingestion.hpp"

struct DraftAttachment {
    std::string blobId;
    std::string mimeType;
    std::string filename;
    std::string contentId;
    bool isInline;
    // Filled in by the caller once the account's access to blobId is checked
    std::string bytes;
};

struct Draft {
    std::string subject;
    std::vector<ParsedAddress> from;
    std::vector<ParsedAddress> to;
    std::vector<ParsedAddress> cc;
    std::vector<ParsedAddress> bcc;
    std::vector<ParsedAddress> replyTo;

    bool hasText;
    std::string text;
    bool hasHTML;
    std::string html;

    std::string inReplyTo;
    std::vector<std::string> references;

    std::vector<DraftAttachment> attachments;
};

/**
 * Synthesizes RFC 5322 bytes for an Email/set create that supplies structured
 * fields instead of a blobId. The output goes through the same ingestion path
 * as uploaded or delivered mail.
 */
class DraftBuilder {
    std::string mailDomain;

public:
    DraftBuilder(std::string mailDomain);

    // True when the create object carries any structured draft field.
    static bool IsStructuredDraft(const nlohmann::json & create);

    // Throws JMAPError invalidProperties for incomplete drafts.
    static Draft FromJMAP(const nlohmann::json & create);

    std::string newMessageId();

    std::string build(const Draft & draft);
};

#endif /* DraftBuilder_hpp */
