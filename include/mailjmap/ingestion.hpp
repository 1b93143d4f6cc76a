/** Ingestion [MailJMAP]
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

#ifndef Ingestion_hpp
#define Ingestion_hpp

#include <stdio.h>
#include <string>
#include <vector>
#include <utility>

#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"

#include "mailjmap/mail_store.hpp"
#include "mailjmap/blob_store.hpp"

struct ParsedAddress {
    std::string name;
    std::string email;
};

struct ParsedAttachment {
    std::string mimeType;
    std::string filename;
    std::string disposition;
    std::string contentId;
    bool related;
    std::string bytes;
};

struct ParsedEmail {
    std::string subject;
    std::string messageId;      // normalized, no angle brackets
    std::string inReplyTo;      // raw header value
    std::string references;     // raw header value
    time_t sentAt;              // -1 when absent or unparseable

    std::vector<ParsedAddress> from;
    std::vector<ParsedAddress> sender;
    std::vector<ParsedAddress> replyTo;
    std::vector<ParsedAddress> to;
    std::vector<ParsedAddress> cc;
    std::vector<ParsedAddress> bcc;

    bool hasText;
    std::string text;
    bool hasHTML;
    std::string html;

    // In order of appearance, values unfolded but otherwise raw
    std::vector<std::pair<std::string, std::string>> headers;

    std::vector<ParsedAttachment> attachments;
};

struct StoredBody {
    bool present;
    std::string content;
    bool truncated;
};

struct IngestResult {
    std::string canonicalMessageId;
    std::string rawBlobSha256;
    bool inserted;
    ParsedEmail parsed;
};

/**
 * Turns raw RFC 5322 bytes into the canonical Message record: the raw blob,
 * headers, addresses, attachments (as content-addressed Blobs) and a JMAP
 * body structure. A second ingestion of identical bytes resolves to the same
 * Message row.
 */
class IngestionPipeline {
    MailStore * store;
    BlobStore * blobs;

public:
    IngestionPipeline(MailStore * store, BlobStore * blobs);

    static ParsedEmail parseRawEmail(const std::string & bytes);
    static nlohmann::json buildBodyStructure(const ParsedEmail & email, size_t rawSize);
    static std::string makeSnippet(const ParsedEmail & email);
    static StoredBody prepareStoredBody(bool present, const std::string & value);

    // Writes bytes to blob storage (if missing) and upserts the Blob row.
    std::string storeBlob(const std::string & bytes);
    void upsertBlob(std::string sha256, size_t size);
    void ensureAccountBlob(std::string accountId, std::string sha256);

    /**
     * Must run inside a MailStoreTransaction. Stores the raw bytes, upserts
     * the canonical message and grants the account access to every blob it
     * references.
     */
    IngestResult ingest(std::string accountId, const std::string & rawBytes);
    IngestResult ingest(std::string accountId, const std::string & rawBytes, const ParsedEmail & parsed);

    std::string upsertCanonicalMessage(std::string ingestId, std::string rawBlobSha256, const ParsedEmail & email, size_t size, bool * inserted);

private:
    void storeHeaders(std::string canonicalMessageId, const ParsedEmail & email);
    void storeAddresses(std::string canonicalMessageId, const ParsedEmail & email);
    void storeAttachments(std::string canonicalMessageId, const ParsedEmail & email);
};

#endif /* Ingestion_hpp */
