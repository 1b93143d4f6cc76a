#include "mailjmap/ingestion.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/sync_exception.hpp"

#include <regex>

#include "spdlog/spdlog.h"

static std::string stringOrEmpty(mailcore::String * str) {
    if (str == nullptr) {
        return "";
    }
    return std::string(str->UTF8Characters());
}

static std::string utf8FirstCharacters(const std::string & str, size_t count) {
    size_t seen = 0;
    for (size_t ii = 0; ii < str.size(); ii ++) {
        if ((((unsigned char)str[ii]) & 0xC0) != 0x80) {
            if (seen == count) {
                return str.substr(0, ii);
            }
            seen++;
        }
    }
    return str;
}

static void parseHeaderBlock(const std::string & raw, std::vector<std::pair<std::string, std::string>> & out) {
    std::string name = "";
    std::string value = "";
    size_t pos = 0;

    while (pos < raw.size()) {
        size_t eol = raw.find('\n', pos);
        if (eol == std::string::npos) {
            eol = raw.size();
        }
        std::string line = raw.substr(pos, eol - pos);
        pos = eol + 1;
        if (line.size() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() == 0) {
            break;
        }
        if (line[0] == ' ' || line[0] == '\t') {
            if (name != "") {
                value += " " + MailUtils::trim(line);
            }
            continue;
        }
        if (name != "") {
            out.push_back({name, MailUtils::trim(value)});
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            name = "";
            continue;
        }
        name = MailUtils::trim(line.substr(0, colon));
        value = line.substr(colon + 1);
    }
    if (name != "") {
        out.push_back({name, MailUtils::trim(value)});
    }
}

static std::string headerValue(const ParsedEmail & email, std::string lowerName) {
    for (const auto & pair : email.headers) {
        if (MailUtils::toLower(pair.first) == lowerName) {
            return pair.second;
        }
    }
    return "";
}

static void appendAddress(mailcore::Address * addr, std::vector<ParsedAddress> & list) {
    if (addr == nullptr || addr->mailbox() == nullptr) {
        return;
    }
    list.push_back(ParsedAddress{stringOrEmpty(addr->displayName()), stringOrEmpty(addr->mailbox())});
}

static void appendAddresses(mailcore::Array * arr, std::vector<ParsedAddress> & list) {
    if (arr == nullptr) {
        return;
    }
    for (unsigned int ii = 0; ii < arr->count(); ii ++) {
        appendAddress((mailcore::Address *)arr->objectAtIndex(ii), list);
    }
}

static void walkPart(mailcore::AbstractPart * part, ParsedEmail & email, bool related, bool embedded) {
    if (part == nullptr) {
        return;
    }

    switch (part->partType()) {
        case mailcore::PartTypeSingle: {
            mailcore::Attachment * att = (mailcore::Attachment *)part;
            std::string mimeType = MailUtils::toLower(stringOrEmpty(att->mimeType()));
            if (mimeType == "") {
                mimeType = "application/octet-stream";
            }
            std::string filename = stringOrEmpty(att->filename());

            // Unnamed text parts of the message itself are bodies, not attachments
            if (!embedded && filename == "" && (mimeType == "text/plain" || mimeType == "text/html")) {
                std::string value = stringOrEmpty(att->decodedString());
                if (mimeType == "text/plain") {
                    email.text += (email.hasText ? "\n" : "") + value;
                    email.hasText = true;
                } else {
                    email.html += value;
                    email.hasHTML = true;
                }
                return;
            }

            ParsedAttachment pa;
            pa.mimeType = mimeType;
            pa.filename = filename;
            pa.disposition = att->isInlineAttachment() ? "inline" : "attachment";
            pa.contentId = MailUtils::normalizeMessageId(stringOrEmpty(att->contentID()));
            pa.related = related;
            if (att->data() != nullptr) {
                pa.bytes = std::string(att->data()->bytes(), att->data()->length());
            }
            email.attachments.push_back(pa);
            break;
        }
        case mailcore::PartTypeMessage: {
            mailcore::AbstractMessagePart * mp = (mailcore::AbstractMessagePart *)part;
            walkPart(mp->mainPart(), email, related, true);
            break;
        }
        case mailcore::PartTypeMultipartRelated:
        case mailcore::PartTypeMultipartMixed:
        case mailcore::PartTypeMultipartAlternative:
        case mailcore::PartTypeMultipartSigned: {
            mailcore::AbstractMultipart * mp = (mailcore::AbstractMultipart *)part;
            bool childRelated = related || part->partType() == mailcore::PartTypeMultipartRelated;
            mailcore::Array * parts = mp->parts();
            for (unsigned int ii = 0; parts && ii < parts->count(); ii ++) {
                walkPart((mailcore::AbstractPart *)parts->objectAtIndex(ii), email, childRelated, embedded);
            }
            break;
        }
    }
}

IngestionPipeline::IngestionPipeline(MailStore * store, BlobStore * blobs) :
    store(store), blobs(blobs)
{
}

ParsedEmail IngestionPipeline::parseRawEmail(const std::string & bytes) {
    mailcore::AutoreleasePool pool;

    ParsedEmail email;
    email.sentAt = -1;
    email.hasText = false;
    email.hasHTML = false;

    parseHeaderBlock(bytes, email.headers);

    mailcore::Data * data = mailcore::Data::dataWithBytes(bytes.data(), (unsigned int)bytes.size());
    mailcore::MessageParser * parser = mailcore::MessageParser::messageParserWithData(data);
    if (parser == nullptr || parser->header() == nullptr) {
        throw SyncException("invalid-mime", "Unable to parse message", false);
    }
    mailcore::MessageHeader * header = parser->header();

    email.subject = stringOrEmpty(header->subject());
    email.messageId = MailUtils::normalizeMessageId(headerValue(email, "message-id"));
    email.inReplyTo = headerValue(email, "in-reply-to");
    email.references = headerValue(email, "references");
    if (headerValue(email, "date") != "" && header->date() > 0) {
        email.sentAt = header->date();
    }

    appendAddress(header->from(), email.from);
    appendAddress(header->sender(), email.sender);
    appendAddresses(header->replyTo(), email.replyTo);
    appendAddresses(header->to(), email.to);
    appendAddresses(header->cc(), email.cc);
    appendAddresses(header->bcc(), email.bcc);

    walkPart(parser->mainPart(), email, false, false);
    return email;
}

nlohmann::json IngestionPipeline::buildBodyStructure(const ParsedEmail & email, size_t rawSize) {
    nlohmann::json parts = nlohmann::json::array();
    int partCounter = 1;

    if (email.hasText) {
        parts.push_back({
            {"partId", std::to_string(partCounter++)},
            {"type", "text"},
            {"subtype", "plain"},
            {"size", email.text.size()},
        });
    }
    if (email.hasHTML) {
        parts.push_back({
            {"partId", std::to_string(partCounter++)},
            {"type", "text"},
            {"subtype", "html"},
            {"size", email.html.size()},
        });
    }
    for (const auto & att : email.attachments) {
        size_t slash = att.mimeType.find('/');
        std::string type = slash == std::string::npos ? att.mimeType : att.mimeType.substr(0, slash);
        std::string subtype = slash == std::string::npos ? "" : att.mimeType.substr(slash + 1);

        nlohmann::json part = {
            {"partId", std::to_string(partCounter++)},
            {"type", type != "" ? type : "application"},
            {"subtype", subtype != "" ? subtype : "octet-stream"},
            {"size", att.bytes.size()},
            {"disposition", att.disposition},
            {"name", nullptr},
            {"cid", nullptr},
            {"related", att.related},
            {"blobId", MailUtils::sha256Hex(att.bytes)},
        };
        if (att.filename != "") {
            part["name"] = att.filename;
        }
        if (att.contentId != "") {
            part["cid"] = att.contentId;
        }
        parts.push_back(part);
    }

    return {
        {"size", rawSize},
        {"isTruncated", false},
        {"parts", parts},
    };
}

std::string IngestionPipeline::makeSnippet(const ParsedEmail & email) {
    std::string text = MailUtils::trim(email.text);
    if (text != "") {
        return utf8FirstCharacters(text, SNIPPET_LENGTH);
    }
    if (email.html != "") {
        static const std::regex tags("<[^>]+>");
        static const std::regex whitespace("\\s+");
        std::string stripped = std::regex_replace(email.html, tags, " ");
        stripped = MailUtils::trim(std::regex_replace(stripped, whitespace, " "));
        if (stripped != "") {
            return utf8FirstCharacters(stripped, SNIPPET_LENGTH);
        }
    }
    return "";
}

StoredBody IngestionPipeline::prepareStoredBody(bool present, const std::string & value) {
    if (!present || value == "") {
        return StoredBody{false, "", false};
    }
    std::string normalized;
    normalized.reserve(value.size());
    for (size_t ii = 0; ii < value.size(); ii ++) {
        if (value[ii] == '\r' && ii + 1 < value.size() && value[ii + 1] == '\n') {
            continue;
        }
        normalized.push_back(value[ii]);
    }
    if (normalized.size() <= MAX_STORED_BODY_BYTES) {
        return StoredBody{true, normalized, false};
    }
    return StoredBody{true, MailUtils::utf8Prefix(normalized, MAX_STORED_BODY_BYTES), true};
}

std::string IngestionPipeline::storeBlob(const std::string & bytes) {
    std::string sha = MailUtils::sha256Hex(bytes);
    if (!blobs->exists(sha)) {
        blobs->put(sha, bytes);
        BlobStore * storage = blobs;
        store->runAfterRollback([storage, sha]() {
            try {
                storage->remove(sha);
            } catch (std::exception & ex) {
                spdlog::get("logger")->warn("Unable to delete blob {} after rollback: {}", sha, ex.what());
            }
        });
    }
    upsertBlob(sha, bytes.size());
    return sha;
}

void IngestionPipeline::upsertBlob(std::string sha256, size_t size) {
    SQLite::Statement insert(store->db(), "INSERT OR IGNORE INTO Blob (sha256, size, storageKey, createdAt) VALUES (?,?,?,?)");
    insert.bind(1, sha256);
    insert.bind(2, (long long)size);
    insert.bind(3, sha256);
    insert.bind(4, (long long)time(0));
    insert.exec();
}

void IngestionPipeline::ensureAccountBlob(std::string accountId, std::string sha256) {
    SQLite::Statement insert(store->db(), "INSERT OR IGNORE INTO AccountBlob (accountId, sha256, createdAt) VALUES (?,?,?)");
    insert.bind(1, accountId);
    insert.bind(2, sha256);
    insert.bind(3, (long long)time(0));
    insert.exec();
}

IngestResult IngestionPipeline::ingest(std::string accountId, const std::string & rawBytes) {
    return ingest(accountId, rawBytes, IngestionPipeline::parseRawEmail(rawBytes));
}

IngestResult IngestionPipeline::ingest(std::string accountId, const std::string & rawBytes, const ParsedEmail & parsed) {
    IngestResult result;
    result.parsed = parsed;
    result.rawBlobSha256 = storeBlob(rawBytes);
    ensureAccountBlob(accountId, result.rawBlobSha256);

    // The ingestId is the digest of the raw bytes, identical bytes share one Message
    result.canonicalMessageId = upsertCanonicalMessage(result.rawBlobSha256, result.rawBlobSha256, parsed, rawBytes.size(), &result.inserted);

    SQLite::Statement attachments(store->db(), "SELECT blobSha256 FROM Attachment WHERE messageId = ?");
    attachments.bind(1, result.canonicalMessageId);
    while (attachments.executeStep()) {
        ensureAccountBlob(accountId, attachments.getColumn(0).getString());
    }
    return result;
}

std::string IngestionPipeline::upsertCanonicalMessage(std::string ingestId, std::string rawBlobSha256, const ParsedEmail & email, size_t size, bool * inserted) {
    std::vector<std::string> references = MailUtils::parseReferences(email.references);
    std::vector<std::string> inReplyTo = MailUtils::parseReferences(email.inReplyTo);
    StoredBody text = prepareStoredBody(email.hasText, email.text);
    StoredBody html = prepareStoredBody(email.hasHTML, email.html);

    SQLite::Statement insert(store->db(), "INSERT OR IGNORE INTO Message (id, ingestId, rawBlobSha256, headerMessageId, inReplyTo, referencesJson, subject, snippet, sentAt, createdAt, size, hasAttachment, bodyStructure, textBody, textBodyIsTruncated, htmlBody, htmlBodyIsTruncated) VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)");
    insert.bind(1, MailUtils::idRandomlyGenerated());
    insert.bind(2, ingestId);
    insert.bind(3, rawBlobSha256);
    if (email.messageId != "") {
        insert.bind(4, email.messageId);
    } else {
        insert.bind(4);
    }
    if (inReplyTo.size()) {
        insert.bind(5, inReplyTo.front());
    } else {
        insert.bind(5);
    }
    if (references.size()) {
        insert.bind(6, nlohmann::json(references).dump());
    } else {
        insert.bind(6);
    }
    insert.bind(7, email.subject);
    insert.bind(8, makeSnippet(email));
    if (email.sentAt > 0) {
        insert.bind(9, (long long)email.sentAt);
    } else {
        insert.bind(9);
    }
    insert.bind(10, (long long)time(0));
    insert.bind(11, (long long)size);
    insert.bind(12, email.attachments.size() > 0 ? 1 : 0);
    insert.bind(13, buildBodyStructure(email, size).dump());
    if (text.present) {
        insert.bind(14, text.content);
    } else {
        insert.bind(14);
    }
    insert.bind(15, text.truncated ? 1 : 0);
    if (html.present) {
        insert.bind(16, html.content);
    } else {
        insert.bind(16);
    }
    insert.bind(17, html.truncated ? 1 : 0);
    *inserted = insert.exec() > 0;

    SQLite::Statement find(store->db(), "SELECT id FROM Message WHERE ingestId = ?");
    find.bind(1, ingestId);
    if (!find.executeStep()) {
        throw SyncException("ingest", "Failed to upsert canonical message " + ingestId, true);
    }
    std::string id = find.getColumn(0).getString();

    if (*inserted) {
        storeHeaders(id, email);
        storeAddresses(id, email);
        storeAttachments(id, email);
    }
    return id;
}

void IngestionPipeline::storeHeaders(std::string canonicalMessageId, const ParsedEmail & email) {
    SQLite::Statement insert(store->db(), "INSERT INTO MessageHeader (messageId, position, name, lowerName, value) VALUES (?,?,?,?,?)");
    int position = 0;
    for (const auto & pair : email.headers) {
        if (pair.first == "" || pair.second == "") {
            continue;
        }
        insert.reset();
        insert.bind(1, canonicalMessageId);
        insert.bind(2, position++);
        insert.bind(3, pair.first);
        insert.bind(4, MailUtils::toLower(pair.first));
        insert.bind(5, pair.second);
        insert.exec();
    }
}

void IngestionPipeline::storeAddresses(std::string canonicalMessageId, const ParsedEmail & email) {
    std::vector<std::pair<std::string, const std::vector<ParsedAddress> *>> segments = {
        {"from", &email.from},
        {"sender", &email.sender},
        {"reply-to", &email.replyTo},
        {"to", &email.to},
        {"cc", &email.cc},
        {"bcc", &email.bcc},
    };

    SQLite::Statement upsert(store->db(), "INSERT OR IGNORE INTO Address (id, email, name) VALUES (?,?,?)");
    SQLite::Statement lookup(store->db(), "SELECT id FROM Address WHERE email = ?");
    SQLite::Statement link(store->db(), "INSERT INTO MessageAddress (messageId, addressId, kind, position) VALUES (?,?,?,?)");

    for (const auto & segment : segments) {
        int position = 0;
        for (const auto & addr : *segment.second) {
            std::string normalized = MailUtils::normalizeEmail(addr.email);
            if (normalized == "") {
                continue;
            }
            upsert.reset();
            upsert.bind(1, MailUtils::idRandomlyGenerated());
            upsert.bind(2, normalized);
            if (addr.name != "") {
                upsert.bind(3, addr.name);
            } else {
                upsert.bind(3);
            }
            upsert.exec();

            lookup.reset();
            lookup.bind(1, normalized);
            if (!lookup.executeStep()) {
                throw SyncException("ingest", "Failed to upsert address " + normalized, true);
            }
            std::string addressId = lookup.getColumn(0).getString();

            link.reset();
            link.bind(1, canonicalMessageId);
            link.bind(2, addressId);
            link.bind(3, segment.first);
            link.bind(4, position++);
            link.exec();
        }
    }
}

void IngestionPipeline::storeAttachments(std::string canonicalMessageId, const ParsedEmail & email) {
    SQLite::Statement insert(store->db(), "INSERT INTO Attachment (id, messageId, blobSha256, filename, mimeType, disposition, contentId, related, position) VALUES (?,?,?,?,?,?,?,?,?)");
    int position = 0;
    for (const auto & att : email.attachments) {
        std::string sha = storeBlob(att.bytes);

        insert.reset();
        insert.bind(1, MailUtils::idRandomlyGenerated());
        insert.bind(2, canonicalMessageId);
        insert.bind(3, sha);
        if (att.filename != "") {
            insert.bind(4, att.filename);
        } else {
            insert.bind(4);
        }
        insert.bind(5, att.mimeType);
        insert.bind(6, att.disposition);
        if (att.contentId != "") {
            insert.bind(7, att.contentId);
        } else {
            insert.bind(7);
        }
        insert.bind(8, att.related ? 1 : 0);
        insert.bind(9, position++);
        insert.exec();
    }
    if (position > 0) {
        spdlog::get("logger")->info("Stored {} attachments for message {}", position, canonicalMessageId);
    }
}
