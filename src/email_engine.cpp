#include "mailjmap/email_engine.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/jmap_error.hpp"
#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/sync_exception.hpp"
#include "mailjmap/models/account.hpp"
#include "mailjmap/models/mailbox.hpp"
#include "mailjmap/models/thread.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

#include "spdlog/spdlog.h"

static const std::vector<std::string> MAILBOX_COUNT_PROPERTIES = {
    "totalEmails", "unreadEmails", "totalThreads", "unreadThreads",
};

static const std::vector<std::string> DEFAULT_EMAIL_PROPERTIES = {
    "id", "blobId", "threadId", "mailboxIds", "keywords", "size", "receivedAt",
    "messageId", "inReplyTo", "references", "sender", "from", "to", "cc", "bcc",
    "replyTo", "subject", "sentAt", "hasAttachment", "preview", "bodyValues",
    "textBody", "htmlBody", "attachments",
};

static const std::vector<std::string> DEFAULT_BODY_PROPERTIES = {
    "partId", "blobId", "size", "name", "type", "charset", "disposition", "cid",
};

// "keywords/$seen" style patch keys are JSON pointers
static std::string unescapePointer(std::string token) {
    std::string out;
    for (size_t ii = 0; ii < token.size(); ii ++) {
        if (token[ii] == '~' && ii + 1 < token.size()) {
            if (token[ii + 1] == '1') { out.push_back('/'); ii++; continue; }
            if (token[ii + 1] == '0') { out.push_back('~'); ii++; continue; }
        }
        out.push_back(token[ii]);
    }
    return out;
}

static bool startsWith(const std::string & str, const std::string & prefix) {
    return str.size() > prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

static time_t receivedAtFromJSON(const nlohmann::json & create) {
    if (!create.count("receivedAt") || create["receivedAt"].is_null()) {
        return time(0);
    }
    if (!create["receivedAt"].is_string()) {
        throw JMAPError("invalidProperties", "receivedAt must be a UTCDate string", {"receivedAt"});
    }
    time_t t = MailUtils::timeForTimestamp(create["receivedAt"].get<std::string>());
    if (t < 0) {
        throw JMAPError("invalidProperties", "receivedAt must be a UTCDate string", {"receivedAt"});
    }
    return t;
}

nlohmann::json EmailCreated::toJSON() const {
    return {
        {"id", id},
        {"blobId", blobId},
        {"threadId", threadId},
        {"size", size},
    };
}

EmailEngine::EmailEngine(MailStore * store, BlobStore * blobs, ServerConfig * config, ChangeLog * changes) :
    store(store),
    blobs(blobs),
    config(config),
    changes(changes),
    pipeline(store, blobs),
    threads(store),
    drafts(config->mailDomain)
{
}

// Lookups

std::shared_ptr<Email> EmailEngine::findLiveEmail(std::string accountId, std::string emailId) {
    return store->find<Email>(Query::InAccount(accountId).equal("id", emailId).live());
}

std::vector<std::string> EmailEngine::mailboxIdsForEmail(std::string emailId) {
    std::vector<std::string> ids;
    SQLite::Statement query(store->db(), "SELECT mailboxId FROM MailboxMessage WHERE emailId = ? ORDER BY mailboxId");
    query.bind(1, emailId);
    while (query.executeStep()) {
        ids.push_back(query.getColumn(0).getString());
    }
    return ids;
}

std::vector<std::string> EmailEngine::customKeywordsForEmail(std::string emailId) {
    std::vector<std::string> keywords;
    SQLite::Statement query(store->db(), "SELECT keyword FROM EmailKeyword WHERE emailId = ? ORDER BY keyword");
    query.bind(1, emailId);
    while (query.executeStep()) {
        keywords.push_back(query.getColumn(0).getString());
    }
    return keywords;
}

bool EmailEngine::accountHasBlob(std::string accountId, std::string blobId) {
    SQLite::Statement query(store->db(), "SELECT 1 FROM AccountBlob WHERE accountId = ? AND sha256 = ?");
    query.bind(1, accountId);
    query.bind(2, blobId);
    return query.executeStep();
}

std::vector<std::string> EmailEngine::resolveMailboxIds(std::string accountId, const nlohmann::json & value, const CreationIdMap & creationIds) {
    if (!value.is_object()) {
        throw JMAPError("invalidProperties", "mailboxIds must be an object", {"mailboxIds"});
    }
    std::set<std::string> ids;
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (!it.value().is_boolean()) {
            throw JMAPError("invalidProperties", "mailboxIds values must be true", {"mailboxIds"});
        }
        if (!it.value().get<bool>()) {
            continue;
        }
        std::string id = ResolveCreationReference(it.key(), creationIds, "mailboxIds");
        if (store->find<Mailbox>(Query::InAccount(accountId).equal("id", id)) == nullptr) {
            throw JMAPError("invalidProperties", "Mailbox " + it.key() + " not found", {"mailboxIds"});
        }
        ids.insert(id);
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

std::string EmailEngine::loadBlobForAccount(std::string accountId, std::string blobId, std::string property) {
    if (!accountHasBlob(accountId, blobId)) {
        throw JMAPError("invalidProperties", "blobId not found for this account", {property});
    }
    auto bytes = blobs->get(blobId);
    if (bytes == nullptr) {
        throw JMAPError("invalidProperties", "Blob data is unavailable", {property});
    }
    return *bytes;
}

void EmailEngine::checkAttachmentSize(const ParsedEmail & parsed) {
    long long total = 0;
    for (const auto & att : parsed.attachments) {
        total += (long long)att.bytes.size();
    }
    if (total > config->maxSizeAttachmentsPerEmail) {
        throw JMAPError("limitExceeded", "Attachments exceed the per-email size limit", {"attachments"});
    }
}

// Row maintenance

void EmailEngine::setMailboxes(std::string emailId, const std::vector<std::string> & mailboxIds) {
    std::vector<std::string> existing = mailboxIdsForEmail(emailId);
    std::set<std::string> target(mailboxIds.begin(), mailboxIds.end());

    SQLite::Statement remove(store->db(), "DELETE FROM MailboxMessage WHERE emailId = ? AND mailboxId = ?");
    for (const auto & id : existing) {
        if (!target.count(id)) {
            remove.reset();
            remove.bind(1, emailId);
            remove.bind(2, id);
            remove.exec();
        }
    }

    SQLite::Statement insert(store->db(), "INSERT OR IGNORE INTO MailboxMessage (mailboxId, emailId, addedAt) VALUES (?,?,?)");
    for (const auto & id : target) {
        if (std::find(existing.begin(), existing.end(), id) == existing.end()) {
            insert.reset();
            insert.bind(1, id);
            insert.bind(2, emailId);
            insert.bind(3, (long long)time(0));
            insert.exec();
        }
    }
}

void EmailEngine::setCustomKeywords(std::string emailId, const std::vector<std::string> & keywords) {
    std::vector<std::string> existing = customKeywordsForEmail(emailId);
    std::set<std::string> target(keywords.begin(), keywords.end());

    SQLite::Statement remove(store->db(), "DELETE FROM EmailKeyword WHERE emailId = ? AND keyword = ?");
    for (const auto & kw : existing) {
        if (!target.count(kw)) {
            remove.reset();
            remove.bind(1, emailId);
            remove.bind(2, kw);
            remove.exec();
        }
    }

    SQLite::Statement insert(store->db(), "INSERT OR IGNORE INTO EmailKeyword (emailId, keyword) VALUES (?,?)");
    for (const auto & kw : target) {
        insert.reset();
        insert.bind(1, emailId);
        insert.bind(2, kw);
        insert.exec();
    }
}

void EmailEngine::refreshThread(std::string accountId, std::string threadId) {
    SQLite::Statement live(store->db(), "SELECT COUNT(*), MAX(internalDate) FROM Email WHERE threadId = ? AND isDeleted = 0");
    live.bind(1, threadId);
    live.executeStep();
    int count = live.getColumn(0).getInt();

    auto thread = store->find<Thread>(Query().equal("id", threadId));

    if (count == 0) {
        if (thread != nullptr) {
            store->remove(thread.get());
        }
        changes->recordDestroy(accountId, TYPE_THREAD, threadId);
        return;
    }

    time_t latest = (time_t)live.getColumn(1).getInt64();
    if (thread != nullptr && thread->latestMessageAt() != latest) {
        thread->setLatestMessageAt(latest);
        store->save(thread.get());
    }
    changes->recordUpdate(accountId, TYPE_THREAD, threadId, {"emailIds"});
}

void EmailEngine::recordMailboxCountChanges(std::string accountId, const std::vector<std::string> & mailboxIds) {
    std::set<std::string> unique(mailboxIds.begin(), mailboxIds.end());
    for (const auto & id : unique) {
        changes->recordUpdate(accountId, TYPE_MAILBOX, id, MAILBOX_COUNT_PROPERTIES);
    }
}

// Create

EmailCreated EmailEngine::createFromRaw(std::string accountId, const std::string & rawBytes, const ParsedEmail & parsed, std::vector<std::string> mailboxIds, KeywordFlags flags, std::vector<std::string> customKeywords, time_t internalDate) {
    IngestResult ingested = pipeline.ingest(accountId, rawBytes, parsed);
    ThreadResolution thread = threads.resolveOrCreateThreadId(accountId, parsed.subject, internalDate, parsed.inReplyTo, parsed.references);

    Email email{MailUtils::idRandomlyGenerated(), accountId, ingested.canonicalMessageId, thread.threadId, internalDate};
    email.setIsSeen(flags.isSeen);
    email.setIsFlagged(flags.isFlagged);
    email.setIsAnswered(flags.isAnswered);
    email.setIsDraft(flags.isDraft);
    store->save(&email);

    setMailboxes(email.id(), mailboxIds);
    setCustomKeywords(email.id(), customKeywords);

    changes->recordCreate(accountId, TYPE_EMAIL, email.id());
    if (thread.created) {
        changes->recordCreate(accountId, TYPE_THREAD, thread.threadId);
    } else {
        changes->recordUpdate(accountId, TYPE_THREAD, thread.threadId, {"emailIds"});
    }
    recordMailboxCountChanges(accountId, mailboxIds);

    return EmailCreated{email.id(), ingested.rawBlobSha256, thread.threadId, rawBytes.size()};
}

EmailCreated EmailEngine::createEmail(std::string accountId, const nlohmann::json & create, const CreationIdMap & creationIds) {
    if (!create.is_object()) {
        throw JMAPError("invalidProperties", "Email/create must be an object");
    }
    for (const char * key : {"id", "threadId", "size", "preview", "hasAttachment"}) {
        if (create.count(key)) {
            throw JMAPError("invalidProperties", std::string(key) + " is set by the server", {key});
        }
    }

    if (!create.count("mailboxIds")) {
        throw JMAPError("invalidProperties", "mailboxIds is required", {"mailboxIds"});
    }
    std::vector<std::string> mailboxIds = resolveMailboxIds(accountId, create["mailboxIds"], creationIds);
    if (mailboxIds.size() == 0) {
        throw JMAPError("invalidProperties", "mailboxIds must include at least one mailbox", {"mailboxIds"});
    }
    if ((int)mailboxIds.size() > config->maxMailboxesPerEmail) {
        throw JMAPError("limitExceeded", "Too many mailboxes for one email", {"mailboxIds"});
    }

    std::map<std::string, bool> custom;
    KeywordFlags flags = Keywords::split(create.count("keywords") ? create["keywords"] : nlohmann::json(), KeywordFlags{false, false, false, false}, custom);
    std::vector<std::string> customKeywords;
    for (const auto & pair : custom) {
        if (pair.second) {
            customKeywords.push_back(pair.first);
        }
    }

    time_t internalDate = receivedAtFromJSON(create);

    std::string raw;
    if (create.count("blobId")) {
        if (!create["blobId"].is_string()) {
            throw JMAPError("invalidProperties", "blobId must be a string", {"blobId"});
        }
        raw = loadBlobForAccount(accountId, create["blobId"].get<std::string>(), "blobId");

    } else if (DraftBuilder::IsStructuredDraft(create)) {
        Draft draft = DraftBuilder::FromJMAP(create);
        long long total = 0;
        for (auto & att : draft.attachments) {
            att.bytes = loadBlobForAccount(accountId, att.blobId, "attachments");
            total += (long long)att.bytes.size();
            if (total > config->maxSizeAttachmentsPerEmail) {
                throw JMAPError("limitExceeded", "Attachments exceed the per-email size limit", {"attachments"});
            }
        }
        raw = drafts.build(draft);

    } else {
        throw JMAPError("invalidProperties", "Either blobId or draft fields must be provided", {"blobId"});
    }

    ParsedEmail parsed;
    try {
        parsed = IngestionPipeline::parseRawEmail(raw);
    } catch (SyncException & ex) {
        throw JMAPError("invalidProperties", "Unable to parse message: " + ex.debuginfo, {"blobId"});
    }
    checkAttachmentSize(parsed);

    return createFromRaw(accountId, raw, parsed, mailboxIds, flags, customKeywords, internalDate);
}

// Update

std::vector<std::string> EmailEngine::updateEmail(std::string accountId, std::shared_ptr<Email> email, const nlohmann::json & patch, const CreationIdMap & creationIds) {
    if (!patch.is_object()) {
        throw JMAPError("invalidProperties", "Email/update patch must be an object");
    }

    std::vector<std::string> currentMailboxes = mailboxIdsForEmail(email->id());
    std::set<std::string> nextMailboxes(currentMailboxes.begin(), currentMailboxes.end());
    bool mailboxesPatched = false;

    KeywordFlags base{email->isSeen(), email->isFlagged(), email->isAnswered(), email->isDraft()};
    KeywordFlags next = base;
    std::vector<std::string> currentCustom = customKeywordsForEmail(email->id());
    std::set<std::string> nextCustom(currentCustom.begin(), currentCustom.end());

    for (auto it = patch.begin(); it != patch.end(); ++it) {
        const std::string & key = it.key();
        const nlohmann::json & value = it.value();

        if (key == "mailboxIds") {
            std::vector<std::string> ids = resolveMailboxIds(accountId, value, creationIds);
            nextMailboxes = std::set<std::string>(ids.begin(), ids.end());
            mailboxesPatched = true;

        } else if (startsWith(key, "mailboxIds/")) {
            if (!value.is_boolean() && !value.is_null()) {
                throw JMAPError("invalidProperties", "mailboxIds patch values must be true or null", {key});
            }
            std::string id = ResolveCreationReference(unescapePointer(key.substr(11)), creationIds, "mailboxIds");
            if (value.is_boolean() && value.get<bool>()) {
                if (store->find<Mailbox>(Query::InAccount(accountId).equal("id", id)) == nullptr) {
                    throw JMAPError("invalidProperties", "Mailbox " + id + " not found", {"mailboxIds"});
                }
                nextMailboxes.insert(id);
            } else {
                nextMailboxes.erase(id);
            }
            mailboxesPatched = true;

        } else if (key == "keywords") {
            std::map<std::string, bool> custom;
            next = Keywords::split(value.is_null() ? nlohmann::json::object() : value, KeywordFlags{false, false, false, false}, custom);
            nextCustom.clear();
            for (const auto & pair : custom) {
                if (pair.second) {
                    nextCustom.insert(pair.first);
                }
            }

        } else if (startsWith(key, "keywords/")) {
            if (!value.is_boolean() && !value.is_null()) {
                throw JMAPError("invalidProperties", "keywords patch values must be true or null", {key});
            }
            std::map<std::string, bool> custom;
            next = Keywords::applyOne(unescapePointer(key.substr(9)), value.is_boolean() && value.get<bool>(), next, custom);
            for (const auto & pair : custom) {
                if (pair.second) {
                    nextCustom.insert(pair.first);
                } else {
                    nextCustom.erase(pair.first);
                }
            }

        } else {
            throw JMAPError("invalidProperties", "Property " + key + " cannot be updated", {key});
        }
    }

    if (mailboxesPatched) {
        if (nextMailboxes.size() == 0) {
            throw JMAPError("invalidProperties", "must remain in at least one mailbox", {"mailboxIds"});
        }
        if ((int)nextMailboxes.size() > config->maxMailboxesPerEmail) {
            throw JMAPError("limitExceeded", "Too many mailboxes for one email", {"mailboxIds"});
        }
    }

    std::vector<std::string> changed;
    std::vector<std::string> touchedMailboxes;
    std::set<std::string> current(currentMailboxes.begin(), currentMailboxes.end());

    if (mailboxesPatched && nextMailboxes != current) {
        setMailboxes(email->id(), std::vector<std::string>(nextMailboxes.begin(), nextMailboxes.end()));
        std::set_symmetric_difference(current.begin(), current.end(), nextMailboxes.begin(), nextMailboxes.end(), std::back_inserter(touchedMailboxes));
        changed.push_back("mailboxIds");
    }

    std::set<std::string> custom(currentCustom.begin(), currentCustom.end());
    if (next != base || nextCustom != custom) {
        email->setIsSeen(next.isSeen);
        email->setIsFlagged(next.isFlagged);
        email->setIsAnswered(next.isAnswered);
        email->setIsDraft(next.isDraft);
        setCustomKeywords(email->id(), std::vector<std::string>(nextCustom.begin(), nextCustom.end()));
        changed.push_back("keywords");

        // unread counts move with $seen
        if (next.isSeen != base.isSeen) {
            touchedMailboxes.insert(touchedMailboxes.end(), nextMailboxes.begin(), nextMailboxes.end());
            touchedMailboxes.insert(touchedMailboxes.end(), current.begin(), current.end());
        }
    }

    if (changed.size() == 0) {
        return changed;
    }

    email->setUpdatedAt(time(0));
    store->save(email.get());
    changes->recordUpdate(accountId, TYPE_EMAIL, email->id(), changed);
    if (std::find(changed.begin(), changed.end(), "mailboxIds") != changed.end()) {
        changes->recordUpdate(accountId, TYPE_THREAD, email->threadId(), {"emailIds"});
    }
    recordMailboxCountChanges(accountId, touchedMailboxes);
    return changed;
}

// Destroy

void EmailEngine::destroyEmail(std::string accountId, std::string emailId) {
    auto email = findLiveEmail(accountId, emailId);
    if (email == nullptr) {
        throw JMAPError("notFound", "Email not found");
    }
    std::vector<std::string> mailboxIds = mailboxIdsForEmail(emailId);

    SQLite::Statement members(store->db(), "DELETE FROM MailboxMessage WHERE emailId = ?");
    members.bind(1, emailId);
    members.exec();
    SQLite::Statement keywords(store->db(), "DELETE FROM EmailKeyword WHERE emailId = ?");
    keywords.bind(1, emailId);
    keywords.exec();

    email->setIsDeleted(true);
    email->setUpdatedAt(time(0));
    store->save(email.get());

    changes->recordDestroy(accountId, TYPE_EMAIL, emailId);
    refreshThread(accountId, email->threadId());
    recordMailboxCountChanges(accountId, mailboxIds);

    collectCanonicalMessage(email->messageId());
}

void EmailEngine::removeFromMailbox(std::string accountId, std::string emailId, std::string mailboxId) {
    auto email = findLiveEmail(accountId, emailId);
    if (email == nullptr) {
        return;
    }
    std::vector<std::string> mailboxIds = mailboxIdsForEmail(emailId);
    if (std::find(mailboxIds.begin(), mailboxIds.end(), mailboxId) == mailboxIds.end()) {
        return;
    }
    if (mailboxIds.size() == 1) {
        destroyEmail(accountId, emailId);
        return;
    }

    SQLite::Statement remove(store->db(), "DELETE FROM MailboxMessage WHERE emailId = ? AND mailboxId = ?");
    remove.bind(1, emailId);
    remove.bind(2, mailboxId);
    remove.exec();

    email->setUpdatedAt(time(0));
    store->save(email.get());
    changes->recordUpdate(accountId, TYPE_EMAIL, emailId, {"mailboxIds"});
    changes->recordUpdate(accountId, TYPE_THREAD, email->threadId(), {"emailIds"});
    recordMailboxCountChanges(accountId, {mailboxId});
}

std::shared_ptr<Mailbox> EmailEngine::findOrCreateRoleMailbox(std::string accountId, std::string role) {
    if (std::find(MAILBOX_ROLES.begin(), MAILBOX_ROLES.end(), role) == MAILBOX_ROLES.end()) {
        throw JMAPError("invalidArguments", "Unknown mailbox role " + role, {"mailboxRole"});
    }
    auto mailbox = store->find<Mailbox>(Query::InAccount(accountId).equal("role", role));
    if (mailbox != nullptr) {
        return mailbox;
    }
    std::string name = role;
    name[0] = (char)toupper(name[0]);
    mailbox = std::make_shared<Mailbox>(MailUtils::idRandomlyGenerated(), accountId, 0);
    mailbox->setName(name);
    mailbox->setRole(role);
    store->save(mailbox.get());
    changes->recordCreate(accountId, TYPE_MAILBOX, mailbox->id());
    return mailbox;
}

bool EmailEngine::collectCanonicalMessage(std::string canonicalMessageId) {
    SQLite::Statement refs(store->db(), "SELECT COUNT(*) FROM Email WHERE messageId = ? AND isDeleted = 0");
    refs.bind(1, canonicalMessageId);
    refs.executeStep();
    if (refs.getColumn(0).getInt() > 0) {
        return false;
    }

    std::set<std::string> candidates;
    SQLite::Statement message(store->db(), "SELECT rawBlobSha256 FROM Message WHERE id = ?");
    message.bind(1, canonicalMessageId);
    if (!message.executeStep()) {
        return false;
    }
    candidates.insert(message.getColumn(0).getString());

    SQLite::Statement attachments(store->db(), "SELECT blobSha256 FROM Attachment WHERE messageId = ?");
    attachments.bind(1, canonicalMessageId);
    while (attachments.executeStep()) {
        candidates.insert(attachments.getColumn(0).getString());
    }

    for (const char * table : {"MessageHeader", "MessageAddress", "Attachment"}) {
        SQLite::Statement del(store->db(), std::string("DELETE FROM ") + table + " WHERE messageId = ?");
        del.bind(1, canonicalMessageId);
        del.exec();
    }
    SQLite::Statement del(store->db(), "DELETE FROM Message WHERE id = ?");
    del.bind(1, canonicalMessageId);
    del.exec();

    for (const auto & sha : candidates) {
        SQLite::Statement used(store->db(), "SELECT (SELECT COUNT(*) FROM Message WHERE rawBlobSha256 = ?1) + (SELECT COUNT(*) FROM Attachment WHERE blobSha256 = ?1)");
        used.bind(1, sha);
        used.executeStep();
        if (used.getColumn(0).getInt() > 0) {
            continue;
        }
        SQLite::Statement grants(store->db(), "DELETE FROM AccountBlob WHERE sha256 = ?");
        grants.bind(1, sha);
        grants.exec();
        SQLite::Statement blob(store->db(), "DELETE FROM Blob WHERE sha256 = ?");
        blob.bind(1, sha);
        blob.exec();

        BlobStore * storage = blobs;
        store->runAfterCommit([storage, sha]() {
            try {
                storage->remove(sha);
            } catch (std::exception & ex) {
                spdlog::get("logger")->warn("Unable to delete blob {} from storage: {}", sha, ex.what());
            }
        });
    }
    return true;
}

// JMAP methods

nlohmann::json EmailEngine::set(const SetArgs & args, CreationIdMap & creationIds) {
    std::string accountId = args.accountId;
    if (args.hasIfInState) {
        changes->assertInState(accountId, TYPE_EMAIL, args.ifInState);
    }
    std::string oldState = changes->getState(accountId, TYPE_EMAIL);

    nlohmann::json created = nlohmann::json::object();
    nlohmann::json notCreated = nlohmann::json::object();
    nlohmann::json updated = nlohmann::json::object();
    nlohmann::json notUpdated = nlohmann::json::object();
    nlohmann::json destroyed = nlohmann::json::array();
    nlohmann::json notDestroyed = nlohmann::json::object();

    MailStoreTransaction transaction{store, "emailSet"};

    for (const auto & entry : args.create) {
        try {
            EmailCreated result = createEmail(accountId, entry.second, creationIds);
            creationIds[entry.first] = result.id;
            created[entry.first] = result.toJSON();
        } catch (JMAPError & err) {
            notCreated[entry.first] = err.toJSON();
        }
    }

    for (const auto & entry : args.update) {
        try {
            std::string id = ResolveCreationReference(entry.first, creationIds, "id");
            auto email = findLiveEmail(accountId, id);
            if (email == nullptr) {
                throw JMAPError("notFound", "Email not found");
            }
            updateEmail(accountId, email, entry.second, creationIds);
            updated[entry.first] = nullptr;
        } catch (JMAPError & err) {
            notUpdated[entry.first] = err.toJSON();
        }
    }

    for (const auto & ref : args.destroy) {
        try {
            std::string id = ResolveCreationReference(ref, creationIds, "id");
            destroyEmail(accountId, id);
            destroyed.push_back(id);
        } catch (JMAPError & err) {
            notDestroyed[ref] = err.toJSON();
        }
    }

    transaction.commit();

    return {
        {"accountId", accountId},
        {"oldState", oldState},
        {"newState", changes->getState(accountId, TYPE_EMAIL)},
        {"created", created},
        {"notCreated", notCreated},
        {"updated", updated},
        {"notUpdated", notUpdated},
        {"destroyed", destroyed},
        {"notDestroyed", notDestroyed},
    };
}

nlohmann::json EmailEngine::copy(const CopyArgs & args, CreationIdMap & creationIds, std::vector<std::string> & copiedSourceIds) {
    if (args.fromAccountId != args.accountId) {
        throw JMAPError("accountNotFound", "Cross-account copy not supported");
    }
    std::string accountId = args.accountId;
    if (args.hasIfFromInState) {
        changes->assertInState(accountId, TYPE_EMAIL, args.ifFromInState);
    }
    if (args.hasIfInState) {
        changes->assertInState(accountId, TYPE_EMAIL, args.ifInState);
    }
    std::string oldState = changes->getState(accountId, TYPE_EMAIL);

    nlohmann::json created = nlohmann::json::object();
    nlohmann::json notCreated = nlohmann::json::object();

    MailStoreTransaction transaction{store, "emailCopy"};

    for (const auto & entry : args.create) {
        try {
            const nlohmann::json & create = entry.second;
            if (!create.is_object() || !create.count("id") || !create["id"].is_string()) {
                throw JMAPError("invalidProperties", "id of the Email to copy is required", {"id"});
            }
            std::string sourceId = create["id"].get<std::string>();
            auto source = findLiveEmail(accountId, sourceId);
            if (source == nullptr) {
                throw JMAPError("notFound", "Email " + sourceId + " not found");
            }

            if (!create.count("mailboxIds")) {
                throw JMAPError("invalidProperties", "mailboxIds is required", {"mailboxIds"});
            }
            std::vector<std::string> mailboxIds = resolveMailboxIds(accountId, create["mailboxIds"], creationIds);
            if (mailboxIds.size() == 0) {
                throw JMAPError("invalidProperties", "mailboxIds must include at least one mailbox", {"mailboxIds"});
            }
            if ((int)mailboxIds.size() > config->maxMailboxesPerEmail) {
                throw JMAPError("limitExceeded", "Too many mailboxes for one email", {"mailboxIds"});
            }

            KeywordFlags flags{source->isSeen(), source->isFlagged(), source->isAnswered(), source->isDraft()};
            std::vector<std::string> customKeywords = customKeywordsForEmail(sourceId);
            if (create.count("keywords")) {
                std::map<std::string, bool> custom;
                flags = Keywords::split(create["keywords"], KeywordFlags{false, false, false, false}, custom);
                customKeywords.clear();
                for (const auto & pair : custom) {
                    if (pair.second) {
                        customKeywords.push_back(pair.first);
                    }
                }
            }
            time_t internalDate = receivedAtFromJSON(create);

            SQLite::Statement message(store->db(), "SELECT rawBlobSha256, size FROM Message WHERE id = ?");
            message.bind(1, source->messageId());
            if (!message.executeStep()) {
                throw SyncException("email-copy", "Email " + sourceId + " has no canonical message", false);
            }
            std::string rawBlobSha256 = message.getColumn(0).getString();
            size_t size = (size_t)message.getColumn(1).getInt64();

            Email email{MailUtils::idRandomlyGenerated(), accountId, source->messageId(), source->threadId(), internalDate};
            email.setIsSeen(flags.isSeen);
            email.setIsFlagged(flags.isFlagged);
            email.setIsAnswered(flags.isAnswered);
            email.setIsDraft(flags.isDraft);
            store->save(&email);
            setMailboxes(email.id(), mailboxIds);
            setCustomKeywords(email.id(), customKeywords);
            pipeline.ensureAccountBlob(accountId, rawBlobSha256);

            changes->recordCreate(accountId, TYPE_EMAIL, email.id());
            refreshThread(accountId, source->threadId());
            recordMailboxCountChanges(accountId, mailboxIds);

            creationIds[entry.first] = email.id();
            created[entry.first] = EmailCreated{email.id(), rawBlobSha256, source->threadId(), size}.toJSON();
            copiedSourceIds.push_back(sourceId);
        } catch (JMAPError & err) {
            notCreated[entry.first] = err.toJSON();
        }
    }

    transaction.commit();

    return {
        {"fromAccountId", args.fromAccountId},
        {"accountId", accountId},
        {"oldState", oldState},
        {"newState", changes->getState(accountId, TYPE_EMAIL)},
        {"created", created},
        {"notCreated", notCreated},
    };
}

nlohmann::json EmailEngine::importEmails(const ImportArgs & args, CreationIdMap & creationIds) {
    std::string accountId = args.accountId;
    if (args.hasIfInState) {
        changes->assertInState(accountId, TYPE_EMAIL, args.ifInState);
    }
    std::string oldState = changes->getState(accountId, TYPE_EMAIL);

    nlohmann::json created = nlohmann::json::object();
    nlohmann::json notCreated = nlohmann::json::object();

    MailStoreTransaction transaction{store, "emailImport"};

    for (const auto & entry : args.emails) {
        try {
            const nlohmann::json & email = entry.second;
            if (!email.is_object() || !email.count("blobId") || !email["blobId"].is_string()) {
                throw JMAPError("invalidProperties", "blobId is required", {"blobId"});
            }
            nlohmann::json create = nlohmann::json::object();
            for (const char * key : {"blobId", "mailboxIds", "keywords", "receivedAt"}) {
                if (email.count(key)) {
                    create[key] = email[key];
                }
            }
            EmailCreated result = createEmail(accountId, create, creationIds);
            creationIds[entry.first] = result.id;
            created[entry.first] = result.toJSON();
        } catch (JMAPError & err) {
            notCreated[entry.first] = err.toJSON();
        }
    }

    transaction.commit();

    return {
        {"accountId", accountId},
        {"oldState", oldState},
        {"newState", changes->getState(accountId, TYPE_EMAIL)},
        {"created", created},
        {"notCreated", notCreated},
    };
}

EmailCreated EmailEngine::deliver(std::string accountId, const std::string & rawBytes, std::string mailboxRole) {
    ParsedEmail parsed = IngestionPipeline::parseRawEmail(rawBytes);

    MailStoreTransaction transaction{store, "deliver"};

    if (store->find<Account>(Query().equal("id", accountId)) == nullptr) {
        throw JMAPError("accountNotFound", "Account " + accountId + " is not registered");
    }

    auto mailbox = findOrCreateRoleMailbox(accountId, mailboxRole);
    EmailCreated result = createFromRaw(accountId, rawBytes, parsed, {mailbox->id()}, KeywordFlags{false, false, false, false}, {}, time(0));
    transaction.commit();

    spdlog::get("logger")->info("Delivered {} bytes to {} ({}) as {}", rawBytes.size(), accountId, mailboxRole, result.id);
    return result;
}

nlohmann::json EmailEngine::getChanges(const ChangesArgs & args) {
    ChangesResult result = changes->getChanges(args.accountId, TYPE_EMAIL, args.sinceState, args.maxChanges);
    return {
        {"accountId", args.accountId},
        {"oldState", result.oldState},
        {"newState", result.newState},
        {"hasMoreChanges", result.hasMoreChanges},
        {"created", result.created},
        {"updated", result.updated},
        {"destroyed", result.destroyed},
    };
}

// Email/get

static nlohmann::json jmapBodyPart(const nlohmann::json & stored, const std::vector<std::string> & bodyProperties) {
    std::string type = stored.value("type", "application") + "/" + stored.value("subtype", "octet-stream");
    bool isText = stored.value("type", "") == "text";
    nlohmann::json full = {
        {"partId", stored.value("partId", "")},
        {"blobId", stored.count("blobId") ? stored["blobId"] : nlohmann::json()},
        {"size", stored.value("size", 0)},
        {"name", stored.count("name") ? stored["name"] : nlohmann::json()},
        {"type", type},
        {"charset", isText ? nlohmann::json("utf-8") : nlohmann::json()},
        {"disposition", stored.count("disposition") ? stored["disposition"] : nlohmann::json()},
        {"cid", stored.count("cid") ? stored["cid"] : nlohmann::json()},
    };
    nlohmann::json part = nlohmann::json::object();
    for (const auto & prop : bodyProperties) {
        if (full.count(prop)) {
            part[prop] = full[prop];
        }
    }
    return part;
}

static bool isBodyPart(const nlohmann::json & part, std::string subtype) {
    return part.value("type", "") == "text" && part.value("subtype", "") == subtype && !part.count("disposition");
}

nlohmann::json EmailEngine::toJMAP(std::shared_ptr<Email> email, const GetArgs & args) {
    std::vector<std::string> properties = args.hasProperties ? args.properties : DEFAULT_EMAIL_PROPERTIES;
    std::set<std::string> want(properties.begin(), properties.end());
    std::vector<std::string> bodyProperties = args.hasBodyProperties ? args.bodyProperties : DEFAULT_BODY_PROPERTIES;

    SQLite::Statement message(store->db(), "SELECT * FROM Message WHERE id = ?");
    message.bind(1, email->messageId());
    if (!message.executeStep()) {
        throw SyncException("email-get", "Email " + email->id() + " has no canonical message", false);
    }

    nlohmann::json result = {{"id", email->id()}};

    if (want.count("blobId")) result["blobId"] = message.getColumn("rawBlobSha256").getString();
    if (want.count("threadId")) result["threadId"] = email->threadId();
    if (want.count("size")) result["size"] = message.getColumn("size").getInt64();
    if (want.count("receivedAt")) result["receivedAt"] = MailUtils::timestampForTime(email->internalDate());
    if (want.count("subject")) result["subject"] = message.getColumn("subject").getString();
    if (want.count("preview")) result["preview"] = message.getColumn("snippet").getString();
    if (want.count("hasAttachment")) result["hasAttachment"] = message.getColumn("hasAttachment").getInt() != 0;
    if (want.count("sentAt")) {
        result["sentAt"] = message.getColumn("sentAt").isNull() ? nlohmann::json() : nlohmann::json(MailUtils::timestampForTime((time_t)message.getColumn("sentAt").getInt64()));
    }
    if (want.count("messageId")) {
        result["messageId"] = message.getColumn("headerMessageId").isNull() ? nlohmann::json() : nlohmann::json::array({message.getColumn("headerMessageId").getString()});
    }
    if (want.count("inReplyTo")) {
        result["inReplyTo"] = message.getColumn("inReplyTo").isNull() ? nlohmann::json() : nlohmann::json::array({message.getColumn("inReplyTo").getString()});
    }
    if (want.count("references")) {
        result["references"] = message.getColumn("referencesJson").isNull() ? nlohmann::json() : nlohmann::json::parse(message.getColumn("referencesJson").getString());
    }
    if (want.count("mailboxIds")) {
        nlohmann::json mailboxIds = nlohmann::json::object();
        for (const auto & id : mailboxIdsForEmail(email->id())) {
            mailboxIds[id] = true;
        }
        result["mailboxIds"] = mailboxIds;
    }
    if (want.count("keywords")) {
        KeywordFlags flags{email->isSeen(), email->isFlagged(), email->isAnswered(), email->isDraft()};
        result["keywords"] = Keywords::toJMAP(flags, customKeywordsForEmail(email->id()));
    }

    static const std::vector<std::pair<std::string, std::string>> ADDRESS_KINDS = {
        {"from", "from"}, {"sender", "sender"}, {"replyTo", "reply-to"}, {"to", "to"}, {"cc", "cc"}, {"bcc", "bcc"},
    };
    for (const auto & kind : ADDRESS_KINDS) {
        if (!want.count(kind.first)) {
            continue;
        }
        SQLite::Statement addresses(store->db(), "SELECT Address.email, Address.name FROM MessageAddress INNER JOIN Address ON Address.id = MessageAddress.addressId WHERE MessageAddress.messageId = ? AND MessageAddress.kind = ? ORDER BY MessageAddress.position");
        addresses.bind(1, email->messageId());
        addresses.bind(2, kind.second);
        nlohmann::json list = nlohmann::json::array();
        while (addresses.executeStep()) {
            list.push_back({
                {"email", addresses.getColumn(0).getString()},
                {"name", addresses.getColumn(1).isNull() ? nlohmann::json() : nlohmann::json(addresses.getColumn(1).getString())},
            });
        }
        result[kind.first] = list.size() ? list : nlohmann::json();
    }

    for (const auto & prop : properties) {
        if (!startsWith(prop, "header:")) {
            continue;
        }
        std::string name = prop.substr(7);
        bool all = false;
        if (name.size() > 4 && name.compare(name.size() - 4, 4, ":all") == 0) {
            all = true;
            name = name.substr(0, name.size() - 4);
        }
        SQLite::Statement headers(store->db(), "SELECT value FROM MessageHeader WHERE messageId = ? AND lowerName = ? ORDER BY position");
        headers.bind(1, email->messageId());
        headers.bind(2, MailUtils::toLower(name));
        nlohmann::json values = nlohmann::json::array();
        while (headers.executeStep()) {
            values.push_back(headers.getColumn(0).getString());
        }
        if (all) {
            result[prop] = values;
        } else {
            result[prop] = values.size() ? values.back() : nlohmann::json();
        }
    }

    bool fetchText = args.fetchTextBodyValues || args.fetchAllBodyValues;
    bool fetchHTML = args.fetchHTMLBodyValues || args.fetchAllBodyValues;
    bool needStructure = want.count("bodyStructure") || want.count("textBody") || want.count("htmlBody") || want.count("attachments") || want.count("bodyValues") || fetchText || fetchHTML;
    if (!needStructure) {
        return result;
    }

    nlohmann::json structure = message.getColumn("bodyStructure").isNull() ? nlohmann::json::object() : nlohmann::json::parse(message.getColumn("bodyStructure").getString());
    nlohmann::json parts = structure.count("parts") ? structure["parts"] : nlohmann::json::array();

    nlohmann::json textParts = nlohmann::json::array();
    nlohmann::json htmlParts = nlohmann::json::array();
    nlohmann::json attachmentParts = nlohmann::json::array();
    std::string textPartId = "";
    std::string htmlPartId = "";
    for (const auto & part : parts) {
        if (isBodyPart(part, "plain")) {
            textParts.push_back(jmapBodyPart(part, bodyProperties));
            textPartId = part.value("partId", "");
        } else if (isBodyPart(part, "html")) {
            htmlParts.push_back(jmapBodyPart(part, bodyProperties));
            htmlPartId = part.value("partId", "");
        } else {
            attachmentParts.push_back(jmapBodyPart(part, bodyProperties));
        }
    }

    if (want.count("bodyStructure")) {
        nlohmann::json filtered = nlohmann::json::array();
        for (const auto & part : parts) {
            filtered.push_back(jmapBodyPart(part, bodyProperties));
        }
        result["bodyStructure"] = {
            {"size", structure.value("size", 0)},
            {"isTruncated", structure.value("isTruncated", false)},
            {"parts", filtered},
        };
    }
    if (want.count("textBody")) {
        result["textBody"] = textParts.size() ? textParts : htmlParts;
    }
    if (want.count("htmlBody")) {
        result["htmlBody"] = htmlParts.size() ? htmlParts : textParts;
    }
    if (want.count("attachments")) {
        result["attachments"] = attachmentParts;
    }

    if (want.count("bodyValues") || fetchText || fetchHTML) {
        size_t maxBytes = args.maxBodyValueBytes > 0 ? args.maxBodyValueBytes : JMAP_DEFAULT_MAX_BODY_VALUE_BYTES;
        nlohmann::json bodyValues = nlohmann::json::object();

        auto addValue = [&](std::string partId, std::string column, std::string truncatedColumn) {
            if (partId == "" || message.getColumn(column.c_str()).isNull()) {
                return;
            }
            std::string value = message.getColumn(column.c_str()).getString();
            bool truncated = message.getColumn(truncatedColumn.c_str()).getInt() != 0;
            if (value.size() > maxBytes) {
                value = MailUtils::utf8Prefix(value, maxBytes);
                truncated = true;
            }
            bodyValues[partId] = {
                {"value", value},
                {"isEncodingProblem", false},
                {"isTruncated", truncated},
            };
        };
        if (fetchText) {
            addValue(textPartId, "textBody", "textBodyIsTruncated");
        }
        if (fetchHTML) {
            addValue(htmlPartId, "htmlBody", "htmlBodyIsTruncated");
        }
        result["bodyValues"] = bodyValues;
    }
    return result;
}

nlohmann::json EmailEngine::get(const GetArgs & args) {
    nlohmann::json list = nlohmann::json::array();
    nlohmann::json notFound = nlohmann::json::array();

    for (const auto & id : args.ids) {
        auto email = findLiveEmail(args.accountId, id);
        if (email == nullptr) {
            notFound.push_back(id);
            continue;
        }
        list.push_back(toJMAP(email, args));
    }

    return {
        {"accountId", args.accountId},
        {"state", changes->getState(args.accountId, TYPE_EMAIL)},
        {"list", list},
        {"notFound", notFound},
    };
}

// Email/parse

static nlohmann::json parsedAddresses(const std::vector<ParsedAddress> & addresses) {
    if (addresses.size() == 0) {
        return nullptr;
    }
    nlohmann::json list = nlohmann::json::array();
    for (const auto & address : addresses) {
        list.push_back({
            {"email", address.email},
            {"name", address.name == "" ? nlohmann::json() : nlohmann::json(address.name)},
        });
    }
    return list;
}

static nlohmann::json parsedToJMAP(const ParsedEmail & parsed, std::string blobId, size_t size, const GetArgs & args) {
    std::vector<std::string> properties = args.hasProperties ? args.properties : DEFAULT_EMAIL_PROPERTIES;
    std::set<std::string> want(properties.begin(), properties.end());
    std::vector<std::string> bodyProperties = args.hasBodyProperties ? args.bodyProperties : DEFAULT_BODY_PROPERTIES;

    // a parsed blob belongs to no mailbox or thread
    nlohmann::json result = nlohmann::json::object();
    for (const char * unset : {"id", "mailboxIds", "keywords", "threadId", "receivedAt"}) {
        if (want.count(unset)) {
            result[unset] = nullptr;
        }
    }
    if (want.count("blobId")) result["blobId"] = blobId;
    if (want.count("size")) result["size"] = size;
    if (want.count("subject")) result["subject"] = parsed.subject;
    if (want.count("preview")) result["preview"] = IngestionPipeline::makeSnippet(parsed);
    if (want.count("hasAttachment")) result["hasAttachment"] = parsed.attachments.size() > 0;
    if (want.count("sentAt")) {
        result["sentAt"] = parsed.sentAt > 0 ? nlohmann::json(MailUtils::timestampForTime(parsed.sentAt)) : nlohmann::json();
    }
    if (want.count("messageId")) {
        result["messageId"] = parsed.messageId != "" ? nlohmann::json::array({parsed.messageId}) : nlohmann::json();
    }
    if (want.count("inReplyTo")) {
        std::vector<std::string> ids = MailUtils::parseReferences(parsed.inReplyTo);
        result["inReplyTo"] = ids.size() ? nlohmann::json(ids) : nlohmann::json();
    }
    if (want.count("references")) {
        std::vector<std::string> ids = MailUtils::parseReferences(parsed.references);
        result["references"] = ids.size() ? nlohmann::json(ids) : nlohmann::json();
    }
    if (want.count("from")) result["from"] = parsedAddresses(parsed.from);
    if (want.count("sender")) result["sender"] = parsedAddresses(parsed.sender);
    if (want.count("replyTo")) result["replyTo"] = parsedAddresses(parsed.replyTo);
    if (want.count("to")) result["to"] = parsedAddresses(parsed.to);
    if (want.count("cc")) result["cc"] = parsedAddresses(parsed.cc);
    if (want.count("bcc")) result["bcc"] = parsedAddresses(parsed.bcc);

    for (const auto & prop : properties) {
        if (!startsWith(prop, "header:")) {
            continue;
        }
        std::string name = prop.substr(7);
        bool all = false;
        if (name.size() > 4 && name.compare(name.size() - 4, 4, ":all") == 0) {
            all = true;
            name = name.substr(0, name.size() - 4);
        }
        nlohmann::json values = nlohmann::json::array();
        for (const auto & header : parsed.headers) {
            if (MailUtils::toLower(header.first) == MailUtils::toLower(name)) {
                values.push_back(header.second);
            }
        }
        result[prop] = all ? values : (values.size() ? values.back() : nlohmann::json());
    }

    nlohmann::json structure = IngestionPipeline::buildBodyStructure(parsed, size);
    nlohmann::json textParts = nlohmann::json::array();
    nlohmann::json htmlParts = nlohmann::json::array();
    nlohmann::json attachmentParts = nlohmann::json::array();
    nlohmann::json allParts = nlohmann::json::array();
    std::string textPartId = "";
    std::string htmlPartId = "";
    for (const auto & part : structure["parts"]) {
        allParts.push_back(jmapBodyPart(part, bodyProperties));
        if (isBodyPart(part, "plain")) {
            textParts.push_back(jmapBodyPart(part, bodyProperties));
            textPartId = part.value("partId", "");
        } else if (isBodyPart(part, "html")) {
            htmlParts.push_back(jmapBodyPart(part, bodyProperties));
            htmlPartId = part.value("partId", "");
        } else {
            attachmentParts.push_back(jmapBodyPart(part, bodyProperties));
        }
    }
    if (want.count("bodyStructure")) {
        result["bodyStructure"] = {{"size", size}, {"isTruncated", false}, {"parts", allParts}};
    }
    if (want.count("textBody")) result["textBody"] = textParts.size() ? textParts : htmlParts;
    if (want.count("htmlBody")) result["htmlBody"] = htmlParts.size() ? htmlParts : textParts;
    if (want.count("attachments")) result["attachments"] = attachmentParts;

    bool fetchText = args.fetchTextBodyValues || args.fetchAllBodyValues;
    bool fetchHTML = args.fetchHTMLBodyValues || args.fetchAllBodyValues;
    if (want.count("bodyValues") || fetchText || fetchHTML) {
        size_t maxBytes = args.maxBodyValueBytes > 0 ? args.maxBodyValueBytes : JMAP_DEFAULT_MAX_BODY_VALUE_BYTES;
        nlohmann::json bodyValues = nlohmann::json::object();
        auto addValue = [&](std::string partId, bool present, const std::string & content) {
            if (partId == "" || !present) {
                return;
            }
            std::string value = content.size() > maxBytes ? MailUtils::utf8Prefix(content, maxBytes) : content;
            bodyValues[partId] = {
                {"value", value},
                {"isEncodingProblem", false},
                {"isTruncated", value.size() < content.size()},
            };
        };
        if (fetchText) {
            addValue(textPartId, parsed.hasText, parsed.text);
        }
        if (fetchHTML) {
            addValue(htmlPartId, parsed.hasHTML, parsed.html);
        }
        result["bodyValues"] = bodyValues;
    }
    return result;
}

nlohmann::json EmailEngine::parse(const GetArgs & args) {
    nlohmann::json parsed = nlohmann::json::object();
    nlohmann::json notParsable = nlohmann::json::array();
    nlohmann::json notFound = nlohmann::json::array();

    for (const auto & blobId : args.ids) {
        std::shared_ptr<std::string> bytes = accountHasBlob(args.accountId, blobId) ? blobs->get(blobId) : nullptr;
        if (bytes == nullptr) {
            notFound.push_back(blobId);
            continue;
        }
        try {
            parsed[blobId] = parsedToJMAP(IngestionPipeline::parseRawEmail(*bytes), blobId, bytes->size(), args);
        } catch (SyncException & ex) {
            spdlog::get("logger")->info("Blob {} is not parsable as a message: {}", blobId, ex.debuginfo);
            notParsable.push_back(blobId);
        }
    }

    return {
        {"accountId", args.accountId},
        {"parsed", parsed},
        {"notParsable", notParsable},
        {"notFound", notFound},
    };
}

// Email/query

static std::string likePattern(std::string value) {
    std::string pattern = "%";
    for (char c : value) {
        if (c == '%' || c == '_' || c == '\\') {
            pattern.push_back('\\');
        }
        pattern.push_back(c);
    }
    return pattern + "%";
}

static std::string addressCondition(std::string kind, std::string value, std::vector<nlohmann::json> & binds) {
    binds.push_back(kind);
    binds.push_back(likePattern(value));
    binds.push_back(likePattern(value));
    return "M.id IN (SELECT MessageAddress.messageId FROM MessageAddress INNER JOIN Address ON Address.id = MessageAddress.addressId WHERE MessageAddress.kind = ? AND (Address.email LIKE ? ESCAPE '\\' OR Address.name LIKE ? ESCAPE '\\'))";
}

static std::string keywordCondition(std::string keyword, bool present, std::vector<nlohmann::json> & binds) {
    std::string normalized = Keywords::normalizeKeywordName(keyword);
    std::string column = "";
    if (normalized == "$seen" || normalized == "\\seen") column = "E.isSeen";
    if (normalized == "$flagged" || normalized == "\\flagged") column = "E.isFlagged";
    if (normalized == "$answered" || normalized == "\\answered") column = "E.isAnswered";
    if (normalized == "$draft" || normalized == "\\draft") column = "E.isDraft";
    if (column != "") {
        return column + (present ? " = 1" : " = 0");
    }
    binds.push_back(normalized);
    return std::string("E.id ") + (present ? "IN" : "NOT IN") + " (SELECT emailId FROM EmailKeyword WHERE keyword = ?)";
}

static std::string filterToSQL(const nlohmann::json & filter, std::vector<nlohmann::json> & binds) {
    if (filter.count("operator")) {
        std::string op = filter["operator"].is_string() ? filter["operator"].get<std::string>() : "";
        if (op != "AND" && op != "OR" && op != "NOT") {
            throw JMAPError("invalidArguments", "Unknown filter operator " + op);
        }
        if (!filter.count("conditions") || !filter["conditions"].is_array()) {
            throw JMAPError("invalidArguments", "Filter operator needs conditions");
        }
        std::vector<std::string> parts;
        for (const auto & condition : filter["conditions"]) {
            if (!condition.is_object()) {
                throw JMAPError("invalidArguments", "Filter conditions must be objects");
            }
            parts.push_back("(" + filterToSQL(condition, binds) + ")");
        }
        if (parts.size() == 0) {
            return op == "OR" ? "0" : "1";
        }
        std::string joiner = op == "OR" ? " OR " : " AND ";
        std::string sql = "";
        for (size_t ii = 0; ii < parts.size(); ii ++) {
            sql += (ii > 0 ? joiner : "") + (op == "NOT" ? "NOT " + parts[ii] : parts[ii]);
        }
        return sql;
    }

    std::vector<std::string> clauses;
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        const std::string & key = it.key();
        const nlohmann::json & value = it.value();

        if (key == "inMailbox" && value.is_string()) {
            clauses.push_back("E.id IN (SELECT emailId FROM MailboxMessage WHERE mailboxId = ?)");
            binds.push_back(value);
        } else if (key == "inMailboxOtherThan" && value.is_array()) {
            std::vector<std::string> ids;
            for (const auto & id : value) {
                if (id.is_string()) {
                    ids.push_back(id.get<std::string>());
                    binds.push_back(id);
                }
            }
            clauses.push_back("E.id IN (SELECT emailId FROM MailboxMessage WHERE mailboxId NOT IN (" + MailUtils::qmarks(ids.size()) + "))");
            if (ids.size() == 0) {
                clauses.back() = "E.id IN (SELECT emailId FROM MailboxMessage)";
            }
        } else if (key == "text" && value.is_string()) {
            std::string pattern = likePattern(value.get<std::string>());
            clauses.push_back("(M.subject LIKE ? ESCAPE '\\' OR M.textBody LIKE ? ESCAPE '\\' OR M.htmlBody LIKE ? ESCAPE '\\' OR M.id IN (SELECT MessageAddress.messageId FROM MessageAddress INNER JOIN Address ON Address.id = MessageAddress.addressId WHERE Address.email LIKE ? ESCAPE '\\' OR Address.name LIKE ? ESCAPE '\\'))");
            for (int ii = 0; ii < 5; ii ++) {
                binds.push_back(pattern);
            }
        } else if (key == "subject" && value.is_string()) {
            clauses.push_back("M.subject LIKE ? ESCAPE '\\'");
            binds.push_back(likePattern(value.get<std::string>()));
        } else if (key == "body" && value.is_string()) {
            clauses.push_back("(M.textBody LIKE ? ESCAPE '\\' OR M.htmlBody LIKE ? ESCAPE '\\')");
            binds.push_back(likePattern(value.get<std::string>()));
            binds.push_back(likePattern(value.get<std::string>()));
        } else if ((key == "from" || key == "to" || key == "cc" || key == "bcc") && value.is_string()) {
            clauses.push_back(addressCondition(key, value.get<std::string>(), binds));
        } else if ((key == "after" || key == "before") && value.is_string()) {
            time_t t = MailUtils::timeForTimestamp(value.get<std::string>());
            if (t < 0) {
                throw JMAPError("invalidArguments", "filter." + key + " must be a UTCDate");
            }
            clauses.push_back(key == "after" ? "E.internalDate >= ?" : "E.internalDate < ?");
            binds.push_back((long long)t);
        } else if ((key == "minSize" || key == "sizeLarger") && value.is_number_integer()) {
            clauses.push_back("M.size >= ?");
            binds.push_back(value);
        } else if ((key == "maxSize" || key == "sizeSmaller") && value.is_number_integer()) {
            clauses.push_back("M.size < ?");
            binds.push_back(value);
        } else if (key == "hasKeyword" && value.is_string()) {
            clauses.push_back(keywordCondition(value.get<std::string>(), true, binds));
        } else if (key == "notKeyword" && value.is_string()) {
            clauses.push_back(keywordCondition(value.get<std::string>(), false, binds));
        } else if (key == "hasAttachment" && value.is_boolean()) {
            clauses.push_back(value.get<bool>() ? "M.hasAttachment = 1" : "M.hasAttachment = 0");
        } else {
            throw JMAPError("unsupportedFilter", "Unsupported filter " + key);
        }
    }
    if (clauses.size() == 0) {
        return "1";
    }
    std::string sql = "";
    for (size_t ii = 0; ii < clauses.size(); ii ++) {
        sql += (ii > 0 ? " AND " : "") + clauses[ii];
    }
    return sql;
}

static bool isDefaultEmailSort(const nlohmann::json & sort) {
    if (sort.is_null() || (sort.is_array() && sort.size() == 0)) {
        return true;
    }
    if (!sort.is_array() || sort.size() != 1 || !sort[0].is_object()) {
        return false;
    }
    const nlohmann::json & comparator = sort[0];
    return comparator.value("property", "") == "receivedAt" && comparator.count("isAscending") && comparator["isAscending"] == false;
}

static bool isEmptyFilter(const nlohmann::json & filter) {
    return filter.is_null() || (filter.is_object() && filter.size() == 0);
}

std::vector<std::string> EmailEngine::queryIds(std::string accountId, const nlohmann::json & filter, const nlohmann::json & sort, bool collapseThreads) {
    std::vector<nlohmann::json> binds{accountId};
    std::string where = "E.accountId = ? AND E.isDeleted = 0";
    if (filter.is_object()) {
        where += " AND (" + filterToSQL(filter, binds) + ")";
    }

    std::string order = "";
    if (sort.is_array()) {
        for (const auto & comparator : sort) {
            std::string property = comparator.is_object() && comparator.count("property") && comparator["property"].is_string() ? comparator["property"].get<std::string>() : "";
            bool ascending = !(comparator.is_object() && comparator.count("isAscending") && comparator["isAscending"] == false);
            std::string column = "";
            if (property == "receivedAt") column = "E.internalDate";
            if (property == "sentAt") column = "M.sentAt";
            if (property == "size") column = "M.size";
            if (property == "subject") column = "M.subject";
            if (column == "") {
                throw JMAPError("unsupportedSort", "Unsupported sort property " + property);
            }
            order += (order == "" ? "" : ", ") + column + (ascending ? " ASC" : " DESC");
        }
    }
    if (order == "") {
        order = "E.internalDate DESC";
    }

    SQLite::Statement statement(store->db(), "SELECT E.id, E.threadId FROM Email E INNER JOIN Message M ON M.id = E.messageId WHERE " + where + " ORDER BY " + order + ", E.id ASC");
    for (size_t ii = 0; ii < binds.size(); ii ++) {
        if (binds[ii].is_number_integer()) {
            statement.bind((int)ii + 1, binds[ii].get<long long>());
        } else {
            statement.bind((int)ii + 1, binds[ii].get<std::string>());
        }
    }

    std::vector<std::string> ids;
    std::set<std::string> seenThreads;
    while (statement.executeStep()) {
        if (collapseThreads) {
            std::string threadId = statement.getColumn(1).getString();
            if (seenThreads.count(threadId)) {
                continue;
            }
            seenThreads.insert(threadId);
        }
        ids.push_back(statement.getColumn(0).getString());
    }
    return ids;
}

nlohmann::json EmailEngine::query(const QueryArgs & args) {
    std::vector<std::string> ids = queryIds(args.accountId, args.filter, args.sort, args.collapseThreads);

    QueryWindow window = ApplyQueryWindow(ids, args, JMAP_MAX_OBJECTS_IN_GET, JMAP_MAX_OBJECTS_IN_GET);
    nlohmann::json response = {
        {"accountId", args.accountId},
        {"queryState", changes->getState(args.accountId, TYPE_EMAIL)},
        {"canCalculateChanges", isEmptyFilter(args.filter) && isDefaultEmailSort(args.sort) && !args.collapseThreads},
        {"collapseThreads", args.collapseThreads},
        {"position", window.position},
        {"ids", window.ids},
    };
    if (args.calculateTotal) {
        response["total"] = window.total;
    }
    return response;
}

nlohmann::json EmailEngine::queryChanges(const QueryChangesArgs & args) {
    if (!isEmptyFilter(args.filter)) {
        throw JMAPError("unsupportedFilter", "Email/queryChanges only supports the default (empty) filter");
    }
    if (!isDefaultEmailSort(args.sort)) {
        throw JMAPError("unsupportedSort", "Email/queryChanges only supports sorting by receivedAt descending");
    }
    if (args.collapseThreads) {
        throw JMAPError("cannotCalculateChanges", "Email/queryChanges does not support collapseThreads");
    }

    ChangesResult result = changes->getChanges(args.accountId, TYPE_EMAIL, args.sinceQueryState, args.maxChanges);
    if (result.hasMoreChanges) {
        if (args.maxChanges > 0) {
            throw JMAPError("tooManyChanges", "More than " + std::to_string(args.maxChanges) + " changes since " + args.sinceQueryState);
        }
        throw JMAPError("cannotCalculateChanges", "Too many changes since " + args.sinceQueryState);
    }

    // receivedAt never changes and the filter is empty, so updates cannot
    // move an Email in or out of the results.
    std::vector<std::string> ids = queryIds(args.accountId, nlohmann::json(), nlohmann::json(), false);
    std::map<std::string, size_t> positions;
    for (size_t ii = 0; ii < ids.size(); ii ++) {
        positions[ids[ii]] = ii;
    }

    std::vector<std::pair<size_t, std::string>> created;
    for (const auto & id : result.created) {
        auto it = positions.find(id);
        if (it != positions.end()) {
            created.push_back({it->second, id});
        }
    }
    std::sort(created.begin(), created.end());

    nlohmann::json added = nlohmann::json::array();
    for (const auto & entry : created) {
        added.push_back({{"id", entry.second}, {"index", entry.first}});
    }

    nlohmann::json response = {
        {"accountId", args.accountId},
        {"oldQueryState", result.oldState},
        {"newQueryState", result.newState},
        {"removed", result.destroyed},
        {"added", added},
    };
    if (args.calculateTotal) {
        response["total"] = ids.size();
    }
    return response;
}

// Thread/get and Thread/changes

nlohmann::json EmailEngine::threadGet(const GetArgs & args) {
    nlohmann::json list = nlohmann::json::array();
    nlohmann::json notFound = nlohmann::json::array();

    for (const auto & id : args.ids) {
        auto thread = store->find<Thread>(Query::InAccount(args.accountId).equal("id", id));
        std::vector<std::string> emailIds;
        if (thread != nullptr) {
            SQLite::Statement query(store->db(), "SELECT id FROM Email WHERE threadId = ? AND isDeleted = 0 ORDER BY internalDate ASC, id ASC");
            query.bind(1, id);
            while (query.executeStep()) {
                emailIds.push_back(query.getColumn(0).getString());
            }
        }
        if (emailIds.size() == 0) {
            notFound.push_back(id);
            continue;
        }
        list.push_back(FilterProperties({{"id", id}, {"emailIds", emailIds}}, args));
    }

    return {
        {"accountId", args.accountId},
        {"state", changes->getState(args.accountId, TYPE_THREAD)},
        {"list", list},
        {"notFound", notFound},
    };
}

nlohmann::json EmailEngine::threadChanges(const ChangesArgs & args) {
    ChangesResult result = changes->getChanges(args.accountId, TYPE_THREAD, args.sinceState, args.maxChanges);
    return {
        {"accountId", args.accountId},
        {"oldState", result.oldState},
        {"newState", result.newState},
        {"hasMoreChanges", result.hasMoreChanges},
        {"created", result.created},
        {"updated", result.updated},
        {"destroyed", result.destroyed},
    };
}
