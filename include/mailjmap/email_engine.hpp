/** EmailEngine [MailJMAP]
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

#ifndef EmailEngine_hpp
#define EmailEngine_hpp

#include <stdio.h>
#include <string>
#include <map>
#include <memory>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailjmap/mail_store.hpp"
#include "mailjmap/blob_store.hpp"
#include "mailjmap/change_log.hpp"
#include "mailjmap/draft_builder.hpp"
#include "mailjmap/ingestion.hpp"
#include "mailjmap/keywords.hpp"
#include "mailjmap/server_config.hpp"
#include "mailjmap/thread_resolver.hpp"
#include "mailjmap/models/email.hpp"
#include "mailjmap/models/mailbox.hpp"
#include "mailjmap/jmap/method_args.hpp"

struct EmailCreated {
    std::string id;
    std::string blobId;
    std::string threadId;
    size_t size;

    nlohmann::json toJSON() const;
};

/**
 * Email/get, /set, /changes, /query, /copy and /import, plus the inbound
 * delivery entrypoint. Every mutation writes through the ChangeLog on the
 * same transaction as the rows it touches: an Email change is accompanied
 * by Thread (emailIds) and Mailbox (counts) changes.
 *
 * Storage deletes for collected canonical messages are queued with
 * MailStore::runAfterCommit and never happen for a rolled back transaction.
 */
class EmailEngine {
    MailStore * store;
    BlobStore * blobs;
    ServerConfig * config;
    ChangeLog * changes;

    IngestionPipeline pipeline;
    ThreadResolver threads;
    DraftBuilder drafts;

public:
    EmailEngine(MailStore * store, BlobStore * blobs, ServerConfig * config, ChangeLog * changes);

    nlohmann::json get(const GetArgs & args);
    nlohmann::json set(const SetArgs & args, CreationIdMap & creationIds);
    nlohmann::json getChanges(const ChangesArgs & args);
    nlohmann::json query(const QueryArgs & args);

    // Only the default query (no filter, newest first, threads not collapsed)
    // can be diffed. Other queries throw unsupportedFilter, unsupportedSort
    // or cannotCalculateChanges.
    nlohmann::json queryChanges(const QueryChangesArgs & args);

    // Email/parse. args.ids holds the blobIds. Nothing is stored.
    nlohmann::json parse(const GetArgs & args);

    // copiedSourceIds receives the ids of source Emails that were copied, for
    // onSuccessDestroyOriginal.
    nlohmann::json copy(const CopyArgs & args, CreationIdMap & creationIds, std::vector<std::string> & copiedSourceIds);
    nlohmann::json importEmails(const ImportArgs & args, CreationIdMap & creationIds);

    nlohmann::json threadGet(const GetArgs & args);
    nlohmann::json threadChanges(const ChangesArgs & args);

    /**
     * Delivers raw RFC 5322 bytes into the mailbox holding `mailboxRole`,
     * creating that mailbox when the account has none. Opens its own
     * transaction.
     */
    EmailCreated deliver(std::string accountId, const std::string & rawBytes, std::string mailboxRole = "inbox");

    // The primitives below must run inside a MailStoreTransaction.

    EmailCreated createFromRaw(std::string accountId, const std::string & rawBytes, const ParsedEmail & parsed, std::vector<std::string> mailboxIds, KeywordFlags flags, std::vector<std::string> customKeywords, time_t internalDate);

    void destroyEmail(std::string accountId, std::string emailId);

    // Drops one mailbox membership, destroying the Email if it was the last.
    void removeFromMailbox(std::string accountId, std::string emailId, std::string mailboxId);

    /**
     * Deletes a canonical Message (and its headers, addresses, attachment
     * rows and no-longer-referenced Blobs) once no live Email points at it.
     * Returns false when the message is still referenced.
     */
    bool collectCanonicalMessage(std::string canonicalMessageId);

    std::shared_ptr<Email> findLiveEmail(std::string accountId, std::string emailId);

    // Creates "Inbox", "Sent" etc. on first use and records the Mailbox change.
    std::shared_ptr<Mailbox> findOrCreateRoleMailbox(std::string accountId, std::string role);

    std::vector<std::string> mailboxIdsForEmail(std::string emailId);
    std::vector<std::string> customKeywordsForEmail(std::string emailId);

    bool accountHasBlob(std::string accountId, std::string blobId);

private:
    EmailCreated createEmail(std::string accountId, const nlohmann::json & create, const CreationIdMap & creationIds);
    std::vector<std::string> updateEmail(std::string accountId, std::shared_ptr<Email> email, const nlohmann::json & patch, const CreationIdMap & creationIds);

    std::vector<std::string> resolveMailboxIds(std::string accountId, const nlohmann::json & value, const CreationIdMap & creationIds);
    std::string loadBlobForAccount(std::string accountId, std::string blobId, std::string property);
    void checkAttachmentSize(const ParsedEmail & parsed);

    std::vector<std::string> queryIds(std::string accountId, const nlohmann::json & filter, const nlohmann::json & sort, bool collapseThreads);

    void setMailboxes(std::string emailId, const std::vector<std::string> & mailboxIds);
    void setCustomKeywords(std::string emailId, const std::vector<std::string> & keywords);
    void refreshThread(std::string accountId, std::string threadId);
    void recordMailboxCountChanges(std::string accountId, const std::vector<std::string> & mailboxIds);

    nlohmann::json toJMAP(std::shared_ptr<Email> email, const GetArgs & args);
};

#endif /* EmailEngine_hpp */
