/** constants [MailJMAP]
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

#ifndef constants_hpp
#define constants_hpp

#include <string>
#include <vector>
#include <map>

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

#if defined(_MSC_VER)
#define FS_PATH_SEP "\\"
#else
#define FS_PATH_SEP "/"
#endif

#define JMAP_CAPABILITY_CORE        "urn:ietf:params:jmap:core"
#define JMAP_CAPABILITY_MAIL        "urn:ietf:params:jmap:mail"
#define JMAP_CAPABILITY_SUBMISSION  "urn:ietf:params:jmap:submission"

#define JMAP_MAX_SIZE_UPLOAD                (18 * 1024 * 1024)
#define JMAP_MAX_CONCURRENT_UPLOAD          4
#define JMAP_MAX_SIZE_REQUEST               (10 * 1024 * 1024)
#define JMAP_MAX_CONCURRENT_REQUESTS        4
#define JMAP_MAX_CALLS_IN_REQUEST           16
#define JMAP_MAX_OBJECTS_IN_GET             256
#define JMAP_MAX_OBJECTS_IN_SET             128
#define JMAP_MAX_MAILBOXES_PER_EMAIL        32
#define JMAP_MAX_SIZE_MAILBOX_NAME          255
#define JMAP_MAX_SIZE_ATTACHMENTS_PER_EMAIL (18 * 1024 * 1024)
#define JMAP_MAX_KEYWORD_LENGTH             255
#define JMAP_DEFAULT_MAX_BODY_VALUE_BYTES   (64 * 1024)

#define MAX_STORED_BODY_BYTES               (256 * 1024)
#define SNIPPET_LENGTH                      200
#define SLOW_TRANSACTION_MS                 80

// Object types tracked by the change log
#define TYPE_MAILBOX            "Mailbox"
#define TYPE_THREAD             "Thread"
#define TYPE_EMAIL              "Email"
#define TYPE_EMAIL_SUBMISSION   "EmailSubmission"

static std::vector<std::string> MAILBOX_ROLES = {
    "inbox", "sent", "drafts", "archive", "trash", "spam"
};

// Seconds to wait before attempt N+1 of a failed submission
static std::vector<int> SUBMISSION_RETRY_DELAYS = {60, 300, 900, 3600, 21600};

static std::vector<std::string> SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS Account ("
        "id VARCHAR(40) PRIMARY KEY,"
        "accountId VARCHAR(40),"
        "version INTEGER,"
        "data TEXT,"
        "emailAddress VARCHAR(255) UNIQUE)",

    "CREATE TABLE IF NOT EXISTS Identity ("
        "id VARCHAR(40) PRIMARY KEY,"
        "accountId VARCHAR(40),"
        "version INTEGER,"
        "data TEXT,"
        "email VARCHAR(255))",
    "CREATE INDEX IF NOT EXISTS IdentityAccountIndex ON Identity (accountId)",

    "CREATE TABLE IF NOT EXISTS Mailbox ("
        "id VARCHAR(40) PRIMARY KEY,"
        "accountId VARCHAR(40),"
        "version INTEGER,"
        "data TEXT,"
        "name VARCHAR(255),"
        "parentId VARCHAR(40),"
        "role VARCHAR(40),"
        "sortOrder INTEGER DEFAULT 0,"
        "createdAt INTEGER,"
        "updatedAt INTEGER)",
    "CREATE UNIQUE INDEX IF NOT EXISTS MailboxRoleIndex ON Mailbox (accountId, role) WHERE role IS NOT NULL",
    "CREATE INDEX IF NOT EXISTS MailboxParentIndex ON Mailbox (accountId, parentId)",

    "CREATE TABLE IF NOT EXISTS Thread ("
        "id VARCHAR(40) PRIMARY KEY,"
        "accountId VARCHAR(40),"
        "version INTEGER,"
        "data TEXT,"
        "subject VARCHAR(500),"
        "createdAt INTEGER,"
        "latestMessageAt INTEGER)",
    "CREATE INDEX IF NOT EXISTS ThreadAccountIndex ON Thread (accountId, latestMessageAt DESC)",

    "CREATE TABLE IF NOT EXISTS Blob ("
        "sha256 VARCHAR(64) PRIMARY KEY,"
        "size INTEGER,"
        "storageKey VARCHAR(255),"
        "createdAt INTEGER)",

    "CREATE TABLE IF NOT EXISTS AccountBlob ("
        "accountId VARCHAR(40),"
        "sha256 VARCHAR(64),"
        "createdAt INTEGER,"
        "PRIMARY KEY (accountId, sha256))",
    "CREATE INDEX IF NOT EXISTS AccountBlobShaIndex ON AccountBlob (sha256)",

    "CREATE TABLE IF NOT EXISTS Message ("
        "id VARCHAR(40) PRIMARY KEY,"
        "ingestId VARCHAR(64) UNIQUE,"
        "rawBlobSha256 VARCHAR(64),"
        "headerMessageId VARCHAR(500),"
        "inReplyTo VARCHAR(500),"
        "referencesJson TEXT,"
        "subject TEXT,"
        "snippet TEXT,"
        "sentAt INTEGER,"
        "createdAt INTEGER,"
        "size INTEGER,"
        "hasAttachment INTEGER DEFAULT 0,"
        "bodyStructure TEXT,"
        "textBody TEXT,"
        "textBodyIsTruncated INTEGER DEFAULT 0,"
        "htmlBody TEXT,"
        "htmlBodyIsTruncated INTEGER DEFAULT 0)",
    "CREATE INDEX IF NOT EXISTS MessageHeaderMessageIdIndex ON Message (headerMessageId)",
    "CREATE INDEX IF NOT EXISTS MessageRawBlobIndex ON Message (rawBlobSha256)",

    "CREATE TABLE IF NOT EXISTS Email ("
        "id VARCHAR(40) PRIMARY KEY,"
        "accountId VARCHAR(40),"
        "version INTEGER,"
        "data TEXT,"
        "messageId VARCHAR(40),"
        "threadId VARCHAR(40),"
        "internalDate INTEGER,"
        "isSeen INTEGER DEFAULT 0,"
        "isFlagged INTEGER DEFAULT 0,"
        "isAnswered INTEGER DEFAULT 0,"
        "isDraft INTEGER DEFAULT 0,"
        "isDeleted INTEGER DEFAULT 0,"
        "createdAt INTEGER,"
        "updatedAt INTEGER)",
    "CREATE INDEX IF NOT EXISTS EmailThreadIndex ON Email (threadId, isDeleted)",
    "CREATE INDEX IF NOT EXISTS EmailMessageIndex ON Email (messageId)",
    "CREATE INDEX IF NOT EXISTS EmailDateIndex ON Email (accountId, internalDate DESC)",

    "CREATE TABLE IF NOT EXISTS MailboxMessage ("
        "mailboxId VARCHAR(40),"
        "emailId VARCHAR(40),"
        "addedAt INTEGER,"
        "PRIMARY KEY (mailboxId, emailId))",
    "CREATE INDEX IF NOT EXISTS MailboxMessageEmailIndex ON MailboxMessage (emailId)",

    "CREATE TABLE IF NOT EXISTS EmailKeyword ("
        "emailId VARCHAR(40),"
        "keyword VARCHAR(255),"
        "PRIMARY KEY (emailId, keyword))",

    "CREATE TABLE IF NOT EXISTS Attachment ("
        "id VARCHAR(40) PRIMARY KEY,"
        "messageId VARCHAR(40),"
        "blobSha256 VARCHAR(64),"
        "filename TEXT,"
        "mimeType VARCHAR(255),"
        "disposition VARCHAR(40),"
        "contentId VARCHAR(255),"
        "related INTEGER DEFAULT 0,"
        "position INTEGER)",
    "CREATE INDEX IF NOT EXISTS AttachmentMessageIndex ON Attachment (messageId)",
    "CREATE INDEX IF NOT EXISTS AttachmentBlobIndex ON Attachment (blobSha256)",

    "CREATE TABLE IF NOT EXISTS Address ("
        "id VARCHAR(40) PRIMARY KEY,"
        "email VARCHAR(255) UNIQUE,"
        "name TEXT)",

    "CREATE TABLE IF NOT EXISTS MessageAddress ("
        "messageId VARCHAR(40),"
        "addressId VARCHAR(40),"
        "kind VARCHAR(16),"
        "position INTEGER)",
    "CREATE INDEX IF NOT EXISTS MessageAddressMessageIndex ON MessageAddress (messageId, kind)",

    "CREATE TABLE IF NOT EXISTS MessageHeader ("
        "messageId VARCHAR(40),"
        "position INTEGER,"
        "name VARCHAR(255),"
        "lowerName VARCHAR(255),"
        "value TEXT)",
    "CREATE INDEX IF NOT EXISTS MessageHeaderIndex ON MessageHeader (messageId, lowerName)",

    "CREATE TABLE IF NOT EXISTS JMAPState ("
        "accountId VARCHAR(40),"
        "type VARCHAR(40),"
        "modSeq INTEGER,"
        "PRIMARY KEY (accountId, type))",

    "CREATE TABLE IF NOT EXISTS ChangeLog ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "accountId VARCHAR(40),"
        "type VARCHAR(40),"
        "objectId VARCHAR(40),"
        "op VARCHAR(8),"
        "modSeq INTEGER,"
        "updatedProperties TEXT,"
        "createdAt INTEGER)",
    "CREATE INDEX IF NOT EXISTS ChangeLogIndex ON ChangeLog (accountId, type, modSeq)",

    "CREATE TABLE IF NOT EXISTS EmailSubmission ("
        "id VARCHAR(40) PRIMARY KEY,"
        "accountId VARCHAR(40),"
        "version INTEGER,"
        "data TEXT,"
        "emailId VARCHAR(40),"
        "threadId VARCHAR(40),"
        "identityId VARCHAR(40),"
        "status VARCHAR(16),"
        "undoStatus VARCHAR(16),"
        "retryCount INTEGER DEFAULT 0,"
        "nextAttemptAt INTEGER,"
        "sendAt INTEGER,"
        "createdAt INTEGER,"
        "updatedAt INTEGER)",
    "CREATE INDEX IF NOT EXISTS EmailSubmissionQueueIndex ON EmailSubmission (status, nextAttemptAt, createdAt)",
    "CREATE INDEX IF NOT EXISTS EmailSubmissionAccountIndex ON EmailSubmission (accountId, createdAt)",
};

#endif /* constants_hpp */
