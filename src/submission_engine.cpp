#include "mailjmap/submission_engine.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/delivery_status.hpp"
#include "mailjmap/jmap_error.hpp"
#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/models/email.hpp"
#include "mailjmap/models/identity.hpp"

#include <algorithm>
#include <set>

#include "spdlog/spdlog.h"

static nlohmann::json envelopeAddress(std::string email) {
    return {{"email", email}, {"parameters", nullptr}};
}

SubmissionEngine::SubmissionEngine(MailStore * store, ChangeLog * changes) :
    store(store), changes(changes)
{
}

nlohmann::json SubmissionEngine::toJMAP(EmailSubmission * submission) {
    std::vector<std::string> recipients;
    nlohmann::json envelope = submission->envelope();
    if (envelope.count("rcptTo") && envelope["rcptTo"].is_array()) {
        for (const auto & rcpt : envelope["rcptTo"]) {
            if (rcpt.is_object() && rcpt.count("email") && rcpt["email"].is_string()) {
                recipients.push_back(rcpt["email"].get<std::string>());
            }
        }
    }

    return {
        {"id", submission->id()},
        {"identityId", submission->identityId()},
        {"emailId", submission->emailId()},
        {"threadId", submission->threadId()},
        {"envelope", envelope},
        {"sendAt", MailUtils::timestampForTime(submission->sendAt())},
        {"undoStatus", submission->undoStatus()},
        {"status", submission->status()},
        {"retryCount", submission->retryCount()},
        {"deliveryStatus", DeliveryStatus::normalize(submission->deliveryStatus(), recipients)},
        {"dsnBlobIds", nlohmann::json::array()},
        {"mdnBlobIds", nlohmann::json::array()},
    };
}

std::vector<std::string> SubmissionEngine::defaultRecipients(std::string canonicalMessageId) {
    SQLite::Statement query(store->db(), "SELECT Address.email FROM MessageAddress INNER JOIN Address ON Address.id = MessageAddress.addressId WHERE MessageAddress.messageId = ? AND MessageAddress.kind IN ('to', 'cc', 'bcc') ORDER BY CASE MessageAddress.kind WHEN 'to' THEN 0 WHEN 'cc' THEN 1 ELSE 2 END, MessageAddress.position");
    query.bind(1, canonicalMessageId);

    std::set<std::string> seen;
    std::vector<std::string> recipients;
    while (query.executeStep()) {
        std::string email = query.getColumn(0).getString();
        if (seen.insert(MailUtils::toLower(email)).second) {
            recipients.push_back(email);
        }
    }
    return recipients;
}

std::shared_ptr<EmailSubmission> SubmissionEngine::createSubmission(std::string accountId, const nlohmann::json & create, const CreationIdMap & creationIds) {
    if (!create.is_object()) {
        throw JMAPError("invalidProperties", "EmailSubmission/create must be an object");
    }
    for (const char * key : {"id", "threadId", "undoStatus", "deliveryStatus", "dsnBlobIds", "mdnBlobIds"}) {
        if (create.count(key)) {
            throw JMAPError("invalidProperties", std::string(key) + " is set by the server", {key});
        }
    }
    if (!create.count("emailId") || !create["emailId"].is_string() || create["emailId"].get<std::string>() == "") {
        throw JMAPError("invalidProperties", "emailId must be a non-empty string", {"emailId"});
    }
    if (!create.count("identityId") || !create["identityId"].is_string() || create["identityId"].get<std::string>() == "") {
        throw JMAPError("invalidProperties", "identityId must be a non-empty string", {"identityId"});
    }

    std::string emailId = ResolveCreationReference(create["emailId"].get<std::string>(), creationIds, "emailId");
    std::string identityId = create["identityId"].get<std::string>();

    auto identity = store->find<Identity>(Query::InAccount(accountId).equal("id", identityId));
    if (identity == nullptr) {
        throw JMAPError("invalidProperties", "identityId does not belong to this account", {"identityId"});
    }
    auto email = store->find<Email>(Query::InAccount(accountId).equal("id", emailId).live());
    if (email == nullptr) {
        throw JMAPError("invalidProperties", "emailId not found for this account", {"emailId"});
    }

    std::string mailFrom = identity->email();
    std::vector<std::string> rcptTo;
    bool rcptOverride = false;

    if (create.count("envelope") && !create["envelope"].is_null()) {
        const nlohmann::json & envelope = create["envelope"];
        if (!envelope.is_object()) {
            throw JMAPError("invalidProperties", "envelope must be an object", {"envelope"});
        }
        if (envelope.count("mailFrom") && !envelope["mailFrom"].is_null()) {
            const nlohmann::json & from = envelope["mailFrom"];
            if (!from.is_object() || !from.count("email") || !from["email"].is_string()) {
                throw JMAPError("invalidProperties", "envelope.mailFrom.email must be a string", {"envelope"});
            }
            if (from["email"].get<std::string>() != "") {
                mailFrom = from["email"].get<std::string>();
            }
        }
        if (envelope.count("rcptTo") && !envelope["rcptTo"].is_null()) {
            if (!envelope["rcptTo"].is_array()) {
                throw JMAPError("invalidProperties", "envelope.rcptTo must be an array", {"envelope"});
            }
            for (const auto & rcpt : envelope["rcptTo"]) {
                if (!rcpt.is_object() || !rcpt.count("email") || !rcpt["email"].is_string()) {
                    throw JMAPError("invalidProperties", "envelope.rcptTo items need an email string", {"envelope"});
                }
                rcptTo.push_back(rcpt["email"].get<std::string>());
            }
            rcptOverride = rcptTo.size() > 0;
        }
    }
    if (!rcptOverride) {
        rcptTo = defaultRecipients(email->messageId());
    }
    if (rcptTo.size() == 0) {
        throw JMAPError("invalidProperties", "EmailSubmission has no recipients", {"envelope"});
    }

    time_t sendAt = time(0);
    if (create.count("sendAt") && !create["sendAt"].is_null()) {
        if (!create["sendAt"].is_string() || MailUtils::timeForTimestamp(create["sendAt"].get<std::string>()) < 0) {
            throw JMAPError("invalidProperties", "sendAt must be a UTCDate", {"sendAt"});
        }
        sendAt = std::max(sendAt, MailUtils::timeForTimestamp(create["sendAt"].get<std::string>()));
    }

    nlohmann::json storedEnvelope = {
        {"mailFrom", envelopeAddress(mailFrom)},
        {"rcptTo", nlohmann::json::array()},
    };
    for (const auto & rcpt : rcptTo) {
        storedEnvelope["rcptTo"].push_back(envelopeAddress(rcpt));
    }

    auto submission = std::make_shared<EmailSubmission>(MailUtils::idRandomlyGenerated(), accountId, emailId, email->threadId(), identityId, storedEnvelope, sendAt);
    submission->setDeliveryStatus(DeliveryStatus::initialMap(rcptTo));
    store->save(submission.get());
    changes->recordCreate(accountId, TYPE_EMAIL_SUBMISSION, submission->id());

    spdlog::get("logger")->info("Queued submission {} of email {} to {} recipients", submission->id(), emailId, rcptTo.size());
    return submission;
}

std::vector<std::string> SubmissionEngine::updateSubmission(std::shared_ptr<EmailSubmission> submission, const nlohmann::json & patch) {
    if (!patch.is_object()) {
        throw JMAPError("invalidProperties", "EmailSubmission/update patch must be an object");
    }
    std::vector<std::string> changed;
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (it.key() != "undoStatus") {
            throw JMAPError("invalidProperties", "Property " + it.key() + " cannot be updated", {it.key()});
        }
        if (it.value() != UNDO_STATUS_CANCELED) {
            throw JMAPError("invalidProperties", "undoStatus can only be set to canceled", {"undoStatus"});
        }
        if (submission->undoStatus() == UNDO_STATUS_CANCELED) {
            continue;
        }
        if (submission->status() != SUBMISSION_STATUS_PENDING) {
            throw JMAPError("cannotUnsend", "The submission is no longer pending");
        }
        submission->setStatus(SUBMISSION_STATUS_CANCELED);
        submission->setUndoStatus(UNDO_STATUS_CANCELED);
        submission->setNextAttemptAt(-1);
        changed = {"undoStatus", "status"};
    }
    if (changed.size()) {
        submission->setUpdatedAt(time(0));
        store->save(submission.get());
        changes->recordUpdate(submission->accountId(), TYPE_EMAIL_SUBMISSION, submission->id(), changed);
    }
    return changed;
}

nlohmann::json SubmissionEngine::set(const SetArgs & args, CreationIdMap & creationIds) {
    std::string accountId = args.accountId;
    if (args.hasIfInState) {
        changes->assertInState(accountId, TYPE_EMAIL_SUBMISSION, args.ifInState);
    }
    std::string oldState = changes->getState(accountId, TYPE_EMAIL_SUBMISSION);

    nlohmann::json created = nlohmann::json::object();
    nlohmann::json notCreated = nlohmann::json::object();
    nlohmann::json updated = nlohmann::json::object();
    nlohmann::json notUpdated = nlohmann::json::object();
    nlohmann::json destroyed = nlohmann::json::array();
    nlohmann::json notDestroyed = nlohmann::json::object();

    MailStoreTransaction transaction{store, "emailSubmissionSet"};

    for (const auto & entry : args.create) {
        try {
            auto submission = createSubmission(accountId, entry.second, creationIds);
            creationIds[entry.first] = submission->id();
            created[entry.first] = {
                {"id", submission->id()},
                {"threadId", submission->threadId()},
                {"undoStatus", submission->undoStatus()},
                {"sendAt", MailUtils::timestampForTime(submission->sendAt())},
            };
        } catch (JMAPError & err) {
            notCreated[entry.first] = err.toJSON();
        }
    }

    for (const auto & entry : args.update) {
        try {
            std::string id = ResolveCreationReference(entry.first, creationIds, "id");
            auto submission = store->find<EmailSubmission>(Query::InAccount(accountId).equal("id", id));
            if (submission == nullptr) {
                throw JMAPError("notFound", "EmailSubmission not found");
            }
            updateSubmission(submission, entry.second);
            updated[entry.first] = nullptr;
        } catch (JMAPError & err) {
            notUpdated[entry.first] = err.toJSON();
        }
    }

    for (const auto & ref : args.destroy) {
        try {
            std::string id = ResolveCreationReference(ref, creationIds, "id");
            auto submission = store->find<EmailSubmission>(Query::InAccount(accountId).equal("id", id));
            if (submission == nullptr) {
                throw JMAPError("notFound", "EmailSubmission not found");
            }
            store->remove(submission.get());
            changes->recordDestroy(accountId, TYPE_EMAIL_SUBMISSION, id);
            destroyed.push_back(id);
        } catch (JMAPError & err) {
            notDestroyed[ref] = err.toJSON();
        }
    }

    transaction.commit();

    return {
        {"accountId", accountId},
        {"oldState", oldState},
        {"newState", changes->getState(accountId, TYPE_EMAIL_SUBMISSION)},
        {"created", created},
        {"notCreated", notCreated},
        {"updated", updated},
        {"notUpdated", notUpdated},
        {"destroyed", destroyed},
        {"notDestroyed", notDestroyed},
    };
}

nlohmann::json SubmissionEngine::get(const GetArgs & args) {
    nlohmann::json list = nlohmann::json::array();
    nlohmann::json notFound = nlohmann::json::array();

    for (const auto & id : args.ids) {
        auto submission = store->find<EmailSubmission>(Query::InAccount(args.accountId).equal("id", id));
        if (submission == nullptr) {
            notFound.push_back(id);
            continue;
        }
        list.push_back(FilterProperties(toJMAP(submission.get()), args));
    }

    return {
        {"accountId", args.accountId},
        {"state", changes->getState(args.accountId, TYPE_EMAIL_SUBMISSION)},
        {"list", list},
        {"notFound", notFound},
    };
}

nlohmann::json SubmissionEngine::getChanges(const ChangesArgs & args) {
    ChangesResult result = changes->getChanges(args.accountId, TYPE_EMAIL_SUBMISSION, args.sinceState, args.maxChanges);
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

nlohmann::json SubmissionEngine::query(const QueryArgs & args) {
    std::string sql = "SELECT id FROM EmailSubmission WHERE accountId = ?";
    std::vector<nlohmann::json> binds{args.accountId};

    if (args.filter.is_object()) {
        for (auto it = args.filter.begin(); it != args.filter.end(); ++it) {
            const std::string & key = it.key();
            const nlohmann::json & value = it.value();

            if (key == "identityIds" || key == "emailIds" || key == "threadIds") {
                if (!value.is_array()) {
                    throw JMAPError("invalidArguments", "filter." + key + " must be an array");
                }
                std::string column = key.substr(0, key.size() - 1);
                if (value.size() == 0) {
                    sql += " AND 0";
                    continue;
                }
                sql += " AND " + column + " IN (" + MailUtils::qmarks(value.size()) + ")";
                for (const auto & id : value) {
                    if (!id.is_string()) {
                        throw JMAPError("invalidArguments", "filter." + key + " must contain strings");
                    }
                    binds.push_back(id);
                }
            } else if (key == "undoStatus") {
                if (!value.is_string()) {
                    throw JMAPError("invalidArguments", "filter.undoStatus must be a string");
                }
                sql += " AND undoStatus = ?";
                binds.push_back(value);
            } else if (key == "before" || key == "after") {
                time_t t = value.is_string() ? MailUtils::timeForTimestamp(value.get<std::string>()) : -1;
                if (t < 0) {
                    throw JMAPError("invalidArguments", "filter." + key + " must be a UTCDate");
                }
                sql += key == "before" ? " AND sendAt < ?" : " AND sendAt >= ?";
                binds.push_back((long long)t);
            } else {
                throw JMAPError("unsupportedFilter", "Unsupported filter " + key);
            }
        }
    }

    std::string order = "";
    if (args.sort.is_array()) {
        for (const auto & comparator : args.sort) {
            std::string property = comparator.is_object() && comparator.count("property") && comparator["property"].is_string() ? comparator["property"].get<std::string>() : "";
            bool ascending = !(comparator.is_object() && comparator.count("isAscending") && comparator["isAscending"] == false);
            std::string column = "";
            if (property == "emailId") column = "emailId";
            if (property == "threadId") column = "threadId";
            if (property == "sentAt") column = "sendAt";
            if (column == "") {
                throw JMAPError("unsupportedSort", "Unsupported sort property " + property);
            }
            order += (order == "" ? "" : ", ") + column + (ascending ? " ASC" : " DESC");
        }
    }
    if (order == "") {
        order = "sendAt ASC";
    }
    sql += " ORDER BY " + order + ", id ASC";

    SQLite::Statement statement(store->db(), sql);
    for (size_t ii = 0; ii < binds.size(); ii ++) {
        if (binds[ii].is_number_integer()) {
            statement.bind((int)ii + 1, binds[ii].get<long long>());
        } else {
            statement.bind((int)ii + 1, binds[ii].get<std::string>());
        }
    }
    std::vector<std::string> ids;
    while (statement.executeStep()) {
        ids.push_back(statement.getColumn(0).getString());
    }

    QueryWindow window = ApplyQueryWindow(ids, args, JMAP_MAX_OBJECTS_IN_GET, JMAP_MAX_OBJECTS_IN_GET);
    nlohmann::json response = {
        {"accountId", args.accountId},
        {"queryState", changes->getState(args.accountId, TYPE_EMAIL_SUBMISSION)},
        {"canCalculateChanges", false},
        {"position", window.position},
        {"ids", window.ids},
    };
    if (args.calculateTotal) {
        response["total"] = window.total;
    }
    return response;
}
