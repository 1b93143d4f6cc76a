#include "mailjmap/mailbox_engine.hpp"
#include "mailjmap/email_engine.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/jmap_error.hpp"
#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/mail_utils.hpp"

#include <algorithm>
#include <set>

#include "spdlog/spdlog.h"

static size_t utf8Length(const std::string & str) {
    size_t count = 0;
    for (char c : str) {
        if ((((unsigned char)c) & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

static std::string validatedName(const nlohmann::json & value) {
    if (!value.is_string()) {
        throw JMAPError("invalidProperties", "Mailbox name must be a non-empty string", {"name"});
    }
    std::string name = MailUtils::trim(value.get<std::string>());
    if (name == "") {
        throw JMAPError("invalidProperties", "Mailbox name must be a non-empty string", {"name"});
    }
    if (utf8Length(name) > JMAP_MAX_SIZE_MAILBOX_NAME) {
        throw JMAPError("invalidProperties", "Mailbox name is too long", {"name"});
    }
    return name;
}

static std::string validatedRole(const nlohmann::json & value) {
    if (value.is_null()) {
        return "";
    }
    if (!value.is_string()) {
        throw JMAPError("invalidProperties", "role must be a string or null", {"role"});
    }
    std::string role = MailUtils::toLower(MailUtils::trim(value.get<std::string>()));
    if (role == "") {
        return "";
    }
    if (std::find(MAILBOX_ROLES.begin(), MAILBOX_ROLES.end(), role) == MAILBOX_ROLES.end()) {
        throw JMAPError("invalidProperties", "Unknown mailbox role " + role, {"role"});
    }
    return role;
}

static int validatedSortOrder(const nlohmann::json & value) {
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw JMAPError("invalidProperties", "sortOrder must be a non-negative integer", {"sortOrder"});
    }
    return value.get<int>();
}

static std::string parentReference(const nlohmann::json & value) {
    if (value.is_null()) {
        return "";
    }
    if (!value.is_string() || value.get<std::string>() == "") {
        throw JMAPError("invalidProperties", "parentId must be a string or null", {"parentId"});
    }
    return value.get<std::string>();
}

static const std::set<std::string> SERVER_SET_PROPERTIES = {
    "id", "totalEmails", "unreadEmails", "totalThreads", "unreadThreads", "myRights",
};

MailboxEngine::MailboxEngine(MailStore * store, ChangeLog * changes, EmailEngine * emails) :
    store(store), changes(changes), emails(emails)
{
}

std::shared_ptr<Mailbox> MailboxEngine::findByRole(std::string accountId, std::string role) {
    return store->find<Mailbox>(Query::InAccount(accountId).equal("role", role));
}

std::map<std::string, MailboxCounts> MailboxEngine::countsForAccount(std::string accountId) {
    std::map<std::string, MailboxCounts> counts;
    SQLite::Statement query(store->db(), "SELECT MailboxMessage.mailboxId, COUNT(*), SUM(CASE WHEN Email.isSeen = 0 THEN 1 ELSE 0 END), COUNT(DISTINCT Email.threadId), COUNT(DISTINCT CASE WHEN Email.isSeen = 0 THEN Email.threadId END) FROM MailboxMessage INNER JOIN Email ON Email.id = MailboxMessage.emailId WHERE Email.accountId = ? AND Email.isDeleted = 0 GROUP BY MailboxMessage.mailboxId");
    query.bind(1, accountId);
    while (query.executeStep()) {
        counts[query.getColumn(0).getString()] = MailboxCounts{
            query.getColumn(1).getInt(),
            query.getColumn(2).getInt(),
            query.getColumn(3).getInt(),
            query.getColumn(4).getInt(),
        };
    }
    return counts;
}

nlohmann::json MailboxEngine::toJMAP(Mailbox * mailbox, MailboxCounts counts) {
    return {
        {"id", mailbox->id()},
        {"name", mailbox->name()},
        {"parentId", mailbox->parentId() == "" ? nlohmann::json() : nlohmann::json(mailbox->parentId())},
        {"role", mailbox->role() == "" ? nlohmann::json() : nlohmann::json(mailbox->role())},
        {"sortOrder", mailbox->sortOrder()},
        {"totalEmails", counts.totalEmails},
        {"unreadEmails", counts.unreadEmails},
        {"totalThreads", counts.totalThreads},
        {"unreadThreads", counts.unreadThreads},
        {"isSubscribed", true},
        {"myRights", {
            {"mayReadItems", true},
            {"mayAddItems", true},
            {"mayRemoveItems", true},
            {"maySetSeen", true},
            {"maySetKeywords", true},
            {"mayCreateChild", true},
            {"mayRename", true},
            {"mayDelete", true},
            {"maySubmit", true},
        }},
    };
}

nlohmann::json MailboxEngine::get(const GetArgs & args) {
    std::string state = changes->getState(args.accountId, TYPE_MAILBOX);
    auto counts = countsForAccount(args.accountId);

    Query q = Query::InAccount(args.accountId).orderBy("sortOrder").orderBy("name");
    auto mailboxes = store->findAllMap<Mailbox>(q, "id");

    nlohmann::json list = nlohmann::json::array();
    nlohmann::json notFound = nlohmann::json::array();

    auto append = [&](std::shared_ptr<Mailbox> mailbox) {
        MailboxCounts c = counts.count(mailbox->id()) ? counts[mailbox->id()] : MailboxCounts{0, 0, 0, 0};
        list.push_back(FilterProperties(toJMAP(mailbox.get(), c), args));
    };

    if (args.hasIds) {
        for (const auto & id : args.ids) {
            if (mailboxes.count(id)) {
                append(mailboxes[id]);
            } else {
                notFound.push_back(id);
            }
        }
    } else {
        for (const auto & mailbox : store->findAll<Mailbox>(q)) {
            append(mailbox);
        }
    }

    return {
        {"accountId", args.accountId},
        {"state", state},
        {"list", list},
        {"notFound", notFound},
    };
}

void MailboxEngine::ensureRoleAvailable(MailboxMap & mailboxes, std::string role, std::string mailboxId) {
    if (role == "") {
        return;
    }
    for (const auto & pair : mailboxes) {
        if (pair.second->role() == role && pair.first != mailboxId) {
            throw JMAPError("roleConflict", "Role " + role + " is already assigned to another mailbox", {"role"});
        }
    }
}

void MailboxEngine::ensureParentValid(MailboxMap & mailboxes, std::string parentId, std::string childId) {
    if (parentId == "") {
        return;
    }
    if (parentId == childId) {
        throw JMAPError("invalidProperties", "parentId cannot reference the mailbox itself", {"parentId"});
    }
    if (!mailboxes.count(parentId)) {
        throw JMAPError("invalidProperties", "parentId does not exist", {"parentId"});
    }

    std::set<std::string> seen;
    std::string cursor = mailboxes[parentId]->parentId();
    while (cursor != "" && !seen.count(cursor)) {
        if (cursor == childId) {
            throw JMAPError("invalidProperties", "parentId creates a cycle", {"parentId"});
        }
        seen.insert(cursor);
        cursor = mailboxes.count(cursor) ? mailboxes[cursor]->parentId() : "";
    }
}

std::string MailboxEngine::createMailbox(std::string accountId, const nlohmann::json & create, MailboxMap & mailboxes, CreationIdMap & creationIds) {
    if (!create.is_object()) {
        throw JMAPError("invalidProperties", "Mailbox/create patch must be an object");
    }
    for (auto it = create.begin(); it != create.end(); ++it) {
        if (SERVER_SET_PROPERTIES.count(it.key())) {
            throw JMAPError("invalidProperties", it.key() + " is set by the server", {it.key()});
        }
    }

    std::string name = validatedName(create.count("name") ? create["name"] : nlohmann::json());
    std::string role = create.count("role") ? validatedRole(create["role"]) : "";
    int sortOrder = create.count("sortOrder") ? validatedSortOrder(create["sortOrder"]) : 0;
    std::string parentId = create.count("parentId") ? parentReference(create["parentId"]) : "";
    parentId = ResolveCreationReference(parentId, creationIds, "parentId");

    std::string id = MailUtils::idRandomlyGenerated();
    ensureRoleAvailable(mailboxes, role, id);
    ensureParentValid(mailboxes, parentId, id);

    auto mailbox = std::make_shared<Mailbox>(id, accountId, 0);
    mailbox->setName(name);
    mailbox->setRole(role);
    mailbox->setSortOrder(sortOrder);
    mailbox->setParentId(parentId);
    store->save(mailbox.get());
    changes->recordCreate(accountId, TYPE_MAILBOX, id);

    mailboxes[id] = mailbox;
    return id;
}

std::vector<std::string> MailboxEngine::updateMailbox(std::string accountId, std::shared_ptr<Mailbox> mailbox, const nlohmann::json & patch, MailboxMap & mailboxes, const CreationIdMap & creationIds) {
    if (!patch.is_object()) {
        throw JMAPError("invalidProperties", "Mailbox/update patch must be an object");
    }

    std::vector<std::string> changed;
    std::string name = mailbox->name();
    std::string role = mailbox->role();
    std::string parentId = mailbox->parentId();
    int sortOrder = mailbox->sortOrder();

    for (auto it = patch.begin(); it != patch.end(); ++it) {
        const std::string & key = it.key();
        if (key == "name") {
            name = validatedName(it.value());
        } else if (key == "role") {
            role = validatedRole(it.value());
        } else if (key == "sortOrder") {
            sortOrder = validatedSortOrder(it.value());
        } else if (key == "parentId") {
            parentId = ResolveCreationReference(parentReference(it.value()), creationIds, "parentId");
        } else if (key == "isSubscribed") {
            continue;
        } else if (SERVER_SET_PROPERTIES.count(key)) {
            throw JMAPError("invalidProperties", key + " is set by the server", {key});
        } else {
            throw JMAPError("invalidProperties", "Unknown property " + key, {key});
        }
    }

    if (role != mailbox->role()) {
        ensureRoleAvailable(mailboxes, role, mailbox->id());
        changed.push_back("role");
    }
    if (parentId != mailbox->parentId()) {
        ensureParentValid(mailboxes, parentId, mailbox->id());
        changed.push_back("parentId");
    }
    if (name != mailbox->name()) {
        changed.push_back("name");
    }
    if (sortOrder != mailbox->sortOrder()) {
        changed.push_back("sortOrder");
    }
    if (changed.size() == 0) {
        return changed;
    }

    mailbox->setName(name);
    mailbox->setRole(role);
    mailbox->setParentId(parentId);
    mailbox->setSortOrder(sortOrder);
    mailbox->setUpdatedAt(time(0));
    store->save(mailbox.get());
    changes->recordUpdate(accountId, TYPE_MAILBOX, mailbox->id(), changed);
    return changed;
}

void MailboxEngine::destroyMailbox(std::string accountId, std::shared_ptr<Mailbox> mailbox, bool removeEmails, MailboxMap & mailboxes) {
    for (const auto & pair : mailboxes) {
        if (pair.second->parentId() == mailbox->id()) {
            throw JMAPError("mailboxHasChild", "Mailbox has child mailboxes");
        }
    }

    std::vector<std::string> emailIds;
    SQLite::Statement members(store->db(), "SELECT MailboxMessage.emailId FROM MailboxMessage INNER JOIN Email ON Email.id = MailboxMessage.emailId WHERE MailboxMessage.mailboxId = ? AND Email.isDeleted = 0");
    members.bind(1, mailbox->id());
    while (members.executeStep()) {
        emailIds.push_back(members.getColumn(0).getString());
    }

    if (emailIds.size() > 0 && !removeEmails) {
        throw JMAPError("mailboxHasEmail", "Mailbox still contains emails");
    }
    for (const auto & emailId : emailIds) {
        emails->removeFromMailbox(accountId, emailId, mailbox->id());
    }

    store->remove(mailbox.get());
    changes->recordDestroy(accountId, TYPE_MAILBOX, mailbox->id());
    mailboxes.erase(mailbox->id());

    if (emailIds.size()) {
        spdlog::get("logger")->info("Destroyed mailbox {} and removed {} emails from it", mailbox->id(), emailIds.size());
    }
}

nlohmann::json MailboxEngine::set(const SetArgs & args, CreationIdMap & creationIds) {
    std::string accountId = args.accountId;
    if (args.hasIfInState) {
        changes->assertInState(accountId, TYPE_MAILBOX, args.ifInState);
    }
    std::string oldState = changes->getState(accountId, TYPE_MAILBOX);

    nlohmann::json created = nlohmann::json::object();
    nlohmann::json notCreated = nlohmann::json::object();
    nlohmann::json updated = nlohmann::json::object();
    nlohmann::json notUpdated = nlohmann::json::object();
    nlohmann::json destroyed = nlohmann::json::array();
    nlohmann::json notDestroyed = nlohmann::json::object();

    MailStoreTransaction transaction{store, "mailboxSet"};

    Query all = Query::InAccount(accountId);
    MailboxMap mailboxes = store->findAllMap<Mailbox>(all, "id");

    // A create may name its parent by a creation id from the same call, so
    // creations whose parent reference is still pending are deferred.
    std::vector<std::pair<std::string, nlohmann::json>> pending = args.create;
    std::set<std::string> pendingIds;
    for (const auto & entry : pending) {
        pendingIds.insert(entry.first);
    }

    while (pending.size() > 0) {
        std::vector<std::pair<std::string, nlohmann::json>> deferred;
        for (const auto & entry : pending) {
            const nlohmann::json & create = entry.second;
            bool waiting = false;
            if (create.is_object() && create.count("parentId") && create["parentId"].is_string()) {
                std::string ref = create["parentId"].get<std::string>();
                waiting = ref.size() > 1 && ref[0] == '#' && pendingIds.count(ref.substr(1)) && !creationIds.count(ref.substr(1)) && ref.substr(1) != entry.first;
            }
            if (waiting) {
                deferred.push_back(entry);
                continue;
            }
            try {
                std::string id = createMailbox(accountId, create, mailboxes, creationIds);
                creationIds[entry.first] = id;
                created[entry.first] = {
                    {"id", id},
                    {"totalEmails", 0},
                    {"unreadEmails", 0},
                    {"totalThreads", 0},
                    {"unreadThreads", 0},
                };
            } catch (JMAPError & err) {
                notCreated[entry.first] = err.toJSON();
            }
            pendingIds.erase(entry.first);
        }
        if (deferred.size() == pending.size()) {
            // Unresolvable references: report each one
            for (const auto & entry : deferred) {
                notCreated[entry.first] = JMAPError("invalidProperties", "Unknown creation id reference " + entry.second["parentId"].get<std::string>(), {"parentId"}).toJSON();
            }
            break;
        }
        pending = deferred;
    }

    for (const auto & entry : args.update) {
        try {
            std::string id = ResolveCreationReference(entry.first, creationIds, "id");
            if (!mailboxes.count(id)) {
                throw JMAPError("notFound", "Mailbox not found");
            }
            updateMailbox(accountId, mailboxes[id], entry.second, mailboxes, creationIds);
            updated[entry.first] = nullptr;
        } catch (JMAPError & err) {
            notUpdated[entry.first] = err.toJSON();
        }
    }

    for (const auto & ref : args.destroy) {
        try {
            std::string id = ResolveCreationReference(ref, creationIds, "id");
            if (!mailboxes.count(id)) {
                throw JMAPError("notFound", "Mailbox not found");
            }
            destroyMailbox(accountId, mailboxes[id], args.onDestroyRemoveEmails, mailboxes);
            destroyed.push_back(id);
        } catch (JMAPError & err) {
            notDestroyed[ref] = err.toJSON();
        }
    }

    transaction.commit();

    return {
        {"accountId", accountId},
        {"oldState", oldState},
        {"newState", changes->getState(accountId, TYPE_MAILBOX)},
        {"created", created},
        {"notCreated", notCreated},
        {"updated", updated},
        {"notUpdated", notUpdated},
        {"destroyed", destroyed},
        {"notDestroyed", notDestroyed},
    };
}

nlohmann::json MailboxEngine::getChanges(const ChangesArgs & args) {
    ChangesResult result = changes->getChanges(args.accountId, TYPE_MAILBOX, args.sinceState, args.maxChanges, "", true);
    return {
        {"accountId", args.accountId},
        {"oldState", result.oldState},
        {"newState", result.newState},
        {"hasMoreChanges", result.hasMoreChanges},
        {"created", result.created},
        {"updated", result.updated},
        {"destroyed", result.destroyed},
        {"updatedProperties", result.updatedProperties.size() ? nlohmann::json(result.updatedProperties) : nlohmann::json()},
    };
}

nlohmann::json MailboxEngine::query(const QueryArgs & args) {
    std::string sql = "SELECT id FROM Mailbox WHERE accountId = ?";
    std::vector<std::string> binds{args.accountId};

    if (args.filter.is_object()) {
        for (auto it = args.filter.begin(); it != args.filter.end(); ++it) {
            const std::string & key = it.key();
            const nlohmann::json & value = it.value();
            if (key == "parentId") {
                if (value.is_null()) {
                    sql += " AND parentId IS NULL";
                } else if (value.is_string()) {
                    sql += " AND parentId = ?";
                    binds.push_back(value.get<std::string>());
                } else {
                    throw JMAPError("invalidArguments", "filter.parentId must be a string or null");
                }
            } else if (key == "role") {
                if (value.is_null()) {
                    sql += " AND role IS NULL";
                } else if (value.is_string()) {
                    sql += " AND role = ?";
                    binds.push_back(MailUtils::toLower(value.get<std::string>()));
                } else {
                    throw JMAPError("invalidArguments", "filter.role must be a string or null");
                }
            } else if (key == "hasAnyRole") {
                if (!value.is_boolean()) {
                    throw JMAPError("invalidArguments", "filter.hasAnyRole must be a boolean");
                }
                sql += value.get<bool>() ? " AND role IS NOT NULL" : " AND role IS NULL";
            } else if (key == "name") {
                if (!value.is_string()) {
                    throw JMAPError("invalidArguments", "filter.name must be a string");
                }
                sql += " AND name LIKE ? ESCAPE '\\'";
                std::string pattern;
                for (char c : value.get<std::string>()) {
                    if (c == '%' || c == '_' || c == '\\') {
                        pattern.push_back('\\');
                    }
                    pattern.push_back(c);
                }
                binds.push_back("%" + pattern + "%");
            } else if (key == "isSubscribed") {
                continue;
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
            if (property != "name" && property != "sortOrder") {
                throw JMAPError("unsupportedSort", "Unsupported sort property " + property);
            }
            order += (order == "" ? "" : ", ") + property + (ascending ? " ASC" : " DESC");
        }
    }
    if (order == "") {
        order = "sortOrder ASC, name ASC";
    }
    sql += " ORDER BY " + order + ", id ASC";

    SQLite::Statement statement(store->db(), sql);
    for (size_t ii = 0; ii < binds.size(); ii ++) {
        statement.bind((int)ii + 1, binds[ii]);
    }
    std::vector<std::string> ids;
    while (statement.executeStep()) {
        ids.push_back(statement.getColumn(0).getString());
    }

    QueryWindow window = ApplyQueryWindow(ids, args, 500, 500);
    nlohmann::json response = {
        {"accountId", args.accountId},
        {"queryState", changes->getState(args.accountId, TYPE_MAILBOX)},
        {"canCalculateChanges", false},
        {"position", window.position},
        {"ids", window.ids},
    };
    if (args.calculateTotal) {
        response["total"] = window.total;
    }
    return response;
}
