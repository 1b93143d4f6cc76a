#include "mailjmap/change_log.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/jmap_error.hpp"

#include <map>
#include <set>

ChangeLog::ChangeLog(MailStore * store) : store(store) {
}

long long ChangeLog::bumpState(std::string accountId, std::string type) {
    SQLite::Statement upsert(store->db(), "INSERT INTO JMAPState (accountId, type, modSeq) VALUES (?, ?, 1) ON CONFLICT (accountId, type) DO UPDATE SET modSeq = modSeq + 1");
    upsert.bind(1, accountId);
    upsert.bind(2, type);
    upsert.exec();
    return currentModSeq(accountId, type);
}

long long ChangeLog::recordCreate(std::string accountId, std::string type, std::string objectId) {
    return record(accountId, type, objectId, CHANGE_OP_CREATE, {});
}

long long ChangeLog::recordUpdate(std::string accountId, std::string type, std::string objectId, std::vector<std::string> updatedProperties) {
    return record(accountId, type, objectId, CHANGE_OP_UPDATE, updatedProperties);
}

long long ChangeLog::recordDestroy(std::string accountId, std::string type, std::string objectId) {
    return record(accountId, type, objectId, CHANGE_OP_DESTROY, {});
}

long long ChangeLog::record(std::string accountId, std::string type, std::string objectId, std::string op, std::vector<std::string> updatedProperties) {
    long long modSeq = bumpState(accountId, type);

    SQLite::Statement insert(store->db(), "INSERT INTO ChangeLog (accountId, type, objectId, op, modSeq, updatedProperties, createdAt) VALUES (?,?,?,?,?,?,?)");
    insert.bind(1, accountId);
    insert.bind(2, type);
    insert.bind(3, objectId);
    insert.bind(4, op);
    insert.bind(5, modSeq);
    if (updatedProperties.size()) {
        insert.bind(6, nlohmann::json(updatedProperties).dump());
    } else {
        insert.bind(6);
    }
    insert.bind(7, (long long)time(0));
    insert.exec();
    return modSeq;
}

long long ChangeLog::currentModSeq(std::string accountId, std::string type) {
    SQLite::Statement query(store->db(), "SELECT modSeq FROM JMAPState WHERE accountId = ? AND type = ?");
    query.bind(1, accountId);
    query.bind(2, type);
    if (query.executeStep()) {
        return query.getColumn(0).getInt64();
    }
    return 0;
}

std::string ChangeLog::getState(std::string accountId, std::string type) {
    return std::to_string(currentModSeq(accountId, type));
}

void ChangeLog::assertInState(std::string accountId, std::string type, std::string ifInState) {
    std::string current = getState(accountId, type);
    if (ifInState != current) {
        throw JMAPError("stateMismatch", "Expected state " + ifInState + " but the current state is " + current);
    }
}

static bool parseState(std::string state, long long * out) {
    if (state.size() == 0 || state.size() > 18) {
        return false;
    }
    for (char c : state) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    *out = std::stoll(state);
    return true;
}

ChangesResult ChangeLog::getChanges(std::string accountId, std::string type, std::string sinceState, int maxChanges, std::string upToId, bool includeUpdatedProperties) {
    long long since = 0;
    long long current = currentModSeq(accountId, type);

    if (!parseState(sinceState, &since) || since > current) {
        throw JMAPError("cannotCalculateChanges", "sinceState " + sinceState + " is not a state this server issued");
    }
    if (maxChanges <= 0 || maxChanges > JMAP_MAX_OBJECTS_IN_GET) {
        maxChanges = JMAP_MAX_OBJECTS_IN_GET;
    }

    struct Row {
        std::string objectId;
        std::string op;
        long long modSeq;
        nlohmann::json props;
    };
    std::vector<Row> rows;

    SQLite::Statement query(store->db(), "SELECT objectId, op, modSeq, updatedProperties FROM ChangeLog WHERE accountId = ? AND type = ? AND modSeq > ? ORDER BY modSeq ASC LIMIT ?");
    query.bind(1, accountId);
    query.bind(2, type);
    query.bind(3, since);
    query.bind(4, maxChanges + 1);
    while (query.executeStep()) {
        Row row;
        row.objectId = query.getColumn("objectId").getString();
        row.op = query.getColumn("op").getString();
        row.modSeq = query.getColumn("modSeq").getInt64();
        row.props = query.getColumn("updatedProperties").isNull() ? nlohmann::json(nullptr) : nlohmann::json::parse(query.getColumn("updatedProperties").getString());
        rows.push_back(row);
    }

    ChangesResult result;
    result.oldState = sinceState;
    result.hasMoreChanges = (int)rows.size() > maxChanges;
    if (result.hasMoreChanges) {
        rows.resize(maxChanges);
    }

    // upToId ends the window at the last entry for that object
    if (upToId != "") {
        for (size_t ii = rows.size(); ii > 0; ii --) {
            if (rows[ii - 1].objectId == upToId) {
                if (ii < rows.size()) {
                    rows.resize(ii);
                    result.hasMoreChanges = true;
                }
                break;
            }
        }
    }

    result.newState = result.hasMoreChanges && rows.size() ? std::to_string(rows.back().modSeq) : std::to_string(current);

    std::vector<std::string> order;
    std::map<std::string, std::pair<std::string, std::string>> ops; // id => first, last
    std::set<std::string> props;
    bool propsComplete = true;

    for (const auto & row : rows) {
        if (!ops.count(row.objectId)) {
            order.push_back(row.objectId);
            ops[row.objectId] = {row.op, row.op};
        } else {
            ops[row.objectId].second = row.op;
        }
        if (row.op == CHANGE_OP_UPDATE) {
            if (row.props.is_array()) {
                for (const auto & p : row.props) {
                    props.insert(p.get<std::string>());
                }
            } else {
                propsComplete = false;
            }
        }
    }

    for (const auto & id : order) {
        const std::string & first = ops[id].first;
        const std::string & last = ops[id].second;

        if (last == CHANGE_OP_DESTROY) {
            if (first != CHANGE_OP_CREATE) {
                result.destroyed.push_back(id);
            }
        } else if (first == CHANGE_OP_CREATE) {
            result.created.push_back(id);
        } else {
            result.updated.push_back(id);
        }
    }

    if (includeUpdatedProperties && propsComplete && result.updated.size()) {
        result.updatedProperties = std::vector<std::string>(props.begin(), props.end());
    }
    return result;
}

std::string ChangeLog::getSessionState(std::string accountId) {
    SQLite::Statement query(store->db(), "SELECT MAX(modSeq) FROM JMAPState WHERE accountId = ?");
    query.bind(1, accountId);
    if (query.executeStep() && !query.getColumn(0).isNull()) {
        return std::to_string(query.getColumn(0).getInt64());
    }
    return "0";
}
