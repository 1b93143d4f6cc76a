#include "mailjmap/jmap/method_args.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/jmap_error.hpp"

#include <algorithm>
#include <map>
#include <set>

static std::map<std::string, std::set<std::string>> SUPPORTED_METHODS = {
    {TYPE_MAILBOX, {"get", "set", "changes", "query"}},
    {TYPE_EMAIL, {"get", "set", "changes", "query", "queryChanges", "copy", "import", "parse"}},
    {TYPE_THREAD, {"get", "changes"}},
    {TYPE_EMAIL_SUBMISSION, {"get", "set", "changes", "query"}},
};

static void invalid(std::string description) {
    throw JMAPError("invalidArguments", description);
}

static std::string optionalString(const nlohmann::json & args, std::string key, bool * present = nullptr) {
    if (present) {
        *present = false;
    }
    if (!args.count(key) || args[key].is_null()) {
        return "";
    }
    if (!args[key].is_string()) {
        invalid(key + " must be a string");
    }
    if (present) {
        *present = true;
    }
    return args[key].get<std::string>();
}

static bool optionalBool(const nlohmann::json & args, std::string key) {
    if (!args.count(key) || args[key].is_null()) {
        return false;
    }
    if (!args[key].is_boolean()) {
        invalid(key + " must be a boolean");
    }
    return args[key].get<bool>();
}

static long long optionalInt(const nlohmann::json & args, std::string key, long long fallback) {
    if (!args.count(key) || args[key].is_null()) {
        return fallback;
    }
    if (!args[key].is_number_integer()) {
        invalid(key + " must be an integer");
    }
    return args[key].get<long long>();
}

static std::vector<std::string> stringList(const nlohmann::json & args, std::string key, bool * present) {
    std::vector<std::string> list;
    *present = false;
    if (!args.count(key) || args[key].is_null()) {
        return list;
    }
    if (!args[key].is_array()) {
        invalid(key + " must be an array of strings");
    }
    for (const auto & item : args[key]) {
        if (!item.is_string()) {
            invalid(key + " must be an array of strings");
        }
        list.push_back(item.get<std::string>());
    }
    *present = true;
    return list;
}

static std::vector<std::pair<std::string, nlohmann::json>> objectMap(const nlohmann::json & args, std::string key) {
    std::vector<std::pair<std::string, nlohmann::json>> entries;
    if (!args.count(key) || args[key].is_null()) {
        return entries;
    }
    if (!args[key].is_object()) {
        invalid(key + " must be an object");
    }
    for (auto it = args[key].begin(); it != args[key].end(); ++it) {
        entries.push_back({it.key(), it.value()});
    }
    return entries;
}

MethodCall MethodCall::Parse(std::string name, const nlohmann::json & args, std::string callId) {
    size_t slash = name.find('/');
    if (slash == std::string::npos) {
        throw JMAPError("unknownMethod", "Unknown method " + name);
    }
    std::string type = name.substr(0, slash);
    std::string method = name.substr(slash + 1);
    if (!SUPPORTED_METHODS.count(type) || !SUPPORTED_METHODS[type].count(method)) {
        throw JMAPError("unknownMethod", "Unknown method " + name);
    }
    if (!args.is_object()) {
        invalid("Method arguments must be an object");
    }

    MethodCall call;
    call.name = name;
    call.objectType = type;
    call.callId = callId;

    if (method == "get" || method == "parse") {
        call.kind = method == "get" ? MethodKind::Get : MethodKind::Parse;
        call.get.accountId = optionalString(args, "accountId");
        call.get.ids = stringList(args, method == "get" ? "ids" : "blobIds", &call.get.hasIds);
        if (call.kind == MethodKind::Parse && !call.get.hasIds) {
            invalid("blobIds is required");
        }
        call.get.properties = stringList(args, "properties", &call.get.hasProperties);
        call.get.bodyProperties = stringList(args, "bodyProperties", &call.get.hasBodyProperties);
        call.get.fetchTextBodyValues = optionalBool(args, "fetchTextBodyValues");
        call.get.fetchHTMLBodyValues = optionalBool(args, "fetchHTMLBodyValues");
        call.get.fetchAllBodyValues = optionalBool(args, "fetchAllBodyValues");
        long long maxBytes = optionalInt(args, "maxBodyValueBytes", 0);
        if (maxBytes < 0) {
            invalid("maxBodyValueBytes must not be negative");
        }
        call.get.maxBodyValueBytes = (size_t)maxBytes;
        if (call.get.hasIds && call.get.ids.size() > JMAP_MAX_OBJECTS_IN_GET) {
            throw JMAPError("limitExceeded", "Too many ids requested");
        }

    } else if (method == "set") {
        call.kind = MethodKind::Set;
        call.set.accountId = optionalString(args, "accountId");
        call.set.ifInState = optionalString(args, "ifInState", &call.set.hasIfInState);
        call.set.create = objectMap(args, "create");
        call.set.update = objectMap(args, "update");
        bool hasDestroy = false;
        call.set.destroy = stringList(args, "destroy", &hasDestroy);
        call.set.onDestroyRemoveEmails = optionalBool(args, "onDestroyRemoveEmails");
        if (call.set.create.size() + call.set.update.size() + call.set.destroy.size() > JMAP_MAX_OBJECTS_IN_SET) {
            throw JMAPError("limitExceeded", "Too many objects in one /set call");
        }

    } else if (method == "changes") {
        call.kind = MethodKind::Changes;
        call.changes.accountId = optionalString(args, "accountId");
        bool hasSince = false;
        call.changes.sinceState = optionalString(args, "sinceState", &hasSince);
        if (!hasSince) {
            invalid("sinceState is required");
        }
        call.changes.maxChanges = (int)optionalInt(args, "maxChanges", 0);
        if (call.changes.maxChanges < 0) {
            invalid("maxChanges must be positive");
        }

    } else if (method == "query") {
        call.kind = MethodKind::Query;
        call.query.accountId = optionalString(args, "accountId");
        call.query.filter = args.count("filter") ? args["filter"] : nlohmann::json();
        if (!call.query.filter.is_null() && !call.query.filter.is_object()) {
            invalid("filter must be an object");
        }
        call.query.sort = args.count("sort") ? args["sort"] : nlohmann::json();
        if (!call.query.sort.is_null() && !call.query.sort.is_array()) {
            invalid("sort must be an array");
        }
        call.query.position = optionalInt(args, "position", 0);
        call.query.anchor = optionalString(args, "anchor", &call.query.hasAnchor);
        call.query.anchorOffset = optionalInt(args, "anchorOffset", 0);
        call.query.limit = (int)optionalInt(args, "limit", -1);
        if (args.count("limit") && !args["limit"].is_null() && call.query.limit < 0) {
            invalid("limit must not be negative");
        }
        call.query.calculateTotal = optionalBool(args, "calculateTotal");
        call.query.collapseThreads = optionalBool(args, "collapseThreads");

    } else if (method == "queryChanges") {
        call.kind = MethodKind::QueryChanges;
        call.queryChanges.accountId = optionalString(args, "accountId");
        call.queryChanges.filter = args.count("filter") ? args["filter"] : nlohmann::json();
        if (!call.queryChanges.filter.is_null() && !call.queryChanges.filter.is_object()) {
            invalid("filter must be an object");
        }
        call.queryChanges.sort = args.count("sort") ? args["sort"] : nlohmann::json();
        if (!call.queryChanges.sort.is_null() && !call.queryChanges.sort.is_array()) {
            invalid("sort must be an array");
        }
        bool hasSince = false;
        call.queryChanges.sinceQueryState = optionalString(args, "sinceQueryState", &hasSince);
        if (!hasSince) {
            invalid("sinceQueryState is required");
        }
        call.queryChanges.maxChanges = (int)optionalInt(args, "maxChanges", 0);
        if (call.queryChanges.maxChanges < 0) {
            invalid("maxChanges must be positive");
        }
        call.queryChanges.upToId = optionalString(args, "upToId", &call.queryChanges.hasUpToId);
        call.queryChanges.calculateTotal = optionalBool(args, "calculateTotal");
        call.queryChanges.collapseThreads = optionalBool(args, "collapseThreads");

    } else if (method == "copy") {
        call.kind = MethodKind::Copy;
        bool hasFrom = false;
        call.copy.fromAccountId = optionalString(args, "fromAccountId", &hasFrom);
        call.copy.accountId = optionalString(args, "accountId");
        if (!hasFrom) {
            invalid("fromAccountId is required");
        }
        call.copy.ifFromInState = optionalString(args, "ifFromInState", &call.copy.hasIfFromInState);
        call.copy.ifInState = optionalString(args, "ifInState", &call.copy.hasIfInState);
        call.copy.create = objectMap(args, "create");
        call.copy.onSuccessDestroyOriginal = optionalBool(args, "onSuccessDestroyOriginal");
        call.copy.destroyFromIfInState = optionalString(args, "destroyFromIfInState", &call.copy.hasDestroyFromIfInState);
        if (call.copy.create.size() > JMAP_MAX_OBJECTS_IN_SET) {
            throw JMAPError("limitExceeded", "Too many objects in one /copy call");
        }

    } else if (method == "import") {
        call.kind = MethodKind::Import;
        call.import.accountId = optionalString(args, "accountId");
        call.import.ifInState = optionalString(args, "ifInState", &call.import.hasIfInState);
        call.import.emails = objectMap(args, "emails");
        if (call.import.emails.size() > JMAP_MAX_OBJECTS_IN_SET) {
            throw JMAPError("limitExceeded", "Too many emails in one /import call");
        }
    }

    return call;
}

std::string MethodCall::accountId() const {
    switch (kind) {
        case MethodKind::Get:
        case MethodKind::Parse: return get.accountId;
        case MethodKind::Set: return set.accountId;
        case MethodKind::Changes: return changes.accountId;
        case MethodKind::Query: return query.accountId;
        case MethodKind::QueryChanges: return queryChanges.accountId;
        case MethodKind::Copy: return copy.accountId;
        case MethodKind::Import: return import.accountId;
    }
    return "";
}

void MethodCall::setAccountId(std::string accountId) {
    switch (kind) {
        case MethodKind::Get:
        case MethodKind::Parse: get.accountId = accountId; break;
        case MethodKind::Set: set.accountId = accountId; break;
        case MethodKind::Changes: changes.accountId = accountId; break;
        case MethodKind::Query: query.accountId = accountId; break;
        case MethodKind::QueryChanges: queryChanges.accountId = accountId; break;
        case MethodKind::Copy: copy.accountId = accountId; break;
        case MethodKind::Import: import.accountId = accountId; break;
    }
}

std::string ResolveCreationReference(std::string ref, const CreationIdMap & creationIds, std::string property) {
    if (ref.size() == 0 || ref[0] != '#') {
        return ref;
    }
    auto it = creationIds.find(ref.substr(1));
    if (it == creationIds.end()) {
        throw JMAPError("invalidProperties", "Unknown creation id reference " + ref, {property});
    }
    return it->second;
}

nlohmann::json FilterProperties(const nlohmann::json & object, const GetArgs & args) {
    if (!args.hasProperties) {
        return object;
    }
    nlohmann::json filtered = {{"id", object["id"]}};
    for (const auto & prop : args.properties) {
        if (object.count(prop)) {
            filtered[prop] = object[prop];
        }
    }
    return filtered;
}

QueryWindow ApplyQueryWindow(const std::vector<std::string> & ids, const QueryArgs & args, int defaultLimit, int maxLimit) {
    long long total = (long long)ids.size();
    long long start = 0;

    if (args.hasAnchor) {
        auto it = std::find(ids.begin(), ids.end(), args.anchor);
        if (it == ids.end()) {
            throw JMAPError("anchorNotFound", "Anchor " + args.anchor + " is not in the results");
        }
        start = (long long)(it - ids.begin()) + args.anchorOffset;
    } else if (args.position < 0) {
        start = total + args.position;
    } else {
        start = args.position;
    }
    if (start < 0) {
        start = 0;
    }
    if (start > total) {
        start = total;
    }

    long long limit = args.limit >= 0 ? args.limit : defaultLimit;
    if (limit > maxLimit) {
        limit = maxLimit;
    }
    long long end = std::min(total, start + limit);

    QueryWindow window;
    window.position = start;
    window.total = total;
    window.ids = std::vector<std::string>(ids.begin() + start, ids.begin() + end);
    return window;
}
