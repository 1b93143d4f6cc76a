/** MethodArgs [MailJMAP]
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

#ifndef MethodArgs_hpp
#define MethodArgs_hpp

#include <stdio.h>
#include <map>
#include <string>
#include <vector>
#include <utility>

#include "nlohmann/json.hpp"

enum class MethodKind {
    Get,
    Set,
    Changes,
    Query,
    QueryChanges,
    Copy,
    Import,
    Parse,
};

// Email/parse reuses GetArgs with the blobIds in `ids`.
struct GetArgs {
    std::string accountId;
    bool hasIds = false;
    std::vector<std::string> ids;
    bool hasProperties = false;
    std::vector<std::string> properties;

    // Email/get
    bool hasBodyProperties = false;
    std::vector<std::string> bodyProperties;
    bool fetchTextBodyValues = false;
    bool fetchHTMLBodyValues = false;
    bool fetchAllBodyValues = false;
    size_t maxBodyValueBytes = 0;
};

struct SetArgs {
    std::string accountId;
    bool hasIfInState = false;
    std::string ifInState;
    std::vector<std::pair<std::string, nlohmann::json>> create;
    std::vector<std::pair<std::string, nlohmann::json>> update;
    std::vector<std::string> destroy;

    // Mailbox/set
    bool onDestroyRemoveEmails = false;
};

struct ChangesArgs {
    std::string accountId;
    std::string sinceState;
    int maxChanges = 0;
};

struct QueryArgs {
    std::string accountId;
    nlohmann::json filter;
    nlohmann::json sort;
    long long position = 0;
    bool hasAnchor = false;
    std::string anchor;
    long long anchorOffset = 0;
    int limit = -1;
    bool calculateTotal = false;
    bool collapseThreads = false;
};

struct QueryChangesArgs {
    std::string accountId;
    nlohmann::json filter;
    nlohmann::json sort;
    std::string sinceQueryState;
    int maxChanges = 0;
    bool hasUpToId = false;
    std::string upToId;
    bool calculateTotal = false;
    bool collapseThreads = false;
};

struct CopyArgs {
    std::string fromAccountId;
    std::string accountId;
    bool hasIfFromInState = false;
    std::string ifFromInState;
    bool hasIfInState = false;
    std::string ifInState;
    std::vector<std::pair<std::string, nlohmann::json>> create;
    bool onSuccessDestroyOriginal = false;
    bool hasDestroyFromIfInState = false;
    std::string destroyFromIfInState;
};

struct ImportArgs {
    std::string accountId;
    bool hasIfInState = false;
    std::string ifInState;
    std::vector<std::pair<std::string, nlohmann::json>> emails;
};

/**
 * One entry of a JMAP request's methodCalls, validated and decoded into the
 * argument struct for its kind. Only the member matching `kind` is filled.
 */
struct MethodCall {
    std::string name;
    std::string objectType;
    MethodKind kind;
    std::string callId;

    GetArgs get;
    SetArgs set;
    ChangesArgs changes;
    QueryArgs query;
    QueryChangesArgs queryChanges;
    CopyArgs copy;
    ImportArgs import;

    // Throws JMAPError unknownMethod for methods this server does not
    // implement and invalidArguments for malformed argument objects.
    static MethodCall Parse(std::string name, const nlohmann::json & args, std::string callId);

    std::string accountId() const;
    void setAccountId(std::string accountId);
};

// creation id => server id, shared by every call in one request
typedef std::map<std::string, std::string> CreationIdMap;

// "#abc" resolves to the id created as "abc" earlier in the request. Other
// values pass through. Throws JMAPError invalidProperties on a dangling ref.
std::string ResolveCreationReference(std::string ref, const CreationIdMap & creationIds, std::string property);

// Keeps "id" plus the requested properties when the client sent a list.
nlohmann::json FilterProperties(const nlohmann::json & object, const GetArgs & args);

struct QueryWindow {
    long long position;
    std::vector<std::string> ids;
    long long total;
};

// Applies position / anchor / anchorOffset / limit to a fully sorted id list.
QueryWindow ApplyQueryWindow(const std::vector<std::string> & ids, const QueryArgs & args, int defaultLimit, int maxLimit);

#endif /* MethodArgs_hpp */
