#include "mailjmap/jmap/dispatcher.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/jmap_error.hpp"

#include <algorithm>

#include <SQLiteCpp/SQLiteCpp.h>
#include "spdlog/spdlog.h"

static nlohmann::json requestError(std::string type, std::string description) {
    return {{"type", type}, {"description", description}};
}

static nlohmann::json single(std::string name, nlohmann::json result) {
    nlohmann::json list = nlohmann::json::array();
    list.push_back(nlohmann::json::array({name, result}));
    return list;
}

JMAPDispatcher::JMAPDispatcher(ChangeLog * changes, EmailEngine * emails, MailboxEngine * mailboxes, SubmissionEngine * submissions) :
    changes(changes), emails(emails), mailboxes(mailboxes), submissions(submissions)
{
}

const std::vector<std::string> & JMAPDispatcher::SupportedCapabilities() {
    static std::vector<std::string> capabilities = {
        JMAP_CAPABILITY_CORE, JMAP_CAPABILITY_MAIL, JMAP_CAPABILITY_SUBMISSION
    };
    return capabilities;
}

EndpointResponse JMAPDispatcher::handle(std::string accountId, const nlohmann::json & request) {
    if (!request.is_object() || !request.count("using") || !request["using"].is_array() || !request.count("methodCalls") || !request["methodCalls"].is_array()) {
        return EndpointResponse::JSON(400, requestError("notRequest", "Request must be an object with using and methodCalls"));
    }

    const auto & supported = SupportedCapabilities();
    for (const auto & capability : request["using"]) {
        if (!capability.is_string()) {
            return EndpointResponse::JSON(400, requestError("notRequest", "using must be an array of strings"));
        }
        if (std::find(supported.begin(), supported.end(), capability.get<std::string>()) == supported.end()) {
            return EndpointResponse::JSON(400, {
                {"type", "unknownCapability"},
                {"capability", capability},
                {"description", "Unsupported capability " + capability.get<std::string>()},
            });
        }
    }

    const nlohmann::json & methodCalls = request["methodCalls"];
    if (methodCalls.size() > JMAP_MAX_CALLS_IN_REQUEST) {
        return EndpointResponse::JSON(400, {
            {"type", "limitExceeded"},
            {"limit", "maxCallsInRequest"},
            {"description", "Too many method calls in one request"},
        });
    }
    for (const auto & invocation : methodCalls) {
        if (!invocation.is_array() || invocation.size() != 3 || !invocation[0].is_string() || !invocation[2].is_string()) {
            return EndpointResponse::JSON(400, requestError("notRequest", "Each method call must be [name, arguments, callId]"));
        }
    }

    CreationIdMap creationIds;
    nlohmann::json responses = nlohmann::json::array();
    for (const auto & invocation : methodCalls) {
        dispatch(accountId, invocation[0].get<std::string>(), invocation[1], invocation[2].get<std::string>(), creationIds, responses);
    }

    return EndpointResponse::JSON(200, {
        {"methodResponses", responses},
        {"sessionState", changes->getSessionState(accountId)},
    });
}

void JMAPDispatcher::dispatch(std::string accountId, const std::string & name, const nlohmann::json & args, const std::string & callId, CreationIdMap & creationIds, nlohmann::json & responses) {
    auto logger = spdlog::get("logger");
    try {
        MethodCall call = MethodCall::Parse(name, args, callId);

        if (call.accountId() == "") {
            call.setAccountId(accountId);
        } else if (call.accountId() != accountId) {
            throw JMAPError("accountNotFound", "Account " + call.accountId() + " is not available");
        }
        if (call.kind == MethodKind::Copy && call.copy.fromAccountId != accountId) {
            throw JMAPError("accountNotFound", "Account " + call.copy.fromAccountId + " is not available");
        }

        for (const auto & entry : invoke(call, creationIds)) {
            responses.push_back(nlohmann::json::array({entry[0], entry[1], callId}));
        }
    } catch (JMAPError & err) {
        responses.push_back(nlohmann::json::array({"error", err.toJSON(), callId}));
    } catch (SQLite::Exception & ex) {
        logger->error("{} failed with a database error: {}", name, ex.what());
        responses.push_back(nlohmann::json::array({"error", requestError("serverError", "Database error"), callId}));
    } catch (std::exception & ex) {
        logger->error("{} failed: {}", name, ex.what());
        responses.push_back(nlohmann::json::array({"error", requestError("serverError", ex.what()), callId}));
    }
}

nlohmann::json JMAPDispatcher::invoke(MethodCall & call, CreationIdMap & creationIds) {
    const std::string & type = call.objectType;

    if (type == TYPE_MAILBOX) {
        switch (call.kind) {
            case MethodKind::Get: return single(call.name, mailboxes->get(call.get));
            case MethodKind::Set: return single(call.name, mailboxes->set(call.set, creationIds));
            case MethodKind::Changes: return single(call.name, mailboxes->getChanges(call.changes));
            case MethodKind::Query: return single(call.name, mailboxes->query(call.query));
            default: break;
        }
    } else if (type == TYPE_THREAD) {
        switch (call.kind) {
            case MethodKind::Get: return single(call.name, emails->threadGet(call.get));
            case MethodKind::Changes: return single(call.name, emails->threadChanges(call.changes));
            default: break;
        }
    } else if (type == TYPE_EMAIL_SUBMISSION) {
        switch (call.kind) {
            case MethodKind::Get: return single(call.name, submissions->get(call.get));
            case MethodKind::Set: return single(call.name, submissions->set(call.set, creationIds));
            case MethodKind::Changes: return single(call.name, submissions->getChanges(call.changes));
            case MethodKind::Query: return single(call.name, submissions->query(call.query));
            default: break;
        }
    } else if (type == TYPE_EMAIL) {
        switch (call.kind) {
            case MethodKind::Get: return single(call.name, emails->get(call.get));
            case MethodKind::Set: return single(call.name, emails->set(call.set, creationIds));
            case MethodKind::Changes: return single(call.name, emails->getChanges(call.changes));
            case MethodKind::Query: return single(call.name, emails->query(call.query));
            case MethodKind::QueryChanges: return single(call.name, emails->queryChanges(call.queryChanges));
            case MethodKind::Parse: return single(call.name, emails->parse(call.get));
            case MethodKind::Import: return single(call.name, emails->importEmails(call.import, creationIds));
            case MethodKind::Copy: {
                std::vector<std::string> copiedSourceIds;
                nlohmann::json result = nlohmann::json::array();
                result.push_back(nlohmann::json::array({call.name, emails->copy(call.copy, creationIds, copiedSourceIds)}));

                if (call.copy.onSuccessDestroyOriginal && copiedSourceIds.size() > 0) {
                    SetArgs destroy;
                    destroy.accountId = call.copy.fromAccountId;
                    destroy.hasIfInState = call.copy.hasDestroyFromIfInState;
                    destroy.ifInState = call.copy.destroyFromIfInState;
                    destroy.destroy = copiedSourceIds;
                    try {
                        result.push_back(nlohmann::json::array({"Email/set", emails->set(destroy, creationIds)}));
                    } catch (JMAPError & err) {
                        result.push_back(nlohmann::json::array({"error", err.toJSON()}));
                    }
                }
                return result;
            }
        }
    }
    throw JMAPError("unknownMethod", "Unknown method " + call.name);
}
