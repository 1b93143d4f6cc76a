#include "mailjmap/thread_resolver.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/models/thread.hpp"

#include "spdlog/spdlog.h"

ThreadResolver::ThreadResolver(MailStore * store) : store(store) {
}

ThreadResolution ThreadResolver::resolveOrCreateThreadId(std::string accountId, std::string subject, time_t internalDate, std::string inReplyTo, std::string referencesHeader) {
    std::string replyId = MailUtils::normalizeMessageId(inReplyTo);
    if (replyId != "") {
        std::vector<std::string> ids{replyId};
        std::string threadId = findThreadForMessageIds(accountId, ids);
        if (threadId != "" && touchThread(threadId, internalDate)) {
            return ThreadResolution{threadId, false};
        }
    }

    std::vector<std::string> referenceIds = MailUtils::parseReferences(referencesHeader);
    if (referenceIds.size() > 0) {
        std::string threadId = findThreadForMessageIds(accountId, referenceIds);
        if (threadId != "" && touchThread(threadId, internalDate)) {
            return ThreadResolution{threadId, false};
        }
    }

    Thread thread{MailUtils::idRandomlyGenerated(), accountId, subject, internalDate};
    store->save(&thread);
    return ThreadResolution{thread.id(), true};
}

std::string ThreadResolver::findThreadForMessageIds(std::string accountId, std::vector<std::string> & messageIds) {
    // SQLite limits bound parameters, very long References chains are cut
    if (messageIds.size() > 900) {
        messageIds.resize(900);
    }
    SQLite::Statement query(store->db(), "SELECT Email.threadId FROM Email INNER JOIN Message ON Message.id = Email.messageId WHERE Email.accountId = ? AND Email.isDeleted = 0 AND Message.headerMessageId IN (" + MailUtils::qmarks(messageIds.size()) + ") ORDER BY Email.internalDate ASC LIMIT 1");
    int ii = 1;
    query.bind(ii++, accountId);
    for (const auto & id : messageIds) {
        query.bind(ii++, id);
    }
    if (query.executeStep()) {
        return query.getColumn(0).getString();
    }
    return "";
}

bool ThreadResolver::touchThread(std::string threadId, time_t internalDate) {
    auto thread = store->find<Thread>(Query().equal("id", threadId));
    if (thread == nullptr) {
        spdlog::get("logger")->warn("Email references thread {} which no longer exists", threadId);
        return false;
    }
    if (internalDate > thread->latestMessageAt()) {
        thread->setLatestMessageAt(internalDate);
        store->save(thread.get());
    }
    return true;
}
