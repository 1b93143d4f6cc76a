#include "mailjmap/account_registry.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/jmap_error.hpp"
#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/models/account.hpp"
#include "mailjmap/models/identity.hpp"

#include "spdlog/spdlog.h"

nlohmann::json RegisteredAccount::toJSON() const {
    return {
        {"accountId", accountId},
        {"emailAddress", emailAddress},
        {"identityId", identityId},
        {"mailboxIds", mailboxIds},
    };
}

AccountRegistry::AccountRegistry(MailStore * store, EmailEngine * emails) :
    store(store), emails(emails)
{
}

const std::vector<std::string> & AccountRegistry::DefaultMailboxRoles() {
    return MAILBOX_ROLES;
}

RegisteredAccount AccountRegistry::registerAccount(std::string accountId, std::string emailAddress, std::string name) {
    if (!MailUtils::isAccountId(accountId)) {
        throw JMAPError("invalidArguments", "Invalid account id", {"accountId"});
    }
    std::string address = MailUtils::normalizeEmail(emailAddress);
    size_t at = address.find('@');
    if (at == std::string::npos || at == 0 || at == address.size() - 1 || address.find(' ') != std::string::npos) {
        throw JMAPError("invalidArguments", "Invalid email address", {"emailAddress"});
    }

    MailStoreTransaction transaction{store, "registerAccount"};

    if (store->find<Account>(Query().equal("id", accountId)) != nullptr) {
        throw JMAPError("alreadyExists", "Account " + accountId + " already exists");
    }
    if (store->find<Account>(Query().equal("emailAddress", address)) != nullptr) {
        throw JMAPError("alreadyExists", "The address " + address + " is already registered");
    }

    Account account{accountId, address, name};
    store->save(&account);

    Identity identity{MailUtils::idRandomlyGenerated(), accountId, address, name};
    store->save(&identity);

    RegisteredAccount result;
    result.accountId = accountId;
    result.emailAddress = address;
    result.identityId = identity.id();
    for (const auto & role : DefaultMailboxRoles()) {
        result.mailboxIds[role] = emails->findOrCreateRoleMailbox(accountId, role)->id();
    }

    transaction.commit();
    spdlog::get("logger")->info("Registered account {} ({})", accountId, address);
    return result;
}
