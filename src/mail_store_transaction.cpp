#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/constants.hpp"

#include "spdlog/spdlog.h"

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

MailStoreTransaction::MailStoreTransaction(MailStore * store, std::string name) :
    _store(store), _name(name), _committed(false), _requested(steady_clock::now())
{
    _store->beginTransaction();
    _acquired = steady_clock::now();
}

MailStoreTransaction::~MailStoreTransaction() noexcept
{
    if (_committed) {
        return;
    }
    try {
        _store->rollbackTransaction();
    } catch (SQLite::Exception & ex) {
        spdlog::get("logger")->warn("Rollback of {} failed: {}", _name, ex.what());
    }
}

void MailStoreTransaction::commit()
{
    if (_committed) {
        throw SQLite::Exception("Transaction " + _name + " already committed.");
    }
    _store->commitTransaction();
    _committed = true;
    logIfSlow();
}

void MailStoreTransaction::logIfSlow()
{
    long long total = duration_cast<milliseconds>(steady_clock::now() - _requested).count();
    if (total <= SLOW_TRANSACTION_MS) {
        return;
    }
    long long waiting = duration_cast<milliseconds>(_acquired - _requested).count();
    spdlog::get("logger")->warn("[SLOW] Transaction={} took {}ms ({}ms waiting for the write lock)", _name, total, waiting);
}
