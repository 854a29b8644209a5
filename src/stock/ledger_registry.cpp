#include "stock/ledger_registry.h"

#include <utility>
#include <vector>

namespace stock {

LedgerRegistry::LedgerRegistry(std::shared_ptr<audit::StructuredLogger> logger)
    : logger_(std::move(logger)) {}

std::shared_ptr<StockLedger> LedgerRegistry::createLedger(SessionId session_id,
                                                          LedgerConfig config) {
    std::scoped_lock lock(mutex_);
    if (ledgers_.count(session_id) > 0) {
        return nullptr;
    }

    auto ledger = std::make_shared<StockLedger>(std::move(config));
    if (logger_) {
        ledger->setLogger(logger_, session_id);
        audit::LogFields fields;
        fields.session_id = session_id;
        logger_->log("info", "ledger_created", "Stock ledger created", fields);
    }
    ledgers_.emplace(session_id, ledger);
    return ledger;
}

std::shared_ptr<StockLedger> LedgerRegistry::findLedger(SessionId session_id) const {
    std::scoped_lock lock(mutex_);
    auto it = ledgers_.find(session_id);
    if (it == ledgers_.end()) {
        return nullptr;
    }
    return it->second;
}

bool LedgerRegistry::removeLedger(SessionId session_id) {
    std::scoped_lock lock(mutex_);
    auto it = ledgers_.find(session_id);
    if (it == ledgers_.end()) {
        return false;
    }
    if (logger_) {
        audit::LogFields fields;
        fields.session_id = session_id;
        logger_->log("info", "ledger_removed", "Stock ledger removed", fields);
    }
    ledgers_.erase(it);
    return true;
}

std::size_t LedgerRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return ledgers_.size();
}

std::map<LedgerRegistry::SessionId, DailyReport> LedgerRegistry::processDailyOperations(
    Date today) {
    std::vector<std::pair<SessionId, std::shared_ptr<StockLedger>>> snapshot;
    {
        std::scoped_lock lock(mutex_);
        snapshot.assign(ledgers_.begin(), ledgers_.end());
    }

    std::map<SessionId, DailyReport> reports;
    for (auto &entry : snapshot) {
        reports.emplace(entry.first, entry.second->processDailyOperations(today));
    }
    return reports;
}

}  // namespace stock
