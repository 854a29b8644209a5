#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "audit/logging.h"
#include "stock/stock_ledger.h"

namespace stock {

// One independent ledger per game session. Ledgers never share lots, so the
// registry lock only guards the session map, never a ledger's contents.
class LedgerRegistry {
public:
    using SessionId = std::uint64_t;

    explicit LedgerRegistry(std::shared_ptr<audit::StructuredLogger> logger = nullptr);

    std::shared_ptr<StockLedger> createLedger(SessionId session_id,
                                              LedgerConfig config = LedgerConfig{});
    std::shared_ptr<StockLedger> findLedger(SessionId session_id) const;
    bool removeLedger(SessionId session_id);
    std::size_t size() const;

    // Runs the daily pass on every session ledger for the same simulated day.
    std::map<SessionId, DailyReport> processDailyOperations(Date today);

private:
    std::shared_ptr<audit::StructuredLogger> logger_;
    std::unordered_map<SessionId, std::shared_ptr<StockLedger>> ledgers_;
    mutable std::mutex mutex_;
};

}  // namespace stock
