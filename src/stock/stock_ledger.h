#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "audit/logging.h"
#include "stock/stock_models.h"

namespace stock {

// Owns every lot of one session's stock and the append-only waste log.
// All public calls take the same lock for their whole duration, so a FEFO
// drain or a daily pass is atomic with respect to every other call.
class StockLedger {
public:
    explicit StockLedger(LedgerConfig config = LedgerConfig{});

    StockLedger(const StockLedger &) = delete;
    StockLedger &operator=(const StockLedger &) = delete;

    AddLotResult addLot(const LotParams &params);

    ConsumeResult consume(const IngredientId &ingredient_id,
                          Quantity requested,
                          Date today);

    std::vector<StockLot> promotionCandidates(Date today) const;
    std::vector<StockLot> lotsNearExpiry(Date today,
                                         std::optional<int> warning_days = std::nullopt) const;

    // Must be called once per advancing day; a date not after the last
    // processed one is rejected with DayAlreadyProcessed.
    DailyReport processDailyOperations(Date today);

    std::vector<StockLot> lots() const;
    std::optional<StockLot> lot(LotId lot_id) const;
    std::optional<LotStatus> lotStatus(LotId lot_id, Date today) const;
    std::vector<WasteRecord> wasteRecords() const;

    Quantity availableQuantity(const IngredientId &ingredient_id, Date today) const;
    // Value of non-expired stock, for one ingredient or the whole ledger.
    Money stockValue(Date today,
                     const std::optional<IngredientId> &ingredient_id = std::nullopt) const;
    Money totalWasteValue() const;
    Money wasteValueByReason(WasteReason reason) const;
    RotationAnalysis rotationAnalysis(const IngredientId &ingredient_id, Date today) const;
    std::optional<Date> lastProcessedDate() const;

    const LedgerConfig &config() const;
    Money promotionPriceFor(Money base_price) const;

    void setLogger(std::shared_ptr<audit::StructuredLogger> logger,
                   std::uint64_t session_id = 0);

private:
    LedgerError validate(const LotParams &params) const;
    std::vector<StockLot> promotionCandidatesLocked(Date today) const;
    std::vector<StockLot> lotsNearExpiryLocked(Date today, int warning_days) const;
    Quantity roundQuantity(Quantity value) const;
    void recordWaste(const StockLot &lot,
                     Quantity quantity_lost,
                     WasteReason reason,
                     Date event_date);
    void logEvent(const std::string &level,
                  const std::string &event,
                  const std::string &message,
                  audit::LogFields fields) const;

    LedgerConfig config_;
    LotId next_lot_id_{1};
    RecordId next_record_id_{1};
    std::vector<StockLot> lots_;
    std::vector<WasteRecord> waste_records_;
    std::optional<Date> last_processed_;
    std::shared_ptr<audit::StructuredLogger> logger_;
    std::uint64_t session_id_{0};
    mutable std::mutex mutex_;
};

}  // namespace stock
