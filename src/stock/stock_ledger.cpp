#include "stock/stock_ledger.h"

#include "stock/lot_status.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace stock {

StockLedger::StockLedger(LedgerConfig config) : config_(std::move(config)) {}

AddLotResult StockLedger::addLot(const LotParams &params) {
    std::scoped_lock lock(mutex_);
    AddLotResult result;
    result.error = validate(params);
    if (result.error != LedgerError::None) {
        audit::LogFields fields;
        fields.ingredient_id = params.ingredient_id;
        fields.quantity = params.quantity;
        fields.reason = toString(result.error);
        logEvent("warn", "lot_rejected", "Lot rejected by validation", std::move(fields));
        return result;
    }

    StockLot lot;
    lot.lot_id = next_lot_id_++;
    lot.ingredient_id = params.ingredient_id;
    lot.supplier_id = params.supplier_id;
    lot.purchase_date = params.purchase_date;
    lot.expiry_date = params.expiry_date;
    lot.unit_cost_ht = params.unit_cost_ht;
    lot.quality_degradation_rate = params.quality_degradation_rate;
    lot.initial_quantity = roundQuantity(params.quantity);
    lot.quantity = lot.initial_quantity;
    lot.lot_number = params.lot_number;
    lot.variant_id = params.variant_id;
    lots_.push_back(lot);
    result.lot_id = lot.lot_id;

    audit::LogFields fields;
    fields.ingredient_id = lot.ingredient_id;
    fields.lot_id = lot.lot_id;
    fields.quantity = lot.quantity;
    fields.unit_cost = lot.unit_cost_ht;
    fields.event_date = formatDate(lot.expiry_date);
    logEvent("info", "lot_added", "Lot received", std::move(fields));
    return result;
}

ConsumeResult StockLedger::consume(const IngredientId &ingredient_id,
                                   Quantity requested,
                                   Date today) {
    std::scoped_lock lock(mutex_);
    ConsumeResult result;
    result.requested = requested;
    if (!(requested > 0.0)) {
        result.error = LedgerError::NonPositiveRequest;
        result.requested = 0.0;
        audit::LogFields fields;
        fields.ingredient_id = ingredient_id;
        if (std::isfinite(requested)) {
            fields.requested = requested;
        }
        fields.reason = toString(result.error);
        logEvent("warn", "consume_rejected", "Consumption request rejected",
                 std::move(fields));
        return result;
    }

    std::vector<StockLot *> candidates;
    for (auto &lot : lots_) {
        if (lot.ingredient_id == ingredient_id && lot.quantity > 0.0 &&
            !isExpired(lot, today)) {
            candidates.push_back(&lot);
        }
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const StockLot *lhs, const StockLot *rhs) {
                  if (lhs->expiry_date != rhs->expiry_date) {
                      return lhs->expiry_date < rhs->expiry_date;
                  }
                  if (lhs->purchase_date != rhs->purchase_date) {
                      return lhs->purchase_date < rhs->purchase_date;
                  }
                  return lhs->lot_id < rhs->lot_id;
              });

    // Quantities stay on the configured precision grid so a drained lot is
    // exactly 0 rather than a residue of binary rounding.
    const Quantity wanted = roundQuantity(requested);
    result.requested = wanted;
    Quantity remaining = wanted;
    for (auto *lot : candidates) {
        if (remaining <= 0.0) {
            break;
        }
        const Quantity taken = roundQuantity(std::min(lot->quantity, remaining));
        if (taken <= 0.0) {
            continue;
        }
        lot->quantity = std::max(0.0, roundQuantity(lot->quantity - taken));
        remaining = std::max(0.0, roundQuantity(remaining - taken));
        result.obtained = roundQuantity(result.obtained + taken);
        result.portions.push_back(
            ConsumedPortion{lot->lot_id, lot->expiry_date, taken, lot->unit_cost_ht});
    }

    if (result.obtained < wanted) {
        audit::LogFields fields;
        fields.ingredient_id = ingredient_id;
        fields.requested = wanted;
        fields.quantity = result.obtained;
        fields.event_date = formatDate(today);
        logEvent("warn", "consume_shortfall", "Insufficient stock for request",
                 std::move(fields));
    }
    return result;
}

std::vector<StockLot> StockLedger::promotionCandidates(Date today) const {
    std::scoped_lock lock(mutex_);
    return promotionCandidatesLocked(today);
}

std::vector<StockLot> StockLedger::lotsNearExpiry(Date today,
                                                  std::optional<int> warning_days) const {
    std::scoped_lock lock(mutex_);
    return lotsNearExpiryLocked(today, warning_days.value_or(config_.near_expiry_window_days));
}

DailyReport StockLedger::processDailyOperations(Date today) {
    std::scoped_lock lock(mutex_);
    DailyReport report;
    report.event_date = today;

    const std::string trace_id = audit::StructuredLogger::generateTraceId();
    if (last_processed_ && today <= *last_processed_) {
        report.error = LedgerError::DayAlreadyProcessed;
        audit::LogFields fields;
        fields.trace_id = trace_id;
        fields.event_date = formatDate(today);
        fields.reason = toString(report.error);
        logEvent("warn", "daily_rejected", "Day already processed", std::move(fields));
        return report;
    }

    for (auto &lot : lots_) {
        if (isExpired(lot, today)) {
            const Quantity lost = lot.quantity;
            recordWaste(lot, lost, WasteReason::Expired, today);
            report.total_waste_value += lost * lot.unit_cost_ht;
            ++report.expired_lots;
            lot.quantity = 0.0;

            audit::LogFields fields;
            fields.trace_id = trace_id;
            fields.ingredient_id = lot.ingredient_id;
            fields.lot_id = lot.lot_id;
            fields.quantity = lost;
            fields.event_date = formatDate(today);
            fields.reason = toString(WasteReason::Expired);
            logEvent("info", "lot_expired", "Expired lot written off", std::move(fields));
            continue;
        }

        if (lot.quality_degradation_rate <= 0.0 || lot.quantity <= 0.0) {
            continue;
        }

        double rate = lot.quality_degradation_rate;
        if (shelfLifeRemaining(lot, today) < 0.5) {
            rate = std::min(1.0, rate * config_.late_life_degradation_factor);
        }
        const Quantity loss = std::min(lot.quantity, roundQuantity(lot.quantity * rate));
        if (loss <= 0.0) {
            continue;
        }
        lot.quantity = std::max(0.0, roundQuantity(lot.quantity - loss));
        recordWaste(lot, loss, WasteReason::Degraded, today);
        report.degradation_losses[lot.ingredient_id] += loss;
        report.total_waste_value += loss * lot.unit_cost_ht;

        audit::LogFields fields;
        fields.trace_id = trace_id;
        fields.ingredient_id = lot.ingredient_id;
        fields.lot_id = lot.lot_id;
        fields.quantity = loss;
        fields.event_date = formatDate(today);
        fields.reason = toString(WasteReason::Degraded);
        logEvent("info", "lot_degraded", "Degradation loss recorded", std::move(fields));
    }

    lots_.erase(std::remove_if(lots_.begin(), lots_.end(),
                               [today](const StockLot &lot) {
                                   return isExpired(lot, today);
                               }),
                lots_.end());
    last_processed_ = today;

    report.lots_near_expiry = lotsNearExpiryLocked(today, config_.near_expiry_window_days);
    report.promotion_candidates = promotionCandidatesLocked(today);

    audit::LogFields fields;
    fields.trace_id = trace_id;
    fields.count = report.expired_lots;
    fields.event_date = formatDate(today);
    logEvent("info", "daily_processed", "Daily stock operations processed",
             std::move(fields));
    return report;
}

std::vector<StockLot> StockLedger::lots() const {
    std::scoped_lock lock(mutex_);
    return lots_;
}

std::optional<StockLot> StockLedger::lot(LotId lot_id) const {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(lots_.begin(), lots_.end(),
                           [lot_id](const StockLot &lot) { return lot.lot_id == lot_id; });
    if (it == lots_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<LotStatus> StockLedger::lotStatus(LotId lot_id, Date today) const {
    auto found = lot(lot_id);
    if (!found) {
        return std::nullopt;
    }
    return deriveStatus(*found, today, config_);
}

std::vector<WasteRecord> StockLedger::wasteRecords() const {
    std::scoped_lock lock(mutex_);
    return waste_records_;
}

Quantity StockLedger::availableQuantity(const IngredientId &ingredient_id, Date today) const {
    std::scoped_lock lock(mutex_);
    Quantity total = 0.0;
    for (const auto &lot : lots_) {
        if (lot.ingredient_id == ingredient_id && !isExpired(lot, today)) {
            total += lot.quantity;
        }
    }
    return total;
}

Money StockLedger::stockValue(Date today, const std::optional<IngredientId> &ingredient_id) const {
    std::scoped_lock lock(mutex_);
    Money total = 0.0;
    for (const auto &lot : lots_) {
        if (ingredient_id && lot.ingredient_id != *ingredient_id) {
            continue;
        }
        if (!isExpired(lot, today)) {
            total += lot.totalValue();
        }
    }
    return total;
}

Money StockLedger::totalWasteValue() const {
    std::scoped_lock lock(mutex_);
    Money total = 0.0;
    for (const auto &record : waste_records_) {
        total += record.totalLossValue();
    }
    return total;
}

Money StockLedger::wasteValueByReason(WasteReason reason) const {
    std::scoped_lock lock(mutex_);
    Money total = 0.0;
    for (const auto &record : waste_records_) {
        if (record.reason == reason) {
            total += record.totalLossValue();
        }
    }
    return total;
}

RotationAnalysis StockLedger::rotationAnalysis(const IngredientId &ingredient_id,
                                               Date today) const {
    std::scoped_lock lock(mutex_);
    RotationAnalysis analysis;
    int total_age = 0;
    for (const auto &lot : lots_) {
        if (lot.ingredient_id != ingredient_id) {
            continue;
        }
        const int age = daysBetween(lot.purchase_date, today);
        total_age += age;
        analysis.oldest_lot_days = std::max(analysis.oldest_lot_days, age);
        analysis.total_quantity += lot.quantity;
        ++analysis.lots_count;
        if (lot.quantity > 0.0 &&
            isNearExpiry(lot, today, config_.near_expiry_window_days)) {
            ++analysis.near_expiry_count;
        }
    }
    if (analysis.lots_count > 0) {
        analysis.average_age_days =
            static_cast<double>(total_age) / static_cast<double>(analysis.lots_count);
    }
    return analysis;
}

std::optional<Date> StockLedger::lastProcessedDate() const {
    std::scoped_lock lock(mutex_);
    return last_processed_;
}

const LedgerConfig &StockLedger::config() const {
    return config_;
}

Money StockLedger::promotionPriceFor(Money base_price) const {
    return promotionPrice(base_price, config_.promotion_discount_rate);
}

void StockLedger::setLogger(std::shared_ptr<audit::StructuredLogger> logger,
                            std::uint64_t session_id) {
    std::scoped_lock lock(mutex_);
    logger_ = std::move(logger);
    session_id_ = session_id;
}

LedgerError StockLedger::validate(const LotParams &params) const {
    if (!std::isfinite(params.quantity)) {
        return LedgerError::InvalidQuantity;
    }
    if (params.quantity < 0.0) {
        return LedgerError::NegativeQuantity;
    }
    if (!std::isfinite(params.unit_cost_ht)) {
        return LedgerError::InvalidUnitCost;
    }
    if (params.unit_cost_ht < 0.0) {
        return LedgerError::NegativeUnitCost;
    }
    if (params.expiry_date < params.purchase_date) {
        return LedgerError::ExpiryBeforePurchase;
    }
    if (!(params.quality_degradation_rate >= 0.0 && params.quality_degradation_rate <= 1.0)) {
        return LedgerError::InvalidDegradationRate;
    }
    return LedgerError::None;
}

std::vector<StockLot> StockLedger::promotionCandidatesLocked(Date today) const {
    std::vector<StockLot> result;
    for (const auto &lot : lots_) {
        if (lot.quantity > 0.0 && isPromotionCandidate(lot, today, config_)) {
            result.push_back(lot);
        }
    }
    return result;
}

std::vector<StockLot> StockLedger::lotsNearExpiryLocked(Date today, int warning_days) const {
    std::vector<StockLot> result;
    for (const auto &lot : lots_) {
        if (lot.quantity > 0.0 && isNearExpiry(lot, today, warning_days)) {
            result.push_back(lot);
        }
    }
    return result;
}

Quantity StockLedger::roundQuantity(Quantity value) const {
    const double scale = std::pow(10.0, config_.quantity_decimals);
    const double scaled = value * scale;
    if (!std::isfinite(scaled)) {
        return value;
    }
    return std::round(scaled) / scale;
}

void StockLedger::recordWaste(const StockLot &lot,
                              Quantity quantity_lost,
                              WasteReason reason,
                              Date event_date) {
    WasteRecord record;
    record.record_id = next_record_id_++;
    record.lot_id = lot.lot_id;
    record.ingredient_id = lot.ingredient_id;
    record.quantity_lost = quantity_lost;
    record.unit_cost_ht = lot.unit_cost_ht;
    record.reason = reason;
    record.event_date = event_date;
    record.lot_number = lot.lot_number;
    waste_records_.push_back(std::move(record));
}

void StockLedger::logEvent(const std::string &level,
                           const std::string &event,
                           const std::string &message,
                           audit::LogFields fields) const {
    if (!logger_) {
        return;
    }
    if (session_id_ != 0) {
        fields.session_id = session_id_;
    }
    logger_->log(level, event, message, fields);
}

}  // namespace stock
