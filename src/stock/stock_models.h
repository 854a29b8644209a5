#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "stock/calendar.h"

namespace stock {

using LotId = std::uint64_t;
using RecordId = std::uint64_t;
using IngredientId = std::string;
using SupplierId = std::string;
using Quantity = double;
using Money = double;

enum class LotStatus : std::uint8_t {
    Fresh,
    NearExpiry,
    Promotion,
    Expired
};

enum class WasteReason : std::uint8_t {
    Expired,
    Degraded
};

enum class StatusPrecedence : std::uint8_t {
    PromotionFirst,
    NearExpiryFirst
};

enum class LedgerError : std::uint8_t {
    None,
    NegativeQuantity,
    InvalidQuantity,
    NegativeUnitCost,
    InvalidUnitCost,
    ExpiryBeforePurchase,
    InvalidDegradationRate,
    NonPositiveRequest,
    DayAlreadyProcessed
};

struct LedgerConfig {
    int near_expiry_window_days{3};
    int promotion_window_days{3};
    Quantity promotion_min_quantity{1.0};
    int quantity_decimals{3};
    StatusPrecedence status_precedence{StatusPrecedence::PromotionFirst};
    // Multiplies the degradation rate once less than half the shelf life is left.
    double late_life_degradation_factor{1.0};
    double promotion_discount_rate{0.5};
};

struct LotParams {
    IngredientId ingredient_id;
    Quantity quantity{0.0};
    Money unit_cost_ht{0.0};
    Date purchase_date{};
    Date expiry_date{};
    SupplierId supplier_id;
    double quality_degradation_rate{0.0};
    std::optional<std::string> lot_number;
    std::optional<std::string> variant_id;
};

struct StockLot {
    LotId lot_id{0};
    IngredientId ingredient_id;
    SupplierId supplier_id;
    Date purchase_date{};
    Date expiry_date{};
    Money unit_cost_ht{0.0};
    double quality_degradation_rate{0.0};
    Quantity initial_quantity{0.0};
    Quantity quantity{0.0};
    std::optional<std::string> lot_number;
    std::optional<std::string> variant_id;

    Money totalValue() const { return quantity * unit_cost_ht; }
};

struct WasteRecord {
    RecordId record_id{0};
    LotId lot_id{0};
    IngredientId ingredient_id;
    Quantity quantity_lost{0.0};
    Money unit_cost_ht{0.0};
    WasteReason reason{WasteReason::Expired};
    Date event_date{};
    std::optional<std::string> lot_number;

    Money totalLossValue() const { return quantity_lost * unit_cost_ht; }
};

struct AddLotResult {
    LedgerError error{LedgerError::None};
    LotId lot_id{0};

    bool ok() const { return error == LedgerError::None; }
};

struct ConsumedPortion {
    LotId lot_id{0};
    Date expiry_date{};
    Quantity quantity_taken{0.0};
    Money unit_cost_ht{0.0};
};

struct ConsumeResult {
    LedgerError error{LedgerError::None};
    Quantity requested{0.0};
    Quantity obtained{0.0};
    std::vector<ConsumedPortion> portions;

    bool ok() const { return error == LedgerError::None; }
    Quantity shortfall() const { return requested - obtained; }
    Money costOfGoods() const;
};

struct DailyReport {
    LedgerError error{LedgerError::None};
    Date event_date{};
    std::size_t expired_lots{0};
    std::map<IngredientId, Quantity> degradation_losses;
    Money total_waste_value{0.0};
    std::vector<StockLot> lots_near_expiry;
    std::vector<StockLot> promotion_candidates;

    bool ok() const { return error == LedgerError::None; }
};

struct RotationAnalysis {
    std::size_t lots_count{0};
    Quantity total_quantity{0.0};
    double average_age_days{0.0};
    int oldest_lot_days{0};
    std::size_t near_expiry_count{0};
};

const char *toString(LotStatus status);
const char *toString(WasteReason reason);
const char *toString(LedgerError error);

}  // namespace stock
