#include "stock/stock_models.h"

namespace stock {

Money ConsumeResult::costOfGoods() const {
    Money total = 0.0;
    for (const auto &portion : portions) {
        total += portion.quantity_taken * portion.unit_cost_ht;
    }
    return total;
}

const char *toString(LotStatus status) {
    switch (status) {
        case LotStatus::Fresh:
            return "fresh";
        case LotStatus::NearExpiry:
            return "near_expiry";
        case LotStatus::Promotion:
            return "promotion";
        case LotStatus::Expired:
            return "expired";
    }
    return "unknown";
}

const char *toString(WasteReason reason) {
    switch (reason) {
        case WasteReason::Expired:
            return "expired";
        case WasteReason::Degraded:
            return "degraded";
    }
    return "unknown";
}

const char *toString(LedgerError error) {
    switch (error) {
        case LedgerError::None:
            return "none";
        case LedgerError::NegativeQuantity:
            return "negative_quantity";
        case LedgerError::InvalidQuantity:
            return "invalid_quantity";
        case LedgerError::NegativeUnitCost:
            return "negative_unit_cost";
        case LedgerError::InvalidUnitCost:
            return "invalid_unit_cost";
        case LedgerError::ExpiryBeforePurchase:
            return "expiry_before_purchase";
        case LedgerError::InvalidDegradationRate:
            return "invalid_degradation_rate";
        case LedgerError::NonPositiveRequest:
            return "non_positive_request";
        case LedgerError::DayAlreadyProcessed:
            return "day_already_processed";
    }
    return "unknown";
}

}  // namespace stock
