#include "stock/lot_status.h"

#include <algorithm>

namespace stock {

int daysUntilExpiry(const StockLot &lot, Date today) {
    return daysBetween(today, lot.expiry_date);
}

double shelfLifeRemaining(const StockLot &lot, Date today) {
    const int total_days = daysBetween(lot.purchase_date, lot.expiry_date);
    if (total_days <= 0) {
        return 0.0;
    }
    const int remaining_days = std::max(0, daysUntilExpiry(lot, today));
    return std::min(1.0, static_cast<double>(remaining_days) / total_days);
}

bool isExpired(const StockLot &lot, Date today) {
    return lot.expiry_date < today;
}

bool isNearExpiry(const StockLot &lot, Date today, int warning_days) {
    const int days_left = daysUntilExpiry(lot, today);
    return days_left >= 0 && days_left <= warning_days;
}

bool isPromotionCandidate(const StockLot &lot, Date today, const LedgerConfig &config) {
    return isNearExpiry(lot, today, config.promotion_window_days) &&
           lot.quantity >= config.promotion_min_quantity;
}

LotStatus deriveStatus(const StockLot &lot, Date today, const LedgerConfig &config) {
    if (isExpired(lot, today)) {
        return LotStatus::Expired;
    }

    const bool promotion = isPromotionCandidate(lot, today, config);
    const bool near_expiry = isNearExpiry(lot, today, config.near_expiry_window_days);
    switch (config.status_precedence) {
        case StatusPrecedence::PromotionFirst:
            if (promotion) {
                return LotStatus::Promotion;
            }
            if (near_expiry) {
                return LotStatus::NearExpiry;
            }
            break;
        case StatusPrecedence::NearExpiryFirst:
            if (near_expiry) {
                return LotStatus::NearExpiry;
            }
            if (promotion) {
                return LotStatus::Promotion;
            }
            break;
    }
    return LotStatus::Fresh;
}

Money promotionPrice(Money base_price, double discount_rate) {
    const double rate = std::clamp(discount_rate, 0.0, 1.0);
    return base_price * (1.0 - rate);
}

}  // namespace stock
