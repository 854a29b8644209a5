#pragma once

#include "stock/stock_models.h"

namespace stock {

// Status is never stored on a lot. Every function here is a pure function of
// the lot, the caller's "today" and the ledger thresholds.

int daysUntilExpiry(const StockLot &lot, Date today);

// Remaining shelf life as a fraction of the lot's total shelf life, in [0, 1].
double shelfLifeRemaining(const StockLot &lot, Date today);

bool isExpired(const StockLot &lot, Date today);
bool isNearExpiry(const StockLot &lot, Date today, int warning_days);
bool isPromotionCandidate(const StockLot &lot, Date today, const LedgerConfig &config);

LotStatus deriveStatus(const StockLot &lot, Date today, const LedgerConfig &config);

Money promotionPrice(Money base_price, double discount_rate);

}  // namespace stock
