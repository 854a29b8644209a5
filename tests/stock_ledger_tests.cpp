#include "stock/calendar.h"
#include "stock/lot_status.h"
#include "stock/stock_ledger.h"

#include <cassert>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace {

const stock::Date kToday = stock::makeDate(2025, 3, 10);

stock::LotParams lotParams(const std::string &ingredient_id,
                           double quantity,
                           int purchased_days_ago,
                           int expires_in_days,
                           double unit_cost = 1.0) {
    stock::LotParams params;
    params.ingredient_id = ingredient_id;
    params.quantity = quantity;
    params.unit_cost_ht = unit_cost;
    params.purchase_date = stock::addDays(kToday, -purchased_days_ago);
    params.expiry_date = stock::addDays(kToday, expires_in_days);
    params.supplier_id = "sup1";
    return params;
}

bool near(double lhs, double rhs) {
    return std::fabs(lhs - rhs) < 1e-9;
}

}  // namespace

int main() {
    {
        // tomato: drained in expiry order
        stock::StockLedger ledger;
        auto first = ledger.addLot(lotParams("tomato", 10.0, 0, 1));
        auto second = ledger.addLot(lotParams("tomato", 10.0, 0, 5));
        assert(first.ok() && second.ok());
        assert(first.lot_id < second.lot_id);

        auto result = ledger.consume("tomato", 15.0, kToday);
        assert(result.ok());
        assert(near(result.obtained, 15.0));
        assert(near(result.shortfall(), 0.0));
        assert(result.portions.size() == 2);
        assert(result.portions[0].lot_id == first.lot_id);
        assert(near(result.portions[0].quantity_taken, 10.0));
        assert(result.portions[1].lot_id == second.lot_id);
        assert(near(result.portions[1].quantity_taken, 5.0));
        assert(result.portions[0].expiry_date <= result.portions[1].expiry_date);

        assert(near(ledger.lot(first.lot_id)->quantity, 0.0));
        assert(near(ledger.lot(second.lot_id)->quantity, 5.0));
        // drained lots stay until they expire
        assert(ledger.lots().size() == 2);
    }

    {
        // insertion order does not matter, expiry does
        stock::StockLedger ledger;
        auto late = ledger.addLot(lotParams("flour", 4.0, 0, 9, 0.8));
        auto early = ledger.addLot(lotParams("flour", 4.0, 0, 2, 0.5));
        auto middle = ledger.addLot(lotParams("flour", 4.0, 0, 6, 0.6));

        auto result = ledger.consume("flour", 10.0, kToday);
        assert(result.portions.size() == 3);
        assert(result.portions[0].lot_id == early.lot_id);
        assert(result.portions[1].lot_id == middle.lot_id);
        assert(result.portions[2].lot_id == late.lot_id);
        assert(near(result.portions[2].quantity_taken, 2.0));

        double taken = 0.0;
        for (const auto &portion : result.portions) {
            taken += portion.quantity_taken;
        }
        assert(near(taken, result.obtained));
        assert(near(result.costOfGoods(), 4.0 * 0.5 + 4.0 * 0.6 + 2.0 * 0.8));
    }

    {
        // same expiry: older purchase first, then creation order
        stock::StockLedger ledger;
        auto newer = ledger.addLot(lotParams("rice", 3.0, 1, 10));
        auto older = ledger.addLot(lotParams("rice", 3.0, 4, 10));
        auto older_twin = ledger.addLot(lotParams("rice", 3.0, 4, 10));

        auto result = ledger.consume("rice", 7.0, kToday);
        assert(result.portions.size() == 3);
        assert(result.portions[0].lot_id == older.lot_id);
        assert(result.portions[1].lot_id == older_twin.lot_id);
        assert(result.portions[2].lot_id == newer.lot_id);
        assert(near(ledger.lot(newer.lot_id)->quantity, 2.0));
    }

    {
        // shortfall is not an error
        stock::StockLedger ledger;
        ledger.addLot(lotParams("cheese", 2.5, 0, 4));
        auto result = ledger.consume("cheese", 4.0, kToday);
        assert(result.ok());
        assert(near(result.obtained, 2.5));
        assert(near(result.shortfall(), 1.5));
        assert(result.obtained <= result.requested);

        auto again = ledger.consume("cheese", 1.0, kToday);
        assert(again.ok());
        assert(near(again.obtained, 0.0));
        assert(again.portions.empty());
    }

    {
        stock::StockLedger ledger;
        auto result = ledger.consume("unknown", 3.0, kToday);
        assert(result.ok());
        assert(result.obtained == 0.0);
        assert(result.portions.empty());
    }

    {
        // non-positive requests leave stock untouched
        stock::StockLedger ledger;
        auto added = ledger.addLot(lotParams("egg", 12.0, 0, 10));
        auto zero = ledger.consume("egg", 0.0, kToday);
        assert(zero.error == stock::LedgerError::NonPositiveRequest);
        auto negative = ledger.consume("egg", -3.0, kToday);
        assert(negative.error == stock::LedgerError::NonPositiveRequest);
        auto nan = ledger.consume("egg", std::numeric_limits<double>::quiet_NaN(), kToday);
        assert(nan.error == stock::LedgerError::NonPositiveRequest);
        assert(negative.portions.empty());
        assert(near(ledger.lot(added.lot_id)->quantity, 12.0));
    }

    {
        // expired lots are never consumed, even before the daily pass
        stock::StockLedger ledger;
        ledger.addLot(lotParams("cream", 5.0, 6, -1));
        auto fresh = ledger.addLot(lotParams("cream", 2.0, 1, 3));
        auto result = ledger.consume("cream", 4.0, kToday);
        assert(near(result.obtained, 2.0));
        assert(result.portions.size() == 1);
        assert(result.portions[0].lot_id == fresh.lot_id);
        assert(near(ledger.availableQuantity("cream", kToday), 0.0));
    }

    {
        stock::StockLedger ledger;
        assert(ledger.addLot(lotParams("oil", -1.0, 0, 5)).error ==
               stock::LedgerError::NegativeQuantity);
        assert(ledger.addLot(lotParams("oil", 1.0, 0, 5, -0.1)).error ==
               stock::LedgerError::NegativeUnitCost);
        assert(ledger.addLot(lotParams("oil", 1.0, 0, -1)).error ==
               stock::LedgerError::ExpiryBeforePurchase);

        auto bad_rate = lotParams("oil", 1.0, 0, 5);
        bad_rate.quality_degradation_rate = 1.5;
        assert(ledger.addLot(bad_rate).error == stock::LedgerError::InvalidDegradationRate);
        bad_rate.quality_degradation_rate = -0.1;
        assert(ledger.addLot(bad_rate).error == stock::LedgerError::InvalidDegradationRate);

        const double inf = std::numeric_limits<double>::infinity();
        const double nan = std::numeric_limits<double>::quiet_NaN();
        auto unbounded = lotParams("oil", inf, 0, 5);
        unbounded.quality_degradation_rate = 0.1;
        assert(ledger.addLot(unbounded).error == stock::LedgerError::InvalidQuantity);
        assert(ledger.addLot(lotParams("oil", nan, 0, 5)).error ==
               stock::LedgerError::InvalidQuantity);
        assert(ledger.addLot(lotParams("oil", 1.0, 0, 5, inf)).error ==
               stock::LedgerError::InvalidUnitCost);
        assert(ledger.addLot(lotParams("oil", 1.0, 0, 5, nan)).error ==
               stock::LedgerError::InvalidUnitCost);
        assert(near(ledger.consume("oil", 1e300, kToday).obtained, 0.0));

        assert(ledger.lots().empty());

        // same-day expiry and zero quantity are accepted
        auto same_day = ledger.addLot(lotParams("oil", 0.0, 0, 0));
        assert(same_day.ok());
        assert(ledger.lots().size() == 1);
    }

    {
        // draining lots leaves exact zeros, not binary residue
        stock::StockLedger ledger;
        auto first = ledger.addLot(lotParams("pepper", 0.1, 0, 2));
        auto second = ledger.addLot(lotParams("pepper", 0.2, 0, 3));
        auto result = ledger.consume("pepper", 0.3, kToday);
        assert(result.portions.size() == 2);
        assert(result.obtained <= result.requested);
        assert(near(result.shortfall(), 0.0));
        assert(ledger.lot(first.lot_id)->quantity == 0.0);
        assert(ledger.lot(second.lot_id)->quantity == 0.0);
        assert(ledger.lotsNearExpiry(kToday, 30).empty());
        assert(near(ledger.availableQuantity("pepper", kToday), 0.0));

        auto next = ledger.consume("pepper", 0.1, kToday);
        assert(next.portions.empty());
        assert(next.obtained == 0.0);
    }

    {
        // requests are taken on the same precision as stock
        stock::StockLedger ledger;
        auto added = ledger.addLot(lotParams("pepper", 1.0, 0, 4));
        auto result = ledger.consume("pepper", 0.9996, kToday);
        assert(near(result.requested, 1.0));
        assert(near(result.obtained, 1.0));
        assert(ledger.lot(added.lot_id)->quantity == 0.0);
    }

    {
        stock::StockLedger ledger;
        auto params = lotParams("butter", 6.0, 2, 8, 3.5);
        params.lot_number = "B-0042";
        params.variant_id = "organic";
        auto added = ledger.addLot(params);
        auto lot = ledger.lot(added.lot_id);
        assert(lot.has_value());
        assert(lot->ingredient_id == "butter");
        assert(lot->supplier_id == "sup1");
        assert(lot->lot_number == std::optional<std::string>{"B-0042"});
        assert(lot->variant_id == std::optional<std::string>{"organic"});
        assert(near(lot->initial_quantity, 6.0));
        assert(near(lot->totalValue(), 21.0));
        assert(!ledger.lot(added.lot_id + 100).has_value());
        assert(ledger.lotStatus(added.lot_id, kToday) == stock::LotStatus::Fresh);
        assert(!ledger.lotStatus(added.lot_id + 100, kToday).has_value());
    }

    {
        // salad: flagged for promotion and near expiry
        stock::StockLedger ledger;
        auto added = ledger.addLot(lotParams("salad", 5.0, 7, 3, 2.0));

        auto promos = ledger.promotionCandidates(kToday);
        assert(promos.size() == 1);
        assert(promos[0].lot_id == added.lot_id);

        auto near_expiry = ledger.lotsNearExpiry(kToday, 3);
        assert(near_expiry.size() == 1);
        assert(near_expiry[0].lot_id == added.lot_id);

        auto status = ledger.lotStatus(added.lot_id, kToday);
        assert(status == stock::LotStatus::NearExpiry || status == stock::LotStatus::Promotion);
    }

    {
        stock::LedgerConfig config;
        config.near_expiry_window_days = 2;
        config.promotion_window_days = 4;
        config.promotion_min_quantity = 3.0;
        stock::StockLedger ledger(config);
        auto small = ledger.addLot(lotParams("herb", 1.0, 1, 2));
        auto large = ledger.addLot(lotParams("herb", 8.0, 1, 4));
        auto far = ledger.addLot(lotParams("herb", 8.0, 1, 12));
        auto empty = ledger.addLot(lotParams("herb", 4.0, 1, 1));
        ledger.consume("herb", 4.0, kToday);
        assert(near(ledger.lot(empty.lot_id)->quantity, 0.0));

        auto promos = ledger.promotionCandidates(kToday);
        assert(promos.size() == 1);
        assert(promos[0].lot_id == large.lot_id);

        auto near_default = ledger.lotsNearExpiry(kToday);
        assert(near_default.size() == 1);
        assert(near_default[0].lot_id == small.lot_id);

        auto near_wide = ledger.lotsNearExpiry(kToday, 30);
        assert(near_wide.size() == 3);
        assert(near_wide[2].lot_id == far.lot_id);

        // queries are read-only and repeatable
        auto promos_again = ledger.promotionCandidates(kToday);
        assert(promos_again.size() == promos.size());
        assert(promos_again[0].lot_id == promos[0].lot_id);
        assert(near(promos_again[0].quantity, promos[0].quantity));
        assert(ledger.lotsNearExpiry(kToday).size() == near_default.size());
        assert(ledger.wasteRecords().empty());
        assert(near(ledger.promotionPriceFor(12.0), 6.0));
    }

    {
        stock::StockLedger ledger;
        ledger.addLot(lotParams("potato", 10.0, 6, 20));
        ledger.addLot(lotParams("potato", 5.0, 2, 2));
        ledger.addLot(lotParams("onion", 5.0, 9, 20));
        assert(near(ledger.availableQuantity("potato", kToday), 15.0));

        auto analysis = ledger.rotationAnalysis("potato", kToday);
        assert(analysis.lots_count == 2);
        assert(near(analysis.total_quantity, 15.0));
        assert(analysis.oldest_lot_days == 6);
        assert(near(analysis.average_age_days, 4.0));
        assert(analysis.near_expiry_count == 1);

        // stock value counts only lots that have not expired
        ledger.addLot(lotParams("onion", 2.0, 9, -1, 4.0));
        assert(near(ledger.stockValue(kToday, std::string("potato")), 15.0));
        assert(near(ledger.stockValue(kToday, std::string("onion")), 5.0));
        assert(near(ledger.stockValue(kToday), 20.0));
        assert(near(ledger.stockValue(kToday, std::string("leek")), 0.0));
        assert(near(ledger.stockValue(stock::addDays(kToday, 3)), 15.0));

        auto none = ledger.rotationAnalysis("leek", kToday);
        assert(none.lots_count == 0);
        assert(none.average_age_days == 0.0);
    }

    return 0;
}
