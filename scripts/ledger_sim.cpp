#include "audit/logging.h"
#include "stock/calendar.h"
#include "stock/ledger_registry.h"
#include "stock/stock_ledger.h"

#include <atomic>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct Options {
    std::size_t sessions{2};
    std::size_t days{14};
    std::size_t consumers{4};
    std::size_t delivery_every_days{3};
    std::uint32_t seed{7};
    std::string start_date{"2025-01-06"};
    int near_expiry_days{3};
    int promotion_days{3};
    double promotion_min_qty{1.0};
    int decimals{3};
    std::string log_path{"docs/ledger_run.log"};
    std::string summary_path{"docs/ledger_summary.md"};
};

struct IngredientProfile {
    std::string ingredient_id;
    std::string supplier_id;
    double delivery_quantity{0.0};
    double unit_cost{0.0};
    int shelf_life_days{0};
    double degradation_rate{0.0};
    double max_daily_demand{0.0};
};

struct SessionTotals {
    double received{0.0};
    double requested{0.0};
    double consumed{0.0};
    double cost_of_goods{0.0};
    double shortfall{0.0};
    std::size_t expired_lots{0};
    std::size_t rejected_days{0};
};

const std::vector<IngredientProfile> &profiles() {
    static const std::vector<IngredientProfile> kProfiles = {
        {"tomato", "sup-market", 20.0, 1.2, 5, 0.02, 6.0},
        {"salad", "sup-market", 12.0, 2.0, 4, 0.05, 4.0},
        {"milk", "sup-dairy", 15.0, 1.5, 7, 0.0, 5.0},
        {"beef", "sup-butcher", 8.0, 9.5, 3, 0.0, 3.0},
    };
    return kProfiles;
}

void printUsage(const char *argv0) {
    std::cout
        << "Usage: " << argv0
        << " [--sessions N] [--days N] [--consumers N] [--delivery-every N]"
        << " [--seed N] [--start-date YYYY-MM-DD] [--near-expiry-days N]"
        << " [--promotion-days N] [--promotion-min-qty Q] [--decimals N]"
        << " [--log-path PATH] [--summary-path PATH]\n";
}

std::optional<std::size_t> parseSize(const char *value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    try {
        std::size_t idx = 0;
        std::string text(value);
        std::size_t result = std::stoull(text, &idx, 10);
        if (idx != text.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::optional<double> parseReal(const char *value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    try {
        std::size_t idx = 0;
        std::string text(value);
        double result = std::stod(text, &idx);
        if (idx != text.size() || !std::isfinite(result)) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

Options parseArgs(int argc, char **argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto nextValue = [&]() -> const char * {
            if (i + 1 >= argc) {
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--sessions") {
            if (auto value = parseSize(nextValue())) {
                options.sessions = *value;
            }
        } else if (arg == "--days") {
            if (auto value = parseSize(nextValue())) {
                options.days = *value;
            }
        } else if (arg == "--consumers") {
            if (auto value = parseSize(nextValue())) {
                options.consumers = *value == 0 ? 1 : *value;
            }
        } else if (arg == "--delivery-every") {
            if (auto value = parseSize(nextValue())) {
                options.delivery_every_days = *value == 0 ? 1 : *value;
            }
        } else if (arg == "--seed") {
            if (auto value = parseSize(nextValue())) {
                options.seed = static_cast<std::uint32_t>(*value);
            }
        } else if (arg == "--start-date") {
            if (auto value = nextValue()) {
                options.start_date = value;
            }
        } else if (arg == "--near-expiry-days") {
            if (auto value = parseSize(nextValue())) {
                options.near_expiry_days = static_cast<int>(*value);
            }
        } else if (arg == "--promotion-days") {
            if (auto value = parseSize(nextValue())) {
                options.promotion_days = static_cast<int>(*value);
            }
        } else if (arg == "--promotion-min-qty") {
            if (auto value = parseReal(nextValue())) {
                options.promotion_min_qty = *value;
            }
        } else if (arg == "--decimals") {
            if (auto value = parseSize(nextValue())) {
                options.decimals = static_cast<int>(*value);
            }
        } else if (arg == "--log-path") {
            if (auto value = nextValue()) {
                options.log_path = value;
            }
        } else if (arg == "--summary-path") {
            if (auto value = nextValue()) {
                options.summary_path = value;
            }
        }
    }
    return options;
}

void ensureParentDir(const std::string &path) {
    if (path.empty()) {
        return;
    }
    std::filesystem::path target(path);
    auto parent = target.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

void receiveDeliveries(stock::StockLedger &ledger, stock::Date today, SessionTotals &totals) {
    for (const auto &profile : profiles()) {
        stock::LotParams params;
        params.ingredient_id = profile.ingredient_id;
        params.supplier_id = profile.supplier_id;
        params.quantity = profile.delivery_quantity;
        params.unit_cost_ht = profile.unit_cost;
        params.purchase_date = today;
        params.expiry_date = stock::addDays(today, profile.shelf_life_days);
        params.quality_degradation_rate = profile.degradation_rate;
        params.lot_number = profile.ingredient_id + "-" + stock::formatDate(today);
        auto result = ledger.addLot(params);
        if (result.ok()) {
            totals.received += ledger.lot(result.lot_id)->initial_quantity;
        }
    }
}

double remainingStock(const stock::StockLedger &ledger) {
    double total = 0.0;
    for (const auto &lot : ledger.lots()) {
        total += lot.quantity;
    }
    return total;
}

double wastedQuantity(const stock::StockLedger &ledger) {
    double total = 0.0;
    for (const auto &record : ledger.wasteRecords()) {
        total += record.quantity_lost;
    }
    return total;
}

}  // namespace

int main(int argc, char **argv) {
    Options options = parseArgs(argc, argv);

    stock::Date start{};
    if (!stock::parseDate(options.start_date, start)) {
        std::cerr << "Invalid --start-date: " << options.start_date << std::endl;
        return 1;
    }

    std::ofstream log_file;
    if (!options.log_path.empty()) {
        ensureParentDir(options.log_path);
        log_file.open(options.log_path, std::ios::out | std::ios::trunc);
        if (!log_file) {
            std::cerr << "Failed to open log file: " << options.log_path << std::endl;
            return 1;
        }
    }
    if (!options.summary_path.empty()) {
        ensureParentDir(options.summary_path);
    }

    auto logger = log_file.is_open()
                      ? std::make_shared<audit::StructuredLogger>(log_file)
                      : std::make_shared<audit::StructuredLogger>();

    stock::LedgerConfig config;
    config.near_expiry_window_days = options.near_expiry_days;
    config.promotion_window_days = options.promotion_days;
    config.promotion_min_quantity = options.promotion_min_qty;
    config.quantity_decimals = options.decimals;

    stock::LedgerRegistry registry(logger);
    std::map<stock::LedgerRegistry::SessionId, SessionTotals> totals;
    for (std::size_t i = 0; i < options.sessions; ++i) {
        const auto session_id = static_cast<stock::LedgerRegistry::SessionId>(i + 1);
        if (!registry.createLedger(session_id, config)) {
            std::cerr << "Failed to create ledger for session " << session_id << std::endl;
            return 1;
        }
        totals[session_id] = SessionTotals{};
    }

    std::mt19937 rng(options.seed);
    std::mutex totals_mutex;
    std::atomic<std::size_t> consume_calls{0};
    std::size_t promotion_flags = 0;

    for (std::size_t day = 0; day < options.days; ++day) {
        const stock::Date today = stock::addDays(start, static_cast<int>(day));

        if (day % options.delivery_every_days == 0) {
            for (auto &entry : totals) {
                receiveDeliveries(*registry.findLedger(entry.first), today, entry.second);
            }
        }

        // Demand is drawn up front so the run stays reproducible for a seed,
        // whatever order the consumer threads happen to run in.
        struct Request {
            stock::LedgerRegistry::SessionId session_id;
            std::string ingredient_id;
            double quantity;
        };
        std::vector<Request> requests;
        for (const auto &entry : totals) {
            for (const auto &profile : profiles()) {
                std::uniform_real_distribution<double> demand(0.5, profile.max_daily_demand);
                for (std::size_t c = 0; c < options.consumers; ++c) {
                    const double quantity =
                        std::round(demand(rng) / static_cast<double>(options.consumers) * 100.0) /
                        100.0;
                    requests.push_back(Request{entry.first, profile.ingredient_id, quantity});
                }
            }
        }

        std::vector<std::future<void>> futures;
        futures.reserve(options.consumers);
        for (std::size_t c = 0; c < options.consumers; ++c) {
            futures.emplace_back(std::async(std::launch::async, [&, c]() {
                for (std::size_t r = c; r < requests.size(); r += options.consumers) {
                    const auto &request = requests[r];
                    auto ledger = registry.findLedger(request.session_id);
                    if (!ledger) {
                        continue;
                    }
                    auto result = ledger->consume(request.ingredient_id, request.quantity, today);
                    consume_calls.fetch_add(1, std::memory_order_relaxed);
                    if (!result.ok()) {
                        continue;
                    }
                    std::lock_guard<std::mutex> lock(totals_mutex);
                    auto &session_totals = totals[request.session_id];
                    session_totals.requested += result.requested;
                    session_totals.consumed += result.obtained;
                    session_totals.cost_of_goods += result.costOfGoods();
                    session_totals.shortfall += result.shortfall();
                }
            }));
        }
        for (auto &future : futures) {
            future.get();
        }

        // Waste for a day is booked at the start of the next one.
        const stock::Date close = stock::addDays(today, 1);
        for (const auto &report : registry.processDailyOperations(close)) {
            auto &session_totals = totals[report.first];
            if (!report.second.ok()) {
                session_totals.rejected_days += 1;
                continue;
            }
            session_totals.expired_lots += report.second.expired_lots;
            promotion_flags += report.second.promotion_candidates.size();
        }
    }

    if (log_file) {
        log_file.flush();
    }

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(3);
    summary << "# Stock Ledger Simulation Summary\n\n";
    summary << "Generated by `scripts/ledger_sim.cpp`.\n\n";
    summary << "## Command\n";
    summary << "```bash\n";
    summary << "./build/lotledger_sim";
    summary << " --sessions " << options.sessions;
    summary << " --days " << options.days;
    summary << " --consumers " << options.consumers;
    summary << " --delivery-every " << options.delivery_every_days;
    summary << " --seed " << options.seed;
    summary << " --start-date " << options.start_date;
    summary << " --near-expiry-days " << options.near_expiry_days;
    summary << " --promotion-days " << options.promotion_days;
    summary << " --promotion-min-qty " << options.promotion_min_qty;
    summary << " --decimals " << options.decimals;
    if (!options.log_path.empty()) {
        summary << " --log-path " << options.log_path;
    }
    if (!options.summary_path.empty()) {
        summary << " --summary-path " << options.summary_path;
    }
    summary << "\n```\n\n";

    summary << "## Run\n";
    summary << "- Simulated days: " << options.days << "\n";
    summary << "- Consume calls: " << consume_calls.load() << "\n";
    summary << "- Promotion flags raised: " << promotion_flags << "\n\n";

    bool conservation_passed = true;
    summary << "## Sessions\n";
    for (const auto &entry : totals) {
        auto ledger = registry.findLedger(entry.first);
        const auto &session_totals = entry.second;
        const double remaining = remainingStock(*ledger);
        const double wasted = wastedQuantity(*ledger);
        const double balance = session_totals.received - session_totals.consumed - wasted -
                               remaining;
        const bool balanced = std::fabs(balance) < 1e-6;
        conservation_passed = conservation_passed && balanced;

        summary << "- Session " << entry.first << "\n";
        summary << "  - Received: " << session_totals.received << "\n";
        summary << "  - Requested: " << session_totals.requested << "\n";
        summary << "  - Consumed: " << session_totals.consumed << "\n";
        summary << "  - Shortfall: " << session_totals.shortfall << "\n";
        summary << "  - Cost of goods: " << session_totals.cost_of_goods << "\n";
        summary << "  - Expired lots: " << session_totals.expired_lots << "\n";
        summary << "  - Wasted quantity: " << wasted << "\n";
        summary << "  - Waste value: " << ledger->totalWasteValue() << "\n";
        summary << "  - Remaining stock: " << remaining << "\n";
        summary << "  - Rejected daily runs: " << session_totals.rejected_days << "\n";
    }
    summary << "\n## Validation\n";
    summary << "- Quantity conservation (received = consumed + wasted + remaining)\n";
    summary << "  - Status: " << (conservation_passed ? "PASS" : "FAIL") << "\n";
    if (!options.log_path.empty()) {
        summary << "\n## Logs\n";
        summary << "- Log output: `" << options.log_path << "`\n";
    }

    if (!options.summary_path.empty()) {
        std::ofstream summary_file(options.summary_path, std::ios::out | std::ios::trunc);
        if (summary_file) {
            summary_file << summary.str();
        }
    }
    std::cout << summary.str();
    return conservation_passed ? 0 : 2;
}
