#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace audit {

struct LogFields {
    std::optional<std::string> trace_id;
    std::optional<std::uint64_t> session_id;
    std::optional<std::string> ingredient_id;
    std::optional<std::uint64_t> lot_id;
    std::optional<double> quantity;
    std::optional<double> requested;
    std::optional<double> unit_cost;
    std::optional<std::uint64_t> count;
    std::optional<std::string> event_date;
    std::optional<std::string> reason;
};

class StructuredLogger {
public:
    StructuredLogger();
    explicit StructuredLogger(std::ostream &out);

    void log(const std::string &level,
             const std::string &event,
             const std::string &message,
             const LogFields &fields = {});

    static std::string generateTraceId();

private:
    std::ostream &out_;
    std::mutex mutex_;
};

}  // namespace audit
