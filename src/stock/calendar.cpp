#include "stock/calendar.h"

#include <iomanip>
#include <sstream>

namespace stock {

Date makeDate(int year, unsigned month, unsigned day) {
    return Date{std::chrono::year_month_day{std::chrono::year{year},
                                            std::chrono::month{month},
                                            std::chrono::day{day}}};
}

Date addDays(Date date, int days) {
    return date + std::chrono::days{days};
}

int daysBetween(Date from, Date to) {
    return static_cast<int>((to - from).count());
}

std::string formatDate(Date date) {
    const std::chrono::year_month_day ymd{date};
    std::ostringstream out;
    out << std::setw(4) << std::setfill('0') << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << std::setfill('0') << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << std::setfill('0') << static_cast<unsigned>(ymd.day());
    return out.str();
}

bool parseDate(const std::string &text, Date &out) {
    // strict YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }

    const int year = std::stoi(text.substr(0, 4));
    const auto month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    const auto day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{month},
                                          std::chrono::day{day}};
    if (!ymd.ok()) {
        return false;
    }
    out = Date{ymd};
    return true;
}

}  // namespace stock
