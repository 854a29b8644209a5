#pragma once

#include <chrono>
#include <string>

namespace stock {

// Calendar day, no time of day. All "today" values are supplied by callers.
using Date = std::chrono::sys_days;

Date makeDate(int year, unsigned month, unsigned day);
Date addDays(Date date, int days);
int daysBetween(Date from, Date to);
std::string formatDate(Date date);
bool parseDate(const std::string &text, Date &out);

}  // namespace stock
