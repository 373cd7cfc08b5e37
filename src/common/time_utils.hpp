#pragma once

#include <chrono>
#include <string>

namespace focuslens {

std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp);

// Returns the epoch on parse failure.
std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value);

// Local calendar helpers. Weekday is Monday = 0 ... Sunday = 6.
int localHour(std::chrono::system_clock::time_point timestamp);
int localWeekday(std::chrono::system_clock::time_point timestamp);
int localMonth(std::chrono::system_clock::time_point timestamp);

// "yyyy-MM-dd" in local time.
std::string localDateKey(std::chrono::system_clock::time_point timestamp);

// ISO week key "YYYY-Www" in local time.
std::string isoWeekKey(std::chrono::system_clock::time_point timestamp);

std::chrono::system_clock::time_point startOfLocalDay(
    std::chrono::system_clock::time_point timestamp);

// Local midnight of the Monday of the week, and of the first of the month.
std::chrono::system_clock::time_point startOfLocalWeek(
    std::chrono::system_clock::time_point timestamp);
std::chrono::system_clock::time_point startOfLocalMonth(
    std::chrono::system_clock::time_point timestamp);

// Local midnight `days` calendar days after the day of `timestamp`.
std::chrono::system_clock::time_point addLocalDays(
    std::chrono::system_clock::time_point timestamp, int days);

// `days` whole days before `timestamp`. The count is clamped to [0, 36500]
// so that the nanosecond representation cannot overflow.
std::chrono::system_clock::time_point daysBefore(
    std::chrono::system_clock::time_point timestamp, long long days);

std::chrono::system_clock::time_point fromLocalDateTime(int year, int month, int day,
                                                        int hour = 0, int minute = 0,
                                                        int second = 0);

// Parses "yyyy-MM-dd" (local midnight) or a full UTC ISO timestamp.
// Returns false when the value matches neither form.
bool parseDateOrTimestamp(const std::string &value,
                          std::chrono::system_clock::time_point *out);

double minutesBetween(std::chrono::system_clock::time_point from,
                      std::chrono::system_clock::time_point to);

} // namespace focuslens
