#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "common/ttl_cache.hpp"

namespace focuslens {

class SessionEventStore;

enum class Granularity {
    Day,
    Week,
    Month
};

struct TimeRange {
    TimePoint start;
    TimePoint end;
};

struct PeriodMetrics {
    int count = 0;
    double avgFocusScore = 0.0;
    double avgEfficiencyScore = 0.0;
    double completionRate = 0.0; // percent
    double avgDurationMinutes = 0.0;
    int totalInterruptions = 0;
    double interruptionsPerSession = 0.0;
};

struct PeriodWindow {
    TimeRange range;
    PeriodMetrics metrics;
};

struct PeriodComparison {
    PeriodWindow window;
    std::map<std::string, double> percentChanges;
    std::string verdict; // improved, declined, stable
};

struct PeriodComparisonResult {
    Granularity granularity = Granularity::Day;
    PeriodWindow anchor;
    std::vector<PeriodComparison> comparisons;
    std::string overallVerdict;
    std::vector<std::string> insights;
};

struct WeekdayWeekendResult {
    PeriodMetrics weekday;
    PeriodMetrics weekend;
    std::map<std::string, double> percentDifference;
    std::string better; // weekday, weekend, equal
    double effectSize = 0.0;
    std::string effectSizeBand; // none, small, medium, large, insufficient_data
    std::vector<std::string> recommendations;
};

struct HourRange {
    int startHour = 0;
    int endHour = 0; // exclusive
};

struct TimePeriodBucket {
    std::string name;
    HourRange hours;
    PeriodMetrics metrics;
    double composite = 0.0;
    std::string confidence; // high, medium, low
};

struct TimePeriodComparisonResult {
    std::vector<TimePeriodBucket> buckets;
    std::optional<std::string> best;
    std::vector<std::string> insights;
};

struct DailyAverage {
    std::string date;
    double focus = 0.0;
    double efficiency = 0.0;
    double completion = 0.0;
    int sessions = 0;
};

struct MetricTrend {
    std::string metric;
    TrendDirection direction = TrendDirection::InsufficientData;
    double slope = 0.0;
    double predictedIn7Days = 0.0;
    double improvementRate = 0.0; // percent, first vs last moving average
};

struct ProgressTrendResult {
    TrendDirection overall = TrendDirection::InsufficientData;
    std::string message;
    int windowDays = 7;
    std::vector<DailyAverage> daily;
    std::vector<MetricTrend> metrics;
    nlohmann::json milestones = nlohmann::json::object();
};

using ComparisonResult = std::variant<PeriodComparisonResult,
                                      WeekdayWeekendResult,
                                      TimePeriodComparisonResult,
                                      ProgressTrendResult>;

/**
 * ComparisonAnalytics answers period-over-period and bucket comparison
 * queries over the work sessions of a SessionEventStore.
 *
 * Every query is read-only and cached by its parameter signature. Results are
 * descriptive: the weekday/weekend effect size is a magnitude band, not a
 * significance test.
 */
class ComparisonAnalytics
{
public:
    ComparisonAnalytics(const SessionEventStore &sessions,
                        const EngineConfig &config,
                        Clock clock);

    // Compares [range.start, range.end) with `periods` preceding windows,
    // each shifted by one day, week or 30 days.
    PeriodComparisonResult comparePeriods(Granularity granularity,
                                          const TimeRange &range,
                                          int periods);
    WeekdayWeekendResult compareWeekdaysVsWeekends(const TimeRange &range);
    TimePeriodComparisonResult compareTimePeriods(const TimeRange &range,
                                                  const std::map<std::string, HourRange> &periods =
                                                      defaultTimePeriods());
    ProgressTrendResult analyzeProgressTrends(int windowDays, const TimeRange &range);

    void clearCache();
    std::size_t cachedEntries();

    static PeriodMetrics computeMetrics(const std::vector<SessionRecord> &sessions);
    static std::map<std::string, HourRange> defaultTimePeriods();
    static double percentChange(double from, double to);
    static std::string effectSizeBand(const std::vector<double> &a, const std::vector<double> &b,
                                      double *effectSize);
    static TrendDirection directionForSlope(double slope);
    static Granularity parseGranularity(const std::string &value);
    static void validateRange(const TimeRange &range);

private:
    std::vector<SessionRecord> workSessions(const TimeRange &range) const;
    static std::string rangeKey(const TimeRange &range);

    const SessionEventStore &m_sessions;
    TtlCache<ComparisonResult> m_cache;
};

std::string toGranularityString(Granularity granularity);

void to_json(nlohmann::json &j, const PeriodMetrics &metrics);
void to_json(nlohmann::json &j, const PeriodComparisonResult &result);
void to_json(nlohmann::json &j, const WeekdayWeekendResult &result);
void to_json(nlohmann::json &j, const TimePeriodComparisonResult &result);
void to_json(nlohmann::json &j, const ProgressTrendResult &result);

} // namespace focuslens
