#include "engine/comparison_analytics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/session_event_store.hpp"

namespace focuslens {

namespace {

constexpr double kVerdictThreshold = 5.0;
constexpr double kFocusInsightThreshold = 10.0;
constexpr double kCompletionInsightThreshold = 15.0;
constexpr std::size_t kMinEffectGroup = 5;
constexpr std::size_t kMinTrendDays = 3;
constexpr int kPredictionDays = 7;

double roundOneDecimal(double value)
{
    return std::round(value * 10.0) / 10.0;
}

double meanOf(const std::vector<double> &values)
{
    if (values.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (double v : values) {
        total += v;
    }
    return total / static_cast<double>(values.size());
}

double sampleVariance(const std::vector<double> &values)
{
    if (values.size() < 2) {
        return 0.0;
    }
    const double mean = meanOf(values);
    double sum = 0.0;
    for (double v : values) {
        sum += (v - mean) * (v - mean);
    }
    return sum / static_cast<double>(values.size() - 1);
}

// Least-squares slope of values against their index.
double linearSlope(const std::vector<double> &values)
{
    const std::size_t n = values.size();
    if (n < 2) {
        return 0.0;
    }
    double sumX = 0.0;
    double sumY = 0.0;
    double sumXY = 0.0;
    double sumXX = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        sumX += x;
        sumY += values[i];
        sumXY += x * values[i];
        sumXX += x * x;
    }
    const double denominator = n * sumXX - sumX * sumX;
    if (denominator == 0.0) {
        return 0.0;
    }
    return (n * sumXY - sumX * sumY) / denominator;
}

std::vector<double> trailingMovingAverage(const std::vector<double> &values, int window)
{
    std::vector<double> averaged;
    averaged.reserve(values.size());
    const std::size_t span = static_cast<std::size_t>(std::max(1, window));
    for (std::size_t i = 0; i < values.size(); ++i) {
        const std::size_t first = i + 1 >= span ? i + 1 - span : 0;
        double total = 0.0;
        for (std::size_t k = first; k <= i; ++k) {
            total += values[k];
        }
        averaged.push_back(total / static_cast<double>(i - first + 1));
    }
    return averaged;
}

std::chrono::hours shiftFor(Granularity granularity)
{
    switch (granularity) {
    case Granularity::Day:
        return std::chrono::hours(24);
    case Granularity::Week:
        return std::chrono::hours(24 * 7);
    case Granularity::Month:
        return std::chrono::hours(24 * 30);
    }
    return std::chrono::hours(24);
}

std::map<std::string, double> metricChanges(const PeriodMetrics &previous, const PeriodMetrics &current)
{
    return {
        {"avg_focus_score", ComparisonAnalytics::percentChange(previous.avgFocusScore, current.avgFocusScore)},
        {"avg_efficiency_score", ComparisonAnalytics::percentChange(previous.avgEfficiencyScore,
                                                                    current.avgEfficiencyScore)},
        {"completion_rate", ComparisonAnalytics::percentChange(previous.completionRate, current.completionRate)},
        {"avg_duration", ComparisonAnalytics::percentChange(previous.avgDurationMinutes,
                                                            current.avgDurationMinutes)},
        {"interruptions_per_session", ComparisonAnalytics::percentChange(previous.interruptionsPerSession,
                                                                         current.interruptionsPerSession)}
    };
}

std::string verdictFor(const std::map<std::string, double> &changes)
{
    int improving = 0;
    int declining = 0;
    for (const auto &change : changes) {
        // Fewer interruptions is an improvement.
        const double value = change.first == "interruptions_per_session" ? -change.second
                                                                         : change.second;
        if (value > kVerdictThreshold) {
            ++improving;
        } else if (value < -kVerdictThreshold) {
            ++declining;
        }
    }
    const int majority = static_cast<int>(changes.size()) / 2 + 1;
    if (improving >= majority) {
        return "improved";
    }
    if (declining >= majority) {
        return "declined";
    }
    return "stable";
}

std::string confidenceFor(int samples)
{
    if (samples >= 5) {
        return "high";
    }
    if (samples >= 2) {
        return "medium";
    }
    return "low";
}

nlohmann::json rangeToJson(const TimeRange &range)
{
    return nlohmann::json{{"start", toIso8601Utc(range.start)}, {"end", toIso8601Utc(range.end)}};
}

} // namespace

std::string toGranularityString(Granularity granularity)
{
    switch (granularity) {
    case Granularity::Day:
        return "day";
    case Granularity::Week:
        return "week";
    case Granularity::Month:
        return "month";
    }
    return "day";
}

ComparisonAnalytics::ComparisonAnalytics(const SessionEventStore &sessions,
                                         const EngineConfig &config,
                                         Clock clock)
    : m_sessions(sessions)
    , m_cache(config.comparisonCacheTtl, config.comparisonCacheCap, std::move(clock))
{
}

Granularity ComparisonAnalytics::parseGranularity(const std::string &value)
{
    if (value == "day" || value == "daily") {
        return Granularity::Day;
    }
    if (value == "week" || value == "weekly") {
        return Granularity::Week;
    }
    if (value == "month" || value == "monthly") {
        return Granularity::Month;
    }
    throw ValidationError("unknown granularity: " + value);
}

void ComparisonAnalytics::validateRange(const TimeRange &range)
{
    if (range.start >= range.end) {
        throw ValidationError("date range start must be before end");
    }
}

std::string ComparisonAnalytics::rangeKey(const TimeRange &range)
{
    return toIso8601Utc(range.start) + "|" + toIso8601Utc(range.end);
}

std::vector<SessionRecord> ComparisonAnalytics::workSessions(const TimeRange &range) const
{
    std::vector<SessionRecord> result;
    for (auto &record : m_sessions.sessionsBetween(range.start, range.end)) {
        if (record.type == SessionType::Work) {
            result.push_back(std::move(record));
        }
    }
    return result;
}

PeriodMetrics ComparisonAnalytics::computeMetrics(const std::vector<SessionRecord> &sessions)
{
    PeriodMetrics metrics;
    std::vector<double> focus;
    std::vector<double> efficiency;
    std::vector<double> duration;
    int completed = 0;
    for (const auto &record : sessions) {
        if (record.type != SessionType::Work) {
            continue;
        }
        metrics.count++;
        focus.push_back(record.focusScore.value_or(0.0));
        efficiency.push_back(record.efficiencyScore.value_or(0.0));
        duration.push_back(static_cast<double>(record.actualDuration.count()) / 60.0);
        metrics.totalInterruptions += static_cast<int>(record.interruptions.size());
        if (record.completed) {
            ++completed;
        }
    }
    if (metrics.count == 0) {
        return metrics;
    }
    metrics.avgFocusScore = roundOneDecimal(meanOf(focus));
    metrics.avgEfficiencyScore = roundOneDecimal(meanOf(efficiency));
    metrics.completionRate = roundOneDecimal(100.0 * completed / metrics.count);
    metrics.avgDurationMinutes = roundOneDecimal(meanOf(duration));
    metrics.interruptionsPerSession =
        roundOneDecimal(static_cast<double>(metrics.totalInterruptions) / metrics.count);
    return metrics;
}

double ComparisonAnalytics::percentChange(double from, double to)
{
    if (from == 0.0) {
        return to == 0.0 ? 0.0 : 100.0;
    }
    return roundOneDecimal((to - from) / std::abs(from) * 100.0);
}

PeriodComparisonResult ComparisonAnalytics::comparePeriods(Granularity granularity,
                                                           const TimeRange &range,
                                                           int periods)
{
    validateRange(range);
    periods = std::max(1, periods);

    const std::string key = "periods|" + toGranularityString(granularity) + "|"
        + rangeKey(range) + "|" + std::to_string(periods);
    if (auto cached = m_cache.get(key)) {
        return std::get<PeriodComparisonResult>(*cached);
    }

    PeriodComparisonResult result;
    result.granularity = granularity;
    result.anchor.range = range;
    result.anchor.metrics = computeMetrics(workSessions(range));

    const auto shift = shiftFor(granularity);
    int improved = 0;
    int declined = 0;
    for (int i = 1; i <= periods; ++i) {
        PeriodComparison comparison;
        comparison.window.range.start = range.start - shift * i;
        comparison.window.range.end = range.end - shift * i;
        comparison.window.metrics = computeMetrics(workSessions(comparison.window.range));
        comparison.percentChanges = metricChanges(comparison.window.metrics, result.anchor.metrics);
        comparison.verdict = verdictFor(comparison.percentChanges);
        if (comparison.verdict == "improved") {
            ++improved;
        } else if (comparison.verdict == "declined") {
            ++declined;
        }
        result.comparisons.push_back(std::move(comparison));
    }

    if (improved > declined && improved * 2 > periods) {
        result.overallVerdict = "improved";
    } else if (declined > improved && declined * 2 > periods) {
        result.overallVerdict = "declined";
    } else {
        result.overallVerdict = "stable";
    }

    const auto &previous = result.comparisons.front().percentChanges;
    const double focusChange = previous.at("avg_focus_score");
    const double completionChange = previous.at("completion_rate");
    if (focusChange > kFocusInsightThreshold) {
        result.insights.push_back("Focus improved by " + std::to_string(static_cast<int>(focusChange))
                                  + "% compared with the previous " + toGranularityString(granularity));
    } else if (focusChange < -kFocusInsightThreshold) {
        result.insights.push_back("Focus dropped by " + std::to_string(static_cast<int>(-focusChange))
                                  + "% compared with the previous " + toGranularityString(granularity));
    }
    if (completionChange > kCompletionInsightThreshold) {
        result.insights.push_back("You are completing noticeably more of the sessions you start");
    } else if (completionChange < -kCompletionInsightThreshold) {
        result.insights.push_back("Fewer sessions are being completed; consider shorter sessions");
    }
    if (result.anchor.metrics.count == 0) {
        result.insights.push_back("No work sessions in the selected period");
    }

    m_cache.put(key, result);
    return result;
}

std::string ComparisonAnalytics::effectSizeBand(const std::vector<double> &a,
                                                const std::vector<double> &b,
                                                double *effectSize)
{
    *effectSize = 0.0;
    if (a.size() < kMinEffectGroup || b.size() < kMinEffectGroup) {
        return "insufficient_data";
    }
    const double difference = std::abs(meanOf(a) - meanOf(b));
    const double pooledVariance = ((a.size() - 1) * sampleVariance(a) + (b.size() - 1) * sampleVariance(b))
        / static_cast<double>(a.size() + b.size() - 2);
    const double pooled = std::sqrt(pooledVariance);
    if (pooled == 0.0) {
        if (difference == 0.0) {
            return "none";
        }
        *effectSize = std::numeric_limits<double>::infinity();
        return "large";
    }
    *effectSize = difference / pooled;
    if (*effectSize < 0.2) {
        return "none";
    }
    if (*effectSize < 0.5) {
        return "small";
    }
    if (*effectSize < 0.8) {
        return "medium";
    }
    return "large";
}

WeekdayWeekendResult ComparisonAnalytics::compareWeekdaysVsWeekends(const TimeRange &range)
{
    validateRange(range);
    const std::string key = "weekday_weekend|" + rangeKey(range);
    if (auto cached = m_cache.get(key)) {
        return std::get<WeekdayWeekendResult>(*cached);
    }

    std::vector<SessionRecord> weekday;
    std::vector<SessionRecord> weekend;
    std::vector<double> weekdayEfficiency;
    std::vector<double> weekendEfficiency;
    for (auto &record : workSessions(range)) {
        const bool isWeekend = record.environment.weekday >= 5;
        (isWeekend ? weekendEfficiency : weekdayEfficiency).push_back(record.efficiencyScore.value_or(0.0));
        (isWeekend ? weekend : weekday).push_back(std::move(record));
    }

    WeekdayWeekendResult result;
    result.weekday = computeMetrics(weekday);
    result.weekend = computeMetrics(weekend);
    result.percentDifference = metricChanges(result.weekend, result.weekday);

    if (result.weekday.avgEfficiencyScore > result.weekend.avgEfficiencyScore) {
        result.better = "weekday";
    } else if (result.weekend.avgEfficiencyScore > result.weekday.avgEfficiencyScore) {
        result.better = "weekend";
    } else {
        result.better = "equal";
    }
    result.effectSizeBand = effectSizeBand(weekdayEfficiency, weekendEfficiency, &result.effectSize);
    if (!std::isfinite(result.effectSize)) {
        result.effectSize = 0.0;
    }

    if (result.effectSizeBand == "insufficient_data") {
        result.recommendations.push_back("Log at least five sessions on both weekdays and weekends to compare them");
    } else if (result.effectSizeBand == "medium" || result.effectSizeBand == "large") {
        result.recommendations.push_back(result.better == "weekday"
            ? "You work noticeably better on weekdays; protect that time for demanding tasks"
            : "You work noticeably better on weekends; consider moving hard tasks there");
    } else {
        result.recommendations.push_back("Your performance is consistent across the week");
    }

    m_cache.put(key, result);
    return result;
}

std::map<std::string, HourRange> ComparisonAnalytics::defaultTimePeriods()
{
    return {
        {"morning", HourRange{5, 12}},
        {"afternoon", HourRange{12, 17}},
        {"evening", HourRange{17, 22}}
    };
}

TimePeriodComparisonResult ComparisonAnalytics::compareTimePeriods(
    const TimeRange &range,
    const std::map<std::string, HourRange> &periods)
{
    validateRange(range);
    std::string key = "time_periods|" + rangeKey(range);
    for (const auto &period : periods) {
        if (period.second.startHour < 0 || period.second.endHour > 24
            || period.second.startHour >= period.second.endHour) {
            throw ValidationError("invalid hour range for " + period.first);
        }
        key += "|" + period.first + ":" + std::to_string(period.second.startHour) + "-"
            + std::to_string(period.second.endHour);
    }
    if (auto cached = m_cache.get(key)) {
        return std::get<TimePeriodComparisonResult>(*cached);
    }

    const std::vector<SessionRecord> sessions = workSessions(range);
    TimePeriodComparisonResult result;
    double bestComposite = -1.0;
    for (const auto &period : periods) {
        std::vector<SessionRecord> matching;
        for (const auto &record : sessions) {
            const int hour = record.environment.hour;
            if (hour >= period.second.startHour && hour < period.second.endHour) {
                matching.push_back(record);
            }
        }
        TimePeriodBucket bucket;
        bucket.name = period.first;
        bucket.hours = period.second;
        bucket.metrics = computeMetrics(matching);
        bucket.composite = roundOneDecimal(0.4 * bucket.metrics.avgFocusScore
                                           + 0.4 * bucket.metrics.avgEfficiencyScore
                                           + 0.2 * bucket.metrics.completionRate);
        bucket.confidence = confidenceFor(bucket.metrics.count);
        if (bucket.metrics.count > 0 && bucket.composite > bestComposite) {
            bestComposite = bucket.composite;
            result.best = bucket.name;
        }
        result.buckets.push_back(std::move(bucket));
    }

    if (result.best) {
        result.insights.push_back("Your strongest time of day is the " + *result.best);
    } else {
        result.insights.push_back("No work sessions fall into the configured time periods");
    }

    m_cache.put(key, result);
    return result;
}

TrendDirection ComparisonAnalytics::directionForSlope(double slope)
{
    if (slope > 0.5) {
        return TrendDirection::Improving;
    }
    if (slope < -0.5) {
        return TrendDirection::Declining;
    }
    return TrendDirection::Stable;
}

ProgressTrendResult ComparisonAnalytics::analyzeProgressTrends(int windowDays, const TimeRange &range)
{
    validateRange(range);
    windowDays = std::max(1, windowDays);
    const std::string key = "trends|" + std::to_string(windowDays) + "|" + rangeKey(range);
    if (auto cached = m_cache.get(key)) {
        return std::get<ProgressTrendResult>(*cached);
    }

    std::map<std::string, std::vector<SessionRecord>> byDate;
    for (auto &record : workSessions(range)) {
        byDate[localDateKey(record.startTime)].push_back(std::move(record));
    }

    ProgressTrendResult result;
    result.windowDays = windowDays;
    for (const auto &day : byDate) {
        const PeriodMetrics metrics = computeMetrics(day.second);
        DailyAverage average;
        average.date = day.first;
        average.focus = metrics.avgFocusScore;
        average.efficiency = metrics.avgEfficiencyScore;
        average.completion = metrics.completionRate;
        average.sessions = metrics.count;
        result.daily.push_back(average);
    }

    if (result.daily.size() < kMinTrendDays) {
        result.overall = TrendDirection::InsufficientData;
        result.message = "At least 3 days of work sessions are needed to analyse trends";
        m_cache.put(key, result);
        return result;
    }

    const std::vector<std::pair<std::string, double DailyAverage::*>> series = {
        {"focus", &DailyAverage::focus},
        {"efficiency", &DailyAverage::efficiency},
        {"completion", &DailyAverage::completion}
    };

    int improving = 0;
    int declining = 0;
    for (const auto &entry : series) {
        std::vector<double> values;
        for (const auto &day : result.daily) {
            values.push_back(day.*(entry.second));
        }
        const std::vector<double> averaged = trailingMovingAverage(values, windowDays);

        MetricTrend trend;
        trend.metric = entry.first;
        trend.slope = roundOneDecimal(linearSlope(averaged));
        trend.direction = directionForSlope(linearSlope(averaged));
        trend.predictedIn7Days = roundOneDecimal(
            std::clamp(averaged.back() + linearSlope(averaged) * kPredictionDays, 0.0, 100.0));
        trend.improvementRate = percentChange(averaged.front(), averaged.back());
        if (trend.direction == TrendDirection::Improving) {
            ++improving;
        } else if (trend.direction == TrendDirection::Declining) {
            ++declining;
        }
        result.metrics.push_back(trend);

        const auto best = std::max_element(result.daily.begin(), result.daily.end(),
                                           [&entry](const DailyAverage &a, const DailyAverage &b) {
                                               return a.*(entry.second) < b.*(entry.second);
                                           });
        result.milestones["best_" + entry.first + "_day"] =
            nlohmann::json{{"date", best->date}, {"value", (*best).*(entry.second)}};
    }

    const int majority = static_cast<int>(series.size()) / 2 + 1;
    if (improving >= majority) {
        result.overall = TrendDirection::Improving;
    } else if (declining >= majority) {
        result.overall = TrendDirection::Declining;
    } else {
        result.overall = TrendDirection::Stable;
    }
    result.message = "Trend over " + std::to_string(result.daily.size()) + " days is "
        + toTrendDirectionString(result.overall);

    FLOG_DEBUG("ComparisonAnalytics", "analyzeProgressTrends", "trend_computed",
               (nlohmann::json{{"days", result.daily.size()},
                               {"overall", toTrendDirectionString(result.overall)}}));
    m_cache.put(key, result);
    return result;
}

void ComparisonAnalytics::clearCache()
{
    m_cache.clear();
}

std::size_t ComparisonAnalytics::cachedEntries()
{
    return m_cache.size();
}

void to_json(nlohmann::json &j, const PeriodMetrics &metrics)
{
    j = nlohmann::json{
        {"count", metrics.count},
        {"avg_focus_score", metrics.avgFocusScore},
        {"avg_efficiency_score", metrics.avgEfficiencyScore},
        {"completion_rate", metrics.completionRate},
        {"avg_duration", metrics.avgDurationMinutes},
        {"total_interruptions", metrics.totalInterruptions},
        {"interruptions_per_session", metrics.interruptionsPerSession}
    };
}

void to_json(nlohmann::json &j, const PeriodComparisonResult &result)
{
    nlohmann::json comparisons = nlohmann::json::array();
    for (const auto &comparison : result.comparisons) {
        comparisons.push_back({
            {"range", rangeToJson(comparison.window.range)},
            {"metrics", comparison.window.metrics},
            {"changes", comparison.percentChanges},
            {"verdict", comparison.verdict}
        });
    }
    j = nlohmann::json{
        {"granularity", toGranularityString(result.granularity)},
        {"current", {{"range", rangeToJson(result.anchor.range)}, {"metrics", result.anchor.metrics}}},
        {"comparisons", comparisons},
        {"overall", result.overallVerdict},
        {"insights", result.insights}
    };
}

void to_json(nlohmann::json &j, const WeekdayWeekendResult &result)
{
    j = nlohmann::json{
        {"weekday", result.weekday},
        {"weekend", result.weekend},
        {"difference_percent", result.percentDifference},
        {"better", result.better},
        {"effect_size", result.effectSize},
        {"effect_size_band", result.effectSizeBand},
        {"recommendations", result.recommendations}
    };
}

void to_json(nlohmann::json &j, const TimePeriodComparisonResult &result)
{
    nlohmann::json buckets = nlohmann::json::array();
    for (const auto &bucket : result.buckets) {
        buckets.push_back({
            {"name", bucket.name},
            {"hours", {bucket.hours.startHour, bucket.hours.endHour}},
            {"metrics", bucket.metrics},
            {"composite", bucket.composite},
            {"confidence", bucket.confidence}
        });
    }
    j = nlohmann::json{
        {"periods", buckets},
        {"best", result.best ? nlohmann::json(*result.best) : nlohmann::json(nullptr)},
        {"insights", result.insights}
    };
}

void to_json(nlohmann::json &j, const ProgressTrendResult &result)
{
    nlohmann::json daily = nlohmann::json::array();
    for (const auto &day : result.daily) {
        daily.push_back({
            {"date", day.date},
            {"focus", day.focus},
            {"efficiency", day.efficiency},
            {"completion", day.completion},
            {"sessions", day.sessions}
        });
    }
    nlohmann::json metrics = nlohmann::json::object();
    for (const auto &trend : result.metrics) {
        metrics[trend.metric] = {
            {"direction", toTrendDirectionString(trend.direction)},
            {"slope", trend.slope},
            {"predicted_7d", trend.predictedIn7Days},
            {"improvement_rate", trend.improvementRate}
        };
    }
    j = nlohmann::json{
        {"overall", toTrendDirectionString(result.overall)},
        {"message", result.message},
        {"window_days", result.windowDays},
        {"daily", daily},
        {"metrics", metrics},
        {"milestones", result.milestones}
    };
}

} // namespace focuslens
