#include "engine/reports_engine.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/environment_correlator.hpp"
#include "engine/focus_score_calculator.hpp"
#include "engine/interruption_tracker.hpp"
#include "engine/session_event_store.hpp"
#include "engine/session_pattern_tracker.hpp"

namespace focuslens {

namespace {

constexpr int kDefaultReportDays = 30;
constexpr double kLowCompletionRate = 70.0;
constexpr double kLowFocus = 60.0;

double roundOneDecimal(double value)
{
    return std::round(value * 10.0) / 10.0;
}

nlohmann::json rangeToJson(const TimeRange &range)
{
    return nlohmann::json{{"start", toIso8601Utc(range.start)}, {"end", toIso8601Utc(range.end)}};
}

std::string reportKey(const TimeRange &range)
{
    return toIso8601Utc(range.start) + "|" + toIso8601Utc(range.end);
}

} // namespace

ReportsEngine::ReportsEngine(const SessionEventStore &sessions,
                             const InterruptionTracker &interruptions,
                             const EnvironmentCorrelator &environment,
                             const SessionPatternTracker &patterns,
                             const EngineConfig &config,
                             Clock clock)
    : m_sessions(sessions)
    , m_interruptions(interruptions)
    , m_environment(environment)
    , m_patterns(patterns)
    , m_clock(clock)
    , m_cache(config.reportCacheTtl, config.reportCacheCap, clock)
{
}

TimeRange ReportsEngine::defaultRange() const
{
    const TimePoint end = addLocalDays(m_clock(), 1);
    return TimeRange{addLocalDays(end, -kDefaultReportDays), end};
}

ComprehensiveReport ReportsEngine::generateComprehensiveReport(std::optional<TimeRange> range)
{
    const TimeRange effective = range.value_or(defaultRange());
    ComparisonAnalytics::validateRange(effective);

    const std::string key = reportKey(effective);
    if (auto cached = m_cache.get(key)) {
        FLOG_DEBUG("ReportsEngine", "generateComprehensiveReport", "cache_hit",
                   (nlohmann::json{{"key", key}}));
        return *cached;
    }

    ComprehensiveReport report;
    report.range = effective;
    report.generatedAt = m_clock();
    report.summary = sessionSummary(effective);

    const nlohmann::json environment = environmentAnalysis(effective);
    report.sections = nlohmann::json{
        {"session_summary", report.summary},
        {"focus_analysis", focusAnalysis(effective)},
        {"interruption_analysis", interruptionAnalysis(effective)},
        {"environment_analysis", environment},
        {"productivity_trends", trendAnalysis(effective)}
    };
    report.recommendations = recommendationsFor(report.summary, environment);

    FLOG_INFO("ReportsEngine", "generateComprehensiveReport", "report_generated",
              (nlohmann::json{{"range", rangeToJson(effective)},
                              {"sessions", report.summary.value("total_sessions", 0)}}));
    m_cache.put(key, report);
    return report;
}

nlohmann::json ReportsEngine::sessionSummary(const TimeRange &range) const
{
    const std::vector<SessionRecord> sessions = m_sessions.sessionsBetween(range.start, range.end);
    const PeriodMetrics work = ComparisonAnalytics::computeMetrics(sessions);

    int breaks = 0;
    double workMinutes = 0.0;
    double breakMinutes = 0.0;
    std::set<std::string> activeDays;
    for (const auto &record : sessions) {
        const double minutes = static_cast<double>(record.actualDuration.count()) / 60.0;
        if (record.type == SessionType::Work) {
            workMinutes += minutes;
        } else {
            ++breaks;
            breakMinutes += minutes;
        }
        activeDays.insert(localDateKey(record.startTime));
    }

    return nlohmann::json{
        {"total_sessions", sessions.size()},
        {"work_sessions", work.count},
        {"break_sessions", breaks},
        {"completion_rate", work.completionRate},
        {"total_work_minutes", roundOneDecimal(workMinutes)},
        {"total_break_minutes", roundOneDecimal(breakMinutes)},
        {"avg_focus_score", work.avgFocusScore},
        {"avg_efficiency_score", work.avgEfficiencyScore},
        {"avg_duration", work.avgDurationMinutes},
        {"total_interruptions", work.totalInterruptions},
        {"interruptions_per_session", work.interruptionsPerSession},
        {"active_days", activeDays.size()}
    };
}

nlohmann::json ReportsEngine::focusAnalysis(const TimeRange &range) const
{
    std::map<std::string, int> levels{{"high", 0}, {"medium", 0}, {"low", 0}};
    std::map<std::string, std::vector<double>> byPeriod;
    std::optional<SessionRecord> best;
    double total = 0.0;
    int count = 0;
    for (const auto &record : m_sessions.sessionsBetween(range.start, range.end)) {
        if (record.type != SessionType::Work || !record.focusScore) {
            continue;
        }
        const double score = *record.focusScore;
        total += score;
        ++count;
        levels[toFocusLevelString(FocusScoreCalculator::levelFor(score))]++;
        byPeriod[toTimePeriodString(record.environment.timePeriod)].push_back(score);
        if (!best || score > *best->focusScore) {
            best = record;
        }
    }

    if (count == 0) {
        return nlohmann::json{{"sessions", 0}, {"message", "No scored work sessions in range"}};
    }

    nlohmann::json periods = nlohmann::json::object();
    for (const auto &period : byPeriod) {
        double sum = 0.0;
        for (double v : period.second) {
            sum += v;
        }
        periods[period.first] = roundOneDecimal(sum / period.second.size());
    }

    return nlohmann::json{
        {"sessions", count},
        {"avg_focus_score", roundOneDecimal(total / count)},
        {"level_distribution", levels},
        {"by_time_period", periods},
        {"best_session", {
            {"session_id", best->id},
            {"date", localDateKey(best->startTime)},
            {"focus_score", *best->focusScore}
        }}
    };
}

nlohmann::json ReportsEngine::interruptionAnalysis(const TimeRange &range) const
{
    int sessions = 0;
    int interrupted = 0;
    int total = 0;
    for (const auto &record : m_sessions.sessionsBetween(range.start, range.end)) {
        if (record.type != SessionType::Work) {
            continue;
        }
        ++sessions;
        total += static_cast<int>(record.interruptions.size());
        if (!record.interruptions.empty()) {
            ++interrupted;
        }
    }

    const InterruptionSummary summary = m_interruptions.interruptionSummary(range.start, range.end);
    nlohmann::json patterns = nlohmann::json::array();
    for (const auto &pattern : m_interruptions.lastPatterns()) {
        patterns.push_back({
            {"kind", pattern.kind},
            {"description", pattern.description},
            {"recommendation", pattern.recommendation},
            {"severity", toSeverityString(pattern.severity)}
        });
    }

    return nlohmann::json{
        {"total_interruptions", total},
        {"sessions_with_interruptions", interrupted},
        {"interruptions_per_session", sessions > 0 ? roundOneDecimal(static_cast<double>(total) / sessions) : 0.0},
        {"by_type", summary.byType},
        {"by_severity", summary.bySeverity},
        {"average_duration_seconds", roundOneDecimal(summary.averageDurationSeconds)},
        {"patterns", patterns}
    };
}

nlohmann::json ReportsEngine::environmentAnalysis(const TimeRange &range) const
{
    const EnvironmentInsights insights = m_environment.insights(range.start, range.end);
    const OptimalTimes optimal = m_environment.optimalTimes();

    nlohmann::json heatmap = nlohmann::json::array();
    for (const auto &cell : m_environment.heatmap()) {
        heatmap.push_back({{"weekday", cell.weekday},
                           {"hour", cell.hour},
                           {"mean", cell.mean},
                           {"samples", cell.samples}});
    }

    nlohmann::json result{
        {"insufficient_data", insights.insufficientData},
        {"sessions", insights.sessions},
        {"time_period_means", insights.timePeriodMeans},
        {"weekday_mean", insights.weekdayMean},
        {"weekend_mean", insights.weekendMean},
        {"recommendations", insights.recommendations},
        {"heatmap", heatmap}
    };
    if (!insights.message.empty()) {
        result["message"] = insights.message;
    }
    if (!insights.differenceNote.empty()) {
        result["difference"] = insights.differenceNote;
    }
    result["best_time_period"] = insights.bestTimePeriod
        ? nlohmann::json(toTimePeriodString(*insights.bestTimePeriod))
        : nlohmann::json(nullptr);
    result["best_hour"] = optimal.bestHour ? nlohmann::json(*optimal.bestHour) : nlohmann::json(nullptr);
    result["best_weekday"] = optimal.bestWeekday ? nlohmann::json(weekdayName(*optimal.bestWeekday))
                                                 : nlohmann::json(nullptr);
    return result;
}

nlohmann::json ReportsEngine::trendAnalysis(const TimeRange &range) const
{
    const std::string from = localDateKey(range.start);
    const std::string to = localDateKey(range.end);
    nlohmann::json points = nlohmann::json::array();
    for (const auto &point : m_patterns.trendPoints()) {
        if (point.date >= from && point.date < to) {
            points.push_back(point);
        }
    }

    const PatternReport report = m_patterns.patterns();
    nlohmann::json patterns = nlohmann::json::array();
    for (const auto &pattern : report.patterns) {
        patterns.push_back({
            {"kind", pattern.kind},
            {"description", pattern.description},
            {"confidence", pattern.confidence},
            {"data", pattern.data}
        });
    }

    nlohmann::json result{
        {"trend_points", points},
        {"patterns", patterns},
        {"insufficient_data", report.insufficientData}
    };
    if (!report.message.empty()) {
        result["message"] = report.message;
    }
    return result;
}

std::vector<std::string> ReportsEngine::recommendationsFor(const nlohmann::json &summary,
                                                           const nlohmann::json &environment) const
{
    std::vector<std::string> tips;
    const int workSessions = summary.value("work_sessions", 0);
    if (workSessions == 0) {
        tips.emplace_back("Complete a few focus sessions to unlock personalised recommendations.");
        return tips;
    }

    if (summary.value("completion_rate", 0.0) < kLowCompletionRate) {
        tips.emplace_back("Set smaller, more achievable goals for each session to finish more of them.");
    }
    if (summary.value("avg_focus_score", 0.0) < kLowFocus) {
        tips.emplace_back("Try a short pre-session ritual: clear the desk, pick one task, then start the timer.");
    }
    if (summary.value("total_interruptions", 0) * 2 > workSessions) {
        tips.emplace_back("Interruptions are frequent. Turn on do-not-disturb and close chat apps while focusing.");
    }
    if (environment.contains("best_hour") && !environment.at("best_hour").is_null()) {
        tips.push_back("Schedule your most important work around "
                       + std::to_string(environment.at("best_hour").get<int>()) + ":00, your best hour.");
    } else if (environment.contains("best_time_period") && !environment.at("best_time_period").is_null()) {
        tips.push_back("Schedule your most important work in the "
                       + environment.at("best_time_period").get<std::string>() + ".");
    }
    if (tips.empty()) {
        tips.emplace_back("Solid work. Keep your current routine.");
    }
    return tips;
}

SessionRecord ReportsEngine::sessionDetails(const std::string &sessionId) const
{
    return m_sessions.findSession(sessionId);
}

std::vector<SessionRecord> ReportsEngine::sessionsOnDate(const std::string &date) const
{
    std::vector<SessionRecord> result;
    for (auto &record : m_sessions.history()) {
        if (localDateKey(record.startTime) == date) {
            result.push_back(std::move(record));
        }
    }
    return result;
}

std::vector<InterruptionEvent> ReportsEngine::interruptionsOfKind(const std::string &type,
                                                                  const TimeRange &range) const
{
    ComparisonAnalytics::validateRange(range);
    std::vector<InterruptionEvent> result;
    for (const auto &record : m_sessions.sessionsBetween(range.start, range.end)) {
        for (const auto &event : record.interruptions) {
            const std::string name = interruptionTypeName(event);
            if (name == type || (type == "external" && event.kind == InterruptionKind::External)) {
                result.push_back(event);
            }
        }
    }
    return result;
}

void ReportsEngine::clearCache()
{
    m_cache.clear();
}

std::size_t ReportsEngine::cachedEntries()
{
    return m_cache.size();
}

void to_json(nlohmann::json &j, const ComprehensiveReport &report)
{
    j = nlohmann::json{
        {"range", rangeToJson(report.range)},
        {"generated_at", toIso8601Utc(report.generatedAt)},
        {"summary", report.summary},
        {"sections", report.sections},
        {"recommendations", report.recommendations}
    };
}

} // namespace focuslens
