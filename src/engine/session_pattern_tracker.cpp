#include "engine/session_pattern_tracker.hpp"

#include <algorithm>
#include <cmath>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/analytics_store.hpp"

namespace focuslens {

namespace {

constexpr const char *kDocumentName = "productivity_trends";
constexpr std::size_t kMinHistory = 5;
constexpr std::size_t kMinDailyWorkSessions = 3;
constexpr std::size_t kMinHourSessions = 3;
constexpr double kHourEfficiencyThreshold = 75.0;
constexpr std::size_t kRecentWindow = 5;
constexpr double kTrendThreshold = 10.0;
constexpr double kInterruptionsPerSession = 3.0;

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

double confidenceFor(std::size_t samples, std::size_t saturation)
{
    return roundOneDecimal(std::min(1.0, static_cast<double>(samples) / saturation));
}

} // namespace

SessionPatternTracker::SessionPatternTracker(const EngineConfig &config,
                                             AnalyticsStore *store,
                                             Clock clock,
                                             QObject *parent)
    : QObject(parent)
    , m_windowDays(std::max(1, config.patternWindowDays))
    , m_store(store)
    , m_clock(std::move(clock))
    , m_history(config.patternHistoryCap)
    , m_trend(config.trendPointCap)
{
}

void SessionPatternTracker::load()
{
    if (!m_store) {
        return;
    }

    std::optional<nlohmann::json> document;
    try {
        document = m_store->loadDocument(kDocumentName);
    } catch (const std::exception &ex) {
        FLOG_WARN("SessionPatternTracker", "load", "snapshot_read_failed",
                  (nlohmann::json{{"error", ex.what()}}));
        return;
    }
    if (!document || !document->is_object()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_trend.clear();
    try {
        for (const auto &item : document->value("trend_points", nlohmann::json::array())) {
            m_trend.push(item.get<ProductivityTrendPoint>());
        }
    } catch (const nlohmann::json::exception &ex) {
        FLOG_WARN("SessionPatternTracker", "load", "snapshot_malformed",
                  (nlohmann::json{{"error", ex.what()}}));
    }
}

void SessionPatternTracker::replayHistory(const std::vector<SessionRecord> &records)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &record : records) {
        appendLocked(record);
    }
}

void SessionPatternTracker::appendLocked(const SessionRecord &record)
{
    if (m_history.size() == m_history.capacity()) {
        const SessionRecord &oldest = m_history.front();
        auto it = m_byDate.find(localDateKey(oldest.startTime));
        if (it != m_byDate.end()) {
            auto &sessions = it->second;
            sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                          [&oldest](const SessionRecord &s) {
                                              return s.id == oldest.id;
                                          }),
                           sessions.end());
            if (sessions.empty()) {
                m_byDate.erase(it);
            }
        }
    }
    m_history.push(record);
    m_byDate[localDateKey(record.startTime)].push_back(record);
}

void SessionPatternTracker::onSessionFinalized(const SessionRecord &record)
{
    PatternReport report;
    ProductivityTrendPoint point;
    bool trendChanged = false;
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        appendLocked(record);
        if (m_history.size() >= kMinHistory) {
            report = minePatternsLocked();
        }
        if (record.type == SessionType::Work) {
            trendChanged = updateTrendLocked(localDateKey(record.startTime), &point);
        }
        if (trendChanged) {
            snapshot = snapshotLocked();
        }
    }

    if (trendChanged) {
        saveDocumentBestEffort(m_store, kDocumentName, snapshot);
        FLOG_INFO("SessionPatternTracker", "onSessionFinalized", "trend_point_updated",
                  (nlohmann::json{{"date", point.date},
                                  {"score", point.score},
                                  {"sessions", point.sessionsCount}}));
        emit trendUpdated(point);
    }
    if (!report.patterns.empty()) {
        emit patternsDetected(static_cast<int>(report.patterns.size()));
    }
}

PatternReport SessionPatternTracker::patterns() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_history.size() < kMinHistory) {
        PatternReport report;
        report.insufficientData = true;
        report.sessionsAnalyzed = static_cast<int>(m_history.size());
        report.message = "At least 5 sessions are needed to detect patterns";
        return report;
    }
    return minePatternsLocked();
}

PatternReport SessionPatternTracker::minePatternsLocked() const
{
    const TimePoint cutoff = daysBefore(m_clock(), m_windowDays);
    std::vector<SessionRecord> window;
    for (const auto &record : m_history) {
        if (record.type == SessionType::Work && record.startTime >= cutoff) {
            window.push_back(record);
        }
    }
    std::sort(window.begin(), window.end(),
              [](const SessionRecord &a, const SessionRecord &b) {
                  return a.startTime < b.startTime;
              });

    PatternReport report;
    report.sessionsAnalyzed = static_cast<int>(window.size());
    if (window.empty()) {
        report.message = "No work sessions in the last " + std::to_string(m_windowDays) + " days";
        return report;
    }

    std::map<int, std::vector<double>> byHour;
    for (const auto &record : window) {
        byHour[record.environment.hour].push_back(record.efficiencyScore.value_or(0.0));
    }
    for (const auto &bucket : byHour) {
        if (bucket.second.size() < kMinHourSessions) {
            continue;
        }
        const double mean = meanOf(bucket.second);
        if (mean <= kHourEfficiencyThreshold) {
            continue;
        }
        BehaviorPattern pattern;
        pattern.kind = "optimal_hour";
        pattern.description = "Sessions started at " + std::to_string(bucket.first)
            + ":00 are consistently efficient";
        pattern.confidence = confidenceFor(bucket.second.size(), 10);
        pattern.data = nlohmann::json{{"hour", bucket.first},
                                      {"average_efficiency", roundOneDecimal(mean)},
                                      {"sessions", bucket.second.size()}};
        report.patterns.push_back(std::move(pattern));
    }

    if (window.size() > kRecentWindow) {
        std::vector<double> earlier;
        std::vector<double> recent;
        for (std::size_t i = 0; i < window.size(); ++i) {
            const double efficiency = window[i].efficiencyScore.value_or(0.0);
            (i + kRecentWindow >= window.size() ? recent : earlier).push_back(efficiency);
        }
        const double difference = meanOf(recent) - meanOf(earlier);
        if (std::abs(difference) > kTrendThreshold) {
            BehaviorPattern pattern;
            pattern.kind = "efficiency_trend";
            const bool improving = difference > 0;
            pattern.description = improving ? "Efficiency is improving over recent sessions"
                                            : "Efficiency is declining over recent sessions";
            pattern.confidence = confidenceFor(window.size(), 20);
            pattern.data = nlohmann::json{{"direction", improving ? "improving" : "declining"},
                                          {"recent_average", roundOneDecimal(meanOf(recent))},
                                          {"earlier_average", roundOneDecimal(meanOf(earlier))},
                                          {"difference", roundOneDecimal(difference)}};
            report.patterns.push_back(std::move(pattern));
        }
    }

    std::size_t heavy = 0;
    std::size_t totalInterruptions = 0;
    for (const auto &record : window) {
        totalInterruptions += record.interruptions.size();
        if (static_cast<double>(record.interruptions.size()) > kInterruptionsPerSession) {
            ++heavy;
        }
    }
    const double perSession = static_cast<double>(totalInterruptions) / window.size();
    const double heavyShare = static_cast<double>(heavy) / window.size();
    if (perSession > kInterruptionsPerSession && heavyShare > 0.5) {
        BehaviorPattern pattern;
        pattern.kind = "interruption_frequency";
        pattern.description = "Most sessions are interrupted more than three times";
        pattern.confidence = roundOneDecimal(heavyShare);
        pattern.data = nlohmann::json{{"average_per_session", roundOneDecimal(perSession)},
                                      {"heavy_sessions", heavy},
                                      {"sessions", window.size()}};
        report.patterns.push_back(std::move(pattern));
    }

    return report;
}

bool SessionPatternTracker::updateTrendLocked(const std::string &date, ProductivityTrendPoint *point)
{
    auto it = m_byDate.find(date);
    if (it == m_byDate.end()) {
        return false;
    }
    std::vector<SessionRecord> work;
    for (const auto &record : it->second) {
        if (record.type == SessionType::Work) {
            work.push_back(record);
        }
    }
    if (work.size() < kMinDailyWorkSessions) {
        return false;
    }

    ProductivityTrendPoint updated;
    updated.date = date;
    updated.score = compositeScore(work);
    updated.sessionsCount = static_cast<int>(work.size());

    bool replaced = false;
    for (auto &existing : m_trend) {
        if (existing.date == date) {
            existing = updated;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        m_trend.push(updated);
    }
    *point = updated;
    return true;
}

double SessionPatternTracker::compositeScore(const std::vector<SessionRecord> &workSessions)
{
    if (workSessions.empty()) {
        return 0.0;
    }
    std::size_t completed = 0;
    std::vector<double> efficiency;
    std::vector<double> focus;
    for (const auto &record : workSessions) {
        if (record.completed) {
            ++completed;
        }
        efficiency.push_back(record.efficiencyScore.value_or(0.0));
        focus.push_back(record.focusScore.value_or(0.0));
    }
    const double completionRate = static_cast<double>(completed) / workSessions.size();
    const double score = completionRate * 30.0 + meanOf(efficiency) * 0.4 + meanOf(focus) * 0.3;
    return roundOneDecimal(std::clamp(score, 0.0, 100.0));
}

std::vector<ProductivityTrendPoint> SessionPatternTracker::trendPoints() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_trend.toVector();
}

std::vector<SessionRecord> SessionPatternTracker::sessionsOnDate(const std::string &date) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_byDate.find(date);
    if (it == m_byDate.end()) {
        return {};
    }
    return it->second;
}

std::size_t SessionPatternTracker::historySize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.size();
}

nlohmann::json SessionPatternTracker::snapshotLocked() const
{
    nlohmann::json points = nlohmann::json::array();
    for (const auto &point : m_trend) {
        points.push_back(point);
    }
    return nlohmann::json{
        {"trend_points", points},
        {"last_updated", toIso8601Utc(m_clock())}
    };
}

} // namespace focuslens
