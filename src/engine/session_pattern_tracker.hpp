#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <QObject>

#include <nlohmann/json.hpp>

#include "common/bounded_history.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/metatypes.hpp"
#include "common/models.hpp"

namespace focuslens {

class AnalyticsStore;

struct BehaviorPattern {
    std::string kind; // optimal_hour, efficiency_trend, interruption_frequency
    std::string description;
    double confidence = 0.0;
    nlohmann::json data = nlohmann::json::object();
};

struct PatternReport {
    bool insufficientData = false;
    std::string message;
    int sessionsAnalyzed = 0;
    std::vector<BehaviorPattern> patterns;
};

/**
 * SessionPatternTracker mines behavioural trends from finalized sessions and
 * keeps the day-level productivity trend series.
 *
 * Mining needs at least five sessions of history and looks at the trailing
 * pattern window only. A trend point is written for a calendar date once that
 * date has three finished work sessions; later sessions on the same date
 * replace the point.
 */
class SessionPatternTracker : public QObject
{
    Q_OBJECT
public:
    SessionPatternTracker(const EngineConfig &config,
                          AnalyticsStore *store,
                          Clock clock,
                          QObject *parent = nullptr);

    // Restores the trend series. History comes back through replayHistory().
    void load();
    void replayHistory(const std::vector<SessionRecord> &records);

    void onSessionFinalized(const SessionRecord &record);

    PatternReport patterns() const;
    std::vector<ProductivityTrendPoint> trendPoints() const;
    std::vector<SessionRecord> sessionsOnDate(const std::string &date) const;
    std::size_t historySize() const;

    // completion_rate x 30 + mean(efficiency) x 0.4 + mean(focus) x 0.3.
    static double compositeScore(const std::vector<SessionRecord> &workSessions);

signals:
    void trendUpdated(const focuslens::ProductivityTrendPoint &point);
    void patternsDetected(int count);

private:
    void appendLocked(const SessionRecord &record);
    PatternReport minePatternsLocked() const;
    bool updateTrendLocked(const std::string &date, ProductivityTrendPoint *point);
    nlohmann::json snapshotLocked() const;

    int m_windowDays;
    AnalyticsStore *m_store;
    Clock m_clock;

    mutable std::mutex m_mutex;
    BoundedHistory<SessionRecord> m_history;
    std::map<std::string, std::vector<SessionRecord>> m_byDate;
    BoundedHistory<ProductivityTrendPoint> m_trend;
};

} // namespace focuslens
