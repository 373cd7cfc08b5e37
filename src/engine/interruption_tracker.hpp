#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QMetaType>
#include <QObject>

#include <nlohmann/json.hpp>

#include "common/bounded_history.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/metatypes.hpp"
#include "common/models.hpp"

namespace focuslens {

class AnalyticsStore;

enum class TrackerState {
    Idle,
    Active,
    Paused
};

// Per-session interruption tally kept across sessions for pattern mining.
struct InterruptionHistoryEntry {
    std::string sessionId;
    TimePoint timestamp;
    int hour = 0;
    int total = 0;
    std::map<std::string, int> counts;
    std::map<std::string, int> severities;
    long long totalDurationSeconds = 0;
};

struct InterruptionPattern {
    std::string kind; // high_frequency, dominant_type, time_of_day
    std::string description;
    std::string recommendation;
    Severity severity = Severity::Medium;
    nlohmann::json data = nlohmann::json::object();
};

struct InterruptionSummary {
    int sessions = 0;
    int total = 0;
    std::map<std::string, int> byType;
    std::map<std::string, int> bySeverity;
    double averageDurationSeconds = 0.0;
};

/**
 * InterruptionTracker detects engagement breaks inside the active session.
 *
 * Pauses shorter than the pause threshold are dropped silently. The watchdog
 * (checkInactivity) commits one inactivity interruption per idle gap and then
 * restarts the activity clock. Committed events are returned to the caller,
 * which appends them to the session record, and announced through
 * interruptionDetected().
 */
class InterruptionTracker : public QObject
{
    Q_OBJECT
public:
    InterruptionTracker(const EngineConfig &config,
                        AnalyticsStore *store,
                        Clock clock,
                        QObject *parent = nullptr);

    void load();

    void beginSession(const std::string &sessionId);
    // Leaves the tracker idle. An open pause is closed and committed when it
    // already crossed the threshold.
    std::optional<InterruptionEvent> endSession();

    bool recordPauseStart();
    std::optional<InterruptionEvent> recordPauseEnd();
    std::optional<InterruptionEvent> recordUserActivity();
    std::optional<InterruptionEvent> recordExternalInterruption(const std::string &type,
                                                                const std::string &description);
    std::optional<InterruptionEvent> checkInactivity();

    TrackerState state() const;

    // Aggregates the finalized session into history and mines patterns once
    // enough sessions are known.
    std::vector<InterruptionPattern> onSessionFinalized(const SessionRecord &record);

    std::vector<InterruptionHistoryEntry> history() const;
    std::vector<InterruptionPattern> lastPatterns() const;
    InterruptionSummary interruptionSummary(TimePoint from, TimePoint to) const;

    static Severity severityFor(std::chrono::seconds duration);
    static Severity externalSeverity(const std::string &type);
    static std::string recommendationForType(const std::string &typeName);

signals:
    void interruptionDetected(const focuslens::InterruptionEvent &event);
    void patternDetected(const focuslens::InterruptionPattern &pattern);

private:
    InterruptionEvent makeEventLocked(InterruptionKind kind,
                                      TimePoint startedAt,
                                      std::chrono::seconds duration) const;
    std::optional<InterruptionEvent> closePauseLocked(TimePoint now);
    std::vector<InterruptionPattern> minePatternsLocked() const;
    nlohmann::json snapshotLocked() const;
    void announce(const std::optional<InterruptionEvent> &event);

    std::chrono::seconds m_pauseThreshold;
    std::chrono::seconds m_inactivityThreshold;
    AnalyticsStore *m_store;
    Clock m_clock;

    mutable std::mutex m_mutex;
    TrackerState m_state = TrackerState::Idle;
    std::string m_sessionId;
    TimePoint m_pauseStartedAt;
    TimePoint m_lastActivity;
    BoundedHistory<InterruptionHistoryEntry> m_history;
    std::vector<InterruptionPattern> m_lastPatterns;
};

std::string toTrackerStateString(TrackerState state);

} // namespace focuslens

Q_DECLARE_METATYPE(focuslens::InterruptionPattern)
