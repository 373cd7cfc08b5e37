#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QObject>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/bounded_history.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/metatypes.hpp"
#include "common/models.hpp"

namespace focuslens {

class AnalyticsStore;
class FocusScoreCalculator;

/**
 * SessionEventStore records the lifecycle of focus sessions.
 *
 * It holds at most one in-progress SessionRecord. Interaction, interruption
 * and sample writes on that record are serialized by one mutex. Finalized
 * records are appended to a capped history, folded into the daily and weekly
 * aggregate maps, persisted as the "sessions" document and announced through
 * sessionFinalized().
 */
class SessionEventStore : public QObject
{
    Q_OBJECT
public:
    SessionEventStore(const EngineConfig &config,
                      const FocusScoreCalculator &calculator,
                      AnalyticsStore *store,
                      Clock clock,
                      QObject *parent = nullptr);

    // Restores history and aggregates from the persisted snapshot.
    void load();

    // Starts a session and returns its id. An already active session is
    // finalized as not completed first.
    std::string startSession(SessionType type, std::chrono::seconds plannedDuration);

    // No-op returning false when no session is active.
    bool recordInteraction(InteractionKind kind,
                           const nlohmann::json &details = nlohmann::json::object(),
                           const std::string &customType = std::string());
    bool recordInterruption(InterruptionEvent event);

    // Periodic tick: appends one FocusSample computed with the per-tick formula.
    std::optional<double> sampleFocus();

    // Returns nullopt when there is nothing to finalize.
    std::optional<SessionRecord> endSession(bool completed);

    bool hasActiveSession() const;
    std::optional<SessionRecord> activeSession() const;

    // Queries return copies so callers never iterate live state.
    std::vector<SessionRecord> history() const;
    std::vector<SessionRecord> sessionsBetween(TimePoint from, TimePoint to) const;
    std::vector<SessionRecord> recentSessions(std::size_t limit) const;
    SessionRecord findSession(const std::string &id) const;

    DailyStats dailyStats(const std::string &date) const;
    WeeklyStats weeklyStats(const std::string &weekKey) const;
    double dailyProductivityScore(const std::string &date) const;
    nlohmann::json statsSummary() const;

    // Drops sessions that started more than `days` days ago.
    std::size_t cleanupOlderThan(int days);

    static double computeEfficiency(const SessionRecord &record);
    static std::chrono::seconds sanitizePlannedDuration(SessionType type,
                                                        std::chrono::seconds planned);

signals:
    void sessionStarted(const QString &sessionId);
    void focusSampled(double score);
    void sessionFinalized(const focuslens::SessionRecord &record);

private:
    SessionRecord finalizeLocked(bool completed, TimePoint now);
    SessionRecord commitActiveLocked(bool completed, TimePoint now);
    void publishFinalized(const SessionRecord &record, const nlohmann::json &snapshot);
    void applyAggregatesLocked(const SessionRecord &record);
    nlohmann::json snapshotLocked() const;

    const FocusScoreCalculator &m_calculator;
    AnalyticsStore *m_store;
    Clock m_clock;
    std::size_t m_historyCap;

    mutable std::mutex m_mutex;
    std::optional<SessionRecord> m_active;
    BoundedHistory<SessionRecord> m_history;
    std::map<std::string, DailyStats> m_dailyStats;
    std::map<std::string, WeeklyStats> m_weeklyStats;
};

} // namespace focuslens
