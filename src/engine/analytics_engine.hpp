#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <QObject>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/metatypes.hpp"
#include "common/models.hpp"
#include "engine/focus_score_calculator.hpp"
#include "engine/interruption_tracker.hpp"

class QTimer;

namespace focuslens {

class AnalyticsStore;
class ComparisonAnalytics;
class EnvironmentCorrelator;
class ReportBuilder;
class ReportsEngine;
class SessionEventStore;
class SessionPatternTracker;

/**
 * AnalyticsEngine owns the store and every analytics component.
 *
 * It is constructed once by the host application (or a tool's main()) and
 * driven by the timer controller through the session API below. While a
 * session is active two QTimers run on the Qt event loop: the focus sampler
 * and the inactivity watchdog. Finalized records are delivered to the
 * interruption tracker, environment correlator and pattern tracker through
 * SessionEventStore::sessionFinalized.
 */
class AnalyticsEngine : public QObject
{
    Q_OBJECT
public:
    explicit AnalyticsEngine(const EngineConfig &config,
                             Clock clock = systemClock(),
                             QObject *parent = nullptr);
    ~AnalyticsEngine() override;

    std::string startSession(SessionType type, std::chrono::seconds plannedDuration);
    bool recordInteraction(InteractionKind kind,
                           const nlohmann::json &details = nlohmann::json::object(),
                           const std::string &customType = std::string());
    bool pauseSession();
    bool resumeSession();
    bool recordExternalInterruption(const std::string &type, const std::string &description);
    std::optional<double> sampleNow();
    std::optional<FocusAssessment> evaluateFocus();
    bool checkInactivity();
    std::optional<SessionRecord> endSession(bool completed);

    const EngineConfig &config() const;
    // Null when the database could not be opened; the engine then runs in memory.
    AnalyticsStore *store() const;
    SessionEventStore &sessions() const;
    FocusScoreCalculator &calculator() const;
    InterruptionTracker &interruptions() const;
    EnvironmentCorrelator &environment() const;
    SessionPatternTracker &patterns() const;
    ComparisonAnalytics &comparisons() const;
    ReportsEngine &reports() const;
    ReportBuilder &builder() const;

signals:
    void sessionStarted(const QString &sessionId);
    void sessionFinalized(const focuslens::SessionRecord &record);
    void focusScoreUpdated(double score);
    void focusLevelChanged(focuslens::FocusLevel previous, focuslens::FocusLevel current);
    void interruptionDetected(const focuslens::InterruptionEvent &event);
    void patternDetected(const focuslens::InterruptionPattern &pattern);
    void trendUpdated(const focuslens::ProductivityTrendPoint &point);

private slots:
    void runSampleTick();
    void runWatchdogTick();

private:
    void openStore();
    void loadState();
    void wireComponents();
    void commitInterruption(const std::optional<InterruptionEvent> &event);
    void stopTimers();

    EngineConfig m_config;
    Clock m_clock;

    std::unique_ptr<AnalyticsStore> m_store;
    std::unique_ptr<FocusScoreCalculator> m_calculator;
    std::unique_ptr<SessionEventStore> m_sessions;
    std::unique_ptr<InterruptionTracker> m_interruptions;
    std::unique_ptr<EnvironmentCorrelator> m_environment;
    std::unique_ptr<SessionPatternTracker> m_patterns;
    std::unique_ptr<ComparisonAnalytics> m_comparisons;
    std::unique_ptr<ReportsEngine> m_reports;
    std::unique_ptr<ReportBuilder> m_builder;

    QTimer *m_sampleTimer = nullptr;
    QTimer *m_watchdogTimer = nullptr;
};

} // namespace focuslens
