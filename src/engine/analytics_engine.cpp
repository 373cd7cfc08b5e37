#include "engine/analytics_engine.hpp"

#include <algorithm>
#include <limits>

#include <QTimer>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/analytics_store.hpp"
#include "engine/comparison_analytics.hpp"
#include "engine/environment_correlator.hpp"
#include "engine/report_builder.hpp"
#include "engine/reports_engine.hpp"
#include "engine/session_event_store.hpp"
#include "engine/session_pattern_tracker.hpp"

namespace focuslens {

namespace {

int toMilliseconds(std::chrono::seconds interval)
{
    const long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(interval).count();
    return static_cast<int>(std::clamp<long long>(ms, 1, std::numeric_limits<int>::max()));
}

} // namespace

AnalyticsEngine::AnalyticsEngine(const EngineConfig &config, Clock clock, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_clock(std::move(clock))
{
    qRegisterMetaType<focuslens::FocusLevel>();
    qRegisterMetaType<focuslens::SessionRecord>();
    qRegisterMetaType<focuslens::InterruptionEvent>();
    qRegisterMetaType<focuslens::InterruptionPattern>();
    qRegisterMetaType<focuslens::ProductivityTrendPoint>();

    openStore();

    AnalyticsStore *store = m_store.get();
    m_calculator = std::make_unique<FocusScoreCalculator>(m_config.optimalSessionLength);
    m_sessions = std::make_unique<SessionEventStore>(m_config, *m_calculator, store, m_clock);
    m_interruptions = std::make_unique<InterruptionTracker>(m_config, store, m_clock);
    m_environment = std::make_unique<EnvironmentCorrelator>(m_config, store, m_clock);
    m_patterns = std::make_unique<SessionPatternTracker>(m_config, store, m_clock);
    m_comparisons = std::make_unique<ComparisonAnalytics>(*m_sessions, m_config, m_clock);
    m_reports = std::make_unique<ReportsEngine>(*m_sessions, *m_interruptions, *m_environment,
                                                *m_patterns, m_config, m_clock);
    m_builder = std::make_unique<ReportBuilder>(*m_reports, *m_comparisons, *m_sessions,
                                                *m_environment, store, m_clock);

    m_sampleTimer = new QTimer(this);
    m_sampleTimer->setInterval(toMilliseconds(m_config.sampleInterval));
    connect(m_sampleTimer, &QTimer::timeout, this, &AnalyticsEngine::runSampleTick);

    m_watchdogTimer = new QTimer(this);
    m_watchdogTimer->setInterval(toMilliseconds(m_config.watchdogInterval));
    connect(m_watchdogTimer, &QTimer::timeout, this, &AnalyticsEngine::runWatchdogTick);

    wireComponents();
    loadState();
}

AnalyticsEngine::~AnalyticsEngine()
{
    stopTimers();
}

void AnalyticsEngine::openStore()
{
    if (m_config.dataDir.empty()) {
        FLOG_INFO("AnalyticsEngine", "openStore", "persistence_disabled", nlohmann::json::object());
        return;
    }

    try {
        m_store = std::make_unique<AnalyticsStore>(m_config.dataDir);
    } catch (const std::exception &ex) {
        FLOG_ERROR("AnalyticsEngine", "openStore", "store_open_failed",
                   (nlohmann::json{{"dataDir", m_config.dataDir}, {"error", ex.what()}}));
        return;
    }

    std::string integrityMessage;
    bool healthy = false;
    try {
        healthy = m_store->integrityCheck(&integrityMessage);
    } catch (const std::exception &ex) {
        integrityMessage = ex.what();
    }
    if (!healthy) {
        // Running in memory keeps a damaged database from being overwritten.
        FLOG_ERROR("AnalyticsEngine", "openStore", "integrity_check_failed",
                   (nlohmann::json{{"path", m_store->databasePath()}, {"message", integrityMessage}}));
        m_store.reset();
    }
}

void AnalyticsEngine::loadState()
{
    m_sessions->load();
    m_interruptions->load();
    m_environment->load();
    m_patterns->load();
    m_builder->load();
    m_patterns->replayHistory(m_sessions->history());

    FLOG_INFO("AnalyticsEngine", "loadState", "engine_ready",
              (nlohmann::json{{"sessions", m_patterns->historySize()},
                              {"persistent", m_store != nullptr}}));
}

void AnalyticsEngine::wireComponents()
{
    connect(m_calculator.get(), &FocusScoreCalculator::focusScoreUpdated,
            this, &AnalyticsEngine::focusScoreUpdated);
    connect(m_calculator.get(), &FocusScoreCalculator::focusLevelChanged,
            this, &AnalyticsEngine::focusLevelChanged);
    connect(m_interruptions.get(), &InterruptionTracker::interruptionDetected,
            this, &AnalyticsEngine::interruptionDetected);
    connect(m_interruptions.get(), &InterruptionTracker::patternDetected,
            this, &AnalyticsEngine::patternDetected);
    connect(m_patterns.get(), &SessionPatternTracker::trendUpdated,
            this, &AnalyticsEngine::trendUpdated);
    connect(m_sessions.get(), &SessionEventStore::sessionStarted,
            this, &AnalyticsEngine::sessionStarted);

    connect(m_sessions.get(), &SessionEventStore::sessionFinalized, this,
            [this](const SessionRecord &record) {
                logging::SessionScope scope(record.id);
                m_interruptions->onSessionFinalized(record);
                m_environment->onSessionFinalized(record);
                m_patterns->onSessionFinalized(record);
                emit sessionFinalized(record);
            });
}

std::string AnalyticsEngine::startSession(SessionType type, std::chrono::seconds plannedDuration)
{
    if (m_sessions->hasActiveSession()) {
        endSession(false);
    }

    const std::string id = m_sessions->startSession(type, plannedDuration);
    m_calculator->reset();
    m_interruptions->beginSession(id);
    m_sampleTimer->start();
    m_watchdogTimer->start();
    return id;
}

bool AnalyticsEngine::recordInteraction(InteractionKind kind,
                                        const nlohmann::json &details,
                                        const std::string &customType)
{
    if (!m_sessions->recordInteraction(kind, details, customType)) {
        return false;
    }
    commitInterruption(m_interruptions->recordUserActivity());
    return true;
}

bool AnalyticsEngine::pauseSession()
{
    return m_interruptions->recordPauseStart();
}

bool AnalyticsEngine::resumeSession()
{
    if (m_interruptions->state() != TrackerState::Paused) {
        return false;
    }
    commitInterruption(m_interruptions->recordPauseEnd());
    return true;
}

bool AnalyticsEngine::recordExternalInterruption(const std::string &type, const std::string &description)
{
    const auto event = m_interruptions->recordExternalInterruption(type, description);
    commitInterruption(event);
    return event.has_value();
}

std::optional<double> AnalyticsEngine::sampleNow()
{
    return m_sessions->sampleFocus();
}

std::optional<FocusAssessment> AnalyticsEngine::evaluateFocus()
{
    const auto active = m_sessions->activeSession();
    if (!active) {
        return std::nullopt;
    }
    return m_calculator->evaluate(*active, m_clock());
}

bool AnalyticsEngine::checkInactivity()
{
    const auto event = m_interruptions->checkInactivity();
    commitInterruption(event);
    return event.has_value();
}

std::optional<SessionRecord> AnalyticsEngine::endSession(bool completed)
{
    stopTimers();
    if (!m_sessions->hasActiveSession()) {
        return std::nullopt;
    }
    commitInterruption(m_interruptions->endSession());
    return m_sessions->endSession(completed);
}

void AnalyticsEngine::commitInterruption(const std::optional<InterruptionEvent> &event)
{
    if (event) {
        m_sessions->recordInterruption(*event);
    }
}

void AnalyticsEngine::runSampleTick()
{
    if (!m_sessions->sampleFocus()) {
        stopTimers();
        return;
    }
    evaluateFocus();
}

void AnalyticsEngine::runWatchdogTick()
{
    checkInactivity();
}

void AnalyticsEngine::stopTimers()
{
    if (m_sampleTimer) {
        m_sampleTimer->stop();
    }
    if (m_watchdogTimer) {
        m_watchdogTimer->stop();
    }
}

const EngineConfig &AnalyticsEngine::config() const
{
    return m_config;
}

AnalyticsStore *AnalyticsEngine::store() const
{
    return m_store.get();
}

SessionEventStore &AnalyticsEngine::sessions() const
{
    return *m_sessions;
}

FocusScoreCalculator &AnalyticsEngine::calculator() const
{
    return *m_calculator;
}

InterruptionTracker &AnalyticsEngine::interruptions() const
{
    return *m_interruptions;
}

EnvironmentCorrelator &AnalyticsEngine::environment() const
{
    return *m_environment;
}

SessionPatternTracker &AnalyticsEngine::patterns() const
{
    return *m_patterns;
}

ComparisonAnalytics &AnalyticsEngine::comparisons() const
{
    return *m_comparisons;
}

ReportsEngine &AnalyticsEngine::reports() const
{
    return *m_reports;
}

ReportBuilder &AnalyticsEngine::builder() const
{
    return *m_builder;
}

} // namespace focuslens
