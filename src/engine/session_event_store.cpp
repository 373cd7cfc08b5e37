#include "engine/session_event_store.hpp"

#include <algorithm>
#include <cmath>

#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/analytics_store.hpp"
#include "engine/environment_correlator.hpp"
#include "engine/focus_score_calculator.hpp"

namespace focuslens {

namespace {

constexpr const char *kDocumentName = "sessions";
constexpr auto kMaxPlannedDuration = std::chrono::minutes(1440);
constexpr auto kBreakFallback = std::chrono::minutes(5);
constexpr auto kWorkFallback = std::chrono::minutes(25);
constexpr int kIdealDailySessions = 8;

std::string generateSessionId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

double roundOneDecimal(double value)
{
    return std::round(value * 10.0) / 10.0;
}

} // namespace

SessionEventStore::SessionEventStore(const EngineConfig &config,
                                     const FocusScoreCalculator &calculator,
                                     AnalyticsStore *store,
                                     Clock clock,
                                     QObject *parent)
    : QObject(parent)
    , m_calculator(calculator)
    , m_store(store)
    , m_clock(std::move(clock))
    , m_historyCap(config.sessionHistoryCap)
    , m_history(config.sessionHistoryCap)
{
}

void SessionEventStore::load()
{
    if (!m_store) {
        return;
    }

    std::optional<nlohmann::json> document;
    try {
        document = m_store->loadDocument(kDocumentName);
    } catch (const std::exception &ex) {
        FLOG_WARN("SessionEventStore", "load", "snapshot_read_failed",
                  (nlohmann::json{{"error", ex.what()}}));
        return;
    }
    if (!document || !document->is_object()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
    m_dailyStats.clear();
    m_weeklyStats.clear();

    if (document->contains("sessions") && document->at("sessions").is_array()) {
        for (const auto &item : document->at("sessions")) {
            try {
                SessionRecord record = item.get<SessionRecord>();
                record.finalized = true;
                m_history.push(std::move(record));
            } catch (const nlohmann::json::exception &ex) {
                FLOG_WARN("SessionEventStore", "load", "session_entry_skipped",
                          (nlohmann::json{{"error", ex.what()}}));
            }
        }
    }

    const bool hasDaily = document->contains("daily_stats")
        && document->at("daily_stats").is_object();
    const bool hasWeekly = document->contains("weekly_stats")
        && document->at("weekly_stats").is_object();
    bool aggregatesLoaded = false;
    if (hasDaily && hasWeekly) {
        try {
            for (const auto &item : document->at("daily_stats").items()) {
                m_dailyStats[item.key()] = item.value().get<DailyStats>();
            }
            for (const auto &item : document->at("weekly_stats").items()) {
                m_weeklyStats[item.key()] = item.value().get<WeeklyStats>();
            }
            aggregatesLoaded = true;
        } catch (const nlohmann::json::exception &ex) {
            FLOG_WARN("SessionEventStore", "load", "aggregates_rebuilt",
                      (nlohmann::json{{"error", ex.what()}}));
            m_dailyStats.clear();
            m_weeklyStats.clear();
        }
    }
    if (!aggregatesLoaded) {
        for (const auto &record : m_history) {
            applyAggregatesLocked(record);
        }
    }

    FLOG_INFO("SessionEventStore", "load", "history_restored",
              (nlohmann::json{{"sessions", m_history.size()}}));
}

std::string SessionEventStore::startSession(SessionType type, std::chrono::seconds plannedDuration)
{
    const TimePoint now = m_clock();
    SessionRecord record;
    record.id = generateSessionId();
    record.type = type;
    record.plannedDuration = sanitizePlannedDuration(type, plannedDuration);
    record.startTime = now;
    record.environment = makeEnvironmentTag(now);

    const std::string id = record.id;
    const long long plannedSeconds = record.plannedDuration.count();
    std::optional<SessionRecord> replaced;
    nlohmann::json snapshot;
    {
        // A second start finalizes the running session before replacing it.
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_active) {
            replaced = commitActiveLocked(false, now);
            snapshot = snapshotLocked();
        }
        m_active = std::move(record);
    }

    if (replaced) {
        FLOG_WARN("SessionEventStore", "startSession", "replacing_active_session",
                  (nlohmann::json{{"replacedId", replaced->id}}));
        publishFinalized(*replaced, snapshot);
    }

    logging::SessionScope scope(id);
    FLOG_INFO("SessionEventStore", "startSession", "session_started",
              (nlohmann::json{{"type", toSessionTypeString(type)},
                              {"plannedSeconds", plannedSeconds}}));
    emit sessionStarted(QString::fromStdString(id));
    return id;
}

bool SessionEventStore::recordInteraction(InteractionKind kind,
                                          const nlohmann::json &details,
                                          const std::string &customType)
{
    const TimePoint now = m_clock();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_active) {
        return false;
    }

    InteractionEvent event;
    event.timestamp = now;
    event.kind = kind;
    event.customType = kind == InteractionKind::Custom ? customType : std::string();
    event.details = details.is_object() ? details : nlohmann::json::object();
    event.sessionOffset = std::chrono::duration_cast<std::chrono::seconds>(now - m_active->startTime);
    m_active->interactions.push_back(std::move(event));
    return true;
}

bool SessionEventStore::recordInterruption(InterruptionEvent event)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_active) {
        return false;
    }
    event.sessionOffset = std::chrono::duration_cast<std::chrono::seconds>(
        event.startedAt - m_active->startTime);
    if (event.sessionOffset.count() < 0) {
        event.sessionOffset = std::chrono::seconds{0};
    }
    m_active->interruptions.push_back(std::move(event));
    return true;
}

std::optional<double> SessionEventStore::sampleFocus()
{
    const TimePoint now = m_clock();
    double score = 0.0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active) {
            return std::nullopt;
        }
        score = m_calculator.tickScore(*m_active, now);
        m_active->focusSamples.push_back(FocusSample{now, score});
    }
    emit focusSampled(score);
    return score;
}

std::optional<SessionRecord> SessionEventStore::endSession(bool completed)
{
    const TimePoint now = m_clock();
    SessionRecord record;
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active) {
            FLOG_DEBUG("SessionEventStore", "endSession", "no_active_session",
                       nlohmann::json::object());
            return std::nullopt;
        }
        record = commitActiveLocked(completed, now);
        snapshot = snapshotLocked();
    }

    publishFinalized(record, snapshot);
    return record;
}

SessionRecord SessionEventStore::commitActiveLocked(bool completed, TimePoint now)
{
    SessionRecord record = finalizeLocked(completed, now);
    m_history.push(record);
    applyAggregatesLocked(record);
    return record;
}

void SessionEventStore::publishFinalized(const SessionRecord &record, const nlohmann::json &snapshot)
{
    logging::SessionScope scope(record.id);
    FLOG_INFO("SessionEventStore", "endSession", "session_finalized",
              (nlohmann::json{{"completed", record.completed},
                              {"actualSeconds", record.actualDuration.count()},
                              {"focusScore", *record.focusScore},
                              {"efficiencyScore", *record.efficiencyScore},
                              {"interruptions", record.interruptions.size()}}));

    saveDocumentBestEffort(m_store, kDocumentName, snapshot);
    emit sessionFinalized(record);
}

SessionRecord SessionEventStore::finalizeLocked(bool completed, TimePoint now)
{
    SessionRecord record = std::move(*m_active);
    m_active.reset();

    if (now < record.startTime) {
        now = record.startTime;
    }
    record.endTime = now;
    record.actualDuration = std::chrono::duration_cast<std::chrono::seconds>(now - record.startTime);
    record.completed = completed;

    // Sessions shorter than one tick still get a defined focus score.
    if (record.focusSamples.empty()) {
        record.focusSamples.push_back(FocusSample{now, m_calculator.tickScore(record, now)});
    }
    double total = 0.0;
    for (const auto &sample : record.focusSamples) {
        total += sample.score;
    }
    record.focusScore = roundOneDecimal(total / static_cast<double>(record.focusSamples.size()));
    record.efficiencyScore = computeEfficiency(record);
    record.finalized = true;
    return record;
}

void SessionEventStore::applyAggregatesLocked(const SessionRecord &record)
{
    const std::string dateKey = localDateKey(record.startTime);
    const std::string weekKey = isoWeekKey(record.startTime);
    const int minutes = static_cast<int>(
        std::chrono::duration_cast<std::chrono::minutes>(record.actualDuration).count());

    DailyStats &daily = m_dailyStats[dateKey];
    daily.date = dateKey;
    WeeklyStats &weekly = m_weeklyStats[weekKey];
    weekly.weekKey = weekKey;

    if (record.type == SessionType::Work) {
        daily.workSessions++;
        daily.workMinutes += minutes;
        weekly.workSessions++;
        weekly.workMinutes += minutes;
    } else {
        daily.breakSessions++;
        daily.breakMinutes += minutes;
        weekly.breakSessions++;
        weekly.breakMinutes += minutes;
    }
    if (record.completed) {
        daily.completedSessions++;
        weekly.completedSessions++;
    }
}

nlohmann::json SessionEventStore::snapshotLocked() const
{
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto &record : m_history) {
        sessions.push_back(record);
    }
    nlohmann::json daily = nlohmann::json::object();
    for (const auto &entry : m_dailyStats) {
        daily[entry.first] = entry.second;
    }
    nlohmann::json weekly = nlohmann::json::object();
    for (const auto &entry : m_weeklyStats) {
        weekly[entry.first] = entry.second;
    }
    return nlohmann::json{
        {"sessions", sessions},
        {"daily_stats", daily},
        {"weekly_stats", weekly},
        {"last_updated", toIso8601Utc(m_clock())}
    };
}

bool SessionEventStore::hasActiveSession() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.has_value();
}

std::optional<SessionRecord> SessionEventStore::activeSession() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

std::vector<SessionRecord> SessionEventStore::history() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.toVector();
}

std::vector<SessionRecord> SessionEventStore::sessionsBetween(TimePoint from, TimePoint to) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SessionRecord> result;
    for (const auto &record : m_history) {
        if (record.startTime >= from && record.startTime < to) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<SessionRecord> SessionEventStore::recentSessions(std::size_t limit) const
{
    std::vector<SessionRecord> sessions = history();
    std::sort(sessions.begin(), sessions.end(),
              [](const SessionRecord &a, const SessionRecord &b) {
                  return a.startTime > b.startTime;
              });
    if (sessions.size() > limit) {
        sessions.resize(limit);
    }
    return sessions;
}

SessionRecord SessionEventStore::findSession(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &record : m_history) {
        if (record.id == id) {
            return record;
        }
    }
    throw NotFoundError("session not found: " + id);
}

DailyStats SessionEventStore::dailyStats(const std::string &date) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_dailyStats.find(date);
    if (it == m_dailyStats.end()) {
        DailyStats empty;
        empty.date = date;
        return empty;
    }
    return it->second;
}

WeeklyStats SessionEventStore::weeklyStats(const std::string &weekKey) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_weeklyStats.find(weekKey);
    if (it == m_weeklyStats.end()) {
        WeeklyStats empty;
        empty.weekKey = weekKey;
        return empty;
    }
    return it->second;
}

double SessionEventStore::dailyProductivityScore(const std::string &date) const
{
    int work = 0;
    int completedWork = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &record : m_history) {
            if (record.type != SessionType::Work || localDateKey(record.startTime) != date) {
                continue;
            }
            ++work;
            if (record.completed) {
                ++completedWork;
            }
        }
    }
    if (work == 0 || completedWork == 0) {
        return 0.0;
    }

    const double completionRate = static_cast<double>(completedWork) / work;
    const double sessionScore = std::min(1.0, static_cast<double>(completedWork) / kIdealDailySessions);
    return roundOneDecimal((completionRate * 0.6 + sessionScore * 0.4) * 100.0);
}

nlohmann::json SessionEventStore::statsSummary() const
{
    const TimePoint now = m_clock();
    const DailyStats today = dailyStats(localDateKey(now));
    const WeeklyStats week = weeklyStats(isoWeekKey(now));

    int totalSessions = 0;
    long long totalWorkMinutes = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        totalSessions = static_cast<int>(m_history.size());
        for (const auto &record : m_history) {
            if (record.type == SessionType::Work) {
                totalWorkMinutes += std::chrono::duration_cast<std::chrono::minutes>(
                                        record.actualDuration)
                                        .count();
            }
        }
    }

    return nlohmann::json{
        {"today", {
            {"work_sessions", today.workSessions},
            {"work_time", today.workMinutes},
            {"break_time", today.breakMinutes},
            {"productivity_score", dailyProductivityScore(today.date)}
        }},
        {"week", {
            {"work_sessions", week.workSessions},
            {"work_time", week.workMinutes},
            {"break_time", week.breakMinutes}
        }},
        {"total", {
            {"sessions", totalSessions},
            {"work_time", totalWorkMinutes}
        }}
    };
}

std::size_t SessionEventStore::cleanupOlderThan(int days)
{
    const TimePoint cutoff = daysBefore(m_clock(), days);
    std::size_t removed = 0;
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        BoundedHistory<SessionRecord> kept(m_historyCap);
        for (const auto &record : m_history) {
            if (record.startTime >= cutoff) {
                kept.push(record);
            } else {
                ++removed;
            }
        }
        if (removed == 0) {
            return 0;
        }
        m_history = std::move(kept);
        snapshot = snapshotLocked();
    }

    FLOG_INFO("SessionEventStore", "cleanupOlderThan", "old_sessions_removed",
              (nlohmann::json{{"removed", removed}, {"days", days}}));
    saveDocumentBestEffort(m_store, kDocumentName, snapshot);
    return removed;
}

double SessionEventStore::computeEfficiency(const SessionRecord &record)
{
    if (record.plannedDuration.count() <= 0) {
        return 0.0;
    }
    const double ratio = std::min(1.0, static_cast<double>(record.actualDuration.count())
                                           / static_cast<double>(record.plannedDuration.count()));
    const double penalty = std::max(0.5, 1.0 - 0.1 * static_cast<double>(record.interruptions.size()));
    return roundOneDecimal(std::clamp(ratio * 100.0 * penalty, 0.0, 100.0));
}

std::chrono::seconds SessionEventStore::sanitizePlannedDuration(SessionType type,
                                                                std::chrono::seconds planned)
{
    if (planned.count() > 0 && planned <= kMaxPlannedDuration) {
        return planned;
    }

    const std::chrono::seconds fallback = type == SessionType::Break
        ? std::chrono::seconds(kBreakFallback)
        : std::chrono::seconds(kWorkFallback);
    FLOG_WARN("SessionEventStore", "sanitizePlannedDuration", "planned_duration_reset",
              (nlohmann::json{{"type", toSessionTypeString(type)},
                              {"receivedSeconds", planned.count()},
                              {"fallbackSeconds", fallback.count()}}));
    return fallback;
}

} // namespace focuslens
