#include "engine/interruption_tracker.hpp"

#include <algorithm>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/analytics_store.hpp"

namespace focuslens {

namespace {

constexpr const char *kDocumentName = "interruptions";
constexpr auto kLowSeverityLimit = std::chrono::seconds(30);
constexpr auto kMediumSeverityLimit = std::chrono::seconds(120);
constexpr std::size_t kMinHistoryForPatterns = 3;
constexpr std::size_t kFrequencyWindow = 5;
constexpr double kFrequencyAlertAverage = 5.0;
constexpr double kDominantTypeFactor = 2.0;
constexpr double kHourAlertAverage = 4.0;
constexpr int kHourMinSessions = 2;

nlohmann::json entryToJson(const InterruptionHistoryEntry &entry)
{
    return nlohmann::json{
        {"session_id", entry.sessionId},
        {"timestamp", toIso8601Utc(entry.timestamp)},
        {"hour", entry.hour},
        {"total", entry.total},
        {"counts", entry.counts},
        {"severities", entry.severities},
        {"total_duration", entry.totalDurationSeconds}
    };
}

InterruptionHistoryEntry entryFromJson(const nlohmann::json &j)
{
    InterruptionHistoryEntry entry;
    entry.sessionId = j.value("session_id", "");
    entry.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    entry.hour = j.value("hour", 0);
    entry.total = j.value("total", 0);
    if (j.contains("counts") && j.at("counts").is_object()) {
        entry.counts = j.at("counts").get<std::map<std::string, int>>();
    }
    if (j.contains("severities") && j.at("severities").is_object()) {
        entry.severities = j.at("severities").get<std::map<std::string, int>>();
    }
    entry.totalDurationSeconds = j.value("total_duration", 0LL);
    return entry;
}

nlohmann::json patternToJson(const InterruptionPattern &pattern)
{
    return nlohmann::json{
        {"kind", pattern.kind},
        {"description", pattern.description},
        {"recommendation", pattern.recommendation},
        {"severity", toSeverityString(pattern.severity)},
        {"data", pattern.data}
    };
}

InterruptionPattern patternFromJson(const nlohmann::json &j)
{
    InterruptionPattern pattern;
    pattern.kind = j.value("kind", "");
    pattern.description = j.value("description", "");
    pattern.recommendation = j.value("recommendation", "");
    pattern.severity = parseSeverityString(j.value("severity", "medium"));
    if (j.contains("data") && j.at("data").is_object()) {
        pattern.data = j.at("data");
    }
    return pattern;
}

} // namespace

std::string toTrackerStateString(TrackerState state)
{
    switch (state) {
    case TrackerState::Idle:
        return "idle";
    case TrackerState::Active:
        return "active";
    case TrackerState::Paused:
        return "paused";
    }
    return "idle";
}

InterruptionTracker::InterruptionTracker(const EngineConfig &config,
                                         AnalyticsStore *store,
                                         Clock clock,
                                         QObject *parent)
    : QObject(parent)
    , m_pauseThreshold(config.pauseThreshold)
    , m_inactivityThreshold(config.inactivityThreshold)
    , m_store(store)
    , m_clock(std::move(clock))
    , m_history(config.interruptionHistoryCap)
{
}

void InterruptionTracker::load()
{
    if (!m_store) {
        return;
    }

    std::optional<nlohmann::json> document;
    try {
        document = m_store->loadDocument(kDocumentName);
    } catch (const std::exception &ex) {
        FLOG_WARN("InterruptionTracker", "load", "snapshot_read_failed",
                  (nlohmann::json{{"error", ex.what()}}));
        return;
    }
    if (!document || !document->is_object()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
    m_lastPatterns.clear();
    try {
        for (const auto &item : document->value("history", nlohmann::json::array())) {
            m_history.push(entryFromJson(item));
        }
        for (const auto &item : document->value("patterns", nlohmann::json::array())) {
            m_lastPatterns.push_back(patternFromJson(item));
        }
    } catch (const nlohmann::json::exception &ex) {
        FLOG_WARN("InterruptionTracker", "load", "snapshot_malformed",
                  (nlohmann::json{{"error", ex.what()}}));
    }
}

void InterruptionTracker::beginSession(const std::string &sessionId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessionId = sessionId;
    m_state = TrackerState::Active;
    m_lastActivity = m_clock();
}

std::optional<InterruptionEvent> InterruptionTracker::endSession()
{
    std::optional<InterruptionEvent> committed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == TrackerState::Paused) {
            committed = closePauseLocked(m_clock());
        }
        m_state = TrackerState::Idle;
        m_sessionId.clear();
    }
    announce(committed);
    return committed;
}

bool InterruptionTracker::recordPauseStart()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != TrackerState::Active) {
        return false;
    }
    m_state = TrackerState::Paused;
    m_pauseStartedAt = m_clock();
    return true;
}

std::optional<InterruptionEvent> InterruptionTracker::recordPauseEnd()
{
    std::optional<InterruptionEvent> committed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != TrackerState::Paused) {
            return std::nullopt;
        }
        const TimePoint now = m_clock();
        committed = closePauseLocked(now);
        m_state = TrackerState::Active;
        m_lastActivity = now;
    }
    announce(committed);
    return committed;
}

std::optional<InterruptionEvent> InterruptionTracker::recordUserActivity()
{
    std::optional<InterruptionEvent> committed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == TrackerState::Idle) {
            return std::nullopt;
        }
        const TimePoint now = m_clock();
        if (m_state == TrackerState::Paused) {
            committed = closePauseLocked(now);
        }
        m_state = TrackerState::Active;
        m_lastActivity = now;
    }
    announce(committed);
    return committed;
}

std::optional<InterruptionEvent> InterruptionTracker::recordExternalInterruption(
    const std::string &type,
    const std::string &description)
{
    std::optional<InterruptionEvent> committed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == TrackerState::Idle) {
            return std::nullopt;
        }
        InterruptionEvent event = makeEventLocked(InterruptionKind::External, m_clock(),
                                                  std::chrono::seconds{0});
        event.externalType = type.empty() ? std::string("other") : type;
        event.description = description;
        event.severity = externalSeverity(event.externalType);
        committed = std::move(event);
    }
    announce(committed);
    return committed;
}

std::optional<InterruptionEvent> InterruptionTracker::checkInactivity()
{
    std::optional<InterruptionEvent> committed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != TrackerState::Active) {
            return std::nullopt;
        }
        const TimePoint now = m_clock();
        const auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - m_lastActivity);
        if (idle < m_inactivityThreshold) {
            return std::nullopt;
        }
        InterruptionEvent event = makeEventLocked(InterruptionKind::Inactivity, m_lastActivity, idle);
        event.description = "No activity detected";
        committed = std::move(event);
        // One interruption per idle gap.
        m_lastActivity = now;
    }
    announce(committed);
    return committed;
}

TrackerState InterruptionTracker::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

InterruptionEvent InterruptionTracker::makeEventLocked(InterruptionKind kind,
                                                       TimePoint startedAt,
                                                       std::chrono::seconds duration) const
{
    InterruptionEvent event;
    event.kind = kind;
    event.startedAt = startedAt;
    event.duration = duration;
    event.severity = severityFor(duration);
    event.details = nlohmann::json{{"session_id", m_sessionId}};
    return event;
}

std::optional<InterruptionEvent> InterruptionTracker::closePauseLocked(TimePoint now)
{
    const auto paused = std::chrono::duration_cast<std::chrono::seconds>(now - m_pauseStartedAt);
    if (paused < m_pauseThreshold) {
        FLOG_DEBUG("InterruptionTracker", "closePause", "short_pause_ignored",
                   (nlohmann::json{{"seconds", paused.count()}}));
        return std::nullopt;
    }
    InterruptionEvent event = makeEventLocked(InterruptionKind::ManualPause, m_pauseStartedAt, paused);
    event.description = "Session paused";
    return event;
}

void InterruptionTracker::announce(const std::optional<InterruptionEvent> &event)
{
    if (!event) {
        return;
    }
    FLOG_INFO("InterruptionTracker", "announce", "interruption_detected",
              (nlohmann::json{{"type", interruptionTypeName(*event)},
                              {"severity", toSeverityString(event->severity)},
                              {"durationSeconds", event->duration.count()}}));
    emit interruptionDetected(*event);
}

std::vector<InterruptionPattern> InterruptionTracker::onSessionFinalized(const SessionRecord &record)
{
    InterruptionHistoryEntry entry;
    entry.sessionId = record.id;
    entry.timestamp = record.startTime;
    entry.hour = record.environment.hour;
    entry.total = static_cast<int>(record.interruptions.size());
    for (const auto &event : record.interruptions) {
        entry.counts[interruptionTypeName(event)]++;
        entry.severities[toSeverityString(event.severity)]++;
        entry.totalDurationSeconds += event.duration.count();
    }

    std::vector<InterruptionPattern> patterns;
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.push(std::move(entry));
        if (m_history.size() >= kMinHistoryForPatterns) {
            patterns = minePatternsLocked();
        }
        m_lastPatterns = patterns;
        snapshot = snapshotLocked();
    }

    saveDocumentBestEffort(m_store, kDocumentName, snapshot);

    for (const auto &pattern : patterns) {
        FLOG_INFO("InterruptionTracker", "onSessionFinalized", "pattern_detected",
                  (nlohmann::json{{"kind", pattern.kind}, {"data", pattern.data}}));
        emit patternDetected(pattern);
    }
    return patterns;
}

std::vector<InterruptionPattern> InterruptionTracker::minePatternsLocked() const
{
    std::vector<InterruptionPattern> patterns;
    const std::vector<InterruptionHistoryEntry> entries = m_history.toVector();

    // Frequency over the most recent sessions.
    const std::size_t window = std::min(kFrequencyWindow, entries.size());
    int recentTotal = 0;
    for (std::size_t i = entries.size() - window; i < entries.size(); ++i) {
        recentTotal += entries[i].total;
    }
    const double recentAverage = static_cast<double>(recentTotal) / static_cast<double>(window);
    if (recentAverage > kFrequencyAlertAverage) {
        InterruptionPattern pattern;
        pattern.kind = "high_frequency";
        pattern.description = "Recent sessions average more than five interruptions each";
        pattern.recommendation =
            "Block out distraction-free time and silence notifications before starting";
        pattern.severity = Severity::High;
        pattern.data = nlohmann::json{{"average_per_session", recentAverage},
                                      {"sessions", window}};
        patterns.push_back(std::move(pattern));
    }

    std::map<std::string, int> typeTotals;
    for (const auto &entry : entries) {
        for (const auto &count : entry.counts) {
            typeTotals[count.first] += count.second;
        }
    }
    const double sessionCount = static_cast<double>(entries.size());
    std::string dominantType;
    int dominantCount = 0;
    for (const auto &total : typeTotals) {
        if (total.second > dominantCount) {
            dominantType = total.first;
            dominantCount = total.second;
        }
    }
    if (!dominantType.empty() && dominantCount >= kDominantTypeFactor * sessionCount) {
        InterruptionPattern pattern;
        pattern.kind = "dominant_type";
        pattern.description = "Most interruptions are of type " + dominantType;
        pattern.recommendation = recommendationForType(dominantType);
        pattern.severity = Severity::Medium;
        pattern.data = nlohmann::json{{"type", dominantType},
                                      {"count", dominantCount},
                                      {"sessions", entries.size()}};
        patterns.push_back(std::move(pattern));
    }

    std::map<int, std::pair<int, int>> byHour; // hour -> (sessions, interruptions)
    for (const auto &entry : entries) {
        auto &bucket = byHour[entry.hour];
        bucket.first++;
        bucket.second += entry.total;
    }
    for (const auto &bucket : byHour) {
        const int sessions = bucket.second.first;
        if (sessions < kHourMinSessions) {
            continue;
        }
        const double average = static_cast<double>(bucket.second.second) / sessions;
        if (average <= kHourAlertAverage) {
            continue;
        }
        InterruptionPattern pattern;
        pattern.kind = "time_of_day";
        pattern.description = "Sessions starting at " + std::to_string(bucket.first)
            + ":00 are frequently interrupted";
        pattern.recommendation = "Schedule deep work away from this hour or protect it explicitly";
        pattern.severity = Severity::Medium;
        pattern.data = nlohmann::json{{"hour", bucket.first},
                                      {"average_per_session", average},
                                      {"sessions", sessions}};
        patterns.push_back(std::move(pattern));
    }

    return patterns;
}

nlohmann::json InterruptionTracker::snapshotLocked() const
{
    nlohmann::json history = nlohmann::json::array();
    for (const auto &entry : m_history) {
        history.push_back(entryToJson(entry));
    }
    nlohmann::json patterns = nlohmann::json::array();
    for (const auto &pattern : m_lastPatterns) {
        patterns.push_back(patternToJson(pattern));
    }
    return nlohmann::json{
        {"history", history},
        {"patterns", patterns},
        {"last_updated", toIso8601Utc(m_clock())}
    };
}

std::vector<InterruptionHistoryEntry> InterruptionTracker::history() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.toVector();
}

std::vector<InterruptionPattern> InterruptionTracker::lastPatterns() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastPatterns;
}

InterruptionSummary InterruptionTracker::interruptionSummary(TimePoint from, TimePoint to) const
{
    InterruptionSummary summary;
    long long totalDuration = 0;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &entry : m_history) {
        if (entry.timestamp < from || entry.timestamp >= to) {
            continue;
        }
        summary.sessions++;
        summary.total += entry.total;
        totalDuration += entry.totalDurationSeconds;
        for (const auto &count : entry.counts) {
            summary.byType[count.first] += count.second;
        }
        for (const auto &count : entry.severities) {
            summary.bySeverity[count.first] += count.second;
        }
    }
    if (summary.total > 0) {
        summary.averageDurationSeconds = static_cast<double>(totalDuration) / summary.total;
    }
    return summary;
}

Severity InterruptionTracker::severityFor(std::chrono::seconds duration)
{
    if (duration < kLowSeverityLimit) {
        return Severity::Low;
    }
    if (duration < kMediumSeverityLimit) {
        return Severity::Medium;
    }
    return Severity::High;
}

Severity InterruptionTracker::externalSeverity(const std::string &type)
{
    if (type == "phone_call" || type == "urgent_message") {
        return Severity::High;
    }
    return Severity::Medium;
}

std::string InterruptionTracker::recommendationForType(const std::string &typeName)
{
    if (typeName == "external:phone_call") {
        return "Put your phone on silent or in another room during focus sessions";
    }
    if (typeName == "external:urgent_message") {
        return "Batch message checks into your breaks instead of answering mid-session";
    }
    if (typeName == "inactivity") {
        return "Try shorter sessions; long idle stretches suggest the session is too long";
    }
    if (typeName == "manual_pause") {
        return "Plan your breaks up front so you do not need to pause the timer";
    }
    return "Identify the main source of interruptions and remove it before the next session";
}

} // namespace focuslens
