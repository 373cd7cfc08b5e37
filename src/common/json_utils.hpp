#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace focuslens {

inline std::string toSessionTypeString(SessionType type)
{
    switch (type) {
    case SessionType::Work:
        return "work";
    case SessionType::Break:
        return "break";
    }
    return "work";
}

inline SessionType parseSessionTypeString(const std::string &value)
{
    // The timer reports short_break and long_break; both are breaks here.
    if (value == "break" || value == "short_break" || value == "long_break") {
        return SessionType::Break;
    }
    return SessionType::Work;
}

inline std::string toInteractionKindString(InteractionKind kind)
{
    switch (kind) {
    case InteractionKind::Click:
        return "click";
    case InteractionKind::Keypress:
        return "keypress";
    case InteractionKind::TimerControl:
        return "timer_control";
    case InteractionKind::TaskUpdate:
        return "task_update";
    case InteractionKind::Navigation:
        return "navigation";
    case InteractionKind::Custom:
        return "custom";
    }
    return "custom";
}

inline InteractionKind parseInteractionKindString(const std::string &value)
{
    if (value == "click") {
        return InteractionKind::Click;
    }
    if (value == "keypress") {
        return InteractionKind::Keypress;
    }
    if (value == "timer_control") {
        return InteractionKind::TimerControl;
    }
    if (value == "task_update") {
        return InteractionKind::TaskUpdate;
    }
    if (value == "navigation") {
        return InteractionKind::Navigation;
    }
    return InteractionKind::Custom;
}

inline std::string interactionTypeName(const InteractionEvent &event)
{
    if (event.kind == InteractionKind::Custom && !event.customType.empty()) {
        return event.customType;
    }
    return toInteractionKindString(event.kind);
}

inline std::string toSeverityString(Severity severity)
{
    switch (severity) {
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    }
    return "low";
}

inline Severity parseSeverityString(const std::string &value)
{
    if (value == "high") {
        return Severity::High;
    }
    if (value == "medium") {
        return Severity::Medium;
    }
    return Severity::Low;
}

inline std::string toFocusLevelString(FocusLevel level)
{
    switch (level) {
    case FocusLevel::Low:
        return "low";
    case FocusLevel::Medium:
        return "medium";
    case FocusLevel::High:
        return "high";
    }
    return "low";
}

inline std::string toTimePeriodString(TimePeriod period)
{
    switch (period) {
    case TimePeriod::Morning:
        return "morning";
    case TimePeriod::Afternoon:
        return "afternoon";
    case TimePeriod::Evening:
        return "evening";
    case TimePeriod::Night:
        return "night";
    }
    return "night";
}

inline TimePeriod parseTimePeriodString(const std::string &value)
{
    if (value == "morning") {
        return TimePeriod::Morning;
    }
    if (value == "afternoon") {
        return TimePeriod::Afternoon;
    }
    if (value == "evening") {
        return TimePeriod::Evening;
    }
    return TimePeriod::Night;
}

inline std::string toSeasonString(Season season)
{
    switch (season) {
    case Season::Winter:
        return "winter";
    case Season::Spring:
        return "spring";
    case Season::Summer:
        return "summer";
    case Season::Autumn:
        return "autumn";
    }
    return "winter";
}

inline Season parseSeasonString(const std::string &value)
{
    if (value == "spring") {
        return Season::Spring;
    }
    if (value == "summer") {
        return Season::Summer;
    }
    if (value == "autumn") {
        return Season::Autumn;
    }
    return Season::Winter;
}

inline std::string toTrendDirectionString(TrendDirection direction)
{
    switch (direction) {
    case TrendDirection::Improving:
        return "improving";
    case TrendDirection::Declining:
        return "declining";
    case TrendDirection::Stable:
        return "stable";
    case TrendDirection::InsufficientData:
        return "insufficient_data";
    }
    return "insufficient_data";
}

// "manual_pause", "inactivity" or "external:<subtype>".
inline std::string interruptionTypeName(const InterruptionEvent &event)
{
    switch (event.kind) {
    case InterruptionKind::ManualPause:
        return "manual_pause";
    case InterruptionKind::Inactivity:
        return "inactivity";
    case InterruptionKind::External:
        return "external:" + (event.externalType.empty() ? std::string("other")
                                                         : event.externalType);
    }
    return "manual_pause";
}

inline void parseInterruptionTypeName(const std::string &value, InterruptionEvent &event)
{
    const std::string externalPrefix = "external:";
    if (value.rfind(externalPrefix, 0) == 0) {
        event.kind = InterruptionKind::External;
        event.externalType = value.substr(externalPrefix.size());
    } else if (value == "inactivity") {
        event.kind = InterruptionKind::Inactivity;
        event.externalType.clear();
    } else {
        event.kind = InterruptionKind::ManualPause;
        event.externalType.clear();
    }
}

inline void to_json(nlohmann::json &j, const InteractionEvent &event)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(event.timestamp)},
        {"type", interactionTypeName(event)},
        {"details", event.details},
        {"session_time", event.sessionOffset.count()}
    };
}

inline void from_json(const nlohmann::json &j, InteractionEvent &event)
{
    event.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    const std::string type = j.value("type", "custom");
    event.kind = parseInteractionKindString(type);
    event.customType = event.kind == InteractionKind::Custom ? type : std::string();
    if (j.contains("details") && j.at("details").is_object()) {
        event.details = j.at("details");
    } else {
        event.details = nlohmann::json::object();
    }
    event.sessionOffset = std::chrono::seconds{j.value("session_time", 0LL)};
}

inline void to_json(nlohmann::json &j, const InterruptionEvent &event)
{
    j = nlohmann::json{
        {"type", interruptionTypeName(event)},
        {"description", event.description},
        {"timing", {
            {"started_at", toIso8601Utc(event.startedAt)},
            {"session_time", event.sessionOffset.count()}
        }},
        {"duration", event.duration.count()},
        {"severity", toSeverityString(event.severity)},
        {"details", event.details}
    };
}

inline void from_json(const nlohmann::json &j, InterruptionEvent &event)
{
    parseInterruptionTypeName(j.value("type", "manual_pause"), event);
    event.description = j.value("description", "");
    if (j.contains("timing") && j.at("timing").is_object()) {
        const auto &timing = j.at("timing");
        event.startedAt = fromIso8601Utc(timing.value("started_at", ""));
        event.sessionOffset = std::chrono::seconds{timing.value("session_time", 0LL)};
    } else {
        event.startedAt = std::chrono::system_clock::time_point{};
        event.sessionOffset = std::chrono::seconds{0};
    }
    event.duration = std::chrono::seconds{j.value("duration", 0LL)};
    event.severity = parseSeverityString(j.value("severity", "low"));
    if (j.contains("details") && j.at("details").is_object()) {
        event.details = j.at("details");
    } else {
        event.details = nlohmann::json::object();
    }
}

inline void to_json(nlohmann::json &j, const FocusSample &sample)
{
    j = nlohmann::json{{"timestamp", toIso8601Utc(sample.timestamp)}, {"score", sample.score}};
}

inline void from_json(const nlohmann::json &j, FocusSample &sample)
{
    sample.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    sample.score = j.value("score", 0.0);
}

inline void to_json(nlohmann::json &j, const EnvironmentTag &tag)
{
    j = nlohmann::json{
        {"hour", tag.hour},
        {"weekday", tag.weekday},
        {"month", tag.month},
        {"season", toSeasonString(tag.season)},
        {"time_period", toTimePeriodString(tag.timePeriod)},
        {"is_weekend", tag.isWeekend}
    };
}

inline void from_json(const nlohmann::json &j, EnvironmentTag &tag)
{
    tag.hour = j.value("hour", 0);
    tag.weekday = j.value("weekday", 0);
    tag.month = j.value("month", 1);
    tag.season = parseSeasonString(j.value("season", "winter"));
    tag.timePeriod = parseTimePeriodString(j.value("time_period", "night"));
    tag.isWeekend = j.value("is_weekend", tag.weekday >= 5);
}

inline void to_json(nlohmann::json &j, const SessionRecord &record)
{
    j = nlohmann::json{
        {"session_id", record.id},
        {"type", toSessionTypeString(record.type)},
        {"planned_duration", record.plannedDuration.count()},
        {"start_time", toIso8601Utc(record.startTime)},
        {"end_time", record.endTime ? nlohmann::json(toIso8601Utc(*record.endTime))
                                    : nlohmann::json()},
        {"actual_duration", record.actualDuration.count()},
        {"completed", record.completed},
        {"efficiency_score", record.efficiencyScore ? nlohmann::json(*record.efficiencyScore)
                                                    : nlohmann::json()},
        {"focus_score", record.focusScore ? nlohmann::json(*record.focusScore)
                                          : nlohmann::json()},
        {"interactions", record.interactions},
        {"interruptions", record.interruptions},
        {"focus_samples", record.focusSamples},
        {"environment_data", record.environment}
    };
}

inline void from_json(const nlohmann::json &j, SessionRecord &record)
{
    record.id = j.value("session_id", "");
    record.type = parseSessionTypeString(j.value("type", "work"));
    record.plannedDuration = std::chrono::seconds{j.value("planned_duration", 0LL)};
    record.startTime = fromIso8601Utc(j.value("start_time", ""));
    if (j.contains("end_time") && j.at("end_time").is_string()) {
        record.endTime = fromIso8601Utc(j.at("end_time").get<std::string>());
    } else {
        record.endTime.reset();
    }
    record.actualDuration = std::chrono::seconds{j.value("actual_duration", 0LL)};
    record.completed = j.value("completed", false);
    if (j.contains("efficiency_score") && j.at("efficiency_score").is_number()) {
        record.efficiencyScore = j.at("efficiency_score").get<double>();
    } else {
        record.efficiencyScore.reset();
    }
    if (j.contains("focus_score") && j.at("focus_score").is_number()) {
        record.focusScore = j.at("focus_score").get<double>();
    } else {
        record.focusScore.reset();
    }
    record.finalized = record.endTime.has_value();
    if (j.contains("interactions") && j.at("interactions").is_array()) {
        record.interactions = j.at("interactions").get<std::vector<InteractionEvent>>();
    } else {
        record.interactions.clear();
    }
    if (j.contains("interruptions") && j.at("interruptions").is_array()) {
        record.interruptions = j.at("interruptions").get<std::vector<InterruptionEvent>>();
    } else {
        record.interruptions.clear();
    }
    if (j.contains("focus_samples") && j.at("focus_samples").is_array()) {
        record.focusSamples = j.at("focus_samples").get<std::vector<FocusSample>>();
    } else {
        record.focusSamples.clear();
    }
    if (j.contains("environment_data") && j.at("environment_data").is_object()) {
        record.environment = j.at("environment_data").get<EnvironmentTag>();
    } else {
        record.environment = EnvironmentTag{};
    }
}

inline void to_json(nlohmann::json &j, const DailyStats &stats)
{
    j = nlohmann::json{
        {"date", stats.date},
        {"work_sessions", stats.workSessions},
        {"break_sessions", stats.breakSessions},
        {"work_time", stats.workMinutes},
        {"break_time", stats.breakMinutes},
        {"completed_sessions", stats.completedSessions}
    };
}

inline void from_json(const nlohmann::json &j, DailyStats &stats)
{
    stats.date = j.value("date", "");
    stats.workSessions = j.value("work_sessions", 0);
    stats.breakSessions = j.value("break_sessions", 0);
    stats.workMinutes = j.value("work_time", 0);
    stats.breakMinutes = j.value("break_time", 0);
    stats.completedSessions = j.value("completed_sessions", 0);
}

inline void to_json(nlohmann::json &j, const WeeklyStats &stats)
{
    j = nlohmann::json{
        {"week_key", stats.weekKey},
        {"work_sessions", stats.workSessions},
        {"break_sessions", stats.breakSessions},
        {"work_time", stats.workMinutes},
        {"break_time", stats.breakMinutes},
        {"completed_sessions", stats.completedSessions}
    };
}

inline void from_json(const nlohmann::json &j, WeeklyStats &stats)
{
    stats.weekKey = j.value("week_key", "");
    stats.workSessions = j.value("work_sessions", 0);
    stats.breakSessions = j.value("break_sessions", 0);
    stats.workMinutes = j.value("work_time", 0);
    stats.breakMinutes = j.value("break_time", 0);
    stats.completedSessions = j.value("completed_sessions", 0);
}

inline void to_json(nlohmann::json &j, const ProductivityTrendPoint &point)
{
    j = nlohmann::json{
        {"date", point.date},
        {"score", point.score},
        {"sessions_count", point.sessionsCount}
    };
}

inline void from_json(const nlohmann::json &j, ProductivityTrendPoint &point)
{
    point.date = j.value("date", "");
    point.score = j.value("score", 0.0);
    point.sessionsCount = j.value("sessions_count", 0);
}

} // namespace focuslens
