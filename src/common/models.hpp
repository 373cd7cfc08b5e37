#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace focuslens {

using TimePoint = std::chrono::system_clock::time_point;

struct InteractionEvent {
    TimePoint timestamp;
    InteractionKind kind = InteractionKind::Custom;
    // Raw type string, only meaningful for InteractionKind::Custom.
    std::string customType;
    // Open extension map for payload fields the engine does not interpret.
    nlohmann::json details = nlohmann::json::object();
    std::chrono::seconds sessionOffset{0};
};

struct InterruptionEvent {
    InterruptionKind kind = InterruptionKind::ManualPause;
    // Subtype of an external interruption, e.g. "phone_call".
    std::string externalType;
    std::string description;
    TimePoint startedAt;
    std::chrono::seconds duration{0};
    Severity severity = Severity::Low;
    std::chrono::seconds sessionOffset{0};
    nlohmann::json details = nlohmann::json::object();
};

struct FocusSample {
    TimePoint timestamp;
    double score = 0.0;
};

struct EnvironmentTag {
    int hour = 0;
    int weekday = 0; // Monday = 0
    int month = 1;
    Season season = Season::Winter;
    TimePeriod timePeriod = TimePeriod::Night;
    bool isWeekend = false;
};

struct SessionRecord {
    std::string id;
    SessionType type = SessionType::Work;
    std::chrono::seconds plannedDuration{0};
    TimePoint startTime;
    std::optional<TimePoint> endTime;
    std::chrono::seconds actualDuration{0};
    bool completed = false;
    bool finalized = false;

    // Undefined until the session is finalized.
    std::optional<double> focusScore;
    std::optional<double> efficiencyScore;

    std::vector<InteractionEvent> interactions;
    std::vector<InterruptionEvent> interruptions;
    std::vector<FocusSample> focusSamples;
    EnvironmentTag environment;
};

struct DailyStats {
    std::string date;
    int workSessions = 0;
    int breakSessions = 0;
    int workMinutes = 0;
    int breakMinutes = 0;
    int completedSessions = 0;
};

struct WeeklyStats {
    std::string weekKey;
    int workSessions = 0;
    int breakSessions = 0;
    int workMinutes = 0;
    int breakMinutes = 0;
    int completedSessions = 0;
};

struct ProductivityTrendPoint {
    std::string date;
    double score = 0.0;
    int sessionsCount = 0;
};

} // namespace focuslens
