#pragma once

namespace focuslens {

enum class SessionType {
    Work,
    Break
};

// Closed set of interaction kinds the timer UI reports. Anything else is
// recorded as Custom and keeps its raw type string.
enum class InteractionKind {
    Click,
    Keypress,
    TimerControl,
    TaskUpdate,
    Navigation,
    Custom
};

enum class InterruptionKind {
    ManualPause,
    Inactivity,
    External
};

enum class Severity {
    Low,
    Medium,
    High
};

enum class FocusLevel {
    Low,
    Medium,
    High
};

enum class TimePeriod {
    Morning,
    Afternoon,
    Evening,
    Night
};

enum class Season {
    Winter,
    Spring,
    Summer,
    Autumn
};

enum class TrendDirection {
    Improving,
    Declining,
    Stable,
    InsufficientData
};

} // namespace focuslens
