#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "common/ttl_cache.hpp"
#include "engine/comparison_analytics.hpp"

namespace focuslens {

class EnvironmentCorrelator;
class InterruptionTracker;
class SessionEventStore;
class SessionPatternTracker;

struct ComprehensiveReport {
    TimeRange range;
    TimePoint generatedAt;
    nlohmann::json summary = nlohmann::json::object();
    nlohmann::json sections = nlohmann::json::object();
    std::vector<std::string> recommendations;
};

/**
 * ReportsEngine assembles the comprehensive report from the live components.
 *
 * Reports are cached by date range for the configured TTL. Drill-down queries
 * always go back to the components rather than to the cache.
 */
class ReportsEngine
{
public:
    ReportsEngine(const SessionEventStore &sessions,
                  const InterruptionTracker &interruptions,
                  const EnvironmentCorrelator &environment,
                  const SessionPatternTracker &patterns,
                  const EngineConfig &config,
                  Clock clock);

    // Defaults to the 30 local days ending today.
    ComprehensiveReport generateComprehensiveReport(std::optional<TimeRange> range = std::nullopt);
    TimeRange defaultRange() const;

    nlohmann::json sessionSummary(const TimeRange &range) const;
    nlohmann::json focusAnalysis(const TimeRange &range) const;
    nlohmann::json interruptionAnalysis(const TimeRange &range) const;
    nlohmann::json environmentAnalysis(const TimeRange &range) const;
    nlohmann::json trendAnalysis(const TimeRange &range) const;

    SessionRecord sessionDetails(const std::string &sessionId) const;
    std::vector<SessionRecord> sessionsOnDate(const std::string &date) const;
    std::vector<InterruptionEvent> interruptionsOfKind(const std::string &type,
                                                       const TimeRange &range) const;

    void clearCache();
    std::size_t cachedEntries();

private:
    std::vector<std::string> recommendationsFor(const nlohmann::json &summary,
                                                const nlohmann::json &environment) const;

    const SessionEventStore &m_sessions;
    const InterruptionTracker &m_interruptions;
    const EnvironmentCorrelator &m_environment;
    const SessionPatternTracker &m_patterns;
    Clock m_clock;
    TtlCache<ComprehensiveReport> m_cache;
};

void to_json(nlohmann::json &j, const ComprehensiveReport &report);

} // namespace focuslens
