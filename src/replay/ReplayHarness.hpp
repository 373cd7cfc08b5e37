#pragma once

#include <chrono>
#include <memory>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"

namespace focuslens {

class AnalyticsEngine;

/**
 * Drives an AnalyticsEngine through a recorded timer scenario.
 *
 * A scenario directory holds scenario.json and optionally config.json. The
 * scenario lists steps with an "at" offset in seconds from "start"; the
 * harness moves a manual clock to each offset and performs the action, so
 * sampling and the inactivity watchdog run exactly where the script says.
 * The finalized sessions are printed as JSON on stdout.
 */
class ReplayHarness
{
public:
    ReplayHarness();
    ~ReplayHarness();

    int runScenario(const QString &scenarioDir);

private:
    int runSteps(const nlohmann::json &steps);
    int runStep(const nlohmann::json &step);
    int runReportStep(const nlohmann::json &step);
    bool checkExpectations(const nlohmann::json &expect) const;

    std::unique_ptr<ManualClock> m_clock;
    std::unique_ptr<AnalyticsEngine> m_engine;
    std::chrono::system_clock::time_point m_start;
    QString m_dataDir;
    int m_interruptions = 0;
};

} // namespace focuslens
