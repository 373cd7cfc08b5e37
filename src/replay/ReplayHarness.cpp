#include "replay/ReplayHarness.hpp"

#include <iostream>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/analytics_engine.hpp"
#include "engine/session_event_store.hpp"
#include "report/ReportCli.hpp"

namespace focuslens {

namespace {

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json();
    }
}

} // namespace

ReplayHarness::ReplayHarness() = default;

ReplayHarness::~ReplayHarness() = default;

int ReplayHarness::runScenario(const QString &scenarioDir)
{
    const QString scenarioPath = scenarioDir + QDir::separator() + "scenario.json";
    const nlohmann::json scenario = readJsonFile(scenarioPath);
    if (scenario.is_null() || !scenario.contains("steps")) {
        std::cerr << "Missing or invalid " << scenarioPath.toStdString() << std::endl;
        return 1;
    }

    m_start = fromLocalDateTime(2026, 1, 5, 9);
    if (scenario.contains("start")) {
        if (!scenario["start"].is_string()
            || !parseDateOrTimestamp(scenario["start"].get<std::string>(), &m_start)) {
            std::cerr << "Invalid scenario start" << std::endl;
            return 1;
        }
    }

    QTemporaryDir replayData;
    if (!replayData.isValid()) {
        return 1;
    }
    m_dataDir = replayData.path();

    EngineConfig config = loadEngineConfig(scenarioDir + QDir::separator() + "config.json");
    config.dataDir = m_dataDir.toStdString();

    FLOG_INFO("ReplayHarness", "runScenario", "replay_start",
              (nlohmann::json{{"scenarioDir", scenarioDir.toStdString()},
                              {"start", toIso8601Utc(m_start)}}));

    m_clock = std::make_unique<ManualClock>(m_start);
    m_engine = std::make_unique<AnalyticsEngine>(config, m_clock->clock());
    m_interruptions = 0;
    QObject::connect(m_engine.get(), &AnalyticsEngine::interruptionDetected,
                     m_engine.get(), [this](const InterruptionEvent &) { ++m_interruptions; });

    const int status = runSteps(scenario["steps"]);
    if (status != 0) {
        m_engine.reset();
        return status;
    }

    // A scenario that stops mid-session leaves it open rather than finalizing it.
    nlohmann::json output;
    output["scenario"] = scenario.value("id", std::string());
    output["sessions"] = m_engine->sessions().history();
    output["interruptions"] = m_interruptions;
    output["summary"] = m_engine->sessions().statsSummary();
    std::cout << output.dump(2) << std::endl;

    const bool passed = !scenario.contains("expect") || checkExpectations(scenario["expect"]);
    FLOG_INFO("ReplayHarness", "runScenario", "replay_complete",
              (nlohmann::json{{"sessions", output["sessions"].size()},
                              {"interruptions", m_interruptions},
                              {"passed", passed}}));
    m_engine.reset();
    return passed ? 0 : 1;
}

int ReplayHarness::runSteps(const nlohmann::json &steps)
{
    if (!steps.is_array()) {
        return 1;
    }
    for (const auto &step : steps) {
        if (!step.is_object()) {
            return 1;
        }
        if (step.contains("at")) {
            const auto target = m_start + std::chrono::seconds(step.value("at", 0));
            if (target < m_clock->now()) {
                FLOG_WARN("ReplayHarness", "runSteps", "step_out_of_order",
                          (nlohmann::json{{"at", step["at"]}}));
                return 1;
            }
            m_clock->set(target);
        }
        if (runStep(step) != 0) {
            return 1;
        }
    }
    return 0;
}

int ReplayHarness::runStep(const nlohmann::json &step)
{
    const std::string action = step.value("action", "");
    FLOG_DEBUG("ReplayHarness", "runStep", "replay_step",
               (nlohmann::json{{"action", action}, {"time", toIso8601Utc(m_clock->now())}}));

    if (action == "start") {
        const SessionType type = parseSessionTypeString(step.value("type", std::string("work")));
        const int plannedMinutes = step.value("planned_minutes", 25);
        m_engine->startSession(type, std::chrono::minutes(plannedMinutes));
        return 0;
    }
    if (action == "interaction") {
        const std::string kind = step.value("kind", std::string("click"));
        m_engine->recordInteraction(parseInteractionKindString(kind),
                                    step.value("details", nlohmann::json::object()),
                                    kind);
        return 0;
    }
    if (action == "pause") {
        m_engine->pauseSession();
        return 0;
    }
    if (action == "resume") {
        m_engine->resumeSession();
        return 0;
    }
    if (action == "external") {
        m_engine->recordExternalInterruption(step.value("type", std::string("other")),
                                             step.value("description", std::string()));
        return 0;
    }
    if (action == "tick") {
        if (m_engine->sampleNow()) {
            m_engine->evaluateFocus();
        }
        return 0;
    }
    if (action == "watchdog") {
        m_engine->checkInactivity();
        return 0;
    }
    if (action == "end") {
        m_engine->endSession(step.value("completed", true));
        return 0;
    }
    if (action == "report_cli") {
        return runReportStep(step);
    }

    FLOG_WARN("ReplayHarness", "runStep", "unknown_action", (nlohmann::json{{"action", action}}));
    return 1;
}

int ReplayHarness::runReportStep(const nlohmann::json &step)
{
    const nlohmann::json args = step.value("args", nlohmann::json::array());

    QStringList argv;
    argv << QStringLiteral("focuslens-report");
    if (args.is_array()) {
        for (const auto &arg : args) {
            if (arg.is_string()) {
                argv << QString::fromStdString(arg.get<std::string>());
            }
        }
    }
    argv << QStringLiteral("--data-dir") << m_dataDir;

    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : argv) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }

    ReportCli cli;
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}

bool ReplayHarness::checkExpectations(const nlohmann::json &expect) const
{
    bool passed = true;
    const auto history = m_engine->sessions().history();
    if (expect.contains("sessions") && expect["sessions"].get<std::size_t>() != history.size()) {
        std::cerr << "Expected " << expect["sessions"].dump() << " sessions, got "
                  << history.size() << std::endl;
        passed = false;
    }
    if (expect.contains("interruptions") && expect["interruptions"].get<int>() != m_interruptions) {
        std::cerr << "Expected " << expect["interruptions"].dump() << " interruptions, got "
                  << m_interruptions << std::endl;
        passed = false;
    }
    if (expect.contains("completed")) {
        int completed = 0;
        for (const auto &record : history) {
            if (record.completed) {
                ++completed;
            }
        }
        if (expect["completed"].get<int>() != completed) {
            std::cerr << "Expected " << expect["completed"].dump() << " completed sessions, got "
                      << completed << std::endl;
            passed = false;
        }
    }
    return passed;
}

} // namespace focuslens
