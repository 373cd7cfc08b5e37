#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "common/errors.hpp"
#include "engine/analytics_engine.hpp"
#include "engine/report_builder.hpp"
#include "test_support.hpp"

using focuslens::AnalyticsEngine;
using focuslens::ReportBuilder;
using focuslens::SectionType;
using focuslens::SessionType;
using focuslens::TimeRange;
using focuslens::test::localTime;

namespace {

void runWork(AnalyticsEngine &engine, focuslens::ManualClock &clock,
             focuslens::TimePoint start, int minutes, bool completed)
{
    clock.set(start);
    engine.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(minutes));
    engine.endSession(completed);
}

// Monday: full session (efficiency 100). Tuesday: 20 of 25 minutes (80).
void seedTwoDays(AnalyticsEngine &engine, focuslens::ManualClock &clock)
{
    runWork(engine, clock, localTime(5, 9), 25, true);
    runWork(engine, clock, localTime(6, 9), 20, false);
    clock.set(localTime(7, 15));
}

nlohmann::json allSectionsConfig()
{
    return nlohmann::json::parse(R"({
        "name": "Weekly review",
        "date_range": "last_7_days",
        "sections": [
            {"name": "overview", "type": "summary"},
            {"name": "deep_dive", "type": "productivity_analysis"},
            {"name": "split", "type": "comparison", "parameters": {"kind": "weekday_weekend"}},
            {"name": "chart", "type": "visualization", "parameters": {"chart": "bar", "metric": "efficiency"}},
            {"name": "trend", "type": "trend_analysis", "parameters": {"window_days": 3}},
            {"name": "tips", "type": "recommendations"},
            {"name": "raw", "type": "raw_data", "parameters": {"limit": 1}}
        ]
    })");
}

bool rejectsConfig(const nlohmann::json &config)
{
    try {
        ReportBuilder::parseConfig(config);
    } catch (const focuslens::ValidationError &) {
        return true;
    }
    return false;
}

} // namespace

class ReportBuilderTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testConfigValidation();
    void testParseAndSerializeConfig();
    void testResolveRangePresets();
    void testBuildAllSectionTypes();
    void testFailingSectionBecomesWarning();
    void testTimePeriodComparisonAndHeatmap();
    void testTemplates();
    void testTemplateOverrides();
    void testTemplatesPersist();

private:
    QTemporaryDir m_tempDir;
};

void ReportBuilderTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("FOCUSLENS_LOG_DIR", m_tempDir.filePath("logs").toUtf8());
}

void ReportBuilderTests::testConfigValidation()
{
    const nlohmann::json valid = allSectionsConfig();
    QVERIFY(!rejectsConfig(valid));

    QVERIFY(rejectsConfig(nlohmann::json::array()));

    nlohmann::json config = valid;
    config.erase("name");
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["name"] = "";
    QVERIFY(rejectsConfig(config));

    config = valid;
    config.erase("date_range");
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["date_range"] = "last_year";
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["date_range"] = {{"preset", "custom"}, {"from", "2026-01-05"}};
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["date_range"] = {{"preset", "custom"}, {"from", "2026-01-09"}, {"to", "2026-01-05"}};
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["date_range"] = {{"preset", "custom"}, {"from", "yesterday"}, {"to", "2026-01-05"}};
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["sections"] = nlohmann::json::array();
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["sections"].push_back("summary");
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["sections"].push_back({{"name", "pie"}, {"type", "pie_chart"}});
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["sections"].push_back({{"name", "untyped"}});
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["sections"][0]["parameters"] = "verbose";
    QVERIFY(rejectsConfig(config));

    config = valid;
    config["sections"].push_back({{"name", "overview"}, {"type", "summary"}});
    QVERIFY(rejectsConfig(config));
}

void ReportBuilderTests::testParseAndSerializeConfig()
{
    const nlohmann::json input = nlohmann::json::parse(R"({
        "name": "January",
        "date_range": {"preset": "custom", "from": "2026-01-01", "to": "2026-02-01"},
        "sections": [{"name": "overview", "type": "summary"}]
    })");
    const focuslens::ReportConfig config = ReportBuilder::parseConfig(input);
    QCOMPARE(QString::fromStdString(config.name), QStringLiteral("January"));
    QCOMPARE(QString::fromStdString(config.dateRange.preset), QStringLiteral("custom"));
    QVERIFY(config.dateRange.from.has_value());
    QVERIFY(*config.dateRange.from == localTime(1, 0));
    QCOMPARE(config.sections.size(), static_cast<std::size_t>(1));
    QCOMPARE(config.sections.front().type, SectionType::Summary);
    QVERIFY(config.sections.front().parameters.is_object());

    const focuslens::ReportConfig reparsed = ReportBuilder::parseConfig(ReportBuilder::configToJson(config));
    QVERIFY(*reparsed.dateRange.to == localTime(1, 0, 0, 2));
    QCOMPARE(QString::fromStdString(focuslens::toSectionTypeString(reparsed.sections.front().type)),
             QStringLiteral("summary"));

    QCOMPARE(ReportBuilder::parseSectionType("raw_data"), SectionType::RawData);
}

void ReportBuilderTests::testResolveRangePresets()
{
    focuslens::ManualClock clock(localTime(7, 15));
    AnalyticsEngine engine(focuslens::test::memoryConfig(), clock.clock());
    const ReportBuilder &builder = engine.builder();

    const auto resolve = [&builder](const std::string &preset) {
        focuslens::DateRangeSpec spec;
        spec.preset = preset;
        return builder.resolveRange(spec);
    };

    TimeRange range = resolve("today");
    QVERIFY(range.start == localTime(7, 0));
    QVERIFY(range.end == localTime(8, 0));

    range = resolve("last_7_days");
    QVERIFY(range.start == localTime(1, 0));
    QVERIFY(range.end == localTime(8, 0));

    range = resolve("last_30_days");
    QVERIFY(range.start == focuslens::fromLocalDateTime(2025, 12, 9));

    range = resolve("this_week");
    QVERIFY(range.start == localTime(5, 0));
    QVERIFY(range.end == localTime(12, 0));

    range = resolve("this_month");
    QVERIFY(range.start == localTime(1, 0));
    QVERIFY(range.end == localTime(1, 0, 0, 2));

    focuslens::DateRangeSpec custom;
    custom.preset = "custom";
    custom.from = localTime(2, 0);
    custom.to = localTime(4, 0);
    range = builder.resolveRange(custom);
    QVERIFY(range.start == localTime(2, 0));

    bool thrown = false;
    try {
        resolve("custom");
    } catch (const focuslens::ValidationError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void ReportBuilderTests::testBuildAllSectionTypes()
{
    focuslens::ManualClock clock(localTime(5, 9));
    AnalyticsEngine engine(focuslens::test::memoryConfig(), clock.clock());
    seedTwoDays(engine, clock);

    const focuslens::CustomReport report = engine.builder().build(allSectionsConfig());
    QCOMPARE(QString::fromStdString(report.name), QStringLiteral("Weekly review"));
    QVERIFY(report.warnings.empty());
    QCOMPARE(report.sections.size(), static_cast<std::size_t>(7));
    QVERIFY(report.range.start == localTime(1, 0));

    const nlohmann::json &overview = report.sections[0].data;
    QCOMPARE(overview["work_sessions"].get<int>(), 2);

    const nlohmann::json &deepDive = report.sections[1].data;
    QVERIFY(deepDive.contains("focus"));
    QVERIFY(deepDive.contains("interruptions"));
    QVERIFY(deepDive.contains("environment"));

    const nlohmann::json &split = report.sections[2].data;
    QCOMPARE(split["weekday"]["count"].get<int>(), 2);
    QCOMPARE(QString::fromStdString(split["effect_size_band"].get<std::string>()),
             QStringLiteral("insufficient_data"));

    const nlohmann::json &chart = report.sections[3].data;
    QCOMPARE(QString::fromStdString(chart["chart"]["type"].get<std::string>()), QStringLiteral("bar"));
    QCOMPARE(chart["series"].size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(chart["series"][0]["date"].get<std::string>()),
             QStringLiteral("2026-01-05"));
    QCOMPARE(chart["series"][0]["value"].get<double>(), 100.0);
    QCOMPARE(chart["series"][1]["value"].get<double>(), 80.0);

    const nlohmann::json &trend = report.sections[4].data;
    QCOMPARE(QString::fromStdString(trend["overall"].get<std::string>()),
             QStringLiteral("insufficient_data"));
    QCOMPARE(trend["window_days"].get<int>(), 3);
    QVERIFY(trend["trend_points"].is_array());

    QVERIFY(!report.sections[5].data["recommendations"].empty());

    const nlohmann::json &raw = report.sections[6].data;
    QCOMPARE(raw["total"].get<int>(), 1);
    // Newest first.
    QCOMPARE(raw["sessions"][0]["completed"].get<bool>(), false);

    const nlohmann::json json = report;
    QCOMPARE(json["sections"].size(), static_cast<std::size_t>(7));
    QCOMPARE(QString::fromStdString(json["sections"][6]["type"].get<std::string>()),
             QStringLiteral("raw_data"));
}

void ReportBuilderTests::testFailingSectionBecomesWarning()
{
    focuslens::ManualClock clock(localTime(5, 9));
    AnalyticsEngine engine(focuslens::test::memoryConfig(), clock.clock());
    seedTwoDays(engine, clock);

    const nlohmann::json config = nlohmann::json::parse(R"({
        "name": "Partly broken",
        "date_range": "this_week",
        "sections": [
            {"name": "overview", "type": "summary"},
            {"name": "chart", "type": "visualization", "parameters": {"chart": "pie"}},
            {"name": "compare", "type": "comparison", "parameters": {"kind": "periods", "granularity": "decade"}},
            {"name": "raw", "type": "raw_data", "parameters": {"limit": 0}},
            {"name": "tips", "type": "recommendations"}
        ]
    })");

    const focuslens::CustomReport report = engine.builder().build(config);
    QCOMPARE(report.sections.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(report.sections[0].name), QStringLiteral("overview"));
    QCOMPARE(QString::fromStdString(report.sections[1].name), QStringLiteral("tips"));
    QCOMPARE(report.warnings.size(), static_cast<std::size_t>(3));
    QCOMPARE(QString::fromStdString(report.warnings[0]),
             QStringLiteral("Section 'chart' failed: unknown chart type: pie"));
    QVERIFY(report.warnings[1].find("decade") != std::string::npos);
    QVERIFY(report.warnings[2].find("limit") != std::string::npos);
}

void ReportBuilderTests::testTimePeriodComparisonAndHeatmap()
{
    focuslens::ManualClock clock(localTime(5, 9));
    AnalyticsEngine engine(focuslens::test::memoryConfig(), clock.clock());
    runWork(engine, clock, localTime(5, 9), 25, true);
    runWork(engine, clock, localTime(12, 9), 25, true);
    runWork(engine, clock, localTime(12, 14), 25, true);
    clock.set(localTime(13, 12));

    const nlohmann::json config = nlohmann::json::parse(R"({
        "name": "Daypart",
        "date_range": "last_30_days",
        "sections": [
            {"name": "dayparts", "type": "comparison",
             "parameters": {"kind": "time_periods", "periods": {"early": [6, 10], "late": [13, 18]}}},
            {"name": "map", "type": "visualization", "parameters": {"chart": "heatmap"}}
        ]
    })");

    const focuslens::CustomReport report = engine.builder().build(config);
    QVERIFY(report.warnings.empty());

    const nlohmann::json &dayparts = report.sections[0].data;
    QCOMPARE(dayparts["periods"].size(), static_cast<std::size_t>(2));
    QCOMPARE(dayparts["periods"][0]["metrics"]["count"].get<int>(), 2);
    QCOMPARE(dayparts["periods"][1]["metrics"]["count"].get<int>(), 1);

    const nlohmann::json &map = report.sections[1].data;
    QCOMPARE(QString::fromStdString(map["chart"]["x_label"].get<std::string>()), QStringLiteral("hour"));
    QCOMPARE(map["series"].size(), static_cast<std::size_t>(1));
    QCOMPARE(map["series"][0]["weekday"].get<int>(), 0);
    QCOMPARE(map["series"][0]["hour"].get<int>(), 9);
}

void ReportBuilderTests::testTemplates()
{
    focuslens::ManualClock clock(localTime(5, 9));
    AnalyticsEngine engine(focuslens::test::memoryConfig(), clock.clock());
    ReportBuilder &builder = engine.builder();

    QVERIFY(builder.listTemplates().empty());
    builder.saveTemplate("weekly", ReportBuilder::parseConfig(allSectionsConfig()));
    builder.saveTemplate("another", ReportBuilder::parseConfig(allSectionsConfig()));

    const std::vector<std::string> names = builder.listTemplates();
    QCOMPARE(names.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(names.front()), QStringLiteral("another"));

    const focuslens::ReportConfig loaded = builder.loadTemplate("weekly");
    QCOMPARE(loaded.sections.size(), static_cast<std::size_t>(7));
    QCOMPARE(loaded.sections[3].parameters["metric"].get<std::string>(), std::string("efficiency"));

    builder.deleteTemplate("another");
    QCOMPARE(builder.listTemplates().size(), static_cast<std::size_t>(1));

    bool thrown = false;
    try {
        builder.deleteTemplate("another");
    } catch (const focuslens::NotFoundError &) {
        thrown = true;
    }
    QVERIFY(thrown);

    thrown = false;
    try {
        builder.buildFromTemplate("missing");
    } catch (const focuslens::NotFoundError &) {
        thrown = true;
    }
    QVERIFY(thrown);

    thrown = false;
    try {
        builder.saveTemplate("", loaded);
    } catch (const focuslens::ValidationError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void ReportBuilderTests::testTemplateOverrides()
{
    focuslens::ManualClock clock(localTime(5, 9));
    AnalyticsEngine engine(focuslens::test::memoryConfig(), clock.clock());
    seedTwoDays(engine, clock);
    ReportBuilder &builder = engine.builder();
    builder.saveTemplate("weekly", ReportBuilder::parseConfig(allSectionsConfig()));

    const nlohmann::json overrides = nlohmann::json::parse(R"({
        "name": "Monday only",
        "date_range": {"preset": "custom", "from": "2026-01-05", "to": "2026-01-06"},
        "sections": {"raw": {"limit": 5}, "chart": {"metric": "completion"}}
    })");
    const focuslens::CustomReport report = builder.buildFromTemplate("weekly", overrides);
    QCOMPARE(QString::fromStdString(report.name), QStringLiteral("Monday only"));
    QVERIFY(report.range.end == localTime(6, 0));
    QCOMPARE(report.sections[0].data["work_sessions"].get<int>(), 1);
    QCOMPARE(report.sections[3].data["chart"]["metric"].get<std::string>(), std::string("completion"));
    QCOMPARE(report.sections[3].data["series"][0]["value"].get<double>(), 100.0);
    QCOMPARE(report.sections[6].data["total"].get<int>(), 1);

    // The stored template is untouched.
    QCOMPARE(QString::fromStdString(builder.loadTemplate("weekly").name), QStringLiteral("Weekly review"));

    bool thrown = false;
    try {
        builder.buildFromTemplate("weekly", nlohmann::json{{"sections", {{"nope", {{"limit", 1}}}}}});
    } catch (const focuslens::ValidationError &ex) {
        thrown = true;
        QVERIFY(std::string(ex.what()).find("nope") != std::string::npos);
    }
    QVERIFY(thrown);

    thrown = false;
    try {
        builder.buildFromTemplate("weekly", nlohmann::json::array());
    } catch (const focuslens::ValidationError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void ReportBuilderTests::testTemplatesPersist()
{
    QTemporaryDir dataDir;
    QVERIFY(dataDir.isValid());
    focuslens::EngineConfig config = focuslens::test::memoryConfig();
    config.dataDir = dataDir.path().toStdString();
    focuslens::ManualClock clock(localTime(5, 9));

    {
        AnalyticsEngine engine(config, clock.clock());
        QVERIFY(engine.store() != nullptr);
        engine.builder().saveTemplate("weekly", ReportBuilder::parseConfig(allSectionsConfig()));
    }

    AnalyticsEngine reopened(config, clock.clock());
    const std::vector<std::string> names = reopened.builder().listTemplates();
    QCOMPARE(names.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(names.front()), QStringLiteral("weekly"));
    QCOMPARE(reopened.builder().loadTemplate("weekly").sections.size(), static_cast<std::size_t>(7));
}

QTEST_MAIN(ReportBuilderTests)
#include "test_report_builder.moc"
