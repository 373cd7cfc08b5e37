#include "report/ReportCli.hpp"

#include <algorithm>
#include <iostream>

#include <QFile>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/analytics_engine.hpp"
#include "engine/report_builder.hpp"
#include "engine/reports_engine.hpp"

namespace focuslens {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  focuslens-report summary [--from DATE] [--to DATE] [--format markdown|json]\n"
        "  focuslens-report compare periods [--granularity day|week|month] [--periods N] [--from DATE] [--to DATE]\n"
        "  focuslens-report compare weekdays [--from DATE] [--to DATE]\n"
        "  focuslens-report compare time-periods [--from DATE] [--to DATE]\n"
        "  focuslens-report trends [--window DAYS] [--from DATE] [--to DATE]\n"
        "  focuslens-report custom --config FILE | --template NAME [--override JSON]\n"
        "  focuslens-report template save NAME --config FILE\n"
        "  focuslens-report template list\n"
        "  focuslens-report template delete NAME\n"
        "Common options: --data-dir PATH, --format markdown|json\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool isValidFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ValidationError("cannot read " + path.toStdString());
    }
    try {
        return nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ValidationError("invalid JSON in " + path.toStdString() + ": " + ex.what());
    }
}

std::string scalarText(const nlohmann::json &value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

// Generic markdown: scalars as bullets, objects as subsections, arrays of
// scalars inline, arrays of objects as one compact line per item.
void renderJsonMarkdown(const nlohmann::json &value, int depth)
{
    const std::string heading(static_cast<std::size_t>(std::min(depth, 5)), '#');
    for (const auto &item : value.items()) {
        const auto &field = item.value();
        if (field.is_object()) {
            std::cout << "\n" << heading << "# " << item.key() << "\n\n";
            renderJsonMarkdown(field, depth + 1);
        } else if (field.is_array()) {
            if (field.empty()) {
                std::cout << "- " << item.key() << ": none\n";
                continue;
            }
            if (!field.front().is_object()) {
                std::cout << "\n" << heading << "# " << item.key() << "\n\n";
                for (const auto &entry : field) {
                    std::cout << "- " << scalarText(entry) << "\n";
                }
                continue;
            }
            std::cout << "\n" << heading << "# " << item.key() << "\n\n";
            for (const auto &entry : field) {
                std::cout << "- " << entry.dump() << "\n";
            }
        } else {
            std::cout << "- " << item.key() << ": " << scalarText(field) << "\n";
        }
    }
}

void emitResult(const QString &format, const std::string &title, const nlohmann::json &payload)
{
    if (format == QStringLiteral("json")) {
        std::cout << payload.dump(2) << std::endl;
        return;
    }
    std::cout << "# " << title << "\n";
    renderJsonMarkdown(payload, 1);
}

void renderSummaryMarkdown(const ComprehensiveReport &report)
{
    std::cout << "# FocusLens Productivity Report\n\n";
    std::cout << "Period: " << toIso8601Utc(report.range.start) << " -> "
              << toIso8601Utc(report.range.end) << "\n";
    std::cout << "Generated: " << toIso8601Utc(report.generatedAt) << "\n\n";

    std::cout << "## Summary\n\n";
    std::cout << "- Work sessions: " << report.summary.value("work_sessions", 0) << "\n";
    std::cout << "- Break sessions: " << report.summary.value("break_sessions", 0) << "\n";
    std::cout << "- Completion rate: " << report.summary.value("completion_rate", 0.0) << "%\n";
    std::cout << "- Average focus: " << report.summary.value("avg_focus_score", 0.0) << "\n";
    std::cout << "- Average efficiency: " << report.summary.value("avg_efficiency_score", 0.0) << "\n";
    std::cout << "- Work minutes: " << report.summary.value("total_work_minutes", 0.0) << "\n";
    std::cout << "- Interruptions: " << report.summary.value("total_interruptions", 0) << "\n\n";

    std::cout << "## Recommendations\n\n";
    for (const auto &tip : report.recommendations) {
        std::cout << "- " << tip << "\n";
    }
}

void renderCustomMarkdown(const CustomReport &report)
{
    std::cout << "# " << report.name << "\n\n";
    std::cout << "Period: " << toIso8601Utc(report.range.start) << " -> "
              << toIso8601Utc(report.range.end) << "\n";
    for (const auto &section : report.sections) {
        std::cout << "\n## " << section.name << " (" << toSectionTypeString(section.type) << ")\n\n";
        renderJsonMarkdown(section.data, 2);
    }
    if (!report.warnings.empty()) {
        std::cout << "\n## Warnings\n\n";
        for (const auto &warning : report.warnings) {
            std::cout << "- " << warning << "\n";
        }
    }
}

} // namespace

ReportCli::ReportCli() = default;

ReportCli::~ReportCli() = default;

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    FLOG_INFO("ReportCli", "run", "report_cli_command",
              (nlohmann::json{{"command", args.at(1).toStdString()}}));

    try {
        return dispatch(args);
    } catch (const ValidationError &ex) {
        FLOG_WARN("ReportCli", "run", "invalid_request", (nlohmann::json{{"error", ex.what()}}));
        std::cerr << "Invalid request: " << ex.what() << std::endl;
        return 1;
    } catch (const NotFoundError &ex) {
        std::cerr << "Not found: " << ex.what() << std::endl;
        return 1;
    }
}

int ReportCli::dispatch(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const QString command = args.at(1);
    if (command == QStringLiteral("summary")) {
        return runSummary(args);
    }
    if (command == QStringLiteral("compare")) {
        return runCompare(args);
    }
    if (command == QStringLiteral("trends")) {
        return runTrends(args);
    }
    if (command == QStringLiteral("custom")) {
        return runCustom(args);
    }
    if (command == QStringLiteral("template")) {
        return runTemplate(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

AnalyticsEngine &ReportCli::engine(const QStringList &args)
{
    if (!m_engine) {
        EngineConfig config = loadEngineConfig();
        const QString dataDir = getArgValue(args, QStringLiteral("--data-dir"));
        if (!dataDir.isEmpty()) {
            config.dataDir = dataDir.toStdString();
        }
        m_engine = std::make_unique<AnalyticsEngine>(config);
    }
    return *m_engine;
}

TimeRange ReportCli::parseRange(const QStringList &args)
{
    TimeRange range = engine(args).reports().defaultRange();
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    if (!fromValue.isEmpty() && !parseDateOrTimestamp(fromValue.toStdString(), &range.start)) {
        throw ValidationError("invalid --from value: " + fromValue.toStdString());
    }
    if (!toValue.isEmpty() && !parseDateOrTimestamp(toValue.toStdString(), &range.end)) {
        throw ValidationError("invalid --to value: " + toValue.toStdString());
    }
    ComparisonAnalytics::validateRange(range);
    return range;
}

int ReportCli::runSummary(const QStringList &args)
{
    const TimeRange range = parseRange(args);
    const ComprehensiveReport report = engine(args).reports().generateComprehensiveReport(range);
    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
    } else {
        renderSummaryMarkdown(report);
    }
    return 0;
}

int ReportCli::runCompare(const QStringList &args)
{
    if (args.size() < 3) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString kind = args.at(2);
    const TimeRange range = parseRange(args);
    ComparisonAnalytics &comparisons = engine(args).comparisons();
    const QString format = getFormat(args);

    if (kind == QStringLiteral("periods")) {
        const QString granularityValue = getArgValue(args, QStringLiteral("--granularity"));
        const Granularity granularity = ComparisonAnalytics::parseGranularity(
            granularityValue.isEmpty() ? std::string("week") : granularityValue.toStdString());
        const QString periodsValue = getArgValue(args, QStringLiteral("--periods"));
        bool ok = true;
        const int periods = periodsValue.isEmpty() ? 1 : periodsValue.toInt(&ok);
        if (!ok || periods <= 0) {
            throw ValidationError("--periods must be a positive integer");
        }
        emitResult(format, "Period Comparison", comparisons.comparePeriods(granularity, range, periods));
        return 0;
    }
    if (kind == QStringLiteral("weekdays")) {
        emitResult(format, "Weekdays vs Weekends", comparisons.compareWeekdaysVsWeekends(range));
        return 0;
    }
    if (kind == QStringLiteral("time-periods")) {
        emitResult(format, "Time of Day Comparison", comparisons.compareTimePeriods(range));
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runTrends(const QStringList &args)
{
    const TimeRange range = parseRange(args);
    const QString windowValue = getArgValue(args, QStringLiteral("--window"));
    bool ok = true;
    const int window = windowValue.isEmpty() ? 7 : windowValue.toInt(&ok);
    if (!ok || window <= 0) {
        throw ValidationError("--window must be a positive integer");
    }
    emitResult(getFormat(args), "Progress Trends",
               engine(args).comparisons().analyzeProgressTrends(window, range));
    return 0;
}

int ReportCli::runCustom(const QStringList &args)
{
    const QString configPath = getArgValue(args, QStringLiteral("--config"));
    const QString templateName = getArgValue(args, QStringLiteral("--template"));
    ReportBuilder &builder = engine(args).builder();

    CustomReport report;
    if (!configPath.isEmpty()) {
        report = builder.build(readJsonFile(configPath));
    } else if (!templateName.isEmpty()) {
        nlohmann::json overrides = nlohmann::json::object();
        const QString overrideValue = getArgValue(args, QStringLiteral("--override"));
        if (!overrideValue.isEmpty()) {
            try {
                overrides = nlohmann::json::parse(overrideValue.toStdString());
            } catch (const nlohmann::json::parse_error &ex) {
                throw ValidationError(std::string("invalid --override JSON: ") + ex.what());
            }
        }
        report = builder.buildFromTemplate(templateName.toStdString(), overrides);
    } else {
        std::cerr << usageText().toStdString();
        return 1;
    }

    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
    } else {
        renderCustomMarkdown(report);
    }
    return 0;
}

int ReportCli::runTemplate(const QStringList &args)
{
    if (args.size() < 3) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString action = args.at(2);
    ReportBuilder &builder = engine(args).builder();

    if (action == QStringLiteral("list")) {
        const auto names = builder.listTemplates();
        if (getFormat(args) == QStringLiteral("json")) {
            std::cout << nlohmann::json(names).dump(2) << std::endl;
        } else if (names.empty()) {
            std::cout << "No templates saved.\n";
        } else {
            for (const auto &name : names) {
                std::cout << "- " << name << "\n";
            }
        }
        return 0;
    }

    if (args.size() < 4) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const std::string name = args.at(3).toStdString();

    if (action == QStringLiteral("save")) {
        const QString configPath = getArgValue(args, QStringLiteral("--config"));
        if (configPath.isEmpty()) {
            std::cerr << usageText().toStdString();
            return 1;
        }
        builder.saveTemplate(name, ReportBuilder::parseConfig(readJsonFile(configPath)));
        std::cout << "Saved template " << name << "\n";
        return 0;
    }
    if (action == QStringLiteral("delete")) {
        builder.deleteTemplate(name);
        std::cout << "Deleted template " << name << "\n";
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

} // namespace focuslens
