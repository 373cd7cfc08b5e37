#include "engine/report_builder.hpp"

#include <algorithm>
#include <set>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/analytics_store.hpp"
#include "engine/environment_correlator.hpp"
#include "engine/reports_engine.hpp"
#include "engine/session_event_store.hpp"

namespace focuslens {

namespace {

constexpr const char *kDocumentName = "report_templates";
constexpr int kDefaultTrendWindow = 7;
constexpr int kDefaultRawLimit = 100;

const std::set<std::string> &knownPresets()
{
    static const std::set<std::string> presets = {
        "today", "last_7_days", "last_30_days", "this_week", "this_month", "custom"
    };
    return presets;
}

TimePoint parseBoundary(const nlohmann::json &range, const char *field)
{
    if (!range.contains(field) || !range.at(field).is_string()) {
        throw ValidationError(std::string("custom date_range requires '") + field + "'");
    }
    TimePoint value;
    if (!parseDateOrTimestamp(range.at(field).get<std::string>(), &value)) {
        throw ValidationError(std::string("invalid date in date_range.") + field);
    }
    return value;
}

DateRangeSpec parseDateRange(const nlohmann::json &value)
{
    DateRangeSpec spec;
    if (value.is_string()) {
        spec.preset = value.get<std::string>();
    } else if (value.is_object() && value.contains("preset") && value.at("preset").is_string()) {
        spec.preset = value.at("preset").get<std::string>();
    } else {
        throw ValidationError("date_range must name a preset");
    }

    if (knownPresets().count(spec.preset) == 0) {
        throw ValidationError("unknown date_range preset: " + spec.preset);
    }
    if (spec.preset == "custom") {
        if (!value.is_object()) {
            throw ValidationError("custom date_range requires 'from' and 'to'");
        }
        spec.from = parseBoundary(value, "from");
        spec.to = parseBoundary(value, "to");
        ComparisonAnalytics::validateRange(TimeRange{*spec.from, *spec.to});
    }
    return spec;
}

double metricValue(const PeriodMetrics &metrics, const std::string &metric)
{
    if (metric == "focus") {
        return metrics.avgFocusScore;
    }
    if (metric == "efficiency") {
        return metrics.avgEfficiencyScore;
    }
    return metrics.completionRate;
}

} // namespace

std::string toSectionTypeString(SectionType type)
{
    switch (type) {
    case SectionType::Summary:
        return "summary";
    case SectionType::ProductivityAnalysis:
        return "productivity_analysis";
    case SectionType::Comparison:
        return "comparison";
    case SectionType::Visualization:
        return "visualization";
    case SectionType::TrendAnalysis:
        return "trend_analysis";
    case SectionType::Recommendations:
        return "recommendations";
    case SectionType::RawData:
        return "raw_data";
    }
    return "summary";
}

SectionType ReportBuilder::parseSectionType(const std::string &value)
{
    static const std::map<std::string, SectionType> types = {
        {"summary", SectionType::Summary},
        {"productivity_analysis", SectionType::ProductivityAnalysis},
        {"comparison", SectionType::Comparison},
        {"visualization", SectionType::Visualization},
        {"trend_analysis", SectionType::TrendAnalysis},
        {"recommendations", SectionType::Recommendations},
        {"raw_data", SectionType::RawData}
    };
    auto it = types.find(value);
    if (it == types.end()) {
        throw ValidationError("unknown section type: " + value);
    }
    return it->second;
}

ReportBuilder::ReportBuilder(ReportsEngine &reports,
                             ComparisonAnalytics &comparisons,
                             const SessionEventStore &sessions,
                             const EnvironmentCorrelator &environment,
                             AnalyticsStore *store,
                             Clock clock)
    : m_reports(reports)
    , m_comparisons(comparisons)
    , m_sessions(sessions)
    , m_environment(environment)
    , m_store(store)
    , m_clock(std::move(clock))
{
}

void ReportBuilder::load()
{
    if (!m_store) {
        return;
    }

    std::optional<nlohmann::json> document;
    try {
        document = m_store->loadDocument(kDocumentName);
    } catch (const std::exception &ex) {
        FLOG_WARN("ReportBuilder", "load", "snapshot_read_failed",
                  (nlohmann::json{{"error", ex.what()}}));
        return;
    }
    if (!document || !document->is_object()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_templates.clear();
    const nlohmann::json templates = document->value("templates", nlohmann::json::object());
    for (const auto &item : templates.items()) {
        if (item.value().is_object()) {
            m_templates[item.key()] = item.value();
        }
    }
}

ReportConfig ReportBuilder::parseConfig(const nlohmann::json &config)
{
    if (!config.is_object()) {
        throw ValidationError("report config must be a JSON object");
    }

    ReportConfig parsed;
    if (!config.contains("name") || !config.at("name").is_string()
        || config.at("name").get<std::string>().empty()) {
        throw ValidationError("report config requires a non-empty 'name'");
    }
    parsed.name = config.at("name").get<std::string>();

    if (!config.contains("date_range")) {
        throw ValidationError("report config requires 'date_range'");
    }
    parsed.dateRange = parseDateRange(config.at("date_range"));

    if (!config.contains("sections") || !config.at("sections").is_array()
        || config.at("sections").empty()) {
        throw ValidationError("report config requires a non-empty 'sections' array");
    }

    std::set<std::string> names;
    for (const auto &item : config.at("sections")) {
        if (!item.is_object()) {
            throw ValidationError("each section must be an object");
        }
        if (!item.contains("name") || !item.at("name").is_string()
            || item.at("name").get<std::string>().empty()) {
            throw ValidationError("each section requires a non-empty 'name'");
        }
        if (!item.contains("type") || !item.at("type").is_string()) {
            throw ValidationError("section '" + item.at("name").get<std::string>() + "' requires a 'type'");
        }

        SectionConfig section;
        section.name = item.at("name").get<std::string>();
        section.type = parseSectionType(item.at("type").get<std::string>());
        if (item.contains("parameters")) {
            if (!item.at("parameters").is_object()) {
                throw ValidationError("parameters of section '" + section.name + "' must be an object");
            }
            section.parameters = item.at("parameters");
        }
        if (!names.insert(section.name).second) {
            throw ValidationError("duplicate section name: " + section.name);
        }
        parsed.sections.push_back(std::move(section));
    }
    return parsed;
}

nlohmann::json ReportBuilder::configToJson(const ReportConfig &config)
{
    nlohmann::json range{{"preset", config.dateRange.preset}};
    if (config.dateRange.from) {
        range["from"] = toIso8601Utc(*config.dateRange.from);
    }
    if (config.dateRange.to) {
        range["to"] = toIso8601Utc(*config.dateRange.to);
    }

    nlohmann::json sections = nlohmann::json::array();
    for (const auto &section : config.sections) {
        sections.push_back({
            {"name", section.name},
            {"type", toSectionTypeString(section.type)},
            {"parameters", section.parameters}
        });
    }
    return nlohmann::json{
        {"name", config.name},
        {"date_range", range},
        {"sections", sections}
    };
}

TimeRange ReportBuilder::resolveRange(const DateRangeSpec &spec) const
{
    const TimePoint now = m_clock();
    const TimePoint tomorrow = addLocalDays(now, 1);

    if (spec.preset == "today") {
        return TimeRange{startOfLocalDay(now), tomorrow};
    }
    if (spec.preset == "last_7_days") {
        return TimeRange{addLocalDays(now, -6), tomorrow};
    }
    if (spec.preset == "last_30_days") {
        return TimeRange{addLocalDays(now, -29), tomorrow};
    }
    if (spec.preset == "this_week") {
        const TimePoint monday = startOfLocalWeek(now);
        return TimeRange{monday, addLocalDays(monday, 7)};
    }
    if (spec.preset == "this_month") {
        const TimePoint first = startOfLocalMonth(now);
        return TimeRange{first, startOfLocalMonth(addLocalDays(first, 32))};
    }
    if (spec.preset == "custom" && spec.from && spec.to) {
        const TimeRange range{*spec.from, *spec.to};
        ComparisonAnalytics::validateRange(range);
        return range;
    }
    throw ValidationError("cannot resolve date_range preset: " + spec.preset);
}

CustomReport ReportBuilder::build(const nlohmann::json &config)
{
    return build(parseConfig(config));
}

CustomReport ReportBuilder::build(const ReportConfig &config)
{
    CustomReport report;
    report.name = config.name;
    report.range = resolveRange(config.dateRange);
    report.generatedAt = m_clock();

    for (const auto &section : config.sections) {
        try {
            BuiltSection built;
            built.name = section.name;
            built.type = section.type;
            built.data = buildSection(section, report.range);
            report.sections.push_back(std::move(built));
        } catch (const std::exception &ex) {
            FLOG_WARN("ReportBuilder", "build", "section_failed",
                      (nlohmann::json{{"report", config.name},
                                      {"section", section.name},
                                      {"error", ex.what()}}));
            report.warnings.push_back("Section '" + section.name + "' failed: " + ex.what());
        }
    }

    FLOG_INFO("ReportBuilder", "build", "custom_report_built",
              (nlohmann::json{{"report", config.name},
                              {"sections", report.sections.size()},
                              {"warnings", report.warnings.size()}}));
    return report;
}

nlohmann::json ReportBuilder::buildSection(const SectionConfig &section, const TimeRange &range)
{
    switch (section.type) {
    case SectionType::Summary:
        return m_reports.sessionSummary(range);
    case SectionType::ProductivityAnalysis:
        return nlohmann::json{
            {"focus", m_reports.focusAnalysis(range)},
            {"interruptions", m_reports.interruptionAnalysis(range)},
            {"environment", m_reports.environmentAnalysis(range)}
        };
    case SectionType::Comparison:
        return buildComparison(section.parameters, range);
    case SectionType::Visualization:
        return buildVisualization(section.parameters, range);
    case SectionType::TrendAnalysis: {
        const int window = section.parameters.value("window_days", kDefaultTrendWindow);
        nlohmann::json data = m_comparisons.analyzeProgressTrends(window, range);
        data["trend_points"] = m_reports.trendAnalysis(range).at("trend_points");
        return data;
    }
    case SectionType::Recommendations:
        return nlohmann::json{
            {"recommendations", m_reports.generateComprehensiveReport(range).recommendations}
        };
    case SectionType::RawData:
        return buildRawData(section.parameters, range);
    }
    throw ValidationError("unsupported section type");
}

nlohmann::json ReportBuilder::buildComparison(const nlohmann::json &parameters, const TimeRange &range)
{
    const std::string kind = parameters.value("kind", "periods");
    if (kind == "periods") {
        const Granularity granularity =
            ComparisonAnalytics::parseGranularity(parameters.value("granularity", "week"));
        return m_comparisons.comparePeriods(granularity, range, parameters.value("periods", 1));
    }
    if (kind == "weekday_weekend") {
        return m_comparisons.compareWeekdaysVsWeekends(range);
    }
    if (kind == "time_periods") {
        if (!parameters.contains("periods")) {
            return m_comparisons.compareTimePeriods(range);
        }
        std::map<std::string, HourRange> periods;
        for (const auto &item : parameters.at("periods").items()) {
            const auto &bounds = item.value();
            if (!bounds.is_array() || bounds.size() != 2) {
                throw ValidationError("time period '" + item.key() + "' must be [start_hour, end_hour]");
            }
            periods[item.key()] = HourRange{bounds.at(0).get<int>(), bounds.at(1).get<int>()};
        }
        return m_comparisons.compareTimePeriods(range, periods);
    }
    throw ValidationError("unknown comparison kind: " + kind);
}

nlohmann::json ReportBuilder::buildVisualization(const nlohmann::json &parameters, const TimeRange &range)
{
    const std::string chart = parameters.value("chart", "line");
    const std::string metric = parameters.value("metric", "focus");
    if (chart != "line" && chart != "bar" && chart != "heatmap") {
        throw ValidationError("unknown chart type: " + chart);
    }
    if (metric != "focus" && metric != "efficiency" && metric != "completion") {
        throw ValidationError("unknown chart metric: " + metric);
    }

    nlohmann::json series = nlohmann::json::array();
    nlohmann::json meta{{"type", chart}, {"metric", metric}};
    if (chart == "heatmap") {
        for (const auto &cell : m_environment.heatmap()) {
            series.push_back({{"weekday", cell.weekday}, {"hour", cell.hour}, {"value", cell.mean}});
        }
        meta["title"] = "Performance by weekday and hour";
        meta["x_label"] = "hour";
        meta["y_label"] = "weekday";
    } else {
        std::map<std::string, std::vector<SessionRecord>> byDate;
        for (auto &record : m_sessions.sessionsBetween(range.start, range.end)) {
            byDate[localDateKey(record.startTime)].push_back(std::move(record));
        }
        for (const auto &day : byDate) {
            const PeriodMetrics metrics = ComparisonAnalytics::computeMetrics(day.second);
            if (metrics.count == 0) {
                continue;
            }
            series.push_back({{"date", day.first}, {"value", metricValue(metrics, metric)}});
        }
        meta["title"] = "Daily " + metric;
        meta["x_label"] = "date";
        meta["y_label"] = metric == "completion" ? "completion rate (%)" : metric + " score";
    }
    return nlohmann::json{{"chart", meta}, {"series", series}};
}

nlohmann::json ReportBuilder::buildRawData(const nlohmann::json &parameters, const TimeRange &range) const
{
    const int limit = parameters.value("limit", kDefaultRawLimit);
    if (limit <= 0) {
        throw ValidationError("raw_data limit must be positive");
    }
    std::vector<SessionRecord> sessions = m_sessions.sessionsBetween(range.start, range.end);
    std::sort(sessions.begin(), sessions.end(),
              [](const SessionRecord &a, const SessionRecord &b) {
                  return a.startTime > b.startTime;
              });
    if (sessions.size() > static_cast<std::size_t>(limit)) {
        sessions.resize(static_cast<std::size_t>(limit));
    }
    return nlohmann::json{{"total", sessions.size()}, {"sessions", sessions}};
}

void ReportBuilder::saveTemplate(const std::string &name, const ReportConfig &config)
{
    if (name.empty()) {
        throw ValidationError("template name must not be empty");
    }
    std::map<std::string, nlohmann::json> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_templates[name] = configToJson(config);
        snapshot = m_templates;
    }
    FLOG_INFO("ReportBuilder", "saveTemplate", "template_saved",
              (nlohmann::json{{"template", name}}));
    persistTemplates(snapshot);
}

ReportConfig ReportBuilder::loadTemplate(const std::string &name) const
{
    nlohmann::json config;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_templates.find(name);
        if (it == m_templates.end()) {
            throw NotFoundError("report template not found: " + name);
        }
        config = it->second;
    }
    return parseConfig(config);
}

std::vector<std::string> ReportBuilder::listTemplates() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    for (const auto &entry : m_templates) {
        names.push_back(entry.first);
    }
    return names;
}

void ReportBuilder::deleteTemplate(const std::string &name)
{
    std::map<std::string, nlohmann::json> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_templates.erase(name) == 0) {
            throw NotFoundError("report template not found: " + name);
        }
        snapshot = m_templates;
    }
    persistTemplates(snapshot);
}

CustomReport ReportBuilder::buildFromTemplate(const std::string &name, const nlohmann::json &overrides)
{
    nlohmann::json config = configToJson(loadTemplate(name));
    if (!overrides.is_null() && !overrides.is_object()) {
        throw ValidationError("template overrides must be a JSON object");
    }

    if (overrides.is_object()) {
        if (overrides.contains("name")) {
            config["name"] = overrides.at("name");
        }
        if (overrides.contains("date_range")) {
            config["date_range"] = overrides.at("date_range");
        }
        if (overrides.contains("sections")) {
            if (!overrides.at("sections").is_object()) {
                throw ValidationError("section overrides must map section names to parameters");
            }
            for (const auto &item : overrides.at("sections").items()) {
                if (!item.value().is_object()) {
                    throw ValidationError("override for section '" + item.key() + "' must be an object");
                }
                auto section = std::find_if(config["sections"].begin(), config["sections"].end(),
                                            [&item](const nlohmann::json &s) {
                                                return s.value("name", "") == item.key();
                                            });
                if (section == config["sections"].end()) {
                    throw ValidationError("template '" + name + "' has no section named '" + item.key() + "'");
                }
                (*section)["parameters"].update(item.value());
            }
        }
    }
    return build(parseConfig(config));
}

void ReportBuilder::persistTemplates(const std::map<std::string, nlohmann::json> &templates)
{
    nlohmann::json body{{"templates", templates}, {"last_updated", toIso8601Utc(m_clock())}};
    saveDocumentBestEffort(m_store, kDocumentName, body);
}

void to_json(nlohmann::json &j, const CustomReport &report)
{
    nlohmann::json sections = nlohmann::json::array();
    for (const auto &section : report.sections) {
        sections.push_back({
            {"name", section.name},
            {"type", toSectionTypeString(section.type)},
            {"data", section.data}
        });
    }
    j = nlohmann::json{
        {"name", report.name},
        {"range", {{"start", toIso8601Utc(report.range.start)}, {"end", toIso8601Utc(report.range.end)}}},
        {"generated_at", toIso8601Utc(report.generatedAt)},
        {"sections", sections},
        {"warnings", report.warnings}
    };
}

} // namespace focuslens
