#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"
#include "common/models.hpp"
#include "engine/comparison_analytics.hpp"

namespace focuslens {

class AnalyticsStore;
class EnvironmentCorrelator;
class ReportsEngine;
class SessionEventStore;

enum class SectionType {
    Summary,
    ProductivityAnalysis,
    Comparison,
    Visualization,
    TrendAnalysis,
    Recommendations,
    RawData
};

struct DateRangeSpec {
    std::string preset = "last_7_days"; // today, last_7_days, last_30_days, this_week, this_month, custom
    std::optional<TimePoint> from;
    std::optional<TimePoint> to;
};

struct SectionConfig {
    std::string name;
    SectionType type = SectionType::Summary;
    nlohmann::json parameters = nlohmann::json::object();
};

struct ReportConfig {
    std::string name;
    DateRangeSpec dateRange;
    std::vector<SectionConfig> sections;
};

struct BuiltSection {
    std::string name;
    SectionType type = SectionType::Summary;
    nlohmann::json data;
};

struct CustomReport {
    std::string name;
    TimeRange range;
    TimePoint generatedAt;
    std::vector<BuiltSection> sections;
    std::vector<std::string> warnings;
};

/**
 * ReportBuilder turns a declarative report config into a CustomReport.
 *
 * Config errors (missing fields, unknown section types, inverted ranges) throw
 * ValidationError before anything runs. Once building starts, a section that
 * fails is recorded as a warning and left out; the remaining sections still
 * run. Named templates live in the "report_templates" document.
 */
class ReportBuilder
{
public:
    ReportBuilder(ReportsEngine &reports,
                  ComparisonAnalytics &comparisons,
                  const SessionEventStore &sessions,
                  const EnvironmentCorrelator &environment,
                  AnalyticsStore *store,
                  Clock clock);

    void load();

    static ReportConfig parseConfig(const nlohmann::json &config);
    static nlohmann::json configToJson(const ReportConfig &config);
    static SectionType parseSectionType(const std::string &value);

    TimeRange resolveRange(const DateRangeSpec &spec) const;

    CustomReport build(const ReportConfig &config);
    CustomReport build(const nlohmann::json &config);

    void saveTemplate(const std::string &name, const ReportConfig &config);
    ReportConfig loadTemplate(const std::string &name) const;
    std::vector<std::string> listTemplates() const;
    void deleteTemplate(const std::string &name);

    // Overrides may carry "date_range" and "sections": {name: {parameters}}.
    CustomReport buildFromTemplate(const std::string &name,
                                   const nlohmann::json &overrides = nlohmann::json::object());

private:
    nlohmann::json buildSection(const SectionConfig &section, const TimeRange &range);
    nlohmann::json buildComparison(const nlohmann::json &parameters, const TimeRange &range);
    nlohmann::json buildVisualization(const nlohmann::json &parameters, const TimeRange &range);
    nlohmann::json buildRawData(const nlohmann::json &parameters, const TimeRange &range) const;
    void persistTemplates(const std::map<std::string, nlohmann::json> &templates);

    ReportsEngine &m_reports;
    ComparisonAnalytics &m_comparisons;
    const SessionEventStore &m_sessions;
    const EnvironmentCorrelator &m_environment;
    AnalyticsStore *m_store;
    Clock m_clock;

    mutable std::mutex m_mutex;
    std::map<std::string, nlohmann::json> m_templates;
};

std::string toSectionTypeString(SectionType type);

void to_json(nlohmann::json &j, const CustomReport &report);

} // namespace focuslens
