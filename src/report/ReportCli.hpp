#pragma once

#include <memory>
#include <optional>

#include <QString>
#include <QStringList>

#include "engine/comparison_analytics.hpp"

namespace focuslens {

class AnalyticsEngine;

class ReportCli
{
public:
    ReportCli();
    ~ReportCli();

    // CLI dispatcher for reports, comparisons and templates.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int dispatch(const QStringList &args);
    int runSummary(const QStringList &args);
    int runCompare(const QStringList &args);
    int runTrends(const QStringList &args);
    int runCustom(const QStringList &args);
    int runTemplate(const QStringList &args);

    // Reads --from/--to; falls back to the default report range.
    TimeRange parseRange(const QStringList &args);
    AnalyticsEngine &engine(const QStringList &args);

    std::unique_ptr<AnalyticsEngine> m_engine;
};

} // namespace focuslens
