#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>

#include "common/errors.hpp"
#include "engine/analytics_store.hpp"
#include "engine/comparison_analytics.hpp"
#include "engine/focus_score_calculator.hpp"
#include "engine/session_event_store.hpp"
#include "test_support.hpp"

using focuslens::ComparisonAnalytics;
using focuslens::Granularity;
using focuslens::SessionType;
using focuslens::TimeRange;
using focuslens::TrendDirection;
using focuslens::test::localTime;
using focuslens::test::makeRecord;

namespace {

// Session history restored from a scratch database, as the engine does at
// startup.
class SeededHistory
{
public:
    explicit SeededHistory(const std::vector<focuslens::SessionRecord> &records)
        : m_clock(localTime(12, 12))
    {
        m_store = std::make_unique<focuslens::AnalyticsStore>(m_dir.path().toStdString());
        m_sessions = std::make_unique<focuslens::SessionEventStore>(
            focuslens::test::memoryConfig(), m_calculator, m_store.get(), m_clock.clock());
        m_comparisons = std::make_unique<ComparisonAnalytics>(
            *m_sessions, focuslens::test::memoryConfig(), m_clock.clock());
        reseed(records);
    }

    void reseed(const std::vector<focuslens::SessionRecord> &records)
    {
        focuslens::test::writeSessionsDocument(*m_store, records);
        m_sessions->load();
    }

    ComparisonAnalytics &comparisons() { return *m_comparisons; }
    focuslens::ManualClock &clock() { return m_clock; }

private:
    QTemporaryDir m_dir;
    focuslens::ManualClock m_clock;
    focuslens::FocusScoreCalculator m_calculator;
    std::unique_ptr<focuslens::AnalyticsStore> m_store;
    std::unique_ptr<focuslens::SessionEventStore> m_sessions;
    std::unique_ptr<ComparisonAnalytics> m_comparisons;
};

TimeRange daysRange(int firstDay, int endDay)
{
    return TimeRange{localTime(firstDay, 0), localTime(endDay, 0)};
}

// Five weekday sessions at efficiency 90 and five weekend ones at 60.
std::vector<focuslens::SessionRecord> weekdayWeekendHistory()
{
    std::vector<focuslens::SessionRecord> records;
    for (int day = 5; day <= 9; ++day) {
        records.push_back(makeRecord("wd" + std::to_string(day), localTime(day, 9), 70.0, 90.0));
    }
    records.push_back(makeRecord("we1", localTime(10, 9), 70.0, 60.0));
    records.push_back(makeRecord("we2", localTime(10, 11), 70.0, 60.0));
    records.push_back(makeRecord("we3", localTime(10, 15), 70.0, 60.0));
    records.push_back(makeRecord("we4", localTime(11, 9), 70.0, 60.0));
    records.push_back(makeRecord("we5", localTime(11, 11), 70.0, 60.0));
    return records;
}

} // namespace

class ComparisonAnalyticsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testPercentChange();
    void testComputeMetricsSkipsBreaks();
    void testComparePeriodsImproved();
    void testComparePeriodsEmptyAnchor();
    void testRangeAndGranularityValidation();
    void testWeekdayVsWeekend();
    void testWeekdayVsWeekendNeedsFivePerGroup();
    void testEffectSizeBands();
    void testTimePeriods();
    void testStableTrend();
    void testFlatLowScoresAreStable();
    void testImprovingTrend();
    void testTrendNeedsThreeDays();
    void testCacheExpiry();

private:
    QTemporaryDir m_tempDir;
};

void ComparisonAnalyticsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("FOCUSLENS_LOG_DIR", m_tempDir.filePath("logs").toUtf8());
}

void ComparisonAnalyticsTests::testPercentChange()
{
    QCOMPARE(ComparisonAnalytics::percentChange(0.0, 0.0), 0.0);
    QCOMPARE(ComparisonAnalytics::percentChange(0.0, 5.0), 100.0);
    QCOMPARE(ComparisonAnalytics::percentChange(50.0, 75.0), 50.0);
    QCOMPARE(ComparisonAnalytics::percentChange(80.0, 60.0), -25.0);
    QCOMPARE(ComparisonAnalytics::percentChange(3.0, 4.0), 33.3);
}

void ComparisonAnalyticsTests::testComputeMetricsSkipsBreaks()
{
    const std::vector<focuslens::SessionRecord> sessions{
        makeRecord("a", localTime(5, 9), 80.0, 90.0, true, SessionType::Work, 2),
        makeRecord("b", localTime(5, 10), 60.0, 70.0, false, SessionType::Work, 1,
                   std::chrono::minutes(15)),
        makeRecord("c", localTime(5, 11), 10.0, 10.0, true, SessionType::Break),
    };

    const focuslens::PeriodMetrics metrics = ComparisonAnalytics::computeMetrics(sessions);
    QCOMPARE(metrics.count, 2);
    QCOMPARE(metrics.avgFocusScore, 70.0);
    QCOMPARE(metrics.avgEfficiencyScore, 80.0);
    QCOMPARE(metrics.completionRate, 50.0);
    QCOMPARE(metrics.avgDurationMinutes, 20.0);
    QCOMPARE(metrics.totalInterruptions, 3);
    QCOMPARE(metrics.interruptionsPerSession, 1.5);

    const focuslens::PeriodMetrics empty = ComparisonAnalytics::computeMetrics({});
    QCOMPARE(empty.count, 0);
    QCOMPARE(empty.avgFocusScore, 0.0);
}

void ComparisonAnalyticsTests::testComparePeriodsImproved()
{
    SeededHistory history({
        makeRecord("p1", localTime(6, 9), 60.0, 60.0, false),
        makeRecord("p2", localTime(7, 9), 60.0, 60.0, false),
        makeRecord("c1", localTime(13, 9), 80.0, 90.0, true),
        makeRecord("c2", localTime(14, 9), 80.0, 90.0, true),
    });

    const focuslens::PeriodComparisonResult result =
        history.comparisons().comparePeriods(Granularity::Week, daysRange(12, 19), 1);
    QCOMPARE(result.anchor.metrics.count, 2);
    QCOMPARE(result.comparisons.size(), static_cast<std::size_t>(1));

    const focuslens::PeriodComparison &previous = result.comparisons.front();
    QVERIFY(previous.window.range.start == localTime(5, 0));
    QCOMPARE(previous.window.metrics.count, 2);
    QCOMPARE(previous.percentChanges.at("avg_focus_score"), 33.3);
    QCOMPARE(previous.percentChanges.at("avg_efficiency_score"), 50.0);
    QCOMPARE(previous.percentChanges.at("completion_rate"), 100.0);
    QCOMPARE(previous.percentChanges.at("avg_duration"), 0.0);
    QCOMPARE(QString::fromStdString(previous.verdict), QStringLiteral("improved"));
    QCOMPARE(QString::fromStdString(result.overallVerdict), QStringLiteral("improved"));
    QCOMPARE(result.insights.size(), static_cast<std::size_t>(2));
    QVERIFY(result.insights.front().find("Focus improved by 33%") != std::string::npos);

    const nlohmann::json json = result;
    QCOMPARE(QString::fromStdString(json["granularity"].get<std::string>()), QStringLiteral("week"));
    QCOMPARE(json["comparisons"].size(), static_cast<std::size_t>(1));
}

void ComparisonAnalyticsTests::testComparePeriodsEmptyAnchor()
{
    SeededHistory history({makeRecord("p1", localTime(6, 9), 60.0, 60.0)});

    // Zero periods is clamped to one.
    const focuslens::PeriodComparisonResult result =
        history.comparisons().comparePeriods(Granularity::Day, daysRange(7, 8), 0);
    QCOMPARE(result.comparisons.size(), static_cast<std::size_t>(1));
    QCOMPARE(result.anchor.metrics.count, 0);
    QCOMPARE(QString::fromStdString(result.comparisons.front().verdict), QStringLiteral("declined"));
    QCOMPARE(QString::fromStdString(result.insights.back()),
             QStringLiteral("No work sessions in the selected period"));
}

void ComparisonAnalyticsTests::testRangeAndGranularityValidation()
{
    SeededHistory history(std::vector<focuslens::SessionRecord>{});

    bool thrown = false;
    try {
        history.comparisons().comparePeriods(Granularity::Day, daysRange(8, 8), 1);
    } catch (const focuslens::ValidationError &) {
        thrown = true;
    }
    QVERIFY(thrown);

    thrown = false;
    try {
        history.comparisons().compareWeekdaysVsWeekends(daysRange(9, 5));
    } catch (const focuslens::ValidationError &) {
        thrown = true;
    }
    QVERIFY(thrown);

    QCOMPARE(ComparisonAnalytics::parseGranularity("day"), Granularity::Day);
    QCOMPARE(ComparisonAnalytics::parseGranularity("weekly"), Granularity::Week);
    QCOMPARE(ComparisonAnalytics::parseGranularity("month"), Granularity::Month);
    thrown = false;
    try {
        ComparisonAnalytics::parseGranularity("fortnight");
    } catch (const focuslens::ValidationError &ex) {
        thrown = true;
        QVERIFY(std::string(ex.what()).find("fortnight") != std::string::npos);
    }
    QVERIFY(thrown);
}

void ComparisonAnalyticsTests::testWeekdayVsWeekend()
{
    SeededHistory history(weekdayWeekendHistory());

    const focuslens::WeekdayWeekendResult result =
        history.comparisons().compareWeekdaysVsWeekends(daysRange(5, 12));
    QCOMPARE(result.weekday.count, 5);
    QCOMPARE(result.weekend.count, 5);
    QCOMPARE(result.weekday.avgEfficiencyScore, 90.0);
    QCOMPARE(result.weekend.avgEfficiencyScore, 60.0);
    QCOMPARE(result.percentDifference.at("avg_efficiency_score"), 50.0);
    QCOMPARE(result.percentDifference.at("avg_focus_score"), 0.0);
    QCOMPARE(QString::fromStdString(result.better), QStringLiteral("weekday"));
    // Zero spread inside both groups with different means.
    QCOMPARE(QString::fromStdString(result.effectSizeBand), QStringLiteral("large"));
    QCOMPARE(result.effectSize, 0.0);
    QCOMPARE(result.recommendations.size(), static_cast<std::size_t>(1));
    QVERIFY(result.recommendations.front().find("weekdays") != std::string::npos);

    const nlohmann::json json = result;
    QCOMPARE(json["difference_percent"]["avg_efficiency_score"].get<double>(), 50.0);
}

void ComparisonAnalyticsTests::testWeekdayVsWeekendNeedsFivePerGroup()
{
    std::vector<focuslens::SessionRecord> records = weekdayWeekendHistory();
    records.pop_back();
    SeededHistory history(records);

    const focuslens::WeekdayWeekendResult result =
        history.comparisons().compareWeekdaysVsWeekends(daysRange(5, 12));
    QCOMPARE(result.weekend.count, 4);
    QCOMPARE(QString::fromStdString(result.effectSizeBand), QStringLiteral("insufficient_data"));
    QCOMPARE(QString::fromStdString(result.better), QStringLiteral("weekday"));
}

void ComparisonAnalyticsTests::testEffectSizeBands()
{
    double effect = -1.0;
    const std::vector<double> same{70.0, 72.0, 74.0, 76.0, 78.0};
    QCOMPARE(QString::fromStdString(ComparisonAnalytics::effectSizeBand(same, same, &effect)),
             QStringLiteral("none"));
    QCOMPARE(effect, 0.0);

    const std::vector<double> shifted{71.0, 73.0, 75.0, 77.0, 79.0};
    QCOMPARE(QString::fromStdString(ComparisonAnalytics::effectSizeBand(same, shifted, &effect)),
             QStringLiteral("small"));

    const std::vector<double> far{90.0, 92.0, 94.0, 96.0, 98.0};
    QCOMPARE(QString::fromStdString(ComparisonAnalytics::effectSizeBand(same, far, &effect)),
             QStringLiteral("large"));
    QVERIFY(effect > 0.8);

    const std::vector<double> flat{80.0, 80.0, 80.0, 80.0, 80.0};
    QCOMPARE(QString::fromStdString(ComparisonAnalytics::effectSizeBand(flat, flat, &effect)),
             QStringLiteral("none"));
}

void ComparisonAnalyticsTests::testTimePeriods()
{
    std::vector<focuslens::SessionRecord> records;
    for (int day = 5; day <= 9; ++day) {
        records.push_back(makeRecord("m" + std::to_string(day), localTime(day, 9), 90.0, 90.0));
    }
    records.push_back(makeRecord("a1", localTime(5, 14), 60.0, 60.0));
    records.push_back(makeRecord("a2", localTime(6, 14), 60.0, 60.0));
    records.push_back(makeRecord("n1", localTime(6, 23), 99.0, 99.0));
    SeededHistory history(records);

    const focuslens::TimePeriodComparisonResult result =
        history.comparisons().compareTimePeriods(daysRange(5, 12));
    QCOMPARE(result.buckets.size(), static_cast<std::size_t>(3));
    QCOMPARE(QString::fromStdString(result.best.value_or("")), QStringLiteral("morning"));

    for (const auto &bucket : result.buckets) {
        if (bucket.name == "morning") {
            QCOMPARE(bucket.metrics.count, 5);
            QCOMPARE(bucket.composite, 92.0);
            QCOMPARE(QString::fromStdString(bucket.confidence), QStringLiteral("high"));
        } else if (bucket.name == "afternoon") {
            QCOMPARE(bucket.metrics.count, 2);
            QCOMPARE(bucket.composite, 68.0);
            QCOMPARE(QString::fromStdString(bucket.confidence), QStringLiteral("medium"));
        } else {
            QCOMPARE(QString::fromStdString(bucket.name), QStringLiteral("evening"));
            QCOMPARE(bucket.metrics.count, 0);
            QCOMPARE(QString::fromStdString(bucket.confidence), QStringLiteral("low"));
        }
    }

    const focuslens::TimePeriodComparisonResult night = history.comparisons().compareTimePeriods(
        daysRange(5, 12), {{"late", focuslens::HourRange{22, 24}}});
    QCOMPARE(night.buckets.size(), static_cast<std::size_t>(1));
    QCOMPARE(night.buckets.front().metrics.count, 1);

    bool thrown = false;
    try {
        history.comparisons().compareTimePeriods(daysRange(5, 12), {{"bad", focuslens::HourRange{10, 9}}});
    } catch (const focuslens::ValidationError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void ComparisonAnalyticsTests::testStableTrend()
{
    std::vector<focuslens::SessionRecord> records;
    for (int day = 5; day <= 9; ++day) {
        records.push_back(makeRecord("s" + std::to_string(day), localTime(day, 9), 80.0, 80.0));
    }
    SeededHistory history(records);

    const focuslens::ProgressTrendResult result =
        history.comparisons().analyzeProgressTrends(7, daysRange(5, 12));
    QCOMPARE(result.daily.size(), static_cast<std::size_t>(5));
    QCOMPARE(result.overall, TrendDirection::Stable);
    QCOMPARE(result.metrics.size(), static_cast<std::size_t>(3));
    for (const auto &metric : result.metrics) {
        QCOMPARE(metric.slope, 0.0);
        QCOMPARE(metric.direction, TrendDirection::Stable);
        QCOMPARE(metric.improvementRate, 0.0);
    }
    QCOMPARE(QString::fromStdString(result.milestones["best_focus_day"]["date"].get<std::string>()),
             QStringLiteral("2026-01-05"));
}

void ComparisonAnalyticsTests::testFlatLowScoresAreStable()
{
    // Six consecutive sessions at 40, one a day.
    std::vector<focuslens::SessionRecord> daily;
    for (int day = 5; day <= 10; ++day) {
        daily.push_back(makeRecord("d" + std::to_string(day), localTime(day, 9), 40.0, 40.0));
    }
    SeededHistory perDay(daily);
    const focuslens::ProgressTrendResult spread =
        perDay.comparisons().analyzeProgressTrends(7, daysRange(5, 12));
    QCOMPARE(spread.daily.size(), static_cast<std::size_t>(6));
    QCOMPARE(spread.overall, TrendDirection::Stable);
    for (const auto &metric : spread.metrics) {
        QCOMPARE(metric.slope, 0.0);
        QVERIFY(metric.direction != TrendDirection::Improving);
    }
    QCOMPARE(spread.metrics.front().predictedIn7Days, 40.0);

    // The same six packed into three days.
    std::vector<focuslens::SessionRecord> paired;
    for (int i = 0; i < 6; ++i) {
        paired.push_back(makeRecord("p" + std::to_string(i), localTime(5 + i / 2, 9 + i), 40.0, 40.0));
    }
    SeededHistory threeDays(paired);
    const focuslens::ProgressTrendResult packed =
        threeDays.comparisons().analyzeProgressTrends(7, daysRange(5, 12));
    QCOMPARE(packed.daily.size(), static_cast<std::size_t>(3));
    QCOMPARE(packed.overall, TrendDirection::Stable);

    // All six on one day is too little history for a trend, never an improvement.
    std::vector<focuslens::SessionRecord> sameDay;
    for (int i = 0; i < 6; ++i) {
        sameDay.push_back(makeRecord("m" + std::to_string(i), localTime(5, 9 + i), 40.0, 40.0));
    }
    SeededHistory oneDay(sameDay);
    const focuslens::ProgressTrendResult single =
        oneDay.comparisons().analyzeProgressTrends(7, daysRange(5, 12));
    QCOMPARE(single.overall, TrendDirection::InsufficientData);
    QVERIFY(single.metrics.empty());
}

void ComparisonAnalyticsTests::testImprovingTrend()
{
    std::vector<focuslens::SessionRecord> records;
    for (int day = 5; day <= 9; ++day) {
        const double score = 50.0 + (day - 5) * 10.0;
        records.push_back(makeRecord("s" + std::to_string(day), localTime(day, 9), score, score));
    }
    SeededHistory history(records);

    // A window of one leaves the daily series untouched.
    const focuslens::ProgressTrendResult result =
        history.comparisons().analyzeProgressTrends(1, daysRange(5, 12));
    QCOMPARE(result.overall, TrendDirection::Improving);
    QCOMPARE(result.metrics[0].direction, TrendDirection::Improving);
    QCOMPARE(result.metrics[0].slope, 10.0);
    QCOMPARE(result.metrics[0].predictedIn7Days, 100.0);
    QCOMPARE(result.metrics[1].direction, TrendDirection::Improving);
    // Completion is 100 on every day.
    QCOMPARE(result.metrics[2].direction, TrendDirection::Stable);
    QCOMPARE(result.metrics[0].improvementRate, 80.0);
    QCOMPARE(QString::fromStdString(result.milestones["best_focus_day"]["date"].get<std::string>()),
             QStringLiteral("2026-01-09"));
}

void ComparisonAnalyticsTests::testTrendNeedsThreeDays()
{
    SeededHistory history({
        makeRecord("a", localTime(5, 9), 80.0, 80.0),
        makeRecord("b", localTime(5, 14), 80.0, 80.0),
        makeRecord("c", localTime(6, 9), 80.0, 80.0),
        makeRecord("brk", localTime(7, 9), 80.0, 80.0, true, SessionType::Break),
    });

    const focuslens::ProgressTrendResult result =
        history.comparisons().analyzeProgressTrends(7, daysRange(5, 12));
    QCOMPARE(result.overall, TrendDirection::InsufficientData);
    QCOMPARE(result.daily.size(), static_cast<std::size_t>(2));
    QVERIFY(result.metrics.empty());
    QVERIFY(!result.message.empty());
}

void ComparisonAnalyticsTests::testCacheExpiry()
{
    std::vector<focuslens::SessionRecord> records = weekdayWeekendHistory();
    SeededHistory history(records);
    ComparisonAnalytics &comparisons = history.comparisons();

    QCOMPARE(comparisons.compareWeekdaysVsWeekends(daysRange(5, 12)).weekday.count, 5);
    QCOMPARE(comparisons.cachedEntries(), static_cast<std::size_t>(1));

    records.push_back(makeRecord("late", localTime(9, 16), 70.0, 90.0));
    history.reseed(records);

    history.clock().advance(std::chrono::seconds(3599));
    QCOMPARE(comparisons.compareWeekdaysVsWeekends(daysRange(5, 12)).weekday.count, 5);

    history.clock().advance(std::chrono::seconds(1));
    QCOMPARE(comparisons.compareWeekdaysVsWeekends(daysRange(5, 12)).weekday.count, 6);

    comparisons.analyzeProgressTrends(7, daysRange(5, 12));
    QCOMPARE(comparisons.cachedEntries(), static_cast<std::size_t>(2));
    comparisons.clearCache();
    QCOMPARE(comparisons.cachedEntries(), static_cast<std::size_t>(0));
}

QTEST_MAIN(ComparisonAnalyticsTests)
#include "test_comparison_analytics.moc"
