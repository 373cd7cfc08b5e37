#include <QtTest/QtTest>

#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QThread>

#include <set>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "engine/analytics_store.hpp"
#include "engine/focus_score_calculator.hpp"
#include "engine/session_event_store.hpp"
#include "test_support.hpp"

using focuslens::InteractionKind;
using focuslens::SessionEventStore;
using focuslens::SessionType;

class SessionEventStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testLifecycle();
    void testEndWithoutSessionIsNoop();
    void testStartReplacesActiveSession();
    void testWritesWithoutSessionAreIgnored();
    void testConcurrentStartsKeepEverySession();
    void testPlannedDurationFallback();
    void testFallbackWarnsOnce();
    void testShortSessionGetsOneSample();
    void testFocusScoreIsSampleMean();
    void testEfficiency();
    void testHistoryCap();
    void testAggregatesAndSummary();
    void testQueries();
    void testCleanupOlderThan();
    void testPersistenceRoundTrip();
    void testCorruptAggregatesRebuilt();

private:
    QTemporaryDir m_tempDir;
};

void SessionEventStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("FOCUSLENS_LOG_DIR", m_tempDir.filePath("logs").toUtf8());
    qRegisterMetaType<focuslens::SessionRecord>();
}

void SessionEventStoreTests::testLifecycle()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());
    QSignalSpy startedSpy(&store, &SessionEventStore::sessionStarted);
    QSignalSpy finalizedSpy(&store, &SessionEventStore::sessionFinalized);

    const std::string id = store.startSession(SessionType::Work, std::chrono::minutes(25));
    QVERIFY(!id.empty());
    QVERIFY(store.hasActiveSession());
    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(startedSpy.at(0).at(0).toString(), QString::fromStdString(id));

    clock.advance(std::chrono::seconds(60));
    QVERIFY(store.recordInteraction(InteractionKind::Click));
    clock.advance(std::chrono::seconds(60));
    QVERIFY(store.recordInteraction(InteractionKind::Custom, nlohmann::json{{"task", "t1"}}, "task_pinned"));

    const auto active = store.activeSession();
    QVERIFY(active.has_value());
    QCOMPARE(active->interactions.size(), static_cast<std::size_t>(2));
    QCOMPARE(static_cast<long long>(active->interactions[0].sessionOffset.count()), 60LL);
    QCOMPARE(QString::fromStdString(active->interactions[1].customType), QStringLiteral("task_pinned"));
    QVERIFY(!active->focusScore.has_value());

    clock.set(focuslens::test::localTime(5, 9) + std::chrono::seconds(1500));
    const auto record = store.endSession(true);
    QVERIFY(record.has_value());
    QVERIFY(record->finalized);
    QVERIFY(record->completed);
    QCOMPARE(static_cast<long long>(record->actualDuration.count()), 1500LL);
    QCOMPARE(record->efficiencyScore.value_or(-1.0), 100.0);
    QVERIFY(record->focusScore.has_value());
    QVERIFY(*record->focusScore >= 0.0 && *record->focusScore <= 100.0);
    QCOMPARE(record->environment.hour, 9);
    QCOMPARE(record->environment.weekday, 0);

    QVERIFY(!store.hasActiveSession());
    QCOMPARE(store.history().size(), static_cast<std::size_t>(1));
    QCOMPARE(finalizedSpy.count(), 1);
}

void SessionEventStoreTests::testEndWithoutSessionIsNoop()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());
    QSignalSpy finalizedSpy(&store, &SessionEventStore::sessionFinalized);

    QVERIFY(!store.endSession(true).has_value());

    store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(10));
    QVERIFY(store.endSession(false).has_value());
    QVERIFY(!store.endSession(false).has_value());

    QCOMPARE(store.history().size(), static_cast<std::size_t>(1));
    QCOMPARE(finalizedSpy.count(), 1);
}

void SessionEventStoreTests::testStartReplacesActiveSession()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());

    const std::string first = store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(5));
    const std::string second = store.startSession(SessionType::Break, std::chrono::minutes(5));
    QVERIFY(first != second);

    const auto history = store.history();
    QCOMPARE(history.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(history.front().id), QString::fromStdString(first));
    QVERIFY(!history.front().completed);
    QCOMPARE(QString::fromStdString(store.activeSession()->id), QString::fromStdString(second));
}

void SessionEventStoreTests::testWritesWithoutSessionAreIgnored()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());

    QVERIFY(!store.recordInteraction(InteractionKind::Keypress));
    QVERIFY(!store.recordInterruption(focuslens::InterruptionEvent{}));
    QVERIFY(!store.sampleFocus().has_value());
    QVERIFY(store.history().empty());
}

void SessionEventStoreTests::testConcurrentStartsKeepEverySession()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());
    const std::string original = store.startSession(SessionType::Work, std::chrono::minutes(25));

    std::string first;
    std::string second;
    QThread *a = QThread::create([&] { first = store.startSession(SessionType::Work, std::chrono::minutes(25)); });
    QThread *b = QThread::create([&] { second = store.startSession(SessionType::Break, std::chrono::minutes(5)); });
    a->start();
    b->start();
    QVERIFY(a->wait(10000));
    QVERIFY(b->wait(10000));
    delete a;
    delete b;

    // Every started session is either finalized or still active.
    const auto history = store.history();
    QCOMPARE(history.size(), static_cast<std::size_t>(2));
    std::set<std::string> ids;
    for (const auto &record : history) {
        QVERIFY(record.finalized);
        QVERIFY(!record.completed);
        ids.insert(record.id);
    }
    const auto active = store.activeSession();
    QVERIFY(active.has_value());
    ids.insert(active->id);
    QCOMPARE(ids.size(), static_cast<std::size_t>(3));
    QVERIFY(ids.count(original) == 1);
    QVERIFY(ids.count(first) == 1);
    QVERIFY(ids.count(second) == 1);
}

void SessionEventStoreTests::testPlannedDurationFallback()
{
    using std::chrono::minutes;
    using std::chrono::seconds;
    const auto sanitized = [](SessionType type, seconds planned) {
        return static_cast<long long>(SessionEventStore::sanitizePlannedDuration(type, planned).count());
    };
    QCOMPARE(sanitized(SessionType::Work, minutes(50)), 3000LL);
    QCOMPARE(sanitized(SessionType::Work, minutes(1440)), 86400LL);
    QCOMPARE(sanitized(SessionType::Work, seconds(0)), 1500LL);
    QCOMPARE(sanitized(SessionType::Break, seconds(-30)), 300LL);
    // A timestamp leaking into the duration field.
    QCOMPARE(sanitized(SessionType::Break, seconds(1767600000)), 300LL);

    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());
    store.startSession(SessionType::Break, minutes(1441));
    QCOMPARE(static_cast<long long>(store.activeSession()->plannedDuration.count()), 300LL);
}

void SessionEventStoreTests::testFallbackWarnsOnce()
{
    focuslens::logging::initLogging(QStringLiteral("focuslens-session-test"), false);
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());
    store.startSession(SessionType::Work, std::chrono::seconds(0));

    QFile file(m_tempDir.filePath("logs/focuslens-session-test.log"));
    QVERIFY(file.open(QIODevice::ReadOnly));
    int resets = 0;
    long long loggedPlanned = -1;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const auto parsed = nlohmann::json::parse(line.toStdString());
        const std::string what = parsed.value("what", "");
        if (what == "planned_duration_reset") {
            ++resets;
        } else if (what == "session_started") {
            loggedPlanned = parsed.at("context").value("plannedSeconds", -1LL);
        }
    }
    QCOMPARE(resets, 1);
    QCOMPARE(loggedPlanned, 1500LL);
}

void SessionEventStoreTests::testShortSessionGetsOneSample()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());

    store.startSession(SessionType::Work, std::chrono::minutes(25));
    const auto record = store.endSession(false);
    QVERIFY(record.has_value());
    QCOMPARE(record->focusSamples.size(), static_cast<std::size_t>(1));
    QCOMPARE(record->focusScore.value_or(-1.0), 60.0);
    QCOMPARE(record->efficiencyScore.value_or(-1.0), 0.0);
}

void SessionEventStoreTests::testFocusScoreIsSampleMean()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());
    QSignalSpy sampledSpy(&store, &SessionEventStore::focusSampled);

    store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(5));
    QCOMPARE(store.sampleFocus().value_or(-1.0), 68.0);
    clock.advance(std::chrono::minutes(5));
    QCOMPARE(store.sampleFocus().value_or(-1.0), 76.0);
    QCOMPARE(sampledSpy.count(), 2);

    const auto record = store.endSession(false);
    QCOMPARE(record->focusSamples.size(), static_cast<std::size_t>(2));
    QCOMPARE(record->focusScore.value_or(-1.0), 72.0);
    QCOMPARE(record->efficiencyScore.value_or(-1.0), 40.0);
}

void SessionEventStoreTests::testEfficiency()
{
    focuslens::SessionRecord record;
    record.plannedDuration = std::chrono::minutes(25);
    record.actualDuration = std::chrono::minutes(25);
    QCOMPARE(SessionEventStore::computeEfficiency(record), 100.0);

    record.actualDuration = std::chrono::minutes(50);
    QCOMPARE(SessionEventStore::computeEfficiency(record), 100.0);

    record.actualDuration = std::chrono::minutes(25);
    record.interruptions.resize(3);
    QCOMPARE(SessionEventStore::computeEfficiency(record), 70.0);

    // The interruption penalty never removes more than half.
    record.interruptions.resize(12);
    QCOMPARE(SessionEventStore::computeEfficiency(record), 50.0);

    record.plannedDuration = std::chrono::seconds(0);
    QCOMPARE(SessionEventStore::computeEfficiency(record), 0.0);
}

void SessionEventStoreTests::testHistoryCap()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    focuslens::EngineConfig config = focuslens::test::memoryConfig();
    config.sessionHistoryCap = 3;
    SessionEventStore store(config, calculator, nullptr, clock.clock());

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(store.startSession(SessionType::Work, std::chrono::minutes(25)));
        clock.advance(std::chrono::minutes(25));
        store.endSession(true);
    }

    const auto history = store.history();
    QCOMPARE(history.size(), static_cast<std::size_t>(3));
    QCOMPARE(QString::fromStdString(history.front().id), QString::fromStdString(ids[2]));
    QCOMPARE(QString::fromStdString(history.back().id), QString::fromStdString(ids[4]));
}

void SessionEventStoreTests::testAggregatesAndSummary()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());

    store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(25));
    store.endSession(true);
    store.startSession(SessionType::Break, std::chrono::minutes(5));
    clock.advance(std::chrono::minutes(5));
    store.endSession(false);
    store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(25));
    store.endSession(false);

    const focuslens::DailyStats daily = store.dailyStats("2026-01-05");
    QCOMPARE(daily.workSessions, 2);
    QCOMPARE(daily.breakSessions, 1);
    QCOMPARE(daily.workMinutes, 50);
    QCOMPARE(daily.breakMinutes, 5);
    QCOMPARE(daily.completedSessions, 1);

    const focuslens::WeeklyStats weekly = store.weeklyStats("2026-W02");
    QCOMPARE(weekly.workSessions, 2);

    const focuslens::DailyStats missing = store.dailyStats("2026-02-01");
    QCOMPARE(QString::fromStdString(missing.date), QStringLiteral("2026-02-01"));
    QCOMPARE(missing.workSessions, 0);

    // completion 1/2 weighted 0.6, volume 1/8 weighted 0.4.
    QCOMPARE(store.dailyProductivityScore("2026-01-05"), 35.0);
    QCOMPARE(store.dailyProductivityScore("2026-01-06"), 0.0);

    const nlohmann::json summary = store.statsSummary();
    QCOMPARE(summary["today"]["work_sessions"].get<int>(), 2);
    QCOMPARE(summary["today"]["break_time"].get<int>(), 5);
    QCOMPARE(summary["week"]["work_time"].get<int>(), 50);
    QCOMPARE(summary["total"]["sessions"].get<int>(), 3);
}

void SessionEventStoreTests::testQueries()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());

    const std::string morning = store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(25));
    store.endSession(true);
    clock.set(focuslens::test::localTime(6, 14));
    const std::string afternoon = store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(25));
    store.endSession(true);

    // Half-open range on start time.
    const auto firstDay = store.sessionsBetween(focuslens::test::localTime(5, 0),
                                                focuslens::test::localTime(6, 0));
    QCOMPARE(firstDay.size(), static_cast<std::size_t>(1));
    QCOMPARE(store.sessionsBetween(focuslens::test::localTime(5, 9),
                                   focuslens::test::localTime(6, 14)).size(),
             static_cast<std::size_t>(1));

    const auto recent = store.recentSessions(1);
    QCOMPARE(recent.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(recent.front().id), QString::fromStdString(afternoon));

    QCOMPARE(QString::fromStdString(store.findSession(morning).id), QString::fromStdString(morning));
    bool thrown = false;
    try {
        store.findSession("missing");
    } catch (const focuslens::NotFoundError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void SessionEventStoreTests::testCleanupOlderThan()
{
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    SessionEventStore store(focuslens::test::memoryConfig(), calculator, nullptr, clock.clock());

    store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(25));
    store.endSession(true);

    clock.set(focuslens::test::localTime(15, 9));
    const std::string kept = store.startSession(SessionType::Work, std::chrono::minutes(25));
    clock.advance(std::chrono::minutes(25));
    store.endSession(true);

    QCOMPARE(store.cleanupOlderThan(7), static_cast<std::size_t>(1));
    QCOMPARE(store.cleanupOlderThan(7), static_cast<std::size_t>(0));
    const auto history = store.history();
    QCOMPARE(history.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(history.front().id), QString::fromStdString(kept));
}

void SessionEventStoreTests::testPersistenceRoundTrip()
{
    QTemporaryDir dataDir;
    QVERIFY(dataDir.isValid());
    focuslens::ManualClock clock(focuslens::test::localTime(5, 9));
    focuslens::FocusScoreCalculator calculator;
    std::string id;

    {
        focuslens::AnalyticsStore analytics(dataDir.path().toStdString());
        SessionEventStore store(focuslens::test::memoryConfig(), calculator, &analytics, clock.clock());
        id = store.startSession(SessionType::Work, std::chrono::minutes(25));
        clock.advance(std::chrono::minutes(2));
        store.recordInteraction(InteractionKind::TaskUpdate);
        clock.advance(std::chrono::minutes(23));
        store.endSession(true);
        store.startSession(SessionType::Break, std::chrono::minutes(5));
        clock.advance(std::chrono::minutes(5));
        store.endSession(true);
    }

    focuslens::AnalyticsStore analytics(dataDir.path().toStdString());
    SessionEventStore restored(focuslens::test::memoryConfig(), calculator, &analytics, clock.clock());
    restored.load();

    const auto history = restored.history();
    QCOMPARE(history.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(history.front().id), QString::fromStdString(id));
    QVERIFY(history.front().finalized);
    QCOMPARE(history.front().interactions.size(), static_cast<std::size_t>(1));
    QCOMPARE(history.front().interactions.front().kind, InteractionKind::TaskUpdate);
    QCOMPARE(history.back().type, SessionType::Break);

    const focuslens::DailyStats daily = restored.dailyStats("2026-01-05");
    QCOMPARE(daily.workSessions, 1);
    QCOMPARE(daily.breakSessions, 1);
    QCOMPARE(daily.completedSessions, 2);
}

void SessionEventStoreTests::testCorruptAggregatesRebuilt()
{
    QTemporaryDir dataDir;
    QVERIFY(dataDir.isValid());
    focuslens::ManualClock clock(focuslens::test::localTime(5, 18));
    focuslens::FocusScoreCalculator calculator;
    focuslens::AnalyticsStore analytics(dataDir.path().toStdString());

    const auto record = focuslens::test::makeRecord("s-1", focuslens::test::localTime(5, 9), 80.0, 90.0);
    analytics.saveDocument("sessions",
                           nlohmann::json{{"sessions", nlohmann::json::array({record})},
                                          {"daily_stats", {{"2026-01-05", "x"}}},
                                          {"weekly_stats", nlohmann::json::object()}});

    SessionEventStore restored(focuslens::test::memoryConfig(), calculator, &analytics, clock.clock());
    restored.load();

    QCOMPARE(restored.history().size(), static_cast<std::size_t>(1));
    const focuslens::DailyStats daily = restored.dailyStats("2026-01-05");
    QCOMPARE(daily.workSessions, 1);
    QCOMPARE(daily.completedSessions, 1);
    QCOMPARE(daily.workMinutes, 25);
    QCOMPARE(restored.weeklyStats(focuslens::isoWeekKey(record.startTime)).workSessions, 1);
}

QTEST_MAIN(SessionEventStoreTests)
#include "test_session_event_store.moc"
