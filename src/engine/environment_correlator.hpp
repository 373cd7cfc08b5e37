#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QObject>

#include <nlohmann/json.hpp>

#include "common/bounded_history.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/models.hpp"

namespace focuslens {

class AnalyticsStore;

// Calendar context for a session start, computed in local time.
EnvironmentTag makeEnvironmentTag(TimePoint timestamp);
Season seasonForMonth(int month);
TimePeriod timePeriodForHour(int hour);

struct EnvironmentRecord {
    std::string sessionId;
    TimePoint timestamp;
    EnvironmentTag tag;
    double efficiency = 0.0;
    double focus = 0.0;
    double performance = 0.0;
};

struct OptimalTimes {
    std::optional<int> bestHour;
    double bestHourScore = 0.0;
    std::optional<int> bestWeekday;
    double bestWeekdayScore = 0.0;
};

struct EnvironmentInsights {
    bool insufficientData = false;
    std::string message;
    int sessions = 0;
    std::optional<TimePeriod> bestTimePeriod;
    double bestTimePeriodScore = 0.0;
    std::map<std::string, double> timePeriodMeans;
    double weekdayMean = 0.0;
    double weekendMean = 0.0;
    int weekdaySessions = 0;
    int weekendSessions = 0;
    std::string differenceNote;
    std::vector<std::string> recommendations;
};

struct HeatmapCell {
    int weekday = 0;
    int hour = 0;
    double mean = 0.0;
    int samples = 0;
};

/**
 * EnvironmentCorrelator relates session performance to calendar context.
 *
 * Performance of a finalized work session is the mean of its efficiency and
 * focus scores. Each value lands in three rolling bucket maps (hour, weekday,
 * month) and in a capped record list used by the lookback and heatmap queries.
 */
class EnvironmentCorrelator : public QObject
{
    Q_OBJECT
public:
    EnvironmentCorrelator(const EngineConfig &config,
                          AnalyticsStore *store,
                          Clock clock,
                          QObject *parent = nullptr);

    void load();

    // Returns false for break sessions and sessions without scores.
    bool onSessionFinalized(const SessionRecord &record);

    OptimalTimes optimalTimes() const;
    EnvironmentInsights insights(int lookbackDays = 30) const;
    // Same analysis restricted to records in [from, to).
    EnvironmentInsights insights(TimePoint from, TimePoint to) const;
    std::vector<HeatmapCell> heatmap() const;

    std::vector<EnvironmentRecord> records() const;
    std::vector<double> hourBucket(int hour) const;
    std::vector<double> weekdayBucket(int weekday) const;
    std::vector<double> monthBucket(int month) const;

    static double performanceOf(const SessionRecord &record);

signals:
    void optimalHourDetected(int hour, double meanPerformance);

private:
    using BucketMap = std::map<int, BoundedHistory<double>>;

    void addToBucketLocked(BucketMap &buckets, int key, double value);
    OptimalTimes optimalTimesLocked() const;
    nlohmann::json snapshotLocked() const;

    std::size_t m_bucketCap;
    AnalyticsStore *m_store;
    Clock m_clock;

    mutable std::mutex m_mutex;
    BoundedHistory<EnvironmentRecord> m_records;
    BucketMap m_hourBuckets;
    BucketMap m_weekdayBuckets;
    BucketMap m_monthBuckets;
};

std::string weekdayName(int weekday);

} // namespace focuslens
