#include "engine/environment_correlator.hpp"

#include <algorithm>
#include <cmath>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/analytics_store.hpp"

namespace focuslens {

namespace {

constexpr const char *kDocumentName = "environment";
constexpr std::size_t kHeatmapWindow = 200;
constexpr std::size_t kMinHourSamples = 3;
constexpr double kHourThreshold = 70.0;
constexpr std::size_t kMinWeekdaySamples = 2;
constexpr double kWeekdayThreshold = 65.0;
constexpr int kMinHeatmapSamples = 2;
constexpr double kNotableDifference = 10.0;

double meanOf(const std::vector<double> &values)
{
    if (values.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (double v : values) {
        total += v;
    }
    return total / static_cast<double>(values.size());
}

double roundOneDecimal(double value)
{
    return std::round(value * 10.0) / 10.0;
}

nlohmann::json recordToJson(const EnvironmentRecord &record)
{
    return nlohmann::json{
        {"session_id", record.sessionId},
        {"timestamp", toIso8601Utc(record.timestamp)},
        {"environment", record.tag},
        {"efficiency", record.efficiency},
        {"focus", record.focus},
        {"performance", record.performance}
    };
}

EnvironmentRecord recordFromJson(const nlohmann::json &j)
{
    EnvironmentRecord record;
    record.sessionId = j.value("session_id", "");
    record.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    if (j.contains("environment") && j.at("environment").is_object()) {
        record.tag = j.at("environment").get<EnvironmentTag>();
    }
    record.efficiency = j.value("efficiency", 0.0);
    record.focus = j.value("focus", 0.0);
    record.performance = j.value("performance", 0.0);
    return record;
}

std::vector<double> bucketValues(const std::map<int, BoundedHistory<double>> &buckets, int key)
{
    auto it = buckets.find(key);
    if (it == buckets.end()) {
        return {};
    }
    return it->second.toVector();
}

nlohmann::json bucketsToJson(const std::map<int, BoundedHistory<double>> &buckets)
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto &bucket : buckets) {
        out[std::to_string(bucket.first)] = bucket.second.toVector();
    }
    return out;
}

} // namespace

Season seasonForMonth(int month)
{
    switch (month) {
    case 12:
    case 1:
    case 2:
        return Season::Winter;
    case 3:
    case 4:
    case 5:
        return Season::Spring;
    case 6:
    case 7:
    case 8:
        return Season::Summer;
    default:
        return Season::Autumn;
    }
}

TimePeriod timePeriodForHour(int hour)
{
    if (hour >= 5 && hour < 12) {
        return TimePeriod::Morning;
    }
    if (hour >= 12 && hour < 17) {
        return TimePeriod::Afternoon;
    }
    if (hour >= 17 && hour < 22) {
        return TimePeriod::Evening;
    }
    return TimePeriod::Night;
}

EnvironmentTag makeEnvironmentTag(TimePoint timestamp)
{
    EnvironmentTag tag;
    tag.hour = localHour(timestamp);
    tag.weekday = localWeekday(timestamp);
    tag.month = localMonth(timestamp);
    tag.season = seasonForMonth(tag.month);
    tag.timePeriod = timePeriodForHour(tag.hour);
    tag.isWeekend = tag.weekday >= 5;
    return tag;
}

std::string weekdayName(int weekday)
{
    static const char *const names[] = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
    };
    if (weekday < 0 || weekday > 6) {
        return "Unknown";
    }
    return names[weekday];
}

EnvironmentCorrelator::EnvironmentCorrelator(const EngineConfig &config,
                                             AnalyticsStore *store,
                                             Clock clock,
                                             QObject *parent)
    : QObject(parent)
    , m_bucketCap(config.bucketCap)
    , m_store(store)
    , m_clock(std::move(clock))
    , m_records(config.environmentRecordCap)
{
}

void EnvironmentCorrelator::load()
{
    if (!m_store) {
        return;
    }

    std::optional<nlohmann::json> document;
    try {
        document = m_store->loadDocument(kDocumentName);
    } catch (const std::exception &ex) {
        FLOG_WARN("EnvironmentCorrelator", "load", "snapshot_read_failed",
                  (nlohmann::json{{"error", ex.what()}}));
        return;
    }
    if (!document || !document->is_object()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.clear();
    m_hourBuckets.clear();
    m_weekdayBuckets.clear();
    m_monthBuckets.clear();

    try {
        for (const auto &item : document->value("records", nlohmann::json::array())) {
            m_records.push(recordFromJson(item));
        }
        const auto loadBuckets = [this](const nlohmann::json &source, BucketMap &target) {
            for (const auto &item : source.items()) {
                const int key = std::stoi(item.key());
                for (const auto &value : item.value()) {
                    addToBucketLocked(target, key, value.get<double>());
                }
            }
        };
        loadBuckets(document->value("hour_buckets", nlohmann::json::object()), m_hourBuckets);
        loadBuckets(document->value("weekday_buckets", nlohmann::json::object()), m_weekdayBuckets);
        loadBuckets(document->value("month_buckets", nlohmann::json::object()), m_monthBuckets);
    } catch (const std::exception &ex) {
        FLOG_WARN("EnvironmentCorrelator", "load", "snapshot_malformed",
                  (nlohmann::json{{"error", ex.what()}}));
    }
}

double EnvironmentCorrelator::performanceOf(const SessionRecord &record)
{
    return (record.efficiencyScore.value_or(0.0) + record.focusScore.value_or(0.0)) / 2.0;
}

bool EnvironmentCorrelator::onSessionFinalized(const SessionRecord &record)
{
    if (record.type != SessionType::Work || !record.efficiencyScore || !record.focusScore) {
        return false;
    }

    EnvironmentRecord entry;
    entry.sessionId = record.id;
    entry.timestamp = record.startTime;
    entry.tag = record.environment;
    entry.efficiency = *record.efficiencyScore;
    entry.focus = *record.focusScore;
    entry.performance = performanceOf(record);

    OptimalTimes optimal;
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        addToBucketLocked(m_hourBuckets, entry.tag.hour, entry.performance);
        addToBucketLocked(m_weekdayBuckets, entry.tag.weekday, entry.performance);
        addToBucketLocked(m_monthBuckets, entry.tag.month, entry.performance);
        m_records.push(std::move(entry));
        optimal = optimalTimesLocked();
        snapshot = snapshotLocked();
    }

    saveDocumentBestEffort(m_store, kDocumentName, snapshot);

    if (optimal.bestHour) {
        FLOG_DEBUG("EnvironmentCorrelator", "onSessionFinalized", "optimal_hour",
                   (nlohmann::json{{"hour", *optimal.bestHour},
                                   {"mean", optimal.bestHourScore}}));
        emit optimalHourDetected(*optimal.bestHour, optimal.bestHourScore);
    }
    return true;
}

void EnvironmentCorrelator::addToBucketLocked(BucketMap &buckets, int key, double value)
{
    auto it = buckets.find(key);
    if (it == buckets.end()) {
        it = buckets.emplace(key, BoundedHistory<double>(m_bucketCap)).first;
    }
    it->second.push(value);
}

OptimalTimes EnvironmentCorrelator::optimalTimes() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return optimalTimesLocked();
}

OptimalTimes EnvironmentCorrelator::optimalTimesLocked() const
{
    OptimalTimes result;
    for (const auto &bucket : m_hourBuckets) {
        if (bucket.second.size() < kMinHourSamples) {
            continue;
        }
        const double mean = meanOf(bucket.second.toVector());
        if (mean > kHourThreshold && (!result.bestHour || mean > result.bestHourScore)) {
            result.bestHour = bucket.first;
            result.bestHourScore = roundOneDecimal(mean);
        }
    }
    for (const auto &bucket : m_weekdayBuckets) {
        if (bucket.second.size() < kMinWeekdaySamples) {
            continue;
        }
        const double mean = meanOf(bucket.second.toVector());
        if (mean > kWeekdayThreshold && (!result.bestWeekday || mean > result.bestWeekdayScore)) {
            result.bestWeekday = bucket.first;
            result.bestWeekdayScore = roundOneDecimal(mean);
        }
    }
    return result;
}

EnvironmentInsights EnvironmentCorrelator::insights(int lookbackDays) const
{
    const int days = std::max(1, lookbackDays);
    EnvironmentInsights result = insights(daysBefore(m_clock(), days), TimePoint::max());
    if (result.insufficientData) {
        result.message = "No work sessions in the last " + std::to_string(days) + " days";
    }
    return result;
}

EnvironmentInsights EnvironmentCorrelator::insights(TimePoint from, TimePoint to) const
{
    std::vector<EnvironmentRecord> recent;
    OptimalTimes optimal;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &record : m_records) {
            if (record.timestamp >= from && record.timestamp < to) {
                recent.push_back(record);
            }
        }
        optimal = optimalTimesLocked();
    }

    EnvironmentInsights insights;
    insights.sessions = static_cast<int>(recent.size());
    if (recent.empty()) {
        insights.insufficientData = true;
        insights.message = "No work sessions in the selected range";
        return insights;
    }

    std::map<TimePeriod, std::vector<double>> byPeriod;
    std::vector<double> weekday;
    std::vector<double> weekend;
    for (const auto &record : recent) {
        byPeriod[record.tag.timePeriod].push_back(record.performance);
        (record.tag.isWeekend ? weekend : weekday).push_back(record.performance);
    }

    for (const auto &period : byPeriod) {
        const double mean = roundOneDecimal(meanOf(period.second));
        insights.timePeriodMeans[toTimePeriodString(period.first)] = mean;
        if (!insights.bestTimePeriod || mean > insights.bestTimePeriodScore) {
            insights.bestTimePeriod = period.first;
            insights.bestTimePeriodScore = mean;
        }
    }

    insights.weekdaySessions = static_cast<int>(weekday.size());
    insights.weekendSessions = static_cast<int>(weekend.size());
    insights.weekdayMean = roundOneDecimal(meanOf(weekday));
    insights.weekendMean = roundOneDecimal(meanOf(weekend));

    if (!weekday.empty() && !weekend.empty()) {
        const double difference = insights.weekdayMean - insights.weekendMean;
        if (std::abs(difference) > kNotableDifference) {
            const bool weekdaysBetter = difference > 0;
            insights.differenceNote = std::string("You perform ")
                + std::to_string(static_cast<int>(std::round(std::abs(difference))))
                + " points better on " + (weekdaysBetter ? "weekdays" : "weekends");
            insights.recommendations.push_back(
                weekdaysBetter ? "Keep demanding work on weekdays and use weekends for lighter tasks"
                               : "Weekends suit you; consider moving hard problems there");
        }
    }

    if (insights.bestTimePeriod) {
        insights.recommendations.push_back("Schedule important work in the "
                                           + toTimePeriodString(*insights.bestTimePeriod));
    }
    if (optimal.bestHour) {
        insights.recommendations.push_back("Your most productive hour starts at "
                                           + std::to_string(*optimal.bestHour) + ":00");
    }
    if (optimal.bestWeekday) {
        insights.recommendations.push_back(weekdayName(*optimal.bestWeekday)
                                           + " is your strongest day");
    }
    return insights;
}

std::vector<HeatmapCell> EnvironmentCorrelator::heatmap() const
{
    std::map<std::pair<int, int>, std::vector<double>> cells;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::size_t skip = m_records.size() > kHeatmapWindow
            ? m_records.size() - kHeatmapWindow
            : 0;
        std::size_t index = 0;
        for (const auto &record : m_records) {
            if (index++ < skip) {
                continue;
            }
            cells[{record.tag.weekday, record.tag.hour}].push_back(record.performance);
        }
    }

    std::vector<HeatmapCell> result;
    for (const auto &cell : cells) {
        if (static_cast<int>(cell.second.size()) < kMinHeatmapSamples) {
            continue;
        }
        HeatmapCell out;
        out.weekday = cell.first.first;
        out.hour = cell.first.second;
        out.mean = roundOneDecimal(meanOf(cell.second));
        out.samples = static_cast<int>(cell.second.size());
        result.push_back(out);
    }
    return result;
}

std::vector<EnvironmentRecord> EnvironmentCorrelator::records() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.toVector();
}

std::vector<double> EnvironmentCorrelator::hourBucket(int hour) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return bucketValues(m_hourBuckets, hour);
}

std::vector<double> EnvironmentCorrelator::weekdayBucket(int weekday) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return bucketValues(m_weekdayBuckets, weekday);
}

std::vector<double> EnvironmentCorrelator::monthBucket(int month) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return bucketValues(m_monthBuckets, month);
}

nlohmann::json EnvironmentCorrelator::snapshotLocked() const
{
    nlohmann::json records = nlohmann::json::array();
    for (const auto &record : m_records) {
        records.push_back(recordToJson(record));
    }
    return nlohmann::json{
        {"records", records},
        {"hour_buckets", bucketsToJson(m_hourBuckets)},
        {"weekday_buckets", bucketsToJson(m_weekdayBuckets)},
        {"month_buckets", bucketsToJson(m_monthBuckets)},
        {"last_updated", toIso8601Utc(m_clock())}
    };
}

} // namespace focuslens
