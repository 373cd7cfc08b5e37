#include "common/config.hpp"

#include <limits>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace focuslens {

namespace {

// QTimer takes its interval as int milliseconds.
constexpr long long kMaxTimerSeconds = std::numeric_limits<int>::max() / 1000;

template <typename Int>
void readPositive(const nlohmann::json &root, const char *key, Int &target,
                  long long maxValue = std::numeric_limits<long long>::max())
{
    if (!root.contains(key)) {
        return;
    }
    const auto &value = root.at(key);
    if (!value.is_number_integer() || value.get<long long>() <= 0
        || value.get<long long>() > maxValue) {
        FLOG_WARN("Config", "loadEngineConfig", "config_value_rejected",
                  (nlohmann::json{{"key", key}, {"value", value}}));
        return;
    }
    target = static_cast<Int>(value.get<long long>());
}

void readSeconds(const nlohmann::json &root, const char *key, std::chrono::seconds &target,
                 long long maxSeconds = std::numeric_limits<int>::max())
{
    long long raw = target.count();
    readPositive(root, key, raw, maxSeconds);
    target = std::chrono::seconds{raw};
}

} // namespace

QString defaultConfigPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty() ? QStringLiteral(".") : home;
    return base + QStringLiteral("/.config/focuslens/config.json");
}

std::string defaultDataDir()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty() ? QStringLiteral(".") : home;
    return (base + QStringLiteral("/.local/share/focuslens")).toStdString();
}

EngineConfig loadEngineConfig(const QString &path)
{
    EngineConfig config;
    config.dataDir = defaultDataDir();

    QFile file(path);
    if (file.exists() && file.open(QIODevice::ReadOnly)) {
        nlohmann::json root;
        try {
            root = nlohmann::json::parse(file.readAll().toStdString());
        } catch (const nlohmann::json::parse_error &ex) {
            FLOG_WARN("Config", "loadEngineConfig", "config_parse_failed",
                      (nlohmann::json{{"path", path.toStdString()}, {"error", ex.what()}}));
        }

        if (root.is_object()) {
            if (root.contains("data_dir") && root.at("data_dir").is_string()) {
                config.dataDir = root.at("data_dir").get<std::string>();
            }
            readSeconds(root, "sample_interval_s", config.sampleInterval, kMaxTimerSeconds);
            readSeconds(root, "watchdog_interval_s", config.watchdogInterval, kMaxTimerSeconds);
            readSeconds(root, "inactivity_threshold_s", config.inactivityThreshold);
            readSeconds(root, "pause_threshold_s", config.pauseThreshold);
            readPositive(root, "session_history_cap", config.sessionHistoryCap);
            readPositive(root, "interruption_history_cap", config.interruptionHistoryCap);
            readPositive(root, "environment_record_cap", config.environmentRecordCap);
            readPositive(root, "bucket_cap", config.bucketCap);
            readPositive(root, "pattern_history_cap", config.patternHistoryCap);
            readPositive(root, "trend_point_cap", config.trendPointCap);
            readPositive(root, "pattern_window_days", config.patternWindowDays, 36500);
            readSeconds(root, "comparison_cache_ttl_s", config.comparisonCacheTtl);
            readPositive(root, "comparison_cache_cap", config.comparisonCacheCap);
            readSeconds(root, "report_cache_ttl_s", config.reportCacheTtl);
            readPositive(root, "report_cache_cap", config.reportCacheCap);

            long long optimalMinutes = config.optimalSessionLength.count();
            readPositive(root, "optimal_session_minutes", optimalMinutes, 1440);
            config.optimalSessionLength = std::chrono::minutes{optimalMinutes};
        }
    }

    const QString dataDirOverride = qEnvironmentVariable("FOCUSLENS_DATA_DIR");
    if (!dataDirOverride.isEmpty()) {
        config.dataDir = dataDirOverride.toStdString();
    }

    return config;
}

} // namespace focuslens
