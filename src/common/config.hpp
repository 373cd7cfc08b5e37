#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <QString>

namespace focuslens {

struct EngineConfig {
    // Directory holding focuslens.db.
    std::string dataDir;

    std::chrono::seconds sampleInterval{10};
    std::chrono::seconds watchdogInterval{30};
    std::chrono::seconds inactivityThreshold{180};
    std::chrono::seconds pauseThreshold{10};

    std::size_t sessionHistoryCap = 1000;
    std::size_t interruptionHistoryCap = 100;
    std::size_t environmentRecordCap = 1000;
    std::size_t bucketCap = 100;
    std::size_t patternHistoryCap = 1000;
    std::size_t trendPointCap = 30;
    int patternWindowDays = 7;

    std::chrono::seconds comparisonCacheTtl{3600};
    std::size_t comparisonCacheCap = 20;
    std::chrono::seconds reportCacheTtl{900};
    std::size_t reportCacheCap = 10;

    std::chrono::minutes optimalSessionLength{25};
};

QString defaultConfigPath();
std::string defaultDataDir();

// Loads the JSON config at `path`. A missing file yields the defaults; invalid
// values fall back to the default for that key. FOCUSLENS_DATA_DIR overrides
// data_dir.
EngineConfig loadEngineConfig(const QString &path = defaultConfigPath());

} // namespace focuslens
