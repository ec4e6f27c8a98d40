#include "analysissettings.h"

#include <QSettings>

#include <algorithm>

// === Constants ===
namespace {
const QString ORGANIZATION_NAME = "DupeFolders";
const QString APPLICATION_NAME = "DupeFolders";

const QString KEY_MIN_SIMILARITY = "filter/minimumSimilarityPercent";
const QString KEY_MIN_SIZE = "filter/minimumSizeBytes";
const QString KEY_PARALLELISM = "analysis/maxParallelism";
const QString KEY_SCAN_TIMEOUT = "analysis/scanTimeoutMinutes";
const QString KEY_NETWORK_PROBE_TIMEOUT = "recovery/networkProbeTimeoutMs";
const QString KEY_MEMORY_RELIEF_DELAY = "recovery/memoryReliefDelayMs";
const QString KEY_LAST_PROJECT = "lastProjectPath";
}

FilterCriteria AnalysisSettings::filterCriteria() const
{
    FilterCriteria criteria;
    criteria.minimumSimilarityPercent = minimumSimilarityPercent;
    criteria.minimumSizeBytes = minimumSizeBytes;
    return criteria;
}

AnalysisSettings AnalysisSettings::load(const QSettings &settings)
{
    AnalysisSettings result;

    result.minimumSimilarityPercent = std::clamp(
        settings.value(KEY_MIN_SIMILARITY, result.minimumSimilarityPercent).toDouble(), 0.0, 100.0);
    result.minimumSizeBytes = std::max<qint64>(0, settings.value(KEY_MIN_SIZE, result.minimumSizeBytes).toLongLong());
    result.maxParallelism = std::max(1, settings.value(KEY_PARALLELISM, result.maxParallelism).toInt());
    result.scanTimeoutMinutes = std::max(1, settings.value(KEY_SCAN_TIMEOUT, result.scanTimeoutMinutes).toInt());
    result.networkProbeTimeoutMs = std::max(0, settings.value(KEY_NETWORK_PROBE_TIMEOUT, result.networkProbeTimeoutMs).toInt());
    result.memoryReliefDelayMs = std::max(0, settings.value(KEY_MEMORY_RELIEF_DELAY, result.memoryReliefDelayMs).toInt());
    result.lastProjectPath = settings.value(KEY_LAST_PROJECT).toString();

    return result;
}

void AnalysisSettings::save(QSettings &settings) const
{
    settings.setValue(KEY_MIN_SIMILARITY, minimumSimilarityPercent);
    settings.setValue(KEY_MIN_SIZE, minimumSizeBytes);
    settings.setValue(KEY_PARALLELISM, maxParallelism);
    settings.setValue(KEY_SCAN_TIMEOUT, scanTimeoutMinutes);
    settings.setValue(KEY_NETWORK_PROBE_TIMEOUT, networkProbeTimeoutMs);
    settings.setValue(KEY_MEMORY_RELIEF_DELAY, memoryReliefDelayMs);
    settings.setValue(KEY_LAST_PROJECT, lastProjectPath);
}

AnalysisSettings AnalysisSettings::loadUserSettings()
{
    const QSettings settings(QSettings::IniFormat, QSettings::UserScope, ORGANIZATION_NAME, APPLICATION_NAME);
    return load(settings);
}

void AnalysisSettings::saveUserSettings() const
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, ORGANIZATION_NAME, APPLICATION_NAME);
    save(settings);
}
