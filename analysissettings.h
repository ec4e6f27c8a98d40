#ifndef ANALYSISSETTINGS_H
#define ANALYSISSETTINGS_H

#include "datamodels.h"

#include <QString>

class QSettings;

/**
 * @brief User-tunable analysis parameters persisted through QSettings
 */
struct AnalysisSettings {
    double minimumSimilarityPercent = DEFAULT_MINIMUM_SIMILARITY;
    qint64 minimumSizeBytes = DEFAULT_MINIMUM_SIZE_BYTES;
    int maxParallelism = defaultWorkerCount();
    int scanTimeoutMinutes = 30;
    int networkProbeTimeoutMs = 5000;
    int memoryReliefDelayMs = 1000;
    QString lastProjectPath;

    FilterCriteria filterCriteria() const;

    static AnalysisSettings load(const QSettings &settings);
    void save(QSettings &settings) const;

    /**
     * @brief Load from the per-user INI file
     */
    static AnalysisSettings loadUserSettings();
    void saveUserSettings() const;
};

#endif // ANALYSISSETTINGS_H
