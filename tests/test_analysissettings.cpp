#include <gtest/gtest.h>
#include "analysissettings.h"

#include <QSettings>
#include <QTemporaryDir>

class AnalysisSettingsTest : public ::testing::Test {
protected:
    QTemporaryDir tempDir;

    void SetUp() override {
        ASSERT_TRUE(tempDir.isValid());
    }

    QString iniPath() const {
        return tempDir.filePath("settings.ini");
    }
};

TEST_F(AnalysisSettingsTest, MissingKeysFallBackToDefaults) {
    const QSettings empty(iniPath(), QSettings::IniFormat);
    const AnalysisSettings settings = AnalysisSettings::load(empty);

    EXPECT_DOUBLE_EQ(settings.minimumSimilarityPercent, DEFAULT_MINIMUM_SIMILARITY);
    EXPECT_EQ(settings.minimumSizeBytes, DEFAULT_MINIMUM_SIZE_BYTES);
    EXPECT_EQ(settings.scanTimeoutMinutes, 30);
    EXPECT_GE(settings.maxParallelism, 1);
    EXPECT_TRUE(settings.lastProjectPath.isEmpty());
}

TEST_F(AnalysisSettingsTest, SaveThenLoadRoundTrips) {
    AnalysisSettings original;
    original.minimumSimilarityPercent = 75.5;
    original.minimumSizeBytes = 4096;
    original.maxParallelism = 3;
    original.scanTimeoutMinutes = 5;
    original.networkProbeTimeoutMs = 250;
    original.memoryReliefDelayMs = 0;
    original.lastProjectPath = "/projects/photos";

    {
        QSettings writer(iniPath(), QSettings::IniFormat);
        original.save(writer);
        writer.sync();
        ASSERT_EQ(writer.status(), QSettings::NoError);
    }

    const QSettings reader(iniPath(), QSettings::IniFormat);
    const AnalysisSettings loaded = AnalysisSettings::load(reader);

    EXPECT_DOUBLE_EQ(loaded.minimumSimilarityPercent, 75.5);
    EXPECT_EQ(loaded.minimumSizeBytes, 4096);
    EXPECT_EQ(loaded.maxParallelism, 3);
    EXPECT_EQ(loaded.scanTimeoutMinutes, 5);
    EXPECT_EQ(loaded.networkProbeTimeoutMs, 250);
    EXPECT_EQ(loaded.memoryReliefDelayMs, 0);
    EXPECT_EQ(loaded.lastProjectPath, "/projects/photos");
}

/**
 * @test OutOfRangeValuesAreClamped
 * @brief Hand-edited settings cannot produce a negative size or zero workers.
 */
TEST_F(AnalysisSettingsTest, OutOfRangeValuesAreClamped) {
    {
        QSettings writer(iniPath(), QSettings::IniFormat);
        writer.setValue("filter/minimumSimilarityPercent", 150.0);
        writer.setValue("filter/minimumSizeBytes", -10);
        writer.setValue("analysis/maxParallelism", 0);
        writer.setValue("analysis/scanTimeoutMinutes", 0);
        writer.sync();
    }

    const QSettings reader(iniPath(), QSettings::IniFormat);
    const AnalysisSettings loaded = AnalysisSettings::load(reader);

    EXPECT_DOUBLE_EQ(loaded.minimumSimilarityPercent, 100.0);
    EXPECT_EQ(loaded.minimumSizeBytes, 0);
    EXPECT_EQ(loaded.maxParallelism, 1);
    EXPECT_EQ(loaded.scanTimeoutMinutes, 1);
}

TEST_F(AnalysisSettingsTest, FilterCriteriaCarriesThresholdsWithoutDates) {
    AnalysisSettings settings;
    settings.minimumSimilarityPercent = 80.0;
    settings.minimumSizeBytes = 10;

    const FilterCriteria criteria = settings.filterCriteria();

    EXPECT_DOUBLE_EQ(criteria.minimumSimilarityPercent, 80.0);
    EXPECT_EQ(criteria.minimumSizeBytes, 10);
    EXPECT_FALSE(criteria.minimumDate.isValid());
    EXPECT_FALSE(criteria.maximumDate.isValid());
}
