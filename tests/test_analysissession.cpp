/**
 * @file test_analysissession.cpp
 * @brief Workflow tests for AnalysisSession over an in-memory filesystem
 */

#include <gtest/gtest.h>
#include "analysissession.h"
#include "fakefilesystem.h"

#include <QTemporaryDir>

class AnalysisSessionTest : public ::testing::Test {
protected:
    FakeFileSystem fileSystem;
    std::unique_ptr<AnalysisSession> session;

    void SetUp() override {
        fileSystem.addFile("/data/A/x.txt", "first file");
        fileSystem.addFile("/data/A/y.txt", "second file");
        fileSystem.addFile("/backup/A/x.txt", "first file");
        fileSystem.addFile("/backup/A/y.txt", "second file");
        fileSystem.addFile("/backup/C/x.txt", "first file");
        fileSystem.addFile("/backup/C/z.txt", "third file");
        fileSystem.addFile("/backup/C/w.txt", "fourth file");

        session = std::make_unique<AnalysisSession>(fileSystem, testSettings());
    }

    static AnalysisSettings testSettings() {
        AnalysisSettings settings;
        settings.minimumSizeBytes = 0;
        settings.minimumSimilarityPercent = 50.0;
        settings.maxParallelism = 2;
        settings.memoryReliefDelayMs = 0;
        return settings;
    }

    void addBothRoots() {
        ASSERT_EQ(session->addFolder("/data"), OperationStatus::Completed);
        ASSERT_EQ(session->addFolder("/backup"), OperationStatus::Completed);
    }
};

TEST_F(AnalysisSessionTest, AddFolderScansAndRegistersRoot) {
    QStringList added;
    QObject::connect(session.get(), &AnalysisSession::folderAdded,
                     [&added](const QString &folder) { added.append(folder); });

    EXPECT_EQ(session->addFolder("/data"), OperationStatus::Completed);

    EXPECT_EQ(session->scanFolders(), QStringList({"/data"}));
    EXPECT_EQ(added, QStringList({"/data"}));
    EXPECT_TRUE(session->cache().isFolderCached("/data/A"));
    EXPECT_FALSE(session->isOperationInProgress());
}

TEST_F(AnalysisSessionTest, AddFolderRejectsInvalidInput) {
    EXPECT_EQ(session->addFolder(QString()), OperationStatus::Failed);
    EXPECT_EQ(session->addFolder("/missing"), OperationStatus::Failed);
    EXPECT_FALSE(session->lastError().isEmpty());

    ASSERT_EQ(session->addFolder("/data"), OperationStatus::Completed);
    EXPECT_EQ(session->addFolder("/DATA/"), OperationStatus::Failed);
    EXPECT_EQ(session->scanFolders().size(), 1);
}

/**
 * @test NestedRootsAreRejected
 * @brief A root inside, or around, an existing root is refused, so removing
 *        one root never drops folders that another root still covers.
 */
TEST_F(AnalysisSessionTest, NestedRootsAreRejected) {
    ASSERT_EQ(session->addFolder("/data"), OperationStatus::Completed);

    EXPECT_EQ(session->addFolder("/data/A"), OperationStatus::Failed);
    EXPECT_TRUE(session->lastError().contains("/data"));
    EXPECT_EQ(session->addFolder("/"), OperationStatus::Failed);
    EXPECT_EQ(session->scanFolders(), QStringList({"/data"}));

    EXPECT_FALSE(session->removeFolder("/data/A"));
    EXPECT_TRUE(session->cache().isFolderCached("/data/A"));

    EXPECT_EQ(session->addFolder("/backup"), OperationStatus::Completed);
    EXPECT_EQ(session->scanFolders(), QStringList({"/data", "/backup"}));
}

/**
 * @test CancelledScanDoesNotAddRoot
 * @brief Cancelling from a progress handler stops the scan and leaves the root out.
 */
TEST_F(AnalysisSessionTest, CancelledScanDoesNotAddRoot) {
    QObject::connect(session.get(), &AnalysisSession::progressChanged,
                     [this](const AnalysisProgress &) { session->cancelOperation(); });

    EXPECT_EQ(session->addFolder("/data"), OperationStatus::Cancelled);
    EXPECT_TRUE(session->scanFolders().isEmpty());
    EXPECT_FALSE(session->isOperationInProgress());
}

TEST_F(AnalysisSessionTest, ComparisonNeedsTwoFolders) {
    fileSystem.addDirectory("/empty");
    ASSERT_EQ(session->addFolder("/empty"), OperationStatus::Completed);

    EXPECT_EQ(session->runComparison(), OperationStatus::Failed);
    EXPECT_FALSE(session->lastError().isEmpty());
}

/**
 * @test ComparisonFindsIdenticalFolders
 * @brief A folder copied under another root is reported at 100 percent.
 */
TEST_F(AnalysisSessionTest, ComparisonFindsIdenticalFolders) {
    addBothRoots();
    int completedCount = -1;
    QObject::connect(session.get(), &AnalysisSession::comparisonCompleted,
                     [&completedCount](int count) { completedCount = count; });

    ASSERT_EQ(session->runComparison(), OperationStatus::Completed);

    const QList<FolderMatch> matches = session->allMatches();
    ASSERT_FALSE(matches.isEmpty());
    const FolderMatch &best = matches.first();
    EXPECT_EQ(best.leftFolder, "/backup/A");
    EXPECT_EQ(best.rightFolder, "/data/A");
    EXPECT_DOUBLE_EQ(best.similarityPercentage, 100.0);
    EXPECT_EQ(best.duplicateFiles.size(), 2);
    EXPECT_EQ(completedCount, matches.size());

    // /backup/C shares one of three files with each A folder
    for (const FolderMatch &match : matches) {
        if (match.leftFolder == "/backup/C" || match.rightFolder == "/backup/C") {
            EXPECT_DOUBLE_EQ(match.similarityPercentage, 25.0);
        }
    }
}

TEST_F(AnalysisSessionTest, FilteredMatchesUseSettings) {
    addBothRoots();
    ASSERT_EQ(session->runComparison(), OperationStatus::Completed);

    const QList<FolderMatch> filtered = session->filteredMatches();
    ASSERT_FALSE(filtered.isEmpty());
    for (const FolderMatch &match : filtered) {
        EXPECT_GE(match.similarityPercentage, 50.0);
    }
    EXPECT_LT(filtered.size(), session->allMatches().size());
}

TEST_F(AnalysisSessionTest, ApplyFiltersRefiltersWithoutRescanning) {
    addBothRoots();
    ASSERT_EQ(session->runComparison(), OperationStatus::Completed);
    fileSystem.resetCounters();

    FilterCriteria everything;
    everything.minimumSimilarityPercent = 0;
    everything.minimumSizeBytes = 0;

    EXPECT_EQ(session->applyFilters(everything).size(), session->allMatches().size());
    EXPECT_EQ(session->filteredMatches().size(), session->allMatches().size());
    EXPECT_EQ(fileSystem.statCalls(), 0);
    EXPECT_EQ(fileSystem.openCalls(), 0);
}

TEST_F(AnalysisSessionTest, FileDetailsForMatch) {
    addBothRoots();
    ASSERT_EQ(session->runComparison(), OperationStatus::Completed);
    const FolderMatch best = session->allMatches().first();

    const QList<FileDetail> details = session->fileDetails(best, false);

    ASSERT_EQ(details.size(), 2);
    EXPECT_TRUE(details.at(0).isDuplicate);
    EXPECT_EQ(details.at(0).leftFileName, "x.txt");
    EXPECT_EQ(details.at(1).rightFileName, "y.txt");
}

/**
 * @test RemoveFolderDropsCacheAndMatches
 * @brief Removing a root forgets its subtree and any match that touches it.
 */
TEST_F(AnalysisSessionTest, RemoveFolderDropsCacheAndMatches) {
    addBothRoots();
    ASSERT_EQ(session->runComparison(), OperationStatus::Completed);

    EXPECT_TRUE(session->removeFolder("/data"));

    EXPECT_EQ(session->scanFolders(), QStringList({"/backup"}));
    EXPECT_FALSE(session->cache().isFolderCached("/data/A"));
    EXPECT_TRUE(session->cache().isFolderCached("/backup/A"));
    for (const FolderMatch &match : session->allMatches()) {
        EXPECT_FALSE(match.leftFolder.startsWith("/data"));
        EXPECT_FALSE(match.rightFolder.startsWith("/data"));
    }

    EXPECT_FALSE(session->removeFolder("/data"));
}

TEST_F(AnalysisSessionTest, ProjectRoundTripDropsMissingRoots) {
    QTemporaryDir tempDir;
    ASSERT_TRUE(tempDir.isValid());
    const QString projectPath = tempDir.filePath("session");

    addBothRoots();
    ASSERT_TRUE(session->saveProject(projectPath)) << session->lastError().toStdString();
    EXPECT_EQ(session->settings().lastProjectPath, projectPath);

    fileSystem.removePath("/data");

    AnalysisSession restored(fileSystem, testSettings());
    ASSERT_TRUE(restored.loadProject(projectPath)) << restored.lastError().toStdString();

    EXPECT_EQ(restored.scanFolders(), QStringList({"/backup"}));
    EXPECT_TRUE(restored.cache().isFolderCached("/backup/C"));
    EXPECT_FALSE(restored.cache().isFolderCached("/data/A"));
    EXPECT_FALSE(restored.errorSummary().hasErrors());
}

TEST_F(AnalysisSessionTest, LoadedProjectNeedsNoRescan) {
    QTemporaryDir tempDir;
    ASSERT_TRUE(tempDir.isValid());
    const QString projectPath = tempDir.filePath("session");

    addBothRoots();
    ASSERT_EQ(session->runComparison(), OperationStatus::Completed);
    ASSERT_TRUE(session->saveProject(projectPath));

    AnalysisSession restored(fileSystem, testSettings());
    ASSERT_TRUE(restored.loadProject(projectPath));
    fileSystem.resetCounters();

    ASSERT_EQ(restored.runComparison(), OperationStatus::Completed);
    EXPECT_EQ(restored.allMatches().size(), session->allMatches().size());
    EXPECT_EQ(fileSystem.openCalls(), 0);
}

TEST_F(AnalysisSessionTest, LoadingInvalidProjectKeepsState) {
    addBothRoots();
    QTemporaryDir tempDir;
    ASSERT_TRUE(tempDir.isValid());

    EXPECT_FALSE(session->loadProject(tempDir.filePath("none")));
    EXPECT_EQ(session->scanFolders().size(), 2);
    EXPECT_FALSE(session->lastError().isEmpty());
}
