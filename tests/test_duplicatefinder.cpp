/**
 * @file test_duplicatefinder.cpp
 * @brief Unit tests for DuplicateFinder indexing, grouping and hash confirmation
 */

#include <gtest/gtest.h>
#include "cachestore.h"
#include "duplicatefinder.h"
#include "errorrecovery.h"
#include "fakefilesystem.h"
#include "folderscanner.h"

using namespace std::chrono_literals;

class DuplicateFinderTest : public ::testing::Test {
protected:
    FakeFileSystem fileSystem;
    CacheStore cache{fileSystem};
    ErrorRecoveryPolicy policy;
    FolderScanner scanner{cache, policy, fileSystem};
    DuplicateFinder finder{cache, policy, fileSystem};
    QList<AnalysisProgress> progress;

    void SetUp() override {
        policy.setMemoryReliefDelay(0ms);
    }

    QStringList scan(const QString &root) {
        const AnalysisResult<QStringList> result = scanner.scanFolderHierarchy(root, ProgressCallback(), CancellationToken());
        EXPECT_TRUE(result.isCompleted());
        return result.value;
    }

    AnalysisResult<QList<FileMatch>> find(const QStringList &folders,
                                          const CancellationToken &token = CancellationToken()) {
        return finder.findDuplicateFiles(folders, [this](const AnalysisProgress &p) { progress.append(p); }, token);
    }
};

TEST_F(DuplicateFinderTest, ComputesSha256AsLowercaseHex) {
    fileSystem.addFile("/data/abc.txt", "abc");

    EXPECT_EQ(finder.computeFileHash("/data/abc.txt"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(DuplicateFinderTest, HashOfUnreadableFileIsEmptyAndLogged) {
    fileSystem.addFile("/data/locked.txt", "abc");
    fileSystem.setOpenError("/data/locked.txt", FileSystemError::make(FileErrorKind::AccessDenied, "Permission denied"));

    bool abort = false;
    EXPECT_TRUE(finder.computeFileHash("/data/locked.txt", &abort).isEmpty());
    EXPECT_FALSE(abort);

    const ErrorSummary summary = policy.summary();
    EXPECT_EQ(summary.skippedFiles, 1);
    EXPECT_TRUE(summary.skippedPaths.contains("/data/locked.txt"));
}

/**
 * @test FindsIdenticalFilesAcrossFolders
 * @brief Same name, size and content in two folders yields one canonical match.
 */
TEST_F(DuplicateFinderTest, FindsIdenticalFilesAcrossFolders) {
    fileSystem.addFile("/data/B/photo.jpg", "hello");
    fileSystem.addFile("/data/A/photo.jpg", "hello");
    fileSystem.addFile("/data/A/other.jpg", "unique");

    const AnalysisResult<QList<FileMatch>> result = find(scan("/data"));

    ASSERT_TRUE(result.isCompleted());
    ASSERT_EQ(result.value.size(), 1);
    EXPECT_EQ(result.value.first().pathA, "/data/A/photo.jpg");
    EXPECT_EQ(result.value.first().pathB, "/data/B/photo.jpg");
    EXPECT_EQ(result.message, "Found 1 duplicate files");
    ASSERT_FALSE(progress.isEmpty());
    EXPECT_EQ(progress.last().phase, AnalysisPhase::Complete);
}

/**
 * @test SameNameAndSizeWithDifferentContentIsNotAMatch
 * @brief Name and size only nominate candidates; the hash decides.
 */
TEST_F(DuplicateFinderTest, SameNameAndSizeWithDifferentContentIsNotAMatch) {
    fileSystem.addFile("/data/A/photo.jpg", "hello");
    fileSystem.addFile("/data/B/photo.jpg", "hello");
    fileSystem.addFile("/data/C/photo.jpg", "hellx");

    const AnalysisResult<QList<FileMatch>> result = find(scan("/data"));

    ASSERT_TRUE(result.isCompleted());
    ASSERT_EQ(result.value.size(), 1);
    EXPECT_FALSE(result.value.first().pathA.startsWith("/data/C"));
    EXPECT_FALSE(result.value.first().pathB.startsWith("/data/C"));
}

TEST_F(DuplicateFinderTest, NameComparisonIgnoresCase) {
    fileSystem.addFile("/data/A/Photo.JPG", "hello");
    fileSystem.addFile("/data/B/photo.jpg", "hello");

    const AnalysisResult<QList<FileMatch>> result = find(scan("/data"));

    ASSERT_TRUE(result.isCompleted());
    EXPECT_EQ(result.value.size(), 1);
}

TEST_F(DuplicateFinderTest, RenamedCopiesAreNotCandidates) {
    fileSystem.addFile("/data/A/one.txt", "same");
    fileSystem.addFile("/data/B/two.txt", "same");

    const AnalysisResult<QList<FileMatch>> result = find(scan("/data"));

    ASSERT_TRUE(result.isCompleted());
    EXPECT_TRUE(result.value.isEmpty());
    EXPECT_EQ(result.message, "No potential duplicate files found");
    EXPECT_EQ(fileSystem.openCalls(), 0);
}

TEST_F(DuplicateFinderTest, ThreeCopiesGiveThreePairs) {
    fileSystem.addFile("/data/A/x.bin", "payload");
    fileSystem.addFile("/data/B/x.bin", "payload");
    fileSystem.addFile("/data/C/x.bin", "payload");

    const AnalysisResult<QList<FileMatch>> result = find(scan("/data"));

    ASSERT_TRUE(result.isCompleted());
    EXPECT_EQ(result.value.size(), 3);
    EXPECT_TRUE(result.value.contains(FileMatch{"/data/A/x.bin", "/data/B/x.bin"}));
    EXPECT_TRUE(result.value.contains(FileMatch{"/data/A/x.bin", "/data/C/x.bin"}));
    EXPECT_TRUE(result.value.contains(FileMatch{"/data/B/x.bin", "/data/C/x.bin"}));
}

/**
 * @test CachedHashesAreReused
 * @brief A second search over the same folders opens no files.
 */
TEST_F(DuplicateFinderTest, CachedHashesAreReused) {
    fileSystem.addFile("/data/A/photo.jpg", "hello");
    fileSystem.addFile("/data/B/photo.jpg", "hello");
    const QStringList folders = scan("/data");

    ASSERT_TRUE(find(folders).isCompleted());
    EXPECT_EQ(fileSystem.openCalls(), 2);
    EXPECT_EQ(cache.cachedFileHashCount(), 2);

    fileSystem.resetCounters();
    const AnalysisResult<QList<FileMatch>> second = find(folders);

    ASSERT_TRUE(second.isCompleted());
    EXPECT_EQ(second.value.size(), 1);
    EXPECT_EQ(fileSystem.openCalls(), 0);
}

TEST_F(DuplicateFinderTest, UnreadableCandidateIsSkipped) {
    fileSystem.addFile("/data/A/photo.jpg", "hello");
    fileSystem.addFile("/data/B/photo.jpg", "hello");
    fileSystem.addFile("/data/C/photo.jpg", "hello");
    fileSystem.setOpenError("/data/C/photo.jpg", FileSystemError::make(FileErrorKind::AccessDenied, "Permission denied"));

    const AnalysisResult<QList<FileMatch>> result = find(scan("/data"));

    ASSERT_TRUE(result.isCompleted());
    ASSERT_EQ(result.value.size(), 1);
    EXPECT_EQ(result.value.first(), (FileMatch{"/data/A/photo.jpg", "/data/B/photo.jpg"}));
    EXPECT_FALSE(cache.fileHash("/data/C/photo.jpg").has_value());
    EXPECT_GE(policy.summary().skippedFiles, 1);
}

TEST_F(DuplicateFinderTest, OnlyRequestedFoldersAreCompared) {
    fileSystem.addFile("/data/A/photo.jpg", "hello");
    fileSystem.addFile("/data/B/photo.jpg", "hello");
    fileSystem.addFile("/data/C/photo.jpg", "hello");
    scan("/data");

    const AnalysisResult<QList<FileMatch>> result = find({"/data/A", "/data/C"});

    ASSERT_TRUE(result.isCompleted());
    ASSERT_EQ(result.value.size(), 1);
    EXPECT_EQ(result.value.first(), (FileMatch{"/data/A/photo.jpg", "/data/C/photo.jpg"}));
}

TEST_F(DuplicateFinderTest, PreCancelledSearchReportsCancelled) {
    fileSystem.addFile("/data/A/photo.jpg", "hello");
    fileSystem.addFile("/data/B/photo.jpg", "hello");
    const QStringList folders = scan("/data");

    CancellationSource source;
    source.cancel();
    const AnalysisResult<QList<FileMatch>> result = find(folders, source.token());

    EXPECT_TRUE(result.isCancelled());
    EXPECT_TRUE(result.value.isEmpty());
    EXPECT_EQ(fileSystem.openCalls(), 0);
    ASSERT_FALSE(progress.isEmpty());
    EXPECT_EQ(progress.last().phase, AnalysisPhase::Cancelled);
}

/**
 * @test CancellationDuringHashingStopsLaunchingGroups
 * @brief Cancelling from a comparison progress update stops the search before
 *        every candidate group is hashed.
 */
TEST_F(DuplicateFinderTest, CancellationDuringHashingStopsLaunchingGroups) {
    constexpr int groupCount = 30;
    for (int i = 0; i < groupCount; ++i) {
        const QString name = QString("file%1.dat").arg(i);
        fileSystem.addFile("/data/A/" + name, QByteArray::number(i));
        fileSystem.addFile("/data/B/" + name, QByteArray::number(i));
    }
    const QStringList folders = scan("/data");
    finder.setMaxParallelism(1);

    CancellationSource source;
    const AnalysisResult<QList<FileMatch>> result = finder.findDuplicateFiles(
        folders,
        [this, &source](const AnalysisProgress &p) {
            progress.append(p);
            if (p.phase == AnalysisPhase::ComparingFiles && p.current >= 10) {
                source.cancel();
            }
        },
        source.token());

    EXPECT_TRUE(result.isCancelled());
    EXPECT_TRUE(result.value.isEmpty());
    EXPECT_LT(fileSystem.openCalls(), groupCount * 2);
    ASSERT_FALSE(progress.isEmpty());
    EXPECT_EQ(progress.last().phase, AnalysisPhase::Cancelled);
}

TEST_F(DuplicateFinderTest, DiskSpaceExhaustionWhileHashingAborts) {
    fileSystem.addFile("/data/A/photo.jpg", "hello");
    fileSystem.addFile("/data/B/photo.jpg", "hello");
    const QStringList folders = scan("/data");
    fileSystem.setOpenError("/data/B/photo.jpg",
                            FileSystemError::resourceConstrained(ResourceConstraintType::DiskSpace, "No space left"));

    const AnalysisResult<QList<FileMatch>> result = find(folders);

    EXPECT_EQ(result.status, OperationStatus::Aborted);
    EXPECT_EQ(policy.summary().resourceErrors, 1);
    ASSERT_FALSE(progress.isEmpty());
    EXPECT_EQ(progress.last().phase, AnalysisPhase::Cancelled);
}

TEST_F(DuplicateFinderTest, ProgressNeverGoesBackwardsWithinAPhase) {
    for (int i = 0; i < 40; ++i) {
        const QString name = QString("file%1.dat").arg(i);
        fileSystem.addFile("/data/A/" + name, QByteArray::number(i));
        fileSystem.addFile("/data/B/" + name, QByteArray::number(i));
    }

    ASSERT_TRUE(find(scan("/data")).isCompleted());

    for (int i = 1; i < progress.size(); ++i) {
        if (progress[i].phase == progress[i - 1].phase) {
            EXPECT_GE(progress[i].current, progress[i - 1].current);
        }
    }
}
