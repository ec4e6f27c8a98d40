#include "folderaggregator.h"
#include "cachestore.h"
#include "pathutils.h"
#include "progressreporter.h"

#include <QDebug>
#include <QHash>
#include <QPair>
#include <QThreadPool>
#include <QtConcurrent>

#include <algorithm>

// === Constants ===
namespace {
constexpr int AGGREGATION_PROGRESS_INTERVAL = 25;

struct FolderPairGroup {
    QString leftFolder;
    QString rightFolder;
    QList<FileMatch> matches;
};

bool bySimilarityDescending(const FolderMatch &a, const FolderMatch &b)
{
    if (a.similarityPercentage != b.similarityPercentage) {
        return a.similarityPercentage > b.similarityPercentage;
    }
    if (a.leftFolder != b.leftFolder) {
        return a.leftFolder < b.leftFolder;
    }
    return a.rightFolder < b.rightFolder;
}
}

// === Aggregation ===

QFuture<AnalysisResult<QList<FolderMatch>>> FolderAggregator::aggregateFolderMatchesAsync(const QList<FileMatch> &fileMatches,
                                                                                           const CacheStore &cache,
                                                                                           const ProgressCallback &progress,
                                                                                           const CancellationToken &token)
{
    const CacheStore *cachePointer = &cache;
    return QtConcurrent::run(QThreadPool::globalInstance(), [fileMatches, cachePointer, progress, token]() {
        return aggregate(fileMatches, *cachePointer, progress, token);
    });
}

AnalysisResult<QList<FolderMatch>> FolderAggregator::aggregateFolderMatches(const QList<FileMatch> &fileMatches,
                                                                            const CacheStore &cache,
                                                                            const CancellationToken &token)
{
    QFuture<AnalysisResult<QList<FolderMatch>>> future = aggregateFolderMatchesAsync(fileMatches, cache, ProgressCallback(), token);
    return future.result();
}

// === Filtering ===

QList<FolderMatch> FolderAggregator::applyFilters(const QList<FolderMatch> &matches, const FilterCriteria &criteria)
{
    QList<FolderMatch> filtered;
    for (const FolderMatch &match : matches) {
        if (matchesCriteria(match, criteria)) {
            filtered.append(match);
        }
    }
    return filtered;
}

bool FolderAggregator::matchesCriteria(const FolderMatch &match, const FilterCriteria &criteria)
{
    if (match.similarityPercentage < criteria.minimumSimilarityPercent) {
        return false;
    }
    if (match.folderSizeBytes < criteria.minimumSizeBytes) {
        return false;
    }

    if (criteria.minimumDate.isValid()) {
        if (!match.latestModificationDate.isValid() || match.latestModificationDate < criteria.minimumDate) {
            return false;
        }
    }
    if (criteria.maximumDate.isValid()) {
        if (!match.latestModificationDate.isValid() || match.latestModificationDate > criteria.maximumDate) {
            return false;
        }
    }

    return true;
}

// === Private Methods ===

AnalysisResult<QList<FolderMatch>> FolderAggregator::aggregate(const QList<FileMatch> &fileMatches,
                                                               const CacheStore &cache,
                                                               const ProgressCallback &progress,
                                                               const CancellationToken &token)
{
    using Result = AnalysisResult<QList<FolderMatch>>;
    ProgressReporter reporter(progress);

    if (token.isCancellationRequested()) {
        reporter.reportCancelled("Aggregation cancelled");
        return Result::withStatus(OperationStatus::Cancelled, "Aggregation cancelled");
    }

    reporter.reportIndeterminate(AnalysisPhase::AggregatingResults, 0,
                                 QString("Grouping %1 duplicate files by folder").arg(fileMatches.size()));

    QHash<QPair<QString, QString>, FolderPairGroup> groups;
    QList<QPair<QString, QString>> groupOrder;

    for (const FileMatch &match : fileMatches) {
        const QString leftFolder = PathUtils::parentFolder(match.pathA);
        const QString rightFolder = PathUtils::parentFolder(match.pathB);
        if (leftFolder.isEmpty() || rightFolder.isEmpty()) {
            continue;
        }

        const QPair<QString, QString> key(PathUtils::normalizedKey(leftFolder), PathUtils::normalizedKey(rightFolder));
        auto it = groups.find(key);
        if (it == groups.end()) {
            it = groups.insert(key, FolderPairGroup{leftFolder, rightFolder, {}});
            groupOrder.append(key);
        }
        it->matches.append(match);
    }

    const int total = groupOrder.size();
    reporter.report(AnalysisPhase::AggregatingResults, 0, total,
                    QString("Scoring %1 folder pairs").arg(total));

    QList<FolderMatch> folderMatches;
    folderMatches.reserve(total);

    int done = 0;
    for (const QPair<QString, QString> &key : groupOrder) {
        if (token.isCancellationRequested()) {
            reporter.reportCancelled("Aggregation cancelled");
            return Result::withStatus(OperationStatus::Cancelled, "Aggregation cancelled");
        }

        const FolderPairGroup &group = groups[key];
        const FolderInfo leftInfo = cache.folderInfo(group.leftFolder).value_or(FolderInfo());
        const FolderInfo rightInfo = cache.folderInfo(group.rightFolder).value_or(FolderInfo());

        folderMatches.append(FolderMatch(group.leftFolder, group.rightFolder, group.matches,
                                         leftInfo.fileCount(), rightInfo.fileCount(),
                                         leftInfo.totalSize, leftInfo.latestModificationDate));

        ++done;
        if (done % AGGREGATION_PROGRESS_INTERVAL == 0 || done == total) {
            reporter.report(AnalysisPhase::AggregatingResults, done, total,
                            QString("Scored %1 of %2 folder pairs").arg(done).arg(total));
        }
    }

    std::sort(folderMatches.begin(), folderMatches.end(), bySimilarityDescending);

    const QString message = QString("Found %1 folder matches").arg(folderMatches.size());
    qDebug() << message << "from" << fileMatches.size() << "duplicate files";
    reporter.reportComplete(message, total);
    return Result::completed(folderMatches, message);
}
