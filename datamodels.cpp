#include "datamodels.h"
#include "pathutils.h"

#include <QThread>

#include <algorithm>

// === FileMatch ===

FileMatch FileMatch::canonical(const QString &first, const QString &second)
{
    const QString firstFolder = PathUtils::normalizedKey(PathUtils::parentFolder(first));
    const QString secondFolder = PathUtils::normalizedKey(PathUtils::parentFolder(second));

    if (secondFolder < firstFolder) {
        return FileMatch{second, first};
    }
    return FileMatch{first, second};
}

// === FolderMatch ===

FolderMatch::FolderMatch(const QString &left, const QString &right,
                         const QList<FileMatch> &duplicates,
                         int totalLeftFiles, int totalRightFiles,
                         qint64 sizeBytes,
                         const QDateTime &latestModification)
    : leftFolder(left)
    , rightFolder(right)
    , duplicateFiles(duplicates)
    , similarityPercentage(calculateSimilarity(duplicates.size(), totalLeftFiles, totalRightFiles))
    , folderSizeBytes(sizeBytes)
    , latestModificationDate(latestModification)
{
}

double FolderMatch::calculateSimilarity(int duplicateCount, int totalLeftFiles, int totalRightFiles)
{
    const int unionCount = totalLeftFiles + totalRightFiles - duplicateCount;
    if (unionCount <= 0) {
        return 0.0;
    }

    const double similarity = 100.0 * duplicateCount / unionCount;
    return std::clamp(similarity, 0.0, 100.0);
}

// === Progress ===

QString phaseName(AnalysisPhase phase)
{
    switch (phase) {
    case AnalysisPhase::Idle:
        return QStringLiteral("Idle");
    case AnalysisPhase::CountingFolders:
        return QStringLiteral("Counting folders");
    case AnalysisPhase::ScanningFolders:
        return QStringLiteral("Scanning folders");
    case AnalysisPhase::BuildingFileIndex:
        return QStringLiteral("Building file index");
    case AnalysisPhase::ComparingFiles:
        return QStringLiteral("Comparing files");
    case AnalysisPhase::AggregatingResults:
        return QStringLiteral("Aggregating results");
    case AnalysisPhase::Complete:
        return QStringLiteral("Complete");
    case AnalysisPhase::Cancelled:
        return QStringLiteral("Cancelled");
    }
    return QString();
}

int defaultWorkerCount()
{
    return std::max(1, QThread::idealThreadCount() - 1);
}
