#ifndef DATAMODELS_H
#define DATAMODELS_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMetaType>

#include <chrono>
#include <functional>

// === File & Folder Records ===

/**
 * @brief Snapshot of a single file taken at scan time
 */
struct FileMetadata {
    QString fileName;                ///< File name without directory
    qint64 size = 0;                 ///< Size in bytes
    QDateTime lastWriteTime;         ///< Last modification time
};

/**
 * @brief Contents summary of one folder (immediate files only)
 */
struct FolderInfo {
    QStringList files;               ///< Absolute file paths in listing order
    qint64 totalSize = 0;            ///< Sum of sizes of files that could be stat'ed
    QDateTime latestModificationDate; ///< Newest file mtime, invalid when empty or unreadable

    int fileCount() const { return files.size(); }
};

/**
 * @brief Two content-identical files living in different folders
 *
 * Use FileMatch::canonical() to build one: pathA always belongs to the folder
 * whose normalized path sorts first, so a folder pair maps to one key.
 */
struct FileMatch {
    QString pathA;
    QString pathB;

    static FileMatch canonical(const QString &first, const QString &second);

    bool operator==(const FileMatch &other) const
    {
        return pathA == other.pathA && pathB == other.pathB;
    }
};

/**
 * @brief Folder-level duplicate relation with its Jaccard similarity
 */
struct FolderMatch {
    QString leftFolder;
    QString rightFolder;
    QList<FileMatch> duplicateFiles;
    double similarityPercentage = 0.0;
    qint64 folderSizeBytes = 0;
    QDateTime latestModificationDate; ///< Invalid when the left folder has no date

    FolderMatch() = default;
    FolderMatch(const QString &left, const QString &right,
                const QList<FileMatch> &duplicates,
                int totalLeftFiles, int totalRightFiles,
                qint64 sizeBytes = 0,
                const QDateTime &latestModification = QDateTime());

    /**
     * @brief Jaccard similarity in percent
     * @param duplicateCount Files present in both folders
     * @param totalLeftFiles File count of the left folder
     * @param totalRightFiles File count of the right folder
     * @return 100 * d / (L + R - d), 0 when the union is empty, clamped to [0, 100]
     */
    static double calculateSimilarity(int duplicateCount, int totalLeftFiles, int totalRightFiles);
};

// === Filtering ===

constexpr qint64 DEFAULT_MINIMUM_SIZE_BYTES = 1024 * 1024;
constexpr double DEFAULT_MINIMUM_SIMILARITY = 50.0;

struct FilterCriteria {
    double minimumSimilarityPercent = DEFAULT_MINIMUM_SIMILARITY;
    qint64 minimumSizeBytes = DEFAULT_MINIMUM_SIZE_BYTES;
    QDateTime minimumDate;           ///< Ignored when invalid
    QDateTime maximumDate;           ///< Ignored when invalid
};

// === Progress ===

enum class AnalysisPhase {
    Idle,
    CountingFolders,
    ScanningFolders,
    BuildingFileIndex,
    ComparingFiles,
    AggregatingResults,
    Complete,
    Cancelled
};

struct AnalysisProgress {
    AnalysisPhase phase = AnalysisPhase::Idle;
    int current = 0;
    int maximum = 0;
    QString message;
    bool indeterminate = false;

    double percentComplete() const
    {
        return maximum > 0 ? 100.0 * current / maximum : 0.0;
    }
};

using ProgressCallback = std::function<void(const AnalysisProgress &)>;

QString phaseName(AnalysisPhase phase);

/**
 * @brief Default worker count for parallel stages: one less than the core count, at least 1
 */
int defaultWorkerCount();

// === Error Recovery ===

enum class RecoveryActionType {
    Retry,
    RetryWithElevation,
    Skip,
    PauseAndWait,
    ReduceParallelism,
    Abort
};

struct RecoveryAction {
    RecoveryActionType type = RecoveryActionType::Skip;
    QString message;
    QString suggestedSolution;
    bool shouldRetry = false;
    std::chrono::milliseconds retryDelay{0};
};

enum class ResourceConstraintType {
    Memory,
    DiskSpace,
    FileHandles,
    NetworkBandwidth,
    CpuUsage
};

/**
 * @brief Accumulated error statistics for one analysis session
 */
struct ErrorSummary {
    int skippedFiles = 0;
    int permissionErrors = 0;
    int networkErrors = 0;
    int resourceErrors = 0;
    QStringList skippedPaths;
    QStringList errorMessages;
    QDateTime lastErrorTime;

    bool hasErrors() const { return totalErrors() > 0; }
    int totalErrors() const { return skippedFiles + permissionErrors + networkErrors + resourceErrors; }
};

// === File Details ===

constexpr qint64 SIZE_NOT_AVAILABLE = -1;

/**
 * @brief One row of a side-by-side folder comparison
 *
 * Missing sides have an empty file name. Size and date that could not be
 * read are SIZE_NOT_AVAILABLE and an invalid QDateTime.
 */
struct FileDetail {
    QString leftFileName;
    qint64 leftSizeBytes = SIZE_NOT_AVAILABLE;
    QDateTime leftDate;
    QString leftFullPath;

    QString rightFileName;
    qint64 rightSizeBytes = SIZE_NOT_AVAILABLE;
    QDateTime rightDate;
    QString rightFullPath;

    bool isDuplicate = false;

    bool hasLeftFile() const { return !leftFileName.isEmpty(); }
    bool hasRightFile() const { return !rightFileName.isEmpty(); }
    QString primaryFileName() const { return hasLeftFile() ? leftFileName : rightFileName; }
};

// === Persistence ===

/**
 * @brief Durable record of a session's cache and scan roots
 */
struct CacheSnapshot {
    QStringList scanFolders;
    QHash<QString, FolderInfo> folderInfo;
    QHash<QString, QString> fileHashes;
    QHash<QString, QStringList> folderFiles;
    QHash<QString, FileMetadata> fileMetadata;
    QDateTime createdDate;
    QString version;
    QString applicationName;
};

// === Operation Results ===

enum class OperationStatus {
    Completed,
    Cancelled,
    Aborted,
    Failed
};

/**
 * @brief Outcome of a long-running operation
 *
 * Cancellation is reported through status, never as a failure.
 */
template <typename T>
struct AnalysisResult {
    OperationStatus status = OperationStatus::Completed;
    T value{};
    QString message;

    bool isCompleted() const { return status == OperationStatus::Completed; }
    bool isCancelled() const { return status == OperationStatus::Cancelled; }

    static AnalysisResult completed(const T &value, const QString &message = QString())
    {
        return AnalysisResult{OperationStatus::Completed, value, message};
    }

    static AnalysisResult withStatus(OperationStatus status, const QString &message)
    {
        return AnalysisResult{status, T{}, message};
    }
};

Q_DECLARE_METATYPE(AnalysisProgress)

#endif // DATAMODELS_H
