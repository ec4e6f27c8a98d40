#include "folderscanner.h"
#include "cachestore.h"
#include "errorrecovery.h"
#include "filesystemprovider.h"
#include "progressreporter.h"

#include <QDebug>
#include <QStack>
#include <QThreadPool>
#include <QtConcurrent>

#include <algorithm>

// === Constants ===
namespace {
const int ENUMERATION_PROGRESS_INTERVAL = 100;   // Report every N folders found
const int ANALYSIS_PROGRESS_INTERVAL = 25;       // Report every N folders analyzed
}

// === Constructor ===

FolderScanner::FolderScanner(CacheStore &cache, ErrorRecoveryPolicy &errorRecovery, const FileSystemProvider &fileSystem)
    : m_cache(cache)
    , m_errorRecovery(errorRecovery)
    , m_fileSystem(fileSystem)
    , m_maxParallelism(defaultWorkerCount())
{
}

void FolderScanner::setMaxParallelism(int workers)
{
    m_maxParallelism = std::max(1, workers);
}

int FolderScanner::maxParallelism() const
{
    return m_maxParallelism;
}

// === Scanning ===

AnalysisResult<QStringList> FolderScanner::scanFolderHierarchy(const QString &rootPath,
                                                               const ProgressCallback &progress,
                                                               const CancellationToken &token)
{
    using Result = AnalysisResult<QStringList>;
    ProgressReporter reporter(progress);

    if (token.isCancellationRequested()) {
        reporter.reportCancelled("Folder scan cancelled");
        return Result::withStatus(OperationStatus::Cancelled, "Folder scan cancelled");
    }
    if (rootPath.isEmpty()) {
        return Result::withStatus(OperationStatus::Failed, "Root path cannot be empty");
    }
    if (!m_fileSystem.directoryExists(rootPath)) {
        qWarning() << "Scan root does not exist:" << rootPath;
        return Result::withStatus(OperationStatus::Failed, QString("Directory not found: %1").arg(rootPath));
    }

    // Phase 1: enumerate the tree
    QStringList allFolders;
    const OperationStatus enumerationStatus = enumerateFolders(rootPath, reporter, token, allFolders);
    if (enumerationStatus != OperationStatus::Completed) {
        const QString message = enumerationStatus == OperationStatus::Cancelled
                                    ? QString("Folder scan cancelled")
                                    : QString("Folder scan aborted");
        reporter.reportCancelled(message);
        return Result::withStatus(enumerationStatus, message);
    }

    // Phase 2: analyze what is not cached yet
    QStringList uncachedFolders;
    for (const QString &folder : allFolders) {
        if (!m_cache.isFolderCached(folder)) {
            uncachedFolders.append(folder);
        }
    }

    const int total = uncachedFolders.size();
    if (total == 0) {
        qDebug() << "All" << allFolders.size() << "folders under" << rootPath << "already cached";
        reporter.reportComplete(QString("All %1 folders already cached").arg(allFolders.size()), allFolders.size());
        return Result::completed(allFolders);
    }

    qDebug() << "Scanning" << total << "of" << allFolders.size() << "folders under" << rootPath
             << "with" << m_maxParallelism << "workers";
    reporter.report(AnalysisPhase::ScanningFolders, 0, total,
                    QString("Analyzing %1 folders (%2 cached)").arg(total).arg(allFolders.size() - total));

    QAtomicInt processed = 0;
    QAtomicInt abortRequested = 0;

    QThreadPool pool;
    pool.setMaxThreadCount(m_maxParallelism);

    QtConcurrent::blockingMap(&pool, uncachedFolders, [&](const QString &folderPath) {
        if (abortRequested.loadRelaxed() != 0 || token.isCancellationRequested()) {
            return;
        }

        scanSingleFolder(folderPath, abortRequested);

        const int done = processed.fetchAndAddRelaxed(1) + 1;
        if (done % ANALYSIS_PROGRESS_INTERVAL == 0 || done == total) {
            reporter.report(AnalysisPhase::ScanningFolders, done, total,
                            QString("Analyzed %1 of %2 folders").arg(done).arg(total));
        }
    });

    if (token.isCancellationRequested()) {
        qDebug() << "Folder scan cancelled after" << processed.loadRelaxed() << "folders";
        reporter.reportCancelled("Folder scan cancelled");
        return Result::withStatus(OperationStatus::Cancelled, "Folder scan cancelled");
    }
    if (abortRequested.loadRelaxed() != 0) {
        qWarning() << "Folder scan aborted after" << processed.loadRelaxed() << "folders";
        reporter.reportCancelled("Folder scan aborted");
        return Result::withStatus(OperationStatus::Aborted, "Folder scan aborted");
    }

    reporter.reportComplete(QString("Scanned %1 folders").arg(allFolders.size()), total);
    return Result::completed(allFolders);
}

AnalysisResult<FolderInfo> FolderScanner::analyzeFolder(const QString &folderPath, const CancellationToken &token)
{
    using Result = AnalysisResult<FolderInfo>;

    if (token.isCancellationRequested()) {
        return Result::withStatus(OperationStatus::Cancelled, "Folder analysis cancelled");
    }
    if (!m_fileSystem.directoryExists(folderPath)) {
        return Result::withStatus(OperationStatus::Failed, QString("Directory not found: %1").arg(folderPath));
    }

    bool abortRequested = false;
    const FolderInfo info = analyzeFolderContents(folderPath, abortRequested);
    m_cache.cacheFolderInfo(folderPath, info);

    if (abortRequested) {
        return Result::withStatus(OperationStatus::Aborted, "Folder analysis aborted");
    }
    return Result::completed(info);
}

int FolderScanner::countSubfolders(const QString &rootPath) const
{
    if (!m_fileSystem.directoryExists(rootPath)) {
        return 1;
    }

    int count = 0;
    QStack<QString> pending;
    pending.push(rootPath);

    while (!pending.isEmpty()) {
        const QString current = pending.pop();
        ++count;

        const FsResult<QStringList> subdirectories = m_fileSystem.listSubdirectories(current);
        if (!subdirectories.ok()) {
            continue;
        }
        for (const QString &subdirectory : subdirectories.value) {
            pending.push(subdirectory);
        }
    }

    return std::max(1, count);
}

// === Private Methods ===

OperationStatus FolderScanner::enumerateFolders(const QString &rootPath, ProgressReporter &reporter,
                                                const CancellationToken &token, QStringList &folders)
{
    QStack<QString> pending;
    pending.push(rootPath);

    while (!pending.isEmpty()) {
        if (token.isCancellationRequested()) {
            return OperationStatus::Cancelled;
        }

        const QString current = pending.pop();
        folders.append(current);

        const int found = folders.size();
        if (found == 1 || found % ENUMERATION_PROGRESS_INTERVAL == 0) {
            reporter.reportIndeterminate(AnalysisPhase::CountingFolders, found,
                                         QString("Found %1 folders...").arg(found));
        }

        const FsResult<QStringList> subdirectories = m_fileSystem.listSubdirectories(current);
        if (!subdirectories.ok()) {
            if (recordFailure(current, subdirectories.error, "Cannot enumerate subfolders")) {
                return OperationStatus::Aborted;
            }
            // Cached empty so the analysis phase does not fail on it again
            m_cache.cacheFolderInfo(current, FolderInfo());
            continue;
        }

        for (const QString &subdirectory : subdirectories.value) {
            if (token.isCancellationRequested()) {
                return OperationStatus::Cancelled;
            }
            pending.push(subdirectory);
        }
    }

    return OperationStatus::Completed;
}

void FolderScanner::scanSingleFolder(const QString &folderPath, QAtomicInt &abortRequested)
{
    if (!m_fileSystem.directoryExists(folderPath)) {
        const FileSystemError error = FileSystemError::make(FileErrorKind::NotFound, "Folder disappeared before analysis", true);
        if (recordFailure(folderPath, error, "Folder scan failed")) {
            abortRequested.storeRelaxed(1);
        }
        return;
    }

    bool abort = false;
    const FolderInfo info = analyzeFolderContents(folderPath, abort);
    m_cache.cacheFolderInfo(folderPath, info);

    if (abort) {
        abortRequested.storeRelaxed(1);
    }
}

FolderInfo FolderScanner::analyzeFolderContents(const QString &folderPath, bool &abortRequested)
{
    FolderInfo info;

    const FsResult<QStringList> listing = m_fileSystem.listFiles(folderPath);
    if (!listing.ok()) {
        abortRequested = recordFailure(folderPath, listing.error, "Cannot list files");
        return info;
    }

    info.files = listing.value;

    for (const QString &filePath : info.files) {
        const FsResult<FileMetadata> stat = m_fileSystem.statFile(filePath);
        if (!stat.ok()) {
            if (recordFailure(filePath, stat.error, "Cannot read file information")) {
                abortRequested = true;
                break;
            }
            continue;
        }

        m_cache.cacheFileMetadata(filePath, stat.value);
        info.totalSize += stat.value.size;

        if (!info.latestModificationDate.isValid() || stat.value.lastWriteTime > info.latestModificationDate) {
            info.latestModificationDate = stat.value.lastWriteTime;
        }
    }

    return info;
}

bool FolderScanner::recordFailure(const QString &path, const FileSystemError &error, const QString &context)
{
    const RecoveryAction action = m_errorRecovery.handleFileAccessError(path, error);
    m_errorRecovery.logSkippedItem(path, QString("%1: %2").arg(context, action.message));
    return action.type == RecoveryActionType::Abort;
}
