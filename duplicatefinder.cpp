#include "duplicatefinder.h"
#include "cachestore.h"
#include "errorrecovery.h"
#include "filesystemprovider.h"
#include "pathutils.h"
#include "progressreporter.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>
#include <QThreadPool>
#include <QVector>
#include <QtConcurrent>

#include <algorithm>
#include <utility>

// === Constants ===
namespace {
constexpr int INDEX_FILE_PROGRESS_INTERVAL = 100;
constexpr int INDEX_FOLDER_PROGRESS_INTERVAL = 10;
constexpr int GROUPING_FILE_PROGRESS_INTERVAL = 50;
constexpr int HASH_GROUP_PROGRESS_INTERVAL = 10;

QString folderKey(const QString &filePath)
{
    return PathUtils::normalizedKey(PathUtils::parentFolder(filePath));
}
}

// === Constructor ===

DuplicateFinder::DuplicateFinder(CacheStore &cache, ErrorRecoveryPolicy &errorRecovery, const FileSystemProvider &fileSystem)
    : m_cache(cache)
    , m_errorRecovery(errorRecovery)
    , m_fileSystem(fileSystem)
    , m_maxParallelism(defaultWorkerCount())
{
}

void DuplicateFinder::setMaxParallelism(int workers)
{
    m_maxParallelism = std::max(1, workers);
}

int DuplicateFinder::maxParallelism() const
{
    return m_maxParallelism;
}

// === Duplicate Detection ===

AnalysisResult<QList<FileMatch>> DuplicateFinder::findDuplicateFiles(const QStringList &folders,
                                                                     const ProgressCallback &progress,
                                                                     const CancellationToken &token)
{
    using Result = AnalysisResult<QList<FileMatch>>;
    ProgressReporter reporter(progress);

    auto finish = [&reporter](OperationStatus status) {
        const QString message = status == OperationStatus::Cancelled
                                    ? QString("Duplicate search cancelled")
                                    : QString("Duplicate search aborted");
        reporter.reportCancelled(message);
        return Result::withStatus(status, message);
    };

    if (token.isCancellationRequested()) {
        return finish(OperationStatus::Cancelled);
    }

    FileIndex index;
    OperationStatus status = buildFileIndex(folders, reporter, token, index);
    if (status != OperationStatus::Completed) {
        return finish(status);
    }

    QList<QStringList> groups;
    status = groupCandidates(index, folders.size(), reporter, token, groups);
    if (status != OperationStatus::Completed) {
        return finish(status);
    }

    if (groups.isEmpty()) {
        reporter.reportComplete("No potential duplicate files found");
        return Result::completed(QList<FileMatch>(), "No potential duplicate files found");
    }

    QList<FileMatch> matches;
    status = confirmWithHashes(groups, reporter, token, matches);
    if (status != OperationStatus::Completed) {
        return finish(status);
    }

    const QString message = QString("Found %1 duplicate files").arg(matches.size());
    qDebug() << message << "in" << groups.size() << "candidate groups";
    reporter.reportComplete(message, groups.size());
    return Result::completed(matches, message);
}

QString DuplicateFinder::computeFileHash(const QString &filePath, bool *abortRequested)
{
    FsResult<std::unique_ptr<QIODevice>> opened = m_fileSystem.openForRead(filePath);

    FileSystemError error = opened.error;
    if (opened.ok()) {
        QCryptographicHash hash(QCryptographicHash::Sha256);
        if (hash.addData(opened.value.get())) {
            return QString::fromLatin1(hash.result().toHex());
        }
        error = FileSystemError::make(FileErrorKind::Io, opened.value->errorString());
    }

    const RecoveryAction action = m_errorRecovery.handleFileAccessError(filePath, error);
    m_errorRecovery.logSkippedItem(filePath, QString("Hash failed: %1").arg(action.message));
    if (abortRequested && action.type == RecoveryActionType::Abort) {
        *abortRequested = true;
    }
    return QString();
}

// === Private Methods - Stages ===

OperationStatus DuplicateFinder::buildFileIndex(const QStringList &folders, ProgressReporter &reporter,
                                                const CancellationToken &token, FileIndex &index)
{
    const int folderCount = folders.size();
    reporter.report(AnalysisPhase::BuildingFileIndex, 0, folderCount,
                    QString("Indexing files in %1 folders").arg(folderCount));

    int foldersDone = 0;
    int filesIndexed = 0;

    for (const QString &folder : folders) {
        if (token.isCancellationRequested()) {
            return OperationStatus::Cancelled;
        }

        const QStringList files = m_cache.folderFiles(folder);
        for (const QString &filePath : files) {
            const std::optional<FileMetadata> metadata = m_cache.fileMetadata(filePath);
            if (!metadata) {
                m_errorRecovery.logSkippedItem(filePath, "No cached file information");
                continue;
            }

            QStringList &owners = index[IndexKey(metadata->fileName.toLower(), metadata->size)];
            // Files of one folder arrive together, so checking the last owner keeps the list distinct
            if (owners.isEmpty() || owners.constLast() != folder) {
                owners.append(folder);
            }

            ++filesIndexed;
            if (filesIndexed % INDEX_FILE_PROGRESS_INTERVAL == 0) {
                reporter.report(AnalysisPhase::BuildingFileIndex, foldersDone, folderCount,
                                QString("Indexed %1 files").arg(filesIndexed));
            }
        }

        ++foldersDone;
        if (foldersDone % INDEX_FOLDER_PROGRESS_INTERVAL == 0 || foldersDone == folderCount) {
            reporter.report(AnalysisPhase::BuildingFileIndex, foldersDone, folderCount,
                            QString("Indexed %1 of %2 folders").arg(foldersDone).arg(folderCount));
        }
    }

    qDebug() << "Indexed" << filesIndexed << "files into" << index.size() << "name/size keys";
    return OperationStatus::Completed;
}

OperationStatus DuplicateFinder::groupCandidates(const FileIndex &index, int indexedFolders, ProgressReporter &reporter,
                                                 const CancellationToken &token, QList<QStringList> &groups)
{
    QList<IndexKey> candidateKeys;
    for (auto it = index.constBegin(); it != index.constEnd(); ++it) {
        if (it.value().size() > 1) {
            candidateKeys.append(it.key());
        }
    }

    if (candidateKeys.isEmpty()) {
        return OperationStatus::Completed;
    }

    const QSet<IndexKey> candidateKeySet(candidateKeys.constBegin(), candidateKeys.constEnd());
    const int maximum = indexedFolders + candidateKeys.size();
    reporter.report(AnalysisPhase::BuildingFileIndex, indexedFolders, maximum,
                    QString("Grouping %1 potential duplicate sets").arg(candidateKeys.size()));

    QHash<IndexKey, QStringList> fileGroups;
    QSet<QString> processedFolders;
    int filesGrouped = 0;
    int keysDone = 0;

    for (const IndexKey &key : candidateKeys) {
        if (token.isCancellationRequested()) {
            return OperationStatus::Cancelled;
        }

        for (const QString &folder : index.value(key)) {
            const QString normalizedFolder = PathUtils::normalizedKey(folder);
            if (processedFolders.contains(normalizedFolder)) {
                continue;
            }
            processedFolders.insert(normalizedFolder);

            for (const QString &filePath : m_cache.folderFiles(folder)) {
                const std::optional<FileMetadata> metadata = m_cache.fileMetadata(filePath);
                if (!metadata) {
                    continue;
                }

                const IndexKey fileKey(metadata->fileName.toLower(), metadata->size);
                if (!candidateKeySet.contains(fileKey)) {
                    continue;
                }
                fileGroups[fileKey].append(filePath);

                ++filesGrouped;
                if (filesGrouped % GROUPING_FILE_PROGRESS_INTERVAL == 0) {
                    reporter.report(AnalysisPhase::BuildingFileIndex, indexedFolders + keysDone, maximum,
                                    QString("Grouped %1 files").arg(filesGrouped));
                }
            }
        }

        ++keysDone;
        reporter.report(AnalysisPhase::BuildingFileIndex, indexedFolders + keysDone, maximum,
                        QString("Grouped %1 of %2 sets").arg(keysDone).arg(candidateKeys.size()));
    }

    for (const QStringList &files : std::as_const(fileGroups)) {
        if (files.size() > 1) {
            groups.append(files);
        }
    }

    qDebug() << "Grouped" << filesGrouped << "files into" << groups.size() << "candidate groups";
    return OperationStatus::Completed;
}

OperationStatus DuplicateFinder::confirmWithHashes(QList<QStringList> &groups, ProgressReporter &reporter,
                                                   const CancellationToken &token, QList<FileMatch> &matches)
{
    const int total = groups.size();
    reporter.report(AnalysisPhase::ComparingFiles, 0, total,
                    QString("Comparing %1 groups of potential duplicates").arg(total));

    QMutex matchesMutex;
    QAtomicInt processed = 0;
    QAtomicInt abortRequested = 0;

    QThreadPool pool;
    pool.setMaxThreadCount(m_maxParallelism);

    QtConcurrent::blockingMap(&pool, groups, [&](const QStringList &files) {
        if (abortRequested.loadRelaxed() != 0 || token.isCancellationRequested()) {
            return;
        }

        QVector<QString> hashes(files.size());
        QVector<bool> hashed(files.size(), false);
        QList<FileMatch> groupMatches;
        bool abort = false;

        auto hashAt = [&](int i) -> const QString & {
            if (!hashed[i]) {
                hashes[i] = cachedOrComputedHash(files.at(i), abort);
                hashed[i] = true;
            }
            return hashes[i];
        };

        for (int i = 0; i < files.size() && !abort; ++i) {
            for (int j = i + 1; j < files.size() && !abort; ++j) {
                if (token.isCancellationRequested()) {
                    return;
                }
                if (folderKey(files.at(i)) == folderKey(files.at(j))) {
                    continue;
                }

                const QString &first = hashAt(i);
                if (first.isEmpty()) {
                    break;
                }
                const QString &second = hashAt(j);
                if (!second.isEmpty() && first == second) {
                    groupMatches.append(FileMatch::canonical(files.at(i), files.at(j)));
                }
            }
        }

        if (abort) {
            abortRequested.storeRelaxed(1);
        }

        if (!groupMatches.isEmpty()) {
            QMutexLocker locker(&matchesMutex);
            matches.append(groupMatches);
        }

        const int done = processed.fetchAndAddRelaxed(1) + 1;
        if (done % HASH_GROUP_PROGRESS_INTERVAL == 0 || done == total) {
            reporter.report(AnalysisPhase::ComparingFiles, done, total,
                            QString("Compared %1 of %2 groups").arg(done).arg(total));
        }
    });

    if (token.isCancellationRequested()) {
        return OperationStatus::Cancelled;
    }
    if (abortRequested.loadRelaxed() != 0) {
        return OperationStatus::Aborted;
    }
    return OperationStatus::Completed;
}

// === Private Methods - Hashing ===

QString DuplicateFinder::cachedOrComputedHash(const QString &filePath, bool &abortRequested)
{
    const std::optional<QString> cached = m_cache.fileHash(filePath);
    if (cached && !cached->isEmpty()) {
        return *cached;
    }

    const QString hash = computeFileHash(filePath, &abortRequested);
    if (!hash.isEmpty()) {
        m_cache.cacheFileHash(filePath, hash);
    }
    return hash;
}
