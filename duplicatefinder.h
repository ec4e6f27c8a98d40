#ifndef DUPLICATEFINDER_H
#define DUPLICATEFINDER_H

#include "cancellation.h"
#include "datamodels.h"

#include <QHash>
#include <QPair>

class CacheStore;
class ErrorRecoveryPolicy;
class FileSystemProvider;
class ProgressReporter;

/**
 * @brief Finds content-identical files across cached folders
 *
 * Works in three stages:
 * - Index: (lowercase name, size) -> folders containing such a file
 * - Grouping: candidate files for every key present in more than one folder
 * - Confirmation: SHA-256 of each candidate, compared pairwise across folders
 *
 * Only cached data is read in the first two stages; file contents are read
 * in the last one. Computed hashes are written back to the cache.
 */
class DuplicateFinder
{
public:
    DuplicateFinder(CacheStore &cache, ErrorRecoveryPolicy &errorRecovery, const FileSystemProvider &fileSystem);

    void setMaxParallelism(int workers);
    int maxParallelism() const;

    /**
     * @brief Find duplicate files between the given folders
     * @param folders Folders to compare; must already be in the cache
     * @param progress Progress sink, may be null
     * @param token Cancellation token
     * @return File matches in canonical order, unsorted
     */
    AnalysisResult<QList<FileMatch>> findDuplicateFiles(const QStringList &folders,
                                                        const ProgressCallback &progress,
                                                        const CancellationToken &token);

    /**
     * @brief SHA-256 of a file's full content as lowercase hex
     * @param filePath File to hash
     * @param abortRequested Set to true when the recovery policy asks to abort
     * @return Empty string when the file cannot be read
     */
    QString computeFileHash(const QString &filePath, bool *abortRequested = nullptr);

private:
    using IndexKey = QPair<QString, qint64>;
    using FileIndex = QHash<IndexKey, QStringList>;

    OperationStatus buildFileIndex(const QStringList &folders, ProgressReporter &reporter,
                                   const CancellationToken &token, FileIndex &index);
    OperationStatus groupCandidates(const FileIndex &index, int indexedFolders, ProgressReporter &reporter,
                                    const CancellationToken &token, QList<QStringList> &groups);
    OperationStatus confirmWithHashes(QList<QStringList> &groups, ProgressReporter &reporter,
                                      const CancellationToken &token, QList<FileMatch> &matches);

    QString cachedOrComputedHash(const QString &filePath, bool &abortRequested);

    CacheStore &m_cache;
    ErrorRecoveryPolicy &m_errorRecovery;
    const FileSystemProvider &m_fileSystem;
    int m_maxParallelism;
};

#endif // DUPLICATEFINDER_H
