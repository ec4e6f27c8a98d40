#ifndef FOLDERSCANNER_H
#define FOLDERSCANNER_H

#include "cancellation.h"
#include "datamodels.h"

#include <QAtomicInt>

class CacheStore;
class ErrorRecoveryPolicy;
class FileSystemProvider;
class ProgressReporter;

/**
 * @brief Walks a directory tree and fills the cache with folder contents
 *
 * Scanning runs in two phases:
 * - Enumeration: depth-first walk collecting every folder below the root
 * - Analysis: folders missing from the cache are analyzed in parallel
 *
 * Folders analyzed before a cancellation stay cached, so a later scan of
 * the same root only touches what is left.
 */
class FolderScanner
{
public:
    FolderScanner(CacheStore &cache, ErrorRecoveryPolicy &errorRecovery, const FileSystemProvider &fileSystem);

    /**
     * @brief Set the number of folders analyzed concurrently
     * @param workers Values below 1 are raised to 1
     */
    void setMaxParallelism(int workers);
    int maxParallelism() const;

    /**
     * @brief Scan a root folder and everything below it
     * @param rootPath Folder to scan
     * @param progress Progress sink, may be null
     * @param token Cancellation token
     * @return Every folder found under the root (root included) on success
     */
    AnalysisResult<QStringList> scanFolderHierarchy(const QString &rootPath,
                                                    const ProgressCallback &progress,
                                                    const CancellationToken &token);

    /**
     * @brief Analyze one folder and store the result in the cache
     *
     * Always re-reads the folder, even when it is already cached.
     */
    AnalysisResult<FolderInfo> analyzeFolder(const QString &folderPath, const CancellationToken &token);

    /**
     * @brief Best-effort count of folders under a root, root included
     * @return At least 1, also when the tree cannot be read
     */
    int countSubfolders(const QString &rootPath) const;

private:
    OperationStatus enumerateFolders(const QString &rootPath, ProgressReporter &reporter,
                                     const CancellationToken &token, QStringList &folders);
    void scanSingleFolder(const QString &folderPath, QAtomicInt &abortRequested);
    FolderInfo analyzeFolderContents(const QString &folderPath, bool &abortRequested);
    bool recordFailure(const QString &path, const FileSystemError &error, const QString &context);

    CacheStore &m_cache;
    ErrorRecoveryPolicy &m_errorRecovery;
    const FileSystemProvider &m_fileSystem;
    int m_maxParallelism;
};

#endif // FOLDERSCANNER_H
