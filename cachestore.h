#ifndef CACHESTORE_H
#define CACHESTORE_H

#include "concurrentpathmap.h"
#include "datamodels.h"

#include <optional>

class FileSystemProvider;

/**
 * @brief Incremental cache of scan results shared by all analysis stages
 *
 * Holds four maps (folder info, folder file lists, file hashes and file
 * metadata), each with its own lock. Paths are matched case-insensitively
 * and trailing separators are ignored.
 *
 * Safe to use from any number of threads.
 */
class CacheStore
{
public:
    explicit CacheStore(const FileSystemProvider &fileSystem);

    // === Folder Cache ===

    bool isFolderCached(const QString &folderPath) const;

    /**
     * @brief Store folder info, replacing any previous entry
     *
     * The folder's file list is stored alongside.
     */
    void cacheFolderInfo(const QString &folderPath, const FolderInfo &info);

    std::optional<FolderInfo> folderInfo(const QString &folderPath) const;

    /**
     * @brief Cached file list of a folder, empty when unknown
     */
    QStringList folderFiles(const QString &folderPath) const;

    /**
     * @brief Cached total size of a folder, 0 when unknown
     */
    qint64 folderSize(const QString &folderPath) const;

    QStringList cachedFolders() const;
    int cachedFolderCount() const;

    // === File Cache ===

    void cacheFileHash(const QString &filePath, const QString &hash);
    std::optional<QString> fileHash(const QString &filePath) const;
    int cachedFileHashCount() const;

    void cacheFileMetadata(const QString &filePath, const FileMetadata &metadata);
    std::optional<FileMetadata> fileMetadata(const QString &filePath) const;

    // === Maintenance ===

    /**
     * @brief Remove a folder and everything below it from all maps
     * @param rootPath Folder to drop; siblings sharing a name prefix are kept
     */
    void removeFolderTree(const QString &rootPath);

    void clear();

    // === Persistence ===

    /**
     * @brief Copy of the cache for persistence
     * @param scanFolders Scan roots recorded in the snapshot
     */
    CacheSnapshot exportSnapshot(const QStringList &scanFolders) const;

    /**
     * @brief Replace the cache contents with a snapshot
     *
     * File metadata is rebuilt by re-stating every cached file. Files that
     * can no longer be read are left out without reporting an error.
     */
    void importSnapshot(const CacheSnapshot &snapshot);

private:
    const FileSystemProvider &m_fileSystem;

    ConcurrentPathMap<FolderInfo> m_folderInfo;
    ConcurrentPathMap<QStringList> m_folderFiles;
    ConcurrentPathMap<QString> m_fileHashes;
    ConcurrentPathMap<FileMetadata> m_fileMetadata;
};

#endif // CACHESTORE_H
