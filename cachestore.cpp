#include "cachestore.h"
#include "filesystemprovider.h"

#include <QCoreApplication>
#include <QDebug>

// === Constants ===
namespace {
const QString SNAPSHOT_VERSION = "1.0";
const QString DEFAULT_APPLICATION_NAME = "DupeFolders";
}

CacheStore::CacheStore(const FileSystemProvider &fileSystem)
    : m_fileSystem(fileSystem)
{
}

// === Folder Cache ===

bool CacheStore::isFolderCached(const QString &folderPath) const
{
    return m_folderInfo.contains(folderPath);
}

void CacheStore::cacheFolderInfo(const QString &folderPath, const FolderInfo &info)
{
    m_folderInfo.insert(folderPath, info);
    m_folderFiles.insert(folderPath, info.files);
}

std::optional<FolderInfo> CacheStore::folderInfo(const QString &folderPath) const
{
    return m_folderInfo.value(folderPath);
}

QStringList CacheStore::folderFiles(const QString &folderPath) const
{
    return m_folderFiles.value(folderPath).value_or(QStringList());
}

qint64 CacheStore::folderSize(const QString &folderPath) const
{
    const std::optional<FolderInfo> info = m_folderInfo.value(folderPath);
    return info ? info->totalSize : 0;
}

QStringList CacheStore::cachedFolders() const
{
    return m_folderInfo.paths();
}

int CacheStore::cachedFolderCount() const
{
    return m_folderInfo.size();
}

// === File Cache ===

void CacheStore::cacheFileHash(const QString &filePath, const QString &hash)
{
    m_fileHashes.insert(filePath, hash);
}

std::optional<QString> CacheStore::fileHash(const QString &filePath) const
{
    return m_fileHashes.value(filePath);
}

int CacheStore::cachedFileHashCount() const
{
    return m_fileHashes.size();
}

void CacheStore::cacheFileMetadata(const QString &filePath, const FileMetadata &metadata)
{
    m_fileMetadata.insert(filePath, metadata);
}

std::optional<FileMetadata> CacheStore::fileMetadata(const QString &filePath) const
{
    return m_fileMetadata.value(filePath);
}

// === Maintenance ===

void CacheStore::removeFolderTree(const QString &rootPath)
{
    const int folders = m_folderInfo.removeTree(rootPath);
    m_folderFiles.removeTree(rootPath);
    const int hashes = m_fileHashes.removeTree(rootPath);
    const int files = m_fileMetadata.removeTree(rootPath);

    qDebug() << "Removed cache entries under" << rootPath << "- folders:" << folders
             << "files:" << files << "hashes:" << hashes;
}

void CacheStore::clear()
{
    m_folderInfo.clear();
    m_folderFiles.clear();
    m_fileHashes.clear();
    m_fileMetadata.clear();
}

// === Persistence ===

CacheSnapshot CacheStore::exportSnapshot(const QStringList &scanFolders) const
{
    CacheSnapshot snapshot;
    snapshot.scanFolders = scanFolders;
    snapshot.folderInfo = m_folderInfo.toHash();
    snapshot.fileHashes = m_fileHashes.toHash();
    snapshot.folderFiles = m_folderFiles.toHash();
    snapshot.fileMetadata = m_fileMetadata.toHash();
    snapshot.createdDate = QDateTime::currentDateTime();
    snapshot.version = SNAPSHOT_VERSION;

    const QString applicationName = QCoreApplication::applicationName();
    snapshot.applicationName = applicationName.isEmpty() ? DEFAULT_APPLICATION_NAME : applicationName;
    return snapshot;
}

void CacheStore::importSnapshot(const CacheSnapshot &snapshot)
{
    clear();

    for (auto it = snapshot.folderInfo.constBegin(); it != snapshot.folderInfo.constEnd(); ++it) {
        m_folderInfo.insert(it.key(), it.value());
        m_folderFiles.insert(it.key(), snapshot.folderFiles.value(it.key(), it.value().files));
    }

    for (auto it = snapshot.fileHashes.constBegin(); it != snapshot.fileHashes.constEnd(); ++it) {
        m_fileHashes.insert(it.key(), it.value());
    }

    // Metadata is never trusted from the snapshot; re-stat what still exists
    int restored = 0;
    int dropped = 0;
    for (const FolderInfo &info : snapshot.folderInfo) {
        for (const QString &filePath : info.files) {
            const FsResult<FileMetadata> stat = m_fileSystem.statFile(filePath);
            if (stat.ok()) {
                m_fileMetadata.insert(filePath, stat.value);
                ++restored;
            } else {
                ++dropped;
            }
        }
    }

    qDebug() << "Imported cache snapshot:" << snapshot.folderInfo.size() << "folders,"
             << restored << "files restored," << dropped << "unavailable";
}
