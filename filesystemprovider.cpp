#include "filesystemprovider.h"
#include "pathutils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cerrno>
#include <cstring>

// === Constants ===
namespace {
const int MAX_PATH_LENGTH = 4096;
const int MAX_NAME_LENGTH = 255;

const QDir::Filters SUBDIRECTORY_FILTER = QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System | QDir::NoSymLinks;
const QDir::Filters FILE_FILTER = QDir::Files | QDir::Hidden | QDir::System;

QStringList absolutePaths(const QDir &dir, const QStringList &names)
{
    QStringList paths;
    paths.reserve(names.size());
    for (const QString &name : names) {
        paths.append(dir.absoluteFilePath(name));
    }
    return paths;
}
}

// === Queries ===

bool LocalFileSystem::directoryExists(const QString &path) const
{
    if (path.isEmpty()) {
        return false;
    }
    return QFileInfo(path).isDir();
}

FsResult<QStringList> LocalFileSystem::listSubdirectories(const QString &path) const
{
    const FileSystemError error = classifyPath(path, true);
    if (error.isError()) {
        return FsResult<QStringList>::failure(error);
    }

    const QDir dir(path);
    return FsResult<QStringList>::success(absolutePaths(dir, dir.entryList(SUBDIRECTORY_FILTER, QDir::Name)));
}

FsResult<QStringList> LocalFileSystem::listFiles(const QString &path) const
{
    const FileSystemError error = classifyPath(path, true);
    if (error.isError()) {
        return FsResult<QStringList>::failure(error);
    }

    const QDir dir(path);
    return FsResult<QStringList>::success(absolutePaths(dir, dir.entryList(FILE_FILTER, QDir::Name)));
}

FsResult<FileMetadata> LocalFileSystem::statFile(const QString &path) const
{
    const QFileInfo fileInfo(path);
    if (!fileInfo.exists() || !fileInfo.isFile()) {
        const FileSystemError error = classifyPath(path, false);
        if (error.isError()) {
            return FsResult<FileMetadata>::failure(error);
        }
        return FsResult<FileMetadata>::failure(
            FileSystemError::make(FileErrorKind::NotFound, QString("Not a regular file: %1").arg(path)));
    }

    FileMetadata metadata;
    metadata.fileName = fileInfo.fileName();
    metadata.size = fileInfo.size();
    metadata.lastWriteTime = fileInfo.lastModified();
    return FsResult<FileMetadata>::success(metadata);
}

FsResult<std::unique_ptr<QIODevice>> LocalFileSystem::openForRead(const QString &path) const
{
    auto file = std::make_unique<QFile>(path);
    errno = 0;
    if (file->open(QIODevice::ReadOnly)) {
        return FsResult<std::unique_ptr<QIODevice>>::success(std::move(file));
    }

    const int openErrno = errno;
    if (openErrno != 0) {
        return FsResult<std::unique_ptr<QIODevice>>::failure(errorFromErrno(openErrno, path, false));
    }

    switch (file->error()) {
    case QFileDevice::PermissionsError:
        return FsResult<std::unique_ptr<QIODevice>>::failure(
            FileSystemError::make(FileErrorKind::AccessDenied, file->errorString()));
    case QFileDevice::ResourceError:
        return FsResult<std::unique_ptr<QIODevice>>::failure(
            FileSystemError::resourceConstrained(ResourceConstraintType::FileHandles, file->errorString()));
    default:
        break;
    }

    FileSystemError error = classifyPath(path, false);
    if (!error.isError()) {
        error = FileSystemError::make(FileErrorKind::Io, file->errorString());
    }
    return FsResult<std::unique_ptr<QIODevice>>::failure(error);
}

// === Error Classification ===

FileSystemError LocalFileSystem::errorFromErrno(int errorNumber, const QString &path, bool directory)
{
    const QString message = QString("%1: %2").arg(path, QString::fromLocal8Bit(std::strerror(errorNumber)));

    switch (errorNumber) {
    case EACCES:
    case EPERM:
        return FileSystemError::make(FileErrorKind::AccessDenied, message, directory);
    case ENOENT:
    case ENOTDIR:
        return FileSystemError::make(FileErrorKind::NotFound, message, directory);
    case EBUSY:
    case ETXTBSY:
    case EAGAIN:
        return FileSystemError::make(FileErrorKind::Locked, message, directory);
    case ENAMETOOLONG:
        return FileSystemError::make(FileErrorKind::PathTooLong, message, directory);
    case ENETUNREACH:
    case ENETDOWN:
    case EHOSTUNREACH:
    case EHOSTDOWN:
    case ETIMEDOUT:
        return FileSystemError::make(FileErrorKind::NetworkUnreachable, message, directory);
    case ENOMEM:
        return FileSystemError::resourceConstrained(ResourceConstraintType::Memory, message);
    case ENOSPC:
    case EDQUOT:
        return FileSystemError::resourceConstrained(ResourceConstraintType::DiskSpace, message);
    case EMFILE:
    case ENFILE:
        return FileSystemError::resourceConstrained(ResourceConstraintType::FileHandles, message);
    case EIO:
        return FileSystemError::make(FileErrorKind::Io, message, directory);
    default:
        return FileSystemError::make(FileErrorKind::Unknown, message, directory);
    }
}

FileSystemError LocalFileSystem::classifyPath(const QString &path, bool directory) const
{
    if (path.isEmpty()) {
        return FileSystemError::make(FileErrorKind::NotFound, "Empty path", directory);
    }

    if (path.size() > MAX_PATH_LENGTH || PathUtils::fileName(path).size() > MAX_NAME_LENGTH) {
        return FileSystemError::make(FileErrorKind::PathTooLong, QString("Path too long: %1").arg(path), directory);
    }

    const QFileInfo fileInfo(path);
    if (!fileInfo.exists()) {
        return FileSystemError::make(FileErrorKind::NotFound, QString("Path not found: %1").arg(path), directory);
    }

    if (directory && !fileInfo.isDir()) {
        return FileSystemError::make(FileErrorKind::NotFound, QString("Not a directory: %1").arg(path), directory);
    }

    // Listing a directory needs both read and search permission
    if (!fileInfo.isReadable() || (directory && !fileInfo.isExecutable())) {
        return FileSystemError::make(FileErrorKind::AccessDenied, QString("Access denied: %1").arg(path), directory);
    }

    return FileSystemError();
}
