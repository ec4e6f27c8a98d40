#ifndef FILESYSTEMPROVIDER_H
#define FILESYSTEMPROVIDER_H

#include "datamodels.h"

#include <QIODevice>
#include <QString>
#include <QStringList>

#include <memory>
#include <utility>

/**
 * @brief Classification of a failed filesystem operation
 */
enum class FileErrorKind {
    None,
    AccessDenied,
    NotFound,
    Locked,
    PathTooLong,
    NetworkUnreachable,
    ResourceConstrained,
    Io,
    Unknown
};

struct FileSystemError {
    FileErrorKind kind = FileErrorKind::None;
    ResourceConstraintType resource = ResourceConstraintType::Memory; ///< Only meaningful for ResourceConstrained
    QString message;
    bool directory = false;          ///< The failing path is a directory

    bool isError() const { return kind != FileErrorKind::None; }

    static FileSystemError make(FileErrorKind kind, const QString &message, bool directory = false)
    {
        FileSystemError error;
        error.kind = kind;
        error.message = message;
        error.directory = directory;
        return error;
    }

    static FileSystemError resourceConstrained(ResourceConstraintType resource, const QString &message)
    {
        FileSystemError error;
        error.kind = FileErrorKind::ResourceConstrained;
        error.resource = resource;
        error.message = message;
        return error;
    }
};

/**
 * @brief Value-or-error result of a provider call
 */
template <typename T>
struct FsResult {
    T value{};
    FileSystemError error;

    bool ok() const { return !error.isError(); }

    static FsResult success(T value)
    {
        FsResult result;
        result.value = std::move(value);
        return result;
    }

    static FsResult failure(const FileSystemError &error)
    {
        FsResult result;
        result.error = error;
        return result;
    }
};

/**
 * @brief Abstract filesystem used by the scanner, finder and detail builder
 *
 * Implementations report failures as values and must be callable from
 * several worker threads at once.
 */
class FileSystemProvider
{
public:
    virtual ~FileSystemProvider() = default;

    virtual bool directoryExists(const QString &path) const = 0;

    /**
     * @brief Immediate subdirectories of @p path as absolute paths
     */
    virtual FsResult<QStringList> listSubdirectories(const QString &path) const = 0;

    /**
     * @brief Immediate files of @p path as absolute paths
     */
    virtual FsResult<QStringList> listFiles(const QString &path) const = 0;

    virtual FsResult<FileMetadata> statFile(const QString &path) const = 0;

    /**
     * @brief Open a file for sequential reading
     * @return An open device owned by the caller, or the failure
     */
    virtual FsResult<std::unique_ptr<QIODevice>> openForRead(const QString &path) const = 0;
};

/**
 * @brief FileSystemProvider backed by the local filesystem through QDir/QFile
 *
 * Symbolic links to directories are not followed while listing.
 */
class LocalFileSystem : public FileSystemProvider
{
public:
    bool directoryExists(const QString &path) const override;
    FsResult<QStringList> listSubdirectories(const QString &path) const override;
    FsResult<QStringList> listFiles(const QString &path) const override;
    FsResult<FileMetadata> statFile(const QString &path) const override;
    FsResult<std::unique_ptr<QIODevice>> openForRead(const QString &path) const override;

    /**
     * @brief Map an errno value to a classified error
     */
    static FileSystemError errorFromErrno(int errorNumber, const QString &path, bool directory);

private:
    FileSystemError classifyPath(const QString &path, bool directory) const;
};

#endif // FILESYSTEMPROVIDER_H
