/**
 * @file test_localfilesystem.cpp
 * @brief Tests for LocalFileSystem against a temporary directory
 */

#include <gtest/gtest.h>
#include "filesystemprovider.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <cerrno>

class LocalFileSystemTest : public ::testing::Test {
protected:
    QTemporaryDir tempDir;
    LocalFileSystem fileSystem;

    void SetUp() override {
        ASSERT_TRUE(tempDir.isValid());
        ASSERT_TRUE(QDir(tempDir.path()).mkpath("photos/2024"));
        writeFile("photos/a.jpg", "alpha");
        writeFile("photos/b.jpg", "bravo!");
    }

    QString path(const QString &relative) const {
        return tempDir.filePath(relative);
    }

    void writeFile(const QString &relative, const QByteArray &content) {
        QFile file(path(relative));
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        ASSERT_EQ(file.write(content), content.size());
    }
};

TEST_F(LocalFileSystemTest, DirectoryExists) {
    EXPECT_TRUE(fileSystem.directoryExists(path("photos")));
    EXPECT_FALSE(fileSystem.directoryExists(path("photos/a.jpg")));
    EXPECT_FALSE(fileSystem.directoryExists(path("missing")));
    EXPECT_FALSE(fileSystem.directoryExists(QString()));
}

TEST_F(LocalFileSystemTest, ListsFilesAndSubdirectoriesAsAbsolutePaths) {
    const FsResult<QStringList> files = fileSystem.listFiles(path("photos"));
    ASSERT_TRUE(files.ok());
    EXPECT_EQ(files.value, QStringList({path("photos/a.jpg"), path("photos/b.jpg")}));

    const FsResult<QStringList> subdirectories = fileSystem.listSubdirectories(path("photos"));
    ASSERT_TRUE(subdirectories.ok());
    EXPECT_EQ(subdirectories.value, QStringList({path("photos/2024")}));
}

/**
 * @test DirectorySymlinksAreNotListed
 * @brief Links to directories are left out so a walk cannot loop.
 */
TEST_F(LocalFileSystemTest, DirectorySymlinksAreNotListed) {
    ASSERT_TRUE(QFile::link(path("photos"), path("photos/2024/back")));

    const FsResult<QStringList> subdirectories = fileSystem.listSubdirectories(path("photos/2024"));
    ASSERT_TRUE(subdirectories.ok());
    EXPECT_TRUE(subdirectories.value.isEmpty());
}

TEST_F(LocalFileSystemTest, ListingMissingDirectoryIsNotFound) {
    const FsResult<QStringList> result = fileSystem.listFiles(path("missing"));

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, FileErrorKind::NotFound);
    EXPECT_TRUE(result.error.directory);
}

TEST_F(LocalFileSystemTest, StatReturnsNameSizeAndDate) {
    const FsResult<FileMetadata> result = fileSystem.statFile(path("photos/b.jpg"));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value.fileName, "b.jpg");
    EXPECT_EQ(result.value.size, 6);
    EXPECT_TRUE(result.value.lastWriteTime.isValid());
}

TEST_F(LocalFileSystemTest, StatOfMissingFileIsNotFound) {
    const FsResult<FileMetadata> result = fileSystem.statFile(path("photos/none.jpg"));

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, FileErrorKind::NotFound);
}

TEST_F(LocalFileSystemTest, StatOfDirectoryIsNotARegularFile) {
    EXPECT_FALSE(fileSystem.statFile(path("photos")).ok());
}

TEST_F(LocalFileSystemTest, OpenForReadReturnsOpenDevice) {
    FsResult<std::unique_ptr<QIODevice>> result = fileSystem.openForRead(path("photos/a.jpg"));

    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value);
    EXPECT_TRUE(result.value->isOpen());
    EXPECT_EQ(result.value->readAll(), QByteArray("alpha"));
}

TEST_F(LocalFileSystemTest, OpenMissingFileFails) {
    const FsResult<std::unique_ptr<QIODevice>> result = fileSystem.openForRead(path("photos/none.jpg"));

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, FileErrorKind::NotFound);
    EXPECT_FALSE(result.value);
}

TEST_F(LocalFileSystemTest, OverlongNameIsPathTooLong) {
    const QString longName = path("photos/") + QString(300, QChar('x'));
    const FsResult<QStringList> result = fileSystem.listFiles(longName);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, FileErrorKind::PathTooLong);
}

/**
 * @test ErrnoValuesMapToErrorKinds
 * @brief Each errno family lands in the matching kind or resource.
 */
TEST(LocalFileSystemErrnoTest, ErrnoValuesMapToErrorKinds) {
    EXPECT_EQ(LocalFileSystem::errorFromErrno(EACCES, "/p", false).kind, FileErrorKind::AccessDenied);
    EXPECT_EQ(LocalFileSystem::errorFromErrno(ENOENT, "/p", true).kind, FileErrorKind::NotFound);
    EXPECT_TRUE(LocalFileSystem::errorFromErrno(ENOENT, "/p", true).directory);
    EXPECT_EQ(LocalFileSystem::errorFromErrno(EBUSY, "/p", false).kind, FileErrorKind::Locked);
    EXPECT_EQ(LocalFileSystem::errorFromErrno(ENAMETOOLONG, "/p", false).kind, FileErrorKind::PathTooLong);
    EXPECT_EQ(LocalFileSystem::errorFromErrno(ENETUNREACH, "/p", false).kind, FileErrorKind::NetworkUnreachable);
    EXPECT_EQ(LocalFileSystem::errorFromErrno(EIO, "/p", false).kind, FileErrorKind::Io);

    const FileSystemError noSpace = LocalFileSystem::errorFromErrno(ENOSPC, "/p", false);
    EXPECT_EQ(noSpace.kind, FileErrorKind::ResourceConstrained);
    EXPECT_EQ(noSpace.resource, ResourceConstraintType::DiskSpace);

    EXPECT_EQ(LocalFileSystem::errorFromErrno(ENOMEM, "/p", false).resource, ResourceConstraintType::Memory);
    EXPECT_EQ(LocalFileSystem::errorFromErrno(EMFILE, "/p", false).resource, ResourceConstraintType::FileHandles);
    EXPECT_EQ(LocalFileSystem::errorFromErrno(EINVAL, "/p", false).kind, FileErrorKind::Unknown);
}
