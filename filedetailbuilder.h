#ifndef FILEDETAILBUILDER_H
#define FILEDETAILBUILDER_H

#include "datamodels.h"

class CacheStore;
class FileSystemProvider;

/**
 * @brief Builds the side-by-side file listing for one folder match
 */
class FileDetailBuilder
{
public:
    explicit FileDetailBuilder(const FileSystemProvider &fileSystem);

    /**
     * @brief One row per distinct file name found in either folder
     *
     * Names are matched case-insensitively and rows are sorted the same way.
     * A row is a duplicate when its name appears among @p duplicateFiles.
     * Size and date are read from the filesystem; failures leave the
     * not-available sentinels in place.
     */
    QList<FileDetail> build(const QString &leftFolder, const QString &rightFolder,
                            const QList<FileMatch> &duplicateFiles, const CacheStore &cache) const;

    /**
     * @brief Drop rows that are not duplicates unless @p includeUnique is set
     */
    static QList<FileDetail> filter(const QList<FileDetail> &details, bool includeUnique);

private:
    void fillSide(const QString &filePath, QString &fileName, qint64 &sizeBytes, QDateTime &date) const;

    const FileSystemProvider &m_fileSystem;
};

#endif // FILEDETAILBUILDER_H
