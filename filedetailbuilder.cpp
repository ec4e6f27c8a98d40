#include "filedetailbuilder.h"
#include "cachestore.h"
#include "filesystemprovider.h"
#include "pathutils.h"

#include <QHash>
#include <QSet>

#include <algorithm>

FileDetailBuilder::FileDetailBuilder(const FileSystemProvider &fileSystem)
    : m_fileSystem(fileSystem)
{
}

QList<FileDetail> FileDetailBuilder::build(const QString &leftFolder, const QString &rightFolder,
                                           const QList<FileMatch> &duplicateFiles, const CacheStore &cache) const
{
    // Folded name -> full path, first occurrence wins
    QHash<QString, QString> leftFiles;
    QHash<QString, QString> rightFiles;
    QStringList names;
    QSet<QString> seenNames;

    auto collect = [&](const QStringList &paths, QHash<QString, QString> &side) {
        for (const QString &path : paths) {
            const QString name = PathUtils::fileName(path);
            const QString folded = name.toCaseFolded();
            if (!side.contains(folded)) {
                side.insert(folded, path);
            }
            if (!seenNames.contains(folded)) {
                seenNames.insert(folded);
                names.append(name);
            }
        }
    };
    collect(cache.folderFiles(leftFolder), leftFiles);
    collect(cache.folderFiles(rightFolder), rightFiles);

    QSet<QString> duplicateNames;
    for (const FileMatch &match : duplicateFiles) {
        duplicateNames.insert(PathUtils::fileName(match.pathA).toCaseFolded());
    }

    std::sort(names.begin(), names.end(), [](const QString &a, const QString &b) {
        return QString::compare(a, b, Qt::CaseInsensitive) < 0;
    });

    QList<FileDetail> details;
    details.reserve(names.size());

    for (const QString &name : names) {
        const QString folded = name.toCaseFolded();
        FileDetail detail;
        detail.isDuplicate = duplicateNames.contains(folded);

        const auto left = leftFiles.constFind(folded);
        if (left != leftFiles.constEnd()) {
            detail.leftFullPath = left.value();
            fillSide(detail.leftFullPath, detail.leftFileName, detail.leftSizeBytes, detail.leftDate);
        }

        const auto right = rightFiles.constFind(folded);
        if (right != rightFiles.constEnd()) {
            detail.rightFullPath = right.value();
            fillSide(detail.rightFullPath, detail.rightFileName, detail.rightSizeBytes, detail.rightDate);
        }

        details.append(detail);
    }

    return details;
}

QList<FileDetail> FileDetailBuilder::filter(const QList<FileDetail> &details, bool includeUnique)
{
    if (includeUnique) {
        return details;
    }

    QList<FileDetail> duplicates;
    for (const FileDetail &detail : details) {
        if (detail.isDuplicate) {
            duplicates.append(detail);
        }
    }
    return duplicates;
}

void FileDetailBuilder::fillSide(const QString &filePath, QString &fileName, qint64 &sizeBytes, QDateTime &date) const
{
    fileName = PathUtils::fileName(filePath);

    const FsResult<FileMetadata> stat = m_fileSystem.statFile(filePath);
    if (stat.ok()) {
        sizeBytes = stat.value.size;
        date = stat.value.lastWriteTime;
    }
}
