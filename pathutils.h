#ifndef PATHUTILS_H
#define PATHUTILS_H

#include <QString>

/**
 * @brief Path string helpers shared by the cache and the analyzers
 *
 * Paths are treated as plain strings; both '/' and '\\' count as separators.
 */
namespace PathUtils {

/**
 * @brief Cache key for a path: trailing separators stripped, case-folded
 */
QString normalizedKey(const QString &path);

/**
 * @brief True when @p key equals @p rootKey or lies below it
 *
 * Both arguments must already be normalized. The check stops at separator
 * boundaries, so "/data/a" does not contain "/data/ab".
 */
bool isSameOrDescendant(const QString &key, const QString &rootKey);

/**
 * @brief Directory part of a file path, empty when there is none
 */
QString parentFolder(const QString &filePath);

/**
 * @brief Last path component
 */
QString fileName(const QString &path);

bool isSeparator(QChar c);

}

#endif // PATHUTILS_H
