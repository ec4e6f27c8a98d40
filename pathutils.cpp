#include "pathutils.h"

namespace PathUtils {

bool isSeparator(QChar c)
{
    return c == QLatin1Char('/') || c == QLatin1Char('\\');
}

QString normalizedKey(const QString &path)
{
    QString key = path;
    // A bare root ("/" or "C:\") keeps its separator
    while (key.size() > 1 && isSeparator(key.back()) && !key.endsWith(QLatin1String(":\\"))) {
        key.chop(1);
    }
    return key.toCaseFolded();
}

bool isSameOrDescendant(const QString &key, const QString &rootKey)
{
    if (rootKey.isEmpty() || !key.startsWith(rootKey)) {
        return false;
    }
    if (key.size() == rootKey.size()) {
        return true;
    }
    if (isSeparator(rootKey.back())) {
        return true;
    }
    return isSeparator(key.at(rootKey.size()));
}

QString parentFolder(const QString &filePath)
{
    int index = filePath.size() - 1;
    while (index >= 0 && !isSeparator(filePath.at(index))) {
        --index;
    }
    if (index < 0) {
        return QString();
    }
    if (index == 0) {
        return filePath.left(1);
    }
    // Files directly in a drive root keep the separator ("C:\\")
    if (index == 2 && filePath.at(1) == QLatin1Char(':')) {
        return filePath.left(index + 1);
    }
    return filePath.left(index);
}

QString fileName(const QString &path)
{
    int index = path.size() - 1;
    while (index >= 0 && !isSeparator(path.at(index))) {
        --index;
    }
    return path.mid(index + 1);
}

}
