#ifndef CONCURRENTPATHMAP_H
#define CONCURRENTPATHMAP_H

#include "pathutils.h"

#include <QHash>
#include <QReadLocker>
#include <QReadWriteLock>
#include <QStringList>
#include <QWriteLocker>

#include <optional>

/**
 * @brief Thread-safe map from a path to a value
 *
 * Lookups go through PathUtils::normalizedKey(). The spelling used at insert
 * time is kept so exported data carries the original paths.
 */
template <typename Value>
class ConcurrentPathMap
{
public:
    void insert(const QString &path, const Value &value)
    {
        const QString key = PathUtils::normalizedKey(path);
        QWriteLocker locker(&m_lock);
        m_entries.insert(key, Entry{path, value});
    }

    std::optional<Value> value(const QString &path) const
    {
        const QString key = PathUtils::normalizedKey(path);
        QReadLocker locker(&m_lock);
        const auto it = m_entries.constFind(key);
        if (it == m_entries.constEnd()) {
            return std::nullopt;
        }
        return it->value;
    }

    bool contains(const QString &path) const
    {
        const QString key = PathUtils::normalizedKey(path);
        QReadLocker locker(&m_lock);
        return m_entries.contains(key);
    }

    /**
     * @brief Remove @p rootPath and every path below it
     * @return Number of removed entries
     */
    int removeTree(const QString &rootPath)
    {
        const QString rootKey = PathUtils::normalizedKey(rootPath);
        QWriteLocker locker(&m_lock);

        int removed = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (PathUtils::isSameOrDescendant(it.key(), rootKey)) {
                it = m_entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear()
    {
        QWriteLocker locker(&m_lock);
        m_entries.clear();
    }

    int size() const
    {
        QReadLocker locker(&m_lock);
        return m_entries.size();
    }

    QStringList paths() const
    {
        QReadLocker locker(&m_lock);
        QStringList result;
        result.reserve(m_entries.size());
        for (const Entry &entry : m_entries) {
            result.append(entry.path);
        }
        return result;
    }

    /**
     * @brief Copy of the contents keyed by original path spelling
     */
    QHash<QString, Value> toHash() const
    {
        QReadLocker locker(&m_lock);
        QHash<QString, Value> result;
        result.reserve(m_entries.size());
        for (const Entry &entry : m_entries) {
            result.insert(entry.path, entry.value);
        }
        return result;
    }

private:
    struct Entry {
        QString path;
        Value value;
    };

    mutable QReadWriteLock m_lock;
    QHash<QString, Entry> m_entries;
};

#endif // CONCURRENTPATHMAP_H
