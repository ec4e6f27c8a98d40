#ifndef CANCELLATION_H
#define CANCELLATION_H

#include <QAtomicInt>
#include <QDeadlineTimer>
#include <QList>
#include <QSharedPointer>

#include <chrono>

class CancellationSource;

/**
 * @brief Read-only view of a cancellation request
 *
 * Cheap to copy and safe to poll from any thread. A default-constructed
 * token is never cancelled.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    bool isCancellationRequested() const;

private:
    friend class CancellationSource;

    struct State {
        QAtomicInt cancelled = 0;
        QDeadlineTimer deadline{QDeadlineTimer::Forever};
        QList<QSharedPointer<const State>> parents;

        bool isCancelled() const;
    };

    explicit CancellationToken(QSharedPointer<const State> state);

    QSharedPointer<const State> m_state;
};

/**
 * @brief Owner side of a cancellation request
 *
 * A source is cancelled when cancel() is called, when its deadline expires,
 * or when any of its parent tokens is cancelled.
 */
class CancellationSource
{
public:
    CancellationSource();
    explicit CancellationSource(std::chrono::milliseconds timeout);

    /**
     * @brief Create a source linked to @p parents with an optional deadline
     * @param timeout Non-positive means no deadline
     */
    CancellationSource(const QList<CancellationToken> &parents, std::chrono::milliseconds timeout);

    void cancel();
    bool isCancellationRequested() const;
    bool hasTimedOut() const;

    CancellationToken token() const;

private:
    QSharedPointer<CancellationToken::State> m_state;
};

#endif // CANCELLATION_H
