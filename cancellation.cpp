#include "cancellation.h"

#include <utility>

// === CancellationToken ===

CancellationToken::CancellationToken(QSharedPointer<const State> state)
    : m_state(std::move(state))
{
}

bool CancellationToken::isCancellationRequested() const
{
    return m_state && m_state->isCancelled();
}

bool CancellationToken::State::isCancelled() const
{
    if (cancelled.loadRelaxed() != 0 || deadline.hasExpired()) {
        return true;
    }

    for (const QSharedPointer<const State> &parent : parents) {
        if (parent->isCancelled()) {
            return true;
        }
    }
    return false;
}

// === CancellationSource ===

CancellationSource::CancellationSource()
    : m_state(QSharedPointer<CancellationToken::State>::create())
{
}

CancellationSource::CancellationSource(std::chrono::milliseconds timeout)
    : CancellationSource(QList<CancellationToken>(), timeout)
{
}

CancellationSource::CancellationSource(const QList<CancellationToken> &parents, std::chrono::milliseconds timeout)
    : m_state(QSharedPointer<CancellationToken::State>::create())
{
    if (timeout.count() > 0) {
        m_state->deadline = QDeadlineTimer(timeout);
    }

    for (const CancellationToken &parent : parents) {
        if (parent.m_state) {
            m_state->parents.append(parent.m_state);
        }
    }
}

void CancellationSource::cancel()
{
    m_state->cancelled.storeRelaxed(1);
}

bool CancellationSource::isCancellationRequested() const
{
    return m_state->isCancelled();
}

bool CancellationSource::hasTimedOut() const
{
    return m_state->deadline.hasExpired();
}

CancellationToken CancellationSource::token() const
{
    return CancellationToken(m_state);
}
