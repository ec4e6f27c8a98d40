#ifndef ERRORRECOVERY_H
#define ERRORRECOVERY_H

#include "datamodels.h"
#include "filesystemprovider.h"

#include <QMutex>

#include <chrono>
#include <functional>

/**
 * @brief Classifies filesystem failures into recovery actions
 *
 * Also accumulates an ErrorSummary for the session. All methods are
 * thread-safe and none of them throw.
 *
 * Network detection and reachability are virtual so callers can supply
 * their own probes.
 */
class ErrorRecoveryPolicy
{
public:
    ErrorRecoveryPolicy();
    virtual ~ErrorRecoveryPolicy();

    // === Classification ===

    /**
     * @brief Decide how to react to a failed file or directory access
     * @param path Path that failed
     * @param error Classified failure from the filesystem provider
     * @return Recovery action; shouldRetry is false for permission errors
     */
    RecoveryAction handleFileAccessError(const QString &path, const FileSystemError &error);

    /**
     * @brief Decide how to react to an I/O failure on a network location
     * @return PauseAndWait when the network location is unreachable, Retry otherwise
     */
    RecoveryAction handleNetworkError(const QString &path, const FileSystemError &error);

    /**
     * @brief Decide how to react to resource exhaustion
     *
     * Memory pressure runs the memory relief handler and waits before
     * returning. Disk space exhaustion returns Abort.
     */
    RecoveryAction handleResourceConstraintError(ResourceConstraintType type, const QString &detail);

    // === Accumulator ===

    void logSkippedItem(const QString &path, const QString &reason);

    /**
     * @brief Deep copy of the accumulated summary
     */
    ErrorSummary summary() const;

    void clearSummary();

    // === Configuration ===

    void setMemoryReliefHandler(std::function<void()> handler);
    void setMemoryReliefDelay(std::chrono::milliseconds delay);
    void setNetworkProbeTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief True for UNC-style paths ("\\server\share", "//server/share")
     */
    static bool isUncPath(const QString &path);

protected:
    virtual bool isNetworkPath(const QString &path) const;
    virtual bool isNetworkPathReachable(const QString &path) const;

    std::chrono::milliseconds networkProbeTimeout() const;

private:
    void recordError(const QString &message);
    static RecoveryAction makeAction(RecoveryActionType type, const QString &message,
                                     const QString &suggestedSolution, bool shouldRetry,
                                     std::chrono::milliseconds retryDelay);

    mutable QMutex m_mutex;
    ErrorSummary m_summary;

    std::function<void()> m_memoryReliefHandler;
    std::chrono::milliseconds m_memoryReliefDelay;
    std::chrono::milliseconds m_networkProbeTimeout;
};

#endif // ERRORRECOVERY_H
