#include "errorrecovery.h"
#include "pathutils.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QStorageInfo>
#include <QTcpSocket>
#include <QThread>

// === Constants ===
namespace {
using std::chrono::milliseconds;

const milliseconds LOCKED_RETRY_DELAY(2000);
const milliseconds NETWORK_RETRY_DELAY(5000);
const milliseconds NETWORK_PAUSE_DELAY(30000);
const milliseconds BANDWIDTH_PAUSE_DELAY(10000);
const milliseconds MEMORY_RETRY_DELAY(2000);
const milliseconds THROTTLE_RETRY_DELAY(1000);

const milliseconds DEFAULT_MEMORY_RELIEF_DELAY(1000);
const milliseconds DEFAULT_NETWORK_PROBE_TIMEOUT(5000);

const quint16 SMB_PORT = 445;

const QStringList NETWORK_FILESYSTEM_TYPES = {
    "nfs", "nfs4", "cifs", "smb3", "smbfs", "fuse.sshfs", "sshfs", "9p", "afs", "ncpfs"
};

QString timestamped(const QString &message)
{
    return QString("[%1] %2").arg(QDateTime::currentDateTime().toString(Qt::ISODate), message);
}

QString describe(const QString &path, const FileSystemError &error)
{
    if (error.message.isEmpty()) {
        return path;
    }
    return QString("%1 (%2)").arg(path, error.message);
}
}

// === Constructor & Destructor ===

ErrorRecoveryPolicy::ErrorRecoveryPolicy()
    : m_memoryReliefDelay(DEFAULT_MEMORY_RELIEF_DELAY)
    , m_networkProbeTimeout(DEFAULT_NETWORK_PROBE_TIMEOUT)
{
}

ErrorRecoveryPolicy::~ErrorRecoveryPolicy() = default;

// === Classification ===

RecoveryAction ErrorRecoveryPolicy::handleFileAccessError(const QString &path, const FileSystemError &error)
{
    recordError(QString("File access error: %1").arg(describe(path, error)));

    switch (error.kind) {
    case FileErrorKind::AccessDenied: {
        QMutexLocker locker(&m_mutex);
        ++m_summary.permissionErrors;
        locker.unlock();
        qWarning() << "Access denied:" << path;
        return makeAction(RecoveryActionType::RetryWithElevation,
                          QString("Access denied to '%1'").arg(path),
                          "Check the permissions of the file or folder, or run with elevated privileges. The item is skipped for now.",
                          false, milliseconds(0));
    }

    case FileErrorKind::NotFound:
        if (error.directory) {
            return makeAction(RecoveryActionType::Skip,
                              QString("Directory not found: '%1'").arg(path),
                              "The directory may have been moved or deleted during the scan.",
                              false, milliseconds(0));
        }
        return makeAction(RecoveryActionType::Skip,
                          QString("File not found: '%1'").arg(path),
                          "The file may have been moved or deleted during the scan.",
                          false, milliseconds(0));

    case FileErrorKind::Locked:
        return makeAction(RecoveryActionType::Retry,
                          QString("File is locked: '%1'").arg(path),
                          "Another process is using the file. Retrying shortly.",
                          true, LOCKED_RETRY_DELAY);

    case FileErrorKind::PathTooLong:
        return makeAction(RecoveryActionType::Skip,
                          QString("Path too long: '%1'").arg(path),
                          "Shorten the folder structure or move the files closer to the root.",
                          false, milliseconds(0));

    case FileErrorKind::NetworkUnreachable:
        return handleNetworkError(path, error);

    case FileErrorKind::Io:
        if (isNetworkPath(path)) {
            return handleNetworkError(path, error);
        }
        break;

    case FileErrorKind::ResourceConstrained:
        return handleResourceConstraintError(error.resource, describe(path, error));

    case FileErrorKind::None:
    case FileErrorKind::Unknown:
        break;
    }

    return makeAction(RecoveryActionType::Skip,
                      QString("Unexpected error accessing '%1': %2").arg(path, error.message),
                      "The item is skipped.",
                      false, milliseconds(0));
}

RecoveryAction ErrorRecoveryPolicy::handleNetworkError(const QString &path, const FileSystemError &error)
{
    {
        QMutexLocker locker(&m_mutex);
        ++m_summary.networkErrors;
    }
    recordError(QString("Network error: %1").arg(describe(path, error)));

    if (isNetworkPath(path) && !isNetworkPathReachable(path)) {
        qWarning() << "Network location unreachable:" << path;
        return makeAction(RecoveryActionType::PauseAndWait,
                          QString("Network location unreachable: '%1'").arg(path),
                          "Check the network connection. The operation will pause and retry.",
                          true, NETWORK_PAUSE_DELAY);
    }

    return makeAction(RecoveryActionType::Retry,
                      QString("Network I/O error: '%1'").arg(path),
                      "Temporary network problem. Retrying shortly.",
                      true, NETWORK_RETRY_DELAY);
}

RecoveryAction ErrorRecoveryPolicy::handleResourceConstraintError(ResourceConstraintType type, const QString &detail)
{
    {
        QMutexLocker locker(&m_mutex);
        ++m_summary.resourceErrors;
    }
    recordError(QString("Resource constraint: %1").arg(detail));

    switch (type) {
    case ResourceConstraintType::Memory: {
        std::function<void()> relief;
        milliseconds delay;
        {
            QMutexLocker locker(&m_mutex);
            relief = m_memoryReliefHandler;
            delay = m_memoryReliefDelay;
        }
        if (relief) {
            relief();
        }
        if (delay.count() > 0) {
            QThread::msleep(static_cast<unsigned long>(delay.count()));
        }
        return makeAction(RecoveryActionType::ReduceParallelism,
                          "Low memory",
                          "Reducing parallel work to lower memory use.",
                          true, MEMORY_RETRY_DELAY);
    }

    case ResourceConstraintType::DiskSpace:
        qWarning() << "Insufficient disk space, aborting:" << detail;
        return makeAction(RecoveryActionType::Abort,
                          "Insufficient disk space",
                          "Free up disk space and run the analysis again.",
                          false, milliseconds(0));

    case ResourceConstraintType::FileHandles:
        return makeAction(RecoveryActionType::ReduceParallelism,
                          "Too many open files",
                          "Reducing parallel work to release file handles.",
                          true, THROTTLE_RETRY_DELAY);

    case ResourceConstraintType::CpuUsage:
        return makeAction(RecoveryActionType::ReduceParallelism,
                          "High CPU usage",
                          "Reducing parallel work to lower CPU load.",
                          true, THROTTLE_RETRY_DELAY);

    case ResourceConstraintType::NetworkBandwidth:
        return makeAction(RecoveryActionType::PauseAndWait,
                          "Network bandwidth exhausted",
                          "Pausing to let network traffic settle.",
                          true, BANDWIDTH_PAUSE_DELAY);
    }

    return makeAction(RecoveryActionType::ReduceParallelism,
                      "Resource constraint",
                      "Reducing parallel work.",
                      true, MEMORY_RETRY_DELAY);
}

// === Accumulator ===

void ErrorRecoveryPolicy::logSkippedItem(const QString &path, const QString &reason)
{
    QMutexLocker locker(&m_mutex);
    ++m_summary.skippedFiles;
    m_summary.skippedPaths.append(path);
    m_summary.errorMessages.append(timestamped(QString("Skipped: %1 - %2").arg(path, reason)));
    m_summary.lastErrorTime = QDateTime::currentDateTime();
    locker.unlock();

    qDebug() << "Skipped:" << path << "-" << reason;
}

ErrorSummary ErrorRecoveryPolicy::summary() const
{
    QMutexLocker locker(&m_mutex);
    return m_summary;
}

void ErrorRecoveryPolicy::clearSummary()
{
    QMutexLocker locker(&m_mutex);
    m_summary = ErrorSummary();
}

// === Configuration ===

void ErrorRecoveryPolicy::setMemoryReliefHandler(std::function<void()> handler)
{
    QMutexLocker locker(&m_mutex);
    m_memoryReliefHandler = std::move(handler);
}

void ErrorRecoveryPolicy::setMemoryReliefDelay(std::chrono::milliseconds delay)
{
    QMutexLocker locker(&m_mutex);
    m_memoryReliefDelay = delay;
}

void ErrorRecoveryPolicy::setNetworkProbeTimeout(std::chrono::milliseconds timeout)
{
    QMutexLocker locker(&m_mutex);
    m_networkProbeTimeout = timeout;
}

std::chrono::milliseconds ErrorRecoveryPolicy::networkProbeTimeout() const
{
    QMutexLocker locker(&m_mutex);
    return m_networkProbeTimeout;
}

bool ErrorRecoveryPolicy::isUncPath(const QString &path)
{
    return path.startsWith(QLatin1String("\\\\")) || path.startsWith(QLatin1String("//"));
}

// === Network Probes ===

bool ErrorRecoveryPolicy::isNetworkPath(const QString &path) const
{
    if (path.isEmpty()) {
        return false;
    }
    if (isUncPath(path)) {
        return true;
    }

    // QStorageInfo needs an existing path; walk up until one is found
    QString probe = path;
    while (!probe.isEmpty() && !QFileInfo::exists(probe)) {
        const QString parent = PathUtils::parentFolder(probe);
        if (parent == probe) {
            break;
        }
        probe = parent;
    }
    if (probe.isEmpty()) {
        return false;
    }

    const QStorageInfo storage(probe);
    if (!storage.isValid()) {
        return false;
    }
    return NETWORK_FILESYSTEM_TYPES.contains(QString::fromLatin1(storage.fileSystemType()).toLower());
}

bool ErrorRecoveryPolicy::isNetworkPathReachable(const QString &path) const
{
    if (isUncPath(path)) {
        const QString server = path.mid(2).section(QRegularExpression("[/\\\\]"), 0, 0);
        if (server.isEmpty()) {
            return false;
        }

        QTcpSocket socket;
        socket.connectToHost(server, SMB_PORT);
        const bool connected = socket.waitForConnected(static_cast<int>(networkProbeTimeout().count()));
        if (connected) {
            socket.disconnectFromHost();
        } else {
            qDebug() << "Network probe failed for" << server << ":" << socket.errorString();
        }
        return connected;
    }

    return QFileInfo(path).absoluteDir().exists();
}

// === Private Helpers ===

void ErrorRecoveryPolicy::recordError(const QString &message)
{
    QMutexLocker locker(&m_mutex);
    m_summary.errorMessages.append(timestamped(message));
    m_summary.lastErrorTime = QDateTime::currentDateTime();
}

RecoveryAction ErrorRecoveryPolicy::makeAction(RecoveryActionType type, const QString &message,
                                               const QString &suggestedSolution, bool shouldRetry,
                                               std::chrono::milliseconds retryDelay)
{
    RecoveryAction action;
    action.type = type;
    action.message = message;
    action.suggestedSolution = suggestedSolution;
    action.shouldRetry = shouldRetry;
    action.retryDelay = retryDelay;
    return action;
}
