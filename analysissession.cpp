#include "analysissession.h"
#include "filesystemprovider.h"
#include "folderaggregator.h"
#include "pathutils.h"
#include "projectmanager.h"

#include <QDebug>
#include <QMutexLocker>

#include <algorithm>

// === Constants ===
namespace {
constexpr int MIN_FOLDERS_TO_COMPARE = 2;
}

// === Constructor & Destructor ===

AnalysisSession::AnalysisSession(const FileSystemProvider &fileSystem,
                                 const AnalysisSettings &settings,
                                 QObject *parent)
    : QObject(parent)
    , m_fileSystem(fileSystem)
    , m_settings(settings)
    , m_cache(fileSystem)
    , m_scanner(m_cache, m_errorRecovery, fileSystem)
    , m_finder(m_cache, m_errorRecovery, fileSystem)
    , m_detailBuilder(fileSystem)
    , m_projectManager(new ProjectManager(this))
{
    qRegisterMetaType<AnalysisProgress>();

    m_scanner.setMaxParallelism(m_settings.maxParallelism);
    m_finder.setMaxParallelism(m_settings.maxParallelism);
    m_errorRecovery.setMemoryReliefDelay(std::chrono::milliseconds(m_settings.memoryReliefDelayMs));
    m_errorRecovery.setNetworkProbeTimeout(std::chrono::milliseconds(m_settings.networkProbeTimeoutMs));

    connect(m_projectManager, &ProjectManager::projectSaved, this, &AnalysisSession::projectSaved);
    connect(m_projectManager, &ProjectManager::projectLoaded, this, &AnalysisSession::projectLoaded);
}

AnalysisSession::~AnalysisSession()
{
    cancelOperation();
}

// === Scan Folders ===

OperationStatus AnalysisSession::addFolder(const QString &folderPath)
{
    if (folderPath.isEmpty()) {
        setError("Folder path cannot be empty");
        return OperationStatus::Failed;
    }
    // Nested roots would share cache entries that removeFolder drops
    const QString overlapping = overlappingScanRoot(folderPath);
    if (!overlapping.isEmpty()) {
        if (PathUtils::normalizedKey(overlapping) == PathUtils::normalizedKey(folderPath)) {
            setError(QString("Folder is already part of the analysis: %1").arg(folderPath));
        } else {
            setError(QString("Folder %1 overlaps %2, which is already part of the analysis").arg(folderPath, overlapping));
        }
        return OperationStatus::Failed;
    }
    if (!m_fileSystem.directoryExists(folderPath)) {
        setError(QString("Directory not found: %1").arg(folderPath));
        return OperationStatus::Failed;
    }

    const std::chrono::minutes timeout(m_settings.scanTimeoutMinutes);
    CancellationSource operation;
    if (!beginOperation(timeout, operation)) {
        return OperationStatus::Failed;
    }

    setStatus(QString("Scanning %1...").arg(folderPath));
    const AnalysisResult<QStringList> result = m_scanner.scanFolderHierarchy(folderPath, progressCallback(), operation.token());
    endOperation();

    switch (result.status) {
    case OperationStatus::Completed: {
        QMutexLocker locker(&m_mutex);
        m_scanFolders.append(folderPath);
        locker.unlock();

        setStatus(QString("Added %1 (%2 folders)").arg(folderPath).arg(result.value.size()));
        emit folderAdded(folderPath);
        break;
    }
    case OperationStatus::Cancelled:
        if (operation.hasTimedOut()) {
            setError(QString("Scan of %1 timed out after %2 minutes").arg(folderPath).arg(m_settings.scanTimeoutMinutes));
        } else {
            setStatus(QString("Scan of %1 cancelled").arg(folderPath));
        }
        break;
    case OperationStatus::Aborted:
    case OperationStatus::Failed:
        setError(result.message);
        break;
    }

    return result.status;
}

bool AnalysisSession::removeFolder(const QString &folderPath)
{
    const QString rootKey = PathUtils::normalizedKey(folderPath);

    QMutexLocker locker(&m_mutex);
    if (m_operationInProgress) {
        locker.unlock();
        setError("Cannot remove a folder while an operation is in progress");
        return false;
    }

    const auto root = std::find_if(m_scanFolders.begin(), m_scanFolders.end(), [&rootKey](const QString &existing) {
        return PathUtils::normalizedKey(existing) == rootKey;
    });
    if (root == m_scanFolders.end()) {
        locker.unlock();
        setError(QString("Folder is not part of the analysis: %1").arg(folderPath));
        return false;
    }
    m_scanFolders.erase(root);

    auto touchesRemovedTree = [&rootKey](const FolderMatch &match) {
        return PathUtils::isSameOrDescendant(PathUtils::normalizedKey(match.leftFolder), rootKey)
            || PathUtils::isSameOrDescendant(PathUtils::normalizedKey(match.rightFolder), rootKey);
    };
    m_allMatches.erase(std::remove_if(m_allMatches.begin(), m_allMatches.end(), touchesRemovedTree), m_allMatches.end());
    m_filteredMatches.erase(std::remove_if(m_filteredMatches.begin(), m_filteredMatches.end(), touchesRemovedTree),
                            m_filteredMatches.end());
    locker.unlock();

    m_cache.removeFolderTree(folderPath);

    setStatus(QString("Removed %1").arg(folderPath));
    emit folderRemoved(folderPath);
    return true;
}

QStringList AnalysisSession::scanFolders() const
{
    QMutexLocker locker(&m_mutex);
    return m_scanFolders;
}

// === Comparison ===

OperationStatus AnalysisSession::runComparison()
{
    QStringList folders = foldersUnderRoots();
    if (folders.size() < MIN_FOLDERS_TO_COMPARE) {
        setError(QString("At least %1 scanned folders are needed to compare").arg(MIN_FOLDERS_TO_COMPARE));
        return OperationStatus::Failed;
    }
    std::sort(folders.begin(), folders.end());

    CancellationSource operation;
    if (!beginOperation(std::chrono::milliseconds(0), operation)) {
        return OperationStatus::Failed;
    }

    setStatus(QString("Comparing %1 folders...").arg(folders.size()));
    const ProgressCallback progress = progressCallback();

    const AnalysisResult<QList<FileMatch>> duplicates = m_finder.findDuplicateFiles(folders, progress, operation.token());
    if (!duplicates.isCompleted()) {
        endOperation();
        if (duplicates.isCancelled()) {
            setStatus("Comparison cancelled");
        } else {
            setError(duplicates.message);
        }
        return duplicates.status;
    }

    const AnalysisResult<QList<FolderMatch>> aggregated =
        FolderAggregator::aggregateFolderMatchesAsync(duplicates.value, m_cache, progress, operation.token()).result();
    endOperation();

    if (!aggregated.isCompleted()) {
        if (aggregated.isCancelled()) {
            setStatus("Comparison cancelled");
        } else {
            setError(aggregated.message);
        }
        return aggregated.status;
    }

    QMutexLocker locker(&m_mutex);
    m_allMatches = aggregated.value;
    m_filteredMatches = FolderAggregator::applyFilters(m_allMatches, m_settings.filterCriteria());
    const int matchCount = m_allMatches.size();
    const int filteredCount = m_filteredMatches.size();
    locker.unlock();

    setStatus(QString("Found %1 folder matches (%2 shown) from %3 duplicate files")
                  .arg(matchCount).arg(filteredCount).arg(duplicates.value.size()));
    emit comparisonCompleted(matchCount);
    return OperationStatus::Completed;
}

QList<FolderMatch> AnalysisSession::allMatches() const
{
    QMutexLocker locker(&m_mutex);
    return m_allMatches;
}

QList<FolderMatch> AnalysisSession::filteredMatches() const
{
    QMutexLocker locker(&m_mutex);
    return m_filteredMatches;
}

QList<FolderMatch> AnalysisSession::applyFilters(const FilterCriteria &criteria)
{
    QMutexLocker locker(&m_mutex);
    m_filteredMatches = FolderAggregator::applyFilters(m_allMatches, criteria);
    return m_filteredMatches;
}

QList<FileDetail> AnalysisSession::fileDetails(const FolderMatch &match, bool includeUnique) const
{
    const QList<FileDetail> details = m_detailBuilder.build(match.leftFolder, match.rightFolder, match.duplicateFiles, m_cache);
    return FileDetailBuilder::filter(details, includeUnique);
}

// === Control ===

void AnalysisSession::cancelOperation()
{
    QMutexLocker locker(&m_mutex);
    if (m_operationInProgress) {
        qDebug() << "Cancellation requested";
        m_userCancellation.cancel();
    }
}

bool AnalysisSession::isOperationInProgress() const
{
    QMutexLocker locker(&m_mutex);
    return m_operationInProgress;
}

// === Projects ===

bool AnalysisSession::saveProject(const QString &projectPath)
{
    if (isOperationInProgress()) {
        setError("Cannot save while an operation is in progress");
        return false;
    }

    const CacheSnapshot snapshot = m_cache.exportSnapshot(scanFolders());
    if (!m_projectManager->saveProject(projectPath, snapshot)) {
        setError(m_projectManager->lastError());
        return false;
    }

    m_settings.lastProjectPath = projectPath;
    setStatus(QString("Project saved to %1").arg(projectPath));
    return true;
}

bool AnalysisSession::loadProject(const QString &projectPath)
{
    if (isOperationInProgress()) {
        setError("Cannot load while an operation is in progress");
        return false;
    }

    CacheSnapshot snapshot;
    if (!m_projectManager->loadProject(projectPath, snapshot)) {
        setError(m_projectManager->lastError());
        return false;
    }

    m_cache.importSnapshot(snapshot);
    m_errorRecovery.clearSummary();

    QStringList roots;
    for (const QString &root : snapshot.scanFolders) {
        if (m_fileSystem.directoryExists(root)) {
            roots.append(root);
        } else {
            qWarning() << "Dropping missing scan folder from project:" << root;
            m_cache.removeFolderTree(root);
        }
    }

    QMutexLocker locker(&m_mutex);
    m_scanFolders = roots;
    m_allMatches.clear();
    m_filteredMatches.clear();
    locker.unlock();

    m_settings.lastProjectPath = projectPath;
    setStatus(QString("Loaded %1 (%2 scan folders, %3 cached folders)")
                  .arg(projectPath).arg(roots.size()).arg(m_cache.cachedFolderCount()));
    return true;
}

QString AnalysisSession::lastError() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastError;
}

// === Diagnostics ===

ErrorSummary AnalysisSession::errorSummary() const
{
    return m_errorRecovery.summary();
}

void AnalysisSession::clearErrorSummary()
{
    m_errorRecovery.clearSummary();
}

CacheStore &AnalysisSession::cache()
{
    return m_cache;
}

const CacheStore &AnalysisSession::cache() const
{
    return m_cache;
}

ErrorRecoveryPolicy &AnalysisSession::errorRecovery()
{
    return m_errorRecovery;
}

const AnalysisSettings &AnalysisSession::settings() const
{
    return m_settings;
}

// === Private Methods ===

bool AnalysisSession::beginOperation(std::chrono::milliseconds timeout, CancellationSource &operation)
{
    QMutexLocker locker(&m_mutex);
    if (m_operationInProgress) {
        locker.unlock();
        setError("Another operation is already in progress");
        return false;
    }

    m_operationInProgress = true;
    m_userCancellation = CancellationSource();
    operation = CancellationSource({m_userCancellation.token()}, timeout);
    return true;
}

void AnalysisSession::endOperation()
{
    QMutexLocker locker(&m_mutex);
    m_operationInProgress = false;
}

ProgressCallback AnalysisSession::progressCallback()
{
    return [this](const AnalysisProgress &progress) {
        emit progressChanged(progress);
    };
}

QStringList AnalysisSession::foldersUnderRoots() const
{
    QStringList rootKeys;
    for (const QString &root : scanFolders()) {
        rootKeys.append(PathUtils::normalizedKey(root));
    }

    QStringList folders;
    for (const QString &folder : m_cache.cachedFolders()) {
        const QString key = PathUtils::normalizedKey(folder);
        const bool underRoot = std::any_of(rootKeys.cbegin(), rootKeys.cend(), [&key](const QString &rootKey) {
            return PathUtils::isSameOrDescendant(key, rootKey);
        });
        if (underRoot) {
            folders.append(folder);
        }
    }
    return folders;
}

QString AnalysisSession::overlappingScanRoot(const QString &folderPath) const
{
    const QString key = PathUtils::normalizedKey(folderPath);
    QMutexLocker locker(&m_mutex);
    const auto root = std::find_if(m_scanFolders.cbegin(), m_scanFolders.cend(), [&key](const QString &existing) {
        const QString existingKey = PathUtils::normalizedKey(existing);
        return PathUtils::isSameOrDescendant(key, existingKey) || PathUtils::isSameOrDescendant(existingKey, key);
    });
    return root == m_scanFolders.cend() ? QString() : *root;
}

void AnalysisSession::setStatus(const QString &message)
{
    qDebug() << message;
    emit statusChanged(message);
}

void AnalysisSession::setError(const QString &message)
{
    {
        QMutexLocker locker(&m_mutex);
        m_lastError = message;
    }
    qWarning() << message;
    emit statusChanged(message);
}
