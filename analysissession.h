#ifndef ANALYSISSESSION_H
#define ANALYSISSESSION_H

#include "analysissettings.h"
#include "cachestore.h"
#include "cancellation.h"
#include "datamodels.h"
#include "duplicatefinder.h"
#include "errorrecovery.h"
#include "filedetailbuilder.h"
#include "folderscanner.h"

#include <QMutex>
#include <QObject>
#include <QStringList>

#include <chrono>

class FileSystemProvider;
class ProjectManager;

/**
 * @brief One duplicate-folder analysis over a set of scan roots
 *
 * Owns the cache, recovery policy and analysis components, and drives the
 * scan -> compare -> filter workflow. Long operations block the calling
 * thread; call them from a worker thread when a responsive caller is needed.
 * cancelOperation() and the read accessors may be used from any thread.
 */
class AnalysisSession : public QObject
{
    Q_OBJECT

public:
    explicit AnalysisSession(const FileSystemProvider &fileSystem,
                             const AnalysisSettings &settings = AnalysisSettings(),
                             QObject *parent = nullptr);
    ~AnalysisSession();

    // === Scan Folders ===

    /**
     * @brief Scan a root folder and add it to the session
     *
     * The scan stops after the configured timeout or on cancelOperation().
     * Folders scanned before a stop stay cached, but the root is only added
     * when the scan completes.
     */
    OperationStatus addFolder(const QString &folderPath);

    /**
     * @brief Remove a root and forget everything cached below it
     * @return False if the folder is not a scan root
     */
    bool removeFolder(const QString &folderPath);

    QStringList scanFolders() const;

    // === Comparison ===

    /**
     * @brief Find duplicate folders among all cached folders under the roots
     *
     * Needs at least two cached folders. On success the full result is kept
     * and filtered with the session's default criteria.
     */
    OperationStatus runComparison();

    QList<FolderMatch> allMatches() const;
    QList<FolderMatch> filteredMatches() const;

    /**
     * @brief Re-filter the last comparison result
     * @return The matches that satisfy @p criteria
     */
    QList<FolderMatch> applyFilters(const FilterCriteria &criteria);

    QList<FileDetail> fileDetails(const FolderMatch &match, bool includeUnique) const;

    // === Control ===

    void cancelOperation();
    bool isOperationInProgress() const;

    // === Projects ===

    bool saveProject(const QString &projectPath);

    /**
     * @brief Replace the session state with a saved project
     *
     * Scan roots that no longer exist are dropped with their cache entries.
     */
    bool loadProject(const QString &projectPath);

    QString lastError() const;

    // === Diagnostics ===

    ErrorSummary errorSummary() const;
    void clearErrorSummary();

    CacheStore &cache();
    const CacheStore &cache() const;
    ErrorRecoveryPolicy &errorRecovery();
    const AnalysisSettings &settings() const;

signals:
    void progressChanged(const AnalysisProgress &progress);
    void statusChanged(const QString &message);
    void folderAdded(const QString &folderPath);
    void folderRemoved(const QString &folderPath);
    void comparisonCompleted(int folderMatchCount);
    void projectSaved(const QString &projectPath);
    void projectLoaded(const QString &projectPath);

private:
    bool beginOperation(std::chrono::milliseconds timeout, CancellationSource &operation);
    void endOperation();
    ProgressCallback progressCallback();
    QStringList foldersUnderRoots() const;
    QString overlappingScanRoot(const QString &folderPath) const;
    void setStatus(const QString &message);
    void setError(const QString &message);

    const FileSystemProvider &m_fileSystem;
    AnalysisSettings m_settings;

    ErrorRecoveryPolicy m_errorRecovery;
    CacheStore m_cache;
    FolderScanner m_scanner;
    DuplicateFinder m_finder;
    FileDetailBuilder m_detailBuilder;
    ProjectManager *m_projectManager;

    mutable QMutex m_mutex;
    QStringList m_scanFolders;
    QList<FolderMatch> m_allMatches;
    QList<FolderMatch> m_filteredMatches;
    CancellationSource m_userCancellation;
    bool m_operationInProgress = false;
    QString m_lastError;
};

#endif // ANALYSISSESSION_H
