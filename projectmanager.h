#ifndef PROJECTMANAGER_H
#define PROJECTMANAGER_H

#include "datamodels.h"

#include <QObject>
#include <QSqlDatabase>
#include <QString>

/**
 * @brief Saves and loads analysis projects
 *
 * A project is a directory holding:
 * - project.json with the project name, application name, version and creation date
 * - catalog.db, an SQLite database with scan roots, folder contents and file hashes
 *
 * File metadata is not stored; it is rebuilt from disk when the snapshot is
 * imported into a cache.
 */
class ProjectManager : public QObject
{
    Q_OBJECT

public:
    explicit ProjectManager(QObject *parent = nullptr);
    ~ProjectManager();

    // === Project Operations ===

    /**
     * @brief Write a snapshot to a project directory
     * @param projectPath Directory to write; created when missing, existing catalog replaced
     * @param snapshot Cache contents and scan roots
     * @return True if the project was written completely
     */
    bool saveProject(const QString &projectPath, const CacheSnapshot &snapshot);

    /**
     * @brief Read a snapshot from a project directory
     * @param projectPath Directory containing project.json and catalog.db
     * @param snapshot Receives the stored data; untouched on failure
     * @return True if the project was read completely
     */
    bool loadProject(const QString &projectPath, CacheSnapshot &snapshot);

    /**
     * @brief Check that a directory contains both project files
     */
    static bool isValidProject(const QString &projectPath);

    QString lastError() const;

signals:
    void projectSaved(const QString &projectPath);
    void projectLoaded(const QString &projectPath);

private:
    // Database operations
    bool openDatabase(const QString &projectPath);
    void closeDatabase();
    bool createTables();
    bool createIndices();

    // Snapshot transfer
    bool writeSnapshot(const CacheSnapshot &snapshot);
    bool readSnapshot(CacheSnapshot &snapshot);

    // Project metadata
    bool saveProjectMetadata(const QString &projectPath, const CacheSnapshot &snapshot);
    bool loadProjectMetadata(const QString &projectPath, CacheSnapshot &snapshot);

    bool fail(const QString &message);

    QSqlDatabase m_database;
    QString m_connectionName;
    QString m_lastError;
};

#endif // PROJECTMANAGER_H
