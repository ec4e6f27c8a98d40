#include "projectmanager.h"

#include <QAtomicInt>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSqlError>
#include <QSqlQuery>

// === Constants ===
namespace {
const QString DB_CONNECTION_NAME = "project_db";
const QString DB_FILENAME = "catalog.db";
const QString DB_TEMP_FILENAME = "catalog.db.tmp";
const QString PROJECT_FILENAME = "project.json";
const QString PROJECT_VERSION = "1.0";
const int SUPPORTED_MAJOR_VERSION = 1;

// Each manager owns its own named SQLite connection
QAtomicInt nextConnectionId = 0;

// Database table names
const QString TABLE_SCAN_FOLDERS = "scan_folders";
const QString TABLE_FOLDERS = "folders";
const QString TABLE_FOLDER_FILES = "folder_files";
const QString TABLE_FILE_HASHES = "file_hashes";

QVariant dateToVariant(const QDateTime &date)
{
    if (!date.isValid()) {
        return QVariant(QMetaType::fromType<qint64>());
    }
    return QVariant(date.toMSecsSinceEpoch());
}

QDateTime variantToDate(const QVariant &value)
{
    if (value.isNull()) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(value.toLongLong());
}
}

// === Constructor & Destructor ===

ProjectManager::ProjectManager(QObject *parent)
    : QObject(parent)
    , m_connectionName(QString("%1_%2").arg(DB_CONNECTION_NAME).arg(nextConnectionId.fetchAndAddRelaxed(1) + 1))
{
}

ProjectManager::~ProjectManager()
{
    closeDatabase();
}

// === Project Operations ===

bool ProjectManager::saveProject(const QString &projectPath, const CacheSnapshot &snapshot)
{
    m_lastError.clear();

    if (projectPath.isEmpty()) {
        return fail("Project path cannot be empty");
    }

    QDir projectDir;
    if (!projectDir.mkpath(projectPath)) {
        return fail(QString("Failed to create project directory: %1").arg(projectPath));
    }

    // A failed save leaves the previous catalog in place
    const QString tempPath = projectPath + "/" + DB_TEMP_FILENAME;
    const QString dbPath = projectPath + "/" + DB_FILENAME;
    if (QFile::exists(tempPath) && !QFile::remove(tempPath)) {
        return fail(QString("Failed to remove stale catalog: %1").arg(tempPath));
    }

    if (!openDatabase(tempPath)) {
        return false;
    }

    const bool written = createTables() && createIndices() && writeSnapshot(snapshot);
    closeDatabase();

    if (!written) {
        if (!QFile::remove(tempPath)) {
            qWarning() << "Failed to remove incomplete catalog:" << tempPath;
        }
        return false;
    }

    if (QFile::exists(dbPath) && !QFile::remove(dbPath)) {
        return fail(QString("Failed to replace catalog: %1").arg(dbPath));
    }
    if (!QFile::rename(tempPath, dbPath)) {
        return fail(QString("Failed to move catalog into place: %1").arg(dbPath));
    }

    if (!saveProjectMetadata(projectPath, snapshot)) {
        return false;
    }

    qDebug() << "Saved project" << projectPath << "-" << snapshot.folderInfo.size() << "folders,"
             << snapshot.fileHashes.size() << "hashes";
    emit projectSaved(projectPath);
    return true;
}

bool ProjectManager::loadProject(const QString &projectPath, CacheSnapshot &snapshot)
{
    m_lastError.clear();

    if (!isValidProject(projectPath)) {
        return fail(QString("Project files not found in: %1").arg(projectPath));
    }

    CacheSnapshot loaded;
    if (!loadProjectMetadata(projectPath, loaded)) {
        return false;
    }

    if (!openDatabase(projectPath + "/" + DB_FILENAME)) {
        return false;
    }

    const bool read = readSnapshot(loaded);
    closeDatabase();

    if (!read) {
        return false;
    }

    snapshot = loaded;
    qDebug() << "Loaded project" << projectPath << "-" << snapshot.scanFolders.size() << "scan folders,"
             << snapshot.folderInfo.size() << "folders";
    emit projectLoaded(projectPath);
    return true;
}

bool ProjectManager::isValidProject(const QString &projectPath)
{
    if (projectPath.isEmpty()) {
        return false;
    }
    return QFile::exists(projectPath + "/" + DB_FILENAME) && QFile::exists(projectPath + "/" + PROJECT_FILENAME);
}

QString ProjectManager::lastError() const
{
    return m_lastError;
}

// === Private Methods - Database Operations ===

bool ProjectManager::openDatabase(const QString &databasePath)
{
    closeDatabase();

    m_database = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_database.setDatabaseName(databasePath);

    if (!m_database.open()) {
        const QString error = m_database.lastError().text();
        closeDatabase();
        return fail(QString("Failed to open database: %1").arg(error));
    }

    return true;
}

void ProjectManager::closeDatabase()
{
    if (!m_database.isValid()) {
        return;
    }

    m_database.close();
    m_database = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool ProjectManager::createTables()
{
    QSqlQuery query(m_database);

    const QStringList statements = {
        QString("CREATE TABLE %1 ("
                "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                "folder_path TEXT UNIQUE NOT NULL,"
                "position INTEGER NOT NULL"
                ")").arg(TABLE_SCAN_FOLDERS),
        QString("CREATE TABLE %1 ("
                "folder_path TEXT PRIMARY KEY,"
                "total_size INTEGER NOT NULL,"
                "latest_modification INTEGER"
                ")").arg(TABLE_FOLDERS),
        QString("CREATE TABLE %1 ("
                "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                "folder_path TEXT NOT NULL,"
                "file_path TEXT NOT NULL,"
                "position INTEGER NOT NULL"
                ")").arg(TABLE_FOLDER_FILES),
        QString("CREATE TABLE %1 ("
                "file_path TEXT PRIMARY KEY,"
                "file_hash TEXT NOT NULL"
                ")").arg(TABLE_FILE_HASHES)
    };

    for (const QString &statement : statements) {
        if (!query.exec(statement)) {
            return fail(QString("Failed to create table: %1").arg(query.lastError().text()));
        }
    }
    return true;
}

bool ProjectManager::createIndices()
{
    QSqlQuery query(m_database);
    if (!query.exec(QString("CREATE INDEX idx_folder_files_folder ON %1(folder_path, position)").arg(TABLE_FOLDER_FILES))) {
        return fail(QString("Failed to create index: %1").arg(query.lastError().text()));
    }
    return true;
}

// === Private Methods - Snapshot Transfer ===

bool ProjectManager::writeSnapshot(const CacheSnapshot &snapshot)
{
    if (!m_database.transaction()) {
        return fail(QString("Failed to start transaction: %1").arg(m_database.lastError().text()));
    }

    auto rollback = [this](const QSqlQuery &query, const QString &what) {
        const QString error = query.lastError().text();
        if (!m_database.rollback()) {
            qWarning() << "Failed to roll back project save:" << m_database.lastError().text();
        }
        return fail(QString("Failed to save %1: %2").arg(what, error));
    };

    QSqlQuery query(m_database);

    query.prepare(QString("INSERT INTO %1 (folder_path, position) VALUES (?, ?)").arg(TABLE_SCAN_FOLDERS));
    for (int i = 0; i < snapshot.scanFolders.size(); ++i) {
        query.bindValue(0, snapshot.scanFolders.at(i));
        query.bindValue(1, i);
        if (!query.exec()) {
            return rollback(query, "scan folder");
        }
    }

    query.prepare(QString("INSERT INTO %1 (folder_path, total_size, latest_modification) VALUES (?, ?, ?)").arg(TABLE_FOLDERS));
    for (auto it = snapshot.folderInfo.constBegin(); it != snapshot.folderInfo.constEnd(); ++it) {
        query.bindValue(0, it.key());
        query.bindValue(1, it.value().totalSize);
        query.bindValue(2, dateToVariant(it.value().latestModificationDate));
        if (!query.exec()) {
            return rollback(query, "folder");
        }
    }

    query.prepare(QString("INSERT INTO %1 (folder_path, file_path, position) VALUES (?, ?, ?)").arg(TABLE_FOLDER_FILES));
    for (auto it = snapshot.folderInfo.constBegin(); it != snapshot.folderInfo.constEnd(); ++it) {
        const QStringList &files = it.value().files;
        for (int i = 0; i < files.size(); ++i) {
            query.bindValue(0, it.key());
            query.bindValue(1, files.at(i));
            query.bindValue(2, i);
            if (!query.exec()) {
                return rollback(query, "folder file");
            }
        }
    }

    query.prepare(QString("INSERT INTO %1 (file_path, file_hash) VALUES (?, ?)").arg(TABLE_FILE_HASHES));
    for (auto it = snapshot.fileHashes.constBegin(); it != snapshot.fileHashes.constEnd(); ++it) {
        query.bindValue(0, it.key());
        query.bindValue(1, it.value());
        if (!query.exec()) {
            return rollback(query, "file hash");
        }
    }

    if (!m_database.commit()) {
        return fail(QString("Failed to commit project: %1").arg(m_database.lastError().text()));
    }
    return true;
}

bool ProjectManager::readSnapshot(CacheSnapshot &snapshot)
{
    QSqlQuery query(m_database);

    if (!query.exec(QString("SELECT folder_path FROM %1 ORDER BY position").arg(TABLE_SCAN_FOLDERS))) {
        return fail(QString("Failed to read scan folders: %1").arg(query.lastError().text()));
    }
    while (query.next()) {
        snapshot.scanFolders.append(query.value(0).toString());
    }

    if (!query.exec(QString("SELECT folder_path, total_size, latest_modification FROM %1").arg(TABLE_FOLDERS))) {
        return fail(QString("Failed to read folders: %1").arg(query.lastError().text()));
    }
    while (query.next()) {
        FolderInfo info;
        info.totalSize = query.value(1).toLongLong();
        info.latestModificationDate = variantToDate(query.value(2));
        snapshot.folderInfo.insert(query.value(0).toString(), info);
    }

    if (!query.exec(QString("SELECT folder_path, file_path FROM %1 ORDER BY folder_path, position").arg(TABLE_FOLDER_FILES))) {
        return fail(QString("Failed to read folder files: %1").arg(query.lastError().text()));
    }
    while (query.next()) {
        const QString folderPath = query.value(0).toString();
        auto it = snapshot.folderInfo.find(folderPath);
        if (it == snapshot.folderInfo.end()) {
            qWarning() << "Ignoring file of unknown folder:" << folderPath;
            continue;
        }
        it->files.append(query.value(1).toString());
    }

    for (auto it = snapshot.folderInfo.constBegin(); it != snapshot.folderInfo.constEnd(); ++it) {
        snapshot.folderFiles.insert(it.key(), it.value().files);
    }

    if (!query.exec(QString("SELECT file_path, file_hash FROM %1").arg(TABLE_FILE_HASHES))) {
        return fail(QString("Failed to read file hashes: %1").arg(query.lastError().text()));
    }
    while (query.next()) {
        snapshot.fileHashes.insert(query.value(0).toString(), query.value(1).toString());
    }

    return true;
}

// === Private Methods - Project Metadata ===

bool ProjectManager::saveProjectMetadata(const QString &projectPath, const CacheSnapshot &snapshot)
{
    QJsonObject projectInfo;
    projectInfo["name"] = QFileInfo(projectPath).fileName();
    projectInfo["applicationName"] = snapshot.applicationName;
    projectInfo["version"] = snapshot.version.isEmpty() ? PROJECT_VERSION : snapshot.version;
    const QDateTime created = snapshot.createdDate.isValid() ? snapshot.createdDate : QDateTime::currentDateTime();
    projectInfo["created"] = created.toString(Qt::ISODate);

    const QJsonDocument doc(projectInfo);
    QFile projectFile(projectPath + "/" + PROJECT_FILENAME);

    if (!projectFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(QString("Failed to write project file: %1").arg(projectFile.errorString()));
    }

    if (projectFile.write(doc.toJson()) < 0) {
        return fail(QString("Failed to write project file: %1").arg(projectFile.errorString()));
    }
    return true;
}

bool ProjectManager::loadProjectMetadata(const QString &projectPath, CacheSnapshot &snapshot)
{
    QFile file(projectPath + "/" + PROJECT_FILENAME);
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(QString("Failed to open project file: %1").arg(file.errorString()));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(QString("Invalid project file: %1").arg(parseError.errorString()));
    }

    const QJsonObject obj = doc.object();
    snapshot.version = obj["version"].toString(PROJECT_VERSION);
    snapshot.applicationName = obj["applicationName"].toString();
    snapshot.createdDate = QDateTime::fromString(obj["created"].toString(), Qt::ISODate);

    bool versionOk = false;
    const int majorVersion = snapshot.version.section('.', 0, 0).toInt(&versionOk);
    if (!versionOk || majorVersion > SUPPORTED_MAJOR_VERSION) {
        return fail(QString("Unsupported project version: %1").arg(snapshot.version));
    }

    return true;
}

bool ProjectManager::fail(const QString &message)
{
    m_lastError = message;
    qWarning() << message;
    return false;
}
