#include "analysissession.h"
#include "analysissettings.h"
#include "filesystemprovider.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QLoggingCategory>
#include <QTextStream>

// === Constants ===
namespace {
const QString APPLICATION_NAME = "DupeFolders";
const QString APPLICATION_VERSION = "1.0";
const char *MESSAGE_PATTERN = "%{time hh:mm:ss.zzz} %{type}: %{message}";

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void printMatches(QTextStream &out, const AnalysisSession &session, bool withDetails, bool includeUnique)
{
    const QList<FolderMatch> matches = session.filteredMatches();
    out << "Folder matches: " << matches.size() << " of " << session.allMatches().size() << "\n";

    for (const FolderMatch &match : matches) {
        out << QString::number(match.similarityPercentage, 'f', 1) << "%\t"
            << match.duplicateFiles.size() << " files\t"
            << match.folderSizeBytes << " bytes\t"
            << (match.latestModificationDate.isValid() ? match.latestModificationDate.toString(Qt::ISODate) : QString("-"))
            << "\n  " << match.leftFolder
            << "\n  " << match.rightFolder << "\n";

        if (!withDetails) {
            continue;
        }

        for (const FileDetail &detail : session.fileDetails(match, includeUnique)) {
            out << "    " << (detail.isDuplicate ? "=" : " ") << " "
                << (detail.hasLeftFile() ? detail.leftFileName : QString("-")) << " ("
                << detail.leftSizeBytes << ") | "
                << (detail.hasRightFile() ? detail.rightFileName : QString("-")) << " ("
                << detail.rightSizeBytes << ")\n";
        }
    }
}

void printErrorSummary(QTextStream &out, const ErrorSummary &summary)
{
    if (!summary.hasErrors()) {
        return;
    }

    out << "Skipped items: " << summary.skippedFiles
        << ", permission errors: " << summary.permissionErrors
        << ", network errors: " << summary.networkErrors
        << ", resource errors: " << summary.resourceErrors << "\n";
}
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(APPLICATION_NAME);
    QCoreApplication::setApplicationName(APPLICATION_NAME);
    QCoreApplication::setApplicationVersion(APPLICATION_VERSION);
    qSetMessagePattern(MESSAGE_PATTERN);

    QCommandLineParser parser;
    parser.setApplicationDescription("Find duplicate folders across one or more directory trees.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("roots", "Root folders to scan.", "<root>...");

    const QCommandLineOption projectOption({"p", "project"}, "Load a saved project before scanning.", "dir");
    const QCommandLineOption saveOption({"s", "save"}, "Save the project after the comparison.", "dir");
    const QCommandLineOption similarityOption("min-similarity", "Minimum similarity in percent.", "percent");
    const QCommandLineOption sizeOption("min-size", "Minimum folder size in bytes.", "bytes");
    const QCommandLineOption workersOption({"j", "workers"}, "Number of parallel workers.", "count");
    const QCommandLineOption detailsOption({"d", "details"}, "List the files of every match.");
    const QCommandLineOption uniqueOption("include-unique", "Also list files found in only one folder.");
    const QCommandLineOption verboseOption({"v", "verbose"}, "Print debug output.");
    parser.addOptions({projectOption, saveOption, similarityOption, sizeOption, workersOption,
                       detailsOption, uniqueOption, verboseOption});

    parser.process(app);

    if (!parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    AnalysisSettings settings = AnalysisSettings::loadUserSettings();

    bool valueOk = true;
    if (parser.isSet(similarityOption)) {
        settings.minimumSimilarityPercent = parser.value(similarityOption).toDouble(&valueOk);
    }
    if (valueOk && parser.isSet(sizeOption)) {
        settings.minimumSizeBytes = parser.value(sizeOption).toLongLong(&valueOk);
    }
    if (valueOk && parser.isSet(workersOption)) {
        settings.maxParallelism = parser.value(workersOption).toInt(&valueOk);
    }
    if (!valueOk) {
        qCritical() << "Invalid numeric option value";
        return EXIT_USAGE;
    }

    const QStringList roots = parser.positionalArguments();
    if (roots.isEmpty() && !parser.isSet(projectOption)) {
        parser.showHelp(EXIT_USAGE);
    }

    LocalFileSystem fileSystem;
    AnalysisSession session(fileSystem, settings);

    QTextStream out(stdout);
    QTextStream err(stderr);
    QObject::connect(&session, &AnalysisSession::statusChanged, [&err](const QString &message) {
        err << message << Qt::endl;
    });
    QObject::connect(&session, &AnalysisSession::progressChanged, [](const AnalysisProgress &progress) {
        qDebug().noquote() << phaseName(progress.phase) << progress.current << "/" << progress.maximum
                           << progress.message;
    });

    if (parser.isSet(projectOption) && !session.loadProject(parser.value(projectOption))) {
        return EXIT_FAILED;
    }

    for (const QString &root : roots) {
        if (session.addFolder(root) != OperationStatus::Completed) {
            return EXIT_FAILED;
        }
    }

    if (session.runComparison() != OperationStatus::Completed) {
        printErrorSummary(err, session.errorSummary());
        return EXIT_FAILED;
    }

    printMatches(out, session, parser.isSet(detailsOption), parser.isSet(uniqueOption));
    printErrorSummary(err, session.errorSummary());

    if (parser.isSet(saveOption)) {
        if (!session.saveProject(parser.value(saveOption))) {
            return EXIT_FAILED;
        }
        // Command-line overrides are not persisted
        AnalysisSettings stored = AnalysisSettings::loadUserSettings();
        stored.lastProjectPath = parser.value(saveOption);
        stored.saveUserSettings();
    }

    return EXIT_OK;
}
