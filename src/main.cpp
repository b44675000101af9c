#include <QCoreApplication>
#include <QCommandLineParser>
#include "scansyncapp.h"
#include "services/scanprogressmonitor.h"
#include "utils/logging.h"
#include "version.h"

namespace {

bool parsePositiveInt(const QCommandLineParser &parser, const QCommandLineOption &option,
                      int minimum, std::optional<int> &target)
{
    if (!parser.isSet(option)) {
        return true;
    }
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok || value < minimum) {
        qCritical().noquote() << QString("Invalid value for --%1: %2")
                                     .arg(option.names().last(), parser.value(option));
        return false;
    }
    target = value;
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("scansync");
    app.setApplicationVersion(SCANSYNC_VERSION);
    app.setOrganizationName("scansync");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Monitors a mod scan and uploads its translation entries to Trans-Hub");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption serverOption(
        QStringList() << "s" << "server",
        "Scan backend host (default localhost:18000)", "host", "localhost:18000");
    QCommandLineOption directoryOption(
        QStringList() << "d" << "directory",
        "Directory to scan", "path");
    QCommandLineOption incrementalOption(
        QStringList() << "i" << "incremental",
        "Only rescan files changed since the last scan");
    QCommandLineOption jobOption(
        QStringList() << "j" << "job",
        "Monitor an already running scan job instead of starting one", "id");
    QCommandLineOption projectOption(
        QStringList() << "p" << "project",
        "Trans-Hub project id for the upload", "id", "default");
    QCommandLineOption transHubOption(
        "transhub-url",
        "Trans-Hub server URL (default: the saved one)", "url");
    QCommandLineOption apiKeyOption(
        "api-key",
        "Trans-Hub API key (default: the saved one)", "key");
    QCommandLineOption offlineOption(
        "offline",
        "Queue the upload instead of sending it");
    QCommandLineOption syncOnlyOption(
        "sync-only",
        "Upload the offline queue and exit");
    QCommandLineOption checkOption(
        "check",
        "Test whether the Trans-Hub server is reachable and exit");
    QCommandLineOption noUploadOption(
        "no-upload",
        "Monitor the scan without uploading its result");
    QCommandLineOption intervalOption(
        "interval",
        "Base polling interval in milliseconds", "ms");
    QCommandLineOption timeoutOption(
        "timeout",
        "Give up monitoring after this many seconds", "s");
    QCommandLineOption chunkSizeOption(
        "chunk-size",
        "Translation groups per upload chunk", "n");
    QCommandLineOption maxRetriesOption(
        "max-retries",
        "Submissions allowed per chunk", "n");
    QCommandLineOption retryDelayOption(
        "retry-delay",
        "Base retry backoff in milliseconds", "ms");
    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");

    parser.addOptions({serverOption, directoryOption, incrementalOption, jobOption,
                       projectOption, transHubOption, apiKeyOption, offlineOption,
                       syncOnlyOption, checkOption, noUploadOption, intervalOption, timeoutOption,
                       chunkSizeOption, maxRetriesOption, retryDelayOption, verboseOption});

    parser.process(app);

    // Set verbose logging flag
    scansync::verboseLogging = parser.isSet(verboseOption);

    if (scansync::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    AppOptions options;
    options.serverHost = parser.value(serverOption);
    options.directory = parser.value(directoryOption);
    options.incremental = parser.isSet(incrementalOption);
    options.jobId = parser.value(jobOption);
    options.projectId = parser.value(projectOption);
    options.transHubUrl = parser.value(transHubOption);
    options.apiKey = parser.value(apiKeyOption);
    options.offline = parser.isSet(offlineOption);
    options.syncOnly = parser.isSet(syncOnlyOption);
    options.noUpload = parser.isSet(noUploadOption);
    options.checkConnection = parser.isSet(checkOption);

    std::optional<int> interval;
    std::optional<int> timeoutSec;
    if (!parsePositiveInt(parser, intervalOption, 1, interval)
        || !parsePositiveInt(parser, timeoutOption, 1, timeoutSec)
        || !parsePositiveInt(parser, chunkSizeOption, 1, options.chunkSize)
        || !parsePositiveInt(parser, maxRetriesOption, 1, options.maxRetries)
        || !parsePositiveInt(parser, retryDelayOption, 0, options.retryDelayMs)) {
        return static_cast<int>(ExitCode::InvalidArguments);
    }
    options.pollingIntervalMs = interval.value_or(ScanProgressMonitor::DefaultPollingIntervalMs);
    options.timeoutMs = timeoutSec ? static_cast<qint64>(*timeoutSec) * 1000 : 0;

    ScanSyncApp session(options);
    QObject::connect(&session, &ScanSyncApp::finished, &app, &QCoreApplication::exit,
                     Qt::QueuedConnection);

    if (!session.start()) {
        parser.showHelp(static_cast<int>(ExitCode::InvalidArguments));
    }

    return app.exec();
}
