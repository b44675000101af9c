#include "scansyncapp.h"

#include "models/offlinequeue.h"
#include "services/connectionsettings.h"
#include "services/connectionstatemanager.h"
#include "services/errorhandler.h"
#include "services/scanapiclient.h"
#include "services/scanprogressmonitor.h"
#include "services/syncservice.h"
#include "services/transhubclient.h"
#include "utils/logging.h"

#include <QTimer>

ScanSyncApp::ScanSyncApp(const AppOptions &options, QObject *parent)
    : QObject(parent)
    , options_(options)
{
    auto *scanApi = new ScanApiClient(this);
    scanApi->setHost(options_.serverHost);

    // Trans-Hub calls go through the same backend, which proxies them
    auto *transHub = new TransHubClient(this);
    transHub->setHost(options_.serverHost);

    setUpServices(scanApi, transHub);
}

ScanSyncApp::ScanSyncApp(const AppOptions &options, IScanApiClient *scanApi,
                         ITransHubClient *transHub, QObject *parent)
    : QObject(parent)
    , options_(options)
{
    setUpServices(scanApi, transHub);
}

ScanSyncApp::~ScanSyncApp() = default;

void ScanSyncApp::setUpServices(IScanApiClient *scanApi, ITransHubClient *transHub)
{
    scanApi_ = scanApi;
    transHub_ = transHub;

    settings_ = new ConnectionSettings(this);
    queue_ = new OfflineQueue(this);
    monitor_ = new ScanProgressMonitor(scanApi_, this);
    pipeline_ = new ChunkedUploadPipeline(transHub_, this);

    connection_ = new ConnectionStateManager(transHub_, queue_, pipeline_, this);
    connection_->setSettings(settings_);
    sync_ = new SyncService(connection_, pipeline_, queue_, this);
    errors_ = new ErrorHandler(this);

    // Scan monitoring
    connect(monitor_, &ScanProgressMonitor::statusChanged,
            this, &ScanSyncApp::onScanStatus);
    connect(monitor_, &ScanProgressMonitor::metricsUpdated,
            this, &ScanSyncApp::onScanMetrics);
    connect(monitor_, &ScanProgressMonitor::scanCompleted,
            this, &ScanSyncApp::onScanCompleted);
    connect(monitor_, &ScanProgressMonitor::scanFailed,
            this, &ScanSyncApp::onScanFailed);
    connect(monitor_, &ScanProgressMonitor::errorOccurred,
            this, &ScanSyncApp::onMonitorError);
    connect(monitor_, &ScanProgressMonitor::resultRetrievalFailed,
            this, [this](const QString &jobId, const QString &error) {
                errors_->handleResultRetrievalFailed(jobId, error);
                finishWhenIdle(ExitCode::ResultUnavailable);
            });

    connect(monitor_, &ScanProgressMonitor::cancelRequestFinished,
            this, [this](const QString &jobId, bool accepted, const QString &error) {
                if (accepted) {
                    qInfo().noquote() << tr("Scan %1 cancelled").arg(jobId);
                } else {
                    qWarning().noquote() << tr("Scan %1 could not be cancelled: %2")
                                                .arg(jobId, error);
                }
                finishWhenIdle(ExitCode::ScanFailed);
            });

    // Connection
    connect(connection_, &ConnectionStateManager::connectionTested,
            this, [this](bool reachable, const QString &serverUrl, const QString &message) {
                if (reachable) {
                    qInfo().noquote() << tr("Trans-Hub %1 is reachable").arg(serverUrl);
                    finish(ExitCode::Success);
                    return;
                }
                errors_->handleConnectionError(tr("%1: %2").arg(serverUrl, message));
                finish(ExitCode::ConnectionFailed);
            });
    connect(connection_, &ConnectionStateManager::connected,
            this, &ScanSyncApp::onConnected);
    connect(connection_, &ConnectionStateManager::connectionError,
            this, &ScanSyncApp::onConnectionError);
    connect(connection_, &ConnectionStateManager::connectionLost,
            errors_, &ErrorHandler::handleConnectionLost);
    connect(connection_, &ConnectionStateManager::syncStarted,
            this, [](int queueSize) {
                qInfo().noquote() << tr("Syncing %1 queued uploads").arg(queueSize);
            });
    connect(connection_, &ConnectionStateManager::syncFinished,
            this, &ScanSyncApp::onSyncFinished);

    // Uploads, both fresh ones and queue drains
    connect(pipeline_, &ChunkedUploadPipeline::progressChanged,
            this, &ScanSyncApp::onUploadProgress);
    connect(sync_, &SyncService::statusMessage,
            this, [](const QString &message, int) {
                qInfo().noquote() << message;
            });
    connect(sync_, &SyncService::uploadCompleted,
            this, [this](const QString &, int) {
                // Pick up older queued uploads while the server is reachable
                if (connection_->isConnected() && !queue_->isEmpty()
                    && connection_->serverConfig().autoSync) {
                    QTimer::singleShot(0, this, [this]() {
                        connection_->syncOfflineQueue();
                        finishWhenIdle(ExitCode::Success);
                    });
                    return;
                }
                finishWhenIdle(ExitCode::Success);
            });
    connect(sync_, &SyncService::uploadFailed,
            this, [this](const QString &uploadId, const QString &error) {
                errors_->handleUploadFailed(uploadId, error, [this]() {
                    connection_->syncOfflineQueue();
                });
                finishWhenIdle(ExitCode::UploadFailed);
            });
}

ServerConfig ScanSyncApp::effectiveServerConfig() const
{
    ServerConfig config = settings_->serverConfig();
    if (!options_.transHubUrl.isEmpty()) {
        config.baseUrl = options_.transHubUrl;
    }
    if (!options_.apiKey.isEmpty()) {
        config.apiKey = options_.apiKey;
    }
    if (options_.offline) {
        config.offlineMode = true;
    }
    config.autoSync = config.autoSync && settings_->syncSettings().autoSync;
    return config;
}

UploadOptions ScanSyncApp::effectiveUploadOptions() const
{
    UploadOptions options = settings_->syncSettings().toUploadOptions();
    if (options_.chunkSize) {
        options.chunkSize = *options_.chunkSize;
    }
    if (options_.maxRetries) {
        options.maxRetries = *options_.maxRetries;
    }
    if (options_.retryDelayMs) {
        options.retryDelayMs = *options_.retryDelayMs;
    }
    return options;
}

bool ScanSyncApp::start()
{
    if (options_.checkConnection) {
        const ServerConfig config = effectiveServerConfig();
        if (config.baseUrl.isEmpty()) {
            qCritical().noquote() << tr("--check needs --transhub-url or a saved server");
            return false;
        }
        connection_->testServer(config.baseUrl);
        return true;
    }

    if (!options_.syncOnly && options_.directory.isEmpty() && options_.jobId.isEmpty()) {
        qCritical().noquote() << tr("Either --directory, --job, --sync-only or --check is required");
        return false;
    }

    uploadOptions_ = effectiveUploadOptions();
    if (!uploadOptions_.isValid()) {
        qCritical().noquote() << tr("Invalid upload tuning: chunk size %1, retries %2, delay %3 ms")
                                     .arg(uploadOptions_.chunkSize)
                                     .arg(uploadOptions_.maxRetries)
                                     .arg(uploadOptions_.retryDelayMs);
        return false;
    }
    connection_->setUploadOptions(uploadOptions_);

    const ServerConfig config = effectiveServerConfig();
    const bool connectNow = config.isValid() && !config.offlineMode
        && (!options_.transHubUrl.isEmpty() || options_.syncOnly
            || settings_->syncSettings().syncOnStartup);

    LOG_VERBOSE() << "ScanSyncApp: backend" << options_.serverHost
                  << "Trans-Hub" << config.baseUrl
                  << "offline" << config.offlineMode
                  << "queued" << queue_->count();

    if (connectNow) {
        connectionSettled_ = false;
        connection_->connectToServer(config);
    } else if (options_.syncOnly) {
        errors_->handleError(ErrorCategory::Validation, ErrorSeverity::Critical,
                             tr("Cannot sync the offline queue"),
                             config.offlineMode ? tr("Offline mode is enabled")
                                                : tr("No Trans-Hub server configured"));
        QTimer::singleShot(0, this, [this]() { finish(ExitCode::ConnectionFailed); });
        return true;
    }

    if (!options_.syncOnly) {
        startScan();
    }
    return true;
}

void ScanSyncApp::startScan()
{
    monitor_->setPollingInterval(options_.pollingIntervalMs);
    monitor_->setMaxDuration(options_.timeoutMs);

    if (!options_.jobId.isEmpty()) {
        qInfo().noquote() << tr("Monitoring scan %1").arg(options_.jobId);
        monitor_->startPolling(options_.jobId);
        return;
    }

    qInfo().noquote() << tr("Starting %1 scan of %2")
                             .arg(options_.incremental ? tr("incremental") : tr("full"),
                                  options_.directory);

    scanApi_->startScan(options_.directory, options_.incremental,
        [this](const QString &jobId) {
            qInfo().noquote() << tr("Scan started, job %1").arg(jobId);
            startedJobId_ = jobId;
            monitor_->startPolling(jobId);
        },
        [this](const RequestError &error) {
            errors_->handleError(ErrorCategory::Scan, ErrorSeverity::Critical,
                                 tr("Could not start scan"), error.message);
            finishWhenIdle(ExitCode::ScanFailed);
        });
}

void ScanSyncApp::onConnected()
{
    connectionSettled_ = true;
    qInfo().noquote() << tr("Connected to Trans-Hub at %1").arg(connection_->serverConfig().baseUrl);

    if (options_.syncOnly) {
        if (!connection_->isSyncing() && !connection_->syncOfflineQueue()) {
            finish(ExitCode::UploadFailed);
        }
        return;
    }
    submitPendingTask();
}

void ScanSyncApp::onConnectionError(const QString &message)
{
    connectionSettled_ = true;
    errors_->handleConnectionError(message);

    if (options_.syncOnly) {
        finish(ExitCode::ConnectionFailed);
        return;
    }
    // Queued instead of uploaded from here on
    submitPendingTask();
}

void ScanSyncApp::onSyncFinished(bool success, int remainingQueueSize)
{
    if (success) {
        qInfo().noquote() << tr("Offline queue synced");
    } else {
        qWarning().noquote() << tr("Offline queue sync stopped, %1 uploads still queued")
                                    .arg(remainingQueueSize);
    }

    if (options_.syncOnly) {
        finish(success ? ExitCode::Success : ExitCode::UploadFailed);
        return;
    }
    if (pendingExit_) {
        finish(*pendingExit_);
    }
}

void ScanSyncApp::onScanStatus(const JobStatus &status)
{
    QString line = QString("[%1%] %2 %3/%4")
        .arg(status.progressPercent, 5, 'f', 1)
        .arg(QString::fromLatin1(jobStateToString(status.state)))
        .arg(status.processedCount)
        .arg(status.totalCount);
    if (!status.currentItemLabel.isEmpty()) {
        line += QString("  %1").arg(status.currentItemLabel);
    }
    qInfo().noquote() << line;
}

void ScanSyncApp::onScanMetrics(const ProgressMetrics &metrics)
{
    LOG_VERBOSE() << "ScanSyncApp: speed"
                  << (metrics.itemsPerSecond ? QString::number(*metrics.itemsPerSecond, 'f', 1)
                                             : QString("unknown"))
                  << "items/s, eta"
                  << (metrics.etaMs ? QString::number(*metrics.etaMs / 1000) + " s"
                                    : QString("unknown"))
                  << ", next poll in" << metrics.nextIntervalMs << "ms";
}

void ScanSyncApp::onScanCompleted(const QString &jobId, const ScanResult &result)
{
    qInfo().noquote() << tr("Scan %1 completed: %2 mods, %3 language files, %4 keys")
                             .arg(jobId)
                             .arg(result.statistics.totalMods)
                             .arg(result.statistics.totalLanguageFiles)
                             .arg(result.statistics.totalKeys);

    if (options_.noUpload) {
        finishWhenIdle(ExitCode::Success);
        return;
    }

    UploadTask task = UploadTask::fromScanResult(options_.projectId, result);
    if (task.isEmpty()) {
        qInfo().noquote() << tr("Scan produced no translation entries, nothing to upload");
        finishWhenIdle(ExitCode::Success);
        return;
    }

    qInfo().noquote() << tr("Prepared upload %1: %2 groups, %3 entries")
                             .arg(task.uploadId)
                             .arg(task.entries.size())
                             .arg(task.itemCount());
    pendingTask_ = task;
    submitPendingTask();
}

void ScanSyncApp::onScanFailed(const QString &jobId, JobState state, const QString &error)
{
    const QString reason = state == JobState::Cancelled ? tr("Scan was cancelled") : error;

    ErrorHandler::RetryCallback retry;
    if (options_.jobId.isEmpty()) {
        retry = [this]() { startScan(); };
    }
    errors_->handleScanFailed(jobId, reason, retry);
    finishWhenIdle(ExitCode::ScanFailed);
}

void ScanSyncApp::onMonitorError(const QString &jobId, const QString &error)
{
    errors_->handleError(ErrorCategory::Scan, ErrorSeverity::Warning,
                         tr("Monitoring of scan %1 reported an error").arg(jobId), error);

    // Timeouts and unknown jobs end the monitoring
    if (monitor_->isPolling()) {
        return;
    }
    // A scan we started and gave up on would otherwise keep running
    if (!startedJobId_.isEmpty() && jobId == startedJobId_ && monitor_->cancelJob()) {
        return;
    }
    finishWhenIdle(ExitCode::ScanFailed);
}

void ScanSyncApp::onUploadProgress(const UploadProgress &progress)
{
    switch (progress.status) {
    case UploadStatus::Uploading:
        qInfo().noquote() << tr("Uploading chunk %1/%2 (%3%)")
                                 .arg(progress.currentChunk)
                                 .arg(progress.totalChunks)
                                 .arg(progress.percentage, 0, 'f', 0);
        break;
    case UploadStatus::Retrying:
        qWarning().noquote() << tr("Chunk %1/%2 failed, retrying: %3")
                                    .arg(progress.currentChunk)
                                    .arg(progress.totalChunks)
                                    .arg(progress.error);
        break;
    case UploadStatus::Preparing:
    case UploadStatus::Completed:
    case UploadStatus::Failed:
        LOG_VERBOSE() << "ScanSyncApp: upload" << progress.uploadId
                      << uploadStatusToString(progress.status);
        break;
    }
}

void ScanSyncApp::submitPendingTask()
{
    // Wait for the connection attempt so the task is not queued needlessly
    if (!pendingTask_ || !connectionSettled_) {
        return;
    }

    const UploadTask task = *pendingTask_;
    pendingTask_.reset();

    switch (sync_->submit(task, uploadOptions_)) {
    case SyncService::SubmitResult::Uploading:
        break;
    case SyncService::SubmitResult::Queued:
        qInfo().noquote() << tr("%1 uploads waiting in the offline queue").arg(queue_->count());
        finishWhenIdle(ExitCode::Success);
        break;
    case SyncService::SubmitResult::Rejected:
        finishWhenIdle(ExitCode::UploadFailed);
        break;
    }
}

void ScanSyncApp::finishWhenIdle(ExitCode code)
{
    if (connection_->isSyncing()) {
        LOG_VERBOSE() << "ScanSyncApp: waiting for the offline queue sync before exiting";
        pendingExit_ = code;
        return;
    }
    finish(code);
}

void ScanSyncApp::finish(ExitCode code)
{
    if (finished_) {
        return;
    }
    finished_ = true;
    monitor_->stopPolling();
    emit finished(static_cast<int>(code));
}
