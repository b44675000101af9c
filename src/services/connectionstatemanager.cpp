#include "connectionstatemanager.h"

#include "models/offlinequeue.h"
#include "utils/logging.h"

ConnectionStateManager::ConnectionStateManager(ITransHubClient *client,
                                               OfflineQueue *queue,
                                               ChunkedUploadPipeline *pipeline,
                                               QObject *parent)
    : QObject(parent)
    , client_(client)
    , queue_(queue)
    , pipeline_(pipeline)
    , refreshTimer_(new QTimer(this))
{
    status_ = ConnectionStatus::disconnected(tr("Not connected"));
    status_.offlineQueueSize = queue_->count();

    refreshTimer_->setInterval(RefreshIntervalMs);
    connect(refreshTimer_, &QTimer::timeout,
            this, &ConnectionStateManager::refreshStatus);

    connect(queue_, &OfflineQueue::sizeChanged,
            this, &ConnectionStateManager::onQueueSizeChanged);

    connect(pipeline_, &ChunkedUploadPipeline::uploadFinished,
            this, &ConnectionStateManager::onUploadFinished);
    connect(pipeline_, &ChunkedUploadPipeline::uploadFailed,
            this, &ConnectionStateManager::onUploadFailed);
}

ConnectionStateManager::~ConnectionStateManager()
{
    token_.cancel();
}

void ConnectionStateManager::setSettings(ConnectionSettings *settings)
{
    settings_ = settings;
}

void ConnectionStateManager::setStatus(ConnectionStatus status)
{
    // The local queue is the source of truth for the pending count
    status.offlineQueueSize = queue_->count();

    if (status == status_) {
        return;
    }
    status_ = status;
    emit statusChanged(status_);
}

void ConnectionStateManager::appendLog(const QString &event, const QString &details,
                                       LogStatus status)
{
    if (settings_) {
        settings_->appendLog(event, details, status);
    }
}

void ConnectionStateManager::connectToServer(const ServerConfig &config)
{
    if (connecting_) {
        return;
    }

    if (!config.isValid()) {
        const QString message = tr("No Trans-Hub server URL configured");
        setStatus(ConnectionStatus::disconnected(message));
        appendLog(tr("Connection failed"), message, LogStatus::Error);
        emit connectionError(message);
        return;
    }

    token_.cancel();
    token_ = CancellationToken();
    refreshInFlight_ = false;

    config_ = config;
    sessionOpen_ = true;
    connecting_ = true;

    qInfo() << "ConnectionStateManager: connecting to" << config.baseUrl;

    client_->connectToServer(config,
        [this, token = token_](const ConnectionStatus &status) {
            if (token.isCancelled()) {
                return;
            }
            connecting_ = false;
            const bool wasConnected = status_.connected;

            ConnectionStatus result = status;
            if (result.serverUrl.isEmpty()) {
                result.serverUrl = config_.baseUrl;
            }
            setStatus(result);

            if (!result.connected) {
                const QString message = result.message.isEmpty()
                    ? tr("Server refused the connection")
                    : result.message;
                qWarning() << "ConnectionStateManager: connect refused:" << message;
                appendLog(tr("Connection failed"), message, LogStatus::Error);
                emit connectionError(message);
                return;
            }

            qInfo() << "ConnectionStateManager: connected to" << config_.baseUrl;
            if (settings_) {
                settings_->setServerConfig(config_);
            }
            appendLog(tr("Connected"), tr("Connected to %1").arg(config_.baseUrl),
                      LogStatus::Success);
            refreshTimer_->start();

            if (!wasConnected) {
                emit connected();
                if (token.isCancelled()) {
                    return;
                }
            }
            maybeAutoSync();
        },
        [this, token = token_](const RequestError &error) {
            if (token.isCancelled()) {
                return;
            }
            connecting_ = false;
            qWarning() << "ConnectionStateManager: connect failed:" << error.message;
            setStatus(ConnectionStatus::disconnected(error.message));
            appendLog(tr("Connection failed"), error.message, LogStatus::Error);
            emit connectionError(error.message);
        });
}

void ConnectionStateManager::disconnectFromServer()
{
    token_.cancel();
    token_ = CancellationToken();
    refreshTimer_->stop();
    connecting_ = false;
    refreshInFlight_ = false;

    if (syncing_) {
        pipeline_->cancel();
        finishSync(false, tr("Disconnected"));
    }

    const bool wasOpen = sessionOpen_;
    const bool wasConnected = status_.connected;
    sessionOpen_ = false;

    if (wasOpen) {
        client_->disconnectFromServer(
            [] {
                LOG_VERBOSE() << "ConnectionStateManager: backend acknowledged disconnect";
            },
            [](const RequestError &error) {
                qWarning() << "ConnectionStateManager: disconnect request failed:" << error.message;
            });
        appendLog(tr("Disconnected"), tr("Disconnected from server"), LogStatus::Info);
    }

    setStatus(ConnectionStatus::disconnected(tr("Disconnected")));

    if (wasConnected) {
        emit disconnected();
    }
}

void ConnectionStateManager::refreshStatus()
{
    if (refreshInFlight_ || connecting_) {
        return;
    }
    refreshInFlight_ = true;

    client_->fetchStatus(
        [this, token = token_](const ConnectionStatus &status) {
            if (token.isCancelled()) {
                return;
            }
            refreshInFlight_ = false;
            applyRefreshedStatus(status);
        },
        [this, token = token_](const RequestError &error) {
            if (token.isCancelled()) {
                return;
            }
            refreshInFlight_ = false;

            // Older backends have no Trans-Hub endpoints at all
            if (error.kind == RequestError::Kind::NotFound) {
                applyRefreshedStatus(ConnectionStatus::disconnected(
                    tr("Trans-Hub integration not yet implemented"),
                    ConnectionStatus::NotImplemented));
                return;
            }

            qWarning() << "ConnectionStateManager: status query failed:" << error.message;
            applyRefreshedStatus(ConnectionStatus::disconnected(tr("Unable to get status")));
        });
}

void ConnectionStateManager::applyRefreshedStatus(const ConnectionStatus &status)
{
    const CancellationToken token = token_;
    const bool wasConnected = status_.connected;
    setStatus(status);
    if (token.isCancelled()) {
        return;
    }

    if (wasConnected && !status.connected) {
        qInfo() << "ConnectionStateManager: server unreachable:" << status.message;
        appendLog(tr("Connection lost"), status.message, LogStatus::Info);
        emit connectionLost(status.message);
        if (token.isCancelled()) {
            return;
        }
        emit disconnected();
        return;
    }

    if (!wasConnected && status.connected) {
        qInfo() << "ConnectionStateManager: server reachable again";
        emit connected();
        if (token.isCancelled()) {
            return;
        }
    }

    if (status.connected) {
        maybeAutoSync();
    }
}

void ConnectionStateManager::onQueueSizeChanged(int count)
{
    if (status_.offlineQueueSize == count) {
        return;
    }
    status_.offlineQueueSize = count;
    emit statusChanged(status_);
}

void ConnectionStateManager::maybeAutoSync()
{
    if (!config_.autoSync || config_.offlineMode) {
        return;
    }
    if (syncing_ || queue_->isEmpty() || pipeline_->isBusy()) {
        return;
    }
    LOG_VERBOSE() << "ConnectionStateManager: auto-syncing" << queue_->count() << "queued uploads";
    syncOfflineQueue();
}

void ConnectionStateManager::testServer(const QString &serverUrl)
{
    const QString url = serverUrl.isEmpty() ? config_.baseUrl : serverUrl;
    if (url.isEmpty()) {
        emit connectionTested(false, url, tr("No server URL to test"));
        return;
    }

    LOG_VERBOSE() << "ConnectionStateManager: testing" << url;

    QPointer<ConnectionStateManager> self(this);
    client_->testConnection(url, [self](const ConnectionTestResult &result) {
        if (!self) {
            return;
        }
        self->appendLog(QStringLiteral("Connection test"),
                        result.serverUrl + ": " + result.message,
                        result.reachable ? LogStatus::Success : LogStatus::Error);
        emit self->connectionTested(result.reachable, result.serverUrl, result.message);
    });
}

bool ConnectionStateManager::syncOfflineQueue()
{
    if (syncing_) {
        return false;
    }
    if (!status_.connected) {
        qWarning() << "ConnectionStateManager: cannot sync while disconnected";
        return false;
    }
    if (queue_->isEmpty()) {
        emit syncFinished(true, 0);
        return true;
    }
    if (pipeline_->isBusy()) {
        qWarning() << "ConnectionStateManager: cannot sync while another upload is running";
        return false;
    }

    syncing_ = true;
    syncedCount_ = 0;
    qInfo() << "ConnectionStateManager: syncing" << queue_->count() << "queued uploads";

    const CancellationToken token = token_;
    emit syncStarted(queue_->count());
    if (token.isCancelled() || !syncing_) {
        return true;
    }

    drainNext();
    return true;
}

void ConnectionStateManager::drainNext()
{
    const std::optional<UploadTask> head = queue_->head();
    if (!head) {
        finishSync(true);
        return;
    }

    drainingUploadId_ = head->uploadId;
    LOG_VERBOSE() << "ConnectionStateManager: draining" << drainingUploadId_;

    if (!pipeline_->upload(*head, uploadOptions_)) {
        finishSync(false, tr("Upload pipeline unavailable"));
    }
}

void ConnectionStateManager::onUploadFinished(const QString &uploadId, int totalChunks)
{
    Q_UNUSED(totalChunks)
    if (!syncing_ || uploadId != drainingUploadId_) {
        return;
    }

    queue_->removeHead(uploadId);
    syncedCount_++;
    drainNext();
}

void ConnectionStateManager::onUploadFailed(const QString &uploadId, const QString &error)
{
    if (!syncing_ || uploadId != drainingUploadId_) {
        return;
    }
    finishSync(false, error);
}

void ConnectionStateManager::finishSync(bool success, const QString &error)
{
    syncing_ = false;
    drainingUploadId_.clear();
    const int remaining = queue_->count();

    if (success) {
        qInfo() << "ConnectionStateManager: synced" << syncedCount_ << "queued uploads";
        appendLog(tr("Sync completed"),
                  tr("Synced %1 queued uploads").arg(syncedCount_), LogStatus::Success);
        if (settings_) {
            settings_->setLastSync(QDateTime::currentDateTimeUtc());
        }

        // Let the backend flush whatever it buffered on its side
        client_->syncOffline(
            [](int remainingOnServer) {
                LOG_VERBOSE() << "ConnectionStateManager: backend queue now holds"
                              << remainingOnServer << "items";
            },
            [](const RequestError &error) {
                qWarning() << "ConnectionStateManager: backend sync request failed:"
                           << error.message;
            });
    } else {
        qWarning() << "ConnectionStateManager: sync stopped with" << remaining
                   << "uploads queued:" << error;
        appendLog(tr("Sync failed"), error, LogStatus::Error);
    }

    emit syncFinished(success, remaining);
}
