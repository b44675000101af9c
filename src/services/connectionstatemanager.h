/**
 * @file connectionstatemanager.h
 * @brief Trans-Hub connection state, periodic refresh and offline queue draining.
 */

#ifndef CONNECTIONSTATEMANAGER_H
#define CONNECTIONSTATEMANAGER_H

#include <QObject>
#include <QPointer>
#include <QTimer>

#include "services/chunkeduploadpipeline.h"
#include "services/connectionsettings.h"
#include "services/itranshubclient.h"
#include "utils/cancellationtoken.h"

class OfflineQueue;

/**
 * @brief Owns the connection status of the Trans-Hub link.
 *
 * status() always returns a well-formed ConnectionStatus; failures to reach
 * the backend degrade it to disconnected with a message rather than raising
 * errors. Its offlineQueueSize always mirrors the local OfflineQueue.
 *
 * While a session is open (between connectToServer() and
 * disconnectFromServer()) the status is refreshed every RefreshIntervalMs.
 * With autoSync enabled, a non-empty offline queue is drained whenever the
 * server is found reachable.
 *
 * Draining sends queued tasks one at a time, head first, through the shared
 * upload pipeline. A task leaves the queue only after its upload completed;
 * the first failure stops the drain and leaves that task at the head.
 *
 * @par Example usage:
 * @code
 * ConnectionStateManager *manager =
 *     new ConnectionStateManager(transHub, queue, pipeline, this);
 * manager->setSettings(settings);
 * connect(manager, &ConnectionStateManager::statusChanged,
 *         this, &MyClass::onStatus);
 * manager->connectToServer(settings->serverConfig());
 * @endcode
 */
class ConnectionStateManager : public QObject
{
    Q_OBJECT

public:
    /// Interval of the status refresh while a session is open
    static constexpr int RefreshIntervalMs = 30000;

    /**
     * @brief Constructs a connection state manager.
     * @param client Trans-Hub client (not owned).
     * @param queue Offline queue to mirror and drain (not owned).
     * @param pipeline Upload pipeline used for draining (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit ConnectionStateManager(ITransHubClient *client,
                                    OfflineQueue *queue,
                                    ChunkedUploadPipeline *pipeline,
                                    QObject *parent = nullptr);
    ~ConnectionStateManager() override;

    /**
     * @brief Sets where server config and connection history are persisted.
     * @param settings Settings store (not owned), or nullptr to persist nothing.
     */
    void setSettings(ConnectionSettings *settings);

    /**
     * @brief Sets the chunking and retry tuning used when draining.
     */
    void setUploadOptions(const UploadOptions &options) { uploadOptions_ = options; }
    [[nodiscard]] UploadOptions uploadOptions() const { return uploadOptions_; }

    /// @name Connection State
    /// @{
    [[nodiscard]] ConnectionStatus status() const { return status_; }
    [[nodiscard]] bool isConnected() const { return status_.connected; }
    [[nodiscard]] bool isConnecting() const { return connecting_; }
    [[nodiscard]] bool isSyncing() const { return syncing_; }
    [[nodiscard]] bool isSessionOpen() const { return sessionOpen_; }
    [[nodiscard]] bool isRefreshScheduled() const { return refreshTimer_->isActive(); }

    /**
     * @brief Returns the configuration of the current or last session.
     */
    [[nodiscard]] ServerConfig serverConfig() const { return config_; }
    /// @}

public slots:
    /**
     * @brief Connects to a Trans-Hub server.
     *
     * Emits connected() or connectionError(). Ignored while a connect is
     * already in progress.
     */
    void connectToServer(const ServerConfig &config);

    /**
     * @brief Closes the session. Any drain in progress is abandoned.
     */
    void disconnectFromServer();

    /**
     * @brief Queries the current status now.
     */
    void refreshStatus();

    /**
     * @brief Uploads every queued task, oldest first.
     * @return False if not connected or a drain or upload is already running.
     */
    bool syncOfflineQueue();

    /**
     * @brief Checks whether a Trans-Hub URL is reachable, without a session.
     *
     * Emits connectionTested(). An empty @p serverUrl tests the configured one.
     */
    void testServer(const QString &serverUrl = QString());

signals:
    /**
     * @brief Emitted whenever any field of status() changes.
     */
    void statusChanged(const ConnectionStatus &status);

    /**
     * @brief Emitted when the status went from not connected to connected.
     */
    void connected();

    /**
     * @brief Emitted when the status went from connected to not connected.
     */
    void disconnected();

    /**
     * @brief Emitted when a refresh found a connected server unreachable.
     *
     * Followed by disconnected(). The session stays open and later refreshes
     * reconnect silently once the server answers again.
     */
    void connectionLost(const QString &message);

    /**
     * @brief Emitted when a connect attempt failed.
     */
    void connectionError(const QString &message);

    /**
     * @brief Emitted with the outcome of testServer().
     */
    void connectionTested(bool reachable, const QString &serverUrl, const QString &message);

    /**
     * @brief Emitted when a drain starts.
     */
    void syncStarted(int queueSize);

    /**
     * @brief Emitted when a drain ends.
     * @param success True if the queue was emptied.
     * @param remainingQueueSize Tasks still queued.
     */
    void syncFinished(bool success, int remainingQueueSize);

private slots:
    void onQueueSizeChanged(int count);
    void onUploadFinished(const QString &uploadId, int totalChunks);
    void onUploadFailed(const QString &uploadId, const QString &error);

private:
    void setStatus(ConnectionStatus status);
    void applyRefreshedStatus(const ConnectionStatus &status);
    void maybeAutoSync();
    void drainNext();
    void finishSync(bool success, const QString &error = QString());
    void appendLog(const QString &event, const QString &details, LogStatus status);

    ITransHubClient *client_ = nullptr;
    OfflineQueue *queue_ = nullptr;
    ChunkedUploadPipeline *pipeline_ = nullptr;
    QPointer<ConnectionSettings> settings_;
    QTimer *refreshTimer_ = nullptr;

    ServerConfig config_;
    ConnectionStatus status_;
    UploadOptions uploadOptions_;
    CancellationToken token_;

    bool sessionOpen_ = false;
    bool connecting_ = false;
    bool refreshInFlight_ = false;

    // Draining
    bool syncing_ = false;
    QString drainingUploadId_;
    int syncedCount_ = 0;
};

#endif // CONNECTIONSTATEMANAGER_H
