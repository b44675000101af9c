/**
 * @file mocktranshubclient.h
 * @brief Mock Trans-Hub client for unit testing.
 *
 * This mock implements ITransHubClient and can be injected into the upload
 * pipeline and the connection state manager.
 */

#ifndef MOCKTRANSHUBCLIENT_H
#define MOCKTRANSHUBCLIENT_H

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QQueue>

#include <optional>

#include "services/itranshubclient.h"

/**
 * @brief Mock Trans-Hub client implementing ITransHubClient for testing.
 *
 * Two operating modes:
 * - Manual (default): requests are held until the test resolves them with
 *   the mockAccept/mockRespond/mockFail methods, oldest first.
 * - Automatic: requests are answered from the configured responses on the
 *   next event loop iteration, like a real network reply would be.
 *
 * Chunk failures can be planned per chunk index in either mode.
 *
 * @par Example usage:
 * @code
 * MockTransHubClient *mock = new MockTransHubClient(this);
 * mock->mockSetAutoRespond(true);
 * mock->mockFailChunk(1, 2, "boom");   // chunk 1 fails twice, then succeeds
 *
 * ChunkedUploadPipeline pipeline(mock);
 * pipeline.upload(task, options);
 * QTRY_VERIFY(!pipeline.isBusy());
 * @endcode
 */
class MockTransHubClient : public ITransHubClient
{
    Q_OBJECT

public:
    explicit MockTransHubClient(QObject *parent = nullptr);
    ~MockTransHubClient() override = default;

    /// @name ITransHubClient Implementation
    /// @{
    void connectToServer(const ServerConfig &config,
                         StatusCallback onStatus, ErrorCallback onError) override;
    void disconnectFromServer(DoneCallback onDone, ErrorCallback onError) override;
    void fetchStatus(StatusCallback onStatus, ErrorCallback onError) override;
    void uploadChunk(const QJsonObject &body,
                     DoneCallback onAccepted, ErrorCallback onError) override;
    void syncOffline(SyncCallback onSynced, ErrorCallback onError) override;
    void testConnection(const QString &serverUrl, TestCallback onResult) override;
    /// @}

    /// @name Automatic Mode
    /// @{

    /**
     * @brief Answers every request automatically when enabled.
     */
    void mockSetAutoRespond(bool enabled) { autoRespond_ = enabled; }

    /**
     * @brief Status returned by connect and status requests in automatic mode.
     */
    void mockSetServerStatus(const ConnectionStatus &status) { serverStatus_ = status; }

    /**
     * @brief Makes status requests fail in automatic mode. std::nullopt clears it.
     */
    void mockSetStatusError(const std::optional<RequestError> &error) { statusError_ = error; }

    /**
     * @brief Makes connect requests fail in automatic mode. std::nullopt clears it.
     */
    void mockSetConnectError(const std::optional<RequestError> &error) { connectError_ = error; }

    /**
     * @brief Plans failures for a chunk index.
     * @param chunkIndex 0-based chunk index from the request body.
     * @param times Number of submissions of that chunk that fail.
     * @param message Error message reported.
     */
    void mockFailChunk(int chunkIndex, int times, const QString &message = QStringLiteral("Chunk rejected"));
    /// @}

    /// @name Manual Mode
    /// @{
    bool mockRespondConnect(const ConnectionStatus &status);
    bool mockFailConnect(const RequestError &error);
    bool mockRespondStatus(const ConnectionStatus &status);
    bool mockFailStatus(const RequestError &error);
    bool mockAcceptChunk();
    bool mockFailChunkRequest(const RequestError &error);
    bool mockRespondSync(int remainingQueueSize);
    bool mockFailSync(const RequestError &error);
    /// @}

    /// @name Test Inspection Methods
    /// @{
    [[nodiscard]] QList<ServerConfig> mockConnectRequests() const { return connectRequests_; }
    [[nodiscard]] int mockDisconnectCount() const { return disconnectCount_; }
    [[nodiscard]] int mockStatusRequestCount() const { return statusRequestCount_; }
    [[nodiscard]] QList<QJsonObject> mockChunkRequests() const { return chunkRequests_; }
    [[nodiscard]] int mockSyncRequestCount() const { return syncRequestCount_; }
    [[nodiscard]] QStringList mockTestRequests() const { return testRequests_; }
    [[nodiscard]] int mockPendingChunkCount() const { return pendingChunks_.size(); }
    [[nodiscard]] int mockPendingStatusCount() const { return pendingStatus_.size(); }
    [[nodiscard]] int mockPendingConnectCount() const { return pendingConnects_.size(); }

    /**
     * @brief Returns the chunk indices of all chunk requests, in order.
     */
    [[nodiscard]] QList<int> mockChunkIndices() const;

    /**
     * @brief Returns the upload ids of all chunk requests, in order.
     */
    [[nodiscard]] QStringList mockChunkUploadIds() const;

    void mockReset();
    /// @}

private:
    struct PendingStatus {
        StatusCallback onStatus;
        ErrorCallback onError;
    };
    struct PendingChunk {
        QJsonObject body;
        DoneCallback onAccepted;
        ErrorCallback onError;
    };
    struct PendingSync {
        SyncCallback onSynced;
        ErrorCallback onError;
    };

    [[nodiscard]] std::optional<RequestError> takePlannedChunkFailure(int chunkIndex);

    bool autoRespond_ = false;
    ConnectionStatus serverStatus_;
    std::optional<RequestError> statusError_;
    std::optional<RequestError> connectError_;

    struct PlannedFailure {
        int remaining = 0;
        QString message;
    };
    QHash<int, PlannedFailure> plannedFailures_;

    QQueue<PendingStatus> pendingConnects_;
    QQueue<PendingStatus> pendingStatus_;
    QQueue<PendingChunk> pendingChunks_;
    QQueue<PendingSync> pendingSyncs_;

    QList<ServerConfig> connectRequests_;
    int disconnectCount_ = 0;
    int statusRequestCount_ = 0;
    QList<QJsonObject> chunkRequests_;
    int syncRequestCount_ = 0;
    QStringList testRequests_;
};

#endif // MOCKTRANSHUBCLIENT_H
