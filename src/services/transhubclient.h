/**
 * @file transhubclient.h
 * @brief HTTP client for the backend's Trans-Hub proxy endpoints.
 */

#ifndef TRANSHUBCLIENT_H
#define TRANSHUBCLIENT_H

#include "itranshubclient.h"
#include "restclient.h"

/**
 * @brief Production ITransHubClient.
 *
 * Endpoints (all JSON):
 * - POST /transhub/connect
 * - POST /transhub/disconnect
 * - GET  /transhub/status
 * - POST /transhub/upload-chunk
 * - POST /transhub/sync-offline
 * - GET  /transhub/test-connection?server_url=...
 */
class TransHubClient : public ITransHubClient
{
    Q_OBJECT

public:
    static constexpr int RequestTimeoutMs = 15000;
    /// Chunks can be large and the proxy forwards them synchronously
    static constexpr int UploadTimeoutMs = 60000;
    static constexpr int SyncTimeoutMs = 120000;

    explicit TransHubClient(QObject *parent = nullptr);
    ~TransHubClient() override = default;

    /**
     * @brief Sets the backend base URL, e.g. "http://localhost:18000".
     */
    void setHost(const QString &host) { rest_->setHost(host); }
    [[nodiscard]] QString host() const { return rest_->host(); }

    /**
     * @brief Sets the API key sent with every request.
     */
    void setApiKey(const QString &apiKey) { rest_->setApiKey(apiKey); }

    void connectToServer(const ServerConfig &config,
                         StatusCallback onStatus, ErrorCallback onError) override;
    void disconnectFromServer(DoneCallback onDone, ErrorCallback onError) override;
    void fetchStatus(StatusCallback onStatus, ErrorCallback onError) override;
    void uploadChunk(const QJsonObject &body,
                     DoneCallback onAccepted, ErrorCallback onError) override;
    void syncOffline(SyncCallback onSynced, ErrorCallback onError) override;
    void testConnection(const QString &serverUrl, TestCallback onResult) override;

private:
    RestClient *rest_ = nullptr;
};

#endif // TRANSHUBCLIENT_H
