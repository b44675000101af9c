/**
 * @file itranshubclient.h
 * @brief Interface for Trans-Hub aggregation service clients.
 *
 * The local backend proxies these calls to the configured Trans-Hub server,
 * so the client itself always talks to the backend host.
 */

#ifndef ITRANSHUBCLIENT_H
#define ITRANSHUBCLIENT_H

#include <QJsonObject>
#include <QMetaType>
#include <QObject>
#include <QString>

#include <functional>

#include "services/restclient.h"

/**
 * @brief Connection parameters for a Trans-Hub server.
 */
struct ServerConfig {
    QString baseUrl;           ///< Trans-Hub server URL
    QString apiKey;            ///< Optional API key
    bool offlineMode = false;  ///< Queue everything instead of uploading
    bool autoSync = true;      ///< Drain the offline queue when the server is reachable

    [[nodiscard]] bool isValid() const { return !baseUrl.trimmed().isEmpty(); }

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static ServerConfig fromJson(const QJsonObject &json);

    bool operator==(const ServerConfig &other) const {
        return baseUrl == other.baseUrl && apiKey == other.apiKey &&
               offlineMode == other.offlineMode && autoSync == other.autoSync;
    }
    bool operator!=(const ServerConfig &other) const { return !(*this == other); }
};

/**
 * @brief Connection status as reported by (or degraded from) the backend.
 *
 * Always well formed: failures to obtain a status produce a disconnected
 * status carrying a message instead of an error.
 */
struct ConnectionStatus {
    /// Status string used when the backend has no Trans-Hub endpoints
    static constexpr const char *NotImplemented = "not_implemented";

    bool connected = false;
    QString status = "disconnected";  ///< "connected", "disconnected", "offline", "not_implemented"...
    QString serverUrl;
    int offlineQueueSize = 0;
    QString message;

    [[nodiscard]] static ConnectionStatus fromJson(const QJsonObject &json);

    /**
     * @brief Builds the degraded form used when no status could be obtained.
     */
    [[nodiscard]] static ConnectionStatus disconnected(const QString &message,
                                                       const QString &status = "disconnected");

    bool operator==(const ConnectionStatus &other) const {
        return connected == other.connected && status == other.status &&
               serverUrl == other.serverUrl &&
               offlineQueueSize == other.offlineQueueSize && message == other.message;
    }
    bool operator!=(const ConnectionStatus &other) const { return !(*this == other); }
};

/**
 * @brief Result of probing a Trans-Hub URL before connecting to it.
 */
struct ConnectionTestResult {
    bool reachable = false;
    QString serverUrl;
    QString message;
};

/**
 * @brief Abstract client for the Trans-Hub proxy endpoints.
 *
 * Every call completes through exactly one of its callbacks.
 */
class ITransHubClient : public QObject
{
    Q_OBJECT

public:
    using StatusCallback = std::function<void(const ConnectionStatus &status)>;
    using DoneCallback = std::function<void()>;
    using SyncCallback = std::function<void(int remainingQueueSize)>;
    using TestCallback = std::function<void(const ConnectionTestResult &result)>;
    using ErrorCallback = RestClient::ErrorCallback;

    explicit ITransHubClient(QObject *parent = nullptr) : QObject(parent) {}
    ~ITransHubClient() override = default;

    /**
     * @brief Connects the backend to a Trans-Hub server.
     */
    virtual void connectToServer(const ServerConfig &config,
                                 StatusCallback onStatus, ErrorCallback onError) = 0;

    /**
     * @brief Disconnects the backend from its Trans-Hub server.
     */
    virtual void disconnectFromServer(DoneCallback onDone, ErrorCallback onError) = 0;

    /**
     * @brief Queries the current connection status.
     */
    virtual void fetchStatus(StatusCallback onStatus, ErrorCallback onError) = 0;

    /**
     * @brief Sends one upload-chunk request body.
     *
     * A chunk is accepted or rejected as a whole.
     */
    virtual void uploadChunk(const QJsonObject &body,
                             DoneCallback onAccepted, ErrorCallback onError) = 0;

    /**
     * @brief Asks the backend to flush its own offline buffer to the server.
     */
    virtual void syncOffline(SyncCallback onSynced, ErrorCallback onError) = 0;

    /**
     * @brief Checks whether a Trans-Hub URL is reachable from the backend.
     *
     * Failures are folded into an unreachable result.
     */
    virtual void testConnection(const QString &serverUrl, TestCallback onResult) = 0;
};

Q_DECLARE_METATYPE(ServerConfig)
Q_DECLARE_METATYPE(ConnectionStatus)

#endif // ITRANSHUBCLIENT_H
