/**
 * @file restclient.h
 * @brief JSON-over-HTTP transport shared by the scan engine and Trans-Hub clients.
 *
 * Sends GET and POST requests with a per-request timeout, unwraps the
 * {success, data} envelope used by the backends and classifies failures so
 * callers can tell transient faults from real ones.
 */

#ifndef RESTCLIENT_H
#define RESTCLIENT_H

#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>

#include <functional>
#include <optional>

/**
 * @brief A failed request, as reported to error callbacks.
 */
struct RequestError {
    /**
     * @brief Failure classes callers react to differently.
     */
    enum class Kind {
        Timeout,          ///< No answer within the request timeout
        Unreachable,      ///< Host not found, refused or dropped the connection
        NotFound,         ///< HTTP 404
        Server,           ///< Any other HTTP or protocol error
        InvalidResponse,  ///< Body was not JSON or the envelope reported failure
        Aborted           ///< Request was dropped by the client
    };

    Kind kind = Kind::Server;
    QString message;
    int httpStatus = 0;    ///< 0 when no HTTP response was received

    /**
     * @brief Returns true for faults that are expected to clear on their own.
     *
     * Timeouts and unreachable hosts are transient; everything else reflects
     * an answer from the server and is not.
     */
    [[nodiscard]] bool isTransient() const {
        return kind == Kind::Timeout || kind == Kind::Unreachable;
    }
};

/// @brief Convert RequestError::Kind to string for debugging
[[nodiscard]] inline const char* requestErrorKindToString(RequestError::Kind kind) {
    switch (kind) {
        case RequestError::Kind::Timeout: return "Timeout";
        case RequestError::Kind::Unreachable: return "Unreachable";
        case RequestError::Kind::NotFound: return "NotFound";
        case RequestError::Kind::Server: return "Server";
        case RequestError::Kind::InvalidResponse: return "InvalidResponse";
        case RequestError::Kind::Aborted: return "Aborted";
    }
    return "Unknown";
}

/**
 * @brief Asynchronous JSON REST client.
 *
 * Every request carries its own success and error callback. Exactly one of
 * them is invoked when the reply finishes, unless the request was dropped
 * with abortAll().
 *
 * @par Example usage:
 * @code
 * RestClient *rest = new RestClient(this);
 * rest->setHost("127.0.0.1:18000");
 *
 * rest->get("/scan-status/abc", "scanStatus",
 *     [](const QJsonValue &data) { qDebug() << data; },
 *     [](const RequestError &error) { qWarning() << error.message; });
 * @endcode
 */
class RestClient : public QObject
{
    Q_OBJECT

public:
    using JsonCallback = std::function<void(const QJsonValue &data)>;
    using ErrorCallback = std::function<void(const RequestError &error)>;

    /// Maximum characters to include from a non-JSON error body
    static constexpr int ErrorResponsePreviewLength = 200;
    /// Default request timeout in milliseconds
    static constexpr int DefaultTimeoutMs = 15000;

    /**
     * @brief Constructs a REST client.
     * @param parent Optional parent QObject for memory management.
     */
    explicit RestClient(QObject *parent = nullptr);

    ~RestClient() override;

    /**
     * @brief Sets the base URL requests are sent to.
     * @param host Host, host:port or full URL. "http://" is added when no
     *             scheme is given and a trailing slash is removed.
     */
    void setHost(const QString &host);

    [[nodiscard]] QString host() const { return host_; }

    /**
     * @brief Sets the key sent in the X-API-Key header. Empty disables the header.
     */
    void setApiKey(const QString &apiKey);

    [[nodiscard]] bool hasApiKey() const { return !apiKey_.isEmpty(); }

    /**
     * @brief Sends a GET request.
     * @param endpoint Path appended to the host, starting with '/'.
     * @param operation Short name used in log output.
     * @param onSuccess Receives the unwrapped response data.
     * @param onError Receives the classified failure.
     * @param timeoutMs Transfer timeout in milliseconds.
     */
    void get(const QString &endpoint, const QString &operation,
             JsonCallback onSuccess, ErrorCallback onError,
             int timeoutMs = DefaultTimeoutMs);

    /**
     * @brief Sends a POST request with a JSON body.
     * @see get()
     */
    void post(const QString &endpoint, const QString &operation,
              const QJsonObject &body,
              JsonCallback onSuccess, ErrorCallback onError,
              int timeoutMs = DefaultTimeoutMs);

    /**
     * @brief Aborts every outstanding request without invoking its callbacks.
     */
    void abortAll();

    /**
     * @brief Returns the number of requests still waiting for a reply.
     */
    [[nodiscard]] int pendingCount() const { return static_cast<int>(pendingOperations_.size()); }

    /// @name Response handling helpers
    /// @{

    /**
     * @brief Maps a network error and HTTP status to a failure class.
     * @param error The reply's network error.
     * @param httpStatus The HTTP status code, or 0 if none was received.
     */
    [[nodiscard]] static RequestError::Kind classifyError(QNetworkReply::NetworkError error,
                                                          int httpStatus);

    /**
     * @brief Removes the {success, data, error} envelope if present.
     * @param json The parsed response body.
     * @param errorMessage Receives the server's message when success is false.
     * @return The payload, or std::nullopt when the envelope reports failure.
     */
    [[nodiscard]] static std::optional<QJsonValue> unwrapEnvelope(const QJsonValue &json,
                                                                  QString *errorMessage = nullptr);

    /**
     * @brief Collects error strings from "errors", "error" and "detail" fields.
     */
    [[nodiscard]] static QStringList extractErrors(const QJsonObject &json);
    /// @}

private slots:
    void onReplyFinished(QNetworkReply *reply);

private:
    struct PendingRequest {
        QString operation;
        JsonCallback onSuccess;
        ErrorCallback onError;
    };

    [[nodiscard]] QNetworkRequest createRequest(const QString &endpoint, int timeoutMs) const;
    void track(QNetworkReply *reply, const QString &operation,
               JsonCallback onSuccess, ErrorCallback onError);

    QNetworkAccessManager *networkManager_ = nullptr;
    QString host_;
    QString apiKey_;

    QHash<QNetworkReply*, PendingRequest> pendingOperations_;
};

#endif // RESTCLIENT_H
