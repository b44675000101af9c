#include "transhubclient.h"

#include <QUrl>

TransHubClient::TransHubClient(QObject *parent)
    : ITransHubClient(parent)
    , rest_(new RestClient(this))
{
}

void TransHubClient::connectToServer(const ServerConfig &config,
                                     StatusCallback onStatus, ErrorCallback onError)
{
    rest_->setApiKey(config.apiKey);
    rest_->post("/transhub/connect", "connect", config.toJson(),
        [onStatus](const QJsonValue &data) {
            onStatus(ConnectionStatus::fromJson(data.toObject()));
        },
        onError, RequestTimeoutMs);
}

void TransHubClient::disconnectFromServer(DoneCallback onDone, ErrorCallback onError)
{
    rest_->post("/transhub/disconnect", "disconnect", QJsonObject(),
        [onDone](const QJsonValue &) {
            onDone();
        },
        onError, RequestTimeoutMs);
}

void TransHubClient::fetchStatus(StatusCallback onStatus, ErrorCallback onError)
{
    rest_->get("/transhub/status", "status",
        [onStatus](const QJsonValue &data) {
            onStatus(ConnectionStatus::fromJson(data.toObject()));
        },
        onError, RequestTimeoutMs);
}

void TransHubClient::uploadChunk(const QJsonObject &body,
                                 DoneCallback onAccepted, ErrorCallback onError)
{
    rest_->post("/transhub/upload-chunk", "uploadChunk", body,
        [onAccepted](const QJsonValue &) {
            onAccepted();
        },
        onError, UploadTimeoutMs);
}

void TransHubClient::syncOffline(SyncCallback onSynced, ErrorCallback onError)
{
    rest_->post("/transhub/sync-offline", "syncOffline", QJsonObject(),
        [onSynced](const QJsonValue &data) {
            onSynced(data.toObject()["remainingQueueSize"].toInt());
        },
        onError, SyncTimeoutMs);
}

void TransHubClient::testConnection(const QString &serverUrl, TestCallback onResult)
{
    const QString endpoint = "/transhub/test-connection?server_url=" +
                             QString::fromUtf8(QUrl::toPercentEncoding(serverUrl));
    rest_->get(endpoint, "testConnection",
        [serverUrl, onResult](const QJsonValue &data) {
            const QJsonObject json = data.toObject();
            ConnectionTestResult result;
            result.reachable = json["reachable"].toBool(false);
            result.serverUrl = json["serverUrl"].toString(serverUrl);
            result.message = json["message"].toString(json["error"].toString());
            onResult(result);
        },
        [serverUrl, onResult](const RequestError &error) {
            ConnectionTestResult result;
            result.serverUrl = serverUrl;
            result.message = error.message;
            onResult(result);
        },
        RequestTimeoutMs);
}
