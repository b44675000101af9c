#include "restclient.h"

#include "utils/logging.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <utility>

RestClient::RestClient(QObject *parent)
    : QObject(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
    connect(networkManager_, &QNetworkAccessManager::finished,
            this, &RestClient::onReplyFinished);
}

RestClient::~RestClient()
{
    abortAll();
}

void RestClient::setHost(const QString &host)
{
    host_ = host.trimmed();
    // Remove trailing slash if present
    while (host_.endsWith('/')) {
        host_.chop(1);
    }
    // Add http:// if no scheme present
    if (!host_.isEmpty() &&
        !host_.startsWith("http://") && !host_.startsWith("https://")) {
        host_ = "http://" + host_;
    }
}

void RestClient::setApiKey(const QString &apiKey)
{
    apiKey_ = apiKey;
}

QNetworkRequest RestClient::createRequest(const QString &endpoint, int timeoutMs) const
{
    QUrl url(host_ + endpoint);
    QNetworkRequest request(url);

    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setRawHeader("Accept", "application/json");
    request.setTransferTimeout(timeoutMs);

    if (!apiKey_.isEmpty()) {
        request.setRawHeader("X-API-Key", apiKey_.toUtf8());
    }

    return request;
}

void RestClient::track(QNetworkReply *reply, const QString &operation,
                       JsonCallback onSuccess, ErrorCallback onError)
{
    pendingOperations_.insert(reply, PendingRequest{operation,
                                                    std::move(onSuccess),
                                                    std::move(onError)});
}

void RestClient::get(const QString &endpoint, const QString &operation,
                     JsonCallback onSuccess, ErrorCallback onError, int timeoutMs)
{
    LOG_VERBOSE() << "REST GET" << endpoint << "(" << operation << ")";
    QNetworkReply *reply = networkManager_->get(createRequest(endpoint, timeoutMs));
    track(reply, operation, std::move(onSuccess), std::move(onError));
}

void RestClient::post(const QString &endpoint, const QString &operation,
                      const QJsonObject &body,
                      JsonCallback onSuccess, ErrorCallback onError, int timeoutMs)
{
    LOG_VERBOSE() << "REST POST" << endpoint << "(" << operation << ")";
    const QByteArray data = QJsonDocument(body).toJson(QJsonDocument::Compact);
    QNetworkReply *reply = networkManager_->post(createRequest(endpoint, timeoutMs), data);
    track(reply, operation, std::move(onSuccess), std::move(onError));
}

void RestClient::abortAll()
{
    // Take ownership of the map first so onReplyFinished ignores the aborts
    const QHash<QNetworkReply*, PendingRequest> pending = std::exchange(pendingOperations_, {});
    for (auto it = pending.constBegin(); it != pending.constEnd(); ++it) {
        it.key()->abort();
        it.key()->deleteLater();
    }
}

RequestError::Kind RestClient::classifyError(QNetworkReply::NetworkError error, int httpStatus)
{
    if (httpStatus == 404 || error == QNetworkReply::ContentNotFoundError) {
        return RequestError::Kind::NotFound;
    }

    switch (error) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
        // A transfer timeout surfaces as a cancelled operation
        return RequestError::Kind::Timeout;
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
        return RequestError::Kind::Unreachable;
    default:
        return RequestError::Kind::Server;
    }
}

std::optional<QJsonValue> RestClient::unwrapEnvelope(const QJsonValue &json, QString *errorMessage)
{
    if (!json.isObject()) {
        return json;
    }

    const QJsonObject object = json.toObject();
    const QJsonValue success = object["success"];
    if (!success.isBool()) {
        return json;
    }

    if (!success.toBool()) {
        if (errorMessage) {
            const QStringList errors = extractErrors(object);
            *errorMessage = errors.isEmpty() ? QString("Request failed") : errors.join("; ");
        }
        return std::nullopt;
    }

    if (object.contains("data")) {
        return object["data"];
    }
    return json;
}

QStringList RestClient::extractErrors(const QJsonObject &json)
{
    QStringList errors;

    const QJsonArray errorsArray = json["errors"].toArray();
    for (const QJsonValue &error : errorsArray) {
        QString errorStr = error.toString();
        if (!errorStr.isEmpty()) {
            errors.append(errorStr);
        }
    }

    const QJsonValue error = json["error"];
    if (error.isString() && !error.toString().isEmpty()) {
        errors.append(error.toString());
    } else if (error.isObject()) {
        const QString message = error.toObject()["message"].toString();
        if (!message.isEmpty()) {
            errors.append(message);
        }
    }

    const QString detail = json["detail"].toString();
    if (!detail.isEmpty()) {
        errors.append(detail);
    }

    if (errors.isEmpty()) {
        const QString message = json["message"].toString();
        if (!message.isEmpty() && json["success"].isBool()) {
            errors.append(message);
        }
    }

    return errors;
}

void RestClient::onReplyFinished(QNetworkReply *reply)
{
    reply->deleteLater();

    auto it = pendingOperations_.find(reply);
    if (it == pendingOperations_.end()) {
        return;
    }
    const PendingRequest request = it.value();
    pendingOperations_.erase(it);

    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray data = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        RequestError error;
        error.kind = classifyError(reply->error(), httpStatus);
        error.httpStatus = httpStatus;
        error.message = reply->errorString();

        // Try to read the response body for more detailed error info
        if (!data.isEmpty()) {
            const QJsonDocument errorDoc = QJsonDocument::fromJson(data);
            if (errorDoc.isObject()) {
                const QStringList errors = extractErrors(errorDoc.object());
                if (!errors.isEmpty()) {
                    error.message = errors.join("; ");
                }
            } else {
                error.message += " - Response: " +
                    QString::fromUtf8(data).left(ErrorResponsePreviewLength);
            }
        }

        LOG_VERBOSE() << "REST error for" << request.operation << ":"
                      << requestErrorKindToString(error.kind) << error.message;
        if (request.onError) {
            request.onError(error);
        }
        return;
    }

    // Bodiless success, e.g. 204 No Content
    if (data.trimmed().isEmpty()) {
        if (request.onSuccess) {
            request.onSuccess(QJsonValue());
        }
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (doc.isNull()) {
        RequestError error;
        error.kind = RequestError::Kind::InvalidResponse;
        error.httpStatus = httpStatus;
        error.message = "Invalid JSON response: " + parseError.errorString();
        if (request.onError) {
            request.onError(error);
        }
        return;
    }

    const QJsonValue json = doc.isObject() ? QJsonValue(doc.object()) : QJsonValue(doc.array());

    QString envelopeError;
    const std::optional<QJsonValue> payload = unwrapEnvelope(json, &envelopeError);
    if (!payload) {
        RequestError error;
        error.kind = RequestError::Kind::InvalidResponse;
        error.httpStatus = httpStatus;
        error.message = envelopeError;
        if (request.onError) {
            request.onError(error);
        }
        return;
    }

    if (request.onSuccess) {
        request.onSuccess(*payload);
    }
}
