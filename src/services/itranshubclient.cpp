/**
 * @file itranshubclient.cpp
 * @brief Value types of the ITransHubClient interface.
 *
 * Also gives Qt's MOC a translation unit for the interface.
 */

#include "itranshubclient.h"

QJsonObject ServerConfig::toJson() const
{
    QJsonObject json;
    json["baseUrl"] = baseUrl;
    json["apiKey"] = apiKey;
    json["offlineMode"] = offlineMode;
    json["autoSync"] = autoSync;
    return json;
}

ServerConfig ServerConfig::fromJson(const QJsonObject &json)
{
    ServerConfig config;
    config.baseUrl = json["baseUrl"].toString();
    config.apiKey = json["apiKey"].toString();
    config.offlineMode = json["offlineMode"].toBool(false);
    config.autoSync = json["autoSync"].toBool(true);
    return config;
}

ConnectionStatus ConnectionStatus::fromJson(const QJsonObject &json)
{
    ConnectionStatus status;
    status.connected = json["connected"].toBool(false);
    status.status = json["status"].toString(status.connected ? "connected" : "disconnected");
    status.serverUrl = json["serverUrl"].toString(json["server_url"].toString());
    status.offlineQueueSize = json.contains("offlineQueueSize")
        ? json["offlineQueueSize"].toInt()
        : json["offline_queue_size"].toInt();
    status.message = json["message"].toString();
    return status;
}

ConnectionStatus ConnectionStatus::disconnected(const QString &message, const QString &status)
{
    ConnectionStatus result;
    result.connected = false;
    result.status = status;
    result.message = message;
    return result;
}
