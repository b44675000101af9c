/**
 * @file connectionsettings.cpp
 * @brief Implementation of ConnectionSettings.
 */

#include "connectionsettings.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSettings>

namespace {

QJsonDocument readJson(const QSettings &settings, const char *key)
{
    const QByteArray data = settings.value(key).toByteArray();
    if (data.isEmpty()) {
        return QJsonDocument();
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (doc.isNull()) {
        qWarning() << "ConnectionSettings: ignoring unreadable" << key << ":"
                   << parseError.errorString();
    }
    return doc;
}

void writeJson(QSettings &settings, const char *key, const QJsonDocument &doc)
{
    settings.setValue(key, QString::fromUtf8(doc.toJson(QJsonDocument::Compact)));
}

} // namespace

QJsonObject SyncSettings::toJson() const
{
    QJsonObject json;
    json["autoSync"] = autoSync;
    json["syncOnStartup"] = syncOnStartup;
    json["chunkSize"] = chunkSize;
    json["maxRetries"] = maxRetries;
    json["retryDelay"] = retryDelayMs;
    return json;
}

SyncSettings SyncSettings::fromJson(const QJsonObject &json)
{
    SyncSettings settings;
    settings.autoSync = json["autoSync"].toBool(settings.autoSync);
    settings.syncOnStartup = json["syncOnStartup"].toBool(settings.syncOnStartup);
    settings.chunkSize = json["chunkSize"].toInt(settings.chunkSize);
    settings.maxRetries = json["maxRetries"].toInt(settings.maxRetries);
    settings.retryDelayMs = json["retryDelay"].toInt(settings.retryDelayMs);
    return settings;
}

UploadOptions SyncSettings::toUploadOptions() const
{
    UploadOptions options;
    options.chunkSize = chunkSize;
    options.maxRetries = maxRetries;
    options.retryDelayMs = retryDelayMs;
    return options;
}

LogStatus logStatusFromString(const QString &status)
{
    if (status == "success") {
        return LogStatus::Success;
    }
    if (status == "error") {
        return LogStatus::Error;
    }
    return LogStatus::Info;
}

QJsonObject ConnectionLogEntry::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["timestamp"] = timestamp.toString(Qt::ISODateWithMs);
    json["event"] = event;
    json["details"] = details;
    json["status"] = logStatusToString(status);
    return json;
}

ConnectionLogEntry ConnectionLogEntry::fromJson(const QJsonObject &json)
{
    ConnectionLogEntry entry;
    entry.id = json["id"].toString();
    entry.timestamp = QDateTime::fromString(json["timestamp"].toString(), Qt::ISODateWithMs);
    entry.event = json["event"].toString();
    entry.details = json["details"].toString();
    entry.status = logStatusFromString(json["status"].toString());
    return entry;
}

ConnectionSettings::ConnectionSettings(QObject *parent)
    : QObject(parent)
{
    loadSettings();
}

void ConnectionSettings::setServerConfig(const ServerConfig &config)
{
    if (config == serverConfig_) {
        return;
    }
    serverConfig_ = config;
    saveServerConfig();
    emit serverConfigChanged(serverConfig_);
}

void ConnectionSettings::setLastSync(const QDateTime &when)
{
    lastSync_ = when;
    saveServerConfig();
}

void ConnectionSettings::setSyncSettings(const SyncSettings &settings)
{
    syncSettings_ = settings;
    saveSyncSettings();
    emit syncSettingsChanged(syncSettings_);
}

void ConnectionSettings::appendLog(const QString &event, const QString &details, LogStatus status)
{
    ConnectionLogEntry entry;
    entry.timestamp = QDateTime::currentDateTimeUtc();
    entry.id = QString::number(entry.timestamp.toMSecsSinceEpoch());
    entry.event = event;
    entry.details = details;
    entry.status = status;

    logs_.prepend(entry);
    while (logs_.size() > MaxLogEntries) {
        logs_.removeLast();
    }
    saveLogs();
    emit logAppended(entry);
}

void ConnectionSettings::clearLogs()
{
    logs_.clear();
    QSettings settings;
    settings.remove(ConnectionLogsKey);
    emit logsCleared();
}

void ConnectionSettings::loadSettings()
{
    QSettings settings;

    const QJsonObject server = readJson(settings, ServerConfigKey).object();
    serverConfig_ = ServerConfig();
    serverConfig_.baseUrl = server["url"].toString();
    serverConfig_.apiKey = server["apiKey"].toString();
    serverConfig_.offlineMode = server["offlineMode"].toBool(false);
    serverConfig_.autoSync = server["autoSync"].toBool(true);
    lastSync_ = QDateTime::fromString(server["lastSync"].toString(), Qt::ISODateWithMs);

    syncSettings_ = SyncSettings::fromJson(readJson(settings, SyncSettingsKey).object());

    logs_.clear();
    const QJsonArray logs = readJson(settings, ConnectionLogsKey).array();
    for (const QJsonValue &value : logs) {
        logs_.append(ConnectionLogEntry::fromJson(value.toObject()));
        if (logs_.size() >= MaxLogEntries) {
            break;
        }
    }
}

void ConnectionSettings::saveSettings()
{
    saveServerConfig();
    saveSyncSettings();
    saveLogs();
}

void ConnectionSettings::saveServerConfig()
{
    QJsonObject server;
    server["url"] = serverConfig_.baseUrl;
    server["apiKey"] = serverConfig_.apiKey;
    server["offlineMode"] = serverConfig_.offlineMode;
    server["autoSync"] = serverConfig_.autoSync;
    if (lastSync_.isValid()) {
        server["lastSync"] = lastSync_.toString(Qt::ISODateWithMs);
    }

    QSettings settings;
    writeJson(settings, ServerConfigKey, QJsonDocument(server));
}

void ConnectionSettings::saveSyncSettings()
{
    QSettings settings;
    writeJson(settings, SyncSettingsKey, QJsonDocument(syncSettings_.toJson()));
}

void ConnectionSettings::saveLogs()
{
    QJsonArray array;
    for (const ConnectionLogEntry &entry : logs_) {
        array.append(entry.toJson());
    }

    QSettings settings;
    writeJson(settings, ConnectionLogsKey, QJsonDocument(array));
}
