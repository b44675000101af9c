/**
 * @file connectionsettings.h
 * @brief Persisted Trans-Hub server configuration, sync tuning and connection log.
 */

#ifndef CONNECTIONSETTINGS_H
#define CONNECTIONSETTINGS_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>

#include "services/chunkeduploadpipeline.h"
#include "services/itranshubclient.h"

/**
 * @brief How and when queued uploads are synchronised.
 */
struct SyncSettings {
    bool autoSync = true;       ///< Drain the offline queue whenever the server is reachable
    bool syncOnStartup = true;  ///< Connect with the saved server config at startup
    int chunkSize = 100;
    int maxRetries = 3;
    int retryDelayMs = 1000;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static SyncSettings fromJson(const QJsonObject &json);

    /**
     * @brief Returns upload options carrying these tuning values.
     */
    [[nodiscard]] UploadOptions toUploadOptions() const;
};

/**
 * @brief Outcome class of a connection log entry.
 */
enum class LogStatus {
    Success,
    Error,
    Info
};

[[nodiscard]] inline const char* logStatusToString(LogStatus status) {
    switch (status) {
        case LogStatus::Success: return "success";
        case LogStatus::Error: return "error";
        case LogStatus::Info: return "info";
    }
    return "info";
}

[[nodiscard]] LogStatus logStatusFromString(const QString &status);

/**
 * @brief One line of the connection history.
 */
struct ConnectionLogEntry {
    QString id;
    QDateTime timestamp;
    QString event;
    QString details;
    LogStatus status = LogStatus::Info;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static ConnectionLogEntry fromJson(const QJsonObject &json);
};

/**
 * @brief Persistent connection-related state.
 *
 * Stored with QSettings as compact JSON strings under "server_config",
 * "sync_settings" and "connection_logs". The log keeps the newest entry
 * first and at most MaxLogEntries entries. Every change is written through.
 */
class ConnectionSettings : public QObject
{
    Q_OBJECT

public:
    static constexpr const char *ServerConfigKey = "server_config";
    static constexpr const char *SyncSettingsKey = "sync_settings";
    static constexpr const char *ConnectionLogsKey = "connection_logs";

    /// Oldest entries beyond this count are dropped
    static constexpr int MaxLogEntries = 100;

    explicit ConnectionSettings(QObject *parent = nullptr);
    ~ConnectionSettings() override = default;

    /// @name Server configuration
    /// @{
    [[nodiscard]] ServerConfig serverConfig() const { return serverConfig_; }
    [[nodiscard]] bool hasServerConfig() const { return serverConfig_.isValid(); }

    /**
     * @brief Returns when the offline queue was last synchronised, if ever.
     */
    [[nodiscard]] QDateTime lastSync() const { return lastSync_; }

    void setServerConfig(const ServerConfig &config);
    void setLastSync(const QDateTime &when);
    /// @}

    /// @name Sync settings
    /// @{
    [[nodiscard]] SyncSettings syncSettings() const { return syncSettings_; }
    void setSyncSettings(const SyncSettings &settings);
    /// @}

    /// @name Connection log
    /// @{
    [[nodiscard]] QList<ConnectionLogEntry> logs() const { return logs_; }

    /**
     * @brief Prepends an entry to the log.
     */
    void appendLog(const QString &event, const QString &details, LogStatus status);

    void clearLogs();
    /// @}

public slots:
    /**
     * @brief Loads all values from persistent storage.
     */
    void loadSettings();

    /**
     * @brief Saves all values to persistent storage.
     */
    void saveSettings();

signals:
    void serverConfigChanged(const ServerConfig &config);
    void syncSettingsChanged(const SyncSettings &settings);
    void logAppended(const ConnectionLogEntry &entry);
    void logsCleared();

private:
    void saveServerConfig();
    void saveSyncSettings();
    void saveLogs();

    ServerConfig serverConfig_;
    QDateTime lastSync_;
    SyncSettings syncSettings_;
    QList<ConnectionLogEntry> logs_;
};

#endif // CONNECTIONSETTINGS_H
