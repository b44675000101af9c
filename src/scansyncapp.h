/**
 * @file scansyncapp.h
 * @brief Command-line front end wiring the scan, upload and sync services together.
 */

#ifndef SCANSYNCAPP_H
#define SCANSYNCAPP_H

#include <QObject>
#include <QString>

#include <optional>

#include "models/jobstatus.h"
#include "models/uploadtask.h"
#include "services/chunkeduploadpipeline.h"
#include "services/itranshubclient.h"

class IScanApiClient;
class ScanProgressMonitor;
class OfflineQueue;
class ConnectionSettings;
class ConnectionStateManager;
class SyncService;
class ErrorHandler;
struct ProgressMetrics;

/**
 * @brief Options collected from the command line.
 *
 * Unset optionals fall back to the persisted sync settings.
 */
struct AppOptions {
    QString serverHost = "localhost:18000";
    QString directory;
    bool incremental = false;
    QString jobId;
    QString projectId = "default";
    QString transHubUrl;
    QString apiKey;
    bool offline = false;
    bool syncOnly = false;
    bool checkConnection = false;
    bool noUpload = false;
    int pollingIntervalMs = 1000;
    qint64 timeoutMs = 0;               ///< 0 monitors without a deadline
    std::optional<int> chunkSize;
    std::optional<int> maxRetries;
    std::optional<int> retryDelayMs;
};

/**
 * @brief Process exit codes.
 */
enum class ExitCode {
    Success = 0,
    ScanFailed = 1,
    UploadFailed = 2,
    ConnectionFailed = 3,
    InvalidArguments = 4,
    ResultUnavailable = 5   ///< Scan completed but its result could not be fetched
};

/**
 * @brief Runs one scan-and-upload (or sync-only) session.
 *
 * The Trans-Hub connection is opened in parallel with the scan. A finished
 * scan is handed to SyncService once the connection attempt has settled, so
 * it is uploaded when the server is reachable and queued otherwise.
 *
 * @par Example usage:
 * @code
 * ScanSyncApp session(options);
 * QObject::connect(&session, &ScanSyncApp::finished, &app, &QCoreApplication::exit);
 * if (!session.start()) {
 *     return static_cast<int>(ExitCode::InvalidArguments);
 * }
 * return app.exec();
 * @endcode
 */
class ScanSyncApp : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Creates a session talking to the backend named in the options.
     */
    explicit ScanSyncApp(const AppOptions &options, QObject *parent = nullptr);

    /**
     * @brief Creates a session on the given clients.
     * @param scanApi Scan engine client (not owned).
     * @param transHub Trans-Hub client (not owned).
     */
    ScanSyncApp(const AppOptions &options, IScanApiClient *scanApi,
                ITransHubClient *transHub, QObject *parent = nullptr);
    ~ScanSyncApp() override;

    /**
     * @brief Validates the options and starts the session.
     * @return False if the options are unusable; nothing was started.
     */
    bool start();

    [[nodiscard]] bool isFinished() const { return finished_; }

signals:
    /**
     * @brief Emitted once when the session is over.
     * @param exitCode One of ExitCode.
     */
    void finished(int exitCode);

private slots:
    void onConnected();
    void onConnectionError(const QString &message);
    void onSyncFinished(bool success, int remainingQueueSize);
    void onScanStatus(const JobStatus &status);
    void onScanMetrics(const ProgressMetrics &metrics);
    void onScanCompleted(const QString &jobId, const ScanResult &result);
    void onScanFailed(const QString &jobId, JobState state, const QString &error);
    void onMonitorError(const QString &jobId, const QString &error);
    void onUploadProgress(const UploadProgress &progress);

private:
    void setUpServices(IScanApiClient *scanApi, ITransHubClient *transHub);
    [[nodiscard]] ServerConfig effectiveServerConfig() const;
    [[nodiscard]] UploadOptions effectiveUploadOptions() const;
    void startScan();
    void submitPendingTask();
    void finishWhenIdle(ExitCode code);
    void finish(ExitCode code);

    AppOptions options_;
    UploadOptions uploadOptions_;

    IScanApiClient *scanApi_ = nullptr;
    ScanProgressMonitor *monitor_ = nullptr;
    ITransHubClient *transHub_ = nullptr;
    ChunkedUploadPipeline *pipeline_ = nullptr;
    OfflineQueue *queue_ = nullptr;
    ConnectionSettings *settings_ = nullptr;
    ConnectionStateManager *connection_ = nullptr;
    SyncService *sync_ = nullptr;
    ErrorHandler *errors_ = nullptr;

    QString startedJobId_;              ///< Job this session started, empty when attached
    std::optional<UploadTask> pendingTask_;
    std::optional<ExitCode> pendingExit_;
    bool connectionSettled_ = true;
    bool finished_ = false;
};

#endif // SCANSYNCAPP_H
