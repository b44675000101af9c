/**
 * @file iscanapiclient.h
 * @brief Interface for scan engine clients.
 *
 * Lets the progress monitor and the command-line front end run against the
 * real HTTP client in production and a scripted mock in tests.
 */

#ifndef ISCANAPICLIENT_H
#define ISCANAPICLIENT_H

#include <QObject>
#include <QString>

#include <functional>

#include "models/jobstatus.h"
#include "services/restclient.h"

/**
 * @brief Abstract client for the remote scan engine.
 *
 * Every query completes asynchronously through exactly one of its two
 * callbacks. Implementations never throw.
 *
 * @par Example usage:
 * @code
 * IScanApiClient *api = new ScanApiClient(this);
 * api->startScan("/path/to/mods", true,
 *     [](const QString &jobId) { qDebug() << "started" << jobId; },
 *     [](const RequestError &error) { qWarning() << error.message; });
 * @endcode
 */
class IScanApiClient : public QObject
{
    Q_OBJECT

public:
    using JobIdCallback = std::function<void(const QString &jobId)>;
    using StatusCallback = std::function<void(const JobStatus &status)>;
    using ResultCallback = std::function<void(const ScanResult &result)>;
    using DoneCallback = std::function<void()>;
    using ErrorCallback = RestClient::ErrorCallback;

    explicit IScanApiClient(QObject *parent = nullptr) : QObject(parent) {}
    ~IScanApiClient() override = default;

    /**
     * @brief Starts a scan of a directory on the engine's host.
     * @param directory Directory to scan.
     * @param incremental Only rescan files changed since the last scan.
     */
    virtual void startScan(const QString &directory, bool incremental,
                           JobIdCallback onStarted, ErrorCallback onError) = 0;

    /**
     * @brief Queries the current status of a job.
     *
     * A job the engine does not know is reported as RequestError::Kind::NotFound.
     */
    virtual void fetchStatus(const QString &jobId,
                             StatusCallback onStatus, ErrorCallback onError) = 0;

    /**
     * @brief Retrieves the full result of a completed job.
     */
    virtual void fetchResults(const QString &jobId,
                              ResultCallback onResult, ErrorCallback onError) = 0;

    /**
     * @brief Asks the engine to cancel a running job.
     */
    virtual void cancelScan(const QString &jobId,
                            DoneCallback onCancelled, ErrorCallback onError) = 0;
};

#endif // ISCANAPICLIENT_H
