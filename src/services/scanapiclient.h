/**
 * @file scanapiclient.h
 * @brief HTTP client for the scan engine.
 */

#ifndef SCANAPICLIENT_H
#define SCANAPICLIENT_H

#include "iscanapiclient.h"
#include "restclient.h"

/**
 * @brief Production IScanApiClient talking JSON over HTTP.
 *
 * Endpoints:
 * - POST /scan-project {directory, incremental}
 * - GET  /scan-status/{jobId}
 * - GET  /scan-results/{jobId}
 * - POST /scan-cancel/{jobId}
 */
class ScanApiClient : public IScanApiClient
{
    Q_OBJECT

public:
    /// Starting a scan walks the directory before answering
    static constexpr int StartScanTimeoutMs = 120000;
    static constexpr int StatusTimeoutMs = 15000;
    static constexpr int ResultsTimeoutMs = 30000;
    static constexpr int CancelTimeoutMs = 15000;

    explicit ScanApiClient(QObject *parent = nullptr);
    ~ScanApiClient() override = default;

    /**
     * @brief Sets the engine's base URL, e.g. "http://localhost:18000".
     */
    void setHost(const QString &host) { rest_->setHost(host); }
    [[nodiscard]] QString host() const { return rest_->host(); }

    void startScan(const QString &directory, bool incremental,
                   JobIdCallback onStarted, ErrorCallback onError) override;
    void fetchStatus(const QString &jobId,
                     StatusCallback onStatus, ErrorCallback onError) override;
    void fetchResults(const QString &jobId,
                      ResultCallback onResult, ErrorCallback onError) override;
    void cancelScan(const QString &jobId,
                    DoneCallback onCancelled, ErrorCallback onError) override;

    /**
     * @brief Picks the job id out of a start-scan response.
     *
     * Engines have answered with "scan_id", "job_id" or "task_id".
     * @return The id, or an empty string if none is present.
     */
    [[nodiscard]] static QString extractJobId(const QJsonObject &json);

private:
    RestClient *rest_ = nullptr;
};

#endif // SCANAPICLIENT_H
