/**
 * @file scanprogressmonitor.h
 * @brief Adaptive polling of a remote scan job with throughput and ETA metrics.
 */

#ifndef SCANPROGRESSMONITOR_H
#define SCANPROGRESSMONITOR_H

#include <QMetaType>
#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>
#include <optional>

#include "models/jobstatus.h"
#include "services/restclient.h"
#include "utils/cancellationtoken.h"
#include "utils/progresssnapshotstore.h"

class IScanApiClient;

/**
 * @brief Derived metrics published after every status response.
 */
struct ProgressMetrics {
    std::optional<double> itemsPerSecond;  ///< Unknown until two samples span time
    std::optional<qint64> etaMs;           ///< Unknown while progress is flat
    int nextIntervalMs = 0;                ///< Delay before the next status query
};

Q_DECLARE_METATYPE(ProgressMetrics)

/**
 * @brief Tracks one scan job to completion.
 *
 * Only one status query is ever in flight. The next one is scheduled after
 * the current one resolves, with the delay adapted to the observed speed:
 * fast jobs are polled more often, slow or stalled ones less often, and every
 * job is polled more often once it is nearly done.
 *
 * Transport timeouts and unreachable hosts are skipped silently. A job the
 * engine no longer knows stops the monitor. Each job reports at most one
 * terminal outcome (scanCompleted, resultRetrievalFailed or scanFailed) and
 * nothing is emitted for it afterwards.
 *
 * stopPolling() may be called from any slot connected to this object's
 * signals; no further signal for the job is emitted once it returns.
 *
 * @par Example usage:
 * @code
 * ScanProgressMonitor *monitor = new ScanProgressMonitor(scanApi, this);
 * connect(monitor, &ScanProgressMonitor::statusChanged,
 *         this, &MyClass::onStatus);
 * connect(monitor, &ScanProgressMonitor::scanCompleted,
 *         this, &MyClass::onResult);
 * monitor->startPolling(jobId);
 * @endcode
 */
class ScanProgressMonitor : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<qint64()>;

    static constexpr int DefaultPollingIntervalMs = 1000;
    static constexpr int MinPollingIntervalMs = 500;
    static constexpr int MaxPollingIntervalMs = 3000;

    /// Items per second above which polling speeds up
    static constexpr double FastItemsPerSecond = 50.0;
    /// Items per second at or below which polling slows down
    static constexpr double SlowItemsPerSecond = 10.0;
    /// Progress from which polling speeds up regardless of throughput
    static constexpr double NearCompletionPercent = 90.0;

    /**
     * @brief Constructs a monitor.
     * @param client Scan engine client (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit ScanProgressMonitor(IScanApiClient *client, QObject *parent = nullptr);
    ~ScanProgressMonitor() override;

    /// @name Configuration
    /// @{

    /**
     * @brief Sets the base polling interval used by the adaptive rules.
     */
    void setPollingInterval(int ms);
    [[nodiscard]] int pollingInterval() const { return baseIntervalMs_; }

    /**
     * @brief Enables or disables speed-based interval adjustment.
     *
     * When disabled every query is spaced by the base interval.
     */
    void setAdaptivePolling(bool enabled) { adaptivePolling_ = enabled; }
    [[nodiscard]] bool adaptivePolling() const { return adaptivePolling_; }

    /**
     * @brief Gives up on a job after this long. 0 means no limit.
     */
    void setMaxDuration(qint64 ms) { maxDurationMs_ = ms; }
    [[nodiscard]] qint64 maxDuration() const { return maxDurationMs_; }

    /**
     * @brief Replaces the millisecond clock used to timestamp samples.
     */
    void setClock(Clock clock);
    /// @}

    /**
     * @brief Computes the delay before the next query.
     * @param baseMs The configured base interval.
     * @param itemsPerSecond Observed speed, std::nullopt when still unknown.
     * @param progressPercent Latest reported progress.
     */
    [[nodiscard]] static int nextInterval(int baseMs, std::optional<double> itemsPerSecond,
                                          double progressPercent);

    /// @name State
    /// @{
    [[nodiscard]] bool isPolling() const { return polling_; }
    [[nodiscard]] QString jobId() const { return jobId_; }
    [[nodiscard]] std::optional<JobStatus> lastStatus() const { return lastStatus_; }
    [[nodiscard]] std::optional<double> itemsPerSecond() const { return snapshots_.itemsPerSecond(); }
    [[nodiscard]] std::optional<qint64> estimatedTimeRemainingMs() const { return snapshots_.etaMs(); }
    [[nodiscard]] int currentIntervalMs() const { return currentIntervalMs_; }
    [[nodiscard]] bool hasScheduledPoll() const { return pollTimer_->isActive(); }
    [[nodiscard]] bool isQueryInFlight() const { return queryInFlight_; }
    /// @}

public slots:
    /**
     * @brief Starts tracking a job, dropping any job tracked before.
     *
     * The first status query is sent immediately.
     */
    void startPolling(const QString &jobId);

    /**
     * @brief Stops tracking. Idempotent.
     *
     * Replies to queries already sent are discarded when they arrive.
     */
    void stopPolling();

    /**
     * @brief Sends the next status query now instead of waiting.
     *
     * Does nothing while a query is in flight or when not polling.
     */
    void pollNow();

    /**
     * @brief Stops tracking and asks the engine to cancel the job.
     *
     * Applies to the tracked job, or to the last one tracked after polling
     * ended. The engine's answer is reported through cancelRequestFinished().
     * No terminal signal follows for the job.
     *
     * @return False if no job was ever tracked.
     */
    bool cancelJob();

signals:
    /**
     * @brief Emitted after every status response, after metricsUpdated().
     */
    void statusChanged(const JobStatus &status);

    /**
     * @brief Emitted after every status response with the refreshed metrics.
     */
    void metricsUpdated(const ProgressMetrics &metrics);

    /**
     * @brief Emitted once the result of a completed job was retrieved.
     */
    void scanCompleted(const QString &jobId, const ScanResult &result);

    /**
     * @brief Emitted when a job completed but its result could not be fetched.
     *
     * The job still counts as completed.
     */
    void resultRetrievalFailed(const QString &jobId, const QString &error);

    /**
     * @brief Emitted when a job ended as failed or cancelled.
     */
    void scanFailed(const QString &jobId, JobState state, const QString &error);

    /**
     * @brief Emitted for status query errors that are not transient.
     */
    void errorOccurred(const QString &jobId, const QString &error);

    /**
     * @brief Emitted when the engine answered a cancelJob() request.
     * @param accepted False if the request failed; @p error then says why.
     */
    void cancelRequestFinished(const QString &jobId, bool accepted, const QString &error);

    /**
     * @brief Emitted when polling starts or stops.
     */
    void pollingStateChanged(bool polling);

private slots:
    void poll();

private:
    void scheduleNextPoll();
    void onStatusReceived(const JobStatus &status);
    void onStatusError(const RequestError &error);
    void fetchResult();
    void endPolling();

    IScanApiClient *client_ = nullptr;
    QTimer *pollTimer_ = nullptr;
    Clock clock_;

    // Configuration
    int baseIntervalMs_ = DefaultPollingIntervalMs;
    bool adaptivePolling_ = true;
    qint64 maxDurationMs_ = 0;

    // Per-job state
    QString jobId_;
    CancellationToken token_;
    bool polling_ = false;
    bool queryInFlight_ = false;
    bool terminalReported_ = false;
    qint64 startedAtMs_ = 0;
    int currentIntervalMs_ = DefaultPollingIntervalMs;
    std::optional<JobStatus> lastStatus_;
    ProgressSnapshotStore snapshots_;
};

#endif // SCANPROGRESSMONITOR_H
