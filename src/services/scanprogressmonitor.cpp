#include "scanprogressmonitor.h"

#include "services/iscanapiclient.h"
#include "utils/logging.h"

#include <QDateTime>
#include <QPointer>

#include <algorithm>

ScanProgressMonitor::ScanProgressMonitor(IScanApiClient *client, QObject *parent)
    : QObject(parent)
    , client_(client)
    , pollTimer_(new QTimer(this))
    , clock_([] { return QDateTime::currentMSecsSinceEpoch(); })
{
    pollTimer_->setSingleShot(true);
    connect(pollTimer_, &QTimer::timeout, this, &ScanProgressMonitor::poll);
}

ScanProgressMonitor::~ScanProgressMonitor()
{
    token_.cancel();
}

void ScanProgressMonitor::setPollingInterval(int ms)
{
    baseIntervalMs_ = std::max(1, ms);
}

void ScanProgressMonitor::setClock(Clock clock)
{
    if (clock) {
        clock_ = std::move(clock);
    }
}

int ScanProgressMonitor::nextInterval(int baseMs, std::optional<double> itemsPerSecond,
                                      double progressPercent)
{
    int interval;
    if (itemsPerSecond && *itemsPerSecond > FastItemsPerSecond) {
        interval = std::max(MinPollingIntervalMs, baseMs / 2);
    } else if (itemsPerSecond && *itemsPerSecond > SlowItemsPerSecond) {
        interval = baseMs;
    } else {
        // Slow, stalled or not yet measurable
        interval = static_cast<int>(std::min<qint64>(MaxPollingIntervalMs,
                                                     static_cast<qint64>(baseMs) * 2));
    }

    if (progressPercent >= NearCompletionPercent) {
        interval = std::max(MinPollingIntervalMs, interval / 2);
    }
    return interval;
}

void ScanProgressMonitor::startPolling(const QString &jobId)
{
    if (jobId.isEmpty()) {
        qWarning() << "ScanProgressMonitor: refusing to poll an empty job id";
        return;
    }

    // Drop whatever was tracked before without announcing a stop
    token_.cancel();
    token_ = CancellationToken();
    pollTimer_->stop();

    jobId_ = jobId;
    snapshots_.clear();
    lastStatus_.reset();
    queryInFlight_ = false;
    terminalReported_ = false;
    currentIntervalMs_ = baseIntervalMs_;
    startedAtMs_ = clock_();

    qInfo() << "ScanProgressMonitor: polling job" << jobId_;

    const bool wasPolling = polling_;
    polling_ = true;
    if (!wasPolling) {
        CancellationToken token = token_;
        emit pollingStateChanged(true);
        if (token.isCancelled()) {
            return;
        }
    }

    poll();
}

void ScanProgressMonitor::stopPolling()
{
    token_.cancel();
    pollTimer_->stop();
    queryInFlight_ = false;

    if (!polling_) {
        return;
    }

    LOG_VERBOSE() << "ScanProgressMonitor: stopped polling job" << jobId_;
    polling_ = false;
    emit pollingStateChanged(false);
}

void ScanProgressMonitor::pollNow()
{
    if (!polling_ || queryInFlight_) {
        return;
    }
    pollTimer_->stop();
    poll();
}

bool ScanProgressMonitor::cancelJob()
{
    if (jobId_.isEmpty()) {
        return false;
    }

    const QString jobId = jobId_;
    terminalReported_ = true;
    stopPolling();

    qInfo() << "ScanProgressMonitor: requesting cancellation of job" << jobId;

    QPointer<ScanProgressMonitor> self(this);
    client_->cancelScan(jobId,
        [self, jobId]() {
            if (self) {
                emit self->cancelRequestFinished(jobId, true, QString());
            }
        },
        [self, jobId](const RequestError &error) {
            qWarning() << "ScanProgressMonitor: cancelling job" << jobId
                       << "failed:" << error.message;
            if (self) {
                emit self->cancelRequestFinished(jobId, false, error.message);
            }
        });
    return true;
}

void ScanProgressMonitor::scheduleNextPoll()
{
    if (!polling_) {
        return;
    }
    pollTimer_->start(currentIntervalMs_);
}

void ScanProgressMonitor::poll()
{
    if (!polling_ || queryInFlight_) {
        return;
    }

    if (maxDurationMs_ > 0 && clock_() - startedAtMs_ >= maxDurationMs_) {
        const QString jobId = jobId_;
        qWarning() << "ScanProgressMonitor: monitoring of job" << jobId << "timed out";
        stopPolling();
        emit errorOccurred(jobId, tr("Scan monitoring timed out after %1 s")
                                      .arg(maxDurationMs_ / 1000));
        return;
    }

    queryInFlight_ = true;
    LOG_VERBOSE() << "ScanProgressMonitor: querying status of" << jobId_;

    client_->fetchStatus(jobId_,
        [this, token = token_](const JobStatus &status) {
            if (token.isCancelled()) {
                return;
            }
            queryInFlight_ = false;
            onStatusReceived(status);
        },
        [this, token = token_](const RequestError &error) {
            if (token.isCancelled()) {
                return;
            }
            queryInFlight_ = false;
            onStatusError(error);
        });
}

void ScanProgressMonitor::onStatusReceived(const JobStatus &status)
{
    const CancellationToken token = token_;

    lastStatus_ = status;
    snapshots_.addSnapshot({clock_(), status.progressPercent, status.processedCount});

    ProgressMetrics metrics;
    metrics.itemsPerSecond = snapshots_.itemsPerSecond();
    metrics.etaMs = snapshots_.etaMs();
    currentIntervalMs_ = adaptivePolling_
        ? nextInterval(baseIntervalMs_, metrics.itemsPerSecond, status.progressPercent)
        : baseIntervalMs_;
    metrics.nextIntervalMs = currentIntervalMs_;

    LOG_VERBOSE() << "ScanProgressMonitor:" << status.jobId << jobStateToString(status.state)
                  << status.progressPercent << "% next poll in" << currentIntervalMs_ << "ms";

    emit metricsUpdated(metrics);
    if (token.isCancelled()) {
        return;
    }

    emit statusChanged(status);
    if (token.isCancelled()) {
        return;
    }

    switch (status.state) {
    case JobState::Completed:
        endPolling();
        if (token.isCancelled()) {
            return;
        }
        fetchResult();
        return;

    case JobState::Failed:
    case JobState::Cancelled: {
        const QString jobId = jobId_;
        endPolling();
        if (token.isCancelled()) {
            return;
        }
        terminalReported_ = true;
        token_.cancel();
        qInfo() << "ScanProgressMonitor: job" << jobId << "ended as"
                << jobStateToString(status.state);
        emit scanFailed(jobId, status.state, status.errorMessage);
        return;
    }

    case JobState::Pending:
    case JobState::Running:
        scheduleNextPoll();
        return;
    }
}

void ScanProgressMonitor::onStatusError(const RequestError &error)
{
    if (error.isTransient()) {
        LOG_VERBOSE() << "ScanProgressMonitor: transient error for" << jobId_
                      << requestErrorKindToString(error.kind) << "- retrying next tick";
        scheduleNextPoll();
        return;
    }

    const QString jobId = jobId_;
    qWarning() << "ScanProgressMonitor: status query for" << jobId << "failed:" << error.message;

    if (error.kind == RequestError::Kind::NotFound) {
        stopPolling();
        emit errorOccurred(jobId, error.message);
        return;
    }

    const CancellationToken token = token_;
    emit errorOccurred(jobId, error.message);
    if (token.isCancelled()) {
        return;
    }
    scheduleNextPoll();
}

void ScanProgressMonitor::fetchResult()
{
    const QString jobId = jobId_;
    qInfo() << "ScanProgressMonitor: job" << jobId << "completed, fetching result";

    client_->fetchResults(jobId,
        [this, jobId, token = token_](const ScanResult &result) {
            if (token.isCancelled() || terminalReported_) {
                return;
            }
            terminalReported_ = true;
            token_.cancel();
            emit scanCompleted(jobId, result);
        },
        [this, jobId, token = token_](const RequestError &error) {
            if (token.isCancelled() || terminalReported_) {
                return;
            }
            terminalReported_ = true;
            token_.cancel();
            qWarning() << "ScanProgressMonitor: job" << jobId
                       << "completed but its result could not be retrieved:" << error.message;
            emit resultRetrievalFailed(jobId, error.message);
        });
}

void ScanProgressMonitor::endPolling()
{
    pollTimer_->stop();
    if (!polling_) {
        return;
    }
    polling_ = false;
    emit pollingStateChanged(false);
}
