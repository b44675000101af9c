#include "scanapiclient.h"

#include <QUrl>

namespace {

QString jobPath(const QString &prefix, const QString &jobId)
{
    return prefix + QString::fromUtf8(QUrl::toPercentEncoding(jobId));
}

} // namespace

ScanApiClient::ScanApiClient(QObject *parent)
    : IScanApiClient(parent)
    , rest_(new RestClient(this))
{
}

QString ScanApiClient::extractJobId(const QJsonObject &json)
{
    for (const char *key : {"scan_id", "job_id", "task_id"}) {
        const QString id = json[QLatin1String(key)].toString();
        if (!id.isEmpty()) {
            return id;
        }
    }
    return QString();
}

void ScanApiClient::startScan(const QString &directory, bool incremental,
                              JobIdCallback onStarted, ErrorCallback onError)
{
    QJsonObject body;
    body["directory"] = directory;
    body["incremental"] = incremental;

    rest_->post("/scan-project", "startScan", body,
        [onStarted, onError](const QJsonValue &data) {
            const QString jobId = extractJobId(data.toObject());
            if (jobId.isEmpty()) {
                RequestError error;
                error.kind = RequestError::Kind::InvalidResponse;
                error.message = "Scan started but no job id was returned";
                onError(error);
                return;
            }
            onStarted(jobId);
        },
        onError, StartScanTimeoutMs);
}

void ScanApiClient::fetchStatus(const QString &jobId,
                                StatusCallback onStatus, ErrorCallback onError)
{
    rest_->get(jobPath("/scan-status/", jobId), "scanStatus",
        [jobId, onStatus](const QJsonValue &data) {
            onStatus(JobStatus::fromJson(jobId, data.toObject()));
        },
        onError, StatusTimeoutMs);
}

void ScanApiClient::fetchResults(const QString &jobId,
                                 ResultCallback onResult, ErrorCallback onError)
{
    rest_->get(jobPath("/scan-results/", jobId), "scanResults",
        [jobId, onResult](const QJsonValue &data) {
            onResult(ScanResult::fromJson(jobId, data.toObject()));
        },
        onError, ResultsTimeoutMs);
}

void ScanApiClient::cancelScan(const QString &jobId,
                               DoneCallback onCancelled, ErrorCallback onError)
{
    rest_->post(jobPath("/scan-cancel/", jobId), "cancelScan", QJsonObject(),
        [onCancelled](const QJsonValue &) {
            onCancelled();
        },
        onError, CancelTimeoutMs);
}
