#include "syncservice.h"

#include "models/offlinequeue.h"
#include "services/connectionstatemanager.h"

SyncService::SyncService(ConnectionStateManager *connection,
                         ChunkedUploadPipeline *pipeline,
                         OfflineQueue *queue,
                         QObject *parent)
    : QObject(parent)
    , connection_(connection)
    , pipeline_(pipeline)
    , queue_(queue)
{
    connect(pipeline_, &ChunkedUploadPipeline::progressChanged,
            this, &SyncService::onProgressChanged);
    connect(pipeline_, &ChunkedUploadPipeline::uploadFinished,
            this, &SyncService::onUploadFinished);
    connect(pipeline_, &ChunkedUploadPipeline::uploadFailed,
            this, &SyncService::onUploadFailed);
}

SyncService::~SyncService() = default;

SyncService::SubmitResult SyncService::submit(const UploadTask &task, const UploadOptions &options)
{
    if (task.uploadId.isEmpty()) {
        qWarning() << "SyncService: rejecting task without upload id";
        return SubmitResult::Rejected;
    }

    if (connection_->serverConfig().offlineMode) {
        return enqueue(task, tr("Offline mode"));
    }
    if (!connection_->isConnected()) {
        return enqueue(task, tr("Trans-Hub not connected"));
    }
    if (pipeline_->isBusy() || activeTask_) {
        return enqueue(task, tr("Another upload is in progress"));
    }

    // Set before starting: the pipeline may finish before upload() returns
    activeTask_ = task;
    emit uploadStarted(task.uploadId);

    if (!pipeline_->upload(task, options)) {
        activeTask_.reset();
        return enqueue(task, tr("Upload could not be started"));
    }
    return SubmitResult::Uploading;
}

SyncService::SubmitResult SyncService::enqueue(const UploadTask &task, const QString &reason)
{
    if (!queue_->enqueue(task)) {
        qWarning() << "SyncService:" << task.uploadId << "is already queued";
        return SubmitResult::Rejected;
    }

    qInfo() << "SyncService: queued" << task.uploadId << "-" << reason;
    emit taskQueued(task.uploadId, reason);
    emit statusMessage(tr("Upload queued for later sync: %1").arg(reason), 5000);
    return SubmitResult::Queued;
}

void SyncService::onProgressChanged(const UploadProgress &progress)
{
    if (activeTask_ && progress.uploadId == activeTask_->uploadId) {
        emit progressChanged(progress);
    }
}

void SyncService::onUploadFinished(const QString &uploadId, int totalChunks)
{
    if (!activeTask_ || activeTask_->uploadId != uploadId) {
        return;
    }
    activeTask_.reset();

    emit uploadCompleted(uploadId, totalChunks);
    emit statusMessage(tr("Uploaded %1 chunks to Trans-Hub").arg(totalChunks), 3000);
}

void SyncService::onUploadFailed(const QString &uploadId, const QString &error)
{
    if (!activeTask_ || activeTask_->uploadId != uploadId) {
        return;
    }
    const UploadTask task = *activeTask_;
    activeTask_.reset();

    emit uploadFailed(uploadId, error);

    if (queueOnFailure_) {
        enqueue(task, error);
    }
}
