/**
 * @file syncservice.h
 * @brief Decides whether an upload task is sent now or parked in the offline queue.
 *
 * Callers hand finished scan data to this service instead of talking to the
 * pipeline and queue directly, which keeps the upload policy in one place.
 */

#ifndef SYNCSERVICE_H
#define SYNCSERVICE_H

#include <QObject>
#include <QString>

#include <optional>

#include "models/uploadtask.h"
#include "services/chunkeduploadpipeline.h"

class ConnectionStateManager;
class OfflineQueue;

/**
 * @brief Upload policy: send when connected, queue otherwise.
 *
 * A task is queued instead of uploaded when offline mode is configured,
 * when Trans-Hub is not connected, or when the pipeline is busy with another
 * upload. With queue-on-failure enabled (the default), a task whose upload
 * ran out of retries is queued as well so the next sync picks it up.
 *
 * @par Example usage:
 * @code
 * SyncService *sync = new SyncService(connection, pipeline, queue, this);
 * connect(sync, &SyncService::taskQueued, this, &MyClass::onQueued);
 * sync->submit(UploadTask::fromScanResult(projectId, result));
 * @endcode
 */
class SyncService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief What submit() did with a task.
     */
    enum class SubmitResult {
        Uploading,  ///< Upload started
        Queued,     ///< Parked in the offline queue
        Rejected    ///< Not accepted (no upload id, or already queued)
    };
    Q_ENUM(SubmitResult)

    /**
     * @brief Constructs a sync service.
     * @param connection Connection state used for the policy (not owned).
     * @param pipeline Pipeline uploads are delegated to (not owned).
     * @param queue Offline queue tasks are parked in (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit SyncService(ConnectionStateManager *connection,
                         ChunkedUploadPipeline *pipeline,
                         OfflineQueue *queue,
                         QObject *parent = nullptr);
    ~SyncService() override;

    /**
     * @brief Enables queuing of tasks whose upload failed.
     */
    void setQueueOnFailure(bool enabled) { queueOnFailure_ = enabled; }
    [[nodiscard]] bool queueOnFailure() const { return queueOnFailure_; }

    /**
     * @brief Returns whether a task submitted here is being uploaded.
     */
    [[nodiscard]] bool isUploading() const { return activeTask_.has_value(); }

    /**
     * @brief Uploads a task now or queues it.
     * @param task The task. Its uploadId is kept if it is queued.
     * @param options Chunking and retry tuning for an immediate upload.
     */
    SubmitResult submit(const UploadTask &task, const UploadOptions &options = UploadOptions());

signals:
    void uploadStarted(const QString &uploadId);
    void progressChanged(const UploadProgress &progress);
    void uploadCompleted(const QString &uploadId, int totalChunks);
    void uploadFailed(const QString &uploadId, const QString &error);

    /**
     * @brief Emitted when a task was parked in the offline queue.
     * @param reason Why it was not uploaded.
     */
    void taskQueued(const QString &uploadId, const QString &reason);

    /**
     * @brief Short user-facing message for a status line.
     */
    void statusMessage(const QString &message, int timeout);

private slots:
    void onProgressChanged(const UploadProgress &progress);
    void onUploadFinished(const QString &uploadId, int totalChunks);
    void onUploadFailed(const QString &uploadId, const QString &error);

private:
    SubmitResult enqueue(const UploadTask &task, const QString &reason);

    ConnectionStateManager *connection_ = nullptr;
    ChunkedUploadPipeline *pipeline_ = nullptr;
    OfflineQueue *queue_ = nullptr;

    bool queueOnFailure_ = true;
    std::optional<UploadTask> activeTask_;
};

#endif // SYNCSERVICE_H
