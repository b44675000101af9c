/**
 * @file chunkeduploadpipeline.h
 * @brief Sequential chunked upload of translation data with per-chunk retry.
 */

#ifndef CHUNKEDUPLOADPIPELINE_H
#define CHUNKEDUPLOADPIPELINE_H

#include <QElapsedTimer>
#include <QList>
#include <QObject>
#include <QTimer>

#include <functional>

#include "models/uploadtask.h"
#include "services/restclient.h"
#include "utils/cancellationtoken.h"

class ITransHubClient;

/**
 * @brief Tuning for one upload.
 */
struct UploadOptions {
    int chunkSize = 100;      ///< Translation groups per chunk
    int maxRetries = 3;       ///< Total submissions allowed per chunk
    int retryDelayMs = 1000;  ///< Base delay of the exponential backoff
    std::function<void(const UploadProgress &)> onProgress;

    [[nodiscard]] bool isValid() const {
        return chunkSize > 0 && maxRetries > 0 && retryDelayMs >= 0;
    }
};

/**
 * @brief Uploads one task at a time as an ordered series of chunks.
 *
 * Chunk i+1 is only sent after chunk i was accepted. A failed chunk is
 * resubmitted after retryDelayMs x 2^(attempt-1) milliseconds (capped at
 * MaxRetryDelayMs) until maxRetries submissions have failed, at which point
 * the whole upload fails and no later chunk is sent. Chunks the server
 * already accepted stay there; a later upload of the same task reuses its
 * uploadId so the server replaces them.
 *
 * Progress is published through progressChanged() and the options'
 * onProgress callback with identical values.
 *
 * @par Example usage:
 * @code
 * ChunkedUploadPipeline *pipeline = new ChunkedUploadPipeline(transHub, this);
 * connect(pipeline, &ChunkedUploadPipeline::uploadFinished,
 *         this, &MyClass::onUploaded);
 * connect(pipeline, &ChunkedUploadPipeline::uploadFailed,
 *         this, &MyClass::onUploadFailed);
 *
 * UploadOptions options;
 * options.chunkSize = 50;
 * pipeline->upload(task, options);
 * @endcode
 */
class ChunkedUploadPipeline : public QObject
{
    Q_OBJECT

public:
    /// Upper bound for a single backoff wait
    static constexpr int MaxRetryDelayMs = 30000;

    /**
     * @brief Constructs a pipeline.
     * @param client Trans-Hub client used to send chunks (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit ChunkedUploadPipeline(ITransHubClient *client, QObject *parent = nullptr);
    ~ChunkedUploadPipeline() override;

    /**
     * @brief Starts uploading a task.
     * @param task The task to send. An empty task completes immediately.
     * @param options Chunking and retry tuning.
     * @return False if another upload is running or the options are invalid.
     */
    bool upload(const UploadTask &task, const UploadOptions &options = UploadOptions());

    /**
     * @brief Abandons the current upload without emitting further signals.
     *
     * A chunk already on the wire is allowed to finish; its outcome is ignored.
     */
    void cancel();

    [[nodiscard]] bool isBusy() const { return busy_; }

    /**
     * @brief Returns the most recently published progress.
     */
    [[nodiscard]] UploadProgress progress() const { return progress_; }

    /**
     * @brief Returns the chunks of the current or last upload.
     */
    [[nodiscard]] QList<UploadChunk> chunks() const { return chunks_; }

    /**
     * @brief Returns the task of the current or last upload.
     */
    [[nodiscard]] UploadTask currentTask() const { return task_; }

    /**
     * @brief Backoff before resubmitting after the given failed attempt.
     * @param baseMs Base delay.
     * @param attempt 1-based number of the attempt that just failed.
     */
    [[nodiscard]] static int retryDelayMs(int baseMs, int attempt);

signals:
    /**
     * @brief Emitted on every phase change and after every accepted chunk.
     */
    void progressChanged(const UploadProgress &progress);

    /**
     * @brief Emitted once every chunk was accepted.
     */
    void uploadFinished(const QString &uploadId, int totalChunks);

    /**
     * @brief Emitted when a chunk ran out of retries.
     */
    void uploadFailed(const QString &uploadId, const QString &error);

private slots:
    void sendCurrentChunk();

private:
    void onChunkAccepted();
    void onChunkFailed(const RequestError &error);
    void finishCompleted();
    void finishFailed(const QString &error);
    void updateThroughput();
    void publish(UploadStatus status, const QString &error = QString());

    ITransHubClient *client_ = nullptr;
    QTimer *retryTimer_ = nullptr;
    QElapsedTimer elapsed_;

    UploadTask task_;
    UploadOptions options_;
    QList<UploadChunk> chunks_;
    QList<qint64> chunkBytes_;
    int currentIndex_ = 0;
    UploadProgress progress_;
    bool busy_ = false;
    CancellationToken token_;
};

#endif // CHUNKEDUPLOADPIPELINE_H
