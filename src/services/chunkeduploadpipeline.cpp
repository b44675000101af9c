#include "chunkeduploadpipeline.h"

#include "services/itranshubclient.h"
#include "utils/logging.h"

#include <algorithm>
#include <utility>

ChunkedUploadPipeline::ChunkedUploadPipeline(ITransHubClient *client, QObject *parent)
    : QObject(parent)
    , client_(client)
    , retryTimer_(new QTimer(this))
{
    retryTimer_->setSingleShot(true);
    connect(retryTimer_, &QTimer::timeout, this, &ChunkedUploadPipeline::sendCurrentChunk);
}

ChunkedUploadPipeline::~ChunkedUploadPipeline()
{
    token_.cancel();
}

int ChunkedUploadPipeline::retryDelayMs(int baseMs, int attempt)
{
    if (baseMs <= 0) {
        return 0;
    }
    // 2^15 already exceeds any useful base delay times the cap
    const int exponent = std::clamp(attempt - 1, 0, 15);
    const qint64 delay = static_cast<qint64>(baseMs) << exponent;
    return static_cast<int>(std::min<qint64>(delay, MaxRetryDelayMs));
}

bool ChunkedUploadPipeline::upload(const UploadTask &task, const UploadOptions &options)
{
    if (busy_) {
        qWarning() << "ChunkedUploadPipeline: upload" << task.uploadId
                   << "rejected, still sending" << task_.uploadId;
        return false;
    }
    if (!options.isValid()) {
        qWarning() << "ChunkedUploadPipeline: invalid options for" << task.uploadId
                   << "chunkSize" << options.chunkSize << "maxRetries" << options.maxRetries;
        return false;
    }

    token_.cancel();
    token_ = CancellationToken();
    busy_ = true;
    task_ = task;
    options_ = options;
    chunks_ = task.partition(options.chunkSize);
    currentIndex_ = 0;

    chunkBytes_.clear();
    qint64 totalBytes = 0;
    for (const UploadChunk &chunk : std::as_const(chunks_)) {
        chunkBytes_.append(chunk.byteSize());
        totalBytes += chunkBytes_.last();
    }

    progress_ = UploadProgress();
    progress_.uploadId = task.uploadId;
    progress_.totalChunks = static_cast<int>(chunks_.size());
    progress_.totalBytes = totalBytes;
    elapsed_.start();

    qInfo() << "ChunkedUploadPipeline: uploading" << task.uploadId << "in"
            << chunks_.size() << "chunks," << totalBytes << "bytes";

    const CancellationToken token = token_;
    publish(UploadStatus::Preparing);
    if (token.isCancelled()) {
        return true;
    }

    if (chunks_.isEmpty()) {
        finishCompleted();
        return true;
    }

    sendCurrentChunk();
    return true;
}

void ChunkedUploadPipeline::cancel()
{
    if (!busy_) {
        return;
    }
    qInfo() << "ChunkedUploadPipeline: upload" << task_.uploadId << "cancelled";
    token_.cancel();
    retryTimer_->stop();
    busy_ = false;
}

void ChunkedUploadPipeline::sendCurrentChunk()
{
    if (!busy_ || currentIndex_ >= chunks_.size()) {
        return;
    }

    UploadChunk &chunk = chunks_[currentIndex_];
    chunk.attempt++;
    chunk.state = ChunkState::InFlight;
    progress_.currentChunk = currentIndex_ + 1;

    const CancellationToken token = token_;
    publish(UploadStatus::Uploading);
    if (token.isCancelled()) {
        return;
    }

    LOG_VERBOSE() << "ChunkedUploadPipeline: sending chunk" << chunk.index + 1 << "of"
                  << chunk.totalChunks << "attempt" << chunk.attempt;

    client_->uploadChunk(task_.chunkPayload(chunk),
        [this, token]() {
            if (token.isCancelled()) {
                return;
            }
            onChunkAccepted();
        },
        [this, token](const RequestError &error) {
            if (token.isCancelled()) {
                return;
            }
            onChunkFailed(error);
        });
}

void ChunkedUploadPipeline::onChunkAccepted()
{
    UploadChunk &chunk = chunks_[currentIndex_];
    chunk.state = ChunkState::Succeeded;

    progress_.completedChunks++;
    progress_.bytesUploaded += chunkBytes_.at(currentIndex_);
    progress_.percentage = 100.0 * progress_.completedChunks / progress_.totalChunks;
    progress_.error.clear();
    updateThroughput();

    const CancellationToken token = token_;
    publish(UploadStatus::Uploading);
    if (token.isCancelled()) {
        return;
    }

    currentIndex_++;
    if (currentIndex_ >= chunks_.size()) {
        finishCompleted();
    } else {
        sendCurrentChunk();
    }
}

void ChunkedUploadPipeline::onChunkFailed(const RequestError &error)
{
    UploadChunk &chunk = chunks_[currentIndex_];
    chunk.state = ChunkState::Failed;

    if (chunk.attempt < options_.maxRetries) {
        const int delay = retryDelayMs(options_.retryDelayMs, chunk.attempt);
        qWarning() << "ChunkedUploadPipeline: chunk" << chunk.index + 1 << "attempt"
                   << chunk.attempt << "failed:" << error.message << "- retrying in" << delay << "ms";

        const CancellationToken token = token_;
        publish(UploadStatus::Retrying, error.message);
        if (token.isCancelled()) {
            return;
        }
        retryTimer_->start(delay);
        return;
    }

    qWarning() << "ChunkedUploadPipeline: chunk" << chunk.index + 1 << "failed after"
               << chunk.attempt << "attempts:" << error.message;
    finishFailed(error.message);
}

void ChunkedUploadPipeline::finishCompleted()
{
    progress_.percentage = 100.0;
    progress_.currentChunk = progress_.totalChunks;
    progress_.etaSeconds = 0.0;
    updateThroughput();

    const QString uploadId = task_.uploadId;
    const int totalChunks = progress_.totalChunks;
    busy_ = false;
    token_.cancel();

    qInfo() << "ChunkedUploadPipeline: upload" << uploadId << "completed," << totalChunks << "chunks";
    publish(UploadStatus::Completed);
    emit uploadFinished(uploadId, totalChunks);
}

void ChunkedUploadPipeline::finishFailed(const QString &error)
{
    const QString uploadId = task_.uploadId;
    busy_ = false;
    token_.cancel();
    retryTimer_->stop();

    publish(UploadStatus::Failed, error);
    emit uploadFailed(uploadId, error);
}

void ChunkedUploadPipeline::updateThroughput()
{
    const double elapsedSec = elapsed_.elapsed() / 1000.0;
    progress_.speedBytesPerSec = elapsedSec > 0.0 ? progress_.bytesUploaded / elapsedSec : 0.0;

    const qint64 remainingBytes = progress_.totalBytes - progress_.bytesUploaded;
    progress_.etaSeconds = progress_.speedBytesPerSec > 0.0
        ? std::max(0.0, remainingBytes / progress_.speedBytesPerSec)
        : 0.0;
}

void ChunkedUploadPipeline::publish(UploadStatus status, const QString &error)
{
    progress_.status = status;
    progress_.error = error;

    // Copies: a slot may start the next upload and replace both
    const UploadProgress snapshot = progress_;
    const auto onProgress = options_.onProgress;

    if (onProgress) {
        onProgress(snapshot);
    }
    emit progressChanged(snapshot);
}
