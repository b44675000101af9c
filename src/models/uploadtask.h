/**
 * @file uploadtask.h
 * @brief Upload tasks, their chunks and the progress reported while sending them.
 */

#ifndef UPLOADTASK_H
#define UPLOADTASK_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QPair>
#include <QString>

struct ScanResult;

/// Ordered key to text pairs of one translation group
using TranslationPairs = QList<QPair<QString, QString>>;

/**
 * @brief Translations for one mod and locale, keyed "<mod_id>/<locale>".
 */
struct TranslationGroup {
    QString groupKey;
    TranslationPairs translations;
};

/// Ordered groups making up the payload of an upload
using TranslationEntries = QList<TranslationGroup>;

/**
 * @brief Transmission state of a single chunk.
 */
enum class ChunkState {
    Pending,
    InFlight,
    Succeeded,
    Failed
};

[[nodiscard]] inline const char* chunkStateToString(ChunkState state) {
    switch (state) {
        case ChunkState::Pending: return "pending";
        case ChunkState::InFlight: return "inFlight";
        case ChunkState::Succeeded: return "succeeded";
        case ChunkState::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief One bounded slice of an upload, sent and retried on its own.
 */
struct UploadChunk {
    int index = 0;
    int totalChunks = 0;
    TranslationEntries entries;
    int attempt = 0;                       ///< Submissions made so far
    ChunkState state = ChunkState::Pending;

    /// @brief Wire form of the entries: {groupKey: {key: text}}
    [[nodiscard]] QJsonObject entriesToJson() const;

    /// @brief Compact JSON size of entriesToJson() in bytes
    [[nodiscard]] qint64 byteSize() const;
};

/**
 * @brief A dataset destined for Trans-Hub.
 *
 * The uploadId stays fixed for the task's whole life, including any time
 * spent in the offline queue, so a re-sent chunk replaces the earlier copy
 * on the server instead of being counted twice.
 */
struct UploadTask {
    QString uploadId;
    QString projectId;
    QString scanId;
    TranslationEntries entries;
    QJsonObject metadata;      ///< Sent with chunk 0 only
    QDateTime createdAt;

    /**
     * @brief Builds an upload id of the form "upload_<epochMs>_<jobId>".
     */
    [[nodiscard]] static QString makeUploadId(const QString &jobId, qint64 epochMs);

    /**
     * @brief Creates a task with a fresh upload id.
     */
    [[nodiscard]] static UploadTask create(const QString &projectId,
                                           const QString &scanId,
                                           const TranslationEntries &entries,
                                           const QJsonObject &metadata = QJsonObject());

    /**
     * @brief Creates a task from a completed scan.
     *
     * Entries come from the per-mod "entries" of the result, grouped under
     * the mod id. Results without them fall back to each language file's
     * "entries" object, grouped under "<mod_id>/<locale>", skipping files
     * without entries. The scan statistics go into the metadata.
     */
    [[nodiscard]] static UploadTask fromScanResult(const QString &projectId,
                                                   const ScanResult &result);

    /// @brief Total number of key/text pairs across all groups
    [[nodiscard]] qint64 itemCount() const;

    /// @brief Compact JSON size of all entries in bytes
    [[nodiscard]] qint64 totalBytes() const;

    [[nodiscard]] bool isEmpty() const { return entries.isEmpty(); }

    /**
     * @brief Splits the groups into ceil(groups / chunkSize) ordered chunks.
     * @param chunkSize Groups per chunk, must be positive.
     */
    [[nodiscard]] QList<UploadChunk> partition(int chunkSize) const;

    /**
     * @brief Builds the upload-chunk request body for one chunk.
     */
    [[nodiscard]] QJsonObject chunkPayload(const UploadChunk &chunk) const;

    /// @name Persistence
    /// Order-preserving form used by the offline queue.
    /// @{
    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static UploadTask fromJson(const QJsonObject &json);
    /// @}
};

/**
 * @brief Phase reported with each UploadProgress.
 */
enum class UploadStatus {
    Preparing,
    Uploading,
    Retrying,
    Completed,
    Failed
};

[[nodiscard]] inline const char* uploadStatusToString(UploadStatus status) {
    switch (status) {
        case UploadStatus::Preparing: return "preparing";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Retrying: return "retrying";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief Progress of an upload, derived on every state change and never persisted.
 */
struct UploadProgress {
    QString uploadId;
    int totalChunks = 0;
    int completedChunks = 0;
    int currentChunk = 0;               ///< 1-based number of the chunk being sent
    double percentage = 0.0;
    qint64 bytesUploaded = 0;
    qint64 totalBytes = 0;
    double speedBytesPerSec = 0.0;
    double etaSeconds = 0.0;
    UploadStatus status = UploadStatus::Preparing;
    QString error;                      ///< Last error for Retrying and Failed

    [[nodiscard]] bool isTerminal() const {
        return status == UploadStatus::Completed || status == UploadStatus::Failed;
    }
};

Q_DECLARE_METATYPE(UploadTask)
Q_DECLARE_METATYPE(UploadProgress)

#endif // UPLOADTASK_H
