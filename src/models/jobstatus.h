/**
 * @file jobstatus.h
 * @brief Remote scan job state, status snapshots and final results.
 */

#ifndef JOBSTATUS_H
#define JOBSTATUS_H

#include <QJsonArray>
#include <QJsonObject>
#include <QMetaType>
#include <QString>

/**
 * @brief Lifecycle state of a server-side scan job.
 */
enum class JobState {
    Pending,    ///< Accepted, not started yet
    Running,    ///< Scanning in progress
    Completed,  ///< Finished successfully (terminal)
    Failed,     ///< Finished with an error (terminal)
    Cancelled   ///< Stopped on request (terminal)
};

/// @brief Convert JobState to its wire/debug string
[[nodiscard]] inline const char* jobStateToString(JobState state) {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Running: return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Parses a wire state string.
 *
 * Accepts the engine's aliases ("scanning", "processing" for Running and
 * "canceled" for Cancelled). Unknown or empty strings map to Pending.
 */
[[nodiscard]] JobState jobStateFromString(const QString &state);

/// @brief True for Completed, Failed and Cancelled
[[nodiscard]] inline bool isTerminalState(JobState state) {
    return state == JobState::Completed ||
           state == JobState::Failed ||
           state == JobState::Cancelled;
}

/**
 * @brief Snapshot of a remote scan job as reported by the status endpoint.
 */
struct JobStatus {
    QString jobId;                      ///< Opaque job identifier
    JobState state = JobState::Pending; ///< Current lifecycle state
    double progressPercent = 0.0;       ///< Server-reported progress, not corrected client-side
    qint64 processedCount = 0;          ///< Items processed so far
    qint64 totalCount = 0;              ///< Items discovered in total
    QString currentItemLabel;           ///< Work-in-progress descriptor, may be empty
    QString errorMessage;               ///< Only set when state is Failed

    [[nodiscard]] bool isTerminal() const { return isTerminalState(state); }

    /**
     * @brief Builds a status from a status-endpoint payload.
     * @param jobId The job the payload belongs to.
     * @param json Flat or nested ("progress": {...}) status object.
     */
    [[nodiscard]] static JobStatus fromJson(const QString &jobId, const QJsonObject &json);
};

/**
 * @brief Aggregate statistics reported with a finished scan.
 */
struct ScanStatistics {
    int totalMods = 0;
    int totalLanguageFiles = 0;
    qint64 totalKeys = 0;
    qint64 scanDurationMs = 0;

    [[nodiscard]] QJsonObject toJson() const;
};

/**
 * @brief Full result payload of a completed scan.
 */
struct ScanResult {
    QString scanId;
    QJsonArray mods;           ///< Mod descriptors, passed through untouched
    QJsonArray languageFiles;  ///< Language file descriptors, optionally with "entries"
    QJsonObject entries;       ///< Extracted entries per mod: {mod_id: {entries: {key: text}}}
    ScanStatistics statistics;

    /**
     * @brief Builds a result from a result-endpoint payload.
     * @param jobId Fallback scan id when the payload omits "scan_id".
     * @param json The result object.
     */
    [[nodiscard]] static ScanResult fromJson(const QString &jobId, const QJsonObject &json);
};

Q_DECLARE_METATYPE(JobState)
Q_DECLARE_METATYPE(JobStatus)
Q_DECLARE_METATYPE(ScanResult)

#endif // JOBSTATUS_H
