#include "jobstatus.h"

JobState jobStateFromString(const QString &state)
{
    const QString normalized = state.trimmed().toLower();

    if (normalized == "running" || normalized == "scanning" ||
        normalized == "processing") {
        return JobState::Running;
    }
    if (normalized == "completed") {
        return JobState::Completed;
    }
    if (normalized == "failed") {
        return JobState::Failed;
    }
    if (normalized == "cancelled" || normalized == "canceled") {
        return JobState::Cancelled;
    }
    return JobState::Pending;
}

JobStatus JobStatus::fromJson(const QString &jobId, const QJsonObject &json)
{
    JobStatus status;
    status.jobId = jobId;
    status.state = jobStateFromString(json["status"].toString());

    // Newer engines nest progress details, older ones report flat fields
    const QJsonValue progressValue = json["progress"];
    const QJsonObject nested = progressValue.toObject();

    if (progressValue.isObject()) {
        status.progressPercent = nested["percent"].toDouble();
    } else {
        status.progressPercent = progressValue.toDouble();
    }

    status.processedCount = json.contains("processed_files")
        ? json["processed_files"].toInteger()
        : nested["processed"].toInteger();

    status.totalCount = json.contains("total_files")
        ? json["total_files"].toInteger()
        : nested["total"].toInteger();

    status.currentItemLabel = json["current_file"].toString();
    if (status.currentItemLabel.isEmpty()) {
        status.currentItemLabel = nested["current_item"].toString();
    }

    if (status.state == JobState::Failed) {
        status.errorMessage = json["error"].toString();
        if (status.errorMessage.isEmpty()) {
            status.errorMessage = json["error_message"].toString();
        }
    }

    return status;
}

QJsonObject ScanStatistics::toJson() const
{
    QJsonObject json;
    json["total_mods"] = totalMods;
    json["total_language_files"] = totalLanguageFiles;
    json["total_keys"] = totalKeys;
    json["scan_duration_ms"] = scanDurationMs;
    return json;
}

ScanResult ScanResult::fromJson(const QString &jobId, const QJsonObject &json)
{
    ScanResult result;
    result.scanId = json["scan_id"].toString();
    if (result.scanId.isEmpty()) {
        result.scanId = jobId;
    }
    result.mods = json["mods"].toArray();
    result.languageFiles = json["language_files"].toArray();
    result.entries = json["entries"].toObject();

    // Statistics are either grouped or flattened into the result object
    const QJsonObject stats = json.contains("statistics")
        ? json["statistics"].toObject()
        : json;
    result.statistics.totalMods = stats["total_mods"].toInt();
    result.statistics.totalLanguageFiles = stats["total_language_files"].toInt();
    result.statistics.totalKeys = stats.contains("total_keys")
        ? stats["total_keys"].toInteger()
        : stats["total_entries"].toInteger();
    result.statistics.scanDurationMs = stats["scan_duration_ms"].toInteger();

    return result;
}
