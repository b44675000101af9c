#include "uploadtask.h"
#include "jobstatus.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>

namespace {

QJsonObject groupsToWireJson(const TranslationEntries &entries)
{
    QJsonObject json;
    for (const TranslationGroup &group : entries) {
        QJsonObject translations;
        for (const auto &pair : group.translations) {
            translations[pair.first] = pair.second;
        }
        json[group.groupKey] = translations;
    }
    return json;
}

qint64 compactSize(const QJsonObject &json)
{
    return QJsonDocument(json).toJson(QJsonDocument::Compact).size();
}

TranslationPairs stringPairs(const QJsonObject &json)
{
    TranslationPairs pairs;
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (it.value().isString()) {
            pairs.append(qMakePair(it.key(), it.value().toString()));
        }
    }
    return pairs;
}

} // namespace

QJsonObject UploadChunk::entriesToJson() const
{
    return groupsToWireJson(entries);
}

qint64 UploadChunk::byteSize() const
{
    return compactSize(entriesToJson());
}

QString UploadTask::makeUploadId(const QString &jobId, qint64 epochMs)
{
    return QString("upload_%1_%2").arg(epochMs).arg(jobId);
}

UploadTask UploadTask::create(const QString &projectId, const QString &scanId,
                              const TranslationEntries &entries,
                              const QJsonObject &metadata)
{
    UploadTask task;
    task.createdAt = QDateTime::currentDateTimeUtc();
    task.uploadId = makeUploadId(scanId, task.createdAt.toMSecsSinceEpoch());
    task.projectId = projectId;
    task.scanId = scanId;
    task.entries = entries;
    task.metadata = metadata;
    return task;
}

UploadTask UploadTask::fromScanResult(const QString &projectId, const ScanResult &result)
{
    TranslationEntries entries;

    if (!result.entries.isEmpty()) {
        // Per-mod extraction: {mod_id: {entries: {key: text}}}
        for (auto it = result.entries.constBegin(); it != result.entries.constEnd(); ++it) {
            const QJsonObject mod = it.value().toObject();
            if (!mod.contains("entries")) {
                continue;
            }
            entries.append(TranslationGroup{it.key(), stringPairs(mod["entries"].toObject())});
        }
    } else {
        for (const QJsonValue &value : result.languageFiles) {
            const QJsonObject file = value.toObject();
            const QJsonObject fileEntries = file["entries"].toObject();
            if (fileEntries.isEmpty()) {
                continue;
            }
            QString locale = file["locale"].toString();
            if (locale.isEmpty()) {
                locale = file["language_code"].toString();
            }
            const QString groupKey = file["mod_id"].toString() + '/' + locale;

            // Several files may contribute to the same mod and locale
            auto existing = std::find_if(entries.begin(), entries.end(),
                [&groupKey](const TranslationGroup &group) {
                    return group.groupKey == groupKey;
                });
            if (existing != entries.end()) {
                existing->translations.append(stringPairs(fileEntries));
            } else {
                entries.append(TranslationGroup{groupKey, stringPairs(fileEntries)});
            }
        }
    }

    QJsonObject metadata;
    metadata["totalMods"] = result.statistics.totalMods;
    metadata["totalFiles"] = result.statistics.totalLanguageFiles;
    metadata["totalEntries"] = result.statistics.totalKeys;
    metadata["scanTime"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);

    return create(projectId, result.scanId, entries, metadata);
}

qint64 UploadTask::itemCount() const
{
    qint64 count = 0;
    for (const TranslationGroup &group : entries) {
        count += group.translations.size();
    }
    return count;
}

qint64 UploadTask::totalBytes() const
{
    return compactSize(groupsToWireJson(entries));
}

QList<UploadChunk> UploadTask::partition(int chunkSize) const
{
    QList<UploadChunk> chunks;
    if (chunkSize <= 0 || entries.isEmpty()) {
        return chunks;
    }

    const auto groupCount = static_cast<int>(entries.size());
    const int totalChunks = (groupCount + chunkSize - 1) / chunkSize;

    for (int i = 0; i < totalChunks; ++i) {
        UploadChunk chunk;
        chunk.index = i;
        chunk.totalChunks = totalChunks;
        chunk.entries = entries.mid(i * chunkSize, chunkSize);
        chunks.append(chunk);
    }
    return chunks;
}

QJsonObject UploadTask::chunkPayload(const UploadChunk &chunk) const
{
    QJsonObject body;
    body["uploadId"] = uploadId;
    body["projectId"] = projectId;
    body["scanId"] = scanId;
    body["chunkIndex"] = chunk.index;
    body["totalChunks"] = chunk.totalChunks;
    body["entries"] = chunk.entriesToJson();
    if (chunk.index == 0 && !metadata.isEmpty()) {
        body["metadata"] = metadata;
    }
    return body;
}

QJsonObject UploadTask::toJson() const
{
    QJsonArray groups;
    for (const TranslationGroup &group : entries) {
        QJsonArray translations;
        for (const auto &pair : group.translations) {
            translations.append(QJsonArray{pair.first, pair.second});
        }
        QJsonObject groupJson;
        groupJson["group"] = group.groupKey;
        groupJson["translations"] = translations;
        groups.append(groupJson);
    }

    QJsonObject json;
    json["upload_id"] = uploadId;
    json["project_id"] = projectId;
    json["scan_id"] = scanId;
    json["entries"] = groups;
    json["metadata"] = metadata;
    json["created_at"] = createdAt.toString(Qt::ISODateWithMs);
    return json;
}

UploadTask UploadTask::fromJson(const QJsonObject &json)
{
    UploadTask task;
    task.uploadId = json["upload_id"].toString();
    task.projectId = json["project_id"].toString();
    task.scanId = json["scan_id"].toString();
    task.metadata = json["metadata"].toObject();
    task.createdAt = QDateTime::fromString(json["created_at"].toString(), Qt::ISODateWithMs);

    const QJsonArray groups = json["entries"].toArray();
    for (const QJsonValue &groupValue : groups) {
        const QJsonObject groupJson = groupValue.toObject();
        TranslationGroup group;
        group.groupKey = groupJson["group"].toString();
        const QJsonArray translations = groupJson["translations"].toArray();
        for (const QJsonValue &pairValue : translations) {
            const QJsonArray pair = pairValue.toArray();
            if (pair.size() == 2) {
                group.translations.append(qMakePair(pair[0].toString(), pair[1].toString()));
            }
        }
        task.entries.append(group);
    }
    return task;
}
