/**
 * @file offlinequeue.cpp
 * @brief Implementation of the OfflineQueue.
 */

#include "offlinequeue.h"

#include "utils/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QSettings>

OfflineQueue::OfflineQueue(QObject *parent)
    : QObject(parent)
{
    loadSettings();
}

std::optional<UploadTask> OfflineQueue::head() const
{
    if (tasks_.isEmpty()) {
        return std::nullopt;
    }
    return tasks_.first();
}

bool OfflineQueue::contains(const QString &uploadId) const
{
    for (const UploadTask &task : tasks_) {
        if (task.uploadId == uploadId) {
            return true;
        }
    }
    return false;
}

bool OfflineQueue::enqueue(const UploadTask &task)
{
    if (task.uploadId.isEmpty() || contains(task.uploadId)) {
        return false;
    }

    tasks_.append(task);
    saveSettings();
    LOG_VERBOSE() << "OfflineQueue: queued" << task.uploadId << "size" << tasks_.size();
    emit taskEnqueued(task.uploadId);
    emit sizeChanged(count());
    return true;
}

bool OfflineQueue::removeHead(const QString &uploadId)
{
    if (tasks_.isEmpty() || tasks_.first().uploadId != uploadId) {
        return false;
    }

    tasks_.removeFirst();
    saveSettings();
    LOG_VERBOSE() << "OfflineQueue: delivered" << uploadId << "size" << tasks_.size();
    emit taskRemoved(uploadId);
    emit sizeChanged(count());
    return true;
}

void OfflineQueue::clear()
{
    if (tasks_.isEmpty()) {
        return;
    }

    tasks_.clear();
    saveSettings();
    emit sizeChanged(0);
}

void OfflineQueue::loadSettings()
{
    QSettings settings;
    const QByteArray data = settings.value(SettingsKey).toByteArray();

    tasks_.clear();
    if (data.isEmpty()) {
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (!doc.isArray()) {
        qWarning() << "OfflineQueue: ignoring unreadable stored queue:"
                   << parseError.errorString();
        return;
    }

    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        UploadTask task = UploadTask::fromJson(value.toObject());
        if (!task.uploadId.isEmpty()) {
            tasks_.append(task);
        }
    }
}

void OfflineQueue::saveSettings()
{
    QJsonArray array;
    for (const UploadTask &task : tasks_) {
        array.append(task.toJson());
    }

    QSettings settings;
    settings.setValue(SettingsKey,
                      QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact)));
}
