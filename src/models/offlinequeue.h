/**
 * @file offlinequeue.h
 * @brief Durable FIFO of upload tasks waiting for Trans-Hub to come back.
 */

#ifndef OFFLINEQUEUE_H
#define OFFLINEQUEUE_H

#include "uploadtask.h"

#include <QList>
#include <QObject>

#include <optional>

/**
 * @brief FIFO of whole upload tasks, persisted across restarts.
 *
 * The queue is only ever appended to and drained from the head. A task stays
 * at the head until its upload has fully succeeded, so a crash or a failed
 * flush leaves it in place for the next attempt. Queued tasks are never
 * modified.
 *
 * Contents are stored with QSettings under "offline_queue" as a compact JSON
 * array and written through on every change.
 */
class OfflineQueue : public QObject
{
    Q_OBJECT

public:
    /// QSettings key holding the serialized queue
    static constexpr const char *SettingsKey = "offline_queue";

    explicit OfflineQueue(QObject *parent = nullptr);
    ~OfflineQueue() override = default;

    /**
     * @brief Returns the task at the head of the queue, if any.
     */
    [[nodiscard]] std::optional<UploadTask> head() const;

    [[nodiscard]] int count() const { return static_cast<int>(tasks_.size()); }
    [[nodiscard]] bool isEmpty() const { return tasks_.isEmpty(); }

    /**
     * @brief Returns all queued tasks in FIFO order.
     */
    [[nodiscard]] QList<UploadTask> tasks() const { return tasks_; }

    /**
     * @brief Checks whether a task with the given upload id is queued.
     */
    [[nodiscard]] bool contains(const QString &uploadId) const;

public slots:
    /**
     * @brief Appends a task to the tail.
     * @param task The task to queue.
     * @return False if a task with the same upload id is already queued.
     */
    bool enqueue(const UploadTask &task);

    /**
     * @brief Removes the head task after it was delivered.
     * @param uploadId Must match the current head; anything else is ignored.
     * @return True if the head was removed.
     */
    bool removeHead(const QString &uploadId);

    /**
     * @brief Drops every queued task.
     */
    void clear();

    /**
     * @brief Loads the queue from persistent storage.
     */
    void loadSettings();

    /**
     * @brief Saves the queue to persistent storage.
     */
    void saveSettings();

signals:
    /**
     * @brief Emitted after a task was appended.
     */
    void taskEnqueued(const QString &uploadId);

    /**
     * @brief Emitted after the head task was removed.
     */
    void taskRemoved(const QString &uploadId);

    /**
     * @brief Emitted whenever the number of queued tasks changes.
     */
    void sizeChanged(int count);

private:
    QList<UploadTask> tasks_;
};

#endif // OFFLINEQUEUE_H
