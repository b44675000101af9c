#include <QtTest>
#include <QSettings>
#include <QSignalSpy>
#include <QStandardPaths>

#include "models/offlinequeue.h"

namespace {

UploadTask makeTask(const QString &scanId, int groups = 1)
{
    TranslationEntries entries;
    for (int i = 0; i < groups; ++i) {
        TranslationGroup group;
        group.groupKey = QString("%1/en_us").arg(scanId);
        group.translations.append(qMakePair(QString("key.%1").arg(i), QString("Value %1").arg(i)));
        entries.append(group);
    }
    UploadTask task = UploadTask::create("proj", scanId, entries);
    task.uploadId = "upload_" + scanId;
    return task;
}

} // namespace

class TestOfflineQueue : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QCoreApplication::setOrganizationName("scansync-tests");
        QCoreApplication::setApplicationName("test_offlinequeue");
    }

    void init()
    {
        QSettings().clear();
    }

    void cleanupTestCase()
    {
        QSettings().clear();
    }

    // ========== FIFO behaviour ==========

    void testStartsEmpty()
    {
        OfflineQueue queue;
        QVERIFY(queue.isEmpty());
        QCOMPARE(queue.count(), 0);
        QVERIFY(!queue.head().has_value());
    }

    void testFifoOrder()
    {
        OfflineQueue queue;
        QVERIFY(queue.enqueue(makeTask("a")));
        QVERIFY(queue.enqueue(makeTask("b")));
        QVERIFY(queue.enqueue(makeTask("c")));

        QCOMPARE(queue.count(), 3);
        QCOMPARE(queue.head()->uploadId, QString("upload_a"));

        QVERIFY(queue.removeHead("upload_a"));
        QCOMPARE(queue.head()->uploadId, QString("upload_b"));
        QVERIFY(queue.removeHead("upload_b"));
        QCOMPARE(queue.head()->uploadId, QString("upload_c"));
    }

    void testRejectsDuplicateAndEmptyIds()
    {
        OfflineQueue queue;
        QVERIFY(queue.enqueue(makeTask("a")));
        QVERIFY(!queue.enqueue(makeTask("a")));

        UploadTask anonymous = makeTask("b");
        anonymous.uploadId.clear();
        QVERIFY(!queue.enqueue(anonymous));

        QCOMPARE(queue.count(), 1);
    }

    void testRemoveHeadRequiresMatchingId()
    {
        OfflineQueue queue;
        queue.enqueue(makeTask("a"));
        queue.enqueue(makeTask("b"));

        // Only the head can leave the queue
        QVERIFY(!queue.removeHead("upload_b"));
        QVERIFY(!queue.removeHead("upload_missing"));
        QCOMPARE(queue.count(), 2);
        QVERIFY(queue.contains("upload_b"));

        queue.clear();
        QVERIFY(!queue.removeHead("upload_a"));
    }

    void testQueuedTaskIsUnchanged()
    {
        OfflineQueue queue;
        const UploadTask task = makeTask("a", 3);
        queue.enqueue(task);

        const UploadTask head = *queue.head();
        QCOMPARE(head.scanId, task.scanId);
        QCOMPARE(head.projectId, task.projectId);
        QCOMPARE(head.entries.size(), 1);
        QCOMPARE(head.entries.first().translations.size(), 3);
    }

    // ========== Signals ==========

    void testSignals()
    {
        OfflineQueue queue;
        QSignalSpy enqueuedSpy(&queue, &OfflineQueue::taskEnqueued);
        QSignalSpy removedSpy(&queue, &OfflineQueue::taskRemoved);
        QSignalSpy sizeSpy(&queue, &OfflineQueue::sizeChanged);

        queue.enqueue(makeTask("a"));
        queue.enqueue(makeTask("b"));
        queue.enqueue(makeTask("a"));
        queue.removeHead("upload_a");
        queue.clear();
        queue.clear();

        QCOMPARE(enqueuedSpy.count(), 2);
        QCOMPARE(removedSpy.count(), 1);
        QCOMPARE(removedSpy.at(0).at(0).toString(), QString("upload_a"));

        QCOMPARE(sizeSpy.count(), 4);
        QCOMPARE(sizeSpy.at(0).at(0).toInt(), 1);
        QCOMPARE(sizeSpy.at(1).at(0).toInt(), 2);
        QCOMPARE(sizeSpy.at(2).at(0).toInt(), 1);
        QCOMPARE(sizeSpy.at(3).at(0).toInt(), 0);
    }

    // ========== Persistence ==========

    void testSurvivesRestart()
    {
        {
            OfflineQueue queue;
            queue.enqueue(makeTask("a", 2));
            queue.enqueue(makeTask("b"));
        }

        OfflineQueue restored;
        QCOMPARE(restored.count(), 2);
        QCOMPARE(restored.head()->uploadId, QString("upload_a"));
        QCOMPARE(restored.head()->entries.first().translations.size(), 2);
        QCOMPARE(restored.tasks().at(1).uploadId, QString("upload_b"));
    }

    void testRemovalIsPersisted()
    {
        {
            OfflineQueue queue;
            queue.enqueue(makeTask("a"));
            queue.enqueue(makeTask("b"));
            queue.removeHead("upload_a");
        }

        OfflineQueue restored;
        QCOMPARE(restored.count(), 1);
        QCOMPARE(restored.head()->uploadId, QString("upload_b"));
    }

    void testClearIsPersisted()
    {
        {
            OfflineQueue queue;
            queue.enqueue(makeTask("a"));
            queue.clear();
        }

        OfflineQueue restored;
        QVERIFY(restored.isEmpty());
    }

    void testUnreadableStoredQueueIsIgnored()
    {
        QSettings().setValue(OfflineQueue::SettingsKey, QString("{not json"));

        OfflineQueue queue;
        QVERIFY(queue.isEmpty());
        QVERIFY(queue.enqueue(makeTask("a")));
    }
};

QTEST_MAIN(TestOfflineQueue)
#include "test_offlinequeue.moc"
