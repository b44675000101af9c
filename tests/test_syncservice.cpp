#include <QtTest>
#include <QSettings>
#include <QSignalSpy>
#include <QStandardPaths>

#include "mocks/mocktranshubclient.h"
#include "models/offlinequeue.h"
#include "services/chunkeduploadpipeline.h"
#include "services/connectionstatemanager.h"
#include "services/syncservice.h"

namespace {

UploadTask makeTask(const QString &scanId, int groups = 1)
{
    TranslationEntries entries;
    for (int i = 0; i < groups; ++i) {
        TranslationGroup group;
        group.groupKey = QString("%1-mod%2/en_us").arg(scanId).arg(i);
        group.translations.append(qMakePair(QString("key.%1").arg(i), QString("Value %1").arg(i)));
        entries.append(group);
    }
    return UploadTask::create("proj", scanId, entries);
}

UploadOptions fastOptions()
{
    UploadOptions options;
    options.chunkSize = 1;
    options.maxRetries = 2;
    options.retryDelayMs = 0;
    return options;
}

ConnectionStatus connectedStatus()
{
    ConnectionStatus status;
    status.connected = true;
    status.status = "connected";
    return status;
}

} // namespace

class TestSyncService : public QObject
{
    Q_OBJECT

private:
    MockTransHubClient *mockHub = nullptr;
    OfflineQueue *queue = nullptr;
    ChunkedUploadPipeline *pipeline = nullptr;
    ConnectionStateManager *connection = nullptr;
    SyncService *sync = nullptr;

    void connectTo(bool offlineMode = false)
    {
        ServerConfig config;
        config.baseUrl = "http://hub.test";
        config.offlineMode = offlineMode;
        config.autoSync = false;
        connection->connectToServer(config);
        QVERIFY(mockHub->mockRespondConnect(connectedStatus()));
    }

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QCoreApplication::setOrganizationName("scansync-tests");
        QCoreApplication::setApplicationName("test_syncservice");
    }

    void init()
    {
        QSettings().clear();

        mockHub = new MockTransHubClient(this);
        queue = new OfflineQueue(this);
        pipeline = new ChunkedUploadPipeline(mockHub, this);
        connection = new ConnectionStateManager(mockHub, queue, pipeline, this);
        sync = new SyncService(connection, pipeline, queue, this);
    }

    void cleanup()
    {
        delete sync;
        delete connection;
        delete pipeline;
        delete queue;
        delete mockHub;
        sync = nullptr;
        connection = nullptr;
        pipeline = nullptr;
        queue = nullptr;
        mockHub = nullptr;
    }

    void cleanupTestCase()
    {
        QSettings().clear();
    }

    // ========== Upload policy ==========

    void testUploadsWhenConnected()
    {
        connectTo();
        QSignalSpy startedSpy(sync, &SyncService::uploadStarted);
        QSignalSpy completedSpy(sync, &SyncService::uploadCompleted);

        const UploadTask task = makeTask("a", 2);
        QCOMPARE(sync->submit(task, fastOptions()), SyncService::SubmitResult::Uploading);
        QVERIFY(sync->isUploading());
        QCOMPARE(startedSpy.count(), 1);

        QVERIFY(mockHub->mockAcceptChunk());
        QVERIFY(mockHub->mockAcceptChunk());

        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(completedSpy.at(0).at(0).toString(), task.uploadId);
        QCOMPARE(completedSpy.at(0).at(1).toInt(), 2);
        QVERIFY(!sync->isUploading());
        QVERIFY(queue->isEmpty());
    }

    void testQueuesWhenDisconnected()
    {
        QSignalSpy queuedSpy(sync, &SyncService::taskQueued);
        QSignalSpy messageSpy(sync, &SyncService::statusMessage);

        const UploadTask task = makeTask("a");
        QCOMPARE(sync->submit(task), SyncService::SubmitResult::Queued);

        QCOMPARE(queue->count(), 1);
        QCOMPARE(queue->head()->uploadId, task.uploadId);
        QCOMPARE(queuedSpy.count(), 1);
        QCOMPARE(queuedSpy.at(0).at(1).toString(), QString("Trans-Hub not connected"));
        QCOMPARE(messageSpy.count(), 1);
        QVERIFY(mockHub->mockChunkRequests().isEmpty());
    }

    void testQueuesInOfflineMode()
    {
        connectTo(true);
        QSignalSpy queuedSpy(sync, &SyncService::taskQueued);

        QCOMPARE(sync->submit(makeTask("a")), SyncService::SubmitResult::Queued);
        QCOMPARE(queuedSpy.at(0).at(1).toString(), QString("Offline mode"));
        QVERIFY(mockHub->mockChunkRequests().isEmpty());
    }

    void testQueuesWhileBusy()
    {
        connectTo();
        QCOMPARE(sync->submit(makeTask("a"), fastOptions()), SyncService::SubmitResult::Uploading);
        QCOMPARE(sync->submit(makeTask("b"), fastOptions()), SyncService::SubmitResult::Queued);

        QCOMPARE(queue->count(), 1);
        QCOMPARE(mockHub->mockChunkRequests().size(), 1);
    }

    void testRejectsTaskWithoutIdOrAlreadyQueued()
    {
        UploadTask anonymous = makeTask("a");
        anonymous.uploadId.clear();
        QCOMPARE(sync->submit(anonymous), SyncService::SubmitResult::Rejected);

        const UploadTask task = makeTask("b");
        QCOMPARE(sync->submit(task), SyncService::SubmitResult::Queued);
        QCOMPARE(sync->submit(task), SyncService::SubmitResult::Rejected);
        QCOMPARE(queue->count(), 1);
    }

    void testInvalidOptionsFallBackToQueue()
    {
        connectTo();
        UploadOptions options;
        options.chunkSize = 0;

        QCOMPARE(sync->submit(makeTask("a"), options), SyncService::SubmitResult::Queued);
        QVERIFY(!sync->isUploading());
    }

    // ========== Failures ==========

    void testFailedUploadIsQueued()
    {
        connectTo();
        QSignalSpy failedSpy(sync, &SyncService::uploadFailed);
        QSignalSpy queuedSpy(sync, &SyncService::taskQueued);
        mockHub->mockFailChunk(0, 2, "quota exceeded");

        const UploadTask task = makeTask("a");
        QCOMPARE(sync->submit(task, fastOptions()), SyncService::SubmitResult::Uploading);
        QTRY_COMPARE(failedSpy.count(), 1);

        QCOMPARE(failedSpy.at(0).at(1).toString(), QString("quota exceeded"));
        QCOMPARE(queuedSpy.count(), 1);
        QCOMPARE(queuedSpy.at(0).at(1).toString(), QString("quota exceeded"));

        // Queued with the same id so the next sync replaces partial chunks
        QCOMPARE(queue->head()->uploadId, task.uploadId);
        QVERIFY(!sync->isUploading());
    }

    void testFailedUploadNotQueuedWhenDisabled()
    {
        connectTo();
        sync->setQueueOnFailure(false);
        QSignalSpy failedSpy(sync, &SyncService::uploadFailed);
        mockHub->mockFailChunk(0, 2, "quota exceeded");

        sync->submit(makeTask("a"), fastOptions());
        QTRY_COMPARE(failedSpy.count(), 1);
        QVERIFY(queue->isEmpty());
    }

    // ========== Progress ==========

    void testProgressOnlyForOwnUploads()
    {
        connectTo();
        QSignalSpy progressSpy(sync, &SyncService::progressChanged);

        // Uploads started by someone else are not reported here
        QVERIFY(pipeline->upload(makeTask("other"), fastOptions()));
        QVERIFY(mockHub->mockAcceptChunk());
        QCOMPARE(progressSpy.count(), 0);

        const UploadTask task = makeTask("a");
        sync->submit(task, fastOptions());
        QVERIFY(mockHub->mockAcceptChunk());

        QVERIFY(progressSpy.count() > 0);
        for (const QList<QVariant> &args : progressSpy) {
            QCOMPARE(qvariant_cast<UploadProgress>(args.at(0)).uploadId, task.uploadId);
        }
        QCOMPARE(qvariant_cast<UploadProgress>(progressSpy.last().at(0)).status,
                 UploadStatus::Completed);
    }
};

QTEST_MAIN(TestSyncService)
#include "test_syncservice.moc"
