#include <QtTest>

#include "utils/progresssnapshotstore.h"

class TestProgressSnapshotStore : public QObject
{
    Q_OBJECT

private slots:
    // ========== Empty and single sample ==========

    void testEmptyStoreHasNoMetrics()
    {
        ProgressSnapshotStore store;
        QVERIFY(store.isEmpty());
        QVERIFY(!store.hasEnoughHistory());
        QVERIFY(!store.itemsPerSecond().has_value());
        QVERIFY(!store.etaMs().has_value());
        QCOMPARE(store.windowMs(), ProgressSnapshotStore::DefaultWindowMs);
    }

    void testSingleSampleIsUnknownNotZero()
    {
        ProgressSnapshotStore store;
        store.addSnapshot({1000, 10.0, 5});

        QCOMPARE(store.count(), static_cast<size_t>(1));
        QVERIFY(!store.itemsPerSecond().has_value());
        QVERIFY(!store.etaMs().has_value());
    }

    // ========== Speed and ETA ==========

    void testTwoSamplesGiveSpeedAndEta()
    {
        ProgressSnapshotStore store;
        store.addSnapshot({0, 0.0, 0});
        store.addSnapshot({1000, 25.0, 2});

        QVERIFY(store.itemsPerSecond().has_value());
        QCOMPARE(*store.itemsPerSecond(), 2.0);

        // 75% left at 25% per second
        QVERIFY(store.etaMs().has_value());
        QCOMPARE(*store.etaMs(), qint64(3000));
    }

    void testSpeedSpansOldestToNewest()
    {
        // Samples at t=0,1,2 s with 0, 10, 12 items: (12 - 0) / 2 s
        ProgressSnapshotStore store;
        store.addSnapshot({0, 0.0, 0});
        store.addSnapshot({1000, 40.0, 10});
        store.addSnapshot({2000, 48.0, 12});

        QCOMPARE(*store.itemsPerSecond(), 6.0);
        QCOMPARE(store.oldest().processedCount, qint64(0));
        QCOMPARE(store.newest().processedCount, qint64(12));
    }

    void testSameTimestampIsUnknown()
    {
        ProgressSnapshotStore store;
        store.addSnapshot({500, 10.0, 1});
        store.addSnapshot({500, 20.0, 2});

        QVERIFY(store.hasEnoughHistory());
        QVERIFY(!store.itemsPerSecond().has_value());
        QVERIFY(!store.etaMs().has_value());
    }

    void testFlatProgressHasSpeedButNoEta()
    {
        ProgressSnapshotStore store;
        store.addSnapshot({0, 50.0, 100});
        store.addSnapshot({2000, 50.0, 100});

        QCOMPARE(*store.itemsPerSecond(), 0.0);
        QVERIFY(!store.etaMs().has_value());
    }

    void testEtaIsNeverNegative()
    {
        // Servers occasionally overshoot 100%
        ProgressSnapshotStore store;
        store.addSnapshot({0, 90.0, 90});
        store.addSnapshot({1000, 105.0, 105});

        QVERIFY(store.etaMs().has_value());
        QCOMPARE(*store.etaMs(), qint64(0));
    }

    // ========== Window pruning ==========

    void testOldSamplesArePruned()
    {
        ProgressSnapshotStore store(5000);
        store.addSnapshot({0, 0.0, 0});
        store.addSnapshot({3000, 30.0, 30});
        store.addSnapshot({7000, 70.0, 70});

        // t=0 is older than 7000 - 5000
        QCOMPARE(store.count(), static_cast<size_t>(2));
        QCOMPARE(store.oldest().timestampMs, qint64(3000));
        QCOMPARE(*store.itemsPerSecond(), 10.0);
    }

    void testSampleAtWindowEdgeIsKept()
    {
        ProgressSnapshotStore store(5000);
        store.addSnapshot({0, 0.0, 0});
        store.addSnapshot({5000, 50.0, 50});

        QCOMPARE(store.count(), static_cast<size_t>(2));
    }

    void testClear()
    {
        ProgressSnapshotStore store;
        store.addSnapshot({0, 0.0, 0});
        store.addSnapshot({1000, 10.0, 10});
        store.clear();

        QVERIFY(store.isEmpty());
        QVERIFY(!store.itemsPerSecond().has_value());
    }
};

QTEST_MAIN(TestProgressSnapshotStore)
#include "test_progresssnapshotstore.moc"
