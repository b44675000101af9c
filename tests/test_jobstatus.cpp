#include <QtTest>
#include <QJsonArray>
#include <QJsonObject>

#include "models/jobstatus.h"

class TestJobStatus : public QObject
{
    Q_OBJECT

private slots:
    // ========== State strings ==========

    void testStateFromString_data()
    {
        QTest::addColumn<QString>("input");
        QTest::addColumn<JobState>("expected");

        QTest::newRow("pending") << "pending" << JobState::Pending;
        QTest::newRow("running") << "running" << JobState::Running;
        QTest::newRow("scanning") << "scanning" << JobState::Running;
        QTest::newRow("processing") << "processing" << JobState::Running;
        QTest::newRow("completed") << "completed" << JobState::Completed;
        QTest::newRow("failed") << "failed" << JobState::Failed;
        QTest::newRow("cancelled") << "cancelled" << JobState::Cancelled;
        QTest::newRow("canceled") << "canceled" << JobState::Cancelled;
        QTest::newRow("mixed case") << "  Completed " << JobState::Completed;
        QTest::newRow("unknown") << "queued-somewhere" << JobState::Pending;
        QTest::newRow("empty") << "" << JobState::Pending;
    }

    void testStateFromString()
    {
        QFETCH(QString, input);
        QFETCH(JobState, expected);
        QCOMPARE(jobStateFromString(input), expected);
    }

    void testTerminalStates()
    {
        QVERIFY(!isTerminalState(JobState::Pending));
        QVERIFY(!isTerminalState(JobState::Running));
        QVERIFY(isTerminalState(JobState::Completed));
        QVERIFY(isTerminalState(JobState::Failed));
        QVERIFY(isTerminalState(JobState::Cancelled));
        QCOMPARE(QString(jobStateToString(JobState::Cancelled)), QString("cancelled"));
    }

    // ========== Status payloads ==========

    void testFlatStatusPayload()
    {
        QJsonObject json;
        json["status"] = "scanning";
        json["progress"] = 42.5;
        json["processed_files"] = 17;
        json["total_files"] = 40;
        json["current_file"] = "mods/example.jar";

        const JobStatus status = JobStatus::fromJson("job-1", json);
        QCOMPARE(status.jobId, QString("job-1"));
        QCOMPARE(status.state, JobState::Running);
        QCOMPARE(status.progressPercent, 42.5);
        QCOMPARE(status.processedCount, qint64(17));
        QCOMPARE(status.totalCount, qint64(40));
        QCOMPARE(status.currentItemLabel, QString("mods/example.jar"));
        QVERIFY(status.errorMessage.isEmpty());
        QVERIFY(!status.isTerminal());
    }

    void testNestedStatusPayload()
    {
        QJsonObject progress;
        progress["percent"] = 80.0;
        progress["processed"] = 8;
        progress["total"] = 10;
        progress["current_item"] = "lang/en_us.json";

        QJsonObject json;
        json["status"] = "running";
        json["progress"] = progress;

        const JobStatus status = JobStatus::fromJson("job-2", json);
        QCOMPARE(status.progressPercent, 80.0);
        QCOMPARE(status.processedCount, qint64(8));
        QCOMPARE(status.totalCount, qint64(10));
        QCOMPARE(status.currentItemLabel, QString("lang/en_us.json"));
    }

    void testErrorOnlyForFailedJobs()
    {
        QJsonObject failed;
        failed["status"] = "failed";
        failed["error_message"] = "disk full";
        QCOMPARE(JobStatus::fromJson("a", failed).errorMessage, QString("disk full"));

        failed["error"] = "parser crashed";
        QCOMPARE(JobStatus::fromJson("a", failed).errorMessage, QString("parser crashed"));

        QJsonObject running;
        running["status"] = "running";
        running["error"] = "stale";
        QVERIFY(JobStatus::fromJson("a", running).errorMessage.isEmpty());
    }

    // ========== Results ==========

    void testResultWithStatisticsObject()
    {
        QJsonObject stats;
        stats["total_mods"] = 3;
        stats["total_language_files"] = 12;
        stats["total_keys"] = 900;
        stats["scan_duration_ms"] = 1500;

        QJsonObject json;
        json["scan_id"] = "scan-9";
        json["mods"] = QJsonArray{QJsonObject{{"mod_id", "a"}}};
        json["statistics"] = stats;

        const ScanResult result = ScanResult::fromJson("job-9", json);
        QCOMPARE(result.scanId, QString("scan-9"));
        QCOMPARE(result.mods.size(), 1);
        QCOMPARE(result.statistics.totalMods, 3);
        QCOMPARE(result.statistics.totalLanguageFiles, 12);
        QCOMPARE(result.statistics.totalKeys, qint64(900));
        QCOMPARE(result.statistics.scanDurationMs, qint64(1500));
    }

    void testResultWithFlatStatistics()
    {
        QJsonObject json;
        json["total_mods"] = 2;
        json["total_entries"] = 55;

        const ScanResult result = ScanResult::fromJson("job-3", json);
        QCOMPARE(result.scanId, QString("job-3"));
        QCOMPARE(result.statistics.totalMods, 2);
        QCOMPARE(result.statistics.totalKeys, qint64(55));
        QVERIFY(result.entries.isEmpty());
    }
};

QTEST_MAIN(TestJobStatus)
#include "test_jobstatus.moc"
