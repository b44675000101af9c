/**
 * @file test_errorhandler.cpp
 * @brief Unit tests for ErrorHandler.
 *
 * Tests verify:
 * - Error handling emits status messages
 * - Severity levels determine timeout durations
 * - Critical errors and actionable failures request notifications
 * - Retry actions run once
 */

#include <QtTest/QtTest>
#include <QSignalSpy>

#include "services/errorhandler.h"

class TestErrorHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Status message tests
    void testHandleErrorEmitsStatusMessage();
    void testDetailsEqualToTitleNotRepeated();
    void testInfoSeverityTimeout();
    void testWarningSeverityTimeout();
    void testCriticalSeverityTimeout();

    // Convenience method tests
    void testHandleConnectionError();
    void testConnectionLostIsPassive();
    void testScanFailedIsActionable();
    void testScanFailedWithoutMessage();
    void testResultRetrievalFailed();
    void testUploadFailedIsActionable();

    // Retry tests
    void testRetryRunsOnce();
    void testRetryWithoutFailure();
    void testNewFailureReplacesRetry();

    // Signal forwarding tests
    void testErrorLoggedSignal();

private:
    ErrorHandler *handler_ = nullptr;
};

void TestErrorHandler::init()
{
    handler_ = new ErrorHandler(this);
}

void TestErrorHandler::cleanup()
{
    delete handler_;
    handler_ = nullptr;
}

void TestErrorHandler::testHandleErrorEmitsStatusMessage()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleError(ErrorCategory::System,
                          ErrorSeverity::Info,
                          "Test error",
                          "Details");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("Test error: Details"));
}

void TestErrorHandler::testDetailsEqualToTitleNotRepeated()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleError(ErrorCategory::System, ErrorSeverity::Info, "Same", "Same");

    QCOMPARE(spy.at(0).at(0).toString(), QString("Same"));
}

void TestErrorHandler::testInfoSeverityTimeout()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy notifySpy(handler_, &ErrorHandler::notificationRequested);

    handler_->handleError(ErrorCategory::System, ErrorSeverity::Info, "Info");

    QCOMPARE(spy.at(0).at(1).toInt(), 3000);
    QCOMPARE(notifySpy.count(), 0);
}

void TestErrorHandler::testWarningSeverityTimeout()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy notifySpy(handler_, &ErrorHandler::notificationRequested);

    handler_->handleError(ErrorCategory::System, ErrorSeverity::Warning, "Warning");

    QCOMPARE(spy.at(0).at(1).toInt(), 5000);
    QCOMPARE(notifySpy.count(), 0);
}

void TestErrorHandler::testCriticalSeverityTimeout()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy notifySpy(handler_, &ErrorHandler::notificationRequested);

    handler_->handleError(ErrorCategory::Validation, ErrorSeverity::Critical,
                          "Bad input", "No directory given");

    QCOMPARE(spy.at(0).at(1).toInt(), 0);
    QCOMPARE(notifySpy.count(), 1);
    QCOMPARE(notifySpy.at(0).at(0).toString(), QString("Bad input"));
    QCOMPARE(notifySpy.at(0).at(1).toString(), QString("No directory given"));
    QCOMPARE(notifySpy.at(0).at(2).toBool(), false);
}

void TestErrorHandler::testHandleConnectionError()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy logSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleConnectionError("Connection refused");

    QCOMPARE(spy.count(), 1);
    QVERIFY(spy.at(0).at(0).toString().contains("Connection refused"));
    QCOMPARE(spy.at(0).at(1).toInt(), 5000);
    QCOMPARE(qvariant_cast<ErrorCategory>(logSpy.at(0).at(0)), ErrorCategory::Connection);
    QCOMPARE(qvariant_cast<ErrorSeverity>(logSpy.at(0).at(1)), ErrorSeverity::Warning);
}

void TestErrorHandler::testConnectionLostIsPassive()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy notifySpy(handler_, &ErrorHandler::notificationRequested);
    QSignalSpy logSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleConnectionLost("Hub down");

    QCOMPARE(spy.count(), 1);
    QVERIFY(spy.at(0).at(0).toString().contains("queued"));
    QCOMPARE(notifySpy.count(), 0);
    QCOMPARE(qvariant_cast<ErrorSeverity>(logSpy.at(0).at(1)), ErrorSeverity::Info);
    QVERIFY(!handler_->hasRetry());
}

void TestErrorHandler::testScanFailedIsActionable()
{
    QSignalSpy notifySpy(handler_, &ErrorHandler::notificationRequested);
    QSignalSpy logSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleScanFailed("job-1", "archive corrupt", []() {});

    QCOMPARE(notifySpy.count(), 1);
    QCOMPARE(notifySpy.at(0).at(0).toString(), QString("Scan job-1 failed"));
    QCOMPARE(notifySpy.at(0).at(1).toString(), QString("archive corrupt"));
    QCOMPARE(notifySpy.at(0).at(2).toBool(), true);
    QCOMPARE(qvariant_cast<ErrorCategory>(logSpy.at(0).at(0)), ErrorCategory::Scan);
    QVERIFY(handler_->hasRetry());
}

void TestErrorHandler::testScanFailedWithoutMessage()
{
    QSignalSpy notifySpy(handler_, &ErrorHandler::notificationRequested);

    handler_->handleScanFailed("job-2", QString(), nullptr);

    QCOMPARE(notifySpy.at(0).at(1).toString(), QString("The scan did not complete"));
    // Without a callback there is nothing to act on
    QCOMPARE(notifySpy.at(0).at(2).toBool(), false);
    QVERIFY(!handler_->hasRetry());
}

void TestErrorHandler::testResultRetrievalFailed()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy notifySpy(handler_, &ErrorHandler::notificationRequested);

    handler_->handleResultRetrievalFailed("job-3", "result store offline");

    QVERIFY(spy.at(0).at(0).toString().contains("job-3"));
    QVERIFY(spy.at(0).at(0).toString().contains("result store offline"));
    QCOMPARE(notifySpy.count(), 0);
}

void TestErrorHandler::testUploadFailedIsActionable()
{
    QSignalSpy notifySpy(handler_, &ErrorHandler::notificationRequested);
    QSignalSpy logSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleUploadFailed("upload_1_job", "disk full", []() {});

    QCOMPARE(notifySpy.count(), 1);
    QCOMPARE(notifySpy.at(0).at(0).toString(), QString("Upload upload_1_job failed"));
    QCOMPARE(notifySpy.at(0).at(2).toBool(), true);
    QCOMPARE(qvariant_cast<ErrorCategory>(logSpy.at(0).at(0)), ErrorCategory::Upload);
}

void TestErrorHandler::testRetryRunsOnce()
{
    int runs = 0;
    handler_->handleUploadFailed("u", "e", [&runs]() { runs++; });

    QVERIFY(handler_->retryLastFailure());
    QCOMPARE(runs, 1);
    QVERIFY(!handler_->hasRetry());

    QVERIFY(!handler_->retryLastFailure());
    QCOMPARE(runs, 1);
}

void TestErrorHandler::testRetryWithoutFailure()
{
    QVERIFY(!handler_->hasRetry());
    QVERIFY(!handler_->retryLastFailure());
}

void TestErrorHandler::testNewFailureReplacesRetry()
{
    QString retried;
    handler_->handleScanFailed("job-1", "e", [&retried]() { retried = "scan"; });
    handler_->handleUploadFailed("u", "e", [&retried]() { retried = "upload"; });

    QVERIFY(handler_->retryLastFailure());
    QCOMPARE(retried, QString("upload"));
}

void TestErrorHandler::testErrorLoggedSignal()
{
    QSignalSpy spy(handler_, &ErrorHandler::errorLogged);

    handler_->handleError(ErrorCategory::Upload,
                          ErrorSeverity::Warning,
                          "Title",
                          "Details");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(qvariant_cast<ErrorCategory>(spy.at(0).at(0)), ErrorCategory::Upload);
    QCOMPARE(qvariant_cast<ErrorSeverity>(spy.at(0).at(1)), ErrorSeverity::Warning);
    QCOMPARE(spy.at(0).at(2).toString(), QString("Title"));
    QCOMPARE(spy.at(0).at(3).toString(), QString("Details"));
}

QTEST_MAIN(TestErrorHandler)
#include "test_errorhandler.moc"
