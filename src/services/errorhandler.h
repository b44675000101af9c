/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error presentation.
 *
 * Standardizes how scan, upload and connection failures are categorized,
 * logged and surfaced, so the front end only has to render what this service
 * tells it to.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QMetaType>
#include <QObject>
#include <QString>
#include <functional>

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Connection,  ///< Trans-Hub or scan engine unreachable
    Scan,        ///< Scan job failed, was cancelled or lost its result
    Upload,      ///< Chunked upload exhausted its retries
    Validation,  ///< Input validation, configuration errors
    System       ///< General system/application errors
};

/**
 * @brief Severity levels determining how errors are surfaced.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - status line only, short timeout
    Warning,   ///< Warning - status line, longer timeout
    Critical   ///< Critical - status line and notification
};

Q_DECLARE_METATYPE(ErrorCategory)
Q_DECLARE_METATYPE(ErrorSeverity)

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error presentation:
 * - Categorizes errors for appropriate handling
 * - Routes errors by severity (status line vs notification)
 * - Keeps the retry action of the last actionable failure
 * - Logs errors through Qt's message handlers
 *
 * Losing connectivity is reported as passive Info; failed scans and
 * exhausted uploads are actionable notifications with a retry.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(connection, &ConnectionStateManager::connectionLost,
 *         handler, &ErrorHandler::handleConnectionLost);
 *
 * handler->handleUploadFailed(uploadId, error,
 *                             [this, task]() { sync->submit(task); });
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    using RetryCallback = std::function<void()>;

    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /**
     * @brief Handles an error the user can act on by retrying.
     * @param category The error category.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     * @param retryCallback Run by retryLastFailure().
     */
    void handleErrorWithRetry(ErrorCategory category,
                              const QString &title,
                              const QString &details,
                              const RetryCallback &retryCallback);
    /// @}

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles a failed connect attempt (warning severity).
     */
    void handleConnectionError(const QString &message);

    /**
     * @brief Handles loss of a previously working connection (info severity).
     *
     * Shown as a passive status indicator only.
     */
    void handleConnectionLost(const QString &message);

    /**
     * @brief Handles a job that ended failed or cancelled.
     * @param jobId The job.
     * @param error The engine's error message, may be empty.
     * @param retryCallback Restarts the scan.
     */
    void handleScanFailed(const QString &jobId, const QString &error,
                          const RetryCallback &retryCallback);

    /**
     * @brief Handles a completed job whose result could not be fetched.
     */
    void handleResultRetrievalFailed(const QString &jobId, const QString &error);

    /**
     * @brief Handles an upload that ran out of retries.
     * @param uploadId The upload.
     * @param error The last chunk error.
     * @param retryCallback Resubmits the task.
     */
    void handleUploadFailed(const QString &uploadId, const QString &error,
                            const RetryCallback &retryCallback);
    /// @}

    /**
     * @brief Returns whether a retry action is pending.
     */
    [[nodiscard]] bool hasRetry() const { return static_cast<bool>(pendingRetry_); }

    /**
     * @brief Runs and clears the retry action of the last actionable failure.
     * @return False if there was nothing to retry.
     */
    bool retryLastFailure();

signals:
    /**
     * @brief Emitted to display a status line message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted for errors that deserve more than a status line.
     * @param title Notification title.
     * @param message Notification body.
     * @param actionable True if retryLastFailure() can act on it.
     */
    void notificationRequested(const QString &title, const QString &message, bool actionable);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    /**
     * @brief Logs an error for debugging.
     */
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    [[nodiscard]] static QString composeMessage(const QString &title, const QString &details);

    /**
     * @brief Gets the status line timeout for a severity level.
     * @param severity The error severity.
     * @return Timeout in milliseconds.
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

    RetryCallback pendingRetry_;
};

#endif // ERRORHANDLER_H
