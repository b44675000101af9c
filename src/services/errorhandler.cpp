#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

QString ErrorHandler::composeMessage(const QString &title, const QString &details)
{
    if (!details.isEmpty() && details != title) {
        return QString("%1: %2").arg(title, details);
    }
    return title;
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    // Always show in the status line
    emit statusMessage(composeMessage(title, details), timeoutForSeverity(severity));

    if (severity == ErrorSeverity::Critical) {
        emit notificationRequested(title, details.isEmpty() ? title : details, false);
    }
}

void ErrorHandler::handleErrorWithRetry(ErrorCategory category,
                                        const QString &title,
                                        const QString &details,
                                        const RetryCallback &retryCallback)
{
    logError(category, ErrorSeverity::Warning, title, details);

    emit statusMessage(composeMessage(title, details),
                       timeoutForSeverity(ErrorSeverity::Warning));

    pendingRetry_ = retryCallback;
    emit notificationRequested(title, details.isEmpty() ? title : details,
                               static_cast<bool>(pendingRetry_));
}

void ErrorHandler::handleConnectionError(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Warning,
                tr("Connection Error"),
                message);
}

void ErrorHandler::handleConnectionLost(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Info,
                tr("Trans-Hub offline, uploads will be queued"),
                message);
}

void ErrorHandler::handleScanFailed(const QString &jobId, const QString &error,
                                    const RetryCallback &retryCallback)
{
    handleErrorWithRetry(ErrorCategory::Scan,
                         tr("Scan %1 failed").arg(jobId),
                         error.isEmpty() ? tr("The scan did not complete") : error,
                         retryCallback);
}

void ErrorHandler::handleResultRetrievalFailed(const QString &jobId, const QString &error)
{
    handleError(ErrorCategory::Scan,
                ErrorSeverity::Warning,
                tr("Scan %1 completed but its result could not be retrieved").arg(jobId),
                error);
}

void ErrorHandler::handleUploadFailed(const QString &uploadId, const QString &error,
                                      const RetryCallback &retryCallback)
{
    handleErrorWithRetry(ErrorCategory::Upload,
                         tr("Upload %1 failed").arg(uploadId),
                         error,
                         retryCallback);
}

bool ErrorHandler::retryLastFailure()
{
    if (!pendingRetry_) {
        return false;
    }
    // Clear first: the callback may report a new failure
    const RetryCallback retry = std::move(pendingRetry_);
    pendingRetry_ = nullptr;
    retry();
    return true;
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;     // Stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::Scan:
        return QStringLiteral("Scan");
    case ErrorCategory::Upload:
        return QStringLiteral("Upload");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
