#include "errorreporter.h"

#include <QDebug>

ErrorReporter::ErrorReporter(QObject *parent)
    : QObject(parent)
{
}

void ErrorReporter::handleError(ErrorCategory category,
                                ErrorSeverity severity,
                                const QString &title,
                                const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorReporter::reportTaskError(int taskId, TransferError error, const QString &message)
{
    if (error == TransferError::None) {
        return;
    }

    handleError(categoryFor(error),
                severityFor(error),
                tr("Task %1: %2").arg(taskId + 1).arg(QLatin1String(transferErrorToString(error))),
                message);
}

void ErrorReporter::reportValidationError(const QString &title, const QString &details)
{
    handleError(ErrorCategory::Validation, ErrorSeverity::Warning, title, details);
}

ErrorSeverity ErrorReporter::severityFor(TransferError error)
{
    switch (error) {
    case TransferError::None:
    case TransferError::CancelledByCaller:
        return ErrorSeverity::Info;
    case TransferError::SourceNotFound:
    case TransferError::IOFailure:
    case TransferError::AlreadyRunning:
        return ErrorSeverity::Warning;
    case TransferError::IntegrityMismatch:
        return ErrorSeverity::Critical;
    }
    return ErrorSeverity::Warning;
}

ErrorCategory ErrorReporter::categoryFor(TransferError error)
{
    return error == TransferError::IntegrityMismatch ? ErrorCategory::Integrity
                                                     : ErrorCategory::Transfer;
}

void ErrorReporter::logError(ErrorCategory category,
                             ErrorSeverity severity,
                             const QString &title,
                             const QString &details)
{
    errorCount_++;

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

int ErrorReporter::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;  // Stays until replaced
    }
    return 5000;
}

QString ErrorReporter::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::Integrity:
        return QStringLiteral("Integrity");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorReporter::severityToString(ErrorSeverity severity)
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
