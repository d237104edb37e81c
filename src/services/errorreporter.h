/**
 * @file errorreporter.h
 * @brief Centralized error reporting for transfer runs and configuration.
 *
 * This service standardizes how errors are categorized, logged and surfaced
 * as status messages, so the CLI and any other front end present them the
 * same way.
 */

#ifndef ERRORREPORTER_H
#define ERRORREPORTER_H

#include <QObject>
#include <QString>

#include "models/transfertask.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Transfer,    ///< Task-level transfer errors (missing source, I/O, cancellation)
    Integrity,   ///< Digest mismatches
    Validation,  ///< Settings and command-line errors
    System       ///< Scheduler-level problems, e.g. a run refused for lack of tasks
};

/**
 * @brief Severity levels determining how errors are logged.
 */
enum class ErrorSeverity {
    Info,      ///< Expected outcome, e.g. a requested cancellation
    Warning,   ///< Task failed, nothing unverified was deleted
    Critical   ///< Integrity guard tripped or the application cannot continue
};

/**
 * @brief Centralized error reporting service.
 *
 * ErrorReporter:
 * - Maps TransferError values to a category and severity
 * - Logs with the Qt message handler at the matching level
 * - Emits a status message for the presentation layer
 *
 * @par Example usage:
 * @code
 * ErrorReporter *reporter = new ErrorReporter(this);
 * connect(reporter, &ErrorReporter::statusMessage, this, &Cli::printStatus);
 *
 * reporter->reportTaskError(2, TransferError::IntegrityMismatch,
 *                           "SHA256 mismatch for b.bin. Copy failed.");
 * reporter->reportValidationError("Invalid limit", "'fast' is not a rate");
 * @endcode
 */
class ErrorReporter : public QObject
{
    Q_OBJECT

public:
    explicit ErrorReporter(QObject *parent = nullptr);
    ~ErrorReporter() override = default;

    /**
     * @brief Reports an error with explicit category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error summary.
     * @param details Detailed message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /**
     * @brief Reports the failure of one task.
     * @param taskId The task that ended.
     * @param error Why it ended; None is ignored.
     * @param message The completion message.
     */
    void reportTaskError(int taskId, TransferError error, const QString &message);

    /// Reports a settings or command-line problem (warning severity).
    void reportValidationError(const QString &title, const QString &details);

    [[nodiscard]] int errorCount() const { return errorCount_; }

    [[nodiscard]] static ErrorSeverity severityFor(TransferError error);
    [[nodiscard]] static ErrorCategory categoryFor(TransferError error);
    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted to display a status message.
     * @param message The message text.
     * @param timeout Suggested display time in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when an error is logged.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

    int errorCount_ = 0;
};

#endif // ERRORREPORTER_H
