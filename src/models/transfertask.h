#ifndef TRANSFERTASK_H
#define TRANSFERTASK_H

#include <QMetaType>
#include <QString>
#include <QStringList>

enum class TransferMode { Copy, Move, VerifyAndDelete };

enum class TransferPhase { Copying, Verifying, Deleting };

/**
 * @brief Reasons a task can end without success, plus a start refusal.
 */
enum class TransferError {
    None,
    SourceNotFound,     ///< Source path missing at task start
    IOFailure,          ///< Read, write, mkdir or delete failed
    IntegrityMismatch,  ///< Destination digest differs from source (or could not be computed)
    CancelledByCaller,  ///< Stop requested while the task was running
    AlreadyRunning      ///< start() called while a run is active
};

/// Modes that delete the source file once its copy is verified.
[[nodiscard]] inline bool isDestructiveMode(TransferMode mode)
{
    return mode == TransferMode::Move || mode == TransferMode::VerifyAndDelete;
}

[[nodiscard]] inline const char* transferModeToString(TransferMode mode) {
    switch (mode) {
        case TransferMode::Copy: return "copy";
        case TransferMode::Move: return "move";
        case TransferMode::VerifyAndDelete: return "verify-and-delete";
    }
    return "unknown";
}

/// Accepts the names transferModeToString() produces, plus "verify_and_delete".
[[nodiscard]] inline TransferMode transferModeFromString(const QString &text, bool *ok = nullptr) {
    const QString name = text.trimmed().toLower();
    bool recognized = true;
    TransferMode mode = TransferMode::Copy;
    if (name == QLatin1String("move")) {
        mode = TransferMode::Move;
    } else if (name == QLatin1String("verify-and-delete") || name == QLatin1String("verify_and_delete")) {
        mode = TransferMode::VerifyAndDelete;
    } else if (name != QLatin1String("copy")) {
        recognized = false;
    }
    if (ok) {
        *ok = recognized;
    }
    return mode;
}

[[nodiscard]] inline const char* transferPhaseToString(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Copying: return "Copying";
        case TransferPhase::Verifying: return "Verifying";
        case TransferPhase::Deleting: return "Deleting";
    }
    return "Unknown";
}

[[nodiscard]] inline const char* transferErrorToString(TransferError error) {
    switch (error) {
        case TransferError::None: return "None";
        case TransferError::SourceNotFound: return "SourceNotFound";
        case TransferError::IOFailure: return "IOFailure";
        case TransferError::IntegrityMismatch: return "IntegrityMismatch";
        case TransferError::CancelledByCaller: return "CancelledByCaller";
        case TransferError::AlreadyRunning: return "AlreadyRunning";
    }
    return "Unknown";
}

struct TransferTask {
    enum class Status { Pending, Running, Succeeded, Failed, Cancelled };

    int id = -1;  // Queue position, assigned by TransferSession
    QString name;
    QString sourcePath;
    QString destinationPath;
    TransferMode mode = TransferMode::Copy;
    Status status = Status::Pending;
    QString statusMessage;
    TransferError error = TransferError::None;

    [[nodiscard]] bool isFinished() const
    {
        return status == Status::Succeeded || status == Status::Failed || status == Status::Cancelled;
    }
};

[[nodiscard]] inline const char* taskStatusToString(TransferTask::Status status) {
    switch (status) {
        case TransferTask::Status::Pending: return "Pending";
        case TransferTask::Status::Running: return "Running";
        case TransferTask::Status::Succeeded: return "Succeeded";
        case TransferTask::Status::Failed: return "Failed";
        case TransferTask::Status::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief Counters for one finished task.
 */
struct TaskSummary {
    int taskId = -1;
    int filesTotal = 0;
    int filesCompleted = 0;
    qint64 bytesCopied = 0;
    qint64 elapsedMs = 0;
    double averageBytesPerSecond = 0.0;
};

/**
 * @brief Aggregate result of one scheduler run.
 */
struct SessionSummary {
    int tasksTotal = 0;
    int tasksSucceeded = 0;
    int tasksFailed = 0;
    int tasksCancelled = 0;
    int tasksNotRun = 0;
    bool halted = false;        ///< Queue stopped early (failure or cancellation)
    bool stopped = false;       ///< A stop was requested and ended the run
    QStringList failureMessages;

    [[nodiscard]] bool allSucceeded() const { return tasksTotal == tasksSucceeded; }
};

Q_DECLARE_METATYPE(TransferPhase)
Q_DECLARE_METATYPE(TransferError)
Q_DECLARE_METATYPE(TaskSummary)
Q_DECLARE_METATYPE(SessionSummary)

#endif // TRANSFERTASK_H
