/**
 * @file transferworker.h
 * @brief Executes one transfer task: walk, copy, verify, optionally delete.
 */

#ifndef TRANSFERWORKER_H
#define TRANSFERWORKER_H

#include <QElapsedTimer>
#include <QList>
#include <QString>

#include "models/transfertask.h"
#include "services/filedigest.h"
#include "services/ratelimiter.h"

class CancellationToken;
class IFileOperations;
class TransferObserver;

/**
 * @brief State machine states for TransferWorker.
 */
enum class WorkerState {
    Idle,       ///< No task running
    Walking,    ///< Enumerating source files, creating destination root
    Copying,    ///< Streaming a file through the rate limiter
    Verifying,  ///< Comparing source and destination digests
    Deleting,   ///< Removing a verified source file
    Done        ///< Task finished (success, failure or cancelled)
};

/// @brief Convert WorkerState to string for debugging
[[nodiscard]] inline const char* workerStateToString(WorkerState state) {
    switch (state) {
        case WorkerState::Idle: return "Idle";
        case WorkerState::Walking: return "Walking";
        case WorkerState::Copying: return "Copying";
        case WorkerState::Verifying: return "Verifying";
        case WorkerState::Deleting: return "Deleting";
        case WorkerState::Done: return "Done";
    }
    return "Unknown";
}

/**
 * @brief One file to transfer, derived from the source tree.
 */
struct FileUnit {
    QString absoluteSourcePath;
    QString relativePath;
    QString absoluteDestinationPath;
    qint64 size = 0;
};

/**
 * @brief Result of running one task.
 */
struct TaskOutcome {
    TransferTask::Status status = TransferTask::Status::Failed;
    TransferError error = TransferError::None;
    QString message;
    TaskSummary summary;

    [[nodiscard]] bool succeeded() const { return status == TransferTask::Status::Succeeded; }
};

/**
 * @brief Runs a single TransferTask to completion, failure or cancellation.
 *
 * For every file the worker copies the bytes in chunks paced by a
 * RateLimiter, compares source and destination digests, and only then (for
 * Move and VerifyAndDelete) deletes the source. The first failing file ends
 * the task; files completed before it stay completed.
 *
 * The cancellation token is polled before every file and before every chunk.
 * When a stop is noticed mid-file, the partial destination file is removed
 * before the task reports Cancelled.
 *
 * A source that is a regular file is transferred on its own, with progress
 * reported per chunk. If the destination is an existing directory the file
 * keeps its name inside it.
 *
 * @par Example usage:
 * @code
 * LocalFileOperations fileOps;
 * TransferWorker worker(&fileOps, &observer);
 * CancellationToken token;
 * TaskOutcome outcome = worker.run(task, 5 * 1024 * 1024, token);
 * @endcode
 */
class TransferWorker
{
public:
    struct Options {
        qint64 chunkSize = RateLimiter::DefaultChunkSize;
        DigestAlgorithm algorithm = DigestAlgorithm::Sha256;
        bool preserveMetadata = true;
        bool pruneEmptySourceDirectories = false;
    };

    /**
     * @param fileOps Filesystem primitives (not owned).
     * @param observer Event receiver (not owned, may be null).
     */
    TransferWorker(IFileOperations *fileOps, TransferObserver *observer);
    TransferWorker(IFileOperations *fileOps, TransferObserver *observer, const Options &options);

    /**
     * @brief Runs one task.
     * @param task The task; only id, paths and mode are read.
     * @param ceilingBps Throughput ceiling, 0 for the limiter's fallback.
     * @param token Polled for cancellation.
     * @return The final status, error category, message and counters.
     */
    TaskOutcome run(const TransferTask &task, qint64 ceilingBps, const CancellationToken &token);

    [[nodiscard]] WorkerState state() const { return state_; }
    [[nodiscard]] const Options &options() const { return options_; }

    /**
     * @brief Enumerates regular files under sourceDir, sorted by relative path.
     * @param sourceDir Root of the source tree.
     * @param destinationDir Root the relative paths are mapped onto.
     */
    [[nodiscard]] static QList<FileUnit> walk(const QString &sourceDir, const QString &destinationDir);

    /// Absolute, symlink-free form of path; components that do not exist yet are appended as given.
    [[nodiscard]] static QString resolvePath(const QString &path);

private:
    enum class CopyResult { Completed, Cancelled, Failed };

    void transitionTo(WorkerState newState);
    CopyResult copyFile(const FileUnit &unit, RateLimiter &limiter, const CancellationToken &token,
                        int taskId, bool reportByteProgress, qint64 &bytesCopied, QString &errorMessage);
    void discardPartial(const QString &path);
    void pruneEmptyDirectories(const QString &sourceRoot, const QList<FileUnit> &units);
    TaskOutcome finish(const TransferTask &task, TransferTask::Status status, TransferError error,
                       const QString &message, TaskSummary summary);

    IFileOperations *fileOps_ = nullptr;
    TransferObserver *observer_ = nullptr;
    Options options_;
    WorkerState state_ = WorkerState::Idle;
    QElapsedTimer taskTimer_;
};

#endif // TRANSFERWORKER_H
