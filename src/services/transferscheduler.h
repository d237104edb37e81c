/**
 * @file transferscheduler.h
 * @brief Runs a session's task queue sequentially on a background thread.
 */

#ifndef TRANSFERSCHEDULER_H
#define TRANSFERSCHEDULER_H

#include <QList>
#include <QObject>
#include <QString>

#include <memory>

#include "models/transfersession.h"
#include "models/transfertask.h"
#include "services/transferobserver.h"
#include "services/transferworker.h"

class QThread;
class ErrorReporter;
class IFileOperations;

/**
 * @brief What the scheduler does with the rest of the queue after a task fails.
 */
enum class FailurePolicy {
    HaltQueue,     ///< Stop; remaining tasks stay Pending
    ContinueQueue  ///< Run the remaining tasks and aggregate the failures
};

[[nodiscard]] inline const char* failurePolicyToString(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::HaltQueue: return "halt";
        case FailurePolicy::ContinueQueue: return "continue";
    }
    return "unknown";
}

/**
 * @brief Session scheduler for transfer tasks.
 *
 * TransferScheduler owns a TransferSession and runs its tasks strictly one at
 * a time, in insertion order, on a single background thread. Events produced
 * by the TransferWorker are republished as signals; connected receivers on
 * other threads get them queued, in the order they were produced.
 *
 * Only one run can be active. start() while running is refused with
 * TransferError::AlreadyRunning. requestStop() cancels the running task only;
 * tasks that have not started keep status Pending. A cancelled task always
 * ends the run; a failed task ends it under FailurePolicy::HaltQueue.
 *
 * @par Example usage:
 * @code
 * TransferScheduler *scheduler = new TransferScheduler(this);
 *
 * connect(scheduler, &TransferScheduler::progress,
 *         this, &MyView::onProgress);
 * connect(scheduler, &TransferScheduler::sessionFinished,
 *         this, &MyView::onFinished);
 *
 * QList<TransferTask> tasks;
 * TransferTask task;
 * task.sourcePath = "/data/photos";
 * task.destinationPath = "/backup/photos";
 * task.mode = TransferMode::VerifyAndDelete;
 * tasks.append(task);
 *
 * scheduler->start(tasks, 5 * 1024 * 1024);
 * // later
 * scheduler->requestStop();
 * @endcode
 */
class TransferScheduler : public QObject, private TransferObserver
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a scheduler using the local filesystem.
     * @param parent Optional parent QObject for memory management.
     */
    explicit TransferScheduler(QObject *parent = nullptr);

    /**
     * @brief Constructs a scheduler with injected file operations.
     * @param fileOps File operations used by the worker (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit TransferScheduler(IFileOperations *fileOps, QObject *parent = nullptr);

    /**
     * @brief Destructor. Requests a stop and waits for the run to end.
     */
    ~TransferScheduler() override;

    /// @name Run Control
    /// @{

    /**
     * @brief Replaces the task list and ceiling, then starts a run.
     * @param tasks Tasks in execution order.
     * @param throughputCeilingBps Ceiling in bytes/sec, 0 for no requested limit.
     * @return True if the run started; false if already running or no tasks.
     */
    bool start(const QList<TransferTask> &tasks, qint64 throughputCeilingBps);

    /**
     * @brief Starts a run over the session's current task list.
     * @return True if the run started; false if already running or no tasks.
     */
    bool start();

    /**
     * @brief Asks the running task to stop at its next suspension point.
     * @return True if a run was active.
     */
    bool requestStop();

    /**
     * @brief Blocks until the current run has finished.
     * @param msecs Maximum wait, negative to wait forever.
     * @return True if no run is active on return.
     */
    bool waitForFinished(int msecs = -1);
    /// @}

    /// @name Configuration
    /// @{

    /// Worker options for subsequent runs; ignored while running.
    void setWorkerOptions(const TransferWorker::Options &options);
    [[nodiscard]] TransferWorker::Options workerOptions() const { return workerOptions_; }

    void setFailurePolicy(FailurePolicy policy);
    [[nodiscard]] FailurePolicy failurePolicy() const { return failurePolicy_; }

    /**
     * @brief Routes task failures and start refusals to an error reporter.
     * @param reporter The reporter (not owned, may be null).
     */
    void setErrorReporter(ErrorReporter *reporter);
    /// @}

    /// @name State
    /// @{

    [[nodiscard]] bool isRunning() const { return session_.isRunning(); }
    [[nodiscard]] int currentTaskIndex() const { return session_.currentIndex(); }
    [[nodiscard]] TransferError lastStartError() const { return lastStartError_; }

    /// The session; edit its task list only while idle.
    [[nodiscard]] TransferSession &session() { return session_; }
    [[nodiscard]] const TransferSession &session() const { return session_; }
    /// @}

signals:
    void sessionStarted(int taskCount);
    void taskStarted(int taskId, const QString &name);

    /**
     * @brief A file entered a phase.
     * @param taskId The task.
     * @param fileName File path relative to the task source.
     * @param phase Copying, Verifying or Deleting.
     * @param percent Task progress when the phase started.
     */
    void progress(int taskId, const QString &fileName, TransferPhase phase, int percent);

    /// Task progress after each file (per chunk for single-file tasks).
    void taskProgress(int taskId, int percent);

    /// Cumulative throughput of the running task in MB/s.
    void throughputSample(double mbps);

    void statusMessage(const QString &message);

    /**
     * @brief A task ended. Its status in session() is already updated.
     */
    void taskFinished(int taskId, bool success, const QString &message);

    /// A task ended without success (failure or cancellation).
    void taskFailed(int taskId, TransferError error, const QString &message);

    void taskSummaryReady(const TaskSummary &summary);

    /// start() was refused.
    void startRefused(TransferError error, const QString &message);

    /// The run ended; the scheduler is idle again.
    void sessionFinished(const SessionSummary &summary);

private:
    void runAll(std::shared_ptr<CancellationToken> token, qint64 ceilingBps,
                TransferWorker::Options options, FailurePolicy policy);
    void releaseThread();

    // TransferObserver
    void onProgress(int taskId, const QString &fileName, TransferPhase phase, int percent) override;
    void onTaskProgress(int taskId, int percent) override;
    void onThroughputSample(double mbps) override;
    void onStatus(const QString &message) override;

    std::unique_ptr<IFileOperations> ownedFileOps_;
    IFileOperations *fileOps_ = nullptr;
    ErrorReporter *errorReporter_ = nullptr;
    QThread *thread_ = nullptr;

    TransferSession session_;
    TransferWorker::Options workerOptions_;
    FailurePolicy failurePolicy_ = FailurePolicy::HaltQueue;
    TransferError lastStartError_ = TransferError::None;
};

Q_DECLARE_METATYPE(FailurePolicy)

#endif // TRANSFERSCHEDULER_H
