#include "transferscheduler.h"

#include "services/errorreporter.h"
#include "services/localfileoperations.h"
#include "utils/logging.h"

#include <QDeadlineTimer>
#include <QDebug>
#include <QThread>

namespace {

void registerMetaTypes()
{
    qRegisterMetaType<TransferPhase>("TransferPhase");
    qRegisterMetaType<TransferError>("TransferError");
    qRegisterMetaType<TaskSummary>("TaskSummary");
    qRegisterMetaType<SessionSummary>("SessionSummary");
}

} // namespace

TransferScheduler::TransferScheduler(QObject *parent)
    : QObject(parent)
    , ownedFileOps_(std::make_unique<LocalFileOperations>())
{
    fileOps_ = ownedFileOps_.get();
    registerMetaTypes();
}

TransferScheduler::TransferScheduler(IFileOperations *fileOps, QObject *parent)
    : QObject(parent)
    , fileOps_(fileOps)
{
    registerMetaTypes();
}

TransferScheduler::~TransferScheduler()
{
    // The run thread calls back into this object, so it must be gone before
    // any member is destroyed.
    requestStop();
    releaseThread();
}

bool TransferScheduler::start(const QList<TransferTask> &tasks, qint64 throughputCeilingBps)
{
    if (session_.isRunning()) {
        return start();  // Refused with AlreadyRunning, task list untouched
    }

    session_.setTasks(tasks);
    session_.setThroughputCeilingBps(throughputCeilingBps);
    return start();
}

bool TransferScheduler::start()
{
    if (session_.isRunning()) {
        lastStartError_ = TransferError::AlreadyRunning;
        const QString message = tr("Transfer already running");
        qWarning() << "TransferScheduler::start -" << message;
        emit statusMessage(message);
        emit startRefused(TransferError::AlreadyRunning, message);
        return false;
    }

    if (session_.count() == 0) {
        lastStartError_ = TransferError::None;
        const QString message = tr("No tasks to run");
        emit statusMessage(message);
        emit startRefused(TransferError::None, message);
        return false;
    }

    // The previous run's thread has emitted sessionFinished but may not have
    // returned yet.
    releaseThread();

    lastStartError_ = TransferError::None;
    session_.resetStatuses();
    std::shared_ptr<CancellationToken> token = session_.renewToken();
    session_.setRunning(true);

    const qint64 ceiling = session_.throughputCeilingBps();
    const TransferWorker::Options options = workerOptions_;
    const FailurePolicy policy = failurePolicy_;
    const int taskCount = session_.count();

    qInfo() << "TransferScheduler: starting" << taskCount << "task(s), ceiling"
            << ceiling << "B/s, on failure:" << failurePolicyToString(policy);
    emit sessionStarted(taskCount);

    thread_ = QThread::create([this, token, ceiling, options, policy]() {
        runAll(token, ceiling, options, policy);
    });
    thread_->setObjectName(QStringLiteral("TransferScheduler"));
    thread_->start();
    return true;
}

bool TransferScheduler::requestStop()
{
    if (!session_.isRunning()) {
        return false;
    }

    session_.token()->requestStop();
    emit statusMessage(tr("Stop requested, waiting for the current file..."));
    return true;
}

bool TransferScheduler::waitForFinished(int msecs)
{
    if (!thread_) {
        return !session_.isRunning();
    }

    QDeadlineTimer deadline = msecs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                        : QDeadlineTimer(msecs);
    thread_->wait(deadline);
    return !session_.isRunning();
}

void TransferScheduler::setWorkerOptions(const TransferWorker::Options &options)
{
    if (session_.isRunning()) {
        qWarning() << "TransferScheduler::setWorkerOptions - ignored while running";
        return;
    }
    workerOptions_ = options;
}

void TransferScheduler::setFailurePolicy(FailurePolicy policy)
{
    if (session_.isRunning()) {
        qWarning() << "TransferScheduler::setFailurePolicy - ignored while running";
        return;
    }
    failurePolicy_ = policy;
}

void TransferScheduler::setErrorReporter(ErrorReporter *reporter)
{
    if (errorReporter_) {
        disconnect(this, nullptr, errorReporter_, nullptr);
    }

    errorReporter_ = reporter;

    if (errorReporter_) {
        // The reporter is the context object, so these run on its thread.
        connect(this, &TransferScheduler::taskFailed, errorReporter_,
                [reporter](int taskId, TransferError error, const QString &message) {
                    reporter->reportTaskError(taskId, error, message);
                });
        connect(this, &TransferScheduler::startRefused, errorReporter_,
                [reporter](TransferError error, const QString &message) {
                    if (error == TransferError::None) {
                        reporter->handleError(ErrorCategory::System, ErrorSeverity::Warning,
                                              TransferScheduler::tr("Cannot start"), message);
                    } else {
                        reporter->reportTaskError(-1, error, message);
                    }
                });
    }
}

void TransferScheduler::runAll(std::shared_ptr<CancellationToken> token, qint64 ceilingBps,
                               TransferWorker::Options options, FailurePolicy policy)
{
    TransferWorker worker(fileOps_, this, options);
    const QList<TransferTask> tasks = session_.tasks();

    SessionSummary summary;
    summary.tasksTotal = tasks.size();

    for (const TransferTask &task : tasks) {
        if (!token->isRunning()) {
            // Stop landed after the previous task's last chunk
            summary.halted = true;
            summary.stopped = true;
            break;
        }

        session_.setCurrentIndex(task.id);
        session_.setTaskStatus(task.id, TransferTask::Status::Running, tr("Running"));
        emit taskStarted(task.id, task.name);

        const TaskOutcome outcome = worker.run(task, ceilingBps, *token);

        session_.setTaskStatus(task.id, outcome.status, outcome.message, outcome.error);
        emit taskFinished(task.id, outcome.succeeded(), outcome.message);
        emit taskSummaryReady(outcome.summary);

        if (outcome.succeeded()) {
            summary.tasksSucceeded++;
            continue;
        }

        emit taskFailed(task.id, outcome.error, outcome.message);
        summary.failureMessages.append(tr("[%1] %2: %3")
                                           .arg(task.id + 1)
                                           .arg(task.name, outcome.message));

        if (outcome.status == TransferTask::Status::Cancelled) {
            summary.tasksCancelled++;
            summary.halted = true;
            summary.stopped = true;
            break;
        }

        summary.tasksFailed++;
        if (policy == FailurePolicy::HaltQueue) {
            summary.halted = true;
            if (task.id + 1 < tasks.size()) {
                emit statusMessage(tr("Halting queue after failure of task %1").arg(task.id + 1));
            }
            break;
        }
    }

    summary.tasksNotRun = summary.tasksTotal - summary.tasksSucceeded
                          - summary.tasksFailed - summary.tasksCancelled;

    session_.setRunning(false);

    QString finalMessage;
    if (summary.allSucceeded()) {
        finalMessage = tr("Batch operation complete: %1 task(s) succeeded").arg(summary.tasksSucceeded);
    } else if (summary.stopped) {
        finalMessage = tr("Stopped by user: %1 succeeded, %2 not run")
                           .arg(summary.tasksSucceeded).arg(summary.tasksNotRun);
    } else {
        finalMessage = tr("Batch operation finished with errors: %1 succeeded, %2 failed, %3 not run")
                           .arg(summary.tasksSucceeded).arg(summary.tasksFailed).arg(summary.tasksNotRun);
    }
    qInfo().noquote() << "TransferScheduler:" << finalMessage;
    emit statusMessage(finalMessage);
    emit sessionFinished(summary);
}

void TransferScheduler::releaseThread()
{
    if (!thread_) {
        return;
    }
    thread_->wait();
    delete thread_;
    thread_ = nullptr;
}

void TransferScheduler::onProgress(int taskId, const QString &fileName, TransferPhase phase, int percent)
{
    LOG_VERBOSE() << "TransferScheduler: task" << taskId << fileName
                  << transferPhaseToString(phase) << percent << "%";
    emit progress(taskId, fileName, phase, percent);
}

void TransferScheduler::onTaskProgress(int taskId, int percent)
{
    emit taskProgress(taskId, percent);
}

void TransferScheduler::onThroughputSample(double mbps)
{
    emit throughputSample(mbps);
}

void TransferScheduler::onStatus(const QString &message)
{
    emit statusMessage(message);
}
