#include "transfersession.h"

#include <QDebug>
#include <QFileInfo>
#include <QMutexLocker>

TransferSession::TransferSession()
    : token_(std::make_shared<CancellationToken>())
{
}

int TransferSession::addTask(TransferTask task)
{
    QMutexLocker locker(&mutex_);
    if (running_) {
        qWarning() << "TransferSession::addTask - refused while running";
        return -1;
    }

    if (task.name.isEmpty()) {
        task.name = QFileInfo(task.sourcePath).fileName();
    }
    task.id = tasks_.size();
    task.status = TransferTask::Status::Pending;
    task.statusMessage.clear();
    task.error = TransferError::None;
    tasks_.append(task);
    return task.id;
}

bool TransferSession::removeTask(int index)
{
    QMutexLocker locker(&mutex_);
    if (running_ || index < 0 || index >= tasks_.size()) {
        return false;
    }
    tasks_.removeAt(index);
    renumberLocked();
    return true;
}

bool TransferSession::setTasks(const QList<TransferTask> &tasks)
{
    {
        QMutexLocker locker(&mutex_);
        if (running_) {
            return false;
        }
        tasks_.clear();
    }
    for (const TransferTask &task : tasks) {
        addTask(task);
    }
    return true;
}

bool TransferSession::clear()
{
    QMutexLocker locker(&mutex_);
    if (running_) {
        return false;
    }
    tasks_.clear();
    currentIndex_ = -1;
    return true;
}

int TransferSession::count() const
{
    QMutexLocker locker(&mutex_);
    return tasks_.size();
}

QList<TransferTask> TransferSession::tasks() const
{
    QMutexLocker locker(&mutex_);
    return tasks_;
}

TransferTask TransferSession::task(int index) const
{
    QMutexLocker locker(&mutex_);
    if (index < 0 || index >= tasks_.size()) {
        return TransferTask();
    }
    return tasks_.at(index);
}

void TransferSession::setTaskStatus(int index, TransferTask::Status status,
                                    const QString &message, TransferError error)
{
    QMutexLocker locker(&mutex_);
    if (index < 0 || index >= tasks_.size()) {
        qWarning() << "TransferSession::setTaskStatus - invalid index" << index;
        return;
    }
    TransferTask &task = tasks_[index];
    task.status = status;
    task.statusMessage = message;
    task.error = error;
}

void TransferSession::resetStatuses()
{
    QMutexLocker locker(&mutex_);
    for (TransferTask &task : tasks_) {
        task.status = TransferTask::Status::Pending;
        task.statusMessage.clear();
        task.error = TransferError::None;
    }
}

qint64 TransferSession::throughputCeilingBps() const
{
    QMutexLocker locker(&mutex_);
    return ceilingBps_;
}

void TransferSession::setThroughputCeilingBps(qint64 bps)
{
    QMutexLocker locker(&mutex_);
    ceilingBps_ = qMax<qint64>(bps, 0);
}

int TransferSession::currentIndex() const
{
    QMutexLocker locker(&mutex_);
    return currentIndex_;
}

void TransferSession::setCurrentIndex(int index)
{
    QMutexLocker locker(&mutex_);
    currentIndex_ = index;
}

bool TransferSession::isRunning() const
{
    QMutexLocker locker(&mutex_);
    return running_;
}

void TransferSession::setRunning(bool running)
{
    QMutexLocker locker(&mutex_);
    running_ = running;
    if (!running) {
        currentIndex_ = -1;
    }
}

std::shared_ptr<CancellationToken> TransferSession::token() const
{
    QMutexLocker locker(&mutex_);
    return token_;
}

std::shared_ptr<CancellationToken> TransferSession::renewToken()
{
    QMutexLocker locker(&mutex_);
    token_ = std::make_shared<CancellationToken>();
    return token_;
}

void TransferSession::renumberLocked()
{
    for (int i = 0; i < tasks_.size(); ++i) {
        tasks_[i].id = i;
    }
}
