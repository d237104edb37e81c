#ifndef TRANSFERSESSION_H
#define TRANSFERSESSION_H

#include <QList>
#include <QMutex>
#include <QString>

#include <memory>

#include "models/transfertask.h"
#include "services/cancellationtoken.h"

/**
 * @brief Ordered task list plus the state of the run executing it.
 *
 * Insertion order is execution order, and a task's id is its position. The
 * list can only be edited while no run is active; the worker thread updates
 * task status while a run is active. All access is serialized by an internal
 * mutex, so readers on other threads always see whole task records.
 */
class TransferSession
{
public:
    TransferSession();

    TransferSession(const TransferSession &) = delete;
    TransferSession &operator=(const TransferSession &) = delete;

    // Task list editing (refused while running)
    int addTask(TransferTask task);
    bool removeTask(int index);
    bool setTasks(const QList<TransferTask> &tasks);
    bool clear();

    [[nodiscard]] int count() const;
    [[nodiscard]] QList<TransferTask> tasks() const;
    [[nodiscard]] TransferTask task(int index) const;

    // Status updates from the running worker
    void setTaskStatus(int index, TransferTask::Status status,
                       const QString &message = QString(),
                       TransferError error = TransferError::None);
    void resetStatuses();

    [[nodiscard]] qint64 throughputCeilingBps() const;
    void setThroughputCeilingBps(qint64 bps);

    [[nodiscard]] int currentIndex() const;
    void setCurrentIndex(int index);

    [[nodiscard]] bool isRunning() const;
    void setRunning(bool running);

    /// Token of the current (or last) run.
    [[nodiscard]] std::shared_ptr<CancellationToken> token() const;

    /// Discards the previous token and installs a fresh one for a new run.
    std::shared_ptr<CancellationToken> renewToken();

private:
    void renumberLocked();

    mutable QMutex mutex_;
    QList<TransferTask> tasks_;
    qint64 ceilingBps_ = 0;
    int currentIndex_ = -1;
    bool running_ = false;
    std::shared_ptr<CancellationToken> token_;
};

#endif // TRANSFERSESSION_H
