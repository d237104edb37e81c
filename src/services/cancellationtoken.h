/**
 * @file cancellationtoken.h
 * @brief Thread-safe stop flag polled by the transfer worker.
 */

#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <QMutex>

/**
 * @brief Cooperative stop signal shared between a requester and a worker.
 *
 * The worker polls isRunning() between files and between chunks and aborts
 * the current task in an orderly way when it returns false. Nothing is
 * interrupted asynchronously. A token is used for one run only; a new run
 * gets a fresh token.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    /// Asks the worker to stop at its next suspension point.
    void requestStop();

    /// False once requestStop() has been called.
    [[nodiscard]] bool isRunning() const;

    [[nodiscard]] bool isStopRequested() const { return !isRunning(); }

private:
    mutable QMutex mutex_;
    bool running_ = true;
};

#endif // CANCELLATIONTOKEN_H
