#include "cancellationtoken.h"

#include <QMutexLocker>

void CancellationToken::requestStop()
{
    QMutexLocker locker(&mutex_);
    running_ = false;
}

bool CancellationToken::isRunning() const
{
    QMutexLocker locker(&mutex_);
    return running_;
}
