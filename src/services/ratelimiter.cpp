#include "ratelimiter.h"

#include <QThread>

#include "utils/logging.h"

RateLimiter::RateLimiter(qint64 limitBps)
    : limitBps_(qMax<qint64>(limitBps, 0))
    , sleeper_(&RateLimiter::threadSleep)
{
}

qint64 RateLimiter::effectiveLimitBps() const
{
    // 0 means "no limit requested", which is still paced against a high
    // fixed ceiling rather than left unbounded.
    return limitBps_ > 0 ? limitBps_ : UnlimitedFallbackBps;
}

void RateLimiter::start()
{
    clock_.start();
    meter_.reset();
    sleptNs_ = 0;
}

ChunkPacing RateLimiter::throttle(qint64 chunkBytes, qint64 elapsedActualNs)
{
    if (!clock_.isValid()) {
        start();
    }

    ChunkPacing pacing;
    pacing.delayNs = delayFor(chunkBytes, elapsedActualNs, effectiveLimitBps());
    if (pacing.delayNs > 0) {
        sleeper_(pacing.delayNs);
        if (customSleeper_) {
            sleptNs_ += pacing.delayNs;
        }
    }

    qint64 sinceStart = clock_.nsecsElapsed() + sleptNs_;
    meter_.record(chunkBytes, elapsedActualNs + pacing.delayNs, sinceStart);
    pacing.throughputMBps = meter_.averageMBps();

    LOG_VERBOSE() << "RateLimiter: chunk" << chunkBytes << "bytes in" << elapsedActualNs
                  << "ns, delay" << pacing.delayNs << "ns," << pacing.throughputMBps << "MB/s";
    return pacing;
}

qint64 RateLimiter::delayFor(qint64 chunkBytes, qint64 elapsedNs, qint64 effectiveLimitBps)
{
    if (chunkBytes <= 0 || effectiveLimitBps <= 0) {
        return 0;
    }

    // targetNs = chunkBytes / limit seconds; computed in double to avoid
    // overflowing chunkBytes * 1e9 for large chunks.
    const double targetNs = static_cast<double>(chunkBytes) * 1e9
                            / static_cast<double>(effectiveLimitBps);
    const double delay = targetNs - static_cast<double>(elapsedNs);
    return delay > 0.0 ? static_cast<qint64>(delay) : 0;
}

void RateLimiter::setSleeper(Sleeper sleeper)
{
    customSleeper_ = static_cast<bool>(sleeper);
    sleeper_ = sleeper ? std::move(sleeper) : Sleeper(&RateLimiter::threadSleep);
}

void RateLimiter::threadSleep(qint64 ns)
{
    QThread::usleep(static_cast<unsigned long>((ns + 999) / 1000));
}
