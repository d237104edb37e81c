/**
 * @file ratelimiter.h
 * @brief Per-chunk pacing toward a bytes-per-second ceiling.
 */

#ifndef RATELIMITER_H
#define RATELIMITER_H

#include <QElapsedTimer>
#include <QtGlobal>

#include <functional>

#include "utils/throughputmeter.h"

/**
 * @brief Outcome of pacing one chunk.
 */
struct ChunkPacing {
    qint64 delayNs = 0;           ///< Sleep applied after the chunk
    double throughputMBps = 0.0;  ///< Cumulative bytes / time since start()
};

/**
 * @brief Paces a chunked byte stream to approximate a throughput ceiling.
 *
 * After each chunk the caller reports how long reading and writing it took.
 * The limiter computes the time the chunk should have taken at the ceiling
 * (chunkBytes / effectiveLimitBps) and sleeps the difference when the chunk
 * was faster. Pacing is approximate: it never speeds a slow transfer up, and
 * one chunk of overshoot is possible at the start.
 *
 * A ceiling of 0 does not disable pacing. It is replaced by
 * UnlimitedFallbackBps, so "unlimited" transfers are still bounded by that
 * constant.
 *
 * @par Example usage:
 * @code
 * RateLimiter limiter(5 * 1024 * 1024);  // 5 MiB/s
 * limiter.start();
 * while (moreData) {
 *     QElapsedTimer chunkTimer;
 *     chunkTimer.start();
 *     qint64 n = copyOneChunk();
 *     ChunkPacing pacing = limiter.throttle(n, chunkTimer.nsecsElapsed());
 *     reportSpeed(pacing.throughputMBps);
 * }
 * @endcode
 */
class RateLimiter
{
public:
    /// Bytes moved per read/write cycle.
    static constexpr qint64 DefaultChunkSize = 1024 * 1024;

    /// Largest accepted chunk (64 MiB); one chunk buffer is held in memory.
    static constexpr qint64 MaxChunkSize = 64 * 1024 * 1024;

    /// Ceiling substituted when the configured ceiling is 0 (1000 MiB/s).
    static constexpr qint64 UnlimitedFallbackBps = 2LL * 500 * 1024 * 1024;

    using Sleeper = std::function<void(qint64 ns)>;

    /**
     * @brief Constructs a limiter.
     * @param limitBps Ceiling in bytes per second; 0 selects the fallback.
     */
    explicit RateLimiter(qint64 limitBps = 0);

    [[nodiscard]] qint64 limitBps() const { return limitBps_; }

    /// The ceiling actually paced against.
    [[nodiscard]] qint64 effectiveLimitBps() const;

    /// True when the configured ceiling is 0.
    [[nodiscard]] bool usesFallbackCeiling() const { return limitBps_ <= 0; }

    /**
     * @brief Resets the transfer clock and throughput counters.
     */
    void start();

    /**
     * @brief Paces one chunk.
     * @param chunkBytes Size of the chunk just written.
     * @param elapsedActualNs Time actually spent reading and writing it.
     * @return The delay applied and the updated throughput sample.
     *
     * Calls start() implicitly if it was never called.
     */
    ChunkPacing throttle(qint64 chunkBytes, qint64 elapsedActualNs);

    /**
     * @brief Delay needed for a chunk to take chunkBytes / limit seconds.
     * @param chunkBytes Size of the chunk.
     * @param elapsedNs Time the chunk actually took.
     * @param effectiveLimitBps Ceiling; must be positive.
     * @return Nanoseconds to sleep, 0 if the chunk was already slow enough.
     */
    [[nodiscard]] static qint64 delayFor(qint64 chunkBytes, qint64 elapsedNs, qint64 effectiveLimitBps);

    [[nodiscard]] const ThroughputMeter &meter() const { return meter_; }

    /// Replaces the sleep function (tests use this to avoid real sleeps).
    void setSleeper(Sleeper sleeper);

private:
    static void threadSleep(qint64 ns);

    qint64 limitBps_ = 0;
    QElapsedTimer clock_;
    ThroughputMeter meter_;
    Sleeper sleeper_;
    bool customSleeper_ = false;
    qint64 sleptNs_ = 0;  // Sleep a custom sleeper did not spend on the clock
};

#endif // RATELIMITER_H
