/**
 * @file throughputmeter.h
 * @brief Cumulative and rolling-window throughput statistics for a transfer.
 *
 * The meter is fed once per chunk with the chunk size, the time spent on the
 * chunk and the time elapsed since the transfer started. It reports the
 * cumulative average (total bytes / total time) and the spread of recent
 * per-chunk rates.
 */

#ifndef THROUGHPUTMETER_H
#define THROUGHPUTMETER_H

#include <QtGlobal>

#include <algorithm>
#include <limits>
#include <vector>

/**
 * @brief Tracks bytes moved over time and derives throughput figures.
 *
 * @par Example usage:
 * @code
 * ThroughputMeter meter(16);
 * meter.record(1048576, chunkNs, sinceStartNs);
 * double mbps = meter.averageMBps();
 * double peak = meter.windowMaxBytesPerSecond();
 * @endcode
 */
class ThroughputMeter
{
public:
    static constexpr double BytesPerMB = 1024.0 * 1024.0;
    static constexpr double NsPerSecond = 1e9;

    /**
     * @brief Constructs a meter.
     * @param windowSize Number of recent per-chunk rates kept for min/mean/max.
     */
    explicit ThroughputMeter(size_t windowSize = 32)
        : windowSize_(std::max<size_t>(windowSize, 1))
    {
        rates_.reserve(windowSize_);
    }

    /**
     * @brief Records one chunk.
     * @param bytes Bytes moved by the chunk.
     * @param chunkNs Wall time spent on the chunk, pacing delay included.
     * @param sinceStartNs Wall time elapsed since the transfer started.
     */
    void record(qint64 bytes, qint64 chunkNs, qint64 sinceStartNs)
    {
        totalBytes_ += bytes;
        elapsedNs_ = std::max(elapsedNs_, sinceStartNs);
        chunks_++;

        if (chunkNs <= 0) {
            return;
        }
        double rate = static_cast<double>(bytes) * NsPerSecond / static_cast<double>(chunkNs);
        if (rates_.size() < windowSize_) {
            rates_.push_back(rate);
        } else {
            rates_[writeIndex_] = rate;
        }
        writeIndex_ = (writeIndex_ + 1) % windowSize_;
    }

    /// Clears all counters and samples.
    void reset()
    {
        totalBytes_ = 0;
        elapsedNs_ = 0;
        chunks_ = 0;
        rates_.clear();
        writeIndex_ = 0;
    }

    [[nodiscard]] qint64 totalBytes() const { return totalBytes_; }
    [[nodiscard]] qint64 elapsedNs() const { return elapsedNs_; }
    [[nodiscard]] qint64 chunkCount() const { return chunks_; }
    [[nodiscard]] size_t windowSize() const { return windowSize_; }
    [[nodiscard]] size_t sampleCount() const { return rates_.size(); }

    /**
     * @brief Cumulative bytes divided by time since start.
     * @return Bytes per second, or 0.0 before any time has elapsed.
     */
    [[nodiscard]] double averageBytesPerSecond() const
    {
        if (elapsedNs_ <= 0) {
            return 0.0;
        }
        return static_cast<double>(totalBytes_) * NsPerSecond / static_cast<double>(elapsedNs_);
    }

    /// Same as averageBytesPerSecond(), in MB/s (binary megabytes).
    [[nodiscard]] double averageMBps() const
    {
        return averageBytesPerSecond() / BytesPerMB;
    }

    [[nodiscard]] double windowMeanBytesPerSecond() const
    {
        if (rates_.empty()) {
            return 0.0;
        }
        double sum = 0.0;
        for (double rate : rates_) {
            sum += rate;
        }
        return sum / static_cast<double>(rates_.size());
    }

    /// Slowest recent chunk, or 0.0 with no samples.
    [[nodiscard]] double windowMinBytesPerSecond() const
    {
        if (rates_.empty()) {
            return 0.0;
        }
        return *std::min_element(rates_.begin(), rates_.end());
    }

    /// Fastest recent chunk, or 0.0 with no samples.
    [[nodiscard]] double windowMaxBytesPerSecond() const
    {
        if (rates_.empty()) {
            return 0.0;
        }
        return *std::max_element(rates_.begin(), rates_.end());
    }

private:
    size_t windowSize_;
    std::vector<double> rates_;  // Circular buffer of per-chunk rates
    size_t writeIndex_ = 0;
    qint64 totalBytes_ = 0;
    qint64 elapsedNs_ = 0;
    qint64 chunks_ = 0;
};

#endif // THROUGHPUTMETER_H
