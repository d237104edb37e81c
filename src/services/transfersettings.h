/**
 * @file transfersettings.h
 * @brief Engine settings and task lists loaded from INI files.
 */

#ifndef TRANSFERSETTINGS_H
#define TRANSFERSETTINGS_H

#include <QList>
#include <QString>

#include "models/transfertask.h"
#include "services/filedigest.h"
#include "services/ratelimiter.h"
#include "services/transferscheduler.h"
#include "services/transferworker.h"

/**
 * @brief Settings for one scheduler run.
 *
 * Read from an INI file with sections [transfer] and [logging]; command-line
 * options are applied on top by the caller.
 *
 * @code
 * [transfer]
 * limitBps=5M
 * chunkSize=1048576
 * algorithm=sha256
 * failurePolicy=halt
 * pruneEmptySourceDirectories=false
 * preserveMetadata=true
 *
 * [logging]
 * verbose=false
 * @endcode
 */
struct TransferSettings {
    qint64 limitBps = 0;
    qint64 chunkSize = RateLimiter::DefaultChunkSize;
    DigestAlgorithm algorithm = DigestAlgorithm::Sha256;
    FailurePolicy failurePolicy = FailurePolicy::HaltQueue;
    bool pruneEmptySourceDirectories = false;
    bool preserveMetadata = true;
    bool verbose = false;

    [[nodiscard]] TransferWorker::Options workerOptions() const;

    /**
     * @brief Reads settings from an INI file over the current values.
     * @param path The INI file.
     * @param errorString Receives the first problem found (may be null).
     * @return False if the file is missing, unreadable or has an invalid value.
     */
    bool loadFromFile(const QString &path, QString *errorString);
};

/**
 * @brief Reads and writes task lists as QSettings arrays.
 *
 * @code
 * [tasks]
 * size=2
 * 1\name=Photos
 * 1\source=/data/photos
 * 1\destination=/backup/photos
 * 1\mode=verify-and-delete
 * 2\source=/data/docs
 * 2\destination=/backup/docs
 * @endcode
 */
class TaskListFile
{
public:
    /**
     * @brief Loads tasks in file order.
     * @param path The INI file.
     * @param tasks Receives the tasks (appended).
     * @param errorString Receives the first problem found (may be null).
     * @return False on a missing file, a missing path or an unknown mode.
     */
    static bool load(const QString &path, QList<TransferTask> &tasks, QString *errorString);

    /// Writes tasks to an INI file, replacing any existing task array.
    static bool save(const QString &path, const QList<TransferTask> &tasks, QString *errorString);
};

/**
 * @brief Parses a byte rate such as "1048576", "512K", "5M" or "1.5G".
 *
 * Suffixes are binary multiples and may be followed by "B", "/s" or "B/s".
 * Negative values and garbage are rejected.
 */
[[nodiscard]] qint64 parseByteRate(const QString &text, bool *ok = nullptr);

/// Formats bytes/sec for display ("5.00 MB/s"; 0 prints as "unlimited").
[[nodiscard]] QString formatByteRate(qint64 bytesPerSecond);

/// Formats a byte count for display ("64.00 MB", "512 B").
[[nodiscard]] QString formatByteSize(qint64 bytes);

#endif // TRANSFERSETTINGS_H
