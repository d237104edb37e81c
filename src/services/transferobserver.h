/**
 * @file transferobserver.h
 * @brief Callback interface for events produced while a task runs.
 */

#ifndef TRANSFEROBSERVER_H
#define TRANSFEROBSERVER_H

#include <QString>

#include "models/transfertask.h"

/**
 * @brief Receives transfer events from TransferWorker.
 *
 * Callbacks run synchronously on the worker's thread, in the order the events
 * are produced. For a given task every file-level event precedes
 * onTaskFinished(). All methods have empty defaults.
 */
class TransferObserver
{
public:
    virtual ~TransferObserver() = default;

    /**
     * @brief A file entered a phase.
     * @param taskId The task.
     * @param fileName Path of the file relative to the task source.
     * @param phase Copying, Verifying or Deleting.
     * @param percent Task progress when the phase started.
     */
    virtual void onProgress(int taskId, const QString &fileName, TransferPhase phase, int percent)
    {
        Q_UNUSED(taskId)
        Q_UNUSED(fileName)
        Q_UNUSED(phase)
        Q_UNUSED(percent)
    }

    /// Task progress after a file completes (per chunk for single-file tasks).
    virtual void onTaskProgress(int taskId, int percent)
    {
        Q_UNUSED(taskId)
        Q_UNUSED(percent)
    }

    /// Cumulative throughput since task start, after each chunk.
    virtual void onThroughputSample(double mbps)
    {
        Q_UNUSED(mbps)
    }

    virtual void onStatus(const QString &message)
    {
        Q_UNUSED(message)
    }

    virtual void onTaskFinished(int taskId, bool success, const QString &message)
    {
        Q_UNUSED(taskId)
        Q_UNUSED(success)
        Q_UNUSED(message)
    }
};

#endif // TRANSFEROBSERVER_H
