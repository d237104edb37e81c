#include "transferworker.h"

#include "services/cancellationtoken.h"
#include "services/ifileoperations.h"
#include "services/transferobserver.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <algorithm>

TransferWorker::TransferWorker(IFileOperations *fileOps, TransferObserver *observer)
    : TransferWorker(fileOps, observer, Options())
{
}

TransferWorker::TransferWorker(IFileOperations *fileOps, TransferObserver *observer, const Options &options)
    : fileOps_(fileOps)
    , observer_(observer)
    , options_(options)
{
    if (options_.chunkSize <= 0) {
        options_.chunkSize = RateLimiter::DefaultChunkSize;
    } else if (options_.chunkSize > RateLimiter::MaxChunkSize) {
        qWarning() << "TransferWorker: chunk size" << options_.chunkSize
                   << "clamped to" << RateLimiter::MaxChunkSize;
        options_.chunkSize = RateLimiter::MaxChunkSize;
    }
}

void TransferWorker::transitionTo(WorkerState newState)
{
    if (state_ == newState) {
        return;
    }

    qDebug() << "TransferWorker: State transition"
             << workerStateToString(state_) << "->" << workerStateToString(newState);

    state_ = newState;
}

QString TransferWorker::resolvePath(const QString &path)
{
    // Canonicalize the deepest existing ancestor so symlinks and ".." in a
    // not-yet-created destination resolve the same way as an existing one.
    QString existing = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    QStringList missing;
    while (!QFileInfo::exists(existing)) {
        const QString parent = QFileInfo(existing).absolutePath();
        if (parent == existing) {
            break;
        }
        missing.prepend(QFileInfo(existing).fileName());
        existing = parent;
    }

    QString resolved = QFileInfo(existing).canonicalFilePath();
    if (resolved.isEmpty()) {
        resolved = existing;
    }
    for (const QString &part : missing) {
        resolved = QDir(resolved).filePath(part);
    }
    return QDir::cleanPath(resolved);
}

QList<FileUnit> TransferWorker::walk(const QString &sourceDir, const QString &destinationDir)
{
    QList<FileUnit> units;
    const QDir sourceRoot(sourceDir);
    const QDir destinationRoot(destinationDir);

    // Symlinked directories are not descended into; symlinks to files are
    // treated as the files they point at.
    QDirIterator it(sourceDir, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QFileInfo info(path);

        FileUnit unit;
        unit.absoluteSourcePath = info.absoluteFilePath();
        unit.relativePath = sourceRoot.relativeFilePath(unit.absoluteSourcePath);
        unit.absoluteDestinationPath = QDir::cleanPath(destinationRoot.absoluteFilePath(unit.relativePath));
        unit.size = info.size();
        units.append(unit);
    }

    std::sort(units.begin(), units.end(), [](const FileUnit &a, const FileUnit &b) {
        return a.relativePath < b.relativePath;
    });
    return units;
}

TaskOutcome TransferWorker::run(const TransferTask &task, qint64 ceilingBps, const CancellationToken &token)
{
    taskTimer_.start();
    TaskSummary summary;
    summary.taskId = task.id;

    transitionTo(WorkerState::Walking);

    const QFileInfo source(task.sourcePath);
    if (!source.exists()) {
        return finish(task, TransferTask::Status::Failed, TransferError::SourceNotFound,
                      QStringLiteral("Source directory not found: %1").arg(task.sourcePath), summary);
    }

    if (!token.isRunning()) {
        return finish(task, TransferTask::Status::Cancelled, TransferError::CancelledByCaller,
                      QStringLiteral("Cancelled before start."), summary);
    }

    QList<FileUnit> units;
    const bool singleFile = source.isFile();

    if (singleFile) {
        FileUnit unit;
        unit.absoluteSourcePath = source.absoluteFilePath();
        unit.relativePath = source.fileName();
        unit.size = source.size();

        QFileInfo destination(task.destinationPath);
        unit.absoluteDestinationPath = destination.isDir()
            ? QDir(destination.absoluteFilePath()).absoluteFilePath(source.fileName())
            : destination.absoluteFilePath();
        units.append(unit);
    } else {
        const QString sourceRoot = source.canonicalFilePath();
        const QFileInfo destinationRoot(task.destinationPath);
        const QString resolvedDestination = resolvePath(task.destinationPath);
        if (resolvedDestination == sourceRoot) {
            return finish(task, TransferTask::Status::Failed, TransferError::IOFailure,
                          QStringLiteral("Source and destination are the same directory: %1")
                              .arg(task.sourcePath), summary);
        }
        if (resolvedDestination.startsWith(sourceRoot + QLatin1Char('/'))) {
            return finish(task, TransferTask::Status::Failed, TransferError::IOFailure,
                          QStringLiteral("Destination %1 is inside the source directory %2")
                              .arg(task.destinationPath, task.sourcePath), summary);
        }

        if (!fileOps_->makePath(task.destinationPath)) {
            return finish(task, TransferTask::Status::Failed, TransferError::IOFailure,
                          QStringLiteral("Cannot create destination directory: %1")
                              .arg(task.destinationPath), summary);
        }

        units = walk(source.absoluteFilePath(), destinationRoot.absoluteFilePath());
    }

    summary.filesTotal = units.size();
    if (units.isEmpty()) {
        return finish(task, TransferTask::Status::Succeeded, TransferError::None,
                      QStringLiteral("Source directory is empty. Operation successful."), summary);
    }

    if (observer_) {
        observer_->onStatus(QStringLiteral("Starting %1 of %2 file(s) from %3")
                                .arg(QLatin1String(transferModeToString(task.mode)))
                                .arg(units.size())
                                .arg(task.sourcePath));
    }

    RateLimiter limiter(ceilingBps);
    limiter.start();
    const FileDigest digest(options_.algorithm);
    const int totalFiles = units.size();
    int percent = 0;

    for (const FileUnit &unit : units) {
        if (!token.isRunning()) {
            return finish(task, TransferTask::Status::Cancelled, TransferError::CancelledByCaller,
                          QStringLiteral("Operation cancelled after %1 of %2 file(s).")
                              .arg(summary.filesCompleted).arg(totalFiles), summary);
        }

        if (QFileInfo::exists(unit.absoluteDestinationPath)
            && QFileInfo(unit.absoluteDestinationPath).canonicalFilePath()
                   == QFileInfo(unit.absoluteSourcePath).canonicalFilePath()) {
            return finish(task, TransferTask::Status::Failed, TransferError::IOFailure,
                          QStringLiteral("Source and destination are the same file: %1")
                              .arg(unit.relativePath), summary);
        }

        const QString parentDir = QFileInfo(unit.absoluteDestinationPath).absolutePath();
        if (!fileOps_->makePath(parentDir)) {
            return finish(task, TransferTask::Status::Failed, TransferError::IOFailure,
                          QStringLiteral("Cannot create directory %1 for %2")
                              .arg(parentDir, unit.relativePath), summary);
        }

        // 1. Copy
        transitionTo(WorkerState::Copying);
        if (observer_) {
            observer_->onProgress(task.id, unit.relativePath, TransferPhase::Copying, percent);
        }

        QString copyError;
        CopyResult copied = copyFile(unit, limiter, token, task.id, singleFile,
                                     summary.bytesCopied, copyError);
        if (copied == CopyResult::Cancelled) {
            return finish(task, TransferTask::Status::Cancelled, TransferError::CancelledByCaller,
                          QStringLiteral("Operation cancelled during %1. Partial file removed.")
                              .arg(unit.relativePath), summary);
        }
        if (copied == CopyResult::Failed) {
            return finish(task, TransferTask::Status::Failed, TransferError::IOFailure, copyError, summary);
        }

        // Metadata is best effort; the content check below is what counts.
        if (options_.preserveMetadata
            && !fileOps_->copyMetadata(unit.absoluteSourcePath, unit.absoluteDestinationPath)) {
            LOG_VERBOSE() << "TransferWorker: metadata not preserved for" << unit.relativePath;
        }

        // 2. Verify
        transitionTo(WorkerState::Verifying);
        if (observer_) {
            observer_->onProgress(task.id, unit.relativePath, TransferPhase::Verifying, percent);
        }

        const DigestResult sourceDigest = digest.compute(unit.absoluteSourcePath);
        const DigestResult destinationDigest = digest.compute(unit.absoluteDestinationPath);
        if (!sourceDigest.matches(destinationDigest)) {
            qWarning() << "TransferWorker: digest mismatch for" << unit.relativePath
                       << sourceDigest.hex << destinationDigest.hex;
            // The source is untouched; an unverified copy must not look complete.
            discardPartial(unit.absoluteDestinationPath);
            return finish(task, TransferTask::Status::Failed, TransferError::IntegrityMismatch,
                          QStringLiteral("%1 mismatch for %2. Copy failed.")
                              .arg(digestAlgorithmToString(options_.algorithm).toUpper(), unit.relativePath),
                          summary);
        }

        // 3. Delete the verified source
        if (isDestructiveMode(task.mode)) {
            transitionTo(WorkerState::Deleting);
            if (observer_) {
                observer_->onProgress(task.id, unit.relativePath, TransferPhase::Deleting, percent);
            }

            QString removeError;
            if (!fileOps_->removeFile(unit.absoluteSourcePath, &removeError)) {
                // The destination is verified and kept.
                return finish(task, TransferTask::Status::Failed, TransferError::IOFailure,
                              QStringLiteral("Failed to delete source %1: %2")
                                  .arg(unit.relativePath, removeError), summary);
            }
        }

        summary.filesCompleted++;
        percent = summary.filesCompleted * 100 / totalFiles;
        if (observer_) {
            observer_->onTaskProgress(task.id, percent);
        }
        LOG_VERBOSE() << "TransferWorker: completed" << unit.relativePath
                      << summary.filesCompleted << "/" << totalFiles;
    }

    if (!singleFile && isDestructiveMode(task.mode) && options_.pruneEmptySourceDirectories) {
        pruneEmptyDirectories(source.absoluteFilePath(), units);
    }

    return finish(task, TransferTask::Status::Succeeded, TransferError::None,
                  QStringLiteral("Operation %1 successful: %2 file(s).")
                      .arg(QLatin1String(transferModeToString(task.mode)))
                      .arg(summary.filesCompleted), summary);
}

TransferWorker::CopyResult TransferWorker::copyFile(const FileUnit &unit, RateLimiter &limiter,
                                                    const CancellationToken &token, int taskId,
                                                    bool reportByteProgress, qint64 &bytesCopied,
                                                    QString &errorMessage)
{
    QString openError;
    std::unique_ptr<QIODevice> in = fileOps_->openForRead(unit.absoluteSourcePath, &openError);
    if (!in) {
        errorMessage = QStringLiteral("Cannot open source %1: %2").arg(unit.relativePath, openError);
        return CopyResult::Failed;
    }

    std::unique_ptr<QIODevice> out = fileOps_->openForWrite(unit.absoluteDestinationPath, &openError);
    if (!out) {
        errorMessage = QStringLiteral("Cannot open destination %1: %2").arg(unit.relativePath, openError);
        return CopyResult::Failed;
    }

    QByteArray buffer;
    buffer.resize(static_cast<qsizetype>(options_.chunkSize));
    qint64 fileBytes = 0;

    for (;;) {
        if (!token.isRunning()) {
            out->close();
            discardPartial(unit.absoluteDestinationPath);
            LOG_VERBOSE() << "TransferWorker: stop noticed in" << unit.relativePath
                          << "after" << fileBytes << "bytes";
            return CopyResult::Cancelled;
        }

        QElapsedTimer chunkTimer;
        chunkTimer.start();

        const qint64 n = in->read(buffer.data(), buffer.size());
        if (n < 0) {
            errorMessage = QStringLiteral("Read error on %1: %2").arg(unit.relativePath, in->errorString());
            out->close();
            discardPartial(unit.absoluteDestinationPath);
            return CopyResult::Failed;
        }
        if (n == 0) {
            break;
        }

        const qint64 written = out->write(buffer.constData(), n);
        if (written != n) {
            errorMessage = QStringLiteral("Write error on %1: %2").arg(unit.relativePath, out->errorString());
            out->close();
            discardPartial(unit.absoluteDestinationPath);
            return CopyResult::Failed;
        }

        const ChunkPacing pacing = limiter.throttle(n, chunkTimer.nsecsElapsed());
        fileBytes += n;
        bytesCopied += n;

        if (observer_) {
            observer_->onThroughputSample(pacing.throughputMBps);
            if (reportByteProgress && unit.size > 0) {
                observer_->onTaskProgress(taskId, static_cast<int>(qMin<qint64>(fileBytes, unit.size) * 100 / unit.size));
            }
        }
    }

    out->close();
    in->close();
    return CopyResult::Completed;
}

void TransferWorker::discardPartial(const QString &path)
{
    if (!QFileInfo::exists(path)) {
        return;
    }
    QString error;
    if (!fileOps_->removeFile(path, &error)) {
        qWarning() << "TransferWorker: could not remove partial file" << path << "-" << error;
    }
}

void TransferWorker::pruneEmptyDirectories(const QString &sourceRoot, const QList<FileUnit> &units)
{
    const QString root = QDir::cleanPath(sourceRoot);
    const QString rootPrefix = root + QLatin1Char('/');
    QSet<QString> directories;
    for (const FileUnit &unit : units) {
        QString dir = QFileInfo(unit.absoluteSourcePath).absolutePath();
        while (dir.startsWith(rootPrefix)) {
            directories.insert(dir);
            dir = QFileInfo(dir).absolutePath();
        }
    }

    // Deepest first, so parents are empty by the time they are tried
    QList<QString> ordered(directories.begin(), directories.end());
    std::sort(ordered.begin(), ordered.end(), [](const QString &a, const QString &b) {
        return a.count(QLatin1Char('/')) > b.count(QLatin1Char('/'));
    });
    for (const QString &dir : ordered) {
        if (fileOps_->removeEmptyDirectory(dir)) {
            LOG_VERBOSE() << "TransferWorker: pruned" << dir;
        }
    }
}

TaskOutcome TransferWorker::finish(const TransferTask &task, TransferTask::Status status, TransferError error,
                                   const QString &message, TaskSummary summary)
{
    transitionTo(WorkerState::Done);

    summary.elapsedMs = taskTimer_.isValid() ? taskTimer_.elapsed() : 0;
    if (summary.elapsedMs > 0) {
        summary.averageBytesPerSecond = static_cast<double>(summary.bytesCopied) * 1000.0
                                        / static_cast<double>(summary.elapsedMs);
    }

    TaskOutcome outcome;
    outcome.status = status;
    outcome.error = error;
    outcome.message = message;
    outcome.summary = summary;

    if (observer_) {
        observer_->onTaskFinished(task.id, outcome.succeeded(), message);
    }

    transitionTo(WorkerState::Idle);
    return outcome;
}
