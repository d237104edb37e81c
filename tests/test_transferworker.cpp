/**
 * @file test_transferworker.cpp
 * @brief Tests for TransferWorker against a real temporary filesystem.
 *
 * Faults (corrupted or failed writes, failed deletes, stop requests mid-file)
 * are injected through MockFileOperations.
 */

#include <QtTest>
#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "mocks/mockfileoperations.h"
#include "services/cancellationtoken.h"
#include "services/transferobserver.h"
#include "services/transferworker.h"

namespace {

/// Records every worker event as a line of text, in order.
class RecordingObserver : public TransferObserver
{
public:
    void onProgress(int taskId, const QString &fileName, TransferPhase phase, int percent) override
    {
        events.append(QString("progress %1 %2 %3 %4")
                          .arg(taskId)
                          .arg(fileName, QString::fromLatin1(transferPhaseToString(phase)))
                          .arg(percent));
        if (phase == TransferPhase::Copying) {
            copied.append(fileName);
        }
    }

    void onTaskProgress(int taskId, int percent) override
    {
        Q_UNUSED(taskId)
        taskPercents.append(percent);
    }

    void onThroughputSample(double mbps) override
    {
        samples.append(mbps);
    }

    void onStatus(const QString &message) override
    {
        statuses.append(message);
    }

    void onTaskFinished(int taskId, bool success, const QString &message) override
    {
        events.append(QString("finished %1 %2").arg(taskId).arg(success ? "ok" : "failed"));
        finishedMessage = message;
        finishedCount++;
    }

    QStringList events;
    QStringList copied;
    QList<int> taskPercents;
    QList<double> samples;
    QStringList statuses;
    QString finishedMessage;
    int finishedCount = 0;
};

QByteArray patternData(int size, int seed)
{
    QByteArray data;
    data.resize(size);
    for (int i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + seed * 17) % 256);
    }
    return data;
}

QByteArray readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

} // namespace

class TestTransferWorker : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir_ = nullptr;
    MockFileOperations *fileOps_ = nullptr;
    RecordingObserver *observer_ = nullptr;

    QString sourceDir() const { return tempDir_->filePath("source"); }
    QString destinationDir() const { return tempDir_->filePath("destination"); }

    void writeSource(const QString &relativePath, const QByteArray &content)
    {
        const QString path = QDir(sourceDir()).filePath(relativePath);
        QVERIFY(QDir().mkpath(QFileInfo(path).absolutePath()));
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        QCOMPARE(file.write(content), static_cast<qint64>(content.size()));
    }

    TransferTask makeTask(TransferMode mode) const
    {
        TransferTask task;
        task.id = 0;
        task.name = "test";
        task.sourcePath = sourceDir();
        task.destinationPath = destinationDir();
        task.mode = mode;
        return task;
    }

    static TransferWorker::Options smallChunks(qint64 chunkSize = 4096)
    {
        TransferWorker::Options options;
        options.chunkSize = chunkSize;
        return options;
    }

    QString source(const QString &relativePath) const { return QDir(sourceDir()).filePath(relativePath); }
    QString destination(const QString &relativePath) const { return QDir(destinationDir()).filePath(relativePath); }

private slots:
    void init()
    {
        tempDir_ = new QTemporaryDir();
        QVERIFY(tempDir_->isValid());
        QVERIFY(QDir().mkpath(sourceDir()));
        fileOps_ = new MockFileOperations();
        observer_ = new RecordingObserver();
    }

    void cleanup()
    {
        delete observer_;
        observer_ = nullptr;
        delete fileOps_;
        fileOps_ = nullptr;
        delete tempDir_;
        tempDir_ = nullptr;
    }

    // ========== Walking ==========

    void testWalkSortedByRelativePath()
    {
        writeSource("b.bin", "b");
        writeSource("a/z.bin", "z");
        writeSource("a/c.bin", "c");
        writeSource(".hidden", "h");

        QList<FileUnit> units = TransferWorker::walk(sourceDir(), destinationDir());

        QCOMPARE(units.size(), 4);
        QCOMPARE(units.at(0).relativePath, QString(".hidden"));
        QCOMPARE(units.at(1).relativePath, QString("a/c.bin"));
        QCOMPARE(units.at(2).relativePath, QString("a/z.bin"));
        QCOMPARE(units.at(3).relativePath, QString("b.bin"));
        QCOMPARE(units.at(1).absoluteDestinationPath, QDir::cleanPath(destination("a/c.bin")));
        QCOMPARE(units.at(1).size, 1LL);
    }

    // ========== Successful transfers ==========

    void testCopyPreservesTreeAndSource()
    {
        writeSource("one.bin", patternData(10000, 1));
        writeSource("sub/two.bin", patternData(20000, 2));
        writeSource("sub/deeper/three.bin", patternData(5, 3));

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, smallChunks());
        TaskOutcome outcome = worker.run(makeTask(TransferMode::Copy), 0, token);

        QVERIFY2(outcome.succeeded(), qPrintable(outcome.message));
        QCOMPARE(outcome.error, TransferError::None);
        QCOMPARE(outcome.summary.filesTotal, 3);
        QCOMPARE(outcome.summary.filesCompleted, 3);
        QCOMPARE(outcome.summary.bytesCopied, 30005LL);

        QCOMPARE(readAll(destination("one.bin")), patternData(10000, 1));
        QCOMPARE(readAll(destination("sub/two.bin")), patternData(20000, 2));
        QCOMPARE(readAll(destination("sub/deeper/three.bin")), patternData(5, 3));

        // Copy never deletes
        QVERIFY(QFile::exists(source("one.bin")));
        QVERIFY(QFile::exists(source("sub/two.bin")));
        QVERIFY(fileOps_->mockGetRemoveRequests().isEmpty());

        QCOMPARE(observer_->taskPercents, (QList<int>{33, 66, 100}));
        QCOMPARE(observer_->finishedCount, 1);
        QCOMPARE(worker.state(), WorkerState::Idle);
    }

    void testVerifyAndDeleteEmptiesSource()
    {
        writeSource("a.bin", patternData(9000, 1));
        writeSource("b.bin", patternData(9000, 2));
        writeSource("c.bin", patternData(9000, 3));

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, smallChunks());
        TaskOutcome outcome = worker.run(makeTask(TransferMode::VerifyAndDelete), 0, token);

        QVERIFY2(outcome.succeeded(), qPrintable(outcome.message));
        QVERIFY(QDir(sourceDir()).entryList(QDir::Files | QDir::NoDotAndDotDot).isEmpty());
        QCOMPARE(readAll(destination("a.bin")), patternData(9000, 1));
        QCOMPARE(readAll(destination("b.bin")), patternData(9000, 2));
        QCOMPARE(readAll(destination("c.bin")), patternData(9000, 3));
        QCOMPARE(fileOps_->mockGetRemoveRequests(),
                 (QStringList{source("a.bin"), source("b.bin"), source("c.bin")}));
    }

    void testMovePhasesInOrder()
    {
        writeSource("a.bin", patternData(100, 1));

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        TaskOutcome outcome = worker.run(makeTask(TransferMode::Move), 0, token);

        QVERIFY(outcome.succeeded());
        QCOMPARE(observer_->events, (QStringList{
            "progress 0 a.bin Copying 0",
            "progress 0 a.bin Verifying 0",
            "progress 0 a.bin Deleting 0",
            "finished 0 ok"}));
        QVERIFY(outcome.message.contains("1 file(s)"));
    }

    void testEmptySourceSucceeds()
    {
        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        TaskOutcome outcome = worker.run(makeTask(TransferMode::Move), 0, token);

        QVERIFY(outcome.succeeded());
        QCOMPARE(outcome.summary.filesTotal, 0);
        QCOMPARE(outcome.message, QString("Source directory is empty. Operation successful."));
        QVERIFY(QFileInfo(destinationDir()).isDir());
    }

    void testMetadataPreserved()
    {
        writeSource("old.bin", patternData(64, 1));
        const QDateTime stamp = QDateTime::fromSecsSinceEpoch(1000000000);
        {
            QFile file(source("old.bin"));
            QVERIFY(file.open(QIODevice::ReadWrite));
            QVERIFY(file.setFileTime(stamp, QFileDevice::FileModificationTime));
        }

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        QVERIFY(worker.run(makeTask(TransferMode::Copy), 0, token).succeeded());

        QCOMPARE(QFileInfo(destination("old.bin")).lastModified().toSecsSinceEpoch(),
                 stamp.toSecsSinceEpoch());
    }

    void testThroughputSampledPerChunk()
    {
        writeSource("a.bin", patternData(4096 * 5, 1));

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, smallChunks(4096));
        QVERIFY(worker.run(makeTask(TransferMode::Copy), 0, token).succeeded());

        QCOMPARE(observer_->samples.size(), 5);
        for (double mbps : observer_->samples) {
            QVERIFY(mbps > 0.0);
        }
    }

    // ========== Failures ==========

    void testMissingSourceFails()
    {
        TransferTask task = makeTask(TransferMode::Move);
        task.sourcePath = tempDir_->filePath("nowhere");

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        TaskOutcome outcome = worker.run(task, 0, token);

        QCOMPARE(outcome.status, TransferTask::Status::Failed);
        QCOMPARE(outcome.error, TransferError::SourceNotFound);
        QVERIFY(outcome.message.contains("nowhere"));
        QVERIFY(!QFileInfo::exists(destinationDir()));
        QCOMPARE(observer_->finishedCount, 1);
    }

    void testCorruptedCopyHaltsBeforeLaterFiles()
    {
        writeSource("a.bin", patternData(12000, 1));
        writeSource("b.bin", patternData(12000, 2));
        writeSource("c.bin", patternData(12000, 3));
        fileOps_->mockCorruptWritesTo("b.bin");

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, smallChunks());
        TaskOutcome outcome = worker.run(makeTask(TransferMode::VerifyAndDelete), 0, token);

        QCOMPARE(outcome.status, TransferTask::Status::Failed);
        QCOMPARE(outcome.error, TransferError::IntegrityMismatch);
        QVERIFY2(outcome.message.contains("b.bin"), qPrintable(outcome.message));
        QCOMPARE(outcome.summary.filesCompleted, 1);

        // File 1 completed, file 2 untouched at the source, file 3 never attempted
        QVERIFY(!QFile::exists(source("a.bin")));
        QCOMPARE(readAll(source("b.bin")), patternData(12000, 2));
        QVERIFY(!QFile::exists(destination("b.bin")));
        QVERIFY(QFile::exists(source("c.bin")));
        QVERIFY(!QFile::exists(destination("c.bin")));
        QVERIFY(!fileOps_->mockGetRemoveRequests().contains(source("b.bin")));
        QVERIFY(!fileOps_->mockGetWriteOpens().contains(destination("c.bin")));
        QCOMPARE(observer_->copied, (QStringList{"a.bin", "b.bin"}));
    }

    void testWriteFailureRemovesPartial()
    {
        writeSource("a.bin", patternData(8000, 1));
        fileOps_->mockFailWritesTo("a.bin");

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, smallChunks());
        TaskOutcome outcome = worker.run(makeTask(TransferMode::Move), 0, token);

        QCOMPARE(outcome.status, TransferTask::Status::Failed);
        QCOMPARE(outcome.error, TransferError::IOFailure);
        QVERIFY(outcome.message.contains("a.bin"));
        QVERIFY(!QFile::exists(destination("a.bin")));
        QVERIFY(QFile::exists(source("a.bin")));
    }

    void testDeleteFailureKeepsVerifiedDestination()
    {
        writeSource("a.bin", patternData(8000, 1));
        writeSource("b.bin", patternData(8000, 2));
        fileOps_->mockFailRemoveOf("a.bin");

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, smallChunks());
        TaskOutcome outcome = worker.run(makeTask(TransferMode::Move), 0, token);

        QCOMPARE(outcome.status, TransferTask::Status::Failed);
        QCOMPARE(outcome.error, TransferError::IOFailure);
        QVERIFY(outcome.message.contains("Failed to delete source a.bin"));
        QCOMPARE(readAll(destination("a.bin")), patternData(8000, 1));
        QVERIFY(QFile::exists(source("a.bin")));
        QVERIFY(!QFile::exists(destination("b.bin")));
    }

    void testDestinationNotCreatable()
    {
        writeSource("a.bin", "a");
        fileOps_->mockFailMakePath(destinationDir());

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        TaskOutcome outcome = worker.run(makeTask(TransferMode::Copy), 0, token);

        QCOMPARE(outcome.error, TransferError::IOFailure);
        QVERIFY(outcome.message.contains("Cannot create destination directory"));
    }

    void testDestinationInsideSourceRefused()
    {
        writeSource("a.bin", "a");
        writeSource("sub/b.bin", "b");
        TransferTask task = makeTask(TransferMode::Move);
        task.destinationPath = source("sub/backup");

        TransferWorker::Options options;
        options.pruneEmptySourceDirectories = true;

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, options);
        TaskOutcome outcome = worker.run(task, 0, token);

        QCOMPARE(outcome.status, TransferTask::Status::Failed);
        QCOMPARE(outcome.error, TransferError::IOFailure);
        QVERIFY2(outcome.message.contains("inside the source"), qPrintable(outcome.message));
        QVERIFY(!QFileInfo::exists(source("sub/backup")));
        QCOMPARE(readAll(source("a.bin")), QByteArray("a"));
        QCOMPARE(readAll(source("sub/b.bin")), QByteArray("b"));
        QVERIFY(fileOps_->mockGetRemoveRequests().isEmpty());
        QVERIFY(fileOps_->mockGetWriteOpens().isEmpty());
    }

    void testSiblingWithSourcePrefixAccepted()
    {
        // "source-copy" shares a name prefix with "source" but is not inside it
        writeSource("a.bin", "a");
        TransferTask task = makeTask(TransferMode::Copy);
        task.destinationPath = tempDir_->filePath("source-copy");

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        QVERIFY(worker.run(task, 0, token).succeeded());
        QCOMPARE(readAll(tempDir_->filePath("source-copy/a.bin")), QByteArray("a"));
    }

    void testSameSourceAndDestinationRefused()
    {
        writeSource("a.bin", "a");
        TransferTask task = makeTask(TransferMode::Move);
        task.destinationPath = sourceDir();

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        TaskOutcome outcome = worker.run(task, 0, token);

        QCOMPARE(outcome.error, TransferError::IOFailure);
        QCOMPARE(readAll(source("a.bin")), QByteArray("a"));
        QVERIFY(fileOps_->mockGetRemoveRequests().isEmpty());
    }

    void testOversizedChunkClamped()
    {
        writeSource("a.bin", patternData(70000, 5));

        TransferWorker::Options options;
        options.chunkSize = 4LL * 1024 * 1024 * 1024;  // 4 GiB does not fit an int

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, options);
        QCOMPARE(worker.options().chunkSize, RateLimiter::MaxChunkSize);

        TaskOutcome outcome = worker.run(makeTask(TransferMode::Copy), 0, token);
        QVERIFY2(outcome.succeeded(), qPrintable(outcome.message));
        QCOMPARE(readAll(destination("a.bin")), patternData(70000, 5));
        QCOMPARE(observer_->samples.size(), 1);
    }

    void testNonPositiveChunkUsesDefault()
    {
        TransferWorker::Options options;
        options.chunkSize = 0;
        TransferWorker worker(fileOps_, observer_, options);
        QCOMPARE(worker.options().chunkSize, RateLimiter::DefaultChunkSize);
    }

    // ========== Cancellation ==========

    void testCancelBeforeStart()
    {
        writeSource("a.bin", "a");

        CancellationToken token;
        token.requestStop();
        TransferWorker worker(fileOps_, observer_);
        TaskOutcome outcome = worker.run(makeTask(TransferMode::Move), 0, token);

        QCOMPARE(outcome.status, TransferTask::Status::Cancelled);
        QCOMPARE(outcome.error, TransferError::CancelledByCaller);
        QVERIFY(QFile::exists(source("a.bin")));
        QVERIFY(fileOps_->mockGetWriteOpens().isEmpty());
    }

    void testCancelMidFileRemovesPartial()
    {
        const int fileSize = 16 * 4096;
        for (int i = 1; i <= 5; ++i) {
            writeSource(QString("f%1.bin").arg(i), patternData(fileSize, i));
        }

        CancellationToken token;
        fileOps_->mockSetChunkHook([&token](const QString &fileName, int chunkIndex) {
            if (fileName == "f2.bin" && chunkIndex == 2) {
                token.requestStop();
            }
        });

        TransferWorker worker(fileOps_, observer_, smallChunks(4096));
        TaskOutcome outcome = worker.run(makeTask(TransferMode::VerifyAndDelete), 0, token);

        QCOMPARE(outcome.status, TransferTask::Status::Cancelled);
        QCOMPARE(outcome.error, TransferError::CancelledByCaller);
        QVERIFY2(outcome.message.contains("f2.bin"), qPrintable(outcome.message));
        QCOMPARE(outcome.summary.filesCompleted, 1);

        // File 1 fully done
        QVERIFY(!QFile::exists(source("f1.bin")));
        QCOMPARE(readAll(destination("f1.bin")), patternData(fileSize, 1));

        // File 2 left as it was, no partial copy
        QCOMPARE(readAll(source("f2.bin")), patternData(fileSize, 2));
        QVERIFY(!QFile::exists(destination("f2.bin")));

        // Files 3-5 untouched
        for (int i = 3; i <= 5; ++i) {
            QVERIFY(QFile::exists(source(QString("f%1.bin").arg(i))));
            QVERIFY(!QFile::exists(destination(QString("f%1.bin").arg(i))));
        }
        QCOMPARE(observer_->copied, (QStringList{"f1.bin", "f2.bin"}));
    }

    // ========== Single-file source ==========

    void testSingleFileIntoExistingDirectory()
    {
        writeSource("movie.bin", patternData(4096 * 4, 9));
        QVERIFY(QDir().mkpath(destinationDir()));

        TransferTask task = makeTask(TransferMode::Move);
        task.sourcePath = source("movie.bin");

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, smallChunks(4096));
        TaskOutcome outcome = worker.run(task, 0, token);

        QVERIFY2(outcome.succeeded(), qPrintable(outcome.message));
        QCOMPARE(readAll(destination("movie.bin")), patternData(4096 * 4, 9));
        QVERIFY(!QFile::exists(source("movie.bin")));

        // Byte progress per chunk, then the per-file completion
        QCOMPARE(observer_->taskPercents, (QList<int>{25, 50, 75, 100, 100}));
    }

    void testSingleFileThrottledToCeiling()
    {
        // 10 MiB at 5 MiB/s takes at least two seconds
        const int fileSize = 10 * 1024 * 1024;
        writeSource("big.bin", patternData(fileSize, 4));

        TransferTask task = makeTask(TransferMode::Copy);
        task.sourcePath = source("big.bin");
        task.destinationPath = tempDir_->filePath("big-copy.bin");

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        QElapsedTimer timer;
        timer.start();
        TaskOutcome outcome = worker.run(task, 5 * 1024 * 1024, token);
        const qint64 elapsedMs = timer.elapsed();

        QVERIFY2(outcome.succeeded(), qPrintable(outcome.message));
        QVERIFY2(elapsedMs >= 2000, qPrintable(QString("elapsed %1 ms").arg(elapsedMs)));
        QCOMPARE(QFileInfo(task.destinationPath).size(), static_cast<qint64>(fileSize));
        QCOMPARE(QCryptographicHash::hash(readAll(task.destinationPath), QCryptographicHash::Sha256),
                 QCryptographicHash::hash(patternData(fileSize, 4), QCryptographicHash::Sha256));
        QVERIFY(outcome.summary.averageBytesPerSecond <= 5.0 * 1024 * 1024 * 1.01);
    }

    // ========== Pruning ==========

    void testPruneEmptySourceDirectories()
    {
        writeSource("x/y/a.bin", "a");
        writeSource("x/b.bin", "b");
        QVERIFY(QDir().mkpath(QDir(sourceDir()).filePath("unrelated")));

        TransferWorker::Options options;
        options.pruneEmptySourceDirectories = true;

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_, options);
        QVERIFY(worker.run(makeTask(TransferMode::Move), 0, token).succeeded());

        QVERIFY(!QFileInfo::exists(source("x/y")));
        QVERIFY(!QFileInfo::exists(source("x")));
        // Only directories that held transferred files are pruned; the root stays
        QVERIFY(QFileInfo(source("unrelated")).isDir());
        QVERIFY(QFileInfo(sourceDir()).isDir());
    }

    void testNoPruneByDefault()
    {
        writeSource("x/a.bin", "a");

        CancellationToken token;
        TransferWorker worker(fileOps_, observer_);
        QVERIFY(worker.run(makeTask(TransferMode::Move), 0, token).succeeded());

        QVERIFY(QFileInfo(source("x")).isDir());
    }
};

QTEST_MAIN(TestTransferWorker)
#include "test_transferworker.moc"
