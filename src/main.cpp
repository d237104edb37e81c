#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <QTimer>

#include <csignal>

#include "models/transfertask.h"
#include "services/errorreporter.h"
#include "services/ratelimiter.h"
#include "services/transferscheduler.h"
#include "services/transfersettings.h"
#include "utils/logging.h"
#include "version.h"

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitUsage = 1,
    ExitTaskFailed = 2,
    ExitCancelled = 3
};

volatile std::sig_atomic_t stopSignalled = 0;

void onStopSignal(int)
{
    stopSignalled = 1;
}

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("throttlesync");
    app.setApplicationVersion(THROTTLESYNC_VERSION);
    app.setOrganizationName("throttlesync");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Throttled batch copy/move with digest verification before any source is deleted");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("source", "Source directory or file");
    parser.addPositionalArgument("destination", "Destination directory (or file path for a file source)");

    QCommandLineOption modeOption(
        QStringList() << "m" << "mode",
        "Transfer mode: copy, move or verify-and-delete (default copy)", "mode", "copy");
    QCommandLineOption limitOption(
        QStringList() << "l" << "limit",
        "Throughput ceiling, e.g. 5M, 512K or bytes/sec; 0 for no limit", "rate");
    QCommandLineOption tasksOption(
        QStringList() << "t" << "tasks",
        "INI file with a [tasks] array; runs before the positional task", "file");
    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "INI settings file ([transfer], [logging])", "file");
    QCommandLineOption algorithmOption(
        QStringList() << "a" << "algorithm",
        "Verification digest: md5, sha1 or sha256", "name");
    QCommandLineOption chunkOption(
        "chunk-size", "Bytes per read/write cycle (default 1M, at most 64M)", "bytes");
    QCommandLineOption continueOption(
        "continue-on-failure", "Run remaining tasks after a failed task");
    QCommandLineOption pruneOption(
        "prune-empty-dirs", "Remove emptied source subdirectories after move/verify-and-delete");
    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");

    parser.addOption(modeOption);
    parser.addOption(limitOption);
    parser.addOption(tasksOption);
    parser.addOption(configOption);
    parser.addOption(algorithmOption);
    parser.addOption(chunkOption);
    parser.addOption(continueOption);
    parser.addOption(pruneOption);
    parser.addOption(verboseOption);

    parser.process(app);

    ErrorReporter reporter;
    QObject::connect(&reporter, &ErrorReporter::statusMessage,
                     [](const QString &message, int) { err() << message << Qt::endl; });

    // Settings file first, command line on top
    TransferSettings settings;
    QString error;
    if (parser.isSet(configOption) && !settings.loadFromFile(parser.value(configOption), &error)) {
        reporter.reportValidationError("Invalid settings", error);
        return ExitUsage;
    }

    if (parser.isSet(limitOption)) {
        bool ok = false;
        settings.limitBps = parseByteRate(parser.value(limitOption), &ok);
        if (!ok) {
            reporter.reportValidationError("Invalid limit", parser.value(limitOption));
            return ExitUsage;
        }
    }
    if (parser.isSet(chunkOption)) {
        bool ok = false;
        settings.chunkSize = parseByteRate(parser.value(chunkOption), &ok);
        if (!ok || settings.chunkSize <= 0 || settings.chunkSize > RateLimiter::MaxChunkSize) {
            reporter.reportValidationError("Invalid chunk size",
                                           QString("%1 (1 byte to %2)")
                                               .arg(parser.value(chunkOption),
                                                    formatByteSize(RateLimiter::MaxChunkSize)));
            return ExitUsage;
        }
    }
    if (parser.isSet(algorithmOption)) {
        bool ok = false;
        settings.algorithm = digestAlgorithmFromString(parser.value(algorithmOption), &ok);
        if (!ok) {
            reporter.reportValidationError("Invalid algorithm", parser.value(algorithmOption));
            return ExitUsage;
        }
    }
    if (parser.isSet(continueOption)) {
        settings.failurePolicy = FailurePolicy::ContinueQueue;
    }
    if (parser.isSet(pruneOption)) {
        settings.pruneEmptySourceDirectories = true;
    }
    if (parser.isSet(verboseOption)) {
        settings.verbose = true;
    }

    throttlesync::verboseLogging = settings.verbose;
    if (throttlesync::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    QList<TransferTask> tasks;
    if (parser.isSet(tasksOption) && !TaskListFile::load(parser.value(tasksOption), tasks, &error)) {
        reporter.reportValidationError("Invalid task list", error);
        return ExitUsage;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() == 2) {
        bool ok = false;
        TransferTask task;
        task.sourcePath = positional.at(0);
        task.destinationPath = positional.at(1);
        task.mode = transferModeFromString(parser.value(modeOption), &ok);
        if (!ok) {
            reporter.reportValidationError("Invalid mode", parser.value(modeOption));
            return ExitUsage;
        }
        tasks.append(task);
    } else if (!positional.isEmpty()) {
        reporter.reportValidationError("Invalid arguments", "expected <source> <destination>");
        return ExitUsage;
    }

    if (tasks.isEmpty()) {
        err() << parser.helpText();
        return ExitUsage;
    }

    TransferScheduler scheduler;
    scheduler.setWorkerOptions(settings.workerOptions());
    scheduler.setFailurePolicy(settings.failurePolicy);
    scheduler.setErrorReporter(&reporter);

    QObject::connect(&scheduler, &TransferScheduler::taskStarted,
                     [](int taskId, const QString &name) {
                         out() << "[" << taskId + 1 << "] " << name << Qt::endl;
                     });
    QObject::connect(&scheduler, &TransferScheduler::progress,
                     [](int taskId, const QString &fileName, TransferPhase phase, int percent) {
                         out() << "[" << taskId + 1 << "] " << qSetFieldWidth(3) << percent
                               << qSetFieldWidth(0) << "% " << transferPhaseToString(phase)
                               << " " << fileName << Qt::endl;
                     });
    QObject::connect(&scheduler, &TransferScheduler::throughputSample,
                     [](double mbps) { LOG_VERBOSE() << "throughput" << mbps << "MB/s"; });
    QObject::connect(&scheduler, &TransferScheduler::statusMessage,
                     [](const QString &message) { out() << message << Qt::endl; });
    QObject::connect(&scheduler, &TransferScheduler::taskSummaryReady,
                     [](const TaskSummary &summary) {
                         out() << "[" << summary.taskId + 1 << "] "
                               << summary.filesCompleted << "/" << summary.filesTotal << " file(s), "
                               << summary.bytesCopied << " bytes in " << summary.elapsedMs << " ms ("
                               << formatByteRate(static_cast<qint64>(summary.averageBytesPerSecond))
                               << ")" << Qt::endl;
                     });
    QObject::connect(&scheduler, &TransferScheduler::taskFinished,
                     [](int taskId, bool success, const QString &message) {
                         out() << "[" << taskId + 1 << "] " << (success ? "DONE: " : "FAILED: ")
                               << message << Qt::endl;
                     });

    int exitCode = ExitSuccess;
    QObject::connect(&scheduler, &TransferScheduler::sessionFinished,
                     &app, [&exitCode](const SessionSummary &summary) {
                         if (summary.stopped) {
                             exitCode = ExitCancelled;
                         } else if (!summary.allSucceeded()) {
                             exitCode = ExitTaskFailed;
                         }
                         QCoreApplication::exit(exitCode);
                     });

    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    QTimer stopPoll;
    QObject::connect(&stopPoll, &QTimer::timeout, [&scheduler]() {
        if (stopSignalled) {
            stopSignalled = 0;
            scheduler.requestStop();
        }
    });
    stopPoll.start(100);

    out() << "Ceiling: " << formatByteRate(settings.limitBps)
          << ", digest: " << digestAlgorithmToString(settings.algorithm)
          << ", on failure: " << failurePolicyToString(settings.failurePolicy) << Qt::endl;

    if (!scheduler.start(tasks, settings.limitBps)) {
        return ExitUsage;
    }

    const int result = app.exec();
    scheduler.waitForFinished();
    return result;
}
