#include "transfersettings.h"

#include <QFileInfo>
#include <QRegularExpression>
#include <QSettings>

namespace {

void setError(QString *errorString, const QString &message)
{
    if (errorString) {
        *errorString = message;
    }
}

bool checkReadable(const QString &path, QSettings &settings, QString *errorString)
{
    if (!QFileInfo(path).isFile()) {
        setError(errorString, QStringLiteral("File not found: %1").arg(path));
        return false;
    }
    if (settings.status() != QSettings::NoError) {
        setError(errorString, QStringLiteral("Cannot parse %1").arg(path));
        return false;
    }
    return true;
}

} // namespace

TransferWorker::Options TransferSettings::workerOptions() const
{
    TransferWorker::Options options;
    options.chunkSize = chunkSize;
    options.algorithm = algorithm;
    options.preserveMetadata = preserveMetadata;
    options.pruneEmptySourceDirectories = pruneEmptySourceDirectories;
    return options;
}

bool TransferSettings::loadFromFile(const QString &path, QString *errorString)
{
    QSettings settings(path, QSettings::IniFormat);
    if (!checkReadable(path, settings, errorString)) {
        return false;
    }

    if (settings.contains("transfer/limitBps")) {
        bool ok = false;
        const QString text = settings.value("transfer/limitBps").toString();
        qint64 value = parseByteRate(text, &ok);
        if (!ok) {
            setError(errorString, QStringLiteral("Invalid transfer/limitBps: %1").arg(text));
            return false;
        }
        limitBps = value;
    }

    if (settings.contains("transfer/chunkSize")) {
        bool ok = false;
        const QString text = settings.value("transfer/chunkSize").toString();
        qint64 value = parseByteRate(text, &ok);
        if (!ok || value <= 0 || value > RateLimiter::MaxChunkSize) {
            setError(errorString, QStringLiteral("Invalid transfer/chunkSize: %1 (1 byte to %2)")
                                      .arg(text, formatByteSize(RateLimiter::MaxChunkSize)));
            return false;
        }
        chunkSize = value;
    }

    if (settings.contains("transfer/algorithm")) {
        bool ok = false;
        const QString text = settings.value("transfer/algorithm").toString();
        DigestAlgorithm value = digestAlgorithmFromString(text, &ok);
        if (!ok) {
            setError(errorString, QStringLiteral("Invalid transfer/algorithm: %1").arg(text));
            return false;
        }
        algorithm = value;
    }

    if (settings.contains("transfer/failurePolicy")) {
        const QString text = settings.value("transfer/failurePolicy").toString().trimmed().toLower();
        if (text == QLatin1String("halt")) {
            failurePolicy = FailurePolicy::HaltQueue;
        } else if (text == QLatin1String("continue")) {
            failurePolicy = FailurePolicy::ContinueQueue;
        } else {
            setError(errorString, QStringLiteral("Invalid transfer/failurePolicy: %1").arg(text));
            return false;
        }
    }

    pruneEmptySourceDirectories = settings.value("transfer/pruneEmptySourceDirectories",
                                                 pruneEmptySourceDirectories).toBool();
    preserveMetadata = settings.value("transfer/preserveMetadata", preserveMetadata).toBool();
    verbose = settings.value("logging/verbose", verbose).toBool();
    return true;
}

bool TaskListFile::load(const QString &path, QList<TransferTask> &tasks, QString *errorString)
{
    QSettings settings(path, QSettings::IniFormat);
    if (!checkReadable(path, settings, errorString)) {
        return false;
    }

    QList<TransferTask> loaded;
    const int size = settings.beginReadArray("tasks");
    for (int i = 0; i < size; ++i) {
        settings.setArrayIndex(i);

        TransferTask task;
        task.name = settings.value("name").toString();
        task.sourcePath = settings.value("source").toString();
        task.destinationPath = settings.value("destination").toString();

        bool ok = false;
        const QString modeText = settings.value("mode", "copy").toString();
        task.mode = transferModeFromString(modeText, &ok);

        if (task.sourcePath.isEmpty() || task.destinationPath.isEmpty()) {
            settings.endArray();
            setError(errorString, QStringLiteral("Task %1 needs both source and destination").arg(i + 1));
            return false;
        }
        if (!ok) {
            settings.endArray();
            setError(errorString, QStringLiteral("Task %1 has unknown mode: %2").arg(i + 1).arg(modeText));
            return false;
        }
        loaded.append(task);
    }
    settings.endArray();

    tasks.append(loaded);
    return true;
}

bool TaskListFile::save(const QString &path, const QList<TransferTask> &tasks, QString *errorString)
{
    QSettings settings(path, QSettings::IniFormat);
    settings.remove("tasks");
    settings.beginWriteArray("tasks", tasks.size());
    for (int i = 0; i < tasks.size(); ++i) {
        settings.setArrayIndex(i);
        const TransferTask &task = tasks.at(i);
        if (!task.name.isEmpty()) {
            settings.setValue("name", task.name);
        }
        settings.setValue("source", task.sourcePath);
        settings.setValue("destination", task.destinationPath);
        settings.setValue("mode", QString::fromLatin1(transferModeToString(task.mode)));
    }
    settings.endArray();
    settings.sync();

    if (settings.status() != QSettings::NoError) {
        setError(errorString, QStringLiteral("Cannot write %1").arg(path));
        return false;
    }
    return true;
}

qint64 parseByteRate(const QString &text, bool *ok)
{
    static const QRegularExpression pattern(
        QStringLiteral("^\\s*(\\d+(?:\\.\\d+)?)\\s*([kmg]?)(?:i?b)?(?:/s)?\\s*$"),
        QRegularExpression::CaseInsensitiveOption);

    if (ok) {
        *ok = false;
    }

    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return 0;
    }

    double value = match.captured(1).toDouble();
    const QString suffix = match.captured(2).toLower();
    if (suffix == QLatin1String("k")) {
        value *= 1024.0;
    } else if (suffix == QLatin1String("m")) {
        value *= 1024.0 * 1024.0;
    } else if (suffix == QLatin1String("g")) {
        value *= 1024.0 * 1024.0 * 1024.0;
    }

    if (value > 9.0e18) {
        return 0;
    }

    if (ok) {
        *ok = true;
    }
    return static_cast<qint64>(value);
}

QString formatByteRate(qint64 bytesPerSecond)
{
    if (bytesPerSecond <= 0) {
        return QStringLiteral("unlimited");
    }
    return formatByteSize(bytesPerSecond) + QStringLiteral("/s");
}

QString formatByteSize(qint64 bytes)
{
    if (bytes >= 1024 * 1024) {
        return QStringLiteral("%1 MB").arg(static_cast<double>(bytes) / (1024.0 * 1024.0), 0, 'f', 2);
    }
    if (bytes >= 1024) {
        return QStringLiteral("%1 KB").arg(static_cast<double>(bytes) / 1024.0, 0, 'f', 2);
    }
    return QStringLiteral("%1 B").arg(bytes);
}
