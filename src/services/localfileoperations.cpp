#include "localfileoperations.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

std::unique_ptr<QIODevice> LocalFileOperations::openForRead(const QString &path, QString *errorString)
{
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::ReadOnly)) {
        if (errorString) {
            *errorString = file->errorString();
        }
        return nullptr;
    }
    return file;
}

std::unique_ptr<QIODevice> LocalFileOperations::openForWrite(const QString &path, QString *errorString)
{
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Unbuffered)) {
        if (errorString) {
            *errorString = file->errorString();
        }
        return nullptr;
    }
    return file;
}

bool LocalFileOperations::removeFile(const QString &path, QString *errorString)
{
    QFile file(path);
    if (file.remove()) {
        return true;
    }
    if (errorString) {
        *errorString = file.errorString();
    }
    return !QFileInfo::exists(path);
}

bool LocalFileOperations::makePath(const QString &path)
{
    return QDir().mkpath(path);
}

bool LocalFileOperations::removeEmptyDirectory(const QString &path)
{
    // QDir::rmdir fails on non-empty directories, which is what we want
    return QDir().rmdir(path);
}

bool LocalFileOperations::copyMetadata(const QString &sourcePath, const QString &destinationPath)
{
    QFileInfo source(sourcePath);
    if (!source.exists()) {
        return false;
    }

    bool ok = true;
    QFile destination(destinationPath);

    // Times can only be set on an open file; ReadWrite does not truncate.
    if (destination.open(QIODevice::ReadWrite)) {
        const QDateTime modified = source.fileTime(QFileDevice::FileModificationTime);
        const QDateTime accessed = source.fileTime(QFileDevice::FileAccessTime);
        if (modified.isValid() && !destination.setFileTime(modified, QFileDevice::FileModificationTime)) {
            ok = false;
        }
        if (accessed.isValid() && !destination.setFileTime(accessed, QFileDevice::FileAccessTime)) {
            ok = false;
        }
        destination.close();
    } else {
        ok = false;
    }

    if (!destination.setPermissions(source.permissions())) {
        ok = false;
    }

    if (!ok) {
        qWarning() << "LocalFileOperations: could not fully preserve metadata on" << destinationPath;
    }
    return ok;
}
