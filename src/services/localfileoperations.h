#ifndef LOCALFILEOPERATIONS_H
#define LOCALFILEOPERATIONS_H

#include "services/ifileoperations.h"

/**
 * @brief IFileOperations backed by QFile and QDir on the local filesystem.
 */
class LocalFileOperations : public IFileOperations
{
public:
    LocalFileOperations() = default;
    ~LocalFileOperations() override = default;

    [[nodiscard]] std::unique_ptr<QIODevice> openForRead(const QString &path,
                                                         QString *errorString) override;
    [[nodiscard]] std::unique_ptr<QIODevice> openForWrite(const QString &path,
                                                          QString *errorString) override;
    bool removeFile(const QString &path, QString *errorString) override;
    bool makePath(const QString &path) override;
    bool removeEmptyDirectory(const QString &path) override;
    bool copyMetadata(const QString &sourcePath, const QString &destinationPath) override;
};

#endif // LOCALFILEOPERATIONS_H
