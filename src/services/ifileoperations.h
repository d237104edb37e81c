/**
 * @file ifileoperations.h
 * @brief Interface for the filesystem primitives used by the transfer worker.
 *
 * This interface allows dependency injection of file operations, so tests can
 * substitute an implementation that corrupts writes or fails deletions.
 */

#ifndef IFILEOPERATIONS_H
#define IFILEOPERATIONS_H

#include <QIODevice>
#include <QString>

#include <memory>

/**
 * @brief Abstract filesystem primitives.
 *
 * Devices returned by openForRead() and openForWrite() are already open.
 * Writes on a device from openForWrite() must not be buffered, so that a
 * successful write() means the bytes reached the file.
 *
 * @par Example usage:
 * @code
 * // Production code
 * LocalFileOperations fileOps;
 *
 * // Test code
 * MockFileOperations fileOps;
 * fileOps.mockCorruptWritesTo("b.bin");
 *
 * TransferWorker worker(&fileOps, &observer);
 * @endcode
 */
class IFileOperations
{
public:
    virtual ~IFileOperations() = default;

    /**
     * @brief Opens a file for reading.
     * @param path File to open.
     * @param errorString Receives a description on failure (may be null).
     * @return The open device, or nullptr on failure.
     */
    [[nodiscard]] virtual std::unique_ptr<QIODevice> openForRead(const QString &path,
                                                                 QString *errorString) = 0;

    /**
     * @brief Creates or truncates a file for unbuffered writing.
     * @param path File to open.
     * @param errorString Receives a description on failure (may be null).
     * @return The open device, or nullptr on failure.
     */
    [[nodiscard]] virtual std::unique_ptr<QIODevice> openForWrite(const QString &path,
                                                                  QString *errorString) = 0;

    /**
     * @brief Deletes a file.
     * @return True if the file no longer exists.
     */
    virtual bool removeFile(const QString &path, QString *errorString) = 0;

    /**
     * @brief Creates a directory and any missing parents.
     * @return True if the directory exists afterwards.
     */
    virtual bool makePath(const QString &path) = 0;

    /**
     * @brief Removes a directory if it is empty.
     * @return True if the directory was removed.
     */
    virtual bool removeEmptyDirectory(const QString &path) = 0;

    /**
     * @brief Copies modification/access times and permissions.
     * @return True if everything the platform supports was applied.
     */
    virtual bool copyMetadata(const QString &sourcePath, const QString &destinationPath) = 0;
};

#endif // IFILEOPERATIONS_H
