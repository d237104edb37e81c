/**
 * @file mockfileoperations.h
 * @brief Fault-injecting file operations for transfer tests.
 *
 * This mock implements IFileOperations on top of the real filesystem and can
 * corrupt or fail writes and deletions for chosen files.
 */

#ifndef MOCKFILEOPERATIONS_H
#define MOCKFILEOPERATIONS_H

#include <QSet>
#include <QStringList>

#include <functional>

#include "services/localfileoperations.h"

/**
 * @brief Mock file operations implementing IFileOperations for testing.
 *
 * Files are matched by file name (not path), so "b.bin" matches both the
 * source and destination copies; writes only ever target destinations.
 *
 * @par Features:
 * - Corrupt every chunk written to a file
 * - Fail writes to a file
 * - Fail deletion of a file
 * - Hook called after each chunk written (to request a stop mid-file)
 * - Request tracking for test assertions
 *
 * @par Example usage:
 * @code
 * MockFileOperations fileOps;
 * fileOps.mockCorruptWritesTo("b.bin");
 *
 * TransferWorker worker(&fileOps, nullptr);
 * TaskOutcome outcome = worker.run(task, 0, token);
 *
 * QCOMPARE(outcome.error, TransferError::IntegrityMismatch);
 * QVERIFY(fileOps.mockGetRemoveRequests().isEmpty());
 * @endcode
 */
class MockFileOperations : public IFileOperations
{
public:
    using ChunkHook = std::function<void(const QString &fileName, int chunkIndex)>;

    MockFileOperations() = default;
    ~MockFileOperations() override = default;

    /// @name IFileOperations Implementation
    /// @{

    [[nodiscard]] std::unique_ptr<QIODevice> openForRead(const QString &path,
                                                         QString *errorString) override;
    [[nodiscard]] std::unique_ptr<QIODevice> openForWrite(const QString &path,
                                                          QString *errorString) override;
    bool removeFile(const QString &path, QString *errorString) override;
    bool makePath(const QString &path) override;
    bool removeEmptyDirectory(const QString &path) override;
    bool copyMetadata(const QString &sourcePath, const QString &destinationPath) override;
    /// @}

    /// @name Mock Control Methods
    /// @{

    /// Flips the first byte of every chunk written to this file.
    void mockCorruptWritesTo(const QString &fileName) { corruptWrites_.insert(fileName); }

    /// Makes every write to this file fail.
    void mockFailWritesTo(const QString &fileName) { failWrites_.insert(fileName); }

    /// Makes deleting this file fail (it stays on disk).
    void mockFailRemoveOf(const QString &fileName) { failRemoves_.insert(fileName); }

    /// Makes creating this directory fail.
    void mockFailMakePath(const QString &path) { failMakePaths_.insert(path); }

    /// Called after each chunk successfully written.
    void mockSetChunkHook(ChunkHook hook) { chunkHook_ = std::move(hook); }
    /// @}

    /// @name Request Tracking
    /// @{

    [[nodiscard]] QStringList mockGetRemoveRequests() const { return removeRequests_; }
    [[nodiscard]] QStringList mockGetWriteOpens() const { return writeOpens_; }
    void mockClearRequests();
    /// @}

private:
    LocalFileOperations local_;

    QSet<QString> corruptWrites_;
    QSet<QString> failWrites_;
    QSet<QString> failRemoves_;
    QSet<QString> failMakePaths_;
    ChunkHook chunkHook_;

    QStringList removeRequests_;
    QStringList writeOpens_;
};

#endif // MOCKFILEOPERATIONS_H
