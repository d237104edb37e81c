/**
 * @file filedigest.h
 * @brief Streaming content digest of a file, used to verify copies.
 */

#ifndef FILEDIGEST_H
#define FILEDIGEST_H

#include <QString>

/**
 * @brief Hash algorithms available for copy verification.
 */
enum class DigestAlgorithm {
    Md5,
    Sha1,
    Sha256
};

[[nodiscard]] QString digestAlgorithmToString(DigestAlgorithm algorithm);

/**
 * @brief Parses "md5", "sha1" or "sha256" (case-insensitive).
 * @param text The algorithm name.
 * @param ok Set to false when the name is not recognized.
 * @return The parsed algorithm, or Sha256 when not recognized.
 */
[[nodiscard]] DigestAlgorithm digestAlgorithmFromString(const QString &text, bool *ok = nullptr);

/**
 * @brief Result of hashing one file.
 *
 * A failed digest carries the sentinel hex string and never matches anything,
 * including another failed digest.
 */
struct DigestResult {
    QString hex;
    bool ok = false;

    [[nodiscard]] bool matches(const DigestResult &other) const
    {
        return ok && other.ok && hex == other.hex;
    }
};

/**
 * @brief Computes file digests by folding fixed-size blocks into a hash.
 *
 * @par Example usage:
 * @code
 * FileDigest digest(DigestAlgorithm::Sha256);
 * DigestResult src = digest.compute("/data/a.bin");
 * DigestResult dst = digest.compute("/backup/a.bin");
 * if (!src.matches(dst)) {
 *     // treat as integrity failure
 * }
 * @endcode
 */
class FileDigest
{
public:
    /// Block size used when reading files (64 KiB).
    static constexpr qint64 BlockSize = 64 * 1024;

    /// Hex string returned when a file cannot be opened or fully read.
    static const QString FailureSentinel;

    explicit FileDigest(DigestAlgorithm algorithm = DigestAlgorithm::Sha256);

    [[nodiscard]] DigestAlgorithm algorithm() const { return algorithm_; }

    /**
     * @brief Hashes a file.
     * @param path Path of the file to read.
     * @return Lowercase hex digest with ok=true, or the failure sentinel with
     *         ok=false if the file could not be opened or read to the end.
     */
    [[nodiscard]] DigestResult compute(const QString &path) const;

private:
    DigestAlgorithm algorithm_;
};

#endif // FILEDIGEST_H
