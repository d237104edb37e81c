#include "filedigest.h"

#include <QCryptographicHash>
#include <QFile>

#include "utils/logging.h"

const QString FileDigest::FailureSentinel = QStringLiteral("ERROR_HASH");

namespace {

QCryptographicHash::Algorithm toQtAlgorithm(DigestAlgorithm algorithm)
{
    switch (algorithm) {
    case DigestAlgorithm::Md5:
        return QCryptographicHash::Md5;
    case DigestAlgorithm::Sha1:
        return QCryptographicHash::Sha1;
    case DigestAlgorithm::Sha256:
        return QCryptographicHash::Sha256;
    }
    return QCryptographicHash::Sha256;
}

DigestResult failed()
{
    return DigestResult{FileDigest::FailureSentinel, false};
}

} // namespace

QString digestAlgorithmToString(DigestAlgorithm algorithm)
{
    switch (algorithm) {
    case DigestAlgorithm::Md5:
        return QStringLiteral("md5");
    case DigestAlgorithm::Sha1:
        return QStringLiteral("sha1");
    case DigestAlgorithm::Sha256:
        return QStringLiteral("sha256");
    }
    return QStringLiteral("unknown");
}

DigestAlgorithm digestAlgorithmFromString(const QString &text, bool *ok)
{
    const QString name = text.trimmed().toLower();
    bool recognized = true;
    DigestAlgorithm algorithm = DigestAlgorithm::Sha256;

    if (name == QLatin1String("md5")) {
        algorithm = DigestAlgorithm::Md5;
    } else if (name == QLatin1String("sha1")) {
        algorithm = DigestAlgorithm::Sha1;
    } else if (name != QLatin1String("sha256")) {
        recognized = false;
    }

    if (ok) {
        *ok = recognized;
    }
    return algorithm;
}

FileDigest::FileDigest(DigestAlgorithm algorithm)
    : algorithm_(algorithm)
{
}

DigestResult FileDigest::compute(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FileDigest: cannot open" << path << "-" << file.errorString();
        return failed();
    }

    QCryptographicHash hash(toQtAlgorithm(algorithm_));
    QByteArray block;
    block.resize(static_cast<int>(BlockSize));

    for (;;) {
        qint64 n = file.read(block.data(), BlockSize);
        if (n < 0) {
            qWarning() << "FileDigest: read error on" << path << "-" << file.errorString();
            return failed();
        }
        if (n == 0) {
            break;
        }
        hash.addData(block.left(static_cast<int>(n)));
    }

    // A file that shrank or errored mid-read is not "read to completion"
    if (!file.atEnd()) {
        qWarning() << "FileDigest: incomplete read of" << path;
        return failed();
    }

    QString hex = QString::fromLatin1(hash.result().toHex());
    LOG_VERBOSE() << "FileDigest:" << digestAlgorithmToString(algorithm_) << path << hex;
    return DigestResult{hex, true};
}
