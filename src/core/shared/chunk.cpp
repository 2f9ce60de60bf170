#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace dq {

QString computeChunkHash(int64_t documentId, int chunkIndex, const QString& content)
{
    const QString seed = QString::number(documentId) + QStringLiteral("#")
        + QString::number(chunkIndex) + QStringLiteral("#") + content;
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace dq
