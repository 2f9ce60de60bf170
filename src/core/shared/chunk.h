#pragma once

#include <QJsonObject>
#include <QString>

#include <cstdint>

namespace dq {

// A contiguous passage of a document, the unit of retrieval.
// id is assigned by the store on insert and is 0 until then.
struct Chunk {
    int64_t id = 0;
    int64_t documentId = 0;
    int chunkIndex = 0;
    QString content;
    QJsonObject metadata;
    QString contentHash;
};

// SHA-256 of "documentId#chunkIndex#content", hex encoded.
QString computeChunkHash(int64_t documentId, int chunkIndex, const QString& content);

} // namespace dq
