#pragma once

#include <QByteArray>

#include <vector>

namespace dq {

// Scales to unit L2 norm. A zero vector is returned unchanged.
std::vector<float> normalizeVector(std::vector<float> vector);

// Cosine similarity in [-1, 1]. Mismatched sizes or a zero vector yield 0.
float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

// Little-endian float32 blob encoding used for the embeddings and
// query_cache tables.
QByteArray encodeVectorBlob(const std::vector<float>& vector);
std::vector<float> decodeVectorBlob(const void* data, int bytes);

} // namespace dq
