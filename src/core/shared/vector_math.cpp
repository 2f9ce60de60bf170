#include "core/shared/vector_math.h"

#include <QtEndian>

#include <cmath>
#include <cstdint>
#include <cstring>

namespace dq {

std::vector<float> normalizeVector(std::vector<float> vector)
{
    double sumSquares = 0.0;
    for (const float value : vector) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return vector;
    }

    for (float& value : vector) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return vector;
}

float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        normA += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        normB += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(normA) * std::sqrt(normB)));
}

QByteArray encodeVectorBlob(const std::vector<float>& vector)
{
    QByteArray buffer(static_cast<int>(vector.size() * sizeof(float)), Qt::Uninitialized);
    char* out = buffer.data();
    for (const float value : vector) {
        uint32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        qToLittleEndian(bits, out);
        out += sizeof(bits);
    }
    return buffer;
}

std::vector<float> decodeVectorBlob(const void* data, int bytes)
{
    std::vector<float> vector;
    if (data == nullptr || bytes <= 0 || bytes % static_cast<int>(sizeof(float)) != 0) {
        return vector;
    }

    const auto* in = static_cast<const uchar*>(data);
    const size_t count = static_cast<size_t>(bytes) / sizeof(float);
    vector.resize(count);
    for (size_t i = 0; i < count; ++i) {
        const uint32_t bits = qFromLittleEndian<uint32_t>(in + i * sizeof(uint32_t));
        std::memcpy(&vector[i], &bits, sizeof(float));
    }
    return vector;
}

} // namespace dq
