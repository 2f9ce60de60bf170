#include "core/embedding/hashing_embedding_provider.h"
#include "core/shared/vector_math.h"

#include <QCryptographicHash>
#include <QRegularExpression>
#include <QStringList>
#include <QtEndian>

#include <algorithm>

namespace dq {

namespace {

// Stable across processes and platforms, unlike qHash.
quint32 featureHash(const QString& feature)
{
    const QByteArray digest = QCryptographicHash::hash(feature.toUtf8(), QCryptographicHash::Md5);
    return qFromLittleEndian<quint32>(digest.constData());
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(int dimensions)
    : m_dimensions(std::max(dimensions, 1))
{
}

QString HashingEmbeddingProvider::modelId() const
{
    return QStringLiteral("hashing-bow-%1").arg(m_dimensions);
}

EmbeddingResult HashingEmbeddingProvider::embed(const QString& text, const Deadline& deadline)
{
    if (deadline.expired()) {
        return EmbeddingResult::failure(EmbeddingResult::Status::Cancelled,
                                        QStringLiteral("deadline expired"));
    }

    static const QRegularExpression tokenRegex(
        QStringLiteral(R"([\p{L}\p{N}]+)"),
        QRegularExpression::UseUnicodePropertiesOption);

    QStringList tokens;
    auto matchIt = tokenRegex.globalMatch(text.toLower());
    while (matchIt.hasNext()) {
        tokens.append(matchIt.next().captured(0));
    }

    std::vector<float> vector(static_cast<size_t>(m_dimensions), 0.0f);
    auto addFeature = [&](const QString& feature, float weight) {
        const quint32 hash = featureHash(feature);
        const size_t bucket = hash % static_cast<quint32>(m_dimensions);
        const float sign = (hash & 0x80000000u) ? -1.0f : 1.0f;
        vector[bucket] += sign * weight;
    };

    for (int i = 0; i < tokens.size(); ++i) {
        addFeature(tokens.at(i), 1.0f);
        if (i + 1 < tokens.size()) {
            addFeature(tokens.at(i) + QLatin1Char(' ') + tokens.at(i + 1), 0.5f);
        }
    }

    if (tokens.isEmpty()) {
        // Empty input still gets a valid unit vector
        vector[0] = 1.0f;
    }
    return EmbeddingResult::success(normalizeVector(std::move(vector)));
}

} // namespace dq
