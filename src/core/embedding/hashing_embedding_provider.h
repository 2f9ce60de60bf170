#pragma once

#include "core/embedding/embedding_provider.h"

namespace dq {

// Deterministic feature-hashed bag of words and word bigrams. No model
// files or network; used by the command line tool when no external
// embedding service is configured, and by tests.
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(int dimensions = 384);

    EmbeddingResult embed(const QString& text, const Deadline& deadline) override;
    int dimensions() const override { return m_dimensions; }
    QString modelId() const override;

private:
    int m_dimensions;
};

} // namespace dq
