#pragma once

#include "core/shared/types.h"

#include <QString>
#include <cstdint>

namespace dq {

// One fused retrieval result, hydrated with its text.
struct RankedPassage {
    int64_t chunkId = 0;
    int64_t documentId = 0;
    int chunkIndex = 0;
    QString filename;
    QString content;
    float semanticScore = 0.0f;
    float keywordScore = 0.0f;
    float score = 0.0f;
    MatchSource source = MatchSource::Hybrid;
};

} // namespace dq
