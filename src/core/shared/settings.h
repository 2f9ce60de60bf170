#pragma once

#include <QString>
#include <cstdint>

namespace dq {

struct Settings {
    // Database
    QString dbPath;

    // Chunking
    int chunkMaxSize = 1000;
    int chunkOverlap = 200;

    // Embedding
    int embeddingDimensions = 384;
    int embeddingWorkers = 4;

    // Hybrid ranking
    double semanticWeight = 0.6;
    double keywordWeight = 0.4;
    int searchLimit = 20;
    double semanticScoreFloor = 0.2;
    double keywordRankScale = 2.0;
    // Per-side candidate caps before fusion; 0 takes every match in scope.
    int semanticCandidates = 0;
    int keywordCandidates = 0;
    int subSearchTimeoutMs = 2000;

    // Answer cache
    double cacheSimilarityThreshold = 0.85;
    int cacheRetentionDays = 90;
    int cacheMinHits = 3;

    // Request limits
    int64_t maxUploadBytes = 10 * 1024 * 1024;   // 10 MB
    int maxQuestionLength = 5000;
};

// Clamp out-of-range values into their valid ranges.
Settings sanitizedSettings(Settings settings);

} // namespace dq
