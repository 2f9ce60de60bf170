#pragma once

#include "core/shared/chunk.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <vector>

namespace dq {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int maxSize = 1000;   // characters
    int overlap = 200;    // characters, converted to overlap/5 words
};

// Chunker: splits extracted text into overlapping passages for retrieval.
//
// Prose text is split into sentence-like units at '.', '!', '?' and newline,
// then greedily packed into chunks of at most maxSize characters. When a
// chunk is emitted, the next one starts with the last overlap/5 words of it.
// A single unit longer than maxSize is kept whole, so chunks may exceed
// maxSize.
//
// Spreadsheet text (sections introduced by "=== SHEET: name ===") is packed
// row by row instead, repeating the sheet header and COLUMNS line at the top
// of every chunk.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    // Pure text split. Never returns an empty or whitespace-only chunk.
    QStringList chunkText(const QString& text) const;

    // Split and tag with chunk_index 0..N-1, content hash and metadata.
    std::vector<Chunk> chunkDocument(int64_t documentId, const QString& text) const;

    // Sentence-like units, trimmed, empties dropped. Trailing text without
    // terminating punctuation forms the last unit.
    static QStringList splitSentences(const QString& text);

    static bool isSpreadsheetText(const QString& text);

    const Config& config() const { return m_config; }

private:
    struct Piece {
        QString text;
        QJsonObject metadata;
    };

    std::vector<Piece> split(const QString& text) const;
    void chunkProse(const QString& text, std::vector<Piece>& out) const;
    void chunkSheets(const QString& text, std::vector<Piece>& out) const;
    void chunkSheetSection(const QString& section, std::vector<Piece>& out) const;

    Config m_config;
};

} // namespace dq
