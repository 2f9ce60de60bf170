#include "core/indexing/chunker.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>

namespace dq {

namespace {

const QLatin1String kSheetMarker("=== SHEET:");
const QLatin1String kColumnsPrefix("COLUMNS:");

bool isTerminator(QChar ch)
{
    return ch == QLatin1Char('.') || ch == QLatin1Char('!')
        || ch == QLatin1Char('?') || ch == QLatin1Char('\n');
}

QString sheetNameFromHeader(const QString& header)
{
    QString name = header.trimmed();
    name.remove(0, kSheetMarker.size());
    if (name.endsWith(QLatin1String("==="))) {
        name.chop(3);
    }
    return name.trimmed();
}

} // namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    m_config.maxSize = std::max(m_config.maxSize, 1);
    m_config.overlap = std::max(m_config.overlap, 0);
}

// ── Public API ──────────────────────────────────────────────

QStringList Chunker::chunkText(const QString& text) const
{
    QStringList result;
    for (Piece& piece : split(text)) {
        result.append(std::move(piece.text));
    }
    return result;
}

std::vector<Chunk> Chunker::chunkDocument(int64_t documentId, const QString& text) const
{
    std::vector<Piece> pieces = split(text);

    std::vector<Chunk> chunks;
    chunks.reserve(pieces.size());
    int chunkIndex = 0;
    for (Piece& piece : pieces) {
        Chunk chunk;
        chunk.documentId = documentId;
        chunk.chunkIndex = chunkIndex;
        chunk.content = std::move(piece.text);
        chunk.metadata = std::move(piece.metadata);
        chunk.contentHash = computeChunkHash(documentId, chunkIndex, chunk.content);
        chunks.push_back(std::move(chunk));
        ++chunkIndex;
    }

    LOG_DEBUG(dqIngest, "Chunked document %lld: %d chunks from %d chars",
              static_cast<long long>(documentId),
              static_cast<int>(chunks.size()),
              static_cast<int>(text.size()));
    return chunks;
}

QStringList Chunker::splitSentences(const QString& text)
{
    QStringList units;
    QString current;
    int i = 0;
    const int len = text.size();

    while (i < len) {
        const QChar ch = text.at(i);
        if (!isTerminator(ch)) {
            current.append(ch);
            ++i;
            continue;
        }

        // Consume the whole run of terminators ("?!", "...", "\n\n")
        while (i < len && isTerminator(text.at(i))) {
            current.append(text.at(i));
            ++i;
        }
        const QString unit = current.trimmed();
        if (!unit.isEmpty()) {
            units.append(unit);
        }
        current.clear();
    }

    const QString tail = current.trimmed();
    if (!tail.isEmpty()) {
        units.append(tail);
    }
    return units;
}

bool Chunker::isSpreadsheetText(const QString& text)
{
    return text.contains(kSheetMarker);
}

// ── Private helpers ─────────────────────────────────────────

std::vector<Chunker::Piece> Chunker::split(const QString& text) const
{
    std::vector<Piece> pieces;
    if (text.trimmed().isEmpty()) {
        return pieces;
    }

    if (isSpreadsheetText(text)) {
        chunkSheets(text, pieces);
    } else {
        chunkProse(text, pieces);
    }
    return pieces;
}

void Chunker::chunkProse(const QString& text, std::vector<Piece>& out) const
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const int overlapWords = m_config.overlap / 5;

    QString current;
    for (const QString& unit : splitSentences(text)) {
        const int combinedLength = current.size() + 1 + unit.size();
        if (combinedLength > m_config.maxSize && !current.isEmpty()) {
            const QString emitted = current.trimmed();
            out.push_back({emitted, {}});

            QStringList words = emitted.split(whitespace, Qt::SkipEmptyParts);
            if (overlapWords > 0 && !words.isEmpty()) {
                const int keep = std::min(overlapWords, static_cast<int>(words.size()));
                current = words.mid(words.size() - keep).join(QLatin1Char(' '))
                    + QLatin1Char(' ') + unit;
            } else {
                current = unit;
            }
            continue;
        }

        if (current.isEmpty()) {
            current = unit;
        } else {
            current += QLatin1Char(' ') + unit;
        }
    }

    const QString tail = current.trimmed();
    if (!tail.isEmpty()) {
        out.push_back({tail, {}});
    }
}

void Chunker::chunkSheets(const QString& text, std::vector<Piece>& out) const
{
    const int firstMarker = text.indexOf(kSheetMarker);
    if (firstMarker > 0) {
        // Free text ahead of the first sheet (e.g. a workbook title) is prose
        chunkProse(text.left(firstMarker), out);
    }

    int start = firstMarker;
    while (start >= 0) {
        const int next = text.indexOf(kSheetMarker, start + kSheetMarker.size());
        const QString section = next < 0 ? text.mid(start) : text.mid(start, next - start);
        chunkSheetSection(section, out);
        start = next;
    }
}

void Chunker::chunkSheetSection(const QString& section, std::vector<Piece>& out) const
{
    const QStringList lines = section.split(QLatin1Char('\n'));
    if (lines.isEmpty()) {
        return;
    }

    const QString header = lines.first().trimmed();
    QString columns;
    QStringList rows;
    for (int i = 1; i < lines.size(); ++i) {
        const QString line = lines.at(i).trimmed();
        if (line.isEmpty()) {
            continue;
        }
        if (columns.isEmpty() && line.startsWith(kColumnsPrefix)) {
            columns = line;
            continue;
        }
        rows.append(line);
    }

    QJsonObject metadata;
    metadata.insert(QStringLiteral("sheet"), sheetNameFromHeader(header));

    QString prefix = header;
    if (!columns.isEmpty()) {
        prefix += QLatin1Char('\n') + columns;
    }

    if (rows.isEmpty()) {
        out.push_back({prefix, metadata});
        return;
    }

    QString current = prefix;
    int rowsInChunk = 0;
    for (const QString& row : rows) {
        const int combinedLength = current.size() + 1 + row.size();
        if (combinedLength > m_config.maxSize && rowsInChunk > 0) {
            out.push_back({current, metadata});
            current = prefix;
            rowsInChunk = 0;
        }
        current += QLatin1Char('\n') + row;
        ++rowsInChunk;
    }
    out.push_back({current, metadata});
}

} // namespace dq
