#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace dq {

// Result of a content extraction attempt.
// Every extraction produces a status; content is present only on Success.
struct ExtractionResult {
    enum class Status {
        Success,
        UnsupportedMediaType,
        ExtractionFailed,
    };

    Status status = Status::ExtractionFailed;
    std::optional<QString> content;
    std::optional<QString> errorMessage;
    int durationMs = 0;
};

// ContentExtractor: turns raw uploaded bytes into plain text.
//
// Format-specific readers (PDF, word processor, spreadsheet) live outside
// this engine and plug in behind this interface.
class ContentExtractor {
public:
    virtual ~ContentExtractor() = default;

    virtual ExtractionResult extract(const QByteArray& rawBytes, const QString& mediaType) = 0;

    // Media type as sent by the uploader, e.g. "text/plain".
    virtual bool supports(const QString& mediaType) const = 0;
};

} // namespace dq
