#pragma once

#include "core/extraction/extractor.h"
#include <QSet>

namespace dq {

// PlainTextExtractor: decodes text/plain, text/csv and text/markdown uploads.
//
// Attempts UTF-8 decoding first (BOM stripped), falling back to Latin-1.
// Text that is empty after trimming is reported as ExtractionFailed, since
// there is nothing to chunk.
class PlainTextExtractor : public ContentExtractor {
public:
    ExtractionResult extract(const QByteArray& rawBytes, const QString& mediaType) override;
    bool supports(const QString& mediaType) const override;

private:
    static const QSet<QString>& supportedMediaTypes();
};

} // namespace dq
