#include "core/extraction/plain_text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QStringConverter>

namespace dq {

namespace {

// "text/plain; charset=utf-8" -> "text/plain"
QString baseMediaType(const QString& mediaType)
{
    return mediaType.section(QLatin1Char(';'), 0, 0).trimmed().toLower();
}

} // anonymous namespace

const QSet<QString>& PlainTextExtractor::supportedMediaTypes()
{
    static const QSet<QString> types = {
        QStringLiteral("text/plain"),
        QStringLiteral("text/csv"),
        QStringLiteral("text/markdown"),
        QStringLiteral("text/x-markdown"),
    };
    return types;
}

bool PlainTextExtractor::supports(const QString& mediaType) const
{
    return supportedMediaTypes().contains(baseMediaType(mediaType));
}

ExtractionResult PlainTextExtractor::extract(const QByteArray& rawBytes, const QString& mediaType)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;

    if (!supports(mediaType)) {
        result.status = ExtractionResult::Status::UnsupportedMediaType;
        result.errorMessage = QStringLiteral("Unsupported media type: %1").arg(mediaType);
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    QString decoded;
    {
        auto toUtf8 = QStringDecoder(QStringDecoder::Utf8,
                                     QStringDecoder::Flag::Stateless);
        decoded = toUtf8(rawBytes);

        if (toUtf8.hasError()) {
            // UTF-8 failed: fall back to Latin-1 (always succeeds, byte-for-byte)
            decoded = QString::fromLatin1(rawBytes);
            LOG_DEBUG(dqIngest, "UTF-8 decode failed for %s upload, using Latin-1 fallback",
                      qUtf8Printable(mediaType));
        }
    }
    if (decoded.startsWith(QChar(0xFEFF))) {
        decoded.remove(0, 1);
    }

    if (decoded.trimmed().isEmpty()) {
        result.status = ExtractionResult::Status::ExtractionFailed;
        result.errorMessage = QStringLiteral("No text content could be extracted");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    result.status = ExtractionResult::Status::Success;
    result.content = std::move(decoded);
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(dqIngest, "Extracted %lld chars (%s) in %d ms",
              static_cast<long long>(result.content->size()),
              qUtf8Printable(mediaType),
              result.durationMs);

    return result;
}

} // namespace dq
