#include "core/query/question_splitter.h"

#include <QRegularExpression>

namespace dq {

QStringList splitQuestion(const QString& question)
{
    static const QRegularExpression separators(
        QStringLiteral("\\s(?:and|also)\\s|;\\s|,"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression edgeQuestionMarks(
        QStringLiteral("^\\s*\\?+\\s*|\\s*\\?+\\s*$"));

    QStringList parts;
    for (const QString& raw : question.split(separators)) {
        const QString trimmed = raw.trimmed();
        if (trimmed.size() <= 3) {
            continue;
        }
        QString part = trimmed;
        part.remove(edgeQuestionMarks);
        part = part.trimmed();
        if (!part.isEmpty() && !parts.contains(part)) {
            parts.append(part);
        }
    }
    return parts;
}

} // namespace dq
