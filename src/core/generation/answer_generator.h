#pragma once

#include "core/shared/deadline.h"
#include "core/shared/passage.h"

#include <QString>
#include <vector>

namespace dq {

// The literal answer a generator returns when the passages do not support
// an answer. Never cached.
inline const QString& insufficientInformationAnswer()
{
    static const QString answer =
        QStringLiteral("I don't have enough information to answer that question.");
    return answer;
}

inline bool containsInsufficientInformation(const QString& answer)
{
    return answer.contains(insufficientInformationAnswer(), Qt::CaseInsensitive);
}

struct GenerationResult {
    enum class Status {
        Success,
        Unavailable,
        Cancelled,
    };

    Status status = Status::Unavailable;
    QString answer;
    QString errorMessage;
};

// AnswerGenerator: produces a grounded answer from ranked passages.
class AnswerGenerator {
public:
    virtual ~AnswerGenerator() = default;

    virtual GenerationResult answer(const QString& question,
                                    const std::vector<RankedPassage>& passages,
                                    const Deadline& deadline) = 0;
};

} // namespace dq
