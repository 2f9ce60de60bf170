#include "core/generation/extractive_answer_generator.h"
#include "core/index/sqlite_store.h"
#include "core/indexing/chunker.h"

#include <QSet>

#include <algorithm>

namespace dq {

namespace {

struct Candidate {
    QString sentence;
    int overlap = 0;
    float passageScore = 0.0f;
    int order = 0;
};

} // namespace

ExtractiveAnswerGenerator::ExtractiveAnswerGenerator(ExtractiveConfig config)
    : m_config(config)
{
}

GenerationResult ExtractiveAnswerGenerator::answer(const QString& question,
                                                   const std::vector<RankedPassage>& passages,
                                                   const Deadline& deadline)
{
    GenerationResult result;
    if (deadline.expired()) {
        result.status = GenerationResult::Status::Cancelled;
        result.errorMessage = QStringLiteral("deadline expired before generation");
        return result;
    }

    const QStringList questionTerms = SQLiteStore::searchTerms(question);
    const QSet<QString> terms(questionTerms.begin(), questionTerms.end());

    std::vector<Candidate> candidates;
    const size_t passageCount = std::min(passages.size(),
                                         static_cast<size_t>(std::max(m_config.maxPassages, 0)));
    int order = 0;
    for (size_t i = 0; i < passageCount; ++i) {
        for (const QString& sentence : Chunker::splitSentences(passages[i].content)) {
            int overlap = 0;
            for (const QString& term : SQLiteStore::searchTerms(sentence)) {
                if (terms.contains(term)) {
                    ++overlap;
                }
            }
            if (overlap > 0) {
                candidates.push_back({sentence, overlap, passages[i].score, order});
            }
            ++order;
        }
    }

    result.status = GenerationResult::Status::Success;
    if (candidates.empty()) {
        result.answer = insufficientInformationAnswer();
        return result;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         if (a.overlap != b.overlap) {
                             return a.overlap > b.overlap;
                         }
                         return a.passageScore > b.passageScore;
                     });

    const size_t keep = std::min(candidates.size(),
                                 static_cast<size_t>(std::max(m_config.maxSentences, 1)));
    candidates.resize(keep);
    // Read back in document order
    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return a.order < b.order; });

    QStringList sentences;
    QSet<QString> seen;
    for (const Candidate& candidate : candidates) {
        if (!seen.contains(candidate.sentence)) {
            seen.insert(candidate.sentence);
            sentences.append(candidate.sentence);
        }
    }
    result.answer = sentences.join(QLatin1Char(' '));
    return result;
}

} // namespace dq
