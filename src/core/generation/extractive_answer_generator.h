#pragma once

#include "core/generation/answer_generator.h"

namespace dq {

struct ExtractiveConfig {
    int maxPassages = 5;
    int maxSentences = 3;
};

// Offline generator: answers with the sentences of the top passages that
// share the most search terms with the question, or the
// insufficient-information sentinel when none share any.
class ExtractiveAnswerGenerator : public AnswerGenerator {
public:
    explicit ExtractiveAnswerGenerator(ExtractiveConfig config = {});

    GenerationResult answer(const QString& question,
                            const std::vector<RankedPassage>& passages,
                            const Deadline& deadline) override;

private:
    ExtractiveConfig m_config;
};

} // namespace dq
