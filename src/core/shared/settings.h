#pragma once

#include "core/shared/scoring_types.h"

#include <QString>
#include <QStringList>

namespace im {

struct EngineSettings {
    // Questionnaire and fusion rules
    QuestionnaireWeights questionnaire;
    CombinationConfig combination;
    TextQualityConfig textQuality;

    // Processed text shorter than this never reaches the classifier.
    int minTextChars = 10;

    // Embedding providers tried, in order, when the artifact's declared
    // embedder is unavailable.
    QStringList embeddingFallbacks = {
        QStringLiteral("sentence-transformers/paraphrase-multilingual-mpnet-base-v2"),
        QStringLiteral("sentence-transformers/all-MiniLM-L12-v2"),
        QStringLiteral("sentence-transformers/all-MiniLM-L6-v2"),
    };

    // Embedding cache (0 entries disables it)
    int embeddingCacheEntries = 256;
    int embeddingCacheTtlSeconds = 3600;

    // Upper bound for one embed + predict round trip; 0 runs inline with no bound.
    int inferenceTimeoutMs = 5000;
};

} // namespace im
