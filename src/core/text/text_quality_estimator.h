#pragma once

#include "core/models/model_artifact.h"
#include "core/shared/scoring_types.h"

#include <QString>

namespace im {

// Trust factor (0-1) for the free-text channel, independent of the
// classifier's own confidence. Mean of four factors: length adequacy,
// lexical diversity, keyword density and presence of sentence punctuation.
class TextQualityEstimator {
public:
    // keywords may be null (no artifact loaded); keyword density is then 0.
    explicit TextQualityEstimator(const KeywordTable* keywords,
                                  const TextQualityConfig& config = {});

    double estimate(const QString& text) const;

    double lengthFactor(int wordCount) const;

private:
    const KeywordTable* m_keywords = nullptr;
    TextQualityConfig m_config;
};

} // namespace im
