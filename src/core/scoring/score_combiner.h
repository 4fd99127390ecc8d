#pragma once

#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

namespace im {

class ScoreCombiner {
public:
    explicit ScoreCombiner(const CombinationConfig& config = {});

    // Fuses questionnaire and text scores, trusting the text channel in
    // proportion to textQuality (0-1). An empty text map leaves the
    // questionnaire scores untouched.
    ScoreMap combine(const ScoreMap& questionnaireScores,
                     const ScoreMap& textScores,
                     double textQuality) const;

    // Base weights with the text weight scaled by quality, renormalized to sum 1.
    CombinationWeights effectiveWeights(double textQuality) const;

    const CombinationConfig& config() const { return m_config; }

private:
    CombinationConfig m_config;
};

} // namespace im
