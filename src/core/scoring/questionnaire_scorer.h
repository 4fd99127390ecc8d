#pragma once

#include "core/shared/mapping_error.h"
#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <optional>
#include <vector>

namespace im {

class QuestionnaireScorer {
public:
    explicit QuestionnaireScorer(const QuestionnaireWeights& weights = {});

    // Scores structured responses against the catalog they reference.
    // Returns nullopt (and fills errorOut) when any response is invalid; a
    // submission is never partially scored. An empty submission scores to an
    // empty map.
    std::optional<ScoreMap> score(const std::vector<QuestionnaireResponse>& responses,
                                  const std::vector<Question>& catalog,
                                  MappingError* errorOut = nullptr) const;

    // Checks every response without scoring. Used by score() before any
    // contribution is accumulated.
    bool validate(const std::vector<QuestionnaireResponse>& responses,
                  const std::vector<Question>& catalog,
                  MappingError* errorOut = nullptr) const;

    double questionWeight(int questionId) const;

    // Multiplier for an area supported by `distinctQuestions` questions.
    // Uses the largest configured key not above the count.
    double consistencyBonus(int distinctQuestions) const;

    const QuestionnaireWeights& weights() const { return m_weights; }

private:
    QuestionnaireWeights m_weights;
};

} // namespace im
