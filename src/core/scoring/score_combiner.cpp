#include "core/scoring/score_combiner.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>

namespace im {

ScoreCombiner::ScoreCombiner(const CombinationConfig& config)
    : m_config(config)
{
}

CombinationWeights ScoreCombiner::effectiveWeights(double textQuality) const
{
    const double quality = std::clamp(textQuality, 0.0, 1.0);

    CombinationWeights weights;
    weights.questionnaire = m_config.baseWeights.questionnaire;
    weights.text = m_config.baseWeights.text * quality;

    const double total = weights.questionnaire + weights.text;
    if (total > 0.0) {
        weights.questionnaire /= total;
        weights.text /= total;
    }
    return weights;
}

ScoreMap ScoreCombiner::combine(const ScoreMap& questionnaireScores,
                                const ScoreMap& textScores,
                                double textQuality) const
{
    if (textScores.empty()) {
        return questionnaireScores;
    }

    const CombinationWeights weights = effectiveWeights(textQuality);

    QSet<QString> areas;
    for (const auto& entry : questionnaireScores) {
        areas.insert(entry.first);
    }
    for (const auto& entry : textScores) {
        areas.insert(entry.first);
    }

    ScoreMap combined;
    for (const QString& area : areas) {
        const auto qIt = questionnaireScores.find(area);
        const auto tIt = textScores.find(area);
        const double qScore = (qIt != questionnaireScores.end()) ? qIt->second : 0.0;
        const double tScore = (tIt != textScores.end()) ? tIt->second : 0.0;

        double score = qScore * weights.questionnaire + tScore * weights.text;
        if (qScore > m_config.agreementThreshold && tScore > m_config.agreementThreshold) {
            score *= m_config.agreementBonus;
            LOG_DEBUG(imScoring, "agreement bonus applied to '%s' (q=%.3f t=%.3f)",
                      qUtf8Printable(area), qScore, tScore);
        }
        combined[area] = std::min(score, 1.0);
    }

    return normalizeByMax(combined);
}

} // namespace im
