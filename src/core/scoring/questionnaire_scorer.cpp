#include "core/scoring/questionnaire_scorer.h"
#include "core/shared/logging.h"

#include <QSet>

#include <map>
#include <unordered_map>

namespace im {

namespace {

void setError(MappingError* errorOut, MappingErrorCode code, int questionId,
              const QString& optionId, const QString& message)
{
    LOG_WARN(imScoring, "Rejected responses (%s): %s",
             qUtf8Printable(mappingErrorCodeToString(code)), qUtf8Printable(message));
    if (!errorOut) {
        return;
    }
    errorOut->code = code;
    errorOut->questionId = questionId;
    errorOut->optionId = optionId;
    errorOut->message = message;
}

} // namespace

QuestionnaireScorer::QuestionnaireScorer(const QuestionnaireWeights& weights)
    : m_weights(weights)
{
}

double QuestionnaireScorer::questionWeight(int questionId) const
{
    const auto it = m_weights.questionWeights.find(questionId);
    if (it == m_weights.questionWeights.end()) {
        return m_weights.defaultQuestionWeight;
    }
    return it->second;
}

double QuestionnaireScorer::consistencyBonus(int distinctQuestions) const
{
    double bonus = 1.0;
    for (const auto& [count, multiplier] : m_weights.consistencyBonus) {
        if (count > distinctQuestions) {
            break;
        }
        bonus = multiplier;
    }
    return bonus;
}

bool QuestionnaireScorer::validate(const std::vector<QuestionnaireResponse>& responses,
                                   const std::vector<Question>& catalog,
                                   MappingError* errorOut) const
{
    std::unordered_map<int, const Question*> questionsById;
    for (const Question& question : catalog) {
        questionsById.emplace(question.id, &question);
    }

    QSet<int> answered;
    for (const QuestionnaireResponse& response : responses) {
        const auto questionIt = questionsById.find(response.questionId);
        if (questionIt == questionsById.end()) {
            setError(errorOut, MappingErrorCode::UnknownQuestion, response.questionId, QString(),
                     QStringLiteral("Response references unknown question %1")
                         .arg(response.questionId));
            return false;
        }

        if (answered.contains(response.questionId)) {
            setError(errorOut, MappingErrorCode::DuplicateResponse, response.questionId, QString(),
                     QStringLiteral("Duplicate response for question %1")
                         .arg(response.questionId));
            return false;
        }
        answered.insert(response.questionId);

        if (response.selectedOptions.isEmpty()) {
            setError(errorOut, MappingErrorCode::EmptySelection, response.questionId, QString(),
                     QStringLiteral("No option selected for question %1")
                         .arg(response.questionId));
            return false;
        }

        QSet<QString> seenOptions;
        for (const QString& optionId : response.selectedOptions) {
            if (seenOptions.contains(optionId)) {
                setError(errorOut, MappingErrorCode::DuplicateOption, response.questionId, optionId,
                         QStringLiteral("Option '%1' selected twice for question %2")
                             .arg(optionId)
                             .arg(response.questionId));
                return false;
            }
            seenOptions.insert(optionId);

            if (!questionIt->second->findOption(optionId)) {
                setError(errorOut, MappingErrorCode::UnknownOption, response.questionId, optionId,
                         QStringLiteral("Unknown option '%1' for question %2")
                             .arg(optionId)
                             .arg(response.questionId));
                return false;
            }
        }
    }

    return true;
}

std::optional<ScoreMap> QuestionnaireScorer::score(
    const std::vector<QuestionnaireResponse>& responses,
    const std::vector<Question>& catalog,
    MappingError* errorOut) const
{
    if (!validate(responses, catalog, errorOut)) {
        return std::nullopt;
    }

    std::unordered_map<int, const Question*> questionsById;
    for (const Question& question : catalog) {
        questionsById.emplace(question.id, &question);
    }

    // area -> question id -> contribution
    std::map<QString, std::map<int, double>> contributions;

    for (const QuestionnaireResponse& response : responses) {
        const Question* question = questionsById.at(response.questionId);
        const double weight = questionWeight(response.questionId);
        // Multi-selection splits the question's credit instead of multiplying it.
        const double selectedCount = static_cast<double>(response.selectedOptions.size());

        for (const QString& optionId : response.selectedOptions) {
            const QuestionOption* option = question->findOption(optionId);
            if (!option->area.has_value() || option->area->isEmpty()) {
                continue;
            }
            contributions[option->area.value()][response.questionId] +=
                (weight * option->weight) / selectedCount;
        }
    }

    ScoreMap raw;
    for (const auto& [area, perQuestion] : contributions) {
        double base = 0.0;
        for (const auto& [questionId, contribution] : perQuestion) {
            base += contribution;
        }

        double multiplier = consistencyBonus(static_cast<int>(perQuestion.size()));

        const bool onlyHobby = perQuestion.size() == 1
            && perQuestion.begin()->first == m_weights.hobbyQuestionId;
        if (onlyHobby) {
            const auto penaltyIt = m_weights.hobbyPenalties.find(area);
            if (penaltyIt != m_weights.hobbyPenalties.end()) {
                multiplier *= penaltyIt->second;
                LOG_DEBUG(imScoring, "hobby penalty %.2f applied to '%s'",
                          penaltyIt->second, qUtf8Printable(area));
            }
        }

        raw[area] = base * multiplier;
    }

    return normalizeByMax(raw);
}

} // namespace im
