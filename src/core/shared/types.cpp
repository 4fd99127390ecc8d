#include "core/shared/types.h"

#include <algorithm>

namespace im {

const QuestionOption* Question::findOption(const QString& optionId) const
{
    for (const QuestionOption& option : options) {
        if (option.id == optionId) {
            return &option;
        }
    }
    return nullptr;
}

ScoreMap normalizeByMax(const ScoreMap& raw)
{
    double maxScore = 0.0;
    for (const auto& [area, score] : raw) {
        maxScore = std::max(maxScore, score);
    }

    ScoreMap normalized;
    if (maxScore <= 0.0) {
        return normalized;
    }

    for (const auto& [area, score] : raw) {
        if (score <= 0.0) {
            continue;
        }
        normalized[area] = score / maxScore;
    }
    return normalized;
}

int countPositive(const ScoreMap& scores)
{
    return static_cast<int>(std::count_if(scores.begin(), scores.end(),
                                          [](const auto& entry) { return entry.second > 0.0; }));
}

QStringList catalogAreaOrder(const std::vector<Question>& catalog)
{
    QStringList order;
    for (const Question& question : catalog) {
        for (const QuestionOption& option : question.options) {
            if (option.area.has_value() && !option.area->isEmpty()
                && !order.contains(option.area.value())) {
                order.append(option.area.value());
            }
        }
    }
    return order;
}

} // namespace im
