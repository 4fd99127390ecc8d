#pragma once

#include <QString>

#include <map>

namespace im {

// Questionnaire weighting rules. Defaults are the canonical five-question
// configuration: importance grows with the question index.
struct QuestionnaireWeights {
    std::map<int, double> questionWeights = {
        {1, 0.15},  // free time
        {2, 0.20},  // online content
        {3, 0.30},  // group role
        {4, 0.35},  // school subjects
        {5, 0.40},  // profession
    };
    double defaultQuestionWeight = 0.2;

    // Keyed by the number of distinct questions supporting an area.
    std::map<int, double> consistencyBonus = {
        {1, 1.0},
        {2, 1.1},
        {3, 1.25},
        {4, 1.4},
        {5, 1.6},
    };

    // Applied only when an area's sole supporting question is the hobby question.
    int hobbyQuestionId = 1;
    std::map<QString, double> hobbyPenalties = {
        {QStringLiteral("Esportes e Atividades Físicas"), 0.3},
        {QStringLiteral("Artes e Cultura"), 0.5},
        {QStringLiteral("Tecnologia e Computação"), 0.7},
        {QStringLiteral("Literatura e Linguagem"), 0.8},
    };
};

struct CombinationWeights {
    double questionnaire = 0.6;
    double text = 0.4;
};

struct CombinationConfig {
    CombinationWeights baseWeights;
    double agreementThreshold = 0.5;  // both sources must be strictly above
    double agreementBonus = 1.2;
};

struct TextQualityConfig {
    int shortWordLimit = 10;    // below: 0.3
    int mediumWordLimit = 20;   // below: 0.6
    int longWordLimit = 200;    // up to and including: 1.0, above: 0.8
    double shortScore = 0.3;
    double mediumScore = 0.6;
    double idealScore = 1.0;
    double longScore = 0.8;
    double keywordDensityScale = 10.0;
    double missingPunctuationScore = 0.7;
};

} // namespace im
