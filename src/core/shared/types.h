#pragma once

#include <QString>
#include <QStringList>

#include <map>
#include <optional>
#include <vector>

namespace im {

// Area -> score in [0,1]. When non-empty the maximum value is exactly 1.0.
// Areas with no support are absent rather than present at 0.
using ScoreMap = std::map<QString, double>;

struct QuestionOption {
    QString id;
    QString text;
    std::optional<QString> area;  // options without an area contribute nothing
    double weight = 1.0;
};

struct Question {
    int id = 0;
    QString prompt;
    std::vector<QuestionOption> options;  // declaration order is significant

    const QuestionOption* findOption(const QString& optionId) const;
};

struct QuestionnaireResponse {
    int questionId = 0;
    QStringList selectedOptions;
};

struct AreaContribution {
    QString area;
    double score = 0.0;
    double questionnaireContribution = 0.0;
    double textContribution = 0.0;
};

struct AnalysisDetails {
    QString method = QStringLiteral("questionnaire_only");
    double questionnaireWeight = 1.0;  // effective weights after renormalization
    double textWeight = 0.0;
    int areasFromQuestionnaire = 0;
    int areasFromText = 0;
    double agreementScore = 0.0;
    bool textAnalyzed = false;
    QString embeddingProvider;
};

struct MappingResult {
    ScoreMap questionnaireScores;
    ScoreMap textScores;
    ScoreMap combinedScores;
    double textQuality = 0.0;
    std::optional<QString> recommendedArea;
    double confidence = 0.0;
    std::vector<AreaContribution> top3;
    AnalysisDetails analysisDetails;
};

// Drops non-positive entries and divides the rest by the maximum value.
ScoreMap normalizeByMax(const ScoreMap& raw);

// Number of areas with a strictly positive score.
int countPositive(const ScoreMap& scores);

// Areas in the order their first option appears in the catalog.
QStringList catalogAreaOrder(const std::vector<Question>& catalog);

} // namespace im
