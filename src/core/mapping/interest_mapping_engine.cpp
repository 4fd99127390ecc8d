#include "core/mapping/interest_mapping_engine.h"

#include "core/classification/text_classifier.h"
#include "core/embedding/embedding_cache.h"
#include "core/models/model_artifact.h"
#include "core/shared/logging.h"
#include "core/text/text_preprocessor.h"

#include <QHash>
#include <QSet>

#include <algorithm>

namespace im {

namespace {

constexpr int kTopCount = 3;

QSet<QString> topAreas(const QStringList& ranked)
{
    QSet<QString> top;
    for (int i = 0; i < ranked.size() && i < kTopCount; ++i) {
        top.insert(ranked.at(i));
    }
    return top;
}

double scoreOf(const ScoreMap& scores, const QString& area)
{
    const auto it = scores.find(area);
    return it == scores.end() ? 0.0 : it->second;
}

} // namespace

InterestMappingEngine::InterestMappingEngine(EngineSettings settings,
                                             const ModelArtifact* artifact,
                                             std::vector<std::unique_ptr<EmbeddingProvider>> providers,
                                             std::unique_ptr<EmbeddingCache> cache)
    : m_settings(std::move(settings))
    , m_artifact(artifact)
    , m_cache(std::move(cache))
    , m_scorer(m_settings.questionnaire)
    , m_combiner(m_settings.combination)
    , m_quality(artifact ? &artifact->keywordWeights() : nullptr, m_settings.textQuality)
    , m_classifier(std::make_unique<TextClassifier>(artifact, std::move(providers),
                                                    m_settings, m_cache.get()))
{
}

InterestMappingEngine::~InterestMappingEngine() = default;

bool InterestMappingEngine::initialize(QString* errorOut)
{
    m_initError.clear();
    if (!m_classifier->initialize(&m_initError)) {
        LOG_WARN(imCore, "Text analysis unavailable, serving questionnaire-only results: %s",
                 qUtf8Printable(m_initError));
        if (errorOut) {
            *errorOut = m_initError;
        }
        return false;
    }

    LOG_INFO(imCore, "Interest mapping ready (artifact '%s', embedder '%s')",
             qUtf8Printable(m_artifact->artifactId()),
             qUtf8Printable(m_classifier->embeddingProvider()));
    return true;
}

std::optional<MappingResult> InterestMappingEngine::mapInterests(
    const std::vector<QuestionnaireResponse>& responses,
    const std::vector<Question>& catalog,
    const std::optional<QString>& freeText,
    MappingError* errorOut) const
{
    std::optional<ScoreMap> questionnaireScores = m_scorer.score(responses, catalog, errorOut);
    if (!questionnaireScores.has_value()) {
        return std::nullopt;
    }

    MappingResult result;
    result.questionnaireScores = std::move(questionnaireScores.value());

    if (freeText.has_value()) {
        const QString processed = TextPreprocessor::process(freeText.value());
        if (processed.size() >= m_settings.minTextChars) {
            result.analysisDetails.textAnalyzed = true;
            result.textQuality = m_quality.estimate(processed);
            result.textScores = m_classifier->classify(processed);
        } else {
            LOG_DEBUG(imCore, "Free text too short after processing (%d chars), ignored",
                      static_cast<int>(processed.size()));
        }
    }

    result.combinedScores = m_combiner.combine(result.questionnaireScores, result.textScores,
                                               result.textQuality);

    const QStringList ranked = rankAreas(result.combinedScores, catalog);
    if (!ranked.isEmpty()) {
        result.recommendedArea = ranked.front();
        result.confidence = scoreOf(result.combinedScores, ranked.front());
    }

    for (int i = 0; i < ranked.size() && i < kTopCount; ++i) {
        const QString& area = ranked.at(i);
        AreaContribution contribution;
        contribution.area = area;
        contribution.score = scoreOf(result.combinedScores, area);
        contribution.questionnaireContribution = scoreOf(result.questionnaireScores, area);
        contribution.textContribution = scoreOf(result.textScores, area);
        result.top3.push_back(contribution);
    }

    AnalysisDetails& details = result.analysisDetails;
    details.areasFromQuestionnaire = countPositive(result.questionnaireScores);
    details.areasFromText = countPositive(result.textScores);
    details.embeddingProvider = m_classifier->embeddingProvider();

    if (!result.textScores.empty()) {
        const CombinationWeights weights = m_combiner.effectiveWeights(result.textQuality);
        details.method = QStringLiteral("hybrid");
        details.questionnaireWeight = weights.questionnaire;
        details.textWeight = weights.text;
    }

    if (!result.questionnaireScores.empty() && !result.textScores.empty()) {
        QSet<QString> topQuestionnaire =
            topAreas(rankAreas(result.questionnaireScores, catalog));
        const QSet<QString> topText = topAreas(rankAreas(result.textScores, catalog));
        const int overlap = static_cast<int>(topQuestionnaire.intersect(topText).size());
        details.agreementScore = static_cast<double>(overlap) / kTopCount;
    }

    LOG_DEBUG(imCore, "Mapped %d response(s): method=%s recommended=%s confidence=%.3f",
              static_cast<int>(responses.size()), qUtf8Printable(details.method),
              qUtf8Printable(result.recommendedArea.value_or(QStringLiteral("<none>"))),
              result.confidence);
    return result;
}

ScoreMap InterestMappingEngine::analyzeText(const QString& freeText) const
{
    return m_classifier->classify(TextPreprocessor::process(freeText));
}

double InterestMappingEngine::textQuality(const QString& freeText) const
{
    const QString processed = TextPreprocessor::process(freeText);
    if (processed.size() < m_settings.minTextChars) {
        return 0.0;
    }
    return m_quality.estimate(processed);
}

ModelStatus InterestMappingEngine::modelStatus() const
{
    ModelStatus status;
    status.artifactLoaded = m_artifact != nullptr;
    status.textAnalysisAvailable = m_classifier->isAvailable();
    status.embeddingProvider = m_classifier->embeddingProvider();
    status.error = m_initError;
    if (m_artifact) {
        status.artifactId = m_artifact->artifactId();
        status.labels = m_artifact->labels();
    }
    return status;
}

std::vector<AreaAvailability> InterestMappingEngine::availableAreas(
    const std::vector<Question>& catalog) const
{
    std::vector<AreaAvailability> areas;
    for (const QString& area : catalogAreaOrder(catalog)) {
        AreaAvailability availability;
        availability.area = area;
        availability.knownToModel = m_artifact && m_artifact->labels().contains(area);
        areas.push_back(availability);
    }
    return areas;
}

QStringList InterestMappingEngine::rankAreas(const ScoreMap& scores,
                                             const std::vector<Question>& catalog) const
{
    QHash<QString, int> precedence;
    int next = 0;
    for (const QString& area : catalogAreaOrder(catalog)) {
        precedence.insert(area, next++);
    }
    if (m_artifact) {
        for (const QString& label : m_artifact->labels()) {
            if (!precedence.contains(label)) {
                precedence.insert(label, next++);
            }
        }
    }

    const auto rankOf = [&precedence, next](const QString& area) {
        return precedence.value(area, next);
    };

    QStringList ranked;
    for (const auto& [area, score] : scores) {
        if (score > 0.0) {
            ranked.append(area);
        }
    }

    // ScoreMap iterates lexicographically, so a stable sort keeps that as
    // the last tie-break.
    std::stable_sort(ranked.begin(), ranked.end(),
                     [&scores, &rankOf](const QString& a, const QString& b) {
                         const double scoreA = scores.at(a);
                         const double scoreB = scores.at(b);
                         if (scoreA != scoreB) {
                             return scoreA > scoreB;
                         }
                         return rankOf(a) < rankOf(b);
                     });
    return ranked;
}

} // namespace im
