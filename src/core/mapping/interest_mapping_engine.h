#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/scoring/questionnaire_scorer.h"
#include "core/scoring/score_combiner.h"
#include "core/shared/mapping_error.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/text/text_quality_estimator.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

namespace im {

class EmbeddingCache;
class ModelArtifact;
class TextClassifier;

struct ModelStatus {
    bool artifactLoaded = false;
    bool textAnalysisAvailable = false;
    QString artifactId;
    QStringList labels;
    QString embeddingProvider;
    QString error;  // why text analysis is unavailable, when it is
};

struct AreaAvailability {
    QString area;
    bool knownToModel = false;
};

// Hybrid questionnaire + free-text interest mapping. Immutable after
// initialize(); mapInterests() may be called from several threads.
class InterestMappingEngine {
public:
    // artifact may be null: the engine then serves questionnaire-only
    // results. The artifact must outlive the engine. cache may be null.
    InterestMappingEngine(EngineSettings settings,
                          const ModelArtifact* artifact,
                          std::vector<std::unique_ptr<EmbeddingProvider>> providers,
                          std::unique_ptr<EmbeddingCache> cache = nullptr);
    ~InterestMappingEngine();

    InterestMappingEngine(const InterestMappingEngine&) = delete;
    InterestMappingEngine& operator=(const InterestMappingEngine&) = delete;

    // Prepares the text path. A false return is not fatal: the engine keeps
    // answering with questionnaire-only results.
    bool initialize(QString* errorOut = nullptr);

    std::optional<MappingResult> mapInterests(const std::vector<QuestionnaireResponse>& responses,
                                              const std::vector<Question>& catalog,
                                              const std::optional<QString>& freeText,
                                              MappingError* errorOut = nullptr) const;

    // Text channel alone, raw free text in.
    ScoreMap analyzeText(const QString& freeText) const;
    double textQuality(const QString& freeText) const;

    ModelStatus modelStatus() const;
    std::vector<AreaAvailability> availableAreas(const std::vector<Question>& catalog) const;

    // Areas of `scores` by descending score. Ties follow catalog declaration
    // order, then artifact label order, then lexicographic order.
    QStringList rankAreas(const ScoreMap& scores, const std::vector<Question>& catalog) const;

    const EngineSettings& settings() const { return m_settings; }

private:
    EngineSettings m_settings;
    const ModelArtifact* m_artifact = nullptr;
    std::unique_ptr<EmbeddingCache> m_cache;
    QuestionnaireScorer m_scorer;
    ScoreCombiner m_combiner;
    TextQualityEstimator m_quality;
    std::unique_ptr<TextClassifier> m_classifier;
    QString m_initError;
};

} // namespace im
