#pragma once

#include "core/mapping/interest_mapping_engine.h"
#include "core/shared/mapping_error.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace im {

struct MappingRequest {
    std::vector<QuestionnaireResponse> responses;
    std::optional<QString> freeText;
};

// JSON boundary for catalogs, requests and results.
class MappingJson {
public:
    static constexpr int kMaxFreeTextChars = 5000;

    static std::optional<std::vector<Question>> parseCatalog(const QJsonObject& root,
                                                             QString* errorOut = nullptr);
    static std::optional<std::vector<Question>> loadCatalog(const QString& path,
                                                            QString* errorOut = nullptr);

    // Repeated option ids inside one response are collapsed here, keeping
    // first-seen order. Free text over kMaxFreeTextChars is rejected.
    static std::optional<MappingRequest> parseRequest(const QJsonObject& root,
                                                      MappingError* errorOut = nullptr);

    static QJsonObject toJson(const ScoreMap& scores);
    static QJsonObject toJson(const MappingResult& result);
    static QJsonObject toJson(const MappingError& error);
    static QJsonObject toJson(const ModelStatus& status);
    static QJsonObject toJson(const std::vector<AreaAvailability>& areas);

    // Text-only analysis: {"areaScores":[{area, score, percentage}], "topArea",
    // "textQuality", "method"}. areaScores follows rankedAreas.
    static QJsonObject textAnalysisToJson(const ScoreMap& textScores,
                                          const QStringList& rankedAreas,
                                          double textQuality);
};

} // namespace im
