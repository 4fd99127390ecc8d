#include "core/mapping/mapping_json.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>

namespace im {

namespace {

// Option ids may be written as strings or numbers.
QString idToString(const QJsonValue& value)
{
    if (value.isDouble()) {
        return QString::number(value.toInteger());
    }
    return value.toString();
}

void invalid(MappingError* errorOut, int questionId, const QString& message)
{
    LOG_WARN(imCore, "Rejected request: %s", qUtf8Printable(message));
    if (errorOut) {
        errorOut->code = MappingErrorCode::InvalidInput;
        errorOut->questionId = questionId;
        errorOut->optionId.clear();
        errorOut->message = message;
    }
}

} // namespace

std::optional<std::vector<Question>> MappingJson::parseCatalog(const QJsonObject& root,
                                                               QString* errorOut)
{
    if (!root.value(QStringLiteral("questions")).isArray()) {
        if (errorOut) {
            *errorOut = QStringLiteral("catalog has no 'questions' array");
        }
        return std::nullopt;
    }

    std::vector<Question> catalog;
    QSet<int> seenIds;
    const QJsonArray questions = root.value(QStringLiteral("questions")).toArray();
    for (const QJsonValue& questionValue : questions) {
        const QJsonObject obj = questionValue.toObject();
        if (!obj.value(QStringLiteral("id")).isDouble()) {
            if (errorOut) {
                *errorOut = QStringLiteral("catalog question without numeric id");
            }
            return std::nullopt;
        }

        Question question;
        question.id = obj.value(QStringLiteral("id")).toInt();
        question.prompt = obj.value(QStringLiteral("prompt")).toString();
        if (seenIds.contains(question.id)) {
            if (errorOut) {
                *errorOut = QStringLiteral("catalog repeats question id %1").arg(question.id);
            }
            return std::nullopt;
        }
        seenIds.insert(question.id);

        QSet<QString> seenOptions;
        const QJsonArray options = obj.value(QStringLiteral("options")).toArray();
        for (const QJsonValue& optionValue : options) {
            const QJsonObject optionObj = optionValue.toObject();
            QuestionOption option;
            option.id = idToString(optionObj.value(QStringLiteral("id")));
            option.text = optionObj.value(QStringLiteral("text")).toString();
            option.weight = optionObj.value(QStringLiteral("weight")).toDouble(1.0);
            const QString area = optionObj.value(QStringLiteral("area")).toString();
            if (!area.isEmpty()) {
                option.area = area;
            }

            if (option.id.isEmpty() || seenOptions.contains(option.id)) {
                if (errorOut) {
                    *errorOut = QStringLiteral("question %1 has a missing or repeated option id")
                                    .arg(question.id);
                }
                return std::nullopt;
            }
            seenOptions.insert(option.id);
            question.options.push_back(std::move(option));
        }

        catalog.push_back(std::move(question));
    }

    return catalog;
}

std::optional<std::vector<Question>> MappingJson::loadCatalog(const QString& path,
                                                              QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot open catalog %1").arg(path);
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorOut) {
            *errorOut = QStringLiteral("invalid catalog JSON in %1: %2")
                            .arg(path, parseError.errorString());
        }
        return std::nullopt;
    }

    return parseCatalog(doc.object(), errorOut);
}

std::optional<MappingRequest> MappingJson::parseRequest(const QJsonObject& root,
                                                        MappingError* errorOut)
{
    MappingRequest request;

    const QJsonValue responsesValue = root.value(QStringLiteral("responses"));
    if (!responsesValue.isUndefined() && !responsesValue.isArray()) {
        invalid(errorOut, 0, QStringLiteral("'responses' must be an array"));
        return std::nullopt;
    }

    const QJsonArray responses = responsesValue.toArray();
    for (const QJsonValue& value : responses) {
        const QJsonObject obj = value.toObject();
        if (!obj.value(QStringLiteral("questionId")).isDouble()) {
            invalid(errorOut, 0, QStringLiteral("response without numeric questionId"));
            return std::nullopt;
        }

        QuestionnaireResponse response;
        response.questionId = obj.value(QStringLiteral("questionId")).toInt();

        const QJsonArray selected = obj.value(QStringLiteral("selectedOptions")).toArray();
        for (const QJsonValue& optionValue : selected) {
            const QString optionId = idToString(optionValue);
            if (!response.selectedOptions.contains(optionId)) {
                response.selectedOptions.append(optionId);
            }
        }
        request.responses.push_back(std::move(response));
    }

    const QJsonValue freeText = root.value(QStringLiteral("freeText"));
    if (freeText.isString()) {
        const QString text = freeText.toString();
        if (text.size() > kMaxFreeTextChars) {
            invalid(errorOut, 0, QStringLiteral("free text exceeds %1 characters")
                                     .arg(kMaxFreeTextChars));
            return std::nullopt;
        }
        request.freeText = text;
    } else if (!freeText.isUndefined() && !freeText.isNull()) {
        invalid(errorOut, 0, QStringLiteral("'freeText' must be a string"));
        return std::nullopt;
    }

    return request;
}

QJsonObject MappingJson::toJson(const ScoreMap& scores)
{
    QJsonObject obj;
    for (const auto& [area, score] : scores) {
        obj.insert(area, score);
    }
    return obj;
}

QJsonObject MappingJson::toJson(const MappingResult& result)
{
    QJsonObject json;
    json[QStringLiteral("questionnaireScores")] = toJson(result.questionnaireScores);
    json[QStringLiteral("textScores")] = toJson(result.textScores);
    json[QStringLiteral("combinedScores")] = toJson(result.combinedScores);
    json[QStringLiteral("textQuality")] = result.textQuality;
    json[QStringLiteral("recommendedArea")] = result.recommendedArea.has_value()
        ? QJsonValue(result.recommendedArea.value())
        : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("confidence")] = result.confidence;

    QJsonArray top3;
    for (const AreaContribution& contribution : result.top3) {
        QJsonObject entry;
        entry[QStringLiteral("area")] = contribution.area;
        entry[QStringLiteral("score")] = contribution.score;
        entry[QStringLiteral("questionnaireContribution")] = contribution.questionnaireContribution;
        entry[QStringLiteral("textContribution")] = contribution.textContribution;
        top3.append(entry);
    }
    json[QStringLiteral("top3")] = top3;

    const AnalysisDetails& d = result.analysisDetails;
    QJsonObject details;
    details[QStringLiteral("method")] = d.method;
    details[QStringLiteral("questionnaireWeight")] = d.questionnaireWeight;
    details[QStringLiteral("textWeight")] = d.textWeight;
    details[QStringLiteral("areasFromQuestionnaire")] = d.areasFromQuestionnaire;
    details[QStringLiteral("areasFromText")] = d.areasFromText;
    details[QStringLiteral("agreementScore")] = d.agreementScore;
    details[QStringLiteral("textAnalyzed")] = d.textAnalyzed;
    details[QStringLiteral("embeddingProvider")] = d.embeddingProvider;
    json[QStringLiteral("analysisDetails")] = details;
    return json;
}

QJsonObject MappingJson::toJson(const MappingError& error)
{
    QJsonObject json;
    json[QStringLiteral("code")] = mappingErrorCodeToString(error.code);
    json[QStringLiteral("message")] = error.message;
    if (error.questionId != 0) {
        json[QStringLiteral("questionId")] = error.questionId;
    }
    if (!error.optionId.isEmpty()) {
        json[QStringLiteral("optionId")] = error.optionId;
    }
    return json;
}

QJsonObject MappingJson::toJson(const ModelStatus& status)
{
    QJsonObject json;
    json[QStringLiteral("artifactLoaded")] = status.artifactLoaded;
    json[QStringLiteral("textAnalysisAvailable")] = status.textAnalysisAvailable;
    json[QStringLiteral("artifactId")] = status.artifactId;
    json[QStringLiteral("labels")] = QJsonArray::fromStringList(status.labels);
    json[QStringLiteral("embeddingProvider")] = status.embeddingProvider;
    if (!status.error.isEmpty()) {
        json[QStringLiteral("error")] = status.error;
    }
    return json;
}

QJsonObject MappingJson::toJson(const std::vector<AreaAvailability>& areas)
{
    QJsonArray array;
    for (const AreaAvailability& area : areas) {
        QJsonObject entry;
        entry[QStringLiteral("area")] = area.area;
        entry[QStringLiteral("knownToModel")] = area.knownToModel;
        array.append(entry);
    }
    QJsonObject json;
    json[QStringLiteral("areas")] = array;
    return json;
}

QJsonObject MappingJson::textAnalysisToJson(const ScoreMap& textScores,
                                            const QStringList& rankedAreas,
                                            double textQuality)
{
    QJsonArray areaScores;
    for (const QString& area : rankedAreas) {
        const auto it = textScores.find(area);
        if (it == textScores.end()) {
            continue;
        }
        QJsonObject entry;
        entry[QStringLiteral("area")] = area;
        entry[QStringLiteral("score")] = it->second;
        entry[QStringLiteral("percentage")] = it->second * 100.0;
        areaScores.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("areaScores")] = areaScores;
    json[QStringLiteral("topArea")] = areaScores.isEmpty()
        ? QJsonValue(QJsonValue::Null)
        : areaScores.first().toObject().value(QStringLiteral("area"));
    json[QStringLiteral("textQuality")] = textQuality;
    json[QStringLiteral("method")] = QStringLiteral("text_classifier");
    return json;
}

} // namespace im
