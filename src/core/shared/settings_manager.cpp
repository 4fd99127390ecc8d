#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace im {

namespace {

QJsonObject intKeyedToJson(const std::map<int, double>& table)
{
    QJsonObject obj;
    for (const auto& [key, value] : table) {
        obj.insert(QString::number(key), value);
    }
    return obj;
}

// Replaces the table only when the key is present; entries with
// non-numeric keys are skipped with a warning.
void readIntKeyed(const QJsonObject& json, const QString& key, std::map<int, double>* table)
{
    if (!json.value(key).isObject()) {
        return;
    }

    table->clear();
    const QJsonObject obj = json.value(key).toObject();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool ok = false;
        const int intKey = it.key().toInt(&ok);
        if (!ok) {
            LOG_WARN(imCore, "Settings: ignoring non-numeric key '%s' in %s",
                     qUtf8Printable(it.key()), qUtf8Printable(key));
            continue;
        }
        (*table)[intKey] = it.value().toDouble();
    }
}

} // namespace

std::optional<EngineSettings> SettingsManager::load(const QString& path)
{
    const QString filePath = path.isEmpty() ? settingsFilePath() : path;
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(imCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(imCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const EngineSettings& settings, const QString& path)
{
    const QString filePath = path.isEmpty() ? settingsFilePath() : path;
    const QString parentDir = QFileInfo(filePath).absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(imCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(imCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(imCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/interestmapper/settings.json");
}

QJsonObject SettingsManager::toJson(const EngineSettings& settings)
{
    QJsonObject json;

    const QuestionnaireWeights& q = settings.questionnaire;
    json.insert(QStringLiteral("questionWeights"), intKeyedToJson(q.questionWeights));
    json.insert(QStringLiteral("defaultQuestionWeight"), q.defaultQuestionWeight);
    json.insert(QStringLiteral("consistencyBonus"), intKeyedToJson(q.consistencyBonus));
    json.insert(QStringLiteral("hobbyQuestionId"), q.hobbyQuestionId);
    QJsonObject penalties;
    for (const auto& [area, factor] : q.hobbyPenalties) {
        penalties.insert(area, factor);
    }
    json.insert(QStringLiteral("hobbyPenalties"), penalties);

    QJsonObject combination;
    combination.insert(QStringLiteral("questionnaireWeight"),
                       settings.combination.baseWeights.questionnaire);
    combination.insert(QStringLiteral("textWeight"), settings.combination.baseWeights.text);
    combination.insert(QStringLiteral("agreementThreshold"),
                       settings.combination.agreementThreshold);
    combination.insert(QStringLiteral("agreementBonus"), settings.combination.agreementBonus);
    json.insert(QStringLiteral("combination"), combination);

    const TextQualityConfig& tq = settings.textQuality;
    QJsonObject quality;
    quality.insert(QStringLiteral("shortWordLimit"), tq.shortWordLimit);
    quality.insert(QStringLiteral("mediumWordLimit"), tq.mediumWordLimit);
    quality.insert(QStringLiteral("longWordLimit"), tq.longWordLimit);
    quality.insert(QStringLiteral("shortScore"), tq.shortScore);
    quality.insert(QStringLiteral("mediumScore"), tq.mediumScore);
    quality.insert(QStringLiteral("idealScore"), tq.idealScore);
    quality.insert(QStringLiteral("longScore"), tq.longScore);
    quality.insert(QStringLiteral("keywordDensityScale"), tq.keywordDensityScale);
    quality.insert(QStringLiteral("missingPunctuationScore"), tq.missingPunctuationScore);
    json.insert(QStringLiteral("textQuality"), quality);

    json.insert(QStringLiteral("minTextChars"), settings.minTextChars);
    json.insert(QStringLiteral("embeddingFallbacks"),
                QJsonArray::fromStringList(settings.embeddingFallbacks));

    QJsonObject cache;
    cache.insert(QStringLiteral("maxEntries"), settings.embeddingCacheEntries);
    cache.insert(QStringLiteral("ttlSeconds"), settings.embeddingCacheTtlSeconds);
    json.insert(QStringLiteral("embeddingCache"), cache);

    json.insert(QStringLiteral("inferenceTimeoutMs"), settings.inferenceTimeoutMs);
    return json;
}

EngineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    EngineSettings settings;

    QuestionnaireWeights& q = settings.questionnaire;
    readIntKeyed(json, QStringLiteral("questionWeights"), &q.questionWeights);
    readIntKeyed(json, QStringLiteral("consistencyBonus"), &q.consistencyBonus);
    q.defaultQuestionWeight = json.value(QStringLiteral("defaultQuestionWeight"))
                                  .toDouble(q.defaultQuestionWeight);
    q.hobbyQuestionId = json.value(QStringLiteral("hobbyQuestionId")).toInt(q.hobbyQuestionId);

    if (json.value(QStringLiteral("hobbyPenalties")).isObject()) {
        q.hobbyPenalties.clear();
        const QJsonObject penalties = json.value(QStringLiteral("hobbyPenalties")).toObject();
        for (auto it = penalties.begin(); it != penalties.end(); ++it) {
            q.hobbyPenalties[it.key()] = it.value().toDouble();
        }
    }

    const QJsonObject combination = json.value(QStringLiteral("combination")).toObject();
    CombinationConfig& c = settings.combination;
    c.baseWeights.questionnaire = combination.value(QStringLiteral("questionnaireWeight"))
                                      .toDouble(c.baseWeights.questionnaire);
    c.baseWeights.text = combination.value(QStringLiteral("textWeight"))
                             .toDouble(c.baseWeights.text);
    c.agreementThreshold = combination.value(QStringLiteral("agreementThreshold"))
                               .toDouble(c.agreementThreshold);
    c.agreementBonus = combination.value(QStringLiteral("agreementBonus"))
                           .toDouble(c.agreementBonus);

    const QJsonObject quality = json.value(QStringLiteral("textQuality")).toObject();
    TextQualityConfig& tq = settings.textQuality;
    tq.shortWordLimit = quality.value(QStringLiteral("shortWordLimit")).toInt(tq.shortWordLimit);
    tq.mediumWordLimit = quality.value(QStringLiteral("mediumWordLimit")).toInt(tq.mediumWordLimit);
    tq.longWordLimit = quality.value(QStringLiteral("longWordLimit")).toInt(tq.longWordLimit);
    tq.shortScore = quality.value(QStringLiteral("shortScore")).toDouble(tq.shortScore);
    tq.mediumScore = quality.value(QStringLiteral("mediumScore")).toDouble(tq.mediumScore);
    tq.idealScore = quality.value(QStringLiteral("idealScore")).toDouble(tq.idealScore);
    tq.longScore = quality.value(QStringLiteral("longScore")).toDouble(tq.longScore);
    tq.keywordDensityScale = quality.value(QStringLiteral("keywordDensityScale"))
                                 .toDouble(tq.keywordDensityScale);
    tq.missingPunctuationScore = quality.value(QStringLiteral("missingPunctuationScore"))
                                     .toDouble(tq.missingPunctuationScore);

    settings.minTextChars = json.value(QStringLiteral("minTextChars")).toInt(settings.minTextChars);

    if (json.value(QStringLiteral("embeddingFallbacks")).isArray()) {
        settings.embeddingFallbacks.clear();
        const QJsonArray fallbacks = json.value(QStringLiteral("embeddingFallbacks")).toArray();
        for (const QJsonValue& value : fallbacks) {
            settings.embeddingFallbacks.append(value.toString());
        }
    }

    const QJsonObject cache = json.value(QStringLiteral("embeddingCache")).toObject();
    settings.embeddingCacheEntries = cache.value(QStringLiteral("maxEntries"))
                                         .toInt(settings.embeddingCacheEntries);
    settings.embeddingCacheTtlSeconds = cache.value(QStringLiteral("ttlSeconds"))
                                            .toInt(settings.embeddingCacheTtlSeconds);

    settings.inferenceTimeoutMs = json.value(QStringLiteral("inferenceTimeoutMs"))
                                      .toInt(settings.inferenceTimeoutMs);
    if (settings.inferenceTimeoutMs < 0) {
        LOG_WARN(imCore, "Settings: inferenceTimeoutMs(%d) clamped to 0", settings.inferenceTimeoutMs);
        settings.inferenceTimeoutMs = 0;
    }

    return settings;
}

} // namespace im
