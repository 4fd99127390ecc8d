#include "core/models/artifact_manifest.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace im {

namespace {

bool fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

bool readNumberArray(const QJsonValue& value, std::vector<double>* out)
{
    if (!value.isArray()) {
        return false;
    }
    const QJsonArray array = value.toArray();
    out->clear();
    out->reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& item : array) {
        if (!item.isDouble()) {
            return false;
        }
        out->push_back(item.toDouble());
    }
    return true;
}

QStringList readStringArray(const QJsonValue& value)
{
    QStringList result;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& item : array) {
        if (item.isString()) {
            result.append(item.toString());
        }
    }
    return result;
}

std::map<QString, QStringList> readAreaLists(const QJsonObject& obj)
{
    std::map<QString, QStringList> result;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        result[it.key()] = readStringArray(it.value());
    }
    return result;
}

bool readClassifier(const QJsonObject& obj, ClassifierSpec* spec, QString* errorOut)
{
    spec->type = obj.value(QStringLiteral("type")).toString();

    if (spec->type == QStringLiteral("onnx")) {
        spec->role = obj.value(QStringLiteral("role")).toString(spec->role);
        return true;
    }

    if (spec->type != QStringLiteral("linear_softmax")) {
        return fail(errorOut, QStringLiteral("unsupported classifier type '%1'").arg(spec->type));
    }

    const QJsonArray rows = obj.value(QStringLiteral("coefficients")).toArray();
    spec->coefficients.clear();
    spec->coefficients.reserve(static_cast<size_t>(rows.size()));
    for (const QJsonValue& row : rows) {
        std::vector<double> values;
        if (!readNumberArray(row, &values)) {
            return fail(errorOut, QStringLiteral("classifier coefficients must be numeric rows"));
        }
        spec->coefficients.push_back(std::move(values));
    }

    if (!readNumberArray(obj.value(QStringLiteral("intercepts")), &spec->intercepts)) {
        return fail(errorOut, QStringLiteral("classifier intercepts must be a numeric array"));
    }
    return true;
}

} // namespace

std::optional<ArtifactManifest> ArtifactManifest::loadFromFile(const QString& path,
                                                               QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        fail(errorOut, QStringLiteral("cannot open %1").arg(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        fail(errorOut, QStringLiteral("invalid JSON in %1: %2")
                           .arg(path, parseError.errorString()));
        return std::nullopt;
    }

    return loadFromJson(doc.object(), errorOut);
}

std::optional<ArtifactManifest> ArtifactManifest::loadFromJson(const QJsonObject& root,
                                                               QString* errorOut)
{
    ArtifactManifest manifest;
    manifest.artifactId = root.value(QStringLiteral("artifactId")).toString();
    manifest.labels = readStringArray(root.value(QStringLiteral("labels")));
    manifest.areaOrder = readStringArray(root.value(QStringLiteral("areaOrder")));

    const QJsonObject embedder = root.value(QStringLiteral("embedder")).toObject();
    manifest.embedder.identity = embedder.value(QStringLiteral("identity")).toString();
    manifest.embedder.dimensions = embedder.value(QStringLiteral("dimensions")).toInt(0);
    manifest.embedder.fallbacks = readStringArray(embedder.value(QStringLiteral("fallbacks")));

    const QJsonObject scaler = root.value(QStringLiteral("scaler")).toObject();
    if (!readNumberArray(scaler.value(QStringLiteral("mean")), &manifest.scalerMean)
        || !readNumberArray(scaler.value(QStringLiteral("scale")), &manifest.scalerScale)) {
        fail(errorOut, QStringLiteral("scaler mean and scale must be numeric arrays"));
        return std::nullopt;
    }

    const QJsonObject keywords = root.value(QStringLiteral("keywords")).toObject();
    for (auto it = keywords.begin(); it != keywords.end(); ++it) {
        if (!it.value().isObject()) {
            LOG_WARN(imModel, "ArtifactManifest: keyword '%s' has no area weights, skipping",
                     qUtf8Printable(it.key()));
            continue;
        }
        const QJsonObject areaWeights = it.value().toObject();
        std::map<QString, double>& entry = manifest.keywords[it.key()];
        for (auto areaIt = areaWeights.begin(); areaIt != areaWeights.end(); ++areaIt) {
            entry[areaIt.key()] = areaIt.value().toDouble();
        }
    }

    manifest.patterns = readAreaLists(root.value(QStringLiteral("patterns")).toObject());
    manifest.vocabulary = readAreaLists(root.value(QStringLiteral("vocabulary")).toObject());

    if (!root.value(QStringLiteral("classifier")).isObject()) {
        fail(errorOut, QStringLiteral("missing classifier section"));
        return std::nullopt;
    }
    if (!readClassifier(root.value(QStringLiteral("classifier")).toObject(),
                        &manifest.classifier, errorOut)) {
        return std::nullopt;
    }

    return manifest;
}

} // namespace im
