#include "core/embedding/embedding_cache.h"
#include "core/embedding/onnx_embedding_provider.h"
#include "core/mapping/interest_mapping_engine.h"
#include "core/mapping/mapping_json.h"
#include "core/models/file_model_artifact.h"
#include "core/models/model_registry.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>

#include <cstdio>
#include <memory>

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitUsage = 1,
    kExitInvalidInput = 2,
    kExitUnavailable = 3,
};

void printJson(const QJsonObject& obj)
{
    QTextStream out(stdout);
    out << QJsonDocument(obj).toJson(QJsonDocument::Indented);
    out.flush();
}

int fail(ExitCode code, const QString& message)
{
    QTextStream err(stderr);
    err << "interestmapper: " << message << Qt::endl;
    return code;
}

QString defaultCatalogPath()
{
    const QString appDir = QCoreApplication::applicationDirPath();
    QStringList candidates = {
        appDir + QStringLiteral("/data/questionnaire/default_catalog.json"),
        appDir + QStringLiteral("/../data/questionnaire/default_catalog.json"),
        appDir + QStringLiteral("/../../data/questionnaire/default_catalog.json"),
    };
#ifdef INTERESTMAPPER_SOURCE_DIR
    candidates << QString::fromUtf8(INTERESTMAPPER_SOURCE_DIR)
            + QStringLiteral("/data/questionnaire/default_catalog.json");
#endif
    for (const QString& candidate : candidates) {
        if (QFile::exists(candidate)) {
            return QDir::cleanPath(candidate);
        }
    }
    return QDir::cleanPath(candidates.first());
}

std::optional<QJsonObject> readJsonObject(const QString& path, QString* errorOut)
{
    QFile file;
    bool opened = false;
    if (path == QStringLiteral("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        *errorOut = QStringLiteral("cannot open %1").arg(path);
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *errorOut = QStringLiteral("invalid JSON in %1: %2").arg(path, parseError.errorString());
        return std::nullopt;
    }
    return doc.object();
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("interestmapper"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Recommends an interest area from questionnaire responses and free text."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("map | analyze-text | status | areas"));
    parser.addPositionalArgument(QStringLiteral("text"),
                                 QStringLiteral("Free text for analyze-text."), QStringLiteral("[text]"));

    const QCommandLineOption modelsDirOption(QStringLiteral("models-dir"),
        QStringLiteral("Artifact directory (artifact.json, manifest.json)."), QStringLiteral("dir"));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Settings JSON file."), QStringLiteral("file"));
    const QCommandLineOption catalogOption(QStringLiteral("catalog"),
        QStringLiteral("Question catalog JSON file."), QStringLiteral("file"));
    const QCommandLineOption requestOption(QStringLiteral("request"),
        QStringLiteral("Responses JSON file for map, or - for stdin."), QStringLiteral("file"),
        QStringLiteral("-"));
    const QCommandLineOption textOption(QStringLiteral("text"),
        QStringLiteral("Free text for map, overriding the request's freeText."), QStringLiteral("text"));
    parser.addOption(modelsDirOption);
    parser.addOption(settingsOption);
    parser.addOption(catalogOption);
    parser.addOption(requestOption);
    parser.addOption(textOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(kExitUsage);
    }
    const QString command = positional.first();

    im::EngineSettings settings;
    const QString settingsPath = parser.value(settingsOption);
    if (std::optional<im::EngineSettings> loaded = im::SettingsManager::load(settingsPath)) {
        settings = std::move(loaded.value());
    } else if (!settingsPath.isEmpty()) {
        return fail(kExitUsage, QStringLiteral("cannot load settings from %1").arg(settingsPath));
    }

    const QString modelsDir = im::ModelRegistry::resolveModelsDir(parser.value(modelsDirOption));
    im::ModelRegistry registry(modelsDir);
    QString artifactError;
    std::unique_ptr<im::FileModelArtifact> artifact =
        im::FileModelArtifact::load(modelsDir, &registry, &artifactError);
    if (!artifact) {
        LOG_WARN(imCore, "No usable model artifact in %s: %s",
                 qUtf8Printable(modelsDir), qUtf8Printable(artifactError));
    }

    im::EmbeddingCacheConfig cacheConfig;
    cacheConfig.maxEntries = settings.embeddingCacheEntries;
    cacheConfig.ttlSeconds = settings.embeddingCacheTtlSeconds;

    im::InterestMappingEngine engine(settings,
                                     artifact.get(),
                                     im::OnnxEmbeddingProvider::createAll(&registry),
                                     std::make_unique<im::EmbeddingCache>(cacheConfig));
    QString initError;
    if (!engine.initialize(&initError) && artifact) {
        LOG_WARN(imCore, "Text analysis disabled: %s", qUtf8Printable(initError));
    }

    if (command == QStringLiteral("status")) {
        im::ModelStatus status = engine.modelStatus();
        if (!artifact && status.error.isEmpty()) {
            status.error = artifactError;
        }
        printJson(im::MappingJson::toJson(status));
        return kExitOk;
    }

    const QString catalogPath = parser.isSet(catalogOption) ? parser.value(catalogOption)
                                                            : defaultCatalogPath();

    if (command == QStringLiteral("areas")) {
        QString catalogError;
        const auto catalog = im::MappingJson::loadCatalog(catalogPath, &catalogError);
        if (!catalog.has_value()) {
            return fail(kExitInvalidInput, catalogError);
        }
        printJson(im::MappingJson::toJson(engine.availableAreas(catalog.value())));
        return kExitOk;
    }

    if (command == QStringLiteral("analyze-text")) {
        const QString text = positional.size() > 1 ? positional.mid(1).join(QLatin1Char(' '))
                                                   : parser.value(textOption);
        if (text.size() > im::MappingJson::kMaxFreeTextChars) {
            return fail(kExitInvalidInput, QStringLiteral("free text exceeds %1 characters")
                                               .arg(im::MappingJson::kMaxFreeTextChars));
        }
        if (!engine.modelStatus().textAnalysisAvailable) {
            return fail(kExitUnavailable, QStringLiteral("text analysis unavailable"));
        }
        // The catalog only orders ties; without one the label order decides.
        QString catalogError;
        const auto catalog = im::MappingJson::loadCatalog(catalogPath, &catalogError);
        if (!catalog.has_value()) {
            LOG_WARN(imCore, "Ranking without catalog: %s", qUtf8Printable(catalogError));
        }
        const std::vector<im::Question> order = catalog.value_or(std::vector<im::Question>());

        const im::ScoreMap scores = engine.analyzeText(text);
        printJson(im::MappingJson::textAnalysisToJson(scores, engine.rankAreas(scores, order),
                                                      engine.textQuality(text)));
        return kExitOk;
    }

    if (command == QStringLiteral("map")) {
        QString catalogError;
        const auto catalog = im::MappingJson::loadCatalog(catalogPath, &catalogError);
        if (!catalog.has_value()) {
            return fail(kExitInvalidInput, catalogError);
        }

        QString readError;
        const std::optional<QJsonObject> requestJson =
            readJsonObject(parser.value(requestOption), &readError);
        if (!requestJson.has_value()) {
            return fail(kExitInvalidInput, readError);
        }

        im::MappingError mappingError;
        std::optional<im::MappingRequest> request =
            im::MappingJson::parseRequest(requestJson.value(), &mappingError);
        if (request.has_value() && parser.isSet(textOption)) {
            const QString text = parser.value(textOption);
            if (text.size() > im::MappingJson::kMaxFreeTextChars) {
                return fail(kExitInvalidInput, QStringLiteral("free text exceeds %1 characters")
                                                   .arg(im::MappingJson::kMaxFreeTextChars));
            }
            request->freeText = text;
        }

        std::optional<im::MappingResult> result;
        if (request.has_value()) {
            result = engine.mapInterests(request->responses, catalog.value(), request->freeText,
                                         &mappingError);
        }
        if (!result.has_value()) {
            QJsonObject errorJson;
            errorJson[QStringLiteral("error")] = im::MappingJson::toJson(mappingError);
            printJson(errorJson);
            return kExitInvalidInput;
        }

        printJson(im::MappingJson::toJson(result.value()));
        return kExitOk;
    }

    return fail(kExitUsage, QStringLiteral("unknown command '%1'").arg(command));
}
