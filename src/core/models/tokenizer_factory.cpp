#include "core/models/tokenizer_factory.h"

#include "core/shared/logging.h"

#include <QFile>

namespace im {

std::unique_ptr<WordPieceTokenizer> TokenizerFactory::create(const ModelManifestEntry& entry,
                                                              const QString& modelsDir)
{
    if (entry.tokenizer != QStringLiteral("wordpiece")) {
        LOG_WARN(imModel, "TokenizerFactory: unsupported tokenizer type '%s' for '%s'",
                 qPrintable(entry.tokenizer), qPrintable(entry.name));
        return nullptr;
    }

    if (entry.vocab.isEmpty()) {
        LOG_WARN(imModel, "TokenizerFactory: no vocab file specified for model '%s'",
                 qPrintable(entry.name));
        return nullptr;
    }

    const QString vocabPath = modelsDir + QStringLiteral("/") + entry.vocab;
    if (!QFile::exists(vocabPath)) {
        LOG_WARN(imModel, "TokenizerFactory: vocab file not found at %s", qPrintable(vocabPath));
        return nullptr;
    }

    auto tokenizer = std::make_unique<WordPieceTokenizer>(vocabPath, entry.maxSeqLength);
    if (!tokenizer->isLoaded()) {
        return nullptr;
    }

    return tokenizer;
}

} // namespace im
