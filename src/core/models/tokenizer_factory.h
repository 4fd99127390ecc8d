#pragma once

#include "core/embedding/tokenizer.h"
#include "core/models/model_manifest.h"

#include <QString>

#include <memory>

namespace im {

class TokenizerFactory {
public:
    // Only "wordpiece" is supported. Returns nullptr for other types or a
    // missing/empty vocab file.
    static std::unique_ptr<WordPieceTokenizer> create(const ModelManifestEntry& entry,
                                                      const QString& modelsDir);
};

} // namespace im
