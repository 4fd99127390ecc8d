#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace im {

struct TokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int seqLength = 0;
};

// BERT-style uncased WordPiece: lower-case, strip accents, split on
// whitespace and punctuation, greedy longest-match subwords.
// Special token ids are looked up in the vocabulary so multilingual vocabs
// with a different layout work unchanged.
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength = 256);

    bool isLoaded() const;
    int maxSequenceLength() const { return m_maxSequenceLength; }

    // [CLS] tokens [SEP], truncated to maxSequenceLength. No padding.
    TokenizerOutput tokenize(const QString& text) const;

    // Token id for a vocabulary entry, or the [UNK] id.
    int64_t tokenId(const QString& token) const;

private:
    QString normalize(const QString& text) const;
    QStringList basicSplit(const QString& normalizedText) const;
    void appendWordPieces(const QString& word, int maxContentTokens,
                          std::vector<int64_t>* output) const;

    std::unordered_map<std::string, int> m_vocab;
    int m_maxSequenceLength = 256;
    int64_t m_unkId = 100;
    int64_t m_clsId = 101;
    int64_t m_sepId = 102;
    bool m_loaded = false;
};

} // namespace im
