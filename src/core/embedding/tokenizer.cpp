#include "core/embedding/tokenizer.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QRegularExpression>
#include <QStringConverter>
#include <QStringList>
#include <QTextStream>

#include <algorithm>

namespace im {

namespace {

constexpr int kMaxCharsPerWord = 100;

} // namespace

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::max(maxSequenceLength, 3))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(imModel, "WordPieceTokenizer: failed to open vocab %s", qPrintable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }

    if (m_vocab.empty()) {
        LOG_WARN(imModel, "WordPieceTokenizer: empty vocab in %s", qPrintable(vocabPath));
        return;
    }

    const auto lookup = [this](const char* token, int64_t fallback) -> int64_t {
        const auto it = m_vocab.find(token);
        return it == m_vocab.end() ? fallback : it->second;
    };
    m_unkId = lookup("[UNK]", m_unkId);
    m_clsId = lookup("[CLS]", m_clsId);
    m_sepId = lookup("[SEP]", m_sepId);

    m_loaded = true;
}

bool WordPieceTokenizer::isLoaded() const
{
    return m_loaded;
}

int64_t WordPieceTokenizer::tokenId(const QString& token) const
{
    const auto it = m_vocab.find(token.toStdString());
    return it == m_vocab.end() ? m_unkId : it->second;
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    QString stripped;
    stripped.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        const QChar::Category category = ch.category();
        const bool isCombiningMark = category == QChar::Mark_NonSpacing
                                   || category == QChar::Mark_SpacingCombining
                                   || category == QChar::Mark_Enclosing;
        if (!isCombiningMark) {
            stripped.append(ch);
        }
    }

    static const QRegularExpression whitespaceRegex(QStringLiteral("\\s+"));
    stripped.replace(whitespaceRegex, QStringLiteral(" "));
    return stripped.trimmed();
}

// Punctuation becomes a token of its own.
QStringList WordPieceTokenizer::basicSplit(const QString& normalizedText) const
{
    QStringList words;
    QString current;
    for (const QChar ch : normalizedText) {
        if (ch.isSpace()) {
            if (!current.isEmpty()) {
                words.append(current);
                current.clear();
            }
        } else if (ch.isPunct() || ch.isSymbol()) {
            if (!current.isEmpty()) {
                words.append(current);
                current.clear();
            }
            words.append(QString(ch));
        } else {
            current.append(ch);
        }
    }
    if (!current.isEmpty()) {
        words.append(current);
    }
    return words;
}

void WordPieceTokenizer::appendWordPieces(const QString& word, int maxContentTokens,
                                          std::vector<int64_t>* output) const
{
    if (word.size() > kMaxCharsPerWord) {
        output->push_back(m_unkId);
        return;
    }

    // Whole word becomes [UNK] if any position has no matching piece.
    std::vector<int64_t> pieces;
    const int wordLength = static_cast<int>(word.size());
    int start = 0;
    while (start < wordLength) {
        int end = wordLength;
        int matchedId = -1;
        while (end > start) {
            QString piece = word.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }
            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matchedId = it->second;
                break;
            }
            --end;
        }

        if (matchedId < 0) {
            pieces.assign(1, m_unkId);
            break;
        }
        pieces.push_back(matchedId);
        start = end;
    }

    for (const int64_t id : pieces) {
        if (static_cast<int>(output->size()) >= maxContentTokens) {
            return;
        }
        output->push_back(id);
    }
}

TokenizerOutput WordPieceTokenizer::tokenize(const QString& text) const
{
    TokenizerOutput output;
    if (!m_loaded) {
        return output;
    }

    const int maxContentTokens = m_maxSequenceLength - 2;
    std::vector<int64_t> content;
    const QStringList words = basicSplit(normalize(text));
    for (const QString& word : words) {
        if (static_cast<int>(content.size()) >= maxContentTokens) {
            break;
        }
        appendWordPieces(word, maxContentTokens, &content);
    }

    output.inputIds.reserve(content.size() + 2);
    output.inputIds.push_back(m_clsId);
    output.inputIds.insert(output.inputIds.end(), content.begin(), content.end());
    output.inputIds.push_back(m_sepId);

    output.seqLength = static_cast<int>(output.inputIds.size());
    output.attentionMask.assign(output.inputIds.size(), 1);
    output.tokenTypeIds.assign(output.inputIds.size(), 0);
    return output;
}

} // namespace im
