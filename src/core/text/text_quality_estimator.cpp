#include "core/text/text_quality_estimator.h"

#include <QSet>
#include <QStringList>

#include <algorithm>

namespace im {

TextQualityEstimator::TextQualityEstimator(const KeywordTable* keywords,
                                           const TextQualityConfig& config)
    : m_keywords(keywords)
    , m_config(config)
{
}

double TextQualityEstimator::lengthFactor(int wordCount) const
{
    if (wordCount < m_config.shortWordLimit) {
        return m_config.shortScore;
    }
    if (wordCount < m_config.mediumWordLimit) {
        return m_config.mediumScore;
    }
    if (wordCount <= m_config.longWordLimit) {
        return m_config.idealScore;
    }
    return m_config.longScore;
}

double TextQualityEstimator::estimate(const QString& text) const
{
    const QStringList words = text.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return 0.0;
    }

    const int wordCount = static_cast<int>(words.size());
    const QSet<QString> unique(words.begin(), words.end());

    const double length = lengthFactor(wordCount);
    const double diversity = std::min(2.0 * unique.size() / wordCount, 1.0);

    int keywordWords = 0;
    if (m_keywords) {
        for (const QString& word : words) {
            if (m_keywords->count(word.toLower()) > 0) {
                ++keywordWords;
            }
        }
    }
    const double density = std::min(
        static_cast<double>(keywordWords) / wordCount * m_config.keywordDensityScale, 1.0);

    static const QString kPunctuation = QStringLiteral(".,!?;:");
    const bool hasPunctuation = std::any_of(text.begin(), text.end(), [](QChar ch) {
        return kPunctuation.contains(ch);
    });
    const double structure = hasPunctuation ? 1.0 : m_config.missingPunctuationScore;

    return (length + diversity + density + structure) / 4.0;
}

} // namespace im
