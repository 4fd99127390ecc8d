#include "core/text/text_feature_extractor.h"
#include "core/models/model_artifact.h"
#include "core/text/text_preprocessor.h"

#include <QSet>

#include <algorithm>
#include <map>

namespace im {

namespace {

constexpr double kWholeWordMultiplier = 1.5;
constexpr int kLongWordLength = 6;

} // namespace

TextFeatureExtractor::TextFeatureExtractor(const ModelArtifact& artifact)
    : m_artifact(artifact)
{
}

int TextFeatureExtractor::manualFeatureCount(int areaCount)
{
    return areaCount * (kFeaturesPerArea + 1) + kLinguisticFeatureCount;
}

std::vector<double> TextFeatureExtractor::manualFeatures(const QString& processedText) const
{
    const QString textLower = processedText.toLower();
    const QStringList words = TextPreprocessor::words(textLower);
    const QSet<QString> wordSet(words.begin(), words.end());
    const double wordCount = static_cast<double>(words.size());
    const double wordDenominator = std::max(wordCount, 1.0);

    const KeywordTable& keywords = m_artifact.keywordWeights();
    const QStringList& areas = m_artifact.areaOrder();

    std::map<QString, double> areaScores;
    std::map<QString, int> matchCounts;
    for (const auto& [term, areaWeights] : keywords) {
        if (term.isEmpty() || !textLower.contains(term)) {
            continue;
        }
        const bool wholeWord = wordSet.contains(term);
        for (const auto& [area, weight] : areaWeights) {
            if (wholeWord) {
                areaScores[area] += weight * kWholeWordMultiplier;
                matchCounts[area] += 1;
            } else {
                areaScores[area] += weight;
            }
        }
    }

    std::vector<double> features;
    features.reserve(static_cast<size_t>(manualFeatureCount(static_cast<int>(areas.size()))));

    const VocabularyTable& vocabulary = m_artifact.categoryVocabulary();
    for (const QString& area : areas) {
        const auto scoreIt = areaScores.find(area);
        const auto matchIt = matchCounts.find(area);
        const auto vocabIt = vocabulary.find(area);
        const double score = (scoreIt != areaScores.end()) ? scoreIt->second : 0.0;
        const double matches = (matchIt != matchCounts.end()) ? matchIt->second : 0.0;
        const double vocabSize = (vocabIt != vocabulary.end()) ? vocabIt->second.size() : 0.0;

        features.push_back(score);
        features.push_back(matches);
        features.push_back(score / std::max(vocabSize, 1.0));
        features.push_back(matches / wordDenominator);
    }

    const double charCount = static_cast<double>(processedText.size());
    const double longWords = static_cast<double>(std::count_if(
        words.begin(), words.end(),
        [](const QString& word) { return word.size() > kLongWordLength; }));
    const double exclamations = static_cast<double>(processedText.count(QLatin1Char('!'))
                                                    + processedText.count(QLatin1Char('?')));
    const double commas = static_cast<double>(processedText.count(QLatin1Char(',')));
    const double diversity = static_cast<double>(wordSet.size()) / wordDenominator;
    const double uppercase = static_cast<double>(std::count_if(
        processedText.begin(), processedText.end(),
        [](QChar ch) { return ch.isUpper(); }));
    const double keywordWords = static_cast<double>(std::count_if(
        words.begin(), words.end(),
        [&keywords](const QString& word) { return keywords.count(word) > 0; }));

    features.push_back(wordCount);
    features.push_back(charCount);
    features.push_back(longWords);
    features.push_back(exclamations);
    features.push_back(commas);
    features.push_back(diversity);
    features.push_back(uppercase / std::max(charCount, 1.0));
    features.push_back(keywordWords / wordDenominator);

    const PatternTable& patterns = m_artifact.categoryPatterns();
    for (const QString& area : areas) {
        int matched = 0;
        const auto patternIt = patterns.find(area);
        if (patternIt != patterns.end()) {
            for (const QRegularExpression& pattern : patternIt->second) {
                if (pattern.match(textLower).hasMatch()) {
                    ++matched;
                }
            }
        }
        features.push_back(static_cast<double>(matched));
    }

    return features;
}

std::vector<double> TextFeatureExtractor::buildFeatureVector(
    const QString& processedText, const std::vector<float>& embedding) const
{
    const std::vector<double> manual = manualFeatures(processedText);

    std::vector<double> features;
    features.reserve(embedding.size() + manual.size());
    for (const float value : embedding) {
        features.push_back(static_cast<double>(value));
    }
    features.insert(features.end(), manual.begin(), manual.end());
    return features;
}

} // namespace im
