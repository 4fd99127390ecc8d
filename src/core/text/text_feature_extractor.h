#pragma once

#include <QString>

#include <vector>

namespace im {

class ModelArtifact;

// Builds the fixed-order numeric feature vector the artifact's scaler and
// classifier were trained on:
//
//   [embedding] ++ [per-area 4-tuples] ++ [8 linguistic] ++ [per-area pattern counts]
//
// Per-area blocks follow ModelArtifact::areaOrder(). Each 4-tuple is
// (keyword score, whole-word matches, score / vocabulary size,
// matches / word count). The linguistic block is (word count, character
// count, words longer than 6 characters, '!' + '?' count, ',' count,
// lexical diversity, uppercase character fraction, keyword word fraction).
class TextFeatureExtractor {
public:
    static constexpr int kFeaturesPerArea = 4;
    static constexpr int kLinguisticFeatureCount = 8;

    // The artifact must outlive the extractor.
    explicit TextFeatureExtractor(const ModelArtifact& artifact);

    // Everything after the embedding block, for already processed text.
    std::vector<double> manualFeatures(const QString& processedText) const;

    // The only place the full concatenation is assembled.
    std::vector<double> buildFeatureVector(const QString& processedText,
                                           const std::vector<float>& embedding) const;

    // Length of manualFeatures() for an artifact with `areaCount` areas.
    static int manualFeatureCount(int areaCount);

private:
    const ModelArtifact& m_artifact;
};

} // namespace im
