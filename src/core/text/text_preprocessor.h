#pragma once

#include <QString>
#include <QStringList>

#include <utility>
#include <vector>

namespace im {

// Canonical text normalization shared by training and inference. The output
// of process() is what every downstream text feature is computed on, so the
// steps and the expansion table must not change without rebuilding the
// model artifact.
class TextPreprocessor {
public:
    // Lower-cases, expands chat abbreviations and slang on word boundaries,
    // replaces anything other than letters, digits, whitespace and hyphens
    // with a space, then collapses whitespace.
    static QString process(const QString& raw);

    // (abbreviation, expansion) pairs, applied in this order.
    static const std::vector<std::pair<QString, QString>>& expansionTable();

    // Splits processed text on single spaces.
    static QStringList words(const QString& processedText);
};

} // namespace im
