#include "core/text/text_preprocessor.h"

#include <QRegularExpression>
#include <QStringList>

namespace im {

namespace {

struct CompiledExpansion {
    QRegularExpression pattern;
    QString replacement;
};

const std::vector<CompiledExpansion>& compiledExpansions()
{
    static const std::vector<CompiledExpansion> compiled = [] {
        std::vector<CompiledExpansion> out;
        const auto& table = TextPreprocessor::expansionTable();
        out.reserve(table.size());
        for (const auto& [abbreviation, expansion] : table) {
            out.push_back({QRegularExpression(
                               QStringLiteral("\\b%1\\b")
                                   .arg(QRegularExpression::escape(abbreviation)),
                               QRegularExpression::UseUnicodePropertiesOption),
                           expansion});
        }
        return out;
    }();
    return compiled;
}

} // namespace

const std::vector<std::pair<QString, QString>>& TextPreprocessor::expansionTable()
{
    static const std::vector<std::pair<QString, QString>> table = {
        // Basic abbreviations
        {QStringLiteral("tb"), QStringLiteral("também")},
        {QStringLiteral("tbm"), QStringLiteral("também")},
        {QStringLiteral("tmb"), QStringLiteral("também")},
        {QStringLiteral("pq"), QStringLiteral("porque")},
        {QStringLiteral("pqp"), QStringLiteral("porque")},
        {QStringLiteral("pk"), QStringLiteral("porque")},
        {QStringLiteral("vc"), QStringLiteral("você")},
        {QStringLiteral("vcs"), QStringLiteral("vocês")},
        {QStringLiteral("cê"), QStringLiteral("você")},
        {QStringLiteral("mt"), QStringLiteral("muito")},
        {QStringLiteral("mto"), QStringLiteral("muito")},
        {QStringLiteral("mts"), QStringLiteral("muitos")},
        {QStringLiteral("q"), QStringLiteral("que")},
        {QStringLiteral("qq"), QStringLiteral("qualquer")},
        {QStringLiteral("qqr"), QStringLiteral("qualquer")},
        {QStringLiteral("n"), QStringLiteral("não")},
        {QStringLiteral("ñ"), QStringLiteral("não")},
        {QStringLiteral("nn"), QStringLiteral("não não")},
        {QStringLiteral("ta"), QStringLiteral("está")},
        {QStringLiteral("tá"), QStringLiteral("está")},
        {QStringLiteral("tão"), QStringLiteral("estão")},
        {QStringLiteral("to"), QStringLiteral("estou")},
        {QStringLiteral("tô"), QStringLiteral("estou")},
        {QStringLiteral("tou"), QStringLiteral("estou")},

        // Slang
        {QStringLiteral("top"), QStringLiteral("ótimo")},
        {QStringLiteral("show"), QStringLiteral("ótimo")},
        {QStringLiteral("massa"), QStringLiteral("legal")},
        {QStringLiteral("daora"), QStringLiteral("legal")},
        {QStringLiteral("maneiro"), QStringLiteral("legal")},
        {QStringLiteral("irado"), QStringLiteral("legal")},
        {QStringLiteral("suave"), QStringLiteral("tranquilo")},
        {QStringLiteral("deboa"), QStringLiteral("tranquilo")},
        {QStringLiteral("blz"), QStringLiteral("beleza")},
        {QStringLiteral("fmz"), QStringLiteral("firmeza")},

        // Expressions
        {QStringLiteral("tmj"), QStringLiteral("estamos juntos")},
        {QStringLiteral("vlw"), QStringLiteral("valeu")},
        {QStringLiteral("flw"), QStringLiteral("falou")},
        {QStringLiteral("pdp"), QStringLiteral("pode pá")},
        {QStringLiteral("pprt"), QStringLiteral("papo reto")},
        {QStringLiteral("plmdds"), QStringLiteral("pelo amor de deus")},
        {QStringLiteral("pdc"), QStringLiteral("pode crer")},
        {QStringLiteral("tlgd"), QStringLiteral("tá ligado")},
        {QStringLiteral("mec"), QStringLiteral("mano")},
        {QStringLiteral("mlk"), QStringLiteral("moleque")},
        {QStringLiteral("ctz"), QStringLiteral("certeza")},
        {QStringLiteral("ctza"), QStringLiteral("certeza")},
    };
    return table;
}

QString TextPreprocessor::process(const QString& raw)
{
    if (raw.isEmpty()) {
        return QString();
    }

    QString text = raw.toLower();
    for (const CompiledExpansion& expansion : compiledExpansions()) {
        text.replace(expansion.pattern, expansion.replacement);
    }

    QString cleaned;
    cleaned.reserve(text.size());
    bool pendingSpace = false;
    for (const QChar ch : text) {
        const bool keep = ch.isLetterOrNumber() || ch == QLatin1Char('-');
        if (!keep) {
            // Punctuation, symbols and whitespace all collapse to one separator.
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !cleaned.isEmpty()) {
            cleaned.append(QLatin1Char(' '));
        }
        pendingSpace = false;
        cleaned.append(ch);
    }
    return cleaned;
}

QStringList TextPreprocessor::words(const QString& processedText)
{
    return processedText.split(QLatin1Char(' '), Qt::SkipEmptyParts);
}

} // namespace im
