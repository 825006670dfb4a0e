#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QRegularExpression>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>

namespace nv {

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath)
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(nvEmbedding, "Tokenizer vocab not readable: %s", qUtf8Printable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int id = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), id);
        }
        ++id;
    }

    if (m_vocab.empty()) {
        LOG_WARN(nvEmbedding, "Tokenizer vocab is empty: %s", qUtf8Printable(vocabPath));
        return;
    }

    m_loaded = true;
}

bool WordPieceTokenizer::isLoaded() const
{
    return m_loaded;
}

int WordPieceTokenizer::vocabSize() const
{
    return static_cast<int>(m_vocab.size());
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    QString stripped;
    stripped.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        const QChar::Category category = ch.category();
        if (category == QChar::Mark_NonSpacing
            || category == QChar::Mark_SpacingCombining
            || category == QChar::Mark_Enclosing) {
            continue;
        }
        // Punctuation becomes its own word.
        if (ch.isPunct()) {
            stripped.append(QLatin1Char(' '));
            stripped.append(ch);
            stripped.append(QLatin1Char(' '));
            continue;
        }
        stripped.append(ch);
    }

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    stripped.replace(whitespace, QStringLiteral(" "));
    return stripped.trimmed();
}

void WordPieceTokenizer::appendWordPieces(const QString& word, std::vector<int64_t>* output) const
{
    const int length = word.size();
    int start = 0;
    std::vector<int64_t> pieces;

    while (start < length) {
        int end = length;
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
            // A word with any unmatched remainder maps to a single [UNK].
            output->push_back(kUnkTokenId);
            return;
        }
        pieces.push_back(matchedId);
        start = end;
    }

    output->insert(output->end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::wordPieces(const QString& normalizedText) const
{
    std::vector<int64_t> content;
    if (normalizedText.isEmpty()) {
        return content;
    }

    const QStringList words = normalizedText.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        if (static_cast<int>(content.size()) >= kMaxContentTokens) {
            break;
        }
        appendWordPieces(word, &content);
    }

    if (static_cast<int>(content.size()) > kMaxContentTokens) {
        content.resize(kMaxContentTokens);
    }
    return content;
}

TokenizerOutput WordPieceTokenizer::tokenize(const QString& text, int padToLength) const
{
    TokenizerOutput output;
    if (!m_loaded) {
        return output;
    }

    const std::vector<int64_t> content = wordPieces(normalize(text));

    output.inputIds.reserve(content.size() + 2);
    output.inputIds.push_back(kClsTokenId);
    output.inputIds.insert(output.inputIds.end(), content.begin(), content.end());
    output.inputIds.push_back(kSepTokenId);

    const int realLength = static_cast<int>(output.inputIds.size());
    const int targetLength = std::max(realLength, std::min(padToLength, kMaxSequenceLength));

    output.inputIds.resize(static_cast<size_t>(targetLength), kPadTokenId);
    output.attentionMask.assign(static_cast<size_t>(targetLength), 0);
    std::fill_n(output.attentionMask.begin(), realLength, 1);
    output.tokenTypeIds.assign(static_cast<size_t>(targetLength), 0);
    output.seqLength = targetLength;
    return output;
}

BatchTokenizerOutput WordPieceTokenizer::tokenizeBatch(const std::vector<QString>& texts) const
{
    BatchTokenizerOutput batch;
    if (!m_loaded || texts.empty()) {
        return batch;
    }

    std::vector<TokenizerOutput> rows;
    rows.reserve(texts.size());
    int maxLength = 0;
    for (const QString& text : texts) {
        rows.push_back(tokenize(text));
        maxLength = std::max(maxLength, rows.back().seqLength);
    }

    batch.batchSize = static_cast<int>(rows.size());
    batch.seqLength = maxLength;
    const size_t total = static_cast<size_t>(batch.batchSize) * static_cast<size_t>(maxLength);
    batch.inputIds.reserve(total);
    batch.attentionMask.reserve(total);
    batch.tokenTypeIds.reserve(total);

    for (TokenizerOutput& row : rows) {
        row.inputIds.resize(static_cast<size_t>(maxLength), kPadTokenId);
        row.attentionMask.resize(static_cast<size_t>(maxLength), 0);
        row.tokenTypeIds.resize(static_cast<size_t>(maxLength), 0);

        batch.inputIds.insert(batch.inputIds.end(), row.inputIds.begin(), row.inputIds.end());
        batch.attentionMask.insert(batch.attentionMask.end(),
                                   row.attentionMask.begin(), row.attentionMask.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(),
                                  row.tokenTypeIds.begin(), row.tokenTypeIds.end());
    }

    return batch;
}

} // namespace nv
