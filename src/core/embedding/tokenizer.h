#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace nv {

struct TokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int seqLength = 0;
};

// Row-major [batchSize x seqLength] tensors, padded to the longest row.
struct BatchTokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;
};

// WordPieceTokenizer -- BERT-style uncased tokenizer over a vocab.txt
// (one token per line, line number is the id).
class WordPieceTokenizer {
public:
    static constexpr int kPadTokenId = 0;
    static constexpr int kUnkTokenId = 100;
    static constexpr int kClsTokenId = 101;
    static constexpr int kSepTokenId = 102;
    static constexpr int kMaxSequenceLength = 512;

    explicit WordPieceTokenizer(const QString& vocabPath);

    bool isLoaded() const;
    int vocabSize() const;

    TokenizerOutput tokenize(const QString& text, int padToLength = 0) const;
    BatchTokenizerOutput tokenizeBatch(const std::vector<QString>& texts) const;

private:
    static constexpr int kMaxContentTokens = kMaxSequenceLength - 2;

    QString normalize(const QString& text) const;
    std::vector<int64_t> wordPieces(const QString& normalizedText) const;
    void appendWordPieces(const QString& word, std::vector<int64_t>* output) const;

    std::unordered_map<std::string, int> m_vocab;
    bool m_loaded = false;
};

} // namespace nv
