#pragma once

#include "core/embedding/embedding_function.h"

#include <memory>
#include <string>
#include <vector>

namespace nv {

class WordPieceTokenizer;

// OnnxEmbeddingFunction -- sentence embeddings from a BERT-style ONNX
// encoder. A 2-D output is taken as already pooled; a 3-D hidden state
// is pooled by its [CLS] row. Vectors are L2-normalized.
class OnnxEmbeddingFunction : public EmbeddingFunction {
public:
    OnnxEmbeddingFunction(const QString& modelId, const QString& sourceField);
    ~OnnxEmbeddingFunction() override;

    OnnxEmbeddingFunction(const OnnxEmbeddingFunction&) = delete;
    OnnxEmbeddingFunction& operator=(const OnnxEmbeddingFunction&) = delete;

    // Loads the session and vocab, then probes the output dimensionality.
    bool initialize(const QString& modelPath, const QString& vocabPath);
    bool isAvailable() const;

    QString modelId() const override;
    QString sourceField() const override;
    int dimensions() const override;

    std::vector<float> embed(const QString& text) override;
    std::vector<std::vector<float>> embedBatch(const std::vector<QString>& texts) override;

private:
    std::vector<std::vector<float>> runInference(const std::vector<QString>& texts);

    class Impl;
    std::unique_ptr<Impl> m_impl;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;

    QString m_modelId;
    QString m_sourceField;
    int m_dimensions = 0;
    bool m_available = false;
};

} // namespace nv
