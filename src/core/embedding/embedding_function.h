#pragma once

#include <QString>

#include <memory>
#include <vector>

namespace nv {

// EmbeddingFunction -- maps text to a fixed-length vector.
//
// Bound once per table to a single source field (always "content").
// embed() returns an empty vector on failure; embedBatch() returns an
// empty list unless every input was embedded.
class EmbeddingFunction {
public:
    virtual ~EmbeddingFunction() = default;

    virtual QString modelId() const = 0;
    virtual QString sourceField() const = 0;
    virtual int dimensions() const = 0;

    virtual std::vector<float> embed(const QString& text) = 0;
    virtual std::vector<std::vector<float>> embedBatch(const std::vector<QString>& texts);
};

// Resolve <modelsDir>/<modelId, '/' replaced by "__">/{model.onnx,vocab.txt}
// and build an ONNX-backed embedding function for targetField.
// Returns nullptr if the model cannot be loaded.
std::unique_ptr<EmbeddingFunction> createEmbeddingFunction(const QString& modelId,
                                                           const QString& targetField,
                                                           const QString& modelsDir);

QString modelDirectoryFor(const QString& modelsDir, const QString& modelId);

} // namespace nv
