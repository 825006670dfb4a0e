#include "core/embedding/embedding_function.h"
#include "core/embedding/onnx_embedding_function.h"
#include "core/shared/logging.h"

#include <QDir>

namespace nv {

std::vector<std::vector<float>> EmbeddingFunction::embedBatch(const std::vector<QString>& texts)
{
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());
    for (const QString& text : texts) {
        std::vector<float> embedding = embed(text);
        if (embedding.empty()) {
            return {};
        }
        embeddings.push_back(std::move(embedding));
    }
    return embeddings;
}

QString modelDirectoryFor(const QString& modelsDir, const QString& modelId)
{
    QString folder = modelId;
    folder.replace(QLatin1Char('/'), QStringLiteral("__"));
    return QDir(modelsDir).filePath(folder);
}

std::unique_ptr<EmbeddingFunction> createEmbeddingFunction(const QString& modelId,
                                                           const QString& targetField,
                                                           const QString& modelsDir)
{
    if (modelId.isEmpty() || targetField.isEmpty()) {
        LOG_WARN(nvEmbedding, "createEmbeddingFunction: model id and target field are required");
        return nullptr;
    }

    const QDir modelDir(modelDirectoryFor(modelsDir, modelId));
    auto function = std::make_unique<OnnxEmbeddingFunction>(modelId, targetField);
    if (!function->initialize(modelDir.filePath(QStringLiteral("model.onnx")),
                              modelDir.filePath(QStringLiteral("vocab.txt")))) {
        LOG_WARN(nvEmbedding, "createEmbeddingFunction: '%s' unavailable under %s",
                 qUtf8Printable(modelId), qUtf8Printable(modelDir.path()));
        return nullptr;
    }

    LOG_INFO(nvEmbedding, "Embedding function ready: %s (%d dims) bound to '%s'",
             qUtf8Printable(modelId), function->dimensions(), qUtf8Printable(targetField));
    return function;
}

} // namespace nv
