#include "core/embedding/onnx_embedding_function.h"
#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <onnxruntime_cxx_api.h>

#include <QFile>

#include <cmath>

namespace nv {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "notevault-embedding");
    return env;
}

std::vector<float> normalizeEmbedding(std::vector<float> embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return embedding;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return embedding;
}

} // namespace

class OnnxEmbeddingFunction::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> inputNames;
    std::string outputName;
};

OnnxEmbeddingFunction::OnnxEmbeddingFunction(const QString& modelId, const QString& sourceField)
    : m_impl(std::make_unique<Impl>())
    , m_modelId(modelId)
    , m_sourceField(sourceField)
{
}

OnnxEmbeddingFunction::~OnnxEmbeddingFunction() = default;

bool OnnxEmbeddingFunction::initialize(const QString& modelPath, const QString& vocabPath)
{
    m_available = false;

    if (!QFile::exists(modelPath)) {
        LOG_WARN(nvEmbedding, "Model file missing: %s", qUtf8Printable(modelPath));
        return false;
    }

    m_tokenizer = std::make_unique<WordPieceTokenizer>(vocabPath);
    if (!m_tokenizer->isLoaded()) {
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(2);
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        m_impl->inputNames.clear();
        for (size_t i = 0; i < m_impl->session->GetInputCount(); ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetInputNameAllocated(i, allocator);
            if (name.get() != nullptr) {
                m_impl->inputNames.emplace_back(name.get());
            }
        }
        for (const std::string& name : m_impl->inputNames) {
            if (name != "input_ids" && name != "attention_mask" && name != "token_type_ids") {
                LOG_WARN(nvEmbedding, "Unsupported model input '%s'", name.c_str());
                m_impl->session.reset();
                return false;
            }
        }

        // First output unless the export carries a pooled sentence embedding.
        const size_t outputCount = m_impl->session->GetOutputCount();
        for (size_t i = 0; i < outputCount; ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetOutputNameAllocated(i, allocator);
            if (name.get() == nullptr) {
                continue;
            }
            const std::string outputName(name.get());
            if (m_impl->outputName.empty() || outputName == "sentence_embedding") {
                m_impl->outputName = outputName;
            }
        }
        if (m_impl->outputName.empty()) {
            LOG_WARN(nvEmbedding, "Model exposes no outputs: %s", qUtf8Printable(modelPath));
            m_impl->session.reset();
            return false;
        }
    } catch (const Ort::Exception& ex) {
        LOG_WARN(nvEmbedding, "ONNX session creation failed: %s", ex.what());
        m_impl->session.reset();
        return false;
    }

    const std::vector<std::vector<float>> probe = runInference({QStringLiteral("probe")});
    if (probe.size() != 1 || probe.front().empty()) {
        LOG_WARN(nvEmbedding, "Embedding probe failed for %s", qUtf8Printable(m_modelId));
        m_impl->session.reset();
        return false;
    }

    m_dimensions = static_cast<int>(probe.front().size());
    m_available = true;
    return true;
}

bool OnnxEmbeddingFunction::isAvailable() const
{
    return m_available;
}

QString OnnxEmbeddingFunction::modelId() const
{
    return m_modelId;
}

QString OnnxEmbeddingFunction::sourceField() const
{
    return m_sourceField;
}

int OnnxEmbeddingFunction::dimensions() const
{
    return m_dimensions;
}

std::vector<float> OnnxEmbeddingFunction::embed(const QString& text)
{
    std::vector<std::vector<float>> result = embedBatch({text});
    if (result.empty()) {
        return {};
    }
    return std::move(result.front());
}

std::vector<std::vector<float>> OnnxEmbeddingFunction::embedBatch(const std::vector<QString>& texts)
{
    if (!m_available || texts.empty()) {
        return {};
    }
    return runInference(texts);
}

std::vector<std::vector<float>> OnnxEmbeddingFunction::runInference(const std::vector<QString>& texts)
{
    if (!m_impl->session || !m_tokenizer) {
        return {};
    }

    BatchTokenizerOutput tokenized = m_tokenizer->tokenizeBatch(texts);
    if (tokenized.batchSize <= 0 || tokenized.seqLength <= 0) {
        return {};
    }

    const int64_t shape[2] = {
        static_cast<int64_t>(tokenized.batchSize),
        static_cast<int64_t>(tokenized.seqLength),
    };

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                OrtMemTypeDefault);

        std::vector<Ort::Value> inputs;
        std::vector<const char*> inputNames;
        inputs.reserve(m_impl->inputNames.size());
        inputNames.reserve(m_impl->inputNames.size());
        for (const std::string& name : m_impl->inputNames) {
            std::vector<int64_t>* tensor = &tokenized.inputIds;
            if (name == "attention_mask") {
                tensor = &tokenized.attentionMask;
            } else if (name == "token_type_ids") {
                tensor = &tokenized.tokenTypeIds;
            }
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo, tensor->data(), tensor->size(), shape, 2));
            inputNames.push_back(name.c_str());
        }

        const char* outputNames[1] = {m_impl->outputName.c_str()};
        std::vector<Ort::Value> outputs = m_impl->session->Run(
            Ort::RunOptions{nullptr},
            inputNames.data(),
            inputs.data(),
            inputs.size(),
            outputNames,
            1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(nvEmbedding, "Inference returned no tensor output");
            return {};
        }

        const std::vector<int64_t> outShape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        if (!data || outShape.empty() || outShape[0] != tokenized.batchSize) {
            LOG_WARN(nvEmbedding, "Inference returned an unexpected batch shape");
            return {};
        }

        // [batch, hidden] is already pooled; [batch, seq, hidden] takes the [CLS] row.
        int64_t hidden = 0;
        int64_t rowStride = 0;
        if (outShape.size() == 2) {
            hidden = outShape[1];
            rowStride = hidden;
        } else if (outShape.size() == 3 && outShape[1] >= 1) {
            hidden = outShape[2];
            rowStride = outShape[1] * outShape[2];
        } else {
            LOG_WARN(nvEmbedding, "Inference returned an unsupported output rank: %d",
                     static_cast<int>(outShape.size()));
            return {};
        }
        if (hidden <= 0 || (m_dimensions > 0 && hidden != m_dimensions)) {
            LOG_WARN(nvEmbedding, "Inference returned %lld dims, expected %d",
                     static_cast<long long>(hidden), m_dimensions);
            return {};
        }

        std::vector<std::vector<float>> embeddings;
        embeddings.reserve(static_cast<size_t>(tokenized.batchSize));
        for (int i = 0; i < tokenized.batchSize; ++i) {
            const float* row = data + static_cast<size_t>(i) * static_cast<size_t>(rowStride);
            embeddings.push_back(normalizeEmbedding(std::vector<float>(row, row + hidden)));
        }
        return embeddings;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(nvEmbedding, "Inference failed: %s", ex.what());
        return {};
    }
}

} // namespace nv
