#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <algorithm>

namespace nv {

namespace {

class AllowedLabelFilter : public hnswlib::BaseFilterFunctor {
public:
    explicit AllowedLabelFilter(const std::unordered_set<uint64_t>& allowed)
        : m_allowed(allowed)
    {
    }

    bool operator()(hnswlib::labeltype label) override
    {
        return m_allowed.count(static_cast<uint64_t>(label)) > 0;
    }

private:
    const std::unordered_set<uint64_t>& m_allowed;
};

} // namespace

VectorIndex::VectorIndex(int dimensions)
    : m_dimensions(dimensions)
{
}

VectorIndex::~VectorIndex() = default;

bool VectorIndex::create(int initialCapacity)
{
    if (m_dimensions <= 0) {
        LOG_ERROR(nvStore, "VectorIndex::create requires positive dimensions, got %d", m_dimensions);
        return false;
    }

    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(m_dimensions));
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_deletedCount = 0;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(nvStore, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::addVector(uint64_t label, const float* embedding)
{
    if (!m_index || embedding == nullptr) {
        LOG_WARN(nvStore, "VectorIndex::addVector called with unavailable index or null embedding");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (!ensureCapacityForOneMore()) {
        return false;
    }

    try {
        m_index->addPoint(embedding, static_cast<hnswlib::labeltype>(label));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(nvStore, "VectorIndex::addVector failed for label %llu: %s",
                  static_cast<unsigned long long>(label), e.what());
        return false;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    if (!m_index) {
        LOG_WARN(nvStore, "VectorIndex::deleteVector called with unavailable index");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        ++m_deletedCount;
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(nvStore, "VectorIndex::deleteVector failed for label %llu: %s",
                 static_cast<unsigned long long>(label), e.what());
        return false;
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(
    const float* queryVector, int k, const std::unordered_set<uint64_t>* allowedLabels)
{
    std::vector<KnnResult> results;
    if (!m_index || queryVector == nullptr || k <= 0) {
        return results;
    }
    if (allowedLabels && allowedLabels->empty()) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        m_index->setEf(static_cast<size_t>(std::max(kEfSearch, k)));
        static const std::unordered_set<uint64_t> kNoLabels;
        AllowedLabelFilter filter(allowedLabels ? *allowedLabels : kNoLabels);
        auto queue = m_index->searchKnn(queryVector, static_cast<size_t>(k),
                                        allowedLabels ? &filter : nullptr);
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            return a.distance < b.distance;
        });
        return results;
    } catch (const std::exception& e) {
        LOG_ERROR(nvStore, "VectorIndex::search failed: %s", e.what());
        return {};
    }
}

int VectorIndex::totalElements() const
{
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount());
}

int VectorIndex::deletedElements() const
{
    return m_deletedCount;
}

bool VectorIndex::isAvailable() const
{
    return m_index != nullptr;
}

int VectorIndex::dimensions() const
{
    return m_dimensions;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(nvStore, "VectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    try {
        m_index->resizeIndex(newCapacity);
        LOG_DEBUG(nvStore, "VectorIndex resized to capacity %llu",
                  static_cast<unsigned long long>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(nvStore, "VectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace nv
