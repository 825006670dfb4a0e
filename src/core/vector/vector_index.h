#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace nv {

// VectorIndex -- in-memory HNSW over L2-normalized vectors (inner product).
// Labels are supplied by the caller (the owning table uses row ids), so the
// index can be rebuilt from persisted rows at any time.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    explicit VectorIndex(int dimensions);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool create(int initialCapacity = kInitialCapacity);

    bool addVector(uint64_t label, const float* embedding);
    bool deleteVector(uint64_t label);

    // Nearest first. When allowedLabels is given, only those labels are
    // eligible.
    std::vector<KnnResult> search(const float* queryVector, int k,
                                  const std::unordered_set<uint64_t>* allowedLabels = nullptr);

    int totalElements() const;
    int deletedElements() const;
    bool isAvailable() const;
    int dimensions() const;

private:
    bool ensureCapacityForOneMore();

    int m_dimensions = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    int m_deletedCount = 0;
    mutable std::mutex m_writeMutex;
};

} // namespace nv
