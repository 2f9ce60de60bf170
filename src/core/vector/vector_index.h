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

namespace dq {

// In-memory HNSW index over unit-length embeddings, labelled by chunk id.
// Inner-product distance on normalized vectors is cosine distance, so
// 1 - distance is cosine similarity.
class VectorIndex {
public:
    struct KnnResult {
        int64_t label = 0;
        float distance = 0.0f;
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 10000;

    explicit VectorIndex(int dimensions);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool create(int initialCapacity = kInitialCapacity);

    // Adds or replaces the vector stored under label.
    bool addVector(int64_t label, const std::vector<float>& embedding);
    bool deleteVector(int64_t label);

    // Nearest neighbours by ascending distance. When allowedLabels is
    // non-null only those labels are considered.
    std::vector<KnnResult> search(const std::vector<float>& queryVector, int k,
                                  const std::unordered_set<int64_t>* allowedLabels = nullptr);

    int totalElements() const;
    int deletedElements() const;
    bool isAvailable() const;
    int dimensions() const { return m_dimensions; }

private:
    bool ensureCapacityForOneMore();

    int m_dimensions = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    std::unordered_set<int64_t> m_deletedLabels;
    mutable std::mutex m_writeMutex;
};

} // namespace dq
