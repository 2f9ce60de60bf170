#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <algorithm>

namespace dq {

namespace {

class AllowedLabelFilter : public hnswlib::BaseFilterFunctor {
public:
    explicit AllowedLabelFilter(const std::unordered_set<int64_t>& allowed)
        : m_allowed(allowed)
    {
    }

    bool operator()(hnswlib::labeltype label) override
    {
        return m_allowed.count(static_cast<int64_t>(label)) > 0;
    }

private:
    const std::unordered_set<int64_t>& m_allowed;
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
        LOG_ERROR(dqStore, "VectorIndex::create requires a positive dimension, got %d", m_dimensions);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(m_dimensions));
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_deletedLabels.clear();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(dqStore, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::addVector(int64_t label, const std::vector<float>& embedding)
{
    if (!m_index || label < 0) {
        LOG_WARN(dqStore, "VectorIndex::addVector called with unavailable index or bad label");
        return false;
    }
    if (static_cast<int>(embedding.size()) != m_dimensions) {
        LOG_WARN(dqStore, "VectorIndex::addVector dimension mismatch: %d, expected %d",
                 static_cast<int>(embedding.size()), m_dimensions);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (!ensureCapacityForOneMore()) {
        return false;
    }

    try {
        // addPoint on an existing label revives it if deleted and updates it
        m_index->addPoint(embedding.data(), static_cast<hnswlib::labeltype>(label));
        m_deletedLabels.erase(label);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(dqStore, "VectorIndex::addVector failed for label %lld: %s",
                  static_cast<long long>(label), e.what());
        return false;
    }
}

bool VectorIndex::deleteVector(int64_t label)
{
    if (!m_index) {
        LOG_WARN(dqStore, "VectorIndex::deleteVector called with unavailable index");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (m_deletedLabels.count(label) > 0) {
        return true;
    }
    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        m_deletedLabels.insert(label);
        return true;
    } catch (const std::exception& e) {
        // Unknown label: nothing was indexed for it
        LOG_DEBUG(dqStore, "VectorIndex::deleteVector label %lld: %s",
                  static_cast<long long>(label), e.what());
        return false;
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(
    const std::vector<float>& queryVector, int k,
    const std::unordered_set<int64_t>* allowedLabels)
{
    std::vector<KnnResult> results;
    if (!m_index || k <= 0 || static_cast<int>(queryVector.size()) != m_dimensions) {
        return results;
    }
    if (allowedLabels != nullptr && allowedLabels->empty()) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        m_index->setEf(static_cast<size_t>(std::max(kEfSearch, k)));

        std::unique_ptr<AllowedLabelFilter> filter;
        if (allowedLabels != nullptr) {
            filter = std::make_unique<AllowedLabelFilter>(*allowedLabels);
        }
        auto queue = m_index->searchKnn(queryVector.data(), static_cast<size_t>(k), filter.get());

        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<int64_t>(entry.second), entry.first});
        }
        std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            return a.distance < b.distance;
        });
        return results;
    } catch (const std::exception& e) {
        LOG_ERROR(dqStore, "VectorIndex::search failed: %s", e.what());
        return {};
    }
}

int VectorIndex::totalElements() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount());
}

int VectorIndex::deletedElements() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return static_cast<int>(m_deletedLabels.size());
}

bool VectorIndex::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_index != nullptr;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(dqStore, "VectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    if (newCapacity <= maxElements) {
        LOG_ERROR(dqStore, "VectorIndex resize overflow");
        return false;
    }

    try {
        m_index->resizeIndex(newCapacity);
        LOG_INFO(dqStore, "VectorIndex resized to capacity %llu",
                 static_cast<unsigned long long>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(dqStore, "VectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace dq
