#include "core/vector/embedding_store.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace vl {

namespace {

double l2Norm(const float* values, size_t count)
{
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(values[i]) * static_cast<double>(values[i]);
    }
    return std::sqrt(sum);
}

} // namespace

EmbeddingStore::EmbeddingStore(int dimensions)
    : m_configuredDimensions(std::max(dimensions, 0))
    , m_snapshot(std::make_shared<Snapshot>())
{
}

void EmbeddingStore::reset(std::vector<ImageRecord> records)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    publish(std::move(records));
}

void EmbeddingStore::add(const ImageRecord& record)
{
    addBatch({record});
}

void EmbeddingStore::addBatch(const std::vector<ImageRecord>& records)
{
    if (records.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    std::vector<ImageRecord> next = snapshot()->records;
    for (const ImageRecord& record : records) {
        auto it = std::find_if(next.begin(), next.end(), [&record](const ImageRecord& existing) {
            return existing.id == record.id;
        });
        if (it != next.end()) {
            *it = record;
        } else {
            next.push_back(record);
        }
    }
    publish(std::move(next));
}

bool EmbeddingStore::remove(const QString& id)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);
    std::vector<ImageRecord> next = snapshot()->records;
    const auto before = next.size();
    next.erase(std::remove_if(next.begin(), next.end(), [&id](const ImageRecord& record) {
                   return record.id == id;
               }),
               next.end());
    if (next.size() == before) {
        return false;
    }
    publish(std::move(next));
    return true;
}

std::vector<ScoredImage> EmbeddingStore::search(const std::vector<float>& queryVector,
                                                int topK) const
{
    std::vector<ScoredImage> results;
    const std::shared_ptr<const Snapshot> current = snapshot();
    if (topK <= 0 || current->rowRecords.empty() || queryVector.empty()) {
        return results;
    }

    const size_t dims = static_cast<size_t>(current->dimensions);
    if (queryVector.size() != dims) {
        LOG_WARN(vlSearch, "Query dimension %d does not match store dimension %d",
                 static_cast<int>(queryVector.size()), current->dimensions);
        return results;
    }

    const double queryNorm = l2Norm(queryVector.data(), dims);
    if (queryNorm <= 0.0) {
        LOG_WARN(vlSearch, "Zero query vector, no semantic results");
        return results;
    }

    const size_t rows = current->rowRecords.size();
    std::vector<double> scores(rows, 0.0);
    for (size_t row = 0; row < rows; ++row) {
        const float* rowData = current->matrix.data() + row * dims;
        // Rows are stored unit length; renormalize to absorb drift.
        const double rowNorm = l2Norm(rowData, dims);
        double dot = 0.0;
        for (size_t i = 0; i < dims; ++i) {
            dot += static_cast<double>(rowData[i]) * static_cast<double>(queryVector[i]);
        }
        scores[row] = rowNorm > 0.0 ? dot / (rowNorm * queryNorm) : 0.0;
    }

    std::vector<size_t> order(rows);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&scores](size_t lhs, size_t rhs) {
        return scores[lhs] > scores[rhs];
    });

    const size_t limit = std::min(rows, static_cast<size_t>(topK));
    results.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        const size_t row = order[i];
        ScoredImage hit;
        hit.record = current->records[current->rowRecords[row]];
        hit.score = static_cast<float>(std::clamp(scores[row], -1.0, 1.0));
        results.push_back(std::move(hit));
    }
    return results;
}

int EmbeddingStore::recordCount() const
{
    return static_cast<int>(snapshot()->records.size());
}

int EmbeddingStore::embeddedCount() const
{
    return static_cast<int>(snapshot()->rowRecords.size());
}

int EmbeddingStore::dimensions() const
{
    const int current = snapshot()->dimensions;
    return current > 0 ? current : m_configuredDimensions;
}

QStringList EmbeddingStore::embeddedIds() const
{
    const std::shared_ptr<const Snapshot> current = snapshot();
    QStringList ids;
    ids.reserve(static_cast<int>(current->rowRecords.size()));
    for (size_t index : current->rowRecords) {
        ids.append(current->records[index].id);
    }
    return ids;
}

std::shared_ptr<const EmbeddingStore::Snapshot> EmbeddingStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_snapshot;
}

void EmbeddingStore::publish(std::vector<ImageRecord> records)
{
    std::shared_ptr<const Snapshot> next = buildSnapshot(std::move(records));
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    m_snapshot = std::move(next);
}

std::shared_ptr<const EmbeddingStore::Snapshot> EmbeddingStore::buildSnapshot(
    std::vector<ImageRecord> records) const
{
    auto next = std::make_shared<Snapshot>();
    next->records = std::move(records);
    next->dimensions = m_configuredDimensions;

    if (next->dimensions == 0) {
        for (const ImageRecord& record : next->records) {
            if (record.hasEmbedding()) {
                next->dimensions = static_cast<int>(record.embedding.size());
                break;
            }
        }
    }

    const size_t dims = static_cast<size_t>(next->dimensions);
    int skipped = 0;
    for (size_t index = 0; index < next->records.size(); ++index) {
        const ImageRecord& record = next->records[index];
        if (!record.hasEmbedding()) {
            continue;
        }
        if (record.embedding.size() != dims) {
            ++skipped;
            continue;
        }
        const double norm = l2Norm(record.embedding.data(), dims);
        if (norm <= 0.0) {
            ++skipped;
            continue;
        }
        for (float value : record.embedding) {
            next->matrix.push_back(static_cast<float>(static_cast<double>(value) / norm));
        }
        next->rowRecords.push_back(index);
    }

    if (skipped > 0) {
        LOG_WARN(vlSearch, "Excluded %d vectors with dimension other than %d or zero norm",
                 skipped, next->dimensions);
    }
    LOG_DEBUG(vlSearch, "Embedding matrix rebuilt: %d rows of %d",
              static_cast<int>(next->rowRecords.size()), next->dimensions);
    return next;
}

} // namespace vl
