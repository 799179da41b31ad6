#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <mutex>
#include <vector>

namespace vl {

struct ScoredImage {
    ImageRecord record;
    float score = 0.0f;
};

// EmbeddingStore -- exact cosine-similarity search over catalogued vectors.
//
// Holds the record set plus a dense matrix of unit rows and a parallel row
// to record mapping. Records without an embedding, with a foreign
// dimension, or with a zero vector are not part of the matrix.
//
// Every mutation rebuilds the matrix from the full record set (O(n) per
// write) and publishes it as an immutable snapshot; searches work on the
// snapshot they grabbed and never wait for a rebuild.
class EmbeddingStore {
public:
    // dimensions == 0 adopts the size of the first embedded record.
    explicit EmbeddingStore(int dimensions = 0);

    EmbeddingStore(const EmbeddingStore&) = delete;
    EmbeddingStore& operator=(const EmbeddingStore&) = delete;

    void reset(std::vector<ImageRecord> records);

    // Appends the record; a record whose id is already present is replaced
    // in place.
    void add(const ImageRecord& record);
    void addBatch(const std::vector<ImageRecord>& records);

    bool remove(const QString& id);

    // Top-k rows by cosine similarity, strictly descending, ties in
    // catalog order. Empty for an empty store, k <= 0, a zero query or a
    // query of the wrong dimension.
    std::vector<ScoredImage> search(const std::vector<float>& queryVector, int topK) const;

    int recordCount() const;
    int embeddedCount() const;
    int dimensions() const;
    QStringList embeddedIds() const;

private:
    struct Snapshot {
        std::vector<ImageRecord> records;
        int dimensions = 0;
        std::vector<float> matrix;       // row-major, unit rows
        std::vector<size_t> rowRecords;  // row -> index into records
    };

    std::shared_ptr<const Snapshot> snapshot() const;
    void publish(std::vector<ImageRecord> records);
    std::shared_ptr<const Snapshot> buildSnapshot(std::vector<ImageRecord> records) const;

    const int m_configuredDimensions;
    std::mutex m_writeMutex;
    mutable std::mutex m_snapshotMutex;
    std::shared_ptr<const Snapshot> m_snapshot;
};

} // namespace vl
