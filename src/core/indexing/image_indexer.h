#pragma once

#include "core/fs/file_scanner.h"
#include "core/shared/cancellation.h"
#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace vl {

// Forward declarations to avoid pulling in heavy headers.
class EmbeddingProvider;
class EmbeddingStore;
class ImageCatalog;

struct IndexerOptions {
    // Persist after this many new records; 0 persists once after the walk.
    int commitBatchSize = 64;
};

// ImageIndexer -- incremental sweep of a directory tree into the catalog.
//
// For each allow-listed file under the root it:
//   1. Skips the file if its absolute path is already catalogued
//   2. Extracts metadata (MetadataExtractor); failures are logged and skipped
//   3. Assigns a fresh unique id
//   4. Asks the embedding provider for an image vector; on failure the
//      record is kept without one (tag-searchable, not semantically)
//   5. Commits new records to the catalog every commitBatchSize files and
//      mirrors them into the EmbeddingStore
//
// A storage failure aborts the sweep with StoreError; batches committed
// before it stay persisted. Cancellation stops the walk after committing
// what was already discovered.
class ImageIndexer {
public:
    ImageIndexer(ImageCatalog& catalog,
                 EmbeddingStore& store,
                 EmbeddingProvider* embeddings,
                 IndexerOptions options = {});

    // Returns only the records added by this sweep, in walk order.
    std::vector<ImageRecord> index(const QString& rootPath,
                                   const CancellationToken* cancel = nullptr);

private:
    void commit(std::vector<ImageRecord>& pending, std::vector<ImageRecord>& added);
    void attachEmbedding(ImageRecord& record);

    ImageCatalog& m_catalog;
    EmbeddingStore& m_store;
    EmbeddingProvider* m_embeddings;
    IndexerOptions m_options;
    FileScanner m_scanner;
};

} // namespace vl
