#include "core/indexing/image_indexer.h"
#include "core/embedding/embedding_provider.h"
#include "core/extraction/metadata_extractor.h"
#include "core/shared/logging.h"
#include "core/store/image_catalog.h"
#include "core/vector/embedding_store.h"

#include <QElapsedTimer>
#include <QSet>
#include <QUuid>

#include <exception>

namespace vl {

ImageIndexer::ImageIndexer(ImageCatalog& catalog,
                           EmbeddingStore& store,
                           EmbeddingProvider* embeddings,
                           IndexerOptions options)
    : m_catalog(catalog)
    , m_store(store)
    , m_embeddings(embeddings)
    , m_options(options)
{
}

std::vector<ImageRecord> ImageIndexer::index(const QString& rootPath,
                                             const CancellationToken* cancel)
{
    QElapsedTimer timer;
    timer.start();

    std::vector<ImageRecord> added;
    std::vector<ImageRecord> pending;

    ScanStats stats;
    const QStringList candidates = m_scanner.scanDirectory(rootPath, cancel, &stats);
    QSet<QString> seen = m_catalog.knownPaths();

    int skippedKnown = 0;
    int failed = 0;
    for (const QString& path : candidates) {
        if (cancel && cancel->isCancelled()) {
            LOG_INFO(vlIndex, "Sweep of %s cancelled", qUtf8Printable(rootPath));
            break;
        }

        if (seen.contains(path)) {
            ++skippedKnown;
            continue;
        }
        seen.insert(path);

        std::optional<ImageRecord> record = MetadataExtractor::extract(path);
        if (!record) {
            ++failed;
            continue;
        }

        record->id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        attachEmbedding(*record);
        pending.push_back(std::move(*record));

        if (m_options.commitBatchSize > 0
            && static_cast<int>(pending.size()) >= m_options.commitBatchSize) {
            commit(pending, added);
        }
    }

    commit(pending, added);

    if (added.empty()) {
        LOG_INFO(vlIndex, "No new images found in %s", qUtf8Printable(rootPath));
    } else {
        LOG_INFO(vlIndex, "Indexed %d new images from %s in %lld ms "
                          "(%d already known, %d unreadable)",
                 static_cast<int>(added.size()), qUtf8Printable(rootPath),
                 static_cast<long long>(timer.elapsed()), skippedKnown, failed);
    }
    return added;
}

void ImageIndexer::commit(std::vector<ImageRecord>& pending, std::vector<ImageRecord>& added)
{
    if (pending.empty()) {
        return;
    }

    // Throws StoreError; records of this batch are then not persisted.
    std::vector<ImageRecord> committed = m_catalog.commitNew(pending);
    pending.clear();

    m_store.addBatch(committed);
    for (ImageRecord& record : committed) {
        added.push_back(std::move(record));
    }
}

void ImageIndexer::attachEmbedding(ImageRecord& record)
{
    if (!m_embeddings) {
        return;
    }

    std::vector<float> vector;
    try {
        vector = m_embeddings->imageEmbedding(record.path);
    } catch (const std::exception& e) {
        LOG_WARN(vlIndex, "Embedding failed for %s: %s",
                 qUtf8Printable(record.path), e.what());
        return;
    } catch (...) {
        LOG_WARN(vlIndex, "Embedding failed for %s with an unknown error",
                 qUtf8Printable(record.path));
        return;
    }

    if (vector.empty()) {
        LOG_WARN(vlIndex, "Embedding unavailable for %s", qUtf8Printable(record.path));
        return;
    }

    const int expected = m_store.dimensions();
    if (expected > 0 && static_cast<int>(vector.size()) != expected) {
        LOG_WARN(vlIndex, "Embedding for %s has dimension %d, expected %d",
                 qUtf8Printable(record.path), static_cast<int>(vector.size()), expected);
        return;
    }

    record.embedding = std::move(vector);
}

} // namespace vl
