#pragma once

#include "core/indexing/image_indexer.h"
#include "core/jobs/job_tracker.h"
#include "core/query/search_engine.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/store/image_catalog.h"
#include "core/tags/tag_manager.h"
#include "core/vector/embedding_store.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace vl {

class EmbeddingProvider;

// ImageLibrary -- transport-neutral entry point wiring the catalog, tags,
// embedding store, indexer, job tracker and search engine together.
//
// Everything returned is plain data; a transport layer (HTTP, CLI, IPC)
// converts it with the *ToJson helpers. The embedding provider is optional
// and must outlive the library; without one, search is tag-only.
class ImageLibrary {
public:
    explicit ImageLibrary(const Settings& settings, EmbeddingProvider* embeddings = nullptr);
    ~ImageLibrary();

    ImageLibrary(const ImageLibrary&) = delete;
    ImageLibrary& operator=(const ImageLibrary&) = delete;

    // Load the catalog and tag files and rebuild the embedding store.
    void open();

    // Stop running jobs and wait for their threads.
    void shutdown();

    QString submitIndexJob(const QString& path, const std::optional<QString>& tag = std::nullopt);
    std::optional<IndexJob> jobStatus(const QString& jobId) const;
    std::vector<IndexJob> jobs() const;

    // topK <= 0 uses Settings::defaultTopK.
    std::vector<SearchHit> search(const QString& query, int topK = 0) const;

    bool addTag(const QString& imageId, const QString& tagName);
    bool removeTag(const QString& imageId, const QString& tagName);

    // Removes the record and its vector.
    bool removeImage(const QString& imageId);

    std::vector<ImageRecord> images() const;
    std::optional<ImageRecord> image(const QString& imageId) const;
    std::vector<ImageRecord> imagesByTag(const QString& tagName) const;
    QStringList folders() const;
    std::vector<Tag> tags() const;

    // Record JSON with tag ids resolved to names under "tag_names".
    QJsonObject describe(const ImageRecord& record) const;
    QJsonObject describe(const SearchHit& hit) const;

    const Settings& settings() const { return m_settings; }
    bool hasSemanticSearch() const { return m_embeddings != nullptr; }

private:
    Settings m_settings;
    EmbeddingProvider* m_embeddings;

    ImageCatalog m_catalog;
    TagManager m_tags;
    EmbeddingStore m_store;
    ImageIndexer m_indexer;
    SearchEngine m_search;
    JobTracker m_jobs;
};

} // namespace vl
