#include "core/library/image_library.h"
#include "core/embedding/embedding_provider.h"
#include "core/shared/logging.h"

#include <QJsonArray>

namespace vl {

namespace {

int storeDimensions(const Settings& settings, const EmbeddingProvider* embeddings)
{
    if (embeddings && embeddings->dimensions() > 0) {
        return embeddings->dimensions();
    }
    return settings.embeddingDimensions;
}

IndexerOptions indexerOptions(const Settings& settings)
{
    IndexerOptions options;
    options.commitBatchSize = settings.indexCommitBatch;
    return options;
}

} // namespace

ImageLibrary::ImageLibrary(const Settings& settings, EmbeddingProvider* embeddings)
    : m_settings(settings)
    , m_embeddings(embeddings)
    , m_catalog(settings.catalogPath)
    , m_tags(settings.tagPath, m_catalog)
    , m_store(storeDimensions(settings, embeddings))
    , m_indexer(m_catalog, m_store, embeddings, indexerOptions(settings))
    , m_search(m_catalog, m_tags, m_store, embeddings)
    , m_jobs(m_indexer, m_tags)
{
}

ImageLibrary::~ImageLibrary()
{
    shutdown();
}

void ImageLibrary::open()
{
    const RecordFile::LoadStatus catalogStatus = m_catalog.load();
    const RecordFile::LoadStatus tagStatus = m_tags.load();
    if (catalogStatus == RecordFile::LoadStatus::Corrupted
        || tagStatus == RecordFile::LoadStatus::Corrupted) {
        LOG_WARN(vlCore, "Library opened from a corrupted store, previous state was discarded");
    }

    m_store.reset(m_catalog.records());
    LOG_INFO(vlCore, "Library opened: %d images (%d with embeddings), %d tags",
             m_catalog.size(), m_store.embeddedCount(),
             static_cast<int>(m_tags.allTags().size()));
    if (!m_embeddings) {
        LOG_INFO(vlCore, "No embedding model configured, search is tag-only");
    }
}

void ImageLibrary::shutdown()
{
    m_jobs.shutdown();
}

QString ImageLibrary::submitIndexJob(const QString& path, const std::optional<QString>& tag)
{
    return m_jobs.submit(path, tag);
}

std::optional<IndexJob> ImageLibrary::jobStatus(const QString& jobId) const
{
    return m_jobs.status(jobId);
}

std::vector<IndexJob> ImageLibrary::jobs() const
{
    return m_jobs.jobs();
}

std::vector<SearchHit> ImageLibrary::search(const QString& query, int topK) const
{
    return m_search.search(query, topK > 0 ? topK : m_settings.defaultTopK);
}

bool ImageLibrary::addTag(const QString& imageId, const QString& tagName)
{
    return m_tags.addTagToImage(imageId, tagName);
}

bool ImageLibrary::removeTag(const QString& imageId, const QString& tagName)
{
    return m_tags.removeTagFromImage(imageId, tagName);
}

bool ImageLibrary::removeImage(const QString& imageId)
{
    const std::optional<ImageRecord> removed = m_catalog.remove(imageId);
    if (!removed) {
        return false;
    }
    m_store.remove(imageId);
    LOG_INFO(vlCore, "Removed image %s (%s)",
             qUtf8Printable(imageId), qUtf8Printable(removed->path));
    return true;
}

std::vector<ImageRecord> ImageLibrary::images() const
{
    return m_catalog.records();
}

std::optional<ImageRecord> ImageLibrary::image(const QString& imageId) const
{
    return m_catalog.findById(imageId);
}

std::vector<ImageRecord> ImageLibrary::imagesByTag(const QString& tagName) const
{
    return m_tags.imagesByTagName(tagName);
}

QStringList ImageLibrary::folders() const
{
    return m_catalog.folders();
}

std::vector<Tag> ImageLibrary::tags() const
{
    return m_tags.allTags();
}

QJsonObject ImageLibrary::describe(const ImageRecord& record) const
{
    QJsonObject json = imageRecordToJson(record);
    json.remove(QStringLiteral("embedding"));
    json.insert(QStringLiteral("tag_names"), QJsonArray::fromStringList(m_tags.tagNamesFor(record)));
    json.insert(QStringLiteral("has_embedding"), record.hasEmbedding());
    return json;
}

QJsonObject ImageLibrary::describe(const SearchHit& hit) const
{
    QJsonObject json = describe(hit.record);
    json.insert(QStringLiteral("match"),
                hit.source == MatchSource::Tag ? QStringLiteral("tag") : QStringLiteral("semantic"));
    if (hit.source == MatchSource::Semantic) {
        json.insert(QStringLiteral("similarity"), static_cast<double>(hit.similarity));
    }
    return json;
}

} // namespace vl
