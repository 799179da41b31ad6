#include "core/query/search_engine.h"
#include "core/embedding/embedding_provider.h"
#include "core/shared/logging.h"
#include "core/store/image_catalog.h"
#include "core/tags/tag_manager.h"
#include "core/vector/embedding_store.h"

#include <QElapsedTimer>

#include <exception>

namespace vl {

SearchEngine::SearchEngine(const ImageCatalog& catalog,
                           const TagManager& tags,
                           const EmbeddingStore& store,
                           EmbeddingProvider* embeddings)
    : m_catalog(catalog)
    , m_tags(tags)
    , m_store(store)
    , m_embeddings(embeddings)
{
}

std::vector<SearchHit> SearchEngine::search(const QString& query, int topK) const
{
    QElapsedTimer timer;
    timer.start();

    const ParsedQuery parsed = QueryParser::parse(query);
    if (parsed.isEmpty()) {
        return {};
    }

    std::vector<ImageRecord> byTag;
    if (!parsed.people.isEmpty() || !parsed.topics.isEmpty()) {
        byTag = tagMatches(parsed);
    }

    std::vector<ScoredImage> bySimilarity;
    if (!parsed.keywords.isEmpty()) {
        bySimilarity = semanticMatches(parsed, topK);
    }

    std::vector<SearchHit> hits = SearchMerger::merge(byTag, bySimilarity);
    LOG_DEBUG(vlSearch, "Query '%s': %d tag, %d semantic, %d merged in %lld ms",
              qUtf8Printable(query), static_cast<int>(byTag.size()),
              static_cast<int>(bySimilarity.size()), static_cast<int>(hits.size()),
              static_cast<long long>(timer.elapsed()));
    return hits;
}

std::vector<ImageRecord> SearchEngine::tagMatches(const ParsedQuery& parsed) const
{
    std::vector<ImageRecord> matches;
    if (parsed.people.isEmpty()) {
        return matches;
    }

    for (ImageRecord& record : m_catalog.records()) {
        const QStringList names = m_tags.tagNamesFor(record);
        bool matched = false;
        for (const QString& person : parsed.people) {
            if (names.contains(person, Qt::CaseInsensitive)) {
                matched = true;
                break;
            }
        }
        if (matched) {
            matches.push_back(std::move(record));
        }
    }
    return matches;
}

std::vector<ScoredImage> SearchEngine::semanticMatches(const ParsedQuery& parsed, int topK) const
{
    if (parsed.keywords.isEmpty()) {
        return {};
    }
    if (!m_embeddings) {
        LOG_DEBUG(vlSearch, "No embedding provider, skipping semantic search");
        return {};
    }

    const QString text = parsed.keywordText();
    std::vector<float> queryVector;
    try {
        queryVector = m_embeddings->textEmbedding(text);
    } catch (const std::exception& e) {
        LOG_WARN(vlSearch, "Text embedding failed for '%s': %s", qUtf8Printable(text), e.what());
        return {};
    } catch (...) {
        LOG_WARN(vlSearch, "Text embedding failed for '%s' with an unknown error",
                 qUtf8Printable(text));
        return {};
    }

    if (queryVector.empty()) {
        LOG_WARN(vlSearch, "Text embedding unavailable for '%s'", qUtf8Printable(text));
        return {};
    }

    // The store's copies may carry stale tags; the catalog is authoritative.
    std::vector<ScoredImage> matches;
    for (ScoredImage& scored : m_store.search(queryVector, topK)) {
        std::optional<ImageRecord> current = m_catalog.findById(scored.record.id);
        if (!current) {
            continue;
        }
        scored.record = std::move(*current);
        matches.push_back(std::move(scored));
    }
    return matches;
}

} // namespace vl
