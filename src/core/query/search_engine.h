#pragma once

#include "core/query/query_parser.h"
#include "core/vector/search_merger.h"

#include <QString>

#include <vector>

namespace vl {

class EmbeddingProvider;
class EmbeddingStore;
class ImageCatalog;
class TagManager;

// SearchEngine -- hybrid query over tags and image embeddings.
//
//   "@alice @bob beach at sunset #travel"
//     people   -> records tagged with a tag named alice or bob (any case)
//     topics   -> parsed, not matched against anything yet
//     keywords -> "beach at sunset" embedded as text, top-k cosine search
//
// Tag matches keep catalog order and come first; semantic matches follow,
// deduplicated by id. Without an embedding provider, or when it fails for
// the query text, only the tag branch contributes.
class SearchEngine {
public:
    SearchEngine(const ImageCatalog& catalog,
                 const TagManager& tags,
                 const EmbeddingStore& store,
                 EmbeddingProvider* embeddings);

    std::vector<SearchHit> search(const QString& query, int topK = 10) const;

    std::vector<ImageRecord> tagMatches(const ParsedQuery& parsed) const;
    std::vector<ScoredImage> semanticMatches(const ParsedQuery& parsed, int topK) const;

private:
    const ImageCatalog& m_catalog;
    const TagManager& m_tags;
    const EmbeddingStore& m_store;
    EmbeddingProvider* m_embeddings;
};

} // namespace vl
