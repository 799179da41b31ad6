#pragma once

#include "core/shared/types.h"
#include "core/vector/embedding_store.h"

#include <vector>

namespace vl {

enum class MatchSource {
    Tag,
    Semantic,
};

struct SearchHit {
    ImageRecord record;
    MatchSource source = MatchSource::Tag;
    float similarity = 0.0f;  // cosine similarity; 0 for tag matches
};

// Fuses the tag branch and the semantic branch of a hybrid query.
//
// Tag matches come first in the order given, then semantic matches whose
// id is not already present, in score order. The result is not capped:
// tag matches plus a top-k semantic search may return more than k hits.
class SearchMerger {
public:
    static std::vector<SearchHit> merge(const std::vector<ImageRecord>& tagMatches,
                                        const std::vector<ScoredImage>& semanticMatches);
};

} // namespace vl
