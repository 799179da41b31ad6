#include "core/vector/search_merger.h"

#include <QSet>

namespace vl {

std::vector<SearchHit> SearchMerger::merge(const std::vector<ImageRecord>& tagMatches,
                                           const std::vector<ScoredImage>& semanticMatches)
{
    std::vector<SearchHit> merged;
    merged.reserve(tagMatches.size() + semanticMatches.size());
    QSet<QString> seen;

    for (const ImageRecord& record : tagMatches) {
        if (seen.contains(record.id)) {
            continue;
        }
        seen.insert(record.id);

        SearchHit hit;
        hit.record = record;
        hit.source = MatchSource::Tag;
        merged.push_back(std::move(hit));
    }

    for (const ScoredImage& scored : semanticMatches) {
        if (seen.contains(scored.record.id)) {
            continue;
        }
        seen.insert(scored.record.id);

        SearchHit hit;
        hit.record = scored.record;
        hit.source = MatchSource::Semantic;
        hit.similarity = scored.score;
        merged.push_back(std::move(hit));
    }

    return merged;
}

} // namespace vl
