#pragma once

#include <QString>

namespace vl {

struct Settings {
    // Storage
    QString dataDir;
    QString catalogPath;
    QString tagPath;

    // Search
    int defaultTopK = 10;

    // Indexing: persist after this many new records (0 = once per sweep)
    int indexCommitBatch = 64;

    // Embedding dimension D (0 = adopt the first stored vector's size)
    int embeddingDimensions = 512;
};

} // namespace vl
