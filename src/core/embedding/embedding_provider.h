#pragma once

#include <QString>

#include <vector>

namespace vl {

// EmbeddingProvider -- boundary to the embedding model.
//
// Maps text and images into one similarity space of fixed dimension D.
// An empty vector, or an exception, means the embedding could not be
// produced; callers treat both as a per-item failure.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual int dimensions() const = 0;
    virtual std::vector<float> textEmbedding(const QString& text) = 0;
    virtual std::vector<float> imageEmbedding(const QString& imagePath) = 0;
};

} // namespace vl
