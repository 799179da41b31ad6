#pragma once

#include "core/shared/types.h"
#include "core/store/record_file.h"

#include <QString>
#include <QStringList>

#include <mutex>
#include <optional>
#include <vector>

namespace vl {

class ImageCatalog;

// TagManager -- name <-> id tag catalog and image/tag associations.
//
// Tag names are unique case-insensitively; the first spelling wins and all
// lookups ignore case. Tags live in their own RecordFile; associations are
// tag ids stored on the image records, written through the ImageCatalog.
// Only ids of tags resolved here are ever written to a record; ids loaded
// from disk that no longer resolve are treated as absent.
class TagManager {
public:
    static const QString kUnknownTagName;

    TagManager(const QString& filePath, ImageCatalog& catalog);

    TagManager(const TagManager&) = delete;
    TagManager& operator=(const TagManager&) = delete;

    RecordFile::LoadStatus load();

    // Returns the id of the tag with this name, creating and persisting it
    // when needed. Returns an empty string for a blank name or a failed write.
    QString createTag(const QString& name, TagType type = TagType::Custom);

    // Append the tag (created if needed) to the image. Returns true only if
    // the image's tag list changed; false for an unknown image id.
    bool addTagToImage(const QString& imageId, const QString& tagName);

    // Batch form with a single catalog write. Returns the number of images
    // whose tag list changed, or nullopt if the tag file or the catalog
    // could not be written.
    std::optional<int> addTagToImages(const QStringList& imageIds, const QString& tagName);

    // Returns false if the tag or image is unknown or not associated.
    bool removeTagFromImage(const QString& imageId, const QString& tagName);

    std::vector<ImageRecord> imagesByTagName(const QString& name) const;

    // Reverse lookup; kUnknownTagName for ids that do not resolve.
    QString tagName(const QString& tagId) const;

    // Names of the record's resolvable tags, in record order.
    QStringList tagNamesFor(const ImageRecord& record) const;

    std::optional<Tag> findTag(const QString& name) const;
    std::vector<Tag> allTags() const;

    const QString& filePath() const { return m_filePath; }

private:
    std::optional<Tag> findTagLocked(const QString& name) const;
    QString generateTagIdLocked() const;
    bool persistLocked() const;

    QString m_filePath;
    ImageCatalog& m_catalog;
    mutable std::mutex m_mutex;
    std::vector<Tag> m_tags;
};

} // namespace vl
