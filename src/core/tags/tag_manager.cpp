#include "core/tags/tag_manager.h"
#include "core/shared/logging.h"
#include "core/store/image_catalog.h"

#include <QJsonArray>
#include <QSet>
#include <QUuid>

namespace vl {

const QString TagManager::kUnknownTagName = QStringLiteral("Unknown");

TagManager::TagManager(const QString& filePath, ImageCatalog& catalog)
    : m_filePath(filePath)
    , m_catalog(catalog)
{
}

RecordFile::LoadStatus TagManager::load()
{
    RecordFile::LoadStatus status = RecordFile::LoadStatus::Missing;
    const QJsonArray raw = RecordFile::load(m_filePath, &status);

    std::vector<Tag> loaded;
    QSet<QString> ids;
    QSet<QString> names;
    for (const QJsonValue& value : raw) {
        std::optional<Tag> tag = tagFromJson(value.toObject());
        if (!tag) {
            continue;
        }
        const QString key = tag->name.toLower();
        if (ids.contains(tag->id) || names.contains(key)) {
            LOG_WARN(vlStore, "Ignoring duplicate tag %s (%s)",
                     qUtf8Printable(tag->name), qUtf8Printable(tag->id));
            continue;
        }
        ids.insert(tag->id);
        names.insert(key);
        loaded.push_back(std::move(*tag));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_tags = std::move(loaded);
    return status;
}

QString TagManager::createTag(const QString& name, TagType type)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        LOG_WARN(vlStore, "Refusing to create a tag with a blank name");
        return QString();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (const std::optional<Tag> existing = findTagLocked(trimmed)) {
        return existing->id;
    }

    Tag tag;
    tag.id = generateTagIdLocked();
    tag.name = trimmed;
    tag.type = type;
    m_tags.push_back(tag);

    if (!persistLocked()) {
        m_tags.pop_back();
        return QString();
    }

    LOG_INFO(vlStore, "Created tag %s (%s)", qUtf8Printable(tag.name), qUtf8Printable(tag.id));
    return tag.id;
}

bool TagManager::addTagToImage(const QString& imageId, const QString& tagName)
{
    return addTagToImages(QStringList{imageId}, tagName).value_or(0) > 0;
}

std::optional<int> TagManager::addTagToImages(const QStringList& imageIds, const QString& tagName)
{
    QStringList known;
    for (const QString& id : imageIds) {
        if (m_catalog.containsId(id)) {
            known.append(id);
        }
    }
    if (known.isEmpty() || tagName.trimmed().isEmpty()) {
        return 0;
    }

    const QString tagId = createTag(tagName);
    if (tagId.isEmpty()) {
        return std::nullopt;
    }

    return m_catalog.updateRecords(known, [&tagId](ImageRecord& record) {
        if (record.tags.contains(tagId)) {
            return false;
        }
        record.tags.append(tagId);
        return true;
    });
}

bool TagManager::removeTagFromImage(const QString& imageId, const QString& tagName)
{
    const std::optional<Tag> tag = findTag(tagName);
    if (!tag) {
        return false;
    }

    const QString tagId = tag->id;
    return m_catalog.updateRecord(imageId, [&tagId](ImageRecord& record) {
        return record.tags.removeAll(tagId) > 0;
    });
}

std::vector<ImageRecord> TagManager::imagesByTagName(const QString& name) const
{
    std::vector<ImageRecord> matches;
    const std::optional<Tag> tag = findTag(name);
    if (!tag) {
        return matches;
    }

    for (ImageRecord& record : m_catalog.records()) {
        if (record.tags.contains(tag->id)) {
            matches.push_back(std::move(record));
        }
    }
    return matches;
}

QString TagManager::tagName(const QString& tagId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const Tag& tag : m_tags) {
        if (tag.id == tagId) {
            return tag.name;
        }
    }
    return kUnknownTagName;
}

QStringList TagManager::tagNamesFor(const ImageRecord& record) const
{
    QStringList names;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const QString& tagId : record.tags) {
        for (const Tag& tag : m_tags) {
            if (tag.id == tagId) {
                names.append(tag.name);
                break;
            }
        }
    }
    return names;
}

std::optional<Tag> TagManager::findTag(const QString& name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return findTagLocked(name.trimmed());
}

std::vector<Tag> TagManager::allTags() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tags;
}

std::optional<Tag> TagManager::findTagLocked(const QString& name) const
{
    for (const Tag& tag : m_tags) {
        if (tag.name.compare(name, Qt::CaseInsensitive) == 0) {
            return tag;
        }
    }
    return std::nullopt;
}

QString TagManager::generateTagIdLocked() const
{
    for (;;) {
        const QString candidate = QStringLiteral("t")
            + QUuid::createUuid().toString(QUuid::Id128).left(6);
        bool taken = false;
        for (const Tag& tag : m_tags) {
            if (tag.id == candidate) {
                taken = true;
                break;
            }
        }
        if (!taken) {
            return candidate;
        }
    }
}

bool TagManager::persistLocked() const
{
    QJsonArray array;
    for (const Tag& tag : m_tags) {
        array.append(tagToJson(tag));
    }
    return RecordFile::save(m_filePath, array);
}

} // namespace vl
