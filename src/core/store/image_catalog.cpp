#include "core/store/image_catalog.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QJsonArray>

#include <utility>

namespace vl {

ImageCatalog::ImageCatalog(const QString& filePath)
    : m_filePath(filePath)
{
}

RecordFile::LoadStatus ImageCatalog::load()
{
    RecordFile::LoadStatus status = RecordFile::LoadStatus::Missing;
    const QJsonArray raw = RecordFile::load(m_filePath, &status);

    std::vector<ImageRecord> loaded;
    loaded.reserve(static_cast<size_t>(raw.size()));
    QSet<QString> ids;
    QSet<QString> paths;
    int dropped = 0;

    for (const QJsonValue& value : raw) {
        std::optional<ImageRecord> record = imageRecordFromJson(value.toObject());
        if (!record || ids.contains(record->id) || paths.contains(record->path)) {
            ++dropped;
            continue;
        }
        ids.insert(record->id);
        paths.insert(record->path);
        loaded.push_back(std::move(*record));
    }

    if (dropped > 0) {
        LOG_WARN(vlStore, "Dropped %d invalid or duplicate catalog records from %s",
                 dropped, qUtf8Printable(m_filePath));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_records = std::move(loaded);
    reindexLocked();
    LOG_INFO(vlStore, "Catalog loaded: %d records from %s",
             static_cast<int>(m_records.size()), qUtf8Printable(m_filePath));
    return status;
}

std::vector<ImageRecord> ImageCatalog::records() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

std::optional<ImageRecord> ImageCatalog::findById(const QString& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_rowById.constFind(id);
    if (it == m_rowById.constEnd()) {
        return std::nullopt;
    }
    return m_records[static_cast<size_t>(it.value())];
}

bool ImageCatalog::containsId(const QString& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rowById.contains(id);
}

bool ImageCatalog::containsPath(const QString& path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paths.contains(path);
}

QSet<QString> ImageCatalog::knownPaths() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paths;
}

int ImageCatalog::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_records.size());
}

QStringList ImageCatalog::folders() const
{
    QSet<QString> unique;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const ImageRecord& record : m_records) {
            unique.insert(QFileInfo(record.path).absolutePath());
        }
    }
    QStringList result(unique.begin(), unique.end());
    result.sort();
    return result;
}

std::vector<ImageRecord> ImageCatalog::commitNew(const std::vector<ImageRecord>& batch)
{
    std::vector<ImageRecord> added;
    if (batch.empty()) {
        return added;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t previousSize = m_records.size();

    for (const ImageRecord& record : batch) {
        if (record.id.isEmpty() || record.path.isEmpty()) {
            continue;
        }
        if (m_paths.contains(record.path) || m_rowById.contains(record.id)) {
            LOG_DEBUG(vlStore, "Skipping already catalogued %s", qUtf8Printable(record.path));
            continue;
        }
        m_rowById.insert(record.id, static_cast<int>(m_records.size()));
        m_paths.insert(record.path);
        m_records.push_back(record);
        added.push_back(record);
    }

    if (added.empty()) {
        return added;
    }

    if (!persistLocked()) {
        m_records.resize(previousSize);
        reindexLocked();
        throw StoreError(QStringLiteral("Failed to write catalog %1").arg(m_filePath));
    }
    return added;
}

bool ImageCatalog::updateRecord(const QString& id,
                                const std::function<bool(ImageRecord&)>& mutator)
{
    return updateRecords(QStringList{id}, mutator).value_or(0) > 0;
}

std::optional<int> ImageCatalog::updateRecords(const QStringList& ids,
                                               const std::function<bool(ImageRecord&)>& mutator)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::pair<int, ImageRecord>> originals;
    for (const QString& id : ids) {
        const auto it = m_rowById.constFind(id);
        if (it == m_rowById.constEnd()) {
            continue;
        }
        ImageRecord& record = m_records[static_cast<size_t>(it.value())];
        ImageRecord before = record;
        if (mutator(record)) {
            // The dedup key and identity are immutable.
            record.id = before.id;
            record.path = before.path;
            originals.emplace_back(it.value(), std::move(before));
        }
    }

    if (originals.empty()) {
        return 0;
    }

    if (!persistLocked()) {
        for (auto& [row, before] : originals) {
            m_records[static_cast<size_t>(row)] = std::move(before);
        }
        return std::nullopt;
    }
    return static_cast<int>(originals.size());
}

std::optional<ImageRecord> ImageCatalog::remove(const QString& id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_rowById.constFind(id);
    if (it == m_rowById.constEnd()) {
        return std::nullopt;
    }

    const int row = it.value();
    ImageRecord removed = m_records[static_cast<size_t>(row)];
    m_records.erase(m_records.begin() + row);
    reindexLocked();

    if (!persistLocked()) {
        m_records.insert(m_records.begin() + row, removed);
        reindexLocked();
        return std::nullopt;
    }
    return removed;
}

bool ImageCatalog::persistLocked() const
{
    QJsonArray array;
    for (const ImageRecord& record : m_records) {
        array.append(imageRecordToJson(record));
    }
    return RecordFile::save(m_filePath, array);
}

void ImageCatalog::reindexLocked()
{
    m_rowById.clear();
    m_paths.clear();
    m_rowById.reserve(static_cast<int>(m_records.size()));
    m_paths.reserve(static_cast<int>(m_records.size()));
    for (size_t i = 0; i < m_records.size(); ++i) {
        m_rowById.insert(m_records[i].id, static_cast<int>(i));
        m_paths.insert(m_records[i].path);
    }
}

} // namespace vl
