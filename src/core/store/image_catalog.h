#pragma once

#include "core/shared/types.h"
#include "core/store/record_file.h"

#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>

#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace vl {

// Raised when the catalog cannot be persisted at all.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

// ImageCatalog -- the full set of ImageRecords, backed by a RecordFile.
//
// The catalog is the only writer of its file. Every mutation happens under
// one mutex and persists the complete in-memory set before the lock is
// released, so concurrent writers never drop each other's records. A failed
// write rolls the in-memory change back.
class ImageCatalog {
public:
    explicit ImageCatalog(const QString& filePath);

    ImageCatalog(const ImageCatalog&) = delete;
    ImageCatalog& operator=(const ImageCatalog&) = delete;

    // Replace the in-memory set with the file content. Records without an
    // id or path, and repeats of an id or path, are dropped with a warning.
    RecordFile::LoadStatus load();

    std::vector<ImageRecord> records() const;
    std::optional<ImageRecord> findById(const QString& id) const;
    bool containsId(const QString& id) const;
    bool containsPath(const QString& path) const;
    QSet<QString> knownPaths() const;
    int size() const;

    // Sorted unique parent directories of every catalogued image.
    QStringList folders() const;

    // Append records whose path and id are not catalogued yet and persist.
    // Returns the records actually added, in batch order.
    // Throws StoreError if the file cannot be written.
    std::vector<ImageRecord> commitNew(const std::vector<ImageRecord>& batch);

    // Apply mutator to the record with the given id. The mutator returns
    // whether it changed anything; the catalog is persisted only then.
    // Returns false for an unknown id, no change, or a failed write.
    bool updateRecord(const QString& id, const std::function<bool(ImageRecord&)>& mutator);

    // Batch form of updateRecord with a single write. Returns the number
    // of records changed, or nullopt if the write failed and the changes
    // were rolled back.
    std::optional<int> updateRecords(const QStringList& ids,
                                     const std::function<bool(ImageRecord&)>& mutator);

    // Remove a record and persist. Returns the removed record.
    std::optional<ImageRecord> remove(const QString& id);

    const QString& filePath() const { return m_filePath; }

private:
    bool persistLocked() const;
    void reindexLocked();

    QString m_filePath;
    mutable std::mutex m_mutex;
    std::vector<ImageRecord> m_records;
    QHash<QString, int> m_rowById;
    QSet<QString> m_paths;
};

} // namespace vl
