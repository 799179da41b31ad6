#pragma once

#include <QJsonArray>
#include <QString>

namespace vl {

// RecordFile -- flat JSON record storage (an ordered array of objects).
//
// Loading never fails the caller: a missing file is an empty store, and an
// unreadable or malformed file is logged, set aside as "<path>.corrupt" and
// treated as empty. Saving replaces the whole file atomically (write to a
// temporary file, then rename), so a crash mid-write leaves the previous
// content intact.
class RecordFile {
public:
    enum class LoadStatus {
        Loaded,
        Missing,
        Corrupted,
    };

    static QJsonArray load(const QString& filePath, LoadStatus* status = nullptr);
    static bool save(const QString& filePath, const QJsonArray& records);

    static QString corruptCopyPath(const QString& filePath);
};

} // namespace vl
