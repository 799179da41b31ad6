#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace vl {

// MetadataExtractor -- builds an ImageRecord from one file on disk.
//
// Reads the intrinsic size and format through QImageReader (header only
// where the format plugin allows it) plus filesystem size and timestamps.
// The returned id is the bare file name; callers assign a unique id
// before inserting the record into the catalog.
//
// Unreadable files and non-image content yield nullopt and a warning.
class MetadataExtractor {
public:
    static std::optional<ImageRecord> extract(const QString& filePath);
};

} // namespace vl
