#pragma once

#include "core/shared/cancellation.h"

#include <QSet>
#include <QString>
#include <QStringList>

#include <cstdint>

namespace vl {

struct ScanStats {
    uint64_t candidates = 0;
    uint64_t ignored = 0;
    uint64_t deniedDirectories = 0;
};

// FileScanner -- recursive directory walker that yields image candidates.
//
// Walks a directory tree with QDir, keeps regular files whose extension is
// on the image allow-list (common raster formats plus camera RAW) and
// returns their absolute paths. Entries are visited in name order so the
// output is deterministic for an unchanged tree. Directories that cannot
// be listed are logged and skipped; the walk continues with their siblings.
class FileScanner {
public:
    // Recursively scan root and return absolute candidate paths.
    // Returns an empty list if root is missing or not a directory.
    QStringList scanDirectory(const QString& root,
                              const CancellationToken* cancel = nullptr,
                              ScanStats* stats = nullptr) const;

    // True if the file name carries an allow-listed extension.
    static bool isSupportedImage(const QString& fileName);

    static const QSet<QString>& rasterExtensions();
    static const QSet<QString>& rawExtensions();

private:
    // Recursive helper; symlinked directories are not entered.
    void scanRecursive(const QString& dirPath,
                       QStringList& results,
                       ScanStats& stats,
                       const CancellationToken* cancel) const;
};

} // namespace vl
