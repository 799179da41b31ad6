#include "core/fs/file_scanner.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

#include <cinttypes>

namespace vl {

QStringList FileScanner::scanDirectory(const QString& root,
                                       const CancellationToken* cancel,
                                       ScanStats* stats) const
{
    QStringList results;
    ScanStats localStats;

    const QFileInfo rootInfo(root);
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        LOG_WARN(vlFs, "Scan root does not exist: %s", qUtf8Printable(root));
        if (stats) {
            *stats = localStats;
        }
        return results;
    }

    const QString absoluteRoot = QDir::cleanPath(rootInfo.absoluteFilePath());
    LOG_INFO(vlFs, "Starting directory scan: %s", qUtf8Printable(absoluteRoot));

    scanRecursive(absoluteRoot, results, localStats, cancel);

    LOG_INFO(vlFs, "Scan complete: %s, %" PRIu64 " candidates, "
                   "%" PRIu64 " ignored, %" PRIu64 " directories denied",
             qUtf8Printable(absoluteRoot), localStats.candidates,
             localStats.ignored, localStats.deniedDirectories);

    if (stats) {
        *stats = localStats;
    }
    return results;
}

void FileScanner::scanRecursive(const QString& dirPath,
                                QStringList& results,
                                ScanStats& stats,
                                const CancellationToken* cancel) const
{
    if (cancel && cancel->isCancelled()) {
        return;
    }

    const QFileInfo dirInfo(dirPath);
    if (!dirInfo.isReadable() || !dirInfo.isExecutable()) {
        ++stats.deniedDirectories;
        LOG_WARN(vlFs, "Permission denied, skipping directory: %s", qUtf8Printable(dirPath));
        return;
    }

    QDir dir(dirPath);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
        QDir::Name);

    for (const QFileInfo& fi : entries) {
        if (fi.isDir()) {
            // Symlinked directories can form cycles.
            if (fi.isSymLink()) {
                ++stats.ignored;
                continue;
            }
            scanRecursive(fi.absoluteFilePath(), results, stats, cancel);
            continue;
        }

        if (!fi.isFile() || !isSupportedImage(fi.fileName())) {
            ++stats.ignored;
            continue;
        }

        ++stats.candidates;
        results.append(QDir::cleanPath(fi.absoluteFilePath()));

        if (stats.candidates % 10000 == 0) {
            LOG_INFO(vlFs, "Scan progress: %" PRIu64 " candidates, in %s",
                     stats.candidates, qUtf8Printable(dirPath));
        }
    }
}

bool FileScanner::isSupportedImage(const QString& fileName)
{
    const QString ext = QFileInfo(fileName).suffix().toLower();
    if (ext.isEmpty()) {
        return false;
    }
    return rasterExtensions().contains(ext) || rawExtensions().contains(ext);
}

const QSet<QString>& FileScanner::rasterExtensions()
{
    static const QSet<QString> exts = {
        QStringLiteral("jpg"),
        QStringLiteral("jpeg"),
        QStringLiteral("png"),
        QStringLiteral("bmp"),
        QStringLiteral("tiff"),
        QStringLiteral("tif"),
        QStringLiteral("gif"),
        QStringLiteral("webp"),
        QStringLiteral("heic"),
    };
    return exts;
}

const QSet<QString>& FileScanner::rawExtensions()
{
    // Camera manufacturer RAW formats.
    static const QSet<QString> exts = {
        QStringLiteral("cr2"), QStringLiteral("cr3"),
        QStringLiteral("nef"), QStringLiteral("nrw"),
        QStringLiteral("arw"), QStringLiteral("sr2"), QStringLiteral("srw"),
        QStringLiteral("rw2"), QStringLiteral("rwl"),
        QStringLiteral("orf"),
        QStringLiteral("raf"),
        QStringLiteral("pef"),
        QStringLiteral("dng"),
        QStringLiteral("erf"),
        QStringLiteral("3fr"),
        QStringLiteral("x3f"),
        QStringLiteral("mef"),
        QStringLiteral("mos"),
        QStringLiteral("kc2"),
    };
    return exts;
}

} // namespace vl
