#include "core/extraction/metadata_extractor.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QImage>
#include <QImageReader>
#include <QSize>

namespace vl {

std::optional<ImageRecord> MetadataExtractor::extract(const QString& filePath)
{
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        LOG_WARN(vlIndex, "Skipping missing file: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }
    if (!info.isReadable()) {
        LOG_WARN(vlIndex, "Skipping unreadable file: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    QImageReader reader(filePath);
    reader.setDecideFormatFromContent(true);
    if (!reader.canRead()) {
        LOG_WARN(vlIndex, "Skipping non-image file %s: %s",
                 qUtf8Printable(filePath), qUtf8Printable(reader.errorString()));
        return std::nullopt;
    }

    const QByteArray format = reader.format();
    QSize size = reader.size();
    if (!size.isValid()) {
        // Some plugins only report dimensions after a full decode.
        const QImage image = reader.read();
        if (image.isNull()) {
            LOG_WARN(vlIndex, "Skipping undecodable image %s: %s",
                     qUtf8Printable(filePath), qUtf8Printable(reader.errorString()));
            return std::nullopt;
        }
        size = image.size();
    }

    ImageRecord record;
    record.id = info.fileName();
    record.path = info.absoluteFilePath();
    record.format = QString::fromLatin1(format).toUpper();
    record.width = size.width();
    record.height = size.height();
    record.sizeBytes = static_cast<int64_t>(info.size());
    record.created = info.birthTime().isValid() ? info.birthTime() : info.metadataChangeTime();
    record.modified = info.lastModified();
    return record;
}

} // namespace vl
