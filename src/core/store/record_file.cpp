#include "core/store/record_file.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace vl {

namespace {

void setStatus(RecordFile::LoadStatus* status, RecordFile::LoadStatus value)
{
    if (status) {
        *status = value;
    }
}

void preserveCorruptFile(const QString& filePath)
{
    const QString copyPath = RecordFile::corruptCopyPath(filePath);
    QFile::remove(copyPath);
    if (!QFile::copy(filePath, copyPath)) {
        LOG_WARN(vlStore, "Could not preserve corrupted store %s", qUtf8Printable(filePath));
        return;
    }
    LOG_WARN(vlStore, "Corrupted store preserved at %s", qUtf8Printable(copyPath));
}

} // namespace

QJsonArray RecordFile::load(const QString& filePath, LoadStatus* status)
{
    QFile file(filePath);
    if (!file.exists()) {
        setStatus(status, LoadStatus::Missing);
        return {};
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(vlStore, "Failed to open store for read, starting empty: %s",
                 qUtf8Printable(filePath));
        setStatus(status, LoadStatus::Corrupted);
        return {};
    }

    const QByteArray raw = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        LOG_WARN(vlStore, "Malformed store %s (%s), prior records discarded",
                 qUtf8Printable(filePath),
                 qUtf8Printable(doc.isNull() ? parseError.errorString()
                                             : QStringLiteral("top level is not an array")));
        preserveCorruptFile(filePath);
        setStatus(status, LoadStatus::Corrupted);
        return {};
    }

    setStatus(status, LoadStatus::Loaded);
    return doc.array();
}

bool RecordFile::save(const QString& filePath, const QJsonArray& records)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(vlStore, "Failed to create store directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(vlStore, "Failed to open store for write: %s (%s)",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }

    const QByteArray payload = QJsonDocument(records).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        LOG_ERROR(vlStore, "Failed writing store: %s (%s)",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        LOG_ERROR(vlStore, "Failed to commit store: %s (%s)",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

QString RecordFile::corruptCopyPath(const QString& filePath)
{
    return filePath + QStringLiteral(".corrupt");
}

} // namespace vl
