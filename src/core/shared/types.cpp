#include "core/shared/types.h"

#include <QJsonArray>
#include <QJsonValue>

namespace vl {

namespace {

QString timestampToString(const QDateTime& timestamp)
{
    if (!timestamp.isValid()) {
        return QString();
    }
    return timestamp.toString(Qt::ISODateWithMs);
}

QDateTime timestampFromValue(const QJsonValue& value)
{
    if (value.isString()) {
        return QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    }
    if (value.isDouble()) {
        return QDateTime::fromMSecsSinceEpoch(
            static_cast<qint64>(value.toDouble() * 1000.0));
    }
    return QDateTime();
}

} // namespace

QString tagTypeToString(TagType type)
{
    switch (type) {
    case TagType::Person: return QStringLiteral("person");
    case TagType::Topic:  return QStringLiteral("topic");
    case TagType::Custom: return QStringLiteral("custom");
    }
    return QStringLiteral("custom");
}

TagType tagTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("person")) return TagType::Person;
    if (lower == QLatin1String("topic"))  return TagType::Topic;
    return TagType::Custom;
}

QJsonObject imageRecordToJson(const ImageRecord& record)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), record.id);
    json.insert(QStringLiteral("path"), record.path);
    json.insert(QStringLiteral("format"), record.format);
    json.insert(QStringLiteral("width"), record.width);
    json.insert(QStringLiteral("height"), record.height);
    json.insert(QStringLiteral("size_bytes"), static_cast<qint64>(record.sizeBytes));
    json.insert(QStringLiteral("created"), timestampToString(record.created));
    json.insert(QStringLiteral("modified"), timestampToString(record.modified));
    json.insert(QStringLiteral("tags"), QJsonArray::fromStringList(record.tags));

    if (record.hasEmbedding()) {
        QJsonArray embedding;
        for (float value : record.embedding) {
            embedding.append(static_cast<double>(value));
        }
        json.insert(QStringLiteral("embedding"), embedding);
    }

    if (!record.thumbnail.isEmpty()) {
        json.insert(QStringLiteral("thumbnail"), record.thumbnail);
    }
    return json;
}

std::optional<ImageRecord> imageRecordFromJson(const QJsonObject& json)
{
    ImageRecord record;
    record.id = json.value(QStringLiteral("id")).toString();
    record.path = json.value(QStringLiteral("path")).toString();
    if (record.id.isEmpty() || record.path.isEmpty()) {
        return std::nullopt;
    }

    record.format = json.value(QStringLiteral("format")).toString();
    record.width = json.value(QStringLiteral("width")).toInt(0);
    record.height = json.value(QStringLiteral("height")).toInt(0);
    record.sizeBytes = static_cast<int64_t>(
        json.value(QStringLiteral("size_bytes")).toVariant().toLongLong());
    record.created = timestampFromValue(json.value(QStringLiteral("created")));
    record.modified = timestampFromValue(json.value(QStringLiteral("modified")));
    record.thumbnail = json.value(QStringLiteral("thumbnail")).toString();

    // Duplicate tag ids collapse to their first occurrence.
    const QJsonArray tags = json.value(QStringLiteral("tags")).toArray();
    for (const QJsonValue& value : tags) {
        const QString tagId = value.toString();
        if (!tagId.isEmpty() && !record.tags.contains(tagId)) {
            record.tags.append(tagId);
        }
    }

    const QJsonArray embedding = json.value(QStringLiteral("embedding")).toArray();
    record.embedding.reserve(static_cast<size_t>(embedding.size()));
    for (const QJsonValue& value : embedding) {
        if (!value.isDouble()) {
            record.embedding.clear();
            break;
        }
        record.embedding.push_back(static_cast<float>(value.toDouble()));
    }

    return record;
}

QJsonObject tagToJson(const Tag& tag)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), tag.id);
    json.insert(QStringLiteral("name"), tag.name);
    json.insert(QStringLiteral("type"), tagTypeToString(tag.type));
    return json;
}

std::optional<Tag> tagFromJson(const QJsonObject& json)
{
    Tag tag;
    tag.id = json.value(QStringLiteral("id")).toString();
    tag.name = json.value(QStringLiteral("name")).toString();
    if (tag.id.isEmpty() || tag.name.isEmpty()) {
        return std::nullopt;
    }
    tag.type = tagTypeFromString(json.value(QStringLiteral("type")).toString());
    return tag;
}

} // namespace vl
