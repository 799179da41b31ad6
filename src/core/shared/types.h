#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

namespace vl {

// Tag classification. Unknown strings read back as Custom.
enum class TagType {
    Person,
    Topic,
    Custom,
};

QString tagTypeToString(TagType type);
TagType tagTypeFromString(const QString& str);

struct Tag {
    QString id;
    QString name;
    TagType type = TagType::Custom;
};

// One catalogued picture. The catalog is the source of truth; vector and
// tag views are derived from these records.
struct ImageRecord {
    QString id;           // stable, immutable once assigned
    QString path;         // absolute path, the dedup key
    QString format;
    int width = 0;
    int height = 0;
    int64_t sizeBytes = 0;
    QDateTime created;
    QDateTime modified;
    QStringList tags;     // tag ids, no duplicates
    std::vector<float> embedding;
    QString thumbnail;

    bool hasEmbedding() const { return !embedding.empty(); }
};

QJsonObject imageRecordToJson(const ImageRecord& record);
std::optional<ImageRecord> imageRecordFromJson(const QJsonObject& json);

QJsonObject tagToJson(const Tag& tag);
std::optional<Tag> tagFromJson(const QJsonObject& json);

} // namespace vl
