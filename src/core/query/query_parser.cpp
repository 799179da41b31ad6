#include "core/query/query_parser.h"

#include <QRegularExpression>

namespace vl {

namespace {

const QRegularExpression& peopleToken()
{
    static const QRegularExpression kPeople(
        QStringLiteral("@(\\w+)"), QRegularExpression::UseUnicodePropertiesOption);
    return kPeople;
}

const QRegularExpression& topicToken()
{
    static const QRegularExpression kTopics(
        QStringLiteral("#(\\w+)"), QRegularExpression::UseUnicodePropertiesOption);
    return kTopics;
}

const QRegularExpression& filterToken()
{
    static const QRegularExpression kFilter(
        QStringLiteral("[@#]\\w+"), QRegularExpression::UseUnicodePropertiesOption);
    return kFilter;
}

QStringList captures(const QRegularExpression& re, const QString& text)
{
    QStringList values;
    QRegularExpressionMatchIterator it = re.globalMatch(text);
    while (it.hasNext()) {
        values.append(it.next().captured(1));
    }
    return values;
}

} // namespace

ParsedQuery QueryParser::parse(const QString& query)
{
    ParsedQuery parsed;
    if (query.trimmed().isEmpty()) {
        return parsed;
    }

    parsed.people = captures(peopleToken(), query);
    parsed.topics = captures(topicToken(), query);

    QString remainder = query;
    remainder.remove(filterToken());
    static const QRegularExpression kWhitespace(QStringLiteral("\\s+"));
    parsed.keywords = remainder.split(kWhitespace, Qt::SkipEmptyParts);
    return parsed;
}

} // namespace vl
