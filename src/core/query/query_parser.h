#pragma once

#include <QString>
#include <QStringList>

namespace vl {

struct ParsedQuery {
    QStringList people;    // @name tokens, without the prefix
    QStringList topics;    // #name tokens, without the prefix
    QStringList keywords;  // everything else, whitespace-split

    QString keywordText() const { return keywords.join(QChar(' ')); }
    bool isEmpty() const { return people.isEmpty() && topics.isEmpty() && keywords.isEmpty(); }
};

class QueryParser {
public:
    static ParsedQuery parse(const QString& query);
};

} // namespace vl
