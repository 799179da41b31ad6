#include <QtTest/QtTest>
#include "core/vector/search_merger.h"

class TestSearchMerger : public QObject {
    Q_OBJECT

private slots:
    void testEmptyInputs();
    void testTagMatchesOnly();
    void testSemanticOnly();
    void testNoTruncationToTopK();
    void testDuplicatesKeepFirstOccurrence();

private:
    static vl::ImageRecord makeRecord(const QString& id);
    static vl::ScoredImage makeScored(const QString& id, float score);
};

vl::ImageRecord TestSearchMerger::makeRecord(const QString& id)
{
    vl::ImageRecord record;
    record.id = id;
    record.path = QStringLiteral("/pics/%1.png").arg(id);
    return record;
}

vl::ScoredImage TestSearchMerger::makeScored(const QString& id, float score)
{
    vl::ScoredImage scored;
    scored.record = makeRecord(id);
    scored.score = score;
    return scored;
}

void TestSearchMerger::testEmptyInputs()
{
    QVERIFY(vl::SearchMerger::merge({}, {}).empty());
}

void TestSearchMerger::testTagMatchesOnly()
{
    const std::vector<vl::SearchHit> merged =
        vl::SearchMerger::merge({makeRecord("b"), makeRecord("a")}, {});
    QCOMPARE(static_cast<int>(merged.size()), 2);
    QCOMPARE(merged[0].record.id, QStringLiteral("b"));
    QCOMPARE(merged[1].record.id, QStringLiteral("a"));
    QCOMPARE(merged[0].source, vl::MatchSource::Tag);
}

void TestSearchMerger::testSemanticOnly()
{
    const std::vector<vl::SearchHit> merged =
        vl::SearchMerger::merge({}, {makeScored("x", 0.9f), makeScored("y", 0.4f)});
    QCOMPARE(static_cast<int>(merged.size()), 2);
    QCOMPARE(merged[0].record.id, QStringLiteral("x"));
    QCOMPARE(merged[0].source, vl::MatchSource::Semantic);
    QCOMPARE(merged[0].similarity, 0.9f);
}

void TestSearchMerger::testNoTruncationToTopK()
{
    // Two tag matches plus a top-2 semantic search give four hits.
    const std::vector<vl::SearchHit> merged = vl::SearchMerger::merge(
        {makeRecord("t1"), makeRecord("t2")},
        {makeScored("s1", 0.8f), makeScored("s2", 0.7f)});

    QCOMPARE(static_cast<int>(merged.size()), 4);
    QCOMPARE(merged[0].record.id, QStringLiteral("t1"));
    QCOMPARE(merged[1].record.id, QStringLiteral("t2"));
    QCOMPARE(merged[2].record.id, QStringLiteral("s1"));
    QCOMPARE(merged[3].record.id, QStringLiteral("s2"));
}

void TestSearchMerger::testDuplicatesKeepFirstOccurrence()
{
    const std::vector<vl::SearchHit> merged = vl::SearchMerger::merge(
        {makeRecord("a"), makeRecord("b"), makeRecord("a")},
        {makeScored("b", 0.9f), makeScored("c", 0.5f), makeScored("c", 0.4f)});

    QCOMPARE(static_cast<int>(merged.size()), 3);
    QCOMPARE(merged[0].record.id, QStringLiteral("a"));
    QCOMPARE(merged[1].record.id, QStringLiteral("b"));
    QCOMPARE(merged[1].source, vl::MatchSource::Tag);
    QCOMPARE(merged[2].record.id, QStringLiteral("c"));
    QCOMPARE(merged[2].similarity, 0.5f);
}

QTEST_MAIN(TestSearchMerger)
#include "test_search_merger.moc"
