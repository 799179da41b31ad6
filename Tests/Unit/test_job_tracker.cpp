#include <QtTest/QtTest>
#include "core/indexing/image_indexer.h"
#include "core/jobs/job_tracker.h"
#include "core/store/image_catalog.h"
#include "core/tags/tag_manager.h"
#include "core/vector/embedding_store.h"
#include "fake_embedding_provider.h"
#include "test_images.h"

#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>

#include <memory>

class TestJobTracker : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testUnknownJob();
    void testSubmitReturnsImmediately();
    void testZeroNewImagesCompletes();
    void testProgressAndTagLabel();
    void testBlankTagIsIgnored();
    void testStoreFailureCapturedInJob();
    void testTagWriteFailureCapturedInJob();
    void testModelThrowingNonStandardTypeKeepsJobAlive();
    void testConcurrentJobsOnSameRoot();
    void testJobsListedInSubmissionOrder();
    void testSubmitAfterShutdownFails();
    void testOldFinishedJobsAreEvicted();
    void testPollerJsonShape();

private:
    void writeImages(const QString& folder, int count);
    static bool isDone(const vl::JobTracker& tracker, const QString& jobId);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<vl::ImageCatalog> m_catalog;
    std::unique_ptr<vl::TagManager> m_tags;
    std::unique_ptr<vl::EmbeddingStore> m_store;
    std::unique_ptr<vl::ImageIndexer> m_indexer;
    std::unique_ptr<vl::JobTracker> m_tracker;
};

void TestJobTracker::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_catalog = std::make_unique<vl::ImageCatalog>(m_dir->filePath("data/image_data.json"));
    m_catalog->load();
    m_tags = std::make_unique<vl::TagManager>(m_dir->filePath("data/tags.json"), *m_catalog);
    m_tags->load();
    m_store = std::make_unique<vl::EmbeddingStore>(3);
    vl::IndexerOptions options;
    options.commitBatchSize = 2;
    m_indexer = std::make_unique<vl::ImageIndexer>(*m_catalog, *m_store, nullptr, options);
    m_tracker = std::make_unique<vl::JobTracker>(*m_indexer, *m_tags);
}

void TestJobTracker::cleanup()
{
    m_tracker.reset();
    m_indexer.reset();
    m_store.reset();
    m_tags.reset();
    m_catalog.reset();
    m_dir.reset();
}

void TestJobTracker::writeImages(const QString& folder, int count)
{
    for (int i = 0; i < count; ++i) {
        QVERIFY(vl::test::writeTestImage(
            m_dir->filePath(QStringLiteral("%1/img_%2.png").arg(folder).arg(i))));
    }
}

bool TestJobTracker::isDone(const vl::JobTracker& tracker, const QString& jobId)
{
    const std::optional<vl::IndexJob> job = tracker.status(jobId);
    return job && job->done;
}

void TestJobTracker::testUnknownJob()
{
    QVERIFY(!m_tracker->status("no-such-job").has_value());
}

void TestJobTracker::testSubmitReturnsImmediately()
{
    writeImages("photos", 3);

    const QString jobId = m_tracker->submit(m_dir->filePath("photos"));
    QVERIFY(!jobId.isEmpty());

    const std::optional<vl::IndexJob> job = m_tracker->status(jobId);
    QVERIFY(job.has_value());
    QCOMPARE(job->jobId, jobId);
    QCOMPARE(job->path, m_dir->filePath("photos"));
    QVERIFY(!job->tag.has_value());
    QVERIFY(job->progress >= 0 && job->progress <= 100);

    QTRY_VERIFY_WITH_TIMEOUT(isDone(*m_tracker, jobId), 10000);
    QVERIFY(m_tracker->submit(m_dir->filePath("photos")) != jobId);
}

void TestJobTracker::testZeroNewImagesCompletes()
{
    writeImages("photos", 2);
    QCOMPARE(static_cast<int>(m_indexer->index(m_dir->filePath("photos")).size()), 2);

    const QString jobId = m_tracker->submit(m_dir->filePath("photos"));
    QTRY_VERIFY_WITH_TIMEOUT(isDone(*m_tracker, jobId), 10000);

    const vl::IndexJob job = *m_tracker->status(jobId);
    QCOMPARE(job.progress, 100);
    QCOMPARE(job.indexed, 0);
    QCOMPARE(job.total, 0);
    QVERIFY(!job.error.has_value());
    QCOMPARE(job.state, vl::JobState::Completed);

    // Same outcome for a root that does not exist.
    const QString missing = m_tracker->submit(m_dir->filePath("nowhere"));
    QTRY_VERIFY_WITH_TIMEOUT(isDone(*m_tracker, missing), 10000);
    QCOMPARE(m_tracker->status(missing)->progress, 100);
    QVERIFY(!m_tracker->status(missing)->error.has_value());
}

void TestJobTracker::testProgressAndTagLabel()
{
    writeImages("trip", 5);

    const QString jobId = m_tracker->submit(m_dir->filePath("trip"), QStringLiteral("Vacation"));
    QTRY_VERIFY_WITH_TIMEOUT(isDone(*m_tracker, jobId), 10000);

    const vl::IndexJob job = *m_tracker->status(jobId);
    QCOMPARE(job.total, 5);
    QCOMPARE(job.indexed, 5);
    QCOMPARE(job.progress, 100);
    QCOMPARE(job.state, vl::JobState::Completed);
    QCOMPARE(job.tag.value_or(QString()), QStringLiteral("Vacation"));
    QVERIFY(!job.error.has_value());

    QCOMPARE(static_cast<int>(m_tags->imagesByTagName("vacation").size()), 5);
    QCOMPARE(m_catalog->size(), 5);
}

void TestJobTracker::testBlankTagIsIgnored()
{
    writeImages("trip", 1);

    const QString jobId = m_tracker->submit(m_dir->filePath("trip"), QStringLiteral("   "));
    QVERIFY(!m_tracker->status(jobId)->tag.has_value());
    QTRY_VERIFY_WITH_TIMEOUT(isDone(*m_tracker, jobId), 10000);
    QVERIFY(m_tags->allTags().empty());
}

void TestJobTracker::testStoreFailureCapturedInJob()
{
    writeImages("photos", 2);
    {
        QFile blocker(m_dir->filePath("blocker"));
        QVERIFY(blocker.open(QIODevice::WriteOnly));
        blocker.write("x");
    }

    vl::ImageCatalog brokenCatalog(m_dir->filePath("blocker/image_data.json"));
    brokenCatalog.load();
    vl::TagManager tags(m_dir->filePath("blocker/tags.json"), brokenCatalog);
    vl::EmbeddingStore store(3);
    vl::ImageIndexer indexer(brokenCatalog, store, nullptr);
    vl::JobTracker tracker(indexer, tags);

    const QString jobId = tracker.submit(m_dir->filePath("photos"), QStringLiteral("Lost"));
    QTRY_VERIFY_WITH_TIMEOUT(isDone(tracker, jobId), 10000);

    const vl::IndexJob job = *tracker.status(jobId);
    QVERIFY(job.error.has_value());
    QVERIFY(!job.error->isEmpty());
    QCOMPARE(job.state, vl::JobState::Failed);
    QCOMPARE(job.progress, 0);
    QCOMPARE(tracker.activeJobCount(), 0);
}

void TestJobTracker::testTagWriteFailureCapturedInJob()
{
    writeImages("trip", 2);
    {
        QFile blocker(m_dir->filePath("blocker"));
        QVERIFY(blocker.open(QIODevice::WriteOnly));
        blocker.write("x");
    }

    vl::TagManager tags(m_dir->filePath("blocker/tags.json"), *m_catalog);
    vl::JobTracker tracker(*m_indexer, tags);

    const QString jobId = tracker.submit(m_dir->filePath("trip"), QStringLiteral("Vacation"));
    QTRY_VERIFY_WITH_TIMEOUT(isDone(tracker, jobId), 10000);

    const vl::IndexJob job = *tracker.status(jobId);
    QVERIFY(job.error.has_value());
    QVERIFY(job.error->contains(QStringLiteral("Vacation")));
    QCOMPARE(job.state, vl::JobState::Failed);
    QCOMPARE(job.total, 2);
    QCOMPARE(m_catalog->size(), 2);
    QVERIFY(tags.imagesByTagName("Vacation").empty());
}

void TestJobTracker::testModelThrowingNonStandardTypeKeepsJobAlive()
{
    writeImages("photos", 1);

    // A model failure of any type still inserts the record without a vector.
    vl::test::FakeEmbeddingProvider provider;
    provider.setFailure(vl::test::FakeEmbeddingProvider::Failure::ThrowNonStandard);
    vl::ImageIndexer indexer(*m_catalog, *m_store, &provider);
    vl::JobTracker tracker(indexer, *m_tags);

    const QString jobId = tracker.submit(m_dir->filePath("photos"));
    QTRY_VERIFY_WITH_TIMEOUT(isDone(tracker, jobId), 10000);

    const vl::IndexJob job = *tracker.status(jobId);
    QVERIFY(!job.error.has_value());
    QCOMPARE(job.state, vl::JobState::Completed);
    QCOMPARE(job.total, 1);
    QVERIFY(provider.imageCalls() >= 1);
    QVERIFY(!m_catalog->records().front().hasEmbedding());
}

void TestJobTracker::testConcurrentJobsOnSameRoot()
{
    writeImages("shared", 6);

    const QString first = m_tracker->submit(m_dir->filePath("shared"));
    const QString second = m_tracker->submit(m_dir->filePath("shared"));
    QTRY_VERIFY_WITH_TIMEOUT(isDone(*m_tracker, first) && isDone(*m_tracker, second), 10000);

    const vl::IndexJob a = *m_tracker->status(first);
    const vl::IndexJob b = *m_tracker->status(second);
    QVERIFY(!a.error.has_value());
    QVERIFY(!b.error.has_value());
    QCOMPARE(a.total + b.total, 6);
    QCOMPARE(m_catalog->size(), 6);

    vl::ImageCatalog reopened(m_catalog->filePath());
    reopened.load();
    QCOMPARE(reopened.size(), 6);
}

void TestJobTracker::testJobsListedInSubmissionOrder()
{
    writeImages("a", 1);
    writeImages("b", 1);

    const QString first = m_tracker->submit(m_dir->filePath("a"));
    const QString second = m_tracker->submit(m_dir->filePath("b"));

    const std::vector<vl::IndexJob> jobs = m_tracker->jobs();
    QCOMPARE(static_cast<int>(jobs.size()), 2);
    QCOMPARE(jobs[0].jobId, first);
    QCOMPARE(jobs[1].jobId, second);

    QTRY_COMPARE_WITH_TIMEOUT(m_tracker->activeJobCount(), 0, 10000);
}

void TestJobTracker::testSubmitAfterShutdownFails()
{
    m_tracker->shutdown();

    const QString jobId = m_tracker->submit(m_dir->filePath("anything"));
    const std::optional<vl::IndexJob> job = m_tracker->status(jobId);
    QVERIFY(job.has_value());
    QVERIFY(job->done);
    QVERIFY(job->error.has_value());
    QCOMPARE(job->state, vl::JobState::Failed);
}

void TestJobTracker::testOldFinishedJobsAreEvicted()
{
    vl::JobTracker tracker(*m_indexer, *m_tags, 2);

    QStringList submitted;
    for (int i = 0; i < 5; ++i) {
        const QString jobId = tracker.submit(m_dir->filePath(QStringLiteral("empty_%1").arg(i)));
        QTRY_VERIFY_WITH_TIMEOUT(isDone(tracker, jobId), 10000);
        submitted.append(jobId);
    }

    // Each submit trims the finished jobs before registering the new one.
    QVERIFY(!tracker.status(submitted[0]).has_value());
    QVERIFY(!tracker.status(submitted[1]).has_value());
    QVERIFY(tracker.status(submitted[2]).has_value());

    const std::vector<vl::IndexJob> jobs = tracker.jobs();
    QCOMPARE(static_cast<int>(jobs.size()), 3);
    QCOMPARE(jobs[0].jobId, submitted[2]);
    QCOMPARE(jobs[2].jobId, submitted[4]);
}

void TestJobTracker::testPollerJsonShape()
{
    vl::IndexJob job;
    job.jobId = QStringLiteral("j1");
    job.path = QStringLiteral("/pics");
    job.progress = 40;
    job.total = 5;
    job.indexed = 2;

    QJsonObject json = vl::indexJobToJson(job);
    QCOMPARE(json.size(), 7);
    QCOMPARE(json.value("progress").toInt(), 40);
    QCOMPARE(json.value("total").toInt(), 5);
    QCOMPARE(json.value("indexed").toInt(), 2);
    QCOMPARE(json.value("done").toBool(), false);
    QCOMPARE(json.value("path").toString(), QStringLiteral("/pics"));
    QVERIFY(json.value("tag").isNull());
    QVERIFY(json.value("error").isNull());

    job.tag = QStringLiteral("Alice");
    job.error = QStringLiteral("disk full");
    job.done = true;
    json = vl::indexJobToJson(job);
    QCOMPARE(json.value("tag").toString(), QStringLiteral("Alice"));
    QCOMPARE(json.value("error").toString(), QStringLiteral("disk full"));
    QCOMPARE(json.value("done").toBool(), true);

    QCOMPARE(vl::jobStateToString(vl::JobState::Failed), QStringLiteral("failed"));
}

QTEST_GUILESS_MAIN(TestJobTracker)
#include "test_job_tracker.moc"
