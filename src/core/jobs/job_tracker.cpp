#include "core/jobs/job_tracker.h"
#include "core/indexing/image_indexer.h"
#include "core/shared/logging.h"
#include "core/tags/tag_manager.h"

#include <QJsonValue>
#include <QStringList>
#include <QUuid>

#include <algorithm>
#include <cstdint>
#include <exception>

namespace vl {

namespace {

// Images tagged per catalog write while reporting progress.
constexpr int kTagChunkSize = 32;

void markFailed(IndexJob& job, const QString& message)
{
    job.error = message;
    job.done = true;
    job.state = JobState::Failed;
}

} // namespace

QString jobStateToString(JobState state)
{
    switch (state) {
    case JobState::Created:   return QStringLiteral("created");
    case JobState::Running:   return QStringLiteral("running");
    case JobState::Completed: return QStringLiteral("completed");
    case JobState::Failed:    return QStringLiteral("failed");
    }
    return QStringLiteral("created");
}

QJsonObject indexJobToJson(const IndexJob& job)
{
    QJsonObject json;
    json.insert(QStringLiteral("progress"), job.progress);
    json.insert(QStringLiteral("total"), job.total);
    json.insert(QStringLiteral("done"), job.done);
    json.insert(QStringLiteral("indexed"), job.indexed);
    json.insert(QStringLiteral("path"), job.path);
    json.insert(QStringLiteral("tag"), job.tag ? QJsonValue(*job.tag) : QJsonValue());
    json.insert(QStringLiteral("error"), job.error ? QJsonValue(*job.error) : QJsonValue());
    return json;
}

JobTracker::JobTracker(ImageIndexer& indexer, TagManager& tags, int maxFinishedJobs)
    : m_indexer(indexer)
    , m_tags(tags)
    , m_maxFinishedJobs(std::max(0, maxFinishedJobs))
{
}

JobTracker::~JobTracker()
{
    shutdown();
}

QString JobTracker::submit(const QString& path, const std::optional<QString>& tag)
{
    auto entry = std::make_shared<JobEntry>();
    entry->job.jobId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    entry->job.path = path;
    if (tag && !tag->trimmed().isEmpty()) {
        entry->job.tag = tag->trimmed();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    reapFinishedLocked();
    m_jobs.emplace(entry->job.jobId, entry);
    m_order.push_back(entry->job.jobId);

    if (m_shutdown) {
        std::lock_guard<std::mutex> jobLock(entry->mutex);
        markFailed(entry->job, QStringLiteral("Job tracker is shut down"));
        return entry->job.jobId;
    }

    LOG_INFO(vlJobs, "Submitted index job %s for %s",
             qUtf8Printable(entry->job.jobId), qUtf8Printable(path));
    entry->thread = std::thread([this, entry]() { run(entry); });
    return entry->job.jobId;
}

std::optional<IndexJob> JobTracker::status(const QString& jobId) const
{
    std::shared_ptr<JobEntry> entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto it = m_jobs.find(jobId);
        if (it == m_jobs.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }

    std::lock_guard<std::mutex> jobLock(entry->mutex);
    return entry->job;
}

std::vector<IndexJob> JobTracker::jobs() const
{
    std::vector<IndexJob> result;
    std::lock_guard<std::mutex> lock(m_mutex);
    result.reserve(m_order.size());
    for (const QString& jobId : m_order) {
        const auto it = m_jobs.find(jobId);
        if (it == m_jobs.end()) {
            continue;
        }
        std::lock_guard<std::mutex> jobLock(it->second->mutex);
        result.push_back(it->second->job);
    }
    return result;
}

int JobTracker::activeJobCount() const
{
    int count = 0;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [_, entry] : m_jobs) {
        std::lock_guard<std::mutex> jobLock(entry->mutex);
        if (!entry->job.done) {
            ++count;
        }
    }
    return count;
}

void JobTracker::shutdown()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        for (auto& [_, entry] : m_jobs) {
            entry->cancel.cancel();
            if (entry->thread.joinable()) {
                threads.push_back(std::move(entry->thread));
            }
        }
    }

    for (std::thread& thread : threads) {
        thread.join();
    }
    if (!threads.empty()) {
        LOG_INFO(vlJobs, "Job tracker stopped, joined %d job threads",
                 static_cast<int>(threads.size()));
    }
}

void JobTracker::run(const std::shared_ptr<JobEntry>& entry)
{
    QString path;
    std::optional<QString> tag;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->job.state = JobState::Running;
        path = entry->job.path;
        tag = entry->job.tag;
    }

    try {
        const std::vector<ImageRecord> added = m_indexer.index(path, &entry->cancel);
        const int total = static_cast<int>(added.size());

        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->job.total = total;
            if (entry->cancel.isCancelled()) {
                markFailed(entry->job, QStringLiteral("Indexing cancelled"));
                return;
            }
            if (total == 0) {
                entry->job.progress = 100;
                entry->job.indexed = 0;
                entry->job.done = true;
                entry->job.state = JobState::Completed;
                LOG_INFO(vlJobs, "Job %s finished, nothing new under %s",
                         qUtf8Printable(entry->job.jobId), qUtf8Printable(path));
                return;
            }
        }

        int count = 0;
        for (size_t start = 0; start < added.size(); start += kTagChunkSize) {
            const size_t end = std::min(added.size(), start + kTagChunkSize);

            if (tag) {
                QStringList ids;
                for (size_t i = start; i < end; ++i) {
                    ids.append(added[i].id);
                }
                if (!m_tags.addTagToImages(ids, *tag)) {
                    std::lock_guard<std::mutex> lock(entry->mutex);
                    markFailed(entry->job, QStringLiteral("Failed to apply tag %1").arg(*tag));
                    LOG_ERROR(vlJobs, "Job %s could not persist tag %s at %d%%",
                              qUtf8Printable(entry->job.jobId), qUtf8Printable(*tag),
                              entry->job.progress);
                    return;
                }
            }

            for (size_t i = start; i < end; ++i) {
                ++count;
                std::lock_guard<std::mutex> lock(entry->mutex);
                entry->job.indexed = count;
                entry->job.progress = static_cast<int>(
                    (static_cast<int64_t>(count) * 100) / total);
            }
        }

        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->job.done = true;
        entry->job.state = JobState::Completed;
        LOG_INFO(vlJobs, "Job %s finished, %d new images under %s",
                 qUtf8Printable(entry->job.jobId), total, qUtf8Printable(path));
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        markFailed(entry->job, QString::fromUtf8(e.what()));
        LOG_ERROR(vlJobs, "Job %s failed at %d%%: %s",
                  qUtf8Printable(entry->job.jobId), entry->job.progress, e.what());
    } catch (...) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        markFailed(entry->job, QStringLiteral("Unknown error"));
        LOG_ERROR(vlJobs, "Job %s failed at %d%% with an unknown error",
                  qUtf8Printable(entry->job.jobId), entry->job.progress);
    }
}

void JobTracker::reapFinishedLocked()
{
    int finished = 0;
    for (auto& [_, entry] : m_jobs) {
        bool done = false;
        {
            std::lock_guard<std::mutex> jobLock(entry->mutex);
            done = entry->job.done;
        }
        if (!done) {
            continue;
        }
        if (entry->thread.joinable()) {
            entry->thread.join();
        }
        ++finished;
    }

    // Oldest first; running jobs are skipped.
    auto it = m_order.begin();
    while (finished > m_maxFinishedJobs && it != m_order.end()) {
        const auto found = m_jobs.find(*it);
        bool evict = found == m_jobs.end();
        if (!evict) {
            std::lock_guard<std::mutex> jobLock(found->second->mutex);
            evict = found->second->job.done;
        }
        if (!evict) {
            ++it;
            continue;
        }
        if (found != m_jobs.end()) {
            m_jobs.erase(found);
            --finished;
        }
        it = m_order.erase(it);
    }
}

} // namespace vl
