#pragma once

#include "core/shared/cancellation.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vl {

class ImageIndexer;
class TagManager;

enum class JobState {
    Created,
    Running,
    Completed,
    Failed,
};

QString jobStateToString(JobState state);

// Snapshot of one indexing job as seen by pollers.
struct IndexJob {
    QString jobId;
    QString path;
    std::optional<QString> tag;
    JobState state = JobState::Created;
    int progress = 0;   // 0-100
    int total = 0;      // new images found by this run
    int indexed = 0;
    bool done = false;
    std::optional<QString> error;
};

// Poller shape: {progress, total, done, indexed, path, tag, error}.
QJsonObject indexJobToJson(const IndexJob& job);

// JobTracker -- registry and runner of background indexing sweeps.
//
// submit() registers a job and starts it on its own thread without
// blocking. The owning thread is the only mutator of a job; status() copies
// a snapshot under the job's lock. A job becomes terminal (done) exactly
// once: on completion, or on the first error, which is captured into the
// job instead of propagating. Cancellation is not offered to callers;
// shutdown() cancels running sweeps and joins their threads.
//
// Running jobs are always kept. Once more than maxFinishedJobs jobs are
// done, the oldest finished ones are evicted on the next submit() and
// status() no longer knows them.
class JobTracker {
public:
    static constexpr int kDefaultMaxFinishedJobs = 256;

    JobTracker(ImageIndexer& indexer, TagManager& tags,
               int maxFinishedJobs = kDefaultMaxFinishedJobs);
    ~JobTracker();

    JobTracker(const JobTracker&) = delete;
    JobTracker& operator=(const JobTracker&) = delete;

    QString submit(const QString& path, const std::optional<QString>& tag = std::nullopt);
    std::optional<IndexJob> status(const QString& jobId) const;

    // All jobs in submission order.
    std::vector<IndexJob> jobs() const;
    int activeJobCount() const;

    void shutdown();

private:
    struct JobEntry {
        mutable std::mutex mutex;
        IndexJob job;
        CancellationToken cancel;
        std::thread thread;
    };

    void run(const std::shared_ptr<JobEntry>& entry);
    void reapFinishedLocked();

    ImageIndexer& m_indexer;
    TagManager& m_tags;
    const int m_maxFinishedJobs;

    mutable std::mutex m_mutex;
    std::unordered_map<QString, std::shared_ptr<JobEntry>> m_jobs;
    std::vector<QString> m_order;
    bool m_shutdown = false;
};

} // namespace vl
