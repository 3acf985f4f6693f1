#pragma once

/**
 * DownloadManager.hpp
 *
 * Pulls recordings off receiver units.
 * One bounded worker pool per unit; tasks beyond the pool's size wait in
 * its FIFO queue.
 */

#include "DownloadTask.hpp"
#include "SyncErrorReport.hpp"
#include "../ThreadPool.hpp"
#include "../naming/NamingResolver.hpp"
#include "../transfer/Decoder.hpp"
#include "../transfer/StreamSource.hpp"
#include "../transfer/TransferSession.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace homestream::core::downloader {

/**
 * Per-receiver settings ("receivers.<unit>")
 */
struct ReceiverSettings {
    std::string name;
    std::string mak;
    int concurrency{0};   // 0 = manager default

    // Where the Now Playing list is read from; empty = not browsable
    std::string address;
    std::string protocol{"https"};
    int port{443};
};

/**
 * Manager-wide settings ("togo" section)
 */
struct DownloadManagerConfig {
    int defaultConcurrency{1};
    int maxAttempts{3};
    std::chrono::milliseconds retryDelay{2000};
    int connectTimeoutSec{30};
    int readTimeoutSec{180};
    bool retainFinished{true};
    SyncErrorAction syncAction{SyncErrorAction::Reject};
    bool saveMetadata{false};
    std::map<std::string, ReceiverSettings> receivers;

    /**
     * @throws ConfigError on out-of-range values
     */
    static DownloadManagerConfig fromJson(const nlohmann::json& togo, const nlohmann::json& receivers);
};

/**
 * Creates the byte source for an attempt
 */
using SourceFactory = std::function<std::unique_ptr<StreamSource>(const DownloadTask& task)>;

/**
 * Called once when a task reaches Complete or Failed
 */
using DownloadCompleteCallback = std::function<void(const TaskStatus& status)>;

/**
 * DownloadManager - Parallel pull management
 *
 * Features:
 * - Per-unit worker pools with a configurable concurrency ceiling
 * - Sequential retry attempts with a cancellable delay
 * - Transport stream validation; damaged streams rejected, kept as the
 *   best of several attempts, or kept as they are
 * - Attempt reports (none / first / all)
 * - Template naming, collision-free finalization
 */
class DownloadManager {
public:
    explicit DownloadManager(DownloadManagerConfig config = {});
    ~DownloadManager();

    // Disable copy
    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    void setSourceFactory(SourceFactory factory);
    void setDecoder(std::shared_ptr<Decoder> decoder);
    void setCompletionCallback(DownloadCompleteCallback callback);

    /**
     * Queue a pull
     * @throws ConfigError (TemplateFieldError for a bad naming template);
     *         no task is created in that case
     * @return Task ID
     */
    std::string enqueue(const Recording& recording,
                        const std::string& destinationDir,
                        const NamingConfig& naming,
                        ErrorMode errorMode,
                        std::optional<DownloadOptions> options = std::nullopt);

    std::optional<TaskStatus> status(const std::string& taskId) const;
    std::vector<TaskStatus> list() const;

    /**
     * Request cancellation. A queued task fails immediately; a running one
     * stops at its next state boundary or chunk.
     * @return false if the task is unknown or already finished
     */
    bool cancel(const std::string& taskId);

    /**
     * Take a task that no worker has picked up out of the queue. The task
     * is forgotten; no completion callback fires for it.
     * @return false if the task is unknown or already started
     */
    bool unqueue(const std::string& taskId);

    /**
     * unqueue() every waiting task, or only those of one unit
     * @return Number of tasks removed
     */
    size_t unqueueAll(const std::string& unit = "");

    /**
     * Acknowledge a finished task; forgets it unless finished tasks are retained
     * @return false if the task is unknown or still running
     */
    bool acknowledge(const std::string& taskId);

    /**
     * Forget finished tasks older than maxAge
     * @return Number of tasks removed
     */
    size_t pruneFinished(std::chrono::seconds maxAge);

    /**
     * Wait for a task to finish
     * @return true if the task is finished (or unknown) before the timeout
     */
    bool waitFor(const std::string& taskId, std::chrono::milliseconds timeout) const;

    void waitForAll() const;

    /**
     * Cancel everything and join the workers. Tasks that were still
     * queued fail as cancelled and are reported to the completion callback.
     */
    void shutdown();

    size_t activeCount() const;
    size_t queuedCount() const;

    const DownloadManagerConfig& config() const { return m_config; }

    /**
     * Default source: local file, or the receiver download URL
     */
    std::unique_ptr<StreamSource> createDefaultSource(const DownloadTask& task) const;

private:
    struct TaskRecord {
        DownloadTask task;
        NamingResolver resolver;
        std::atomic<bool> cancelled{false};
        bool claimed{false};  // picked up by a worker; guarded by m_mutex
        TaskStatus status;   // guarded by m_mutex

        TaskRecord(DownloadTask t, NamingResolver r)
            : task(std::move(t)), resolver(std::move(r)) {}
    };

    ThreadPool& poolFor(const std::string& unit);
    int concurrencyFor(const std::string& unit) const;

    void runTask(const std::shared_ptr<TaskRecord>& record);
    TransferResult runAttempt(TaskRecord& record, int attempt, bool decode);
    void discardBest(DownloadTask& task);
    bool unqueueLocked(const std::string& taskId);
    void writeReport(TaskRecord& record, int attempt, const TransferResult& result);

    template<typename Fn>
    void update(TaskRecord& record, Fn&& fn);
    void finish(TaskRecord& record, TransferState state, ErrorKind kind, const std::string& error);

    std::string generateTaskId();

private:
    DownloadManagerConfig m_config;
    SourceFactory m_sourceFactory;
    std::shared_ptr<Decoder> m_decoder;
    DownloadCompleteCallback m_completeCallback;

    std::unordered_map<std::string, std::shared_ptr<TaskRecord>> m_tasks;
    std::vector<std::string> m_order;   // enqueue order, for list()
    std::unordered_map<std::string, std::unique_ptr<ThreadPool>> m_pools;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_changed;

    std::atomic<bool> m_running{true};
    std::atomic<uint64_t> m_nextTaskId{0};
};

} // namespace homestream::core::downloader
