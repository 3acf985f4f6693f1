/**
 * DownloadManager.cpp
 *
 * Implementation of the parallel pull manager.
 */

#include "DownloadManager.hpp"
#include "../Logger.hpp"
#include "../models/MetadataText.hpp"
#include "../transfer/StreamSink.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace homestream::core::downloader {

namespace fs = std::filesystem;
using utils::FileUtils;
using utils::StringUtils;

// -- DownloadManagerConfig --

DownloadManagerConfig DownloadManagerConfig::fromJson(const nlohmann::json& togo, const nlohmann::json& receivers) {
    DownloadManagerConfig config;

    try {
        if (togo.is_object()) {
            config.defaultConcurrency = togo.value("concurrency", config.defaultConcurrency);
            config.maxAttempts = togo.value("maxAttempts", config.maxAttempts);
            config.retryDelay = std::chrono::milliseconds(togo.value("retryDelayMs", 2000));
            config.connectTimeoutSec = togo.value("connectTimeoutSec", config.connectTimeoutSec);
            config.readTimeoutSec = togo.value("readTimeoutSec", config.readTimeoutSec);
            config.retainFinished = togo.value("retainFinished", config.retainFinished);
            config.syncAction = parseSyncErrorAction(togo.value("tsErrorMode", "reject"));
            config.saveMetadata = togo.value("saveMetadata", config.saveMetadata);
        }

        if (receivers.is_object()) {
            for (const auto& [unit, settings] : receivers.items()) {
                ReceiverSettings receiver;
                receiver.name = settings.value("name", unit);
                receiver.mak = settings.value("mak", "");
                receiver.concurrency = settings.value("concurrency", 0);
                receiver.address = settings.value("address", "");
                receiver.protocol = settings.value("protocol", receiver.protocol);
                receiver.port = settings.value("port", receiver.protocol == "http" ? 80 : 443);
                if (receiver.concurrency < 0) {
                    throw ConfigError("receivers." + unit + ".concurrency must not be negative");
                }
                if (receiver.protocol != "http" && receiver.protocol != "https") {
                    throw ConfigError("receivers." + unit + ".protocol must be http or https");
                }
                config.receivers[unit] = receiver;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid togo settings: ") + e.what());
    }

    if (config.defaultConcurrency < 1) {
        throw ConfigError("togo.concurrency must be at least 1");
    }
    if (config.maxAttempts < 1) {
        throw ConfigError("togo.maxAttempts must be at least 1");
    }
    if (config.retryDelay.count() < 0) {
        throw ConfigError("togo.retryDelayMs must not be negative");
    }

    return config;
}

// -- DownloadManager --

DownloadManager::DownloadManager(DownloadManagerConfig config)
    : m_config(std::move(config)) {
    LOG_INFO("DownloadManager initialized (default concurrency: {}, max attempts: {})",
             m_config.defaultConcurrency, m_config.maxAttempts);
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::setSourceFactory(SourceFactory factory) {
    m_sourceFactory = std::move(factory);
}

void DownloadManager::setDecoder(std::shared_ptr<Decoder> decoder) {
    m_decoder = std::move(decoder);
}

void DownloadManager::setCompletionCallback(DownloadCompleteCallback callback) {
    m_completeCallback = std::move(callback);
}

std::string DownloadManager::enqueue(const Recording& recording,
                                     const std::string& destinationDir,
                                     const NamingConfig& naming,
                                     ErrorMode errorMode,
                                     std::optional<DownloadOptions> options) {
    // Template errors surface here, before anything is queued
    NamingResolver resolver(naming);

    if (destinationDir.empty()) {
        throw ConfigError("no destination directory for " + recording.title);
    }

    DownloadOptions opts;
    if (options) {
        opts = *options;
    } else {
        opts.maxAttempts = m_config.maxAttempts;
        opts.retryDelay = m_config.retryDelay;
        opts.syncAction = m_config.syncAction;
        opts.saveMetadata = m_config.saveMetadata;
    }
    if (opts.maxAttempts < 1) {
        throw ConfigError("maxAttempts must be at least 1");
    }

    if (!m_running) {
        throw std::runtime_error("DownloadManager is shut down");
    }

    DownloadTask task;
    task.id = generateTaskId();
    task.recording = recording;
    if (!task.recording.dateRecorded) {
        task.recording.dateRecorded = std::chrono::system_clock::now();
    }
    task.destinationDir = destinationDir;
    task.errorMode = errorMode;
    task.options = opts;

    const std::string unit = task.recording.unit();
    if (task.options.mak.empty()) {
        auto it = m_config.receivers.find(unit);
        if (it != m_config.receivers.end()) {
            task.options.mak = it->second.mak;
        }
    }

    auto record = std::make_shared<TaskRecord>(std::move(task), std::move(resolver));

    auto now = std::chrono::system_clock::now();
    TaskStatus& status = record->status;
    status.id = record->task.id;
    status.recordingId = record->task.recording.id;
    status.title = record->task.recording.title;
    status.unit = unit;
    status.state = TransferState::Queued;
    status.maxAttempts = record->task.options.maxAttempts;
    status.created = now;
    status.updated = now;

    const std::string taskId = record->task.id;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks[taskId] = record;
        m_order.push_back(taskId);

        poolFor(unit).submit([this, record]() {
            runTask(record);
        });
    }

    LOG_INFO("Queued {} \"{}\" from {} -> {} (error mode: {})",
             taskId, recording.title, unit, destinationDir, toString(errorMode));

    return taskId;
}

std::optional<TaskStatus> DownloadManager::status(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second->status;
}

std::vector<TaskStatus> DownloadManager::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<TaskStatus> result;
    result.reserve(m_order.size());
    for (const auto& id : m_order) {
        auto it = m_tasks.find(id);
        if (it != m_tasks.end()) {
            result.push_back(it->second->status);
        }
    }
    return result;
}

bool DownloadManager::cancel(const std::string& taskId) {
    std::optional<TaskStatus> cancelledQueued;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_tasks.find(taskId);
        if (it == m_tasks.end() || it->second->status.isTerminal()) {
            return false;
        }

        auto& record = *it->second;
        record.cancelled = true;

        // Not yet picked up by a worker: fail without ever connecting
        if (record.status.state == TransferState::Queued && !record.claimed) {
            record.status.state = TransferState::Failed;
            record.status.lastErrorKind = ErrorKind::Cancelled;
            record.status.lastError = "cancelled";
            record.status.updated = std::chrono::system_clock::now();
            cancelledQueued = record.status;
        }
    }

    m_changed.notify_all();
    LOG_INFO("Cancel requested for {}", taskId);

    if (cancelledQueued && m_completeCallback) {
        m_completeCallback(*cancelledQueued);
    }
    return true;
}

bool DownloadManager::unqueueLocked(const std::string& taskId) {
    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return false;
    }

    auto& record = *it->second;
    if (record.status.state != TransferState::Queued || record.claimed) {
        return false;
    }

    // The pool still holds the record; a terminal state makes the worker skip it
    record.cancelled = true;
    record.status.state = TransferState::Failed;
    record.status.lastErrorKind = ErrorKind::Cancelled;
    record.status.lastError = "unqueued";

    m_tasks.erase(it);
    m_order.erase(std::remove(m_order.begin(), m_order.end(), taskId), m_order.end());
    return true;
}

bool DownloadManager::unqueue(const std::string& taskId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!unqueueLocked(taskId)) {
            return false;
        }
    }
    m_changed.notify_all();
    LOG_INFO("Removed {} from the queue", taskId);
    return true;
}

size_t DownloadManager::unqueueAll(const std::string& unit) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> ids;
        for (const auto& id : m_order) {
            auto it = m_tasks.find(id);
            if (it != m_tasks.end() && (unit.empty() || it->second->status.unit == unit)) {
                ids.push_back(id);
            }
        }
        for (const auto& id : ids) {
            if (unqueueLocked(id)) ++removed;
        }
    }

    if (removed > 0) {
        m_changed.notify_all();
        LOG_INFO("Removed {} task(s) from the queue{}", removed, unit.empty() ? "" : " of " + unit);
    }
    return removed;
}

bool DownloadManager::acknowledge(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end() || !it->second->status.isTerminal()) {
        return false;
    }

    if (!m_config.retainFinished) {
        m_tasks.erase(it);
        m_order.erase(std::remove(m_order.begin(), m_order.end(), taskId), m_order.end());
    }
    return true;
}

size_t DownloadManager::pruneFinished(std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto cutoff = std::chrono::system_clock::now() - maxAge;
    size_t removed = 0;

    for (auto it = m_tasks.begin(); it != m_tasks.end(); ) {
        const auto& status = it->second->status;
        if (status.isTerminal() && status.updated <= cutoff) {
            m_order.erase(std::remove(m_order.begin(), m_order.end(), it->first), m_order.end());
            it = m_tasks.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG("Pruned {} finished task(s)", removed);
    }
    return removed;
}

bool DownloadManager::waitFor(const std::string& taskId, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_changed.wait_for(lock, timeout, [&] {
        auto it = m_tasks.find(taskId);
        return it == m_tasks.end() || it->second->status.isTerminal();
    });
}

void DownloadManager::waitForAll() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_changed.wait(lock, [this] {
        for (const auto& [id, record] : m_tasks) {
            if (!record->status.isTerminal()) return false;
        }
        return true;
    });
}

void DownloadManager::shutdown() {
    if (!m_running.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down DownloadManager");

    std::unordered_map<std::string, std::unique_ptr<ThreadPool>> pools;
    std::vector<TaskStatus> cancelledQueued;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = std::chrono::system_clock::now();
        for (const auto& id : m_order) {
            auto it = m_tasks.find(id);
            if (it == m_tasks.end()) continue;
            auto& record = *it->second;
            if (record.status.isTerminal()) continue;
            record.cancelled = true;
            if (record.status.state == TransferState::Queued && !record.claimed) {
                record.status.state = TransferState::Failed;
                record.status.lastErrorKind = ErrorKind::Cancelled;
                record.status.lastError = "cancelled";
                record.status.updated = now;
                cancelledQueued.push_back(record.status);
            }
        }
        pools = std::move(m_pools);
        m_pools.clear();
    }
    m_changed.notify_all();

    if (m_completeCallback) {
        for (const auto& status : cancelledQueued) {
            m_completeCallback(status);
        }
    }

    // Joins the workers
    pools.clear();
}

size_t DownloadManager::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& [id, record] : m_tasks) {
        auto state = record->status.state;
        if (state != TransferState::Queued && !isTerminal(state)) ++count;
    }
    return count;
}

size_t DownloadManager::queuedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& [id, record] : m_tasks) {
        if (record->status.state == TransferState::Queued) ++count;
    }
    return count;
}

std::unique_ptr<StreamSource> DownloadManager::createDefaultSource(const DownloadTask& task) const {
    const auto& locator = task.recording.source;

    if (locator.type == SourceLocator::Type::LocalPath) {
        return std::make_unique<FileSource>(locator.path);
    }

    std::string url = locator.url;
    if (task.recording.streamKind == StreamKind::TS && url.find("Format=") == std::string::npos) {
        url += (url.find('?') == std::string::npos ? "?" : "&");
        url += "Format=video/x-tivo-mpeg-ts";
    }

    ReceiverEndpoint endpoint;
    endpoint.mak = task.options.mak;
    endpoint.connectTimeoutSeconds = m_config.connectTimeoutSec;
    endpoint.readTimeoutSeconds = m_config.readTimeoutSec;
    return std::make_unique<ReceiverSource>(url, endpoint);
}

// -- Workers --

ThreadPool& DownloadManager::poolFor(const std::string& unit) {
    auto it = m_pools.find(unit);
    if (it == m_pools.end()) {
        int workers = concurrencyFor(unit);
        it = m_pools.emplace(unit, std::make_unique<ThreadPool>(static_cast<size_t>(workers), "togo:" + unit)).first;
        LOG_DEBUG("Created pool for {} with {} worker(s)", unit, workers);
    }
    return *it->second;
}

int DownloadManager::concurrencyFor(const std::string& unit) const {
    auto it = m_config.receivers.find(unit);
    if (it != m_config.receivers.end() && it->second.concurrency > 0) {
        return it->second.concurrency;
    }
    return std::max(1, m_config.defaultConcurrency);
}

template<typename Fn>
void DownloadManager::update(TaskRecord& record, Fn&& fn) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (record.status.isTerminal()) return;
        fn(record.status);
        record.status.updated = std::chrono::system_clock::now();
    }
    m_changed.notify_all();
}

void DownloadManager::finish(TaskRecord& record, TransferState state, ErrorKind kind, const std::string& error) {
    TaskStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (record.status.isTerminal()) return;
        record.status.state = state;
        if (state == TransferState::Failed) {
            record.status.lastErrorKind = kind;
            record.status.lastError = error;
        }
        record.status.finalPath = record.task.finalPath;
        record.status.syncErrorCount = record.task.syncErrors.size();
        record.status.corruptPackets = state == TransferState::Complete ? record.task.corruptPackets : 0;
        record.status.updated = std::chrono::system_clock::now();
        snapshot = record.status;
    }
    m_changed.notify_all();

    if (state == TransferState::Complete) {
        LOG_INFO("Done getting \"{}\" -> {} ({} after {} attempt(s))",
                 snapshot.title, snapshot.finalPath,
                 StringUtils::formatBytes(static_cast<int64_t>(snapshot.bytes)), snapshot.attempt);
    } else {
        LOG_WARN("Gave up on \"{}\" after {} attempt(s): {}", snapshot.title, snapshot.attempt, error);
    }

    if (m_completeCallback) {
        m_completeCallback(snapshot);
    }
}

void DownloadManager::runTask(const std::shared_ptr<TaskRecord>& record) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (record->status.isTerminal()) {
            return;   // cancelled while queued
        }
        record->claimed = true;
    }

    DownloadTask& task = record->task;

    bool decode = task.options.decode && m_decoder != nullptr;
    if (task.options.decode && !m_decoder) {
        LOG_WARN("{}: no decoder configured, keeping the encrypted recording", task.id);
    }

    const bool keepBest = task.options.syncAction == SyncErrorAction::Best;

    for (int attempt = 1; attempt <= task.options.maxAttempts; ++attempt) {
        if (record->cancelled || !m_running) {
            discardBest(task);
            finish(*record, TransferState::Failed, ErrorKind::Cancelled, "cancelled");
            return;
        }

        task.attemptCount = attempt;
        update(*record, [attempt](TaskStatus& s) {
            s.attempt = attempt;
            s.bytes = 0;
        });

        TransferResult result;
        try {
            result = runAttempt(*record, attempt, decode);

            for (const auto& e : result.syncErrors) {
                task.syncErrors.push_back(SyncErrorRecord{e.offset, e.packetCount, e.foundByte, attempt});
            }
            writeReport(*record, attempt, result);
        } catch (const std::exception& e) {
            LOG_ERROR("{}: attempt {} raised: {}", task.id, attempt, e.what());
            discardBest(task);
            finish(*record, TransferState::Failed, ErrorKind::None, e.what());
            return;
        }

        if (result.errorKind == ErrorKind::Cancelled) {
            discardBest(task);
            finish(*record, TransferState::Failed, ErrorKind::Cancelled, "cancelled");
            return;
        }

        bool improved = false;
        if (result.success()) {
            if (!keepBest || result.corruptPackets == 0) {
                discardBest(task);
                task.finalPath = result.finalPath;
                task.corruptPackets = result.corruptPackets;
                finish(*record, TransferState::Complete, ErrorKind::None, "");
                return;
            }

            // Fewer corrupt packets than anything kept so far
            discardBest(task);
            task.bestPath = result.finalPath;
            task.corruptPackets = result.corruptPackets;
            improved = true;
            LOG_INFO("{}: keeping attempt {} with {} corrupt packet(s)", task.id, attempt, result.corruptPackets);
        }

        update(*record, [&](TaskStatus& s) {
            s.lastErrorKind = improved ? ErrorKind::StreamCorruption : result.errorKind;
            s.lastError = improved ? std::to_string(result.corruptPackets) + " corrupt packet(s)" : result.error;
            s.syncErrorCount = task.syncErrors.size();
        });

        bool again = attempt < task.options.maxAttempts && (improved || isRetryable(result.errorKind));
        if (!again) {
            if (!task.bestPath.empty()) {
                task.finalPath = task.bestPath;
                task.bestPath.clear();
                finish(*record, TransferState::Complete, ErrorKind::None, "");
            } else {
                finish(*record, TransferState::Failed, result.errorKind, result.error);
            }
            return;
        }

        update(*record, [](TaskStatus& s) { s.state = TransferState::Retrying; });
        LOG_INFO("Transfer error detected, retrying {} ({}/{})", task.id, attempt + 1, task.options.maxAttempts);

        std::unique_lock<std::mutex> lock(m_mutex);
        m_changed.wait_for(lock, task.options.retryDelay, [&] {
            return record->cancelled.load() || !m_running;
        });
    }
}

void DownloadManager::discardBest(DownloadTask& task) {
    if (task.bestPath.empty()) {
        return;
    }
    LOG_DEBUG("{}: dropping {}", task.id, task.bestPath);
    FileUtils::deleteFile(task.bestPath);
    FileUtils::deleteFile(MetadataText::sidecarPath(task.bestPath));
    task.bestPath.clear();
    task.corruptPackets = 0;
}

TransferResult DownloadManager::runAttempt(TaskRecord& record, int attempt, bool decode) {
    DownloadTask& task = record.task;
    const fs::path dir(task.destinationDir);
    const std::string prefix = "." + task.id + ".attempt" + std::to_string(attempt);
    const std::string working = (dir / (prefix + ".part")).string();
    const std::string decoded = (dir / (prefix + ".decoded.part")).string();

    std::unique_ptr<StreamSource> source;
    try {
        source = m_sourceFactory ? m_sourceFactory(task) : createDefaultSource(task);
    } catch (const HomeStreamError& e) {
        TransferResult result;
        result.errorKind = e.kind();
        result.error = e.what();
        return result;
    }
    if (!source) {
        TransferResult result;
        result.errorKind = ErrorKind::Connect;
        result.error = "no source for " + task.recording.id;
        return result;
    }

    FileSink sink(working);

    SessionOptions options;
    options.direction = Direction::Pull;
    options.streamKind = task.recording.streamKind;
    options.validate = task.options.validate;
    if (task.options.syncAction != SyncErrorAction::Reject) {
        options.syncPolicy = SyncPolicy::Tolerate;
        if (task.options.syncAction == SyncErrorAction::Best && !task.bestPath.empty()) {
            options.corruptPacketLimit = task.corruptPackets;
        }
    } else {
        options.syncPolicy = task.errorMode == ErrorMode::All ? SyncPolicy::CollectAll : SyncPolicy::AbortOnFirst;
    }
    options.attempt = attempt;
    options.label = task.id + " \"" + task.recording.title + "\"";

    TransferSession session(*source, sink, options, &record.cancelled);

    session.setStateListener([this, &record](TransferState state) {
        if (isTerminal(state)) return;   // the task decides Complete/Failed
        update(record, [state](TaskStatus& s) { s.state = state; });
    });

    session.setProgressListener([this, &record](uint64_t bytes) {
        update(record, [bytes](TaskStatus& s) { s.bytes = bytes; });
    });

    if (decode) {
        session.setDecodeStep([this, &task, &working, &decoded]() {
            m_decoder->decode(working, decoded, task.options.mak);
            FileUtils::deleteFile(working);
        });
    }

    session.setFinalizeStep([&task, &record, &session, &dir, &working, &decoded, decode, attempt]() -> std::string {
        std::string stem = StringUtils::trim(record.resolver.resolve(task.recording));
        if (stem.empty()) {
            stem = task.id;
        }
        // "Title (^12_2)": 12 corrupt packets, attempt 2
        if (uint64_t corrupt = session.corruptPackets(); corrupt > 0) {
            stem += " (^" + std::to_string(corrupt) + "_" + std::to_string(attempt) + ")";
        }

        std::string extension;
        if (decode || !task.recording.source.encrypted) {
            extension = task.recording.streamKind == StreamKind::TS ? ".ts" : ".ps";
        } else {
            extension = ".tivo";
        }

        const std::string& from = decode ? decoded : working;
        auto finalPath = FileUtils::moveToUniquePath(from, dir, stem, extension);
        if (!finalPath) {
            throw std::runtime_error("cannot move " + from + " into " + dir.string());
        }

        if (task.options.saveMetadata) {
            std::string sidecar = MetadataText::sidecarPath(finalPath->string());
            if (!MetadataText::write(task.recording, sidecar)) {
                LOG_WARN("{}: cannot write {}", task.id, sidecar);
            }
        }
        return finalPath->string();
    });

    TransferResult result = session.run();

    if (!result.success()) {
        FileUtils::deleteFile(working);
        FileUtils::deleteFile(decoded);
    }

    return result;
}

void DownloadManager::writeReport(TaskRecord& record, int attempt, const TransferResult& result) {
    DownloadTask& task = record.task;

    switch (task.errorMode) {
        case ErrorMode::None:
            return;
        case ErrorMode::First:
            if ((result.success() && result.syncErrors.empty()) || task.reportWritten) return;
            break;
        case ErrorMode::All:
            break;
    }

    AttemptReport report;
    report.taskId = task.id;
    report.receiver = task.recording.unit();
    report.recordingId = task.recording.id;
    report.title = task.recording.title;
    report.attempt = attempt;
    report.maxAttempts = task.options.maxAttempts;
    report.startOffset = result.startOffset;
    report.success = result.success();
    report.errorKind = result.errorKind;
    report.error = result.error;
    report.bytes = result.bytes;
    report.syncErrors = result.syncErrors;
    report.time = std::chrono::system_clock::now();

    ReportWriter writer((fs::path(task.destinationDir) / "reports").string());
    if (auto path = writer.write(report)) {
        task.reportWritten = true;
        update(record, [&path](TaskStatus& s) { s.reports.push_back(*path); });
    }
}

std::string DownloadManager::generateTaskId() {
    return "dl_" + std::to_string(++m_nextTaskId);
}

} // namespace homestream::core::downloader
