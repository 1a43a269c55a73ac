#include "sync_coordinator.hpp"

#include <algorithm>
#include <deque>
#include <set>

#include "capability/capability_codec.hpp"
#include "events/event_types.hpp"
#include "logging/logger.hpp"

namespace skysync {
namespace sync {

namespace {
constexpr std::chrono::milliseconds kMinPollInterval{1000};
constexpr int64_t kMsPerDay = 24LL * 60 * 60 * 1000;
}  // namespace

SyncCoordinator::SyncCoordinator(registry::DeviceRegistry &registry, state::StateStore &store,
                                 governor::RateGovernor &governor, transport::ICloudTransport &transport,
                                 const SyncConfig &config)
    : registry_(registry), store_(store), governor_(governor), transport_(transport), config_(config) {}

SyncCoordinator::~SyncCoordinator() { stop(); }

bool SyncCoordinator::refresh_device_list(std::string &error) {
    phase_ = SyncPhase::GATING;
    auto grant = governor_.try_acquire(governor::CallPriority::ROUTINE);
    if (!grant.granted) {
        phase_ = SyncPhase::IDLE;
        error = "device list refresh deferred: quota reserve reached";
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.device_list_failures++;
        return false;
    }

    phase_ = SyncPhase::FETCHING;
    std::vector<transport::DeviceDescriptor> descriptors;
    transport::TransportError terr;
    if (!transport_.list_devices(descriptors, terr)) {
        if (terr.error_class == transport::TransportErrorClass::QUOTA_EXHAUSTED) {
            governor_.observe_exhausted();
        }
        phase_ = SyncPhase::IDLE;
        error = "device list refresh failed: " + terr.message;
        LOG_WARN("[Sync] " << error);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.device_list_failures++;
        return false;
    }

    phase_ = SyncPhase::PARSING;
    std::vector<registry::Device> devices;
    devices.reserve(descriptors.size());
    for (const auto &desc : descriptors) {
        devices.push_back(registry::build_device(desc));
    }

    phase_ = SyncPhase::MERGING;
    auto result = registry_.reconcile(devices);

    for (const auto &id : result.removed) {
        store_.remove_device(id);
    }
    for (const auto &device : devices) {
        bool is_new = std::find(result.added.begin(), result.added.end(), device.device_id) != result.added.end();
        bool is_changed =
            std::find(result.changed.begin(), result.changed.end(), device.device_id) != result.changed.end();
        if (is_new || is_changed || !store_.has_device(device.device_id)) {
            store_.register_device(device);
        }
    }

    phase_ = SyncPhase::IDLE;
    LOG_DEBUG("[Sync] Device list refreshed: " << devices.size() << " device(s)");

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.device_list_refreshes++;
    return true;
}

bool SyncCoordinator::fetch_and_merge(const registry::Device &device, std::string &error) {
    phase_ = SyncPhase::FETCHING;
    nlohmann::json payload;
    transport::TransportError terr;
    if (!transport_.fetch_state(device.address(), payload, terr)) {
        if (terr.error_class == transport::TransportErrorClass::QUOTA_EXHAUSTED) {
            governor_.observe_exhausted();
        }
        error = terr.message;
        store_.mark_stale(device.device_id, "fetch failed: " + terr.message);
        return false;
    }

    phase_ = SyncPhase::PARSING;
    std::vector<capability::ParseIssue> issues;
    auto capabilities = capability::parse_capabilities(device.device_id, device.capabilities, payload, issues);

    bool payload_unusable = false;
    for (const auto &issue : issues) {
        LOG_WARN("[Sync] " << capability::describe_issue(issue));
        if (issue.instance.empty()) {
            payload_unusable = true;
        }
    }
    if (payload_unusable) {
        error = "state payload for " + device.device_id + " could not be parsed";
        store_.mark_stale(device.device_id, error);
        return false;
    }

    phase_ = SyncPhase::MERGING;
    store_.merge(device.device_id, capabilities, state::MergeMode::FULL_REFRESH);
    return true;
}

CycleReport SyncCoordinator::poll_once() {
    CycleReport report;
    const auto start = std::chrono::steady_clock::now();
    const auto devices = registry_.get_all_devices();
    const uint64_t cycle = ++cycle_seq_;
    active_cycle_ = cycle;

    std::deque<const registry::Device *> queue;
    for (const auto &device : devices) {
        queue.push_back(&device);
    }
    // Devices already moved to the back once because a command held their I/O
    std::set<std::string> requeued;

    while (!queue.empty()) {
        if (cancel_cycle_ == cycle || stop_requested_.load()) {
            report.cancelled = true;
            report.deferred = queue.size();
            LOG_INFO("[Sync] Poll cycle cancelled with " << report.deferred << " device(s) remaining");
            break;
        }

        const registry::Device &device = *queue.front();
        queue.pop_front();

        auto io = store_.try_lock_device_io(device.device_id);
        if (!io.owns_lock()) {
            if (!store_.has_device(device.device_id)) {
                continue;  // removed since the cycle started
            }
            if (requeued.insert(device.device_id).second) {
                queue.push_back(&device);
            } else {
                // The in-flight command reconciles this device when it completes
                report.busy++;
                LOG_DEBUG("[Sync] " << device.device_id << " has a command in flight, skipped this cycle");
            }
            continue;
        }

        phase_ = SyncPhase::GATING;
        auto grant = governor_.try_acquire(governor::CallPriority::ROUTINE);
        if (!grant.granted) {
            report.skipped = report.refreshed == 0 && report.failed == 0;
            report.deferred = queue.size() + 1;
            store_.mark_stale(device.device_id, "poll skipped: quota reserve reached");
            for (const auto *rest : queue) {
                store_.mark_stale(rest->device_id, "poll skipped: quota reserve reached");
            }
            if (report.skipped) {
                LOG_DEBUG("[Sync] Poll cycle skipped, quota gate closed (retry in "
                          << grant.retry_after.count() / 1000 << "s)");
            } else {
                LOG_WARN("[Sync] Quota gate closed mid-cycle, " << report.deferred << " device(s) marked stale");
            }
            break;
        }

        std::string error;
        if (fetch_and_merge(device, error)) {
            report.refreshed++;
        } else {
            report.failed++;
            LOG_WARN("[Sync] Refresh failed for " << device.device_id << ": " << error);
        }
    }

    phase_ = SyncPhase::IDLE;
    active_cycle_ = 0;

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    record_cycle(report, duration);
    return report;
}

void SyncCoordinator::record_cycle(const CycleReport &report, std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (report.skipped) {
        stats_.cycles_skipped++;
    } else {
        stats_.cycles_run++;
    }
    if (report.cancelled) {
        stats_.cycles_cancelled++;
    }
    stats_.device_refreshes += report.refreshed;
    stats_.device_failures += report.failed;
    stats_.last_cycle_duration = duration;
    stats_.last_cycle_at_ms = events::now_epoch_ms();
}

bool SyncCoordinator::refresh_device(const std::string &device_id, std::string &error) {
    auto device = registry_.get_device_copy(device_id);
    if (!device) {
        error = "device not found: " + device_id;
        return false;
    }

    auto io = store_.lock_device_io(device_id);
    if (!io.owns_lock()) {
        error = "device " + device_id + " is no longer registered";
        return false;
    }

    // Out-of-band refreshes follow a user action, so they may use the poll reserve
    auto grant = governor_.try_acquire(governor::CallPriority::USER);
    if (!grant.granted) {
        error = "refresh of " + device_id + " denied: quota exhausted";
        store_.mark_stale(device_id, error);
        return false;
    }

    bool ok = fetch_and_merge(*device, error);
    phase_ = SyncPhase::IDLE;

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.out_of_band_refreshes++;
    if (!ok) {
        stats_.device_failures++;
    }
    return ok;
}

void SyncCoordinator::request_refresh(const std::string &device_id) {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (std::find(pending_.begin(), pending_.end(), device_id) != pending_.end()) {
            return;
        }
        pending_.push_back(device_id);
    }
    LOG_DEBUG("[Sync] Out-of-band refresh queued for " << device_id);
    wake_cv_.notify_all();
}

size_t SyncCoordinator::process_pending_refreshes() {
    size_t processed = 0;
    while (true) {
        std::string device_id;
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            if (pending_.empty()) {
                break;
            }
            device_id = pending_.front();
            pending_.pop_front();
        }

        std::string error;
        if (!refresh_device(device_id, error)) {
            LOG_WARN("[Sync] Out-of-band refresh failed: " << error);
        }
        ++processed;
    }
    return processed;
}

void SyncCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }
    LOG_INFO("[Sync] Polling thread starting (interval " << poll_interval().count() << "ms)");
    thread_ = std::thread([this] { run_loop(); });
}

void SyncCoordinator::stop() {
    {
        // Flip under the wait mutex so the polling thread cannot miss the wakeup
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    stop_requested_ = false;
    LOG_INFO("[Sync] Polling thread stopped");
}

void SyncCoordinator::cancel_cycle() {
    // Only the cycle running now is cancelled; an idle coordinator ignores the request
    const uint64_t cycle = active_cycle_.load();
    if (cycle != 0) {
        cancel_cycle_ = cycle;
    }
}

bool SyncCoordinator::set_poll_interval(std::chrono::milliseconds interval, std::string &error) {
    if (interval < kMinPollInterval) {
        error = "poll interval must be >= " + std::to_string(kMinPollInterval.count()) + "ms";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        config_.poll_interval = interval;
        interval_changed_ = true;
    }
    wake_cv_.notify_all();

    size_t devices = registry_.device_count();
    int64_t projected = static_cast<int64_t>(devices) * (kMsPerDay / interval.count());
    LOG_INFO("[Sync] Poll interval set to " << interval.count() << "ms (~" << projected
                                            << " state calls/day for " << devices << " device(s))");
    int64_t remaining = governor_.snapshot().quota;
    if (projected > remaining) {
        LOG_WARN("[Sync] Projected daily calls exceed the quota of " << remaining
                                                                     << "; later cycles will be skipped");
    }
    return true;
}

std::chrono::milliseconds SyncCoordinator::poll_interval() const {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    return config_.poll_interval;
}

SyncStats SyncCoordinator::stats() const {
    SyncStats snapshot;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        snapshot = stats_;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        snapshot.pending_refreshes = pending_.size();
        snapshot.poll_interval_ms = config_.poll_interval.count();
    }
    snapshot.phase = phase_.load();
    return snapshot;
}

void SyncCoordinator::run_loop() {
    using clock = std::chrono::steady_clock;

    auto last_poll = clock::now();
    auto next_list = last_poll + config_.device_list_interval;

    while (running_.load()) {
        clock::time_point next_poll;
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            next_poll = last_poll + config_.poll_interval;
            auto wake_at = std::min(next_poll, next_list);

            wake_cv_.wait_until(lock, wake_at,
                                [this] { return !running_.load() || !pending_.empty() || interval_changed_; });

            if (!running_.load()) {
                break;
            }
            if (interval_changed_) {
                interval_changed_ = false;
                // Recompute the deadline against the new interval
                if (pending_.empty()) {
                    continue;
                }
            }
            next_poll = last_poll + config_.poll_interval;
        }

        process_pending_refreshes();

        auto now = clock::now();
        if (now >= next_list) {
            std::string error;
            refresh_device_list(error);
            next_list = now + config_.device_list_interval;
        }

        if (now >= next_poll) {
            last_poll = now;
            auto report = poll_once();
            LOG_DEBUG("[Sync] Cycle complete: " << report.refreshed << " refreshed, " << report.failed
                                                << " failed, " << report.deferred << " deferred, " << report.busy
                                                << " busy");
        }
    }

    phase_ = SyncPhase::IDLE;
}

}  // namespace sync
}  // namespace skysync
