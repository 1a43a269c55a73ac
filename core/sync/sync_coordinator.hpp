#ifndef SKYSYNC_SYNC_SYNC_COORDINATOR_HPP
#define SKYSYNC_SYNC_SYNC_COORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "governor/rate_governor.hpp"
#include "registry/device_registry.hpp"
#include "state/state_store.hpp"
#include "transport/i_cloud_transport.hpp"

namespace skysync {
namespace sync {

enum class SyncPhase { IDLE, GATING, FETCHING, PARSING, MERGING };

inline const char *phase_to_string(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::IDLE:
            return "IDLE";
        case SyncPhase::GATING:
            return "GATING";
        case SyncPhase::FETCHING:
            return "FETCHING";
        case SyncPhase::PARSING:
            return "PARSING";
        case SyncPhase::MERGING:
            return "MERGING";
    }
    return "UNKNOWN";
}

struct SyncConfig {
    std::chrono::milliseconds poll_interval{60000};
    std::chrono::milliseconds device_list_interval{3600000};
};

// Result of one poll cycle
struct CycleReport {
    bool skipped = false;    // denied before the first device
    bool cancelled = false;  // cancel_cycle()/stop() observed between devices
    size_t refreshed = 0;
    size_t failed = 0;
    size_t deferred = 0;  // not attempted because the quota gate closed
    size_t busy = 0;      // skipped because a command held the device's I/O
};

struct SyncStats {
    uint64_t cycles_run = 0;
    uint64_t cycles_skipped = 0;
    uint64_t cycles_cancelled = 0;
    uint64_t device_refreshes = 0;
    uint64_t device_failures = 0;
    uint64_t device_list_refreshes = 0;
    uint64_t device_list_failures = 0;
    uint64_t out_of_band_refreshes = 0;
    std::chrono::milliseconds last_cycle_duration{0};
    int64_t last_cycle_at_ms = 0;  // epoch ms, 0 = never
    int64_t poll_interval_ms = 0;
    size_t pending_refreshes = 0;
    SyncPhase phase = SyncPhase::IDLE;
};

/**
 * @brief Periodic polling of every registered device
 *
 * One polling thread runs the cycle, the slower device-list refresh and
 * queued out-of-band refreshes. Per device:
 *   GATING (quota) -> FETCHING -> PARSING -> MERGING
 * A device's fetch+merge runs under the store's per-device I/O lock, the
 * same lock the command dispatcher takes around send+reconcile. A poll never
 * waits on that lock: a busy device moves to the end of the cycle once and
 * is skipped if its command is still in flight.
 *
 * Cancellation is cooperative and checked before each device; an
 * in-flight fetch always completes.
 */
class SyncCoordinator {
public:
    SyncCoordinator(registry::DeviceRegistry &registry, state::StateStore &store, governor::RateGovernor &governor,
                    transport::ICloudTransport &transport, const SyncConfig &config);
    ~SyncCoordinator();

    SyncCoordinator(const SyncCoordinator &) = delete;
    SyncCoordinator &operator=(const SyncCoordinator &) = delete;

    // Fetch the device list and reconcile registry and store
    bool refresh_device_list(std::string &error);

    // Run one full poll cycle on the calling thread
    CycleReport poll_once();

    // Refresh one device immediately on the calling thread
    bool refresh_device(const std::string &device_id, std::string &error);

    // Queue an out-of-band refresh for the polling thread
    void request_refresh(const std::string &device_id);

    // Service queued refreshes on the calling thread; returns how many ran
    size_t process_pending_refreshes();

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Stop the current cycle before its next device
    void cancel_cycle();

    bool set_poll_interval(std::chrono::milliseconds interval, std::string &error);
    std::chrono::milliseconds poll_interval() const;

    SyncPhase phase() const { return phase_.load(); }
    SyncStats stats() const;

private:
    // Caller holds the device's I/O lock and a quota grant
    bool fetch_and_merge(const registry::Device &device, std::string &error);
    void run_loop();
    void record_cycle(const CycleReport &report, std::chrono::milliseconds duration);

    registry::DeviceRegistry &registry_;
    state::StateStore &store_;
    governor::RateGovernor &governor_;
    transport::ICloudTransport &transport_;

    std::atomic<SyncPhase> phase_{SyncPhase::IDLE};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> cycle_seq_{0};
    std::atomic<uint64_t> active_cycle_{0};  // 0 = no cycle running
    std::atomic<uint64_t> cancel_cycle_{0};
    std::thread thread_;

    // Guards config, pending queue and wakeups
    mutable std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    SyncConfig config_;
    bool interval_changed_ = false;
    std::deque<std::string> pending_;

    mutable std::mutex stats_mutex_;
    SyncStats stats_;
};

}  // namespace sync
}  // namespace skysync

#endif  // SKYSYNC_SYNC_SYNC_COORDINATOR_HPP
