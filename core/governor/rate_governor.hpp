#ifndef SKYSYNC_GOVERNOR_RATE_GOVERNOR_HPP
#define SKYSYNC_GOVERNOR_RATE_GOVERNOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace skysync {
namespace governor {

enum class CallPriority {
    ROUTINE,  // polls and device-list fetches
    USER      // commands issued by a consumer
};

inline const char *priority_to_string(CallPriority p) { return p == CallPriority::USER ? "USER" : "ROUTINE"; }

struct AcquireResult {
    bool granted = false;
    std::chrono::milliseconds retry_after{0};  // time until the window resets when denied
};

// Read-only copy of the ledger
struct LedgerSnapshot {
    int64_t quota = 0;
    int64_t used = 0;
    int64_t remaining = 0;
    int64_t poll_reserve = 0;
    bool exhausted_by_server = false;
    std::chrono::milliseconds resets_in{0};
    uint64_t routine_denials = 0;
    uint64_t user_denials = 0;
    uint64_t windows_elapsed = 0;
};

struct GovernorConfig {
    int64_t daily_limit = 10000;
    std::chrono::milliseconds window{std::chrono::hours(24)};
    int64_t poll_reserve = 500;
};

/**
 * @brief Daily API call budget shared by every caller
 *
 * All accounting happens under one mutex: a grant is a single
 * check-and-decrement, so concurrent callers can never overdraw the quota.
 * ROUTINE callers stop once the remaining budget reaches the poll reserve;
 * USER callers may spend down to zero.
 *
 * The window starts at construction and rolls forward in whole window
 * lengths. The clock is injectable for tests.
 */
class RateGovernor {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit RateGovernor(const GovernorConfig &config, Clock clock = nullptr);

    AcquireResult try_acquire(CallPriority priority);

    // Server answered 429: treat the budget as spent until the window resets
    void observe_exhausted();

    LedgerSnapshot snapshot() const;

    int64_t remaining() const;

private:
    // Caller holds mutex_
    void roll_window(std::chrono::steady_clock::time_point now);
    std::chrono::milliseconds until_reset(std::chrono::steady_clock::time_point now) const;

    const GovernorConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point reset_at_;
    int64_t used_ = 0;
    bool exhausted_by_server_ = false;
    uint64_t routine_denials_ = 0;
    uint64_t user_denials_ = 0;
    uint64_t windows_elapsed_ = 0;
    bool routine_denial_logged_ = false;
};

}  // namespace governor
}  // namespace skysync

#endif  // SKYSYNC_GOVERNOR_RATE_GOVERNOR_HPP
