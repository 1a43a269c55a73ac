#include "rate_governor.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace skysync {
namespace governor {

RateGovernor::RateGovernor(const GovernorConfig &config, Clock clock)
    : config_(config), clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    reset_at_ = clock_() + config_.window;
}

void RateGovernor::roll_window(std::chrono::steady_clock::time_point now) {
    if (now < reset_at_) {
        return;
    }

    // Advance by whole windows so the reset time stays anchored to start
    auto behind = now - reset_at_;
    auto windows = behind / config_.window + 1;
    reset_at_ += config_.window * windows;
    windows_elapsed_ += static_cast<uint64_t>(windows);

    if (used_ > 0 || exhausted_by_server_) {
        LOG_INFO("[Governor] Quota window reset (" << used_ << " calls used in previous window)");
    }
    used_ = 0;
    exhausted_by_server_ = false;
    routine_denial_logged_ = false;
}

std::chrono::milliseconds RateGovernor::until_reset(std::chrono::steady_clock::time_point now) const {
    if (now >= reset_at_) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(reset_at_ - now);
}

AcquireResult RateGovernor::try_acquire(CallPriority priority) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    roll_window(now);

    int64_t remaining = exhausted_by_server_ ? 0 : config_.daily_limit - used_;
    int64_t floor = priority == CallPriority::ROUTINE ? config_.poll_reserve : 0;

    if (remaining <= floor) {
        AcquireResult denied;
        denied.retry_after = until_reset(now);

        if (priority == CallPriority::ROUTINE) {
            ++routine_denials_;
            if (!routine_denial_logged_) {
                LOG_WARN("[Governor] Routine calls paused: " << remaining << " calls left (reserve "
                                                             << config_.poll_reserve << "), window resets in "
                                                             << denied.retry_after.count() / 1000 << "s");
                routine_denial_logged_ = true;
            }
        } else {
            ++user_denials_;
            LOG_WARN("[Governor] Quota exhausted, denying user call (resets in " << denied.retry_after.count() / 1000
                                                                                << "s)");
        }
        return denied;
    }

    ++used_;
    AcquireResult granted;
    granted.granted = true;
    return granted;
}

void RateGovernor::observe_exhausted() {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_window(clock_());
    if (!exhausted_by_server_) {
        LOG_WARN("[Governor] Server reported quota exhausted after " << used_ << " local calls");
    }
    exhausted_by_server_ = true;
}

LedgerSnapshot RateGovernor::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();

    LedgerSnapshot snap;
    snap.quota = config_.daily_limit;
    snap.poll_reserve = config_.poll_reserve;
    snap.routine_denials = routine_denials_;
    snap.user_denials = user_denials_;
    snap.windows_elapsed = windows_elapsed_;

    if (now >= reset_at_) {
        // Window has lapsed but nobody has called since; report the fresh budget
        snap.used = 0;
        snap.remaining = config_.daily_limit;
        auto next = reset_at_ + config_.window * ((now - reset_at_) / config_.window + 1);
        snap.resets_in = std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
        return snap;
    }

    snap.used = used_;
    snap.exhausted_by_server = exhausted_by_server_;
    snap.remaining = exhausted_by_server_ ? 0 : std::max<int64_t>(0, config_.daily_limit - used_);
    snap.resets_in = until_reset(now);
    return snap;
}

int64_t RateGovernor::remaining() const { return snapshot().remaining; }

}  // namespace governor
}  // namespace skysync
