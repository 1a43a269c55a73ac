#pragma once

/**
 * @file event_emitter.hpp
 * @brief Change-notification fan-out from the state store to consumers
 *
 * - StateStore is the only producer
 * - Every consumer (subscribe_changes() caller, SSE client) owns a bounded queue
 * - A full queue sheds its oldest event; the consumer learns how many it
 *   missed through Subscription::take_missed() and should re-read state
 *
 * Ordering:
 * - Event ids are assigned under the emitter lock and are strictly increasing
 * - The store emits while holding the device's slot lock, so events of one
 *   device reach every queue in commit order
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "event_types.hpp"

namespace skysync {
namespace events {

/**
 * @brief Bounded queue owned by one consumer
 */
class SubscriberQueue {
public:
    SubscriberQueue(size_t capacity, std::string name);

    // Never blocks the producer. Returns false if the oldest entry was shed.
    bool push(const Event &event);

    // timeout_ms = 0 returns immediately
    std::optional<Event> pop(int timeout_ms);

    size_t size() const;
    uint64_t shed_total() const;
    uint64_t take_missed();

    void close();
    bool closed() const;

    const std::string &name() const { return name_; }

private:
    const size_t capacity_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Event> events_;
    uint64_t shed_total_ = 0;
    uint64_t missed_ = 0;  // shed since the consumer last asked
    bool closed_ = false;
};

/**
 * @brief Event filter for subscribers
 *
 * Empty filter = receive all events. The capability filter only applies to
 * CapabilityChangeEvent; staleness and inventory events pass it.
 */
struct EventFilter {
    std::string device_id;   // Empty = all devices
    std::string capability;  // Empty = all capabilities

    bool matches(const Event &event) const;

    static EventFilter all();
};

/**
 * @brief Consumer handle returned by EventEmitter::subscribe
 *
 * Detaches from the emitter on destruction.
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;
    using Detach = std::function<void(SubscriptionId)>;

    Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue, Detach detach);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop() { return pop(0); }

    // Number of events shed since the previous call; non-zero means the
    // consumer's view has a gap
    uint64_t take_missed();

    SubscriptionId id() const { return id_; }
    bool is_active() const;
    size_t queue_size() const;
    uint64_t dropped_count() const;

    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<SubscriberQueue> queue_;
    Detach detach_;
};

class EventEmitter {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Queue capacity when subscribe() is given 0
     * @param max_subscribers Concurrent subscriber limit (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 32);

    // nullptr when max_subscribers is reached
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    // Stamps the next event_id and delivers to every matching subscriber
    void emit(Event event);

    uint64_t next_event_id() const { return next_event_id_.load(); }
    size_t subscriber_count() const;
    size_t max_subscribers() const { return max_subscribers_; }
    bool at_capacity() const;

private:
    void detach(SubscriptionId id);

    struct Subscriber {
        std::shared_ptr<SubscriberQueue> queue;
        EventFilter filter;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscriber> subscribers_;  // ordered by subscription time
    SubscriptionId next_subscription_id_ = 1;
    std::atomic<uint64_t> next_event_id_{1};
};

}  // namespace events
}  // namespace skysync
