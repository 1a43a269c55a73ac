#include "event_emitter.hpp"

#include <chrono>
#include <utility>

#include "logging/logger.hpp"

namespace skysync {
namespace events {

//=============================================================================
// SubscriberQueue
//=============================================================================

SubscriberQueue::SubscriberQueue(size_t capacity, std::string name)
    : capacity_(capacity == 0 ? 1 : capacity), name_(std::move(name)) {}

bool SubscriberQueue::push(const Event &event) {
    bool shed = false;
    uint64_t shed_total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return true;
        }
        if (events_.size() >= capacity_) {
            events_.pop_front();
            shed = true;
            shed_total = ++shed_total_;
            ++missed_;
        }
        events_.push_back(event);
    }
    ready_.notify_one();

    // First shed, then every 100th
    if (shed && shed_total % 100 == 1) {
        LOG_WARN("[EventEmitter] Subscriber '" << name_ << "' is lagging, " << shed_total << " events shed");
    }
    return !shed;
}

std::optional<Event> SubscriberQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms > 0) {
        ready_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return closed_ || !events_.empty(); });
    }
    if (events_.empty()) {
        return std::nullopt;
    }
    Event next = std::move(events_.front());
    events_.pop_front();
    return next;
}

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t SubscriberQueue::shed_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shed_total_;
}

uint64_t SubscriberQueue::take_missed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(missed_, 0);
}

void SubscriberQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

bool SubscriberQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

//=============================================================================
// EventFilter
//=============================================================================

bool EventFilter::matches(const Event &event) const {
    if (!device_id.empty() && get_device_id(event) != device_id) {
        return false;
    }
    if (capability.empty()) {
        return true;
    }
    const auto *change = std::get_if<CapabilityChangeEvent>(&event);
    return change == nullptr || change->touches(capability);
}

EventFilter EventFilter::all() { return EventFilter{}; }

//=============================================================================
// Subscription
//=============================================================================

Subscription::Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue, Detach detach)
    : id_(id), queue_(std::move(queue)), detach_(std::move(detach)) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : id_(std::exchange(other.id_, 0)), queue_(std::move(other.queue_)), detach_(std::move(other.detach_)) {}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this != &other) {
        unsubscribe();
        id_ = std::exchange(other.id_, 0);
        queue_ = std::move(other.queue_);
        detach_ = std::move(other.detach_);
    }
    return *this;
}

std::optional<Event> Subscription::pop(int timeout_ms) {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop(timeout_ms);
}

uint64_t Subscription::take_missed() { return queue_ ? queue_->take_missed() : 0; }

bool Subscription::is_active() const { return queue_ && !queue_->closed(); }

size_t Subscription::queue_size() const { return queue_ ? queue_->size() : 0; }

uint64_t Subscription::dropped_count() const { return queue_ ? queue_->shed_total() : 0; }

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (detach_) {
        detach_(id_);
    }
    if (queue_) {
        queue_->close();
    }
    id_ = 0;
}

//=============================================================================
// EventEmitter
//=============================================================================

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size), max_subscribers_(max_subscribers) {}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    SubscriptionId id = 0;
    std::shared_ptr<SubscriberQueue> queue;
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_) {
            total = subscribers_.size();
        } else {
            id = next_subscription_id_++;
            queue = std::make_shared<SubscriberQueue>(queue_size > 0 ? queue_size : default_queue_size_,
                                                      name.empty() ? "sub-" + std::to_string(id) : name);
            subscribers_.emplace(id, Subscriber{queue, filter});
            total = subscribers_.size();
        }
    }

    if (!queue) {
        LOG_WARN("[EventEmitter] Subscriber limit (" << total << ") reached, rejecting '" << name << "'");
        return nullptr;
    }

    LOG_DEBUG("[EventEmitter] " << queue->name() << " subscribed (" << total << " active)");
    return std::make_unique<Subscription>(id, std::move(queue), [this](SubscriptionId sub_id) { detach(sub_id); });
}

void EventEmitter::emit(Event event) {
    // Deliver under the lock so every queue sees ids in increasing order
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t id = next_event_id_++;
    std::visit([id](auto &e) { e.event_id = id; }, event);

    for (auto &entry : subscribers_) {
        Subscriber &sub = entry.second;
        if (sub.filter.matches(event)) {
            sub.queue->push(event);
        }
    }
}

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

bool EventEmitter::at_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_;
}

void EventEmitter::detach(SubscriptionId id) {
    std::shared_ptr<SubscriberQueue> queue;
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return;
        }
        queue = std::move(it->second.queue);
        subscribers_.erase(it);
        remaining = subscribers_.size();
    }
    queue->close();
    LOG_DEBUG("[EventEmitter] " << queue->name() << " unsubscribed (" << remaining << " active)");
}

}  // namespace events
}  // namespace skysync
