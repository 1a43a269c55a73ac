#include "state_store.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace skysync {
namespace state {

StateStore::StateStore(std::shared_ptr<events::EventEmitter> emitter) : event_emitter_(std::move(emitter)) {}

void StateStore::set_event_emitter(const std::shared_ptr<events::EventEmitter> &emitter) { event_emitter_ = emitter; }

void StateStore::emit(events::Event event) const {
    if (event_emitter_) {
        event_emitter_->emit(std::move(event));
    }
}

std::shared_ptr<StateStore::DeviceSlot> StateStore::find_slot(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = slots_.find(device_id);
    return it == slots_.end() ? nullptr : it->second;
}

void StateStore::register_device(const registry::Device &device) {
    std::map<std::string, capability::CapabilityKind> declared;
    for (const auto &spec : device.capabilities) {
        declared[spec.instance] = spec.kind;
    }

    std::shared_ptr<DeviceSlot> slot;
    bool created = false;
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        auto it = slots_.find(device.device_id);
        if (it == slots_.end()) {
            slot = std::make_shared<DeviceSlot>();
            slot->state.device_id = device.device_id;
            slots_[device.device_id] = slot;
            order_.push_back(device.device_id);
            created = true;
        } else {
            slot = it->second;
        }
    }

    std::unique_lock<std::shared_mutex> slot_lock(slot->mutex);
    slot->declared = std::move(declared);

    if (created) {
        LOG_DEBUG("[StateStore] Registered " << device.device_id << " (" << slot->declared.size()
                                             << " capabilities)");
        emit(events::DeviceInventoryEvent{0, device.device_id, events::InventoryChange::ADDED,
                                          events::now_epoch_ms()});
        return;
    }

    // Drop cached values the new declaration no longer covers
    size_t dropped = 0;
    auto &caps = slot->state.capabilities;
    for (auto it = caps.begin(); it != caps.end();) {
        auto decl = slot->declared.find(it->first);
        if (decl == slot->declared.end() || decl->second != it->second.kind) {
            it = caps.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    LOG_INFO("[StateStore] Capability declaration changed for " << device.device_id << ", dropped " << dropped
                                                                << " cached value(s)");
    emit(events::DeviceInventoryEvent{0, device.device_id, events::InventoryChange::CHANGED,
                                      events::now_epoch_ms()});
}

void StateStore::remove_device(const std::string &device_id) {
    std::shared_ptr<DeviceSlot> slot;
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        auto it = slots_.find(device_id);
        if (it == slots_.end()) {
            return;
        }
        slot = it->second;
        slots_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), device_id), order_.end());
    }

    // Serialize with any in-flight merge before announcing removal
    std::unique_lock<std::shared_mutex> slot_lock(slot->mutex);
    LOG_INFO("[StateStore] Removed " << device_id);
    emit(events::DeviceInventoryEvent{0, device_id, events::InventoryChange::REMOVED, events::now_epoch_ms()});
}

MergeOutcome StateStore::merge(const std::string &device_id, const std::vector<capability::Capability> &capabilities,
                               MergeMode mode) {
    MergeOutcome outcome;
    auto slot = find_slot(device_id);
    if (!slot) {
        LOG_WARN("[StateStore] Merge for unknown device " << device_id << " ignored");
        return outcome;
    }

    const auto now = std::chrono::system_clock::now();
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    auto &state = slot->state;

    std::vector<capability::Capability> changes;
    std::set<std::string> merged;

    for (const auto &cap : capabilities) {
        auto decl = slot->declared.find(cap.instance);
        if (decl == slot->declared.end()) {
            LOG_WARN("[StateStore] Dropping undeclared capability '" << cap.instance << "' for " << device_id);
            ++outcome.dropped;
            continue;
        }
        if (decl->second != cap.kind) {
            LOG_WARN("[StateStore] Dropping capability '" << cap.instance << "' for " << device_id
                                                          << ": kind " << capability::kind_to_string(cap.kind)
                                                          << " does not match declared "
                                                          << capability::kind_to_string(decl->second));
            ++outcome.dropped;
            continue;
        }

        merged.insert(cap.instance);
        auto it = state.capabilities.find(cap.instance);
        if (it == state.capabilities.end() || !capability::values_equal(it->second.value, cap.value)) {
            changes.push_back(cap);
        }

        CachedCapability &cached = state.capabilities[cap.instance];
        cached.kind = cap.kind;
        cached.value = cap.value;
        cached.updated_at = now;
        cached.stale = false;
    }

    if (mode == MergeMode::FULL_REFRESH) {
        for (auto &[instance, cached] : state.capabilities) {
            if (merged.count(instance) == 0) {
                cached.stale = true;
            }
        }

        state.last_refresh = now;
        state.last_error.clear();
        if (state.stale) {
            state.stale = false;
            emit(events::StalenessChangeEvent{0, device_id, false, events::now_epoch_ms()});
        }
    }

    outcome.applied = true;
    outcome.changed = changes.size();

    if (!changes.empty()) {
        LOG_DEBUG("[StateStore] " << device_id << ": " << changes.size() << " capability value(s) changed");
        emit(events::CapabilityChangeEvent{0, device_id, std::move(changes), events::now_epoch_ms()});
    }

    return outcome;
}

bool StateStore::mark_stale(const std::string &device_id, const std::string &reason) {
    auto slot = find_slot(device_id);
    if (!slot) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    if (!reason.empty()) {
        slot->state.last_error = reason;
    }
    if (!slot->state.stale) {
        slot->state.stale = true;
        emit(events::StalenessChangeEvent{0, device_id, true, events::now_epoch_ms()});
    }
    return true;
}

std::optional<DeviceState> StateStore::read(const std::string &device_id) const {
    auto slot = find_slot(device_id);
    if (!slot) {
        return std::nullopt;
    }

    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->state;
}

std::vector<DeviceState> StateStore::read_all() const {
    std::vector<std::shared_ptr<DeviceSlot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        slots.reserve(order_.size());
        for (const auto &id : order_) {
            auto it = slots_.find(id);
            if (it != slots_.end()) {
                slots.push_back(it->second);
            }
        }
    }

    std::vector<DeviceState> states;
    states.reserve(slots.size());
    for (const auto &slot : slots) {
        std::shared_lock<std::shared_mutex> lock(slot->mutex);
        states.push_back(slot->state);
    }
    return states;
}

std::unique_ptr<events::Subscription> StateStore::subscribe(const events::EventFilter &filter, size_t queue_size,
                                                            const std::string &name) {
    if (!event_emitter_) {
        LOG_WARN("[StateStore] subscribe() without an event emitter");
        return nullptr;
    }
    return event_emitter_->subscribe(filter, queue_size, name);
}

DeviceIoLock StateStore::lock_device_io(const std::string &device_id) const {
    auto slot = find_slot(device_id);
    if (!slot) {
        return DeviceIoLock();
    }
    return DeviceIoLock(slot->io_mutex);
}

DeviceIoLock StateStore::try_lock_device_io(const std::string &device_id) const {
    auto slot = find_slot(device_id);
    if (!slot) {
        return DeviceIoLock();
    }
    return DeviceIoLock(slot->io_mutex, std::try_to_lock);
}

bool StateStore::has_device(const std::string &device_id) const { return find_slot(device_id) != nullptr; }

size_t StateStore::device_count() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return slots_.size();
}

size_t StateStore::stale_device_count() const {
    size_t count = 0;
    for (const auto &state : read_all()) {
        if (state.stale) ++count;
    }
    return count;
}

}  // namespace state
}  // namespace skysync
