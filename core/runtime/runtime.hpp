#pragma once

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "control/command_dispatcher.hpp"
#include "events/event_emitter.hpp"
#include "governor/rate_governor.hpp"
#include "http/server.hpp"
#include "registry/device_registry.hpp"
#include "state/state_store.hpp"
#include "sync/sync_coordinator.hpp"
#include "transport/i_cloud_transport.hpp"

namespace skysync {
namespace runtime {

/**
 * @brief Owns every component and exposes the consumer interface
 *
 * Construction order: governor, event emitter, registry, store, transport,
 * coordinator, dispatcher, HTTP server. Shutdown runs in reverse.
 */
class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);

    // Use an already-built transport instead of the configured one
    Runtime(const RuntimeConfig &config, std::unique_ptr<transport::ICloudTransport> transport);

    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Build components, fetch the device list, prime state, start HTTP
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    void shutdown();

    // Consumer interface
    std::optional<state::DeviceState> get_state(const std::string &device_id) const;
    std::unique_ptr<events::Subscription> subscribe_changes(
        const events::EventFilter &filter = events::EventFilter::all(), size_t queue_size = 0,
        const std::string &name = "");
    control::CommandResult send_command(const std::string &device_id, const std::string &instance,
                                        const capability::CapabilityValue &value);
    std::vector<registry::Device> list_devices() const;

    // Redacted configuration, ledger, inventory and state
    nlohmann::json diagnostics() const;
    nlohmann::json redacted_config() const;

    registry::DeviceRegistry &get_registry() { return *registry_; }
    state::StateStore &get_state_store() { return *state_store_; }
    governor::RateGovernor &get_governor() { return *governor_; }
    sync::SyncCoordinator &get_coordinator() { return *coordinator_; }
    control::CommandDispatcher &get_dispatcher() { return *dispatcher_; }
    events::EventEmitter &get_event_emitter() { return *event_emitter_; }

private:
    // Staged initialization helpers
    bool init_core_services(std::string &error);
    bool init_transport(std::string &error);
    bool init_sync(std::string &error);
    bool init_inventory(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<governor::RateGovernor> governor_;
    std::shared_ptr<events::EventEmitter> event_emitter_;  // Shared with StateStore + HTTP
    std::unique_ptr<registry::DeviceRegistry> registry_;
    std::unique_ptr<state::StateStore> state_store_;
    std::unique_ptr<transport::ICloudTransport> transport_;
    std::unique_ptr<sync::SyncCoordinator> coordinator_;
    std::unique_ptr<control::CommandDispatcher> dispatcher_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace skysync
