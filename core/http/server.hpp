#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "events/event_types.hpp"
#include "runtime/config.hpp"

// Forward declarations
namespace skysync {
namespace registry {
class DeviceRegistry;
}
namespace state {
class StateStore;
}
namespace control {
class CommandDispatcher;
}
namespace sync {
class SyncCoordinator;
}
namespace governor {
class RateGovernor;
}
namespace events {
class EventEmitter;
}
}  // namespace skysync

namespace skysync {
namespace http {

/**
 * @brief Local HTTP API over the sync engine
 *
 * An adapter layer only: every route delegates to the registry, state
 * store, dispatcher, coordinator or governor.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Commands run on the handler thread; reads never wait on network I/O
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @param config HTTP configuration (bind address, port, CORS, pool size)
     * @param diagnostics_config Redacted configuration echoed by /v0/diagnostics
     */
    HttpServer(const runtime::HttpConfig &config, registry::DeviceRegistry &registry, state::StateStore &store,
               control::CommandDispatcher &dispatcher, sync::SyncCoordinator &coordinator,
               governor::RateGovernor &governor, std::shared_ptr<events::EventEmitter> event_emitter = nullptr,
               nlohmann::json diagnostics_config = nlohmann::json::object());

    ~HttpServer();

    // Binds and starts the server thread
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;
    const std::chrono::steady_clock::time_point started_at_ = std::chrono::steady_clock::now();

    registry::DeviceRegistry &registry_;
    state::StateStore &store_;
    control::CommandDispatcher &dispatcher_;
    sync::SyncCoordinator &coordinator_;
    governor::RateGovernor &governor_;
    std::shared_ptr<events::EventEmitter> event_emitter_;
    nlohmann::json diagnostics_config_;

    std::atomic<int> sse_client_count_{0};

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Devices (device_handlers.cpp)
    void handle_get_devices(const httplib::Request &req, httplib::Response &res);
    void handle_get_device(const httplib::Request &req, httplib::Response &res);
    void handle_post_device_refresh(const httplib::Request &req, httplib::Response &res);

    // State and events (state_handlers.cpp)
    void handle_get_state(const httplib::Request &req, httplib::Response &res);
    void handle_get_device_state(const httplib::Request &req, httplib::Response &res);
    void handle_get_events(const httplib::Request &req, httplib::Response &res);
    std::string format_sse_event(const events::Event &event);

    // Commands (control_handlers.cpp)
    void handle_post_command(const httplib::Request &req, httplib::Response &res);

    // Runtime (system_handlers.cpp)
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);
    void handle_post_polling(const httplib::Request &req, httplib::Response &res);
    void handle_get_diagnostics(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace skysync
