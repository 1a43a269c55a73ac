#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "http/json.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"
#include "transport/fixture_transport.hpp"
#include "transport/http_transport.hpp"

namespace skysync {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::Runtime(const RuntimeConfig &config, std::unique_ptr<transport::ICloudTransport> transport)
    : config_(config), transport_(std::move(transport)) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing skysync");

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_transport(error)) {
        return false;
    }

    if (!init_sync(error)) {
        return false;
    }

    if (!init_inventory(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_core_services(std::string &) {
    governor::GovernorConfig quota;
    quota.daily_limit = config_.quota.daily_limit;
    quota.window = std::chrono::hours(config_.quota.window_hours);
    quota.poll_reserve = config_.quota.poll_reserve;
    governor_ = std::make_unique<governor::RateGovernor>(quota);

    event_emitter_ = std::make_shared<events::EventEmitter>(static_cast<size_t>(config_.events.queue_size),
                                                             static_cast<size_t>(config_.events.max_subscribers));
    LOG_INFO("[Runtime] Event emitter created (max " << event_emitter_->max_subscribers() << " subscribers)");

    registry_ = std::make_unique<registry::DeviceRegistry>();
    state_store_ = std::make_unique<state::StateStore>(event_emitter_);
    return true;
}

bool Runtime::init_transport(std::string &error) {
    if (transport_) {
        LOG_INFO("[Runtime] Using injected transport: " << transport_->name());
        return true;
    }

    if (!config_.cloud.fixture_file.empty()) {
        auto fixture = std::make_unique<transport::FixtureTransport>();
        if (!fixture->load_file(config_.cloud.fixture_file, error)) {
            error = "Fixture load failed: " + error;
            return false;
        }
        LOG_INFO("[Runtime] Using fixture transport: " << config_.cloud.fixture_file);
        transport_ = std::move(fixture);
        return true;
    }

    transport::HttpTransportConfig http_config;
    http_config.base_url = config_.cloud.base_url;
    http_config.base_path = config_.cloud.base_path;
    http_config.api_key = config_.cloud.api_key;
    http_config.timeout_ms = config_.cloud.timeout_ms;
    http_config.max_retries = config_.cloud.max_retries;
    http_config.backoff_base_ms = config_.cloud.backoff_base_ms;

    transport_ = std::make_unique<transport::HttpTransport>(http_config, governor_.get());
    LOG_INFO("[Runtime] Using cloud transport: " << config_.cloud.base_url << config_.cloud.base_path);
    return true;
}

bool Runtime::init_sync(std::string &) {
    sync::SyncConfig sync_config;
    sync_config.poll_interval = std::chrono::milliseconds(config_.polling.interval_ms);
    sync_config.device_list_interval = std::chrono::milliseconds(config_.polling.device_list_interval_ms);

    coordinator_ =
        std::make_unique<sync::SyncCoordinator>(*registry_, *state_store_, *governor_, *transport_, sync_config);
    dispatcher_ = std::make_unique<control::CommandDispatcher>(*registry_, *state_store_, *governor_, *transport_);

    // Ambiguous command outcomes are re-read by the polling thread
    auto *coordinator = coordinator_.get();
    dispatcher_->set_refresh_requester(
        [coordinator](const std::string &device_id) { coordinator->request_refresh(device_id); });
    return true;
}

bool Runtime::init_inventory(std::string &error) {
    std::string list_error;
    if (!coordinator_->refresh_device_list(list_error)) {
        error = "Initial device discovery failed: " + list_error;
        return false;
    }
    LOG_INFO("[Runtime] Discovered " << registry_->device_count() << " device(s)");

    // Prime the store once so initial reads observe a full snapshot
    auto report = coordinator_->poll_once();
    LOG_INFO("[Runtime] Initial poll: " << report.refreshed << " refreshed, " << report.failed << " failed, "
                                        << report.deferred << " deferred");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled in config");
        return true;
    }

    LOG_INFO("[Runtime] Creating HTTP server");
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *registry_, *state_store_, *dispatcher_,
                                                      *coordinator_, *governor_, event_emitter_, redacted_config());

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    coordinator_->start();
    LOG_INFO("[Runtime] Polling active (interval " << coordinator_->poll_interval().count() << "ms)");
    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
    coordinator_->stop();
}

void Runtime::shutdown() {
    // HTTP first so no new commands arrive
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (coordinator_) {
        coordinator_->stop();
    }
}

std::optional<state::DeviceState> Runtime::get_state(const std::string &device_id) const {
    return state_store_->read(device_id);
}

std::unique_ptr<events::Subscription> Runtime::subscribe_changes(const events::EventFilter &filter,
                                                                 size_t queue_size, const std::string &name) {
    return state_store_->subscribe(filter, queue_size, name);
}

control::CommandResult Runtime::send_command(const std::string &device_id, const std::string &instance,
                                             const capability::CapabilityValue &value) {
    control::CommandRequest request;
    request.device_id = device_id;
    request.instance = instance;
    request.value = value;
    return dispatcher_->dispatch(request);
}

std::vector<registry::Device> Runtime::list_devices() const { return registry_->get_all_devices(); }

nlohmann::json Runtime::redacted_config() const {
    return {{"cloud",
             {{"api_key", redact_secret(config_.cloud.api_key)},
              {"base_url", config_.cloud.base_url},
              {"base_path", config_.cloud.base_path},
              {"timeout_ms", config_.cloud.timeout_ms},
              {"max_retries", config_.cloud.max_retries},
              {"backoff_base_ms", config_.cloud.backoff_base_ms},
              {"fixture_file", config_.cloud.fixture_file}}},
            {"quota",
             {{"daily_limit", config_.quota.daily_limit},
              {"window_hours", config_.quota.window_hours},
              {"poll_reserve", config_.quota.poll_reserve}}},
            {"polling",
             {{"interval_ms", config_.polling.interval_ms},
              {"device_list_interval_ms", config_.polling.device_list_interval_ms}}},
            {"http", {{"enabled", config_.http.enabled}, {"bind", config_.http.bind}, {"port", config_.http.port}}},
            {"events",
             {{"queue_size", config_.events.queue_size}, {"max_subscribers", config_.events.max_subscribers}}},
            {"logging", {{"level", config_.logging.level}}}};
}

nlohmann::json Runtime::diagnostics() const {
    nlohmann::json devices = nlohmann::json::array();
    for (const auto &device : registry_->get_all_devices()) {
        devices.push_back(http::encode_device(device));
    }

    nlohmann::json states = nlohmann::json::array();
    for (const auto &state : state_store_->read_all()) {
        states.push_back(http::encode_device_state(state));
    }

    return {{"config", redacted_config()},
            {"transport", transport_ ? transport_->name() : ""},
            {"quota", http::encode_ledger(governor_->snapshot())},
            {"polling", http::encode_sync_stats(coordinator_->stats())},
            {"commands", {{"sent", dispatcher_->commands_sent()}, {"failed", dispatcher_->commands_failed()}}},
            {"devices", devices},
            {"state", states}};
}

}  // namespace runtime
}  // namespace skysync
