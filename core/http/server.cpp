#include "server.hpp"

#include "errors.hpp"
#include "events/event_emitter.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"

namespace skysync {
namespace http {

namespace {
constexpr int kSocketTimeoutSeconds = 5;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
constexpr const char *kAllowMethods = "GET, POST, OPTIONS";
constexpr const char *kAllowHeaders = "Content-Type";

// Body for statuses httplib produces itself (unmatched route, bad request)
nlohmann::json fallback_error(const httplib::Request &req, int http_status) {
    if (http_status == kStatusNotFound) {
        return make_error_response(StatusCode::NOT_FOUND, "Route not found: " + req.method + " " + req.path);
    }
    if (http_status == kStatusBadRequest) {
        return make_error_response(StatusCode::INVALID_ARGUMENT, "Bad request");
    }
    return make_error_response(StatusCode::INTERNAL, "Internal server error");
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, registry::DeviceRegistry &registry, state::StateStore &store,
                       control::CommandDispatcher &dispatcher, sync::SyncCoordinator &coordinator,
                       governor::RateGovernor &governor, std::shared_ptr<events::EventEmitter> event_emitter,
                       nlohmann::json diagnostics_config)
    : config_(config),
      registry_(registry),
      store_(store),
      dispatcher_(dispatcher),
      coordinator_(coordinator),
      governor_(governor),
      event_emitter_(std::move(event_emitter)),
      diagnostics_config_(std::move(diagnostics_config)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kSocketTimeoutSeconds, 0);
    server_->set_write_timeout(kSocketTimeoutSeconds, 0);

    // SSE clients hold a worker each for the life of the stream
    const int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, allowlist = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        if (!req.has_header("Origin")) {
            return;
        }
        const std::string allow = cors_allow_origin(allowlist, req.get_header_value("Origin"));
        if (allow.empty()) {
            return;
        }
        res.set_header("Access-Control-Allow-Origin", allow.c_str());
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        // Handlers that already wrote a JSON body keep it
        if (res.body.empty()) {
            res.set_content(fallback_error(req, res.status).dump(), "application/json");
        }
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string what = "Unknown exception";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            what = e.what();
        } catch (...) {
        }
        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " threw: " << what);
        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, what).dump(), "application/json");
    });

    setup_routes();

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Listener thread exiting");
    });

    LOG_INFO("[HTTP] Listening on " << config_.bind << ":" << port_ << " (" << pool_size << " workers)");
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (server_) {
        server_->stop();
    }
    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }
    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    using Member = void (HttpServer::*)(const httplib::Request &, httplib::Response &);
    struct Route {
        const char *method;
        const char *pattern;
        Member handler;
    };

    const Route routes[] = {
        {"GET", "/v0/devices", &HttpServer::handle_get_devices},
        {"GET", R"(/v0/devices/([^/]+))", &HttpServer::handle_get_device},
        {"POST", R"(/v0/devices/([^/]+)/refresh)", &HttpServer::handle_post_device_refresh},
        {"GET", "/v0/state", &HttpServer::handle_get_state},
        {"GET", R"(/v0/state/([^/]+))", &HttpServer::handle_get_device_state},
        {"POST", "/v0/command", &HttpServer::handle_post_command},
        {"GET", "/v0/runtime/status", &HttpServer::handle_get_runtime_status},
        {"POST", "/v0/polling", &HttpServer::handle_post_polling},
        {"GET", "/v0/diagnostics", &HttpServer::handle_get_diagnostics},
        {"GET", "/v0/events", &HttpServer::handle_get_events},
    };

    for (const auto &route : routes) {
        auto bound = [this, handler = route.handler](const httplib::Request &req, httplib::Response &res) {
            (this->*handler)(req, res);
        };
        if (std::string(route.method) == "GET") {
            server_->Get(route.pattern, bound);
        } else {
            server_->Post(route.pattern, bound);
        }
        LOG_DEBUG("[HTTP] Route " << route.method << " " << route.pattern);
    }

    // CORS preflight for every route
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
    });
}

}  // namespace http
}  // namespace skysync
