#pragma once

#include <string>
#include <vector>

namespace skysync {
namespace runtime {

struct CloudConfig {
    std::string api_key;  // falls back to $SKYSYNC_API_KEY
    std::string base_url = "https://openapi.api.govee.com";
    std::string base_path = "/router/api/v1";
    int timeout_ms = 10000;
    int max_retries = 2;
    int backoff_base_ms = 1000;
    std::string fixture_file;  // non-empty = offline fixture transport
};

struct QuotaConfig {
    int daily_limit = 10000;
    int window_hours = 24;
    int poll_reserve = 500;  // calls kept back for user commands
};

struct PollingConfig {
    int interval_ms = 60000;
    int device_list_interval_ms = 3600000;
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 16;                           // Worker thread pool size
};

struct EventsConfig {
    int queue_size = 100;      // per-subscriber queue
    int max_subscribers = 32;  // SSE clients + subscribe_changes() callers
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    CloudConfig cloud;
    QuotaConfig quota;
    PollingConfig polling;
    HttpConfig http;
    EventsConfig events;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

// "abcd****wxyz" style masking for logs and diagnostics
std::string redact_secret(const std::string &secret);

}  // namespace runtime
}  // namespace skysync
