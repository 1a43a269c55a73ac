#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

#include "../logging/logger.hpp"

namespace skysync {
namespace runtime {

std::string redact_secret(const std::string &secret) {
    if (secret.empty()) {
        return "";
    }
    if (secret.size() <= 8) {
        return "****";
    }
    return secret.substr(0, 4) + "****" + secret.substr(secret.size() - 4);
}

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate cloud settings
    if (config.cloud.fixture_file.empty()) {
        if (config.cloud.api_key.empty()) {
            error = "cloud.api_key (or SKYSYNC_API_KEY) is required unless cloud.fixture_file is set";
            return false;
        }
        if (config.cloud.base_url.rfind("http://", 0) != 0 && config.cloud.base_url.rfind("https://", 0) != 0) {
            error = "cloud.base_url must start with http:// or https://";
            return false;
        }
    }
    if (config.cloud.timeout_ms < 100) {
        error = "cloud.timeout_ms must be >= 100ms";
        return false;
    }
    if (config.cloud.max_retries < 0 || config.cloud.max_retries > 10) {
        error = "cloud.max_retries must be between 0 and 10";
        return false;
    }
    if (config.cloud.backoff_base_ms < 0) {
        error = "cloud.backoff_base_ms must be >= 0";
        return false;
    }

    // Validate quota settings
    if (config.quota.daily_limit < 1) {
        error = "quota.daily_limit must be at least 1";
        return false;
    }
    if (config.quota.window_hours < 1) {
        error = "quota.window_hours must be at least 1";
        return false;
    }
    if (config.quota.poll_reserve < 0 || config.quota.poll_reserve >= config.quota.daily_limit) {
        error = "quota.poll_reserve must be >= 0 and below quota.daily_limit";
        return false;
    }

    // Validate polling settings
    if (config.polling.interval_ms < 1000) {
        error = "polling.interval_ms must be >= 1000ms";
        return false;
    }
    if (config.polling.device_list_interval_ms < config.polling.interval_ms) {
        error = "polling.device_list_interval_ms must be >= polling.interval_ms";
        return false;
    }

    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    // Validate event settings
    if (config.events.queue_size < 1) {
        error = "events.queue_size must be at least 1";
        return false;
    }
    if (config.events.max_subscribers < 0) {
        error = "events.max_subscribers must be >= 0";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"cloud", "quota", "polling", "http", "events", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load cloud config
        if (yaml["cloud"]) {
            const auto &cloud = yaml["cloud"];
            if (cloud["api_key"]) {
                config.cloud.api_key = cloud["api_key"].as<std::string>();
            }
            if (cloud["base_url"]) {
                config.cloud.base_url = cloud["base_url"].as<std::string>();
            }
            if (cloud["base_path"]) {
                config.cloud.base_path = cloud["base_path"].as<std::string>();
            }
            if (cloud["timeout_ms"]) {
                config.cloud.timeout_ms = cloud["timeout_ms"].as<int>();
            }
            if (cloud["max_retries"]) {
                config.cloud.max_retries = cloud["max_retries"].as<int>();
            }
            if (cloud["backoff_base_ms"]) {
                config.cloud.backoff_base_ms = cloud["backoff_base_ms"].as<int>();
            }
            if (cloud["fixture_file"]) {
                config.cloud.fixture_file = cloud["fixture_file"].as<std::string>();
            }
        }

        // API key from environment variable if not in config
        if (config.cloud.api_key.empty()) {
            const char *key_env = std::getenv("SKYSYNC_API_KEY");
            if (key_env != nullptr) {
                config.cloud.api_key = key_env;
            }
        }

        // Load quota config
        if (yaml["quota"]) {
            const auto &quota = yaml["quota"];
            if (quota["daily_limit"]) {
                config.quota.daily_limit = quota["daily_limit"].as<int>();
            }
            if (quota["window_hours"]) {
                config.quota.window_hours = quota["window_hours"].as<int>();
            }
            if (quota["poll_reserve"]) {
                config.quota.poll_reserve = quota["poll_reserve"].as<int>();
            }
        }

        // Load polling config
        if (yaml["polling"]) {
            if (yaml["polling"]["interval_ms"]) {
                config.polling.interval_ms = yaml["polling"]["interval_ms"].as<int>();
            }
            if (yaml["polling"]["device_list_interval_ms"]) {
                config.polling.device_list_interval_ms = yaml["polling"]["device_list_interval_ms"].as<int>();
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            if (yaml["http"]["enabled"]) {
                config.http.enabled = yaml["http"]["enabled"].as<bool>();
            }
            if (yaml["http"]["bind"]) {
                config.http.bind = yaml["http"]["bind"].as<std::string>();
            }
            if (yaml["http"]["port"]) {
                config.http.port = yaml["http"]["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (yaml["http"]["cors_allowed_origins"]) {
                const auto &origins_node = yaml["http"]["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (yaml["http"]["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = yaml["http"]["cors_allow_credentials"].as<bool>();
            }
            if (yaml["http"]["thread_pool_size"]) {
                config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
            }
        }

        // Load event config
        if (yaml["events"]) {
            if (yaml["events"]["queue_size"]) {
                config.events.queue_size = yaml["events"]["queue_size"].as<int>();
            }
            if (yaml["events"]["max_subscribers"]) {
                config.events.max_subscribers = yaml["events"]["max_subscribers"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        if (config.cloud.fixture_file.empty()) {
            LOG_INFO("[Config] Cloud: " << config.cloud.base_url << config.cloud.base_path
                                        << " (key " << redact_secret(config.cloud.api_key) << ")");
        } else {
            LOG_INFO("[Config] Cloud: fixture file " << config.cloud.fixture_file);
        }
        LOG_INFO("[Config] Quota: " << config.quota.daily_limit << " calls per " << config.quota.window_hours
                                    << "h, poll reserve " << config.quota.poll_reserve);
        LOG_INFO("[Config] Polling interval: " << config.polling.interval_ms << "ms, device list every "
                                               << config.polling.device_list_interval_ms << "ms");

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace skysync
