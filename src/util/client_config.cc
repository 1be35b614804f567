#include "client_config.h"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <spdlog/spdlog.h>

namespace util {
namespace {
const nlohmann::json& section(const nlohmann::json& settings, const char* name) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!settings.is_object()) {
        return kEmpty;
    }
    auto it = settings.find(name);
    if (it == settings.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

template<typename T>
T read_or(const nlohmann::json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[ClientConfig] Ignoring setting '{}': {}", key, e.what());
        return fallback;
    }
}

std::chrono::milliseconds read_ms(const nlohmann::json& object,
                                  const char* key,
                                  std::chrono::milliseconds fallback) {
    const auto value = read_or<std::int64_t>(object, key, fallback.count());
    if (value < 0) {
        spdlog::warn("[ClientConfig] Ignoring negative duration '{}'", key);
        return fallback;
    }
    return std::chrono::milliseconds(value);
}
} // namespace

ClientConfig ClientConfig::from_settings(const nlohmann::json& settings) {
    ClientConfig config;

    const auto& server = section(settings, "server");
    config.server.host = read_or<std::string>(server, "host", config.server.host);
    const auto port = read_or<int>(server, "port", config.server.port);
    if (port > 0 && port <= std::numeric_limits<std::uint16_t>::max()) {
        config.server.port = static_cast<std::uint16_t>(port);
    } else {
        spdlog::warn("[ClientConfig] Invalid server port {}, using {}", port, config.server.port);
    }
    config.server.api_prefix = read_or<std::string>(server, "api_prefix", config.server.api_prefix);
    while (!config.server.api_prefix.empty() && config.server.api_prefix.back() == '/') {
        config.server.api_prefix.pop_back();
    }

    const auto& upload = section(settings, "upload");
    const auto chunk_size = read_or<std::int64_t>(upload,
                                                  "chunk_size",
                                                  static_cast<std::int64_t>(config.chunk_size));
    if (chunk_size > 0) {
        config.chunk_size = static_cast<std::uint64_t>(chunk_size);
    } else {
        spdlog::warn("[ClientConfig] Chunk size must be positive, got {}, using {}",
                     chunk_size,
                     kDefaultChunkSize);
        config.chunk_size = kDefaultChunkSize;
    }
    config.request_timeout = read_ms(upload, "request_timeout_ms", config.request_timeout);
    config.completion_timeout = read_ms(upload, "completion_timeout_ms", config.completion_timeout);
    config.allowed_extensions = read_or<std::vector<std::string>>(upload,
                                                                  "allowed_extensions",
                                                                  config.allowed_extensions);

    const auto& notification = section(settings, "notification");
    config.reconnect_attempts = std::max(0,
                                         read_or<int>(notification,
                                                      "reconnect_attempts",
                                                      config.reconnect_attempts));
    config.reconnect_delay = read_ms(notification, "reconnect_delay_ms", config.reconnect_delay);

    if (settings.is_object()) {
        config.log_level = read_or<std::string>(settings, "log_level", config.log_level);
    }
    return config;
}

} // namespace util
