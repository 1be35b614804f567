#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace util {

constexpr std::uint64_t kDefaultChunkSize = 5 * 1024 * 1024;

struct ServerEndpoint {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8000;
    std::string api_prefix = "/api/v1";
};

struct ClientConfig {
    ServerEndpoint server;

    std::uint64_t chunk_size = kDefaultChunkSize;
    std::chrono::milliseconds request_timeout{60000};
    // Zero disables the stuck-processing bound.
    std::chrono::milliseconds completion_timeout{0};
    std::vector<std::string> allowed_extensions{
        ".pdf", ".doc", ".docx", ".png", ".jpg", ".jpeg", ".txt"};

    int reconnect_attempts = 0;
    std::chrono::milliseconds reconnect_delay{2000};

    std::string log_level = "info";

    static ClientConfig from_settings(const nlohmann::json& settings);
};

} // namespace util
