#include "util/client_config.h"
#include "util/settings.h"
#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(ClientConfigTest, DefaultsMatchDefaultSettings) {
    auto config = util::ClientConfig::from_settings(util::Settings::default_settings());

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8000);
    EXPECT_EQ(config.server.api_prefix, "/api/v1");
    EXPECT_EQ(config.chunk_size, 5u * 1024 * 1024);
    EXPECT_EQ(config.request_timeout, 60000ms);
    EXPECT_EQ(config.completion_timeout, 0ms);
    EXPECT_EQ(config.allowed_extensions.size(), 7u);
    EXPECT_EQ(config.reconnect_attempts, 0);
    EXPECT_EQ(config.reconnect_delay, 2000ms);
    EXPECT_EQ(config.log_level, "info");
}

TEST(ClientConfigTest, EmptyDocumentGivesDefaults) {
    auto from_empty = util::ClientConfig::from_settings(nlohmann::json::object());
    auto from_null = util::ClientConfig::from_settings(nlohmann::json());

    EXPECT_EQ(from_empty.server.port, 8000);
    EXPECT_EQ(from_null.chunk_size, util::kDefaultChunkSize);
}

TEST(ClientConfigTest, ReadsOverrides) {
    auto settings = nlohmann::json::parse(R"({
        "server": {"host": "ingest.local", "port": 9001, "api_prefix": "/api/v2/"},
        "upload": {"chunk_size": 1024, "completion_timeout_ms": 30000,
                   "allowed_extensions": [".md"]},
        "notification": {"reconnect_attempts": 3, "reconnect_delay_ms": 500},
        "log_level": "debug"
    })");

    auto config = util::ClientConfig::from_settings(settings);

    EXPECT_EQ(config.server.host, "ingest.local");
    EXPECT_EQ(config.server.port, 9001);
    EXPECT_EQ(config.server.api_prefix, "/api/v2");
    EXPECT_EQ(config.chunk_size, 1024u);
    EXPECT_EQ(config.completion_timeout, 30000ms);
    EXPECT_EQ(config.allowed_extensions, std::vector<std::string>{".md"});
    EXPECT_EQ(config.reconnect_attempts, 3);
    EXPECT_EQ(config.reconnect_delay, 500ms);
    EXPECT_EQ(config.log_level, "debug");
}

TEST(ClientConfigTest, InvalidValuesFallBack) {
    auto settings = nlohmann::json::parse(R"({
        "server": {"port": 70000, "host": 12},
        "upload": {"chunk_size": 0, "request_timeout_ms": -5},
        "notification": {"reconnect_attempts": -2}
    })");

    auto config = util::ClientConfig::from_settings(settings);

    EXPECT_EQ(config.server.port, 8000);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.chunk_size, util::kDefaultChunkSize);
    EXPECT_EQ(config.request_timeout, 60000ms);
    EXPECT_EQ(config.reconnect_attempts, 0);
}

TEST(ClientConfigTest, NegativeChunkSizeFallsBack) {
    auto settings = nlohmann::json::parse(R"({"upload": {"chunk_size": -5}})");

    auto config = util::ClientConfig::from_settings(settings);

    EXPECT_EQ(config.chunk_size, util::kDefaultChunkSize);

    settings["upload"]["chunk_size"] = -1;
    EXPECT_EQ(util::ClientConfig::from_settings(settings).chunk_size, util::kDefaultChunkSize);
}
