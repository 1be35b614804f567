#include "cli/progress_display.h"
#include "cli/upload_runner.h"
#include "core/executor.h"
#include "notification/notification_channel.h"
#include "notification/session_correlator.h"
#include "upload/http_transfer_client.h"
#include "upload/upload_coordinator.h"
#include "util/client_config.h"
#include "util/settings.h"
#include "util/uuid.h"
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Arguments {
    std::optional<std::string> config_path;
    std::chrono::milliseconds wait{0};
    std::vector<std::string> files;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <settings.json>] [--wait-ms <n>] <file>...\n";
}

std::optional<Arguments> parse_arguments(int argc, char** argv) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (++i >= argc) {
                return std::nullopt;
            }
            args.config_path = argv[i];
        } else if (arg == "--wait-ms") {
            if (++i >= argc) {
                return std::nullopt;
            }
            try {
                const auto value = std::stoll(argv[i]);
                if (value < 0) {
                    return std::nullopt;
                }
                args.wait = std::chrono::milliseconds(value);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else {
            args.files.push_back(arg);
        }
    }
    if (args.files.empty()) {
        return std::nullopt;
    }
    return args;
}

boost::asio::awaitable<void> shut_down(boost::asio::signal_set& signals,
                                       notification::NotificationChannel& channel) {
    boost::system::error_code ec;
    signals.cancel(ec);
    co_await channel.close();
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage(argv[0]);
        return 2;
    }

    auto& settings = util::Settings::instance();
    if (args->config_path) {
        settings.init_from_file(*args->config_path);
    } else {
        settings.init(argv[0]);
    }
    const auto config = util::ClientConfig::from_settings(settings.get());
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("DocRelay starting, server {}:{}{}",
                 config.server.host,
                 config.server.port,
                 config.server.api_prefix);

    core::Executor executor;
    std::thread io_thread([&executor]() { executor.start(); });

    const auto client_id = util::generate_uuid();
    spdlog::info("Client id: {}", client_id);

    notification::NotificationChannel channel(
        executor,
        config.server,
        client_id,
        notification::ReconnectPolicy{config.reconnect_attempts, config.reconnect_delay});
    notification::SessionCorrelator correlator;
    correlator.bind_channel(channel);

    upload::HttpTransferClient transfer_client(config);
    upload::UploadCoordinator coordinator(executor,
                                          transfer_client,
                                          client_id,
                                          upload::UploadOptions::from_config(config));
    correlator.attach(coordinator);

    cli::ProgressDisplay display(std::cout);
    coordinator.set_status_observer(
        [&display](const upload::UploadStatus& status) { display.update(status); });

    cli::UploadRunner runner(executor, coordinator, display, std::cerr);
    boost::asio::signal_set signals(executor.get_io_context(), SIGINT, SIGTERM);
    signals.async_wait([&runner](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        spdlog::info("Received interrupt signal, shutting down...");
        runner.interrupt();
    });

    channel.open();

    const bool all_completed = runner.run(args->files, args->wait);

    spdlog::info("Shutting down...");
    std::promise<void> closed;
    executor.spawn(shut_down(signals, channel), [&closed](std::exception_ptr) {
        closed.set_value();
    });
    closed.get_future().wait_for(std::chrono::seconds(2));

    correlator.detach(coordinator);
    correlator.unbind_channel(client_id);
    executor.stop();
    if (io_thread.joinable()) {
        io_thread.join();
    }
    return all_completed ? 0 : 1;
}
