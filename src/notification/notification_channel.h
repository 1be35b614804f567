#pragma once

#include "channel_observer.h"
#include "core/executor.h"
#include "util/client_config.h"
#include <atomic>
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notification {

struct ReconnectPolicy {
    int attempts = 0; // 0 never reopens a dropped channel
    std::chrono::milliseconds delay{2000};
};

// Push channel {prefix}/ws/processing/{client_id}. One per client identifier, opened for the
// whole presentation session and shared by every upload issued from it.
//
// close() must complete, or the executor must be stopped, before the channel is destroyed.
class NotificationChannel {
  public:
    using SubscriptionId = std::uint64_t;

    NotificationChannel(core::Executor& executor,
                        util::ServerEndpoint endpoint,
                        std::string client_id,
                        ReconnectPolicy policy = {});
    ~NotificationChannel() = default;

    NotificationChannel(const NotificationChannel&) = delete;
    NotificationChannel& operator=(const NotificationChannel&) = delete;

    void open();
    boost::asio::awaitable<void> close();

    SubscriptionId subscribe(ChannelObserver& observer);
    void unsubscribe(SubscriptionId id);

    // Parses one pushed payload and hands a completion event to every subscriber.
    void dispatch_message(std::string_view payload);

    const std::string& client_id() const { return client_id_; }
    std::string target() const;
    bool is_open() const { return connected_.load(); }

  private:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    boost::asio::awaitable<void> run();
    // Returns true if the handshake succeeded before the connection ended.
    boost::asio::awaitable<bool> connect_and_listen();

    void report_open();
    void report_error(const ChannelError& error);
    std::vector<ChannelObserver*> snapshot() const;

    core::Executor& executor_;
    util::ServerEndpoint endpoint_;
    std::string client_id_;
    ReconnectPolicy policy_;

    std::optional<Stream> ws_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> connected_{false};

    mutable std::mutex mutex_;
    SubscriptionId next_subscription_ = 1;
    std::vector<std::pair<SubscriptionId, ChannelObserver*>> subscribers_;
};

} // namespace notification
