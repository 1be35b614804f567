#include "notification_channel.h"
#include "core/timer/spawn_after_delay.h"
#include <algorithm>
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>

namespace notification {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(30);
}

NotificationChannel::NotificationChannel(core::Executor& executor,
                                         util::ServerEndpoint endpoint,
                                         std::string client_id,
                                         ReconnectPolicy policy)
    : executor_(executor)
    , endpoint_(std::move(endpoint))
    , client_id_(std::move(client_id))
    , policy_(policy) {}

std::string NotificationChannel::target() const {
    return endpoint_.api_prefix + "/ws/processing/" + client_id_;
}

void NotificationChannel::open() {
    if (running_.exchange(true)) {
        spdlog::warn("[NotificationChannel::open] Channel for {} is already open", client_id_);
        return;
    }
    closing_.store(false);
    executor_.spawn(run());
}

boost::asio::awaitable<void> NotificationChannel::close() {
    if (closing_.exchange(true)) {
        co_return;
    }
    if (ws_ && ws_->is_open()) {
        boost::system::error_code ec;
        co_await ws_->async_close(websocket::close_code::normal,
                                  boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            spdlog::debug("[NotificationChannel::close] Close handshake failed: {}", ec.message());
            beast::get_lowest_layer(*ws_).close();
        }
    } else if (ws_) {
        // Still connecting; aborts the pending connect or handshake.
        beast::get_lowest_layer(*ws_).close();
    }
    connected_.store(false);
    spdlog::info("[NotificationChannel::close] Notification channel closed for {}", client_id_);
}

NotificationChannel::SubscriptionId NotificationChannel::subscribe(ChannelObserver& observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_subscription_++;
    subscribers_.emplace_back(id, &observer);
    return id;
}

void NotificationChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(subscribers_, [id](const auto& entry) { return entry.first == id; });
}

std::vector<ChannelObserver*> NotificationChannel::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChannelObserver*> observers;
    observers.reserve(subscribers_.size());
    for (const auto& [id, observer] : subscribers_) {
        observers.push_back(observer);
    }
    return observers;
}

void NotificationChannel::dispatch_message(std::string_view payload) {
    auto event = parse_processing_event(payload);
    if (!event) {
        spdlog::debug("[NotificationChannel] Dropping unrecognized message: {}", payload);
        return;
    }

    spdlog::info("[NotificationChannel] Processing complete: document {} ({})",
                 event->document_id,
                 event->filename);
    for (auto* observer : snapshot()) {
        observer->on_processing_complete(client_id_, *event);
    }
}

void NotificationChannel::report_open() {
    connected_.store(true);
    for (auto* observer : snapshot()) {
        observer->on_channel_open(client_id_);
    }
}

void NotificationChannel::report_error(const ChannelError& error) {
    connected_.store(false);
    spdlog::warn("[NotificationChannel] Channel for {} lost: {}", client_id_, error.message);
    for (auto* observer : snapshot()) {
        observer->on_channel_error(client_id_, error);
    }
}

boost::asio::awaitable<void> NotificationChannel::run() {
    int attempts = 0;
    while (!closing_.load()) {
        bool opened = false;
        try {
            opened = co_await connect_and_listen();
        } catch (const std::exception& e) {
            spdlog::error("[NotificationChannel::run] Unexpected failure: {}", e.what());
            report_error(ChannelError{e.what()});
        }
        if (closing_.load()) {
            break;
        }
        if (opened) {
            attempts = 0;
        }
        if (attempts >= policy_.attempts) {
            spdlog::warn("[NotificationChannel::run] Not reopening channel for {}", client_id_);
            break;
        }
        ++attempts;
        spdlog::info("[NotificationChannel::run] Reconnecting in {} ms (attempt {}/{})",
                     policy_.delay.count(),
                     attempts,
                     policy_.attempts);
        co_await core::timer::spawn_after_delay(
            []() -> boost::asio::awaitable<void> { co_return; },
            static_cast<int>(policy_.delay.count()));
    }
    running_.store(false);
}

boost::asio::awaitable<bool> NotificationChannel::connect_and_listen() {
    auto ex = co_await boost::asio::this_coro::executor;
    boost::system::error_code ec;

    // close() may run while any of the steps below is pending.
    auto closed_meanwhile = [this]() {
        if (!closing_.load()) {
            return false;
        }
        if (ws_) {
            beast::get_lowest_layer(*ws_).close();
        }
        spdlog::debug("[NotificationChannel] Channel for {} closed while connecting", client_id_);
        return true;
    };

    tcp::resolver resolver(ex);
    auto const results = co_await resolver.async_resolve(
        endpoint_.host,
        std::to_string(endpoint_.port),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (closed_meanwhile()) {
        co_return false;
    }
    if (ec) {
        report_error(ChannelError{"resolve failed: " + ec.message()});
        co_return false;
    }

    ws_.emplace(ex);
    beast::get_lowest_layer(*ws_).expires_after(kConnectTimeout);
    co_await beast::get_lowest_layer(*ws_).async_connect(
        results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (closed_meanwhile()) {
        co_return false;
    }
    if (ec) {
        report_error(ChannelError{"connect failed: " + ec.message()});
        co_return false;
    }

    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent,
                std::string(BOOST_BEAST_VERSION_STRING) + " DocRelay");
    }));

    const auto host = endpoint_.host + ":" + std::to_string(endpoint_.port);
    co_await ws_->async_handshake(host,
                                  target(),
                                  boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (closed_meanwhile()) {
        co_return false;
    }
    if (ec) {
        report_error(ChannelError{"handshake failed: " + ec.message()});
        co_return false;
    }

    spdlog::info("[NotificationChannel] Connected to ws://{}{}", host, target());
    report_open();

    beast::flat_buffer buffer;
    while (!closing_.load()) {
        co_await ws_->async_read(buffer, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            break;
        }
        dispatch_message(beast::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());
    }

    connected_.store(false);
    if (!closing_.load()) {
        report_error(ChannelError{ec ? ec.message() : "connection closed"});
    }
    co_return true;
}

} // namespace notification
