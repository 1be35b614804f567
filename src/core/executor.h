#pragma once

#include <atomic>
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <optional>

namespace core {
class Executor {
  public:
    Executor() = default;

    ~Executor() {
        if (running_.load()) {
            stop();
        }
    }

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Blocks the calling thread running the io_context until stop().
    void start();
    void stop();

    bool is_running() const { return running_.load(); }

    boost::asio::io_context& get_io_context() { return io_context_; }

    template<typename Awaitable>
    auto spawn(Awaitable&& awaitable) {
        return boost::asio::co_spawn(io_context_,
                                     std::forward<Awaitable>(awaitable),
                                     boost::asio::detached);
    }

    template<typename Awaitable, typename CompletionToken>
    auto spawn(Awaitable&& awaitable, CompletionToken&& token) {
        return boost::asio::co_spawn(io_context_,
                                     std::forward<Awaitable>(awaitable),
                                     std::forward<CompletionToken>(token));
    }

  private:
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_{};
    std::atomic<bool> running_{false};
};
} // namespace core
