#include "executor.h"
#include <spdlog/spdlog.h>

namespace core {
void Executor::start() {
    if (running_.exchange(true)) {
        spdlog::warn("Executor is already running");
        return;
    }
    if (!work_guard_) {
        work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    }
    if (io_context_.stopped()) {
        io_context_.restart();
    }
    spdlog::debug("Executor started");
    io_context_.run();
}

void Executor::stop() {
    if (!running_.exchange(false)) {
        spdlog::warn("Executor is not running");
        return;
    }

    spdlog::debug("Stopping Executor...");
    if (work_guard_) {
        work_guard_.reset();
    }

    io_context_.stop();
    spdlog::debug("Executor stopped");
}
} // namespace core
