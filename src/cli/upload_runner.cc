#include "upload_runner.h"
#include <exception>
#include <future>
#include <spdlog/spdlog.h>

namespace cli {

bool UploadRunner::run(const std::vector<std::string>& files, std::chrono::milliseconds wait) {
    bool all_completed = true;
    for (const auto& file : files) {
        if (interrupted_.load()) {
            all_completed = false;
            break;
        }
        display_.reset();
        if (auto error = coordinator_.select_file(file)) {
            errors_ << file << ": " << error->message << "\n";
            all_completed = false;
            continue;
        }
        if (auto error = upload()) {
            errors_ << file << ": " << error->message << "\n";
            all_completed = false;
            continue;
        }

        auto outcome = display_.wait_for_outcome(wait);
        if (!upload::is_terminal(coordinator_.status().state)) {
            outcome = abandon();
        }
        if (outcome.state != upload::UploadState::Completed) {
            errors_ << file << ": " << outcome.message << "\n";
            all_completed = false;
        }
    }
    return all_completed;
}

void UploadRunner::interrupt() {
    interrupted_ = true;
    coordinator_.cancel();
    display_.stop();
}

std::optional<upload::UploadError> UploadRunner::upload() {
    std::promise<std::optional<upload::UploadError>> done;
    auto future = done.get_future();
    executor_.spawn(coordinator_.start_upload(),
                    [&done](std::exception_ptr e, std::optional<upload::UploadError> result) {
                        if (e) {
                            done.set_exception(e);
                        } else {
                            done.set_value(std::move(result));
                        }
                    });
    try {
        return future.get();
    } catch (const std::exception& e) {
        spdlog::error("[UploadRunner::upload] Upload aborted: {}", e.what());
        return upload::UploadError{upload::ErrorKind::Transport, 0, e.what()};
    }
}

upload::UploadStatus UploadRunner::abandon() {
    const auto before = coordinator_.status();
    spdlog::warn("[UploadRunner::abandon] Giving up on {} in state {}",
                 before.filename,
                 upload::to_string(before.state));
    coordinator_.cancel();
    auto terminal = [](const upload::UploadStatus& status) {
        return upload::is_terminal(status.state);
    };
    display_.wait_until(terminal, kCancelTimeout);

    auto after = coordinator_.status();
    if (!upload::is_terminal(after.state)) {
        spdlog::error("[UploadRunner::abandon] {} did not settle after cancel", after.filename);
    }
    return after;
}

} // namespace cli
