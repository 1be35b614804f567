#include "progress_display.h"
#include <fmt/format.h>
#include <string>

namespace cli {

void ProgressDisplay::update(const upload::UploadStatus& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        print(status);
        last_ = status;
    }
    cv_.notify_all();
}

upload::UploadStatus ProgressDisplay::wait_for_outcome(std::chrono::milliseconds timeout) {
    return wait_until(&ProgressDisplay::settled, timeout);
}

upload::UploadStatus ProgressDisplay::wait_until(
    std::function<bool(const upload::UploadStatus&)> done,
    std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this, &done] { return stopped_ || done(last_); };
    if (timeout.count() > 0) {
        cv_.wait_for(lock, timeout, ready);
    } else {
        cv_.wait(lock, ready);
    }
    return last_;
}

void ProgressDisplay::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_ = upload::UploadStatus{};
}

void ProgressDisplay::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool ProgressDisplay::settled(const upload::UploadStatus& status) {
    return upload::is_terminal(status.state) || status.stuck;
}

void ProgressDisplay::print(const upload::UploadStatus& status) {
    const int filled = status.progress * kBarWidth / 100;
    out_ << fmt::format("[{}{}] {:>3}% {:<12} {}\n",
                        std::string(filled, '#'),
                        std::string(kBarWidth - filled, '.'),
                        status.progress,
                        upload::to_string(status.state),
                        status.message);

    if (status.state == upload::UploadState::Completed && status.document_id) {
        if (last_.state == upload::UploadState::Assembling) {
            out_ << fmt::format("Document \"{}\" (ID: {}) has finished processing and is ready!\n",
                                status.filename,
                                *status.document_id);
        } else if (last_.state == upload::UploadState::Idle) {
            out_ << fmt::format("Document \"{}\" uploaded (ID: {})\n",
                                status.filename,
                                *status.document_id);
        }
    }
    if (status.channel_lost && !last_.channel_lost) {
        out_ << "Warning: notification channel lost; completion may not be reported.\n";
    }
    out_ << std::flush;
}

} // namespace cli
