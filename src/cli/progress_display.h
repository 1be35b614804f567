#pragma once

#include "upload/upload_state.h"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>

namespace cli {

// Prints coordinator status changes and lets the main thread wait for an upload to settle.
class ProgressDisplay {
  public:
    explicit ProgressDisplay(std::ostream& out)
        : out_(out) {}

    ProgressDisplay(const ProgressDisplay&) = delete;
    ProgressDisplay& operator=(const ProgressDisplay&) = delete;

    void update(const upload::UploadStatus& status);

    // Blocks until the last status is Completed, Failed or stuck, or until timeout elapses
    // (zero waits forever). Returns the last status seen.
    upload::UploadStatus wait_for_outcome(std::chrono::milliseconds timeout);

    // Same as wait_for_outcome with a caller-supplied condition.
    upload::UploadStatus wait_until(std::function<bool(const upload::UploadStatus&)> done,
                                    std::chrono::milliseconds timeout);

    void reset();
    void stop();

  private:
    static bool settled(const upload::UploadStatus& status);
    void print(const upload::UploadStatus& status);

    std::ostream& out_;
    std::mutex mutex_;
    std::condition_variable cv_;
    upload::UploadStatus last_;
    bool stopped_ = false;

    static constexpr int kBarWidth = 30;
};

} // namespace cli
