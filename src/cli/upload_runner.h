#pragma once

#include "cli/progress_display.h"
#include "core/executor.h"
#include "upload/upload_coordinator.h"
#include <atomic>
#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cli {

// Uploads files one after another through a single coordinator. The display must be the
// coordinator's status observer.
class UploadRunner {
  public:
    UploadRunner(core::Executor& executor,
                 upload::UploadCoordinator& coordinator,
                 ProgressDisplay& display,
                 std::ostream& errors)
        : executor_(executor)
        , coordinator_(coordinator)
        , display_(display)
        , errors_(errors) {}

    UploadRunner(const UploadRunner&) = delete;
    UploadRunner& operator=(const UploadRunner&) = delete;

    // wait bounds how long each upload may stay unsettled (zero waits forever). An upload
    // that is stuck or still running afterwards is cancelled before the next file starts.
    // Returns true when every file completed.
    bool run(const std::vector<std::string>& files, std::chrono::milliseconds wait);

    // Safe from any thread, e.g. a signal handler.
    void interrupt();

  private:
    std::optional<upload::UploadError> upload();
    upload::UploadStatus abandon();

    core::Executor& executor_;
    upload::UploadCoordinator& coordinator_;
    ProgressDisplay& display_;
    std::ostream& errors_;
    std::atomic<bool> interrupted_{false};

    static constexpr std::chrono::milliseconds kCancelTimeout{2000};
};

} // namespace cli
