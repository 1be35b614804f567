#pragma once

#include "core/executor.h"
#include "notification/processing_event.h"
#include "transfer_client.h"
#include "upload_state.h"
#include "upload_types.h"
#include "util/client_config.h"
#include <atomic>
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace upload {

struct UploadOptions {
    std::uint64_t chunk_size = util::kDefaultChunkSize;
    // Zero waits for the completion event indefinitely.
    std::chrono::milliseconds completion_timeout{0};
    // Lower-case extensions including the dot; empty accepts any file.
    std::vector<std::string> allowed_extensions;

    static UploadOptions from_config(const util::ClientConfig& config);
};

// Drives one upload at a time for a presentation session identified by client_id.
//
// Status changes are applied through transition() on the executor's io_context;
// status() may be read from any thread. The coordinator must outlive the executor's run.
class UploadCoordinator {
  public:
    using StatusObserver = std::function<void(const UploadStatus&)>;

    UploadCoordinator(core::Executor& executor,
                      TransferClient& client,
                      std::string client_id,
                      UploadOptions options = {});
    ~UploadCoordinator() = default;

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    std::optional<UploadError> select_file(const std::filesystem::path& path);

    // Runs the whole transfer. Returns the error that ended it, or std::nullopt when the
    // bytes were accepted (state Completed or Assembling).
    boost::asio::awaitable<std::optional<UploadError>> start_upload();

    void cancel();

    // Called by the session correlator; queue the event and return immediately.
    void notify_processing_complete(const notification::ProcessingCompletionEvent& event);
    void notify_channel_lost();
    void notify_channel_restored();

    UploadStatus status() const;
    std::optional<DocumentId> document_id() const;
    const std::string& client_id() const { return client_id_; }
    const UploadOptions& options() const { return options_; }

    void set_status_observer(StatusObserver observer);

  private:
    boost::asio::awaitable<std::optional<UploadError>> send_whole(const SourceFile& file);
    boost::asio::awaitable<std::optional<UploadError>> send_chunks(const SourceFile& file);

    UploadStatus apply(const UploadEvent& event);
    std::optional<UploadError> fail(UploadError error);
    boost::asio::awaitable<void> watch_for_stall(std::uint64_t generation);
    void post(std::function<void()> task);

    core::Executor& executor_;
    TransferClient& client_;
    std::string client_id_;
    UploadOptions options_;

    mutable std::mutex mutex_;
    UploadStatus status_;
    std::optional<SourceFile> file_;
    std::uint64_t generation_ = 0;
    bool running_ = false;
    StatusObserver observer_;

    std::atomic<bool> cancel_requested_{false};
    boost::asio::steady_timer stall_timer_;
};

} // namespace upload
