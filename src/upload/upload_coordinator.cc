#include "upload_coordinator.h"
#include "chunk_splitter.h"
#include <algorithm>
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cctype>
#include <spdlog/spdlog.h>
#include <system_error>

namespace upload {
namespace {
std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool in_flight(UploadState state) {
    return state == UploadState::Transferring || state == UploadState::Assembling;
}
} // namespace

UploadOptions UploadOptions::from_config(const util::ClientConfig& config) {
    UploadOptions options;
    options.chunk_size = config.chunk_size;
    options.completion_timeout = config.completion_timeout;
    for (const auto& extension : config.allowed_extensions) {
        options.allowed_extensions.push_back(to_lower(extension));
    }
    return options;
}

UploadCoordinator::UploadCoordinator(core::Executor& executor,
                                     TransferClient& client,
                                     std::string client_id,
                                     UploadOptions options)
    : executor_(executor)
    , client_(client)
    , client_id_(std::move(client_id))
    , options_(std::move(options))
    , stall_timer_(executor.get_io_context()) {
    if (options_.chunk_size == 0) {
        spdlog::warn("[UploadCoordinator] Chunk size must be positive, using {}",
                     util::kDefaultChunkSize);
        options_.chunk_size = util::kDefaultChunkSize;
    }
}

std::optional<UploadError> UploadCoordinator::select_file(const std::filesystem::path& path) {
    auto reject = [](std::string message) {
        spdlog::warn("[UploadCoordinator::select_file] {}", message);
        return UploadError::invalid_input(std::move(message));
    };

    if (path.empty()) {
        return reject("No file selected");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ || in_flight(status_.state)) {
            return reject("An upload is already in progress");
        }
    }

    std::error_code ec;
    const auto file_status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::is_regular_file(file_status)) {
        return reject("Not a readable file: " + path.string());
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return reject("Cannot determine size of " + path.string() + ": " + ec.message());
    }
    if (size == 0) {
        return reject("File is empty: " + path.string());
    }
    if (!options_.allowed_extensions.empty()) {
        const auto extension = to_lower(path.extension().string());
        if (std::find(options_.allowed_extensions.begin(),
                      options_.allowed_extensions.end(),
                      extension)
            == options_.allowed_extensions.end()) {
            return reject("Unsupported file type: " + path.filename().string());
        }
    }

    SourceFile file{path, path.filename().string(), size};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ || in_flight(status_.state)) {
            return reject("An upload is already in progress");
        }
        file_ = file;
        ++generation_;
        cancel_requested_.store(false);
    }
    post([this, filename = file.filename]() {
        stall_timer_.cancel();
        apply(events::FileSelected{filename});
    });
    spdlog::info("[UploadCoordinator::select_file] Selected {} ({} bytes)", file.filename, size);
    return std::nullopt;
}

boost::asio::awaitable<std::optional<UploadError>> UploadCoordinator::start_upload() {
    // A selection made just before is applied by a handler queued ahead of this one.
    co_await boost::asio::post(co_await boost::asio::this_coro::executor,
                               boost::asio::use_awaitable);

    std::optional<SourceFile> file;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!file_) {
            spdlog::warn("[UploadCoordinator::start_upload] No file selected");
            co_return UploadError::invalid_input("No file selected");
        }
        if (running_ || status_.state != UploadState::Idle) {
            spdlog::warn("[UploadCoordinator::start_upload] Upload already started for {}",
                         file_->filename);
            co_return UploadError::invalid_input("Select the file again to restart the upload");
        }
        running_ = true;
        file = file_;
        generation = generation_;
    }

    std::optional<UploadError> result;
    try {
        if (file->size <= options_.chunk_size) {
            result = co_await send_whole(*file);
        } else {
            result = co_await send_chunks(*file);
        }
    } catch (const std::exception& e) {
        spdlog::error("[UploadCoordinator::start_upload] Upload of {} aborted: {}",
                      file->filename,
                      e.what());
        result = fail(UploadError{ErrorKind::Transport, 0, e.what()});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }

    if (!result) {
        const auto current = status();
        if (current.state == UploadState::Assembling) {
            if (current.completion_pending && current.document_id) {
                apply(events::ProcessingCompleted{*current.document_id, current.filename});
            } else {
                executor_.spawn(watch_for_stall(generation));
            }
        }
    }
    co_return result;
}

boost::asio::awaitable<std::optional<UploadError>> UploadCoordinator::send_whole(
    const SourceFile& file) {
    auto data = read_chunk(file.path, ByteRange{0, file.size});
    if (!data) {
        co_return fail(UploadError::invalid_input("Failed to read " + file.filename));
    }

    spdlog::info("[UploadCoordinator::send_whole] Uploading {} ({} bytes) in one request",
                 file.filename,
                 file.size);
    auto result = co_await client_.upload_whole(file,
                                                ConstDataBlock(data->data(), data->size()),
                                                client_id_);
    if (const auto* error = std::get_if<TransportError>(&result)) {
        co_return fail(UploadError::from_transport(*error, "Upload failed."));
    }

    apply(events::WholeFileAcknowledged{std::get<DocumentId>(result)});
    co_return std::nullopt;
}

boost::asio::awaitable<std::optional<UploadError>> UploadCoordinator::send_chunks(
    const SourceFile& file) {
    const auto ranges = split(file.size, options_.chunk_size);
    const auto total = ranges.size();
    apply(events::TransferStarted{total});
    spdlog::info("[UploadCoordinator::send_chunks] Uploading {} ({} bytes) in {} chunks",
                 file.filename,
                 file.size,
                 total);

    DocumentId document_id{kNewDocumentSentinel};
    bool assigned = false;

    for (std::uint64_t index = 0; index < total; ++index) {
        if (cancel_requested_.load()) {
            apply(events::Cancelled{});
            spdlog::info("[UploadCoordinator::send_chunks] Cancelled before chunk {}/{}",
                         index + 1,
                         total);
            co_return status().error;
        }

        const auto range = ranges[index];
        auto data = read_chunk(file.path, range);
        if (!data) {
            co_return fail(UploadError::invalid_input(
                "Failed to read chunk " + std::to_string(index + 1) + " of " + file.filename));
        }

        ChunkUpload chunk;
        chunk.data = ConstDataBlock(data->data(), data->size());
        chunk.document_id = document_id;
        chunk.index = index;
        chunk.total = total;
        chunk.filename = file.filename;
        if (index == 0) {
            chunk.client_id = client_id_;
        }

        auto result = co_await client_.upload_chunk(chunk);
        if (const auto* error = std::get_if<TransportError>(&result)) {
            spdlog::error("[UploadCoordinator::send_chunks] Chunk {}/{} of {} failed (HTTP {})",
                          index + 1,
                          total,
                          file.filename,
                          error->http_status);
            co_return fail(UploadError::from_transport(*error, "Chunk upload failed."));
        }

        const auto& returned = std::get<DocumentId>(result);
        if (!assigned) {
            document_id = returned;
            assigned = true;
        }
        apply(events::ChunkAcknowledged{index, returned});
        spdlog::debug("[UploadCoordinator::send_chunks] Chunk {}/{} of {} acknowledged ({} bytes)",
                      index + 1,
                      total,
                      file.filename,
                      range.size());
    }

    if (cancel_requested_.load()) {
        apply(events::Cancelled{});
        co_return status().error;
    }
    co_return std::nullopt;
}

boost::asio::awaitable<void> UploadCoordinator::watch_for_stall(std::uint64_t generation) {
    if (options_.completion_timeout.count() <= 0) {
        co_return;
    }
    stall_timer_.expires_after(options_.completion_timeout);
    boost::system::error_code ec;
    co_await stall_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || status_.state != UploadState::Assembling) {
            co_return;
        }
    }
    spdlog::warn("[UploadCoordinator] No completion event after {} ms for document {}",
                 options_.completion_timeout.count(),
                 document_id().value_or("<unknown>"));
    apply(events::ProcessingStalled{});
}

void UploadCoordinator::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && !in_flight(status_.state)) {
            return;
        }
    }
    cancel_requested_.store(true);
    spdlog::info("[UploadCoordinator::cancel] Cancellation requested");
    post([this]() {
        stall_timer_.cancel();
        if (status().state == UploadState::Assembling) {
            apply(events::Cancelled{});
        }
    });
}

void UploadCoordinator::notify_processing_complete(
    const notification::ProcessingCompletionEvent& event) {
    post([this, event]() {
        const auto before = status();
        const auto after = apply(events::ProcessingCompleted{event.document_id, event.filename});
        if (after == before) {
            spdlog::debug("[UploadCoordinator] Ignoring completion for document {} in state {}",
                          event.document_id,
                          to_string(before.state));
        } else if (after.state == UploadState::Completed) {
            stall_timer_.cancel();
        }
    });
}

void UploadCoordinator::notify_channel_lost() {
    post([this]() { apply(events::ChannelLost{}); });
}

void UploadCoordinator::notify_channel_restored() {
    post([this]() { apply(events::ChannelRestored{}); });
}

UploadStatus UploadCoordinator::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<DocumentId> UploadCoordinator::document_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_.document_id;
}

void UploadCoordinator::set_status_observer(StatusObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

UploadStatus UploadCoordinator::apply(const UploadEvent& event) {
    UploadStatus previous;
    UploadStatus next;
    StatusObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = status_;
        next = transition(status_, event);
        if (next == previous) {
            return next;
        }
        status_ = next;
        observer = observer_;
    }

    if (next.state != previous.state) {
        spdlog::info("[UploadCoordinator] {} -> {} ({}%) {}",
                     to_string(previous.state),
                     to_string(next.state),
                     next.progress,
                     next.message);
    }
    if (observer) {
        observer(next);
    }
    return next;
}

std::optional<UploadError> UploadCoordinator::fail(UploadError error) {
    spdlog::error("[UploadCoordinator] {}: {}", to_string(error.kind), error.message);
    apply(events::TransferFailed{error});
    return error;
}

void UploadCoordinator::post(std::function<void()> task) {
    boost::asio::post(executor_.get_io_context(), std::move(task));
}

} // namespace upload
