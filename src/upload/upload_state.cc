#include "upload_state.h"
#include <algorithm>
#include <fmt/format.h>

namespace upload {
namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::string_view kAssemblingMessage = "Assembling and processing...";
constexpr std::string_view kStillProcessingMessage = "Still processing on the server...";
constexpr std::string_view kChannelLostMessage
    = "Notification channel lost; completion may not be reported.";

bool in_flight(UploadState state) {
    return state == UploadState::Transferring || state == UploadState::Assembling;
}

UploadStatus on_file_selected(const UploadStatus& status, const events::FileSelected& event) {
    if (in_flight(status.state)) {
        return status;
    }
    UploadStatus next;
    next.filename = event.filename;
    next.channel_lost = status.channel_lost;
    return next;
}

UploadStatus on_transfer_started(const UploadStatus& status,
                                 const events::TransferStarted& event) {
    if (status.state != UploadState::Idle || event.total_chunks == 0) {
        return status;
    }
    UploadStatus next = status;
    next.state = UploadState::Transferring;
    next.progress = 0;
    next.total_chunks = event.total_chunks;
    next.completed_chunks = 0;
    next.message = "Uploading...";
    return next;
}

UploadStatus on_chunk_acknowledged(const UploadStatus& status,
                                   const events::ChunkAcknowledged& event) {
    if (status.state != UploadState::Transferring || event.index >= status.total_chunks) {
        return status;
    }
    UploadStatus next = status;
    if (!next.document_id && !event.document_id.empty()) {
        next.document_id = event.document_id;
    }
    next.completed_chunks = std::max(next.completed_chunks, event.index + 1);
    next.progress = std::max(next.progress, progress_for(next.completed_chunks, next.total_chunks));
    next.message = fmt::format("Chunk {} uploaded", event.index + 1);

    if (next.completed_chunks == next.total_chunks) {
        next.state = UploadState::Assembling;
        next.progress = 100;
        next.message = std::string(kAssemblingMessage);
        if (next.channel_lost) {
            next.message = std::string(kChannelLostMessage);
        }
    }
    return next;
}

UploadStatus on_whole_file_acknowledged(const UploadStatus& status,
                                        const events::WholeFileAcknowledged& event) {
    if (status.state != UploadState::Idle) {
        return status;
    }
    UploadStatus next = status;
    next.state = UploadState::Completed;
    next.progress = 100;
    next.total_chunks = 1;
    next.completed_chunks = 1;
    next.document_id = event.document_id;
    next.message = "Upload complete!";
    return next;
}

UploadStatus on_transfer_failed(const UploadStatus& status, const events::TransferFailed& event) {
    if (is_terminal(status.state)) {
        return status;
    }
    UploadStatus next = status;
    next.state = UploadState::Failed;
    if (status.state != UploadState::Assembling) {
        next.progress = progress_for(status.completed_chunks, status.total_chunks);
    }
    next.error = event.error;
    next.message = event.error.message;
    next.completion_pending = false;
    return next;
}

UploadStatus on_processing_completed(const UploadStatus& status,
                                     const events::ProcessingCompleted& event) {
    if (!status.document_id || *status.document_id != event.document_id) {
        return status;
    }
    UploadStatus next = status;
    if (status.state == UploadState::Transferring) {
        next.completion_pending = true;
        return next;
    }
    if (status.state != UploadState::Assembling) {
        return status;
    }
    next.state = UploadState::Completed;
    next.progress = 100;
    next.completion_pending = false;
    next.stuck = false;
    next.error.reset();
    next.message = "Processing complete!";
    if (!event.filename.empty()) {
        next.filename = event.filename;
    }
    return next;
}

UploadStatus on_processing_stalled(const UploadStatus& status) {
    if (status.state != UploadState::Assembling || status.stuck) {
        return status;
    }
    UploadStatus next = status;
    next.stuck = true;
    next.message = std::string(kStillProcessingMessage);
    next.error = UploadError{ErrorKind::StuckProcessing, 0, std::string(kStillProcessingMessage)};
    return next;
}

UploadStatus on_channel_lost(const UploadStatus& status) {
    UploadStatus next = status;
    next.channel_lost = true;
    if (status.state == UploadState::Assembling) {
        next.message = std::string(kChannelLostMessage);
    }
    return next;
}

UploadStatus on_channel_restored(const UploadStatus& status) {
    UploadStatus next = status;
    next.channel_lost = false;
    if (status.state == UploadState::Assembling && !status.stuck) {
        next.message = std::string(kAssemblingMessage);
    }
    return next;
}

UploadStatus on_cancelled(const UploadStatus& status) {
    if (!in_flight(status.state)) {
        return status;
    }
    return on_transfer_failed(
        status,
        events::TransferFailed{UploadError{ErrorKind::Cancelled, 0, "Upload cancelled."}});
}

} // namespace

std::string_view to_string(UploadState state) {
    switch (state) {
    case UploadState::Idle:
        return "Idle";
    case UploadState::Transferring:
        return "Transferring";
    case UploadState::Assembling:
        return "Assembling";
    case UploadState::Completed:
        return "Completed";
    case UploadState::Failed:
        return "Failed";
    }
    return "Unknown";
}

int progress_for(std::uint64_t completed, std::uint64_t total) {
    if (total == 0) {
        return 0;
    }
    completed = std::min(completed, total);
    return static_cast<int>((completed * 100 + total - 1) / total);
}

UploadStatus transition(const UploadStatus& status, const UploadEvent& event) {
    return std::visit(
        overloaded{
            [&](const events::FileSelected& e) { return on_file_selected(status, e); },
            [&](const events::TransferStarted& e) { return on_transfer_started(status, e); },
            [&](const events::ChunkAcknowledged& e) { return on_chunk_acknowledged(status, e); },
            [&](const events::WholeFileAcknowledged& e) {
                return on_whole_file_acknowledged(status, e);
            },
            [&](const events::TransferFailed& e) { return on_transfer_failed(status, e); },
            [&](const events::ProcessingCompleted& e) {
                return on_processing_completed(status, e);
            },
            [&](const events::ProcessingStalled&) { return on_processing_stalled(status); },
            [&](const events::ChannelLost&) { return on_channel_lost(status); },
            [&](const events::ChannelRestored&) { return on_channel_restored(status); },
            [&](const events::Cancelled&) { return on_cancelled(status); },
        },
        event);
}

} // namespace upload
