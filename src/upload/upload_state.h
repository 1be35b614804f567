#pragma once

#include "upload_types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace upload {

enum class UploadState { Idle, Transferring, Assembling, Completed, Failed };

std::string_view to_string(UploadState state);

inline bool is_terminal(UploadState state) {
    return state == UploadState::Completed || state == UploadState::Failed;
}

// Everything the presentation layer needs to render one upload.
struct UploadStatus {
    UploadState state = UploadState::Idle;
    int progress = 0;
    std::string message;
    std::string filename;
    std::optional<DocumentId> document_id;
    std::optional<UploadError> error;
    std::uint64_t completed_chunks = 0;
    std::uint64_t total_chunks = 0;

    // A matching completion arrived before the last chunk was acknowledged.
    bool completion_pending = false;
    bool stuck = false;
    bool channel_lost = false;

    bool operator==(const UploadStatus&) const = default;
};

namespace events {
struct FileSelected {
    std::string filename;
};
struct TransferStarted {
    std::uint64_t total_chunks = 0;
};
struct ChunkAcknowledged {
    std::uint64_t index = 0;
    DocumentId document_id;
};
struct WholeFileAcknowledged {
    DocumentId document_id;
};
struct TransferFailed {
    UploadError error;
};
struct ProcessingCompleted {
    DocumentId document_id;
    std::string filename;
};
struct ProcessingStalled {};
struct ChannelLost {};
struct ChannelRestored {};
struct Cancelled {};
} // namespace events

using UploadEvent = std::variant<events::FileSelected,
                                 events::TransferStarted,
                                 events::ChunkAcknowledged,
                                 events::WholeFileAcknowledged,
                                 events::TransferFailed,
                                 events::ProcessingCompleted,
                                 events::ProcessingStalled,
                                 events::ChannelLost,
                                 events::ChannelRestored,
                                 events::Cancelled>;

// ceil(100 * completed / total), clamped to [0, 100].
int progress_for(std::uint64_t completed, std::uint64_t total);

// The only way an UploadStatus changes. Events that are not valid in the current state
// return the status unchanged.
UploadStatus transition(const UploadStatus& status, const UploadEvent& event);

} // namespace upload
