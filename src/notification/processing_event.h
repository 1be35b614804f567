#pragma once

#include "upload/upload_types.h"
#include <optional>
#include <string>
#include <string_view>

namespace notification {

inline constexpr std::string_view kProcessingCompleteEvent = "processing_complete";

struct ProcessingCompletionEvent {
    upload::DocumentId document_id;
    std::string filename;
};

// {"event": "processing_complete", "document_id": <string|int>, "filename": <string>}
// Anything else, including invalid JSON, yields std::nullopt.
std::optional<ProcessingCompletionEvent> parse_processing_event(std::string_view payload);

} // namespace notification
