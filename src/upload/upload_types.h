#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace upload {

using DocumentId = std::string;

// Sent as document_id on chunk 0, before the server has assigned one.
inline constexpr std::string_view kNewDocumentSentinel = "new";

enum class ErrorKind { InvalidInput, Transport, Channel, StuckProcessing, Cancelled };

std::string_view to_string(ErrorKind kind);

struct TransportError {
    unsigned http_status = 0; // 0 when no HTTP response was received
    std::string detail;
};

struct UploadError {
    ErrorKind kind = ErrorKind::InvalidInput;
    unsigned http_status = 0;
    std::string message;

    bool operator==(const UploadError&) const = default;

    static UploadError invalid_input(std::string message) {
        return {ErrorKind::InvalidInput, 0, std::move(message)};
    }

    // Uses the server detail when present, the fallback text otherwise.
    static UploadError from_transport(const TransportError& error, std::string_view fallback) {
        return {ErrorKind::Transport,
                error.http_status,
                error.detail.empty() ? std::string(fallback) : error.detail};
    }
};

struct SourceFile {
    std::filesystem::path path;
    std::string filename;
    std::uint64_t size = 0;
};

} // namespace upload
