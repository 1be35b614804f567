#include "upload_types.h"

namespace upload {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput:
        return "InvalidInput";
    case ErrorKind::Transport:
        return "TransportError";
    case ErrorKind::Channel:
        return "ChannelError";
    case ErrorKind::StuckProcessing:
        return "StuckProcessing";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

} // namespace upload
