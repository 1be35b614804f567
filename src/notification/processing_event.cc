#include "processing_event.h"
#include "upload/document_id.h"
#include <nlohmann/json.hpp>

namespace notification {

std::optional<ProcessingCompletionEvent> parse_processing_event(std::string_view payload) {
    const auto message = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (!message.is_object()) {
        return std::nullopt;
    }

    auto event = message.find("event");
    if (event == message.end() || !event->is_string()
        || event->get<std::string>() != kProcessingCompleteEvent) {
        return std::nullopt;
    }

    auto id = message.find("document_id");
    if (id == message.end()) {
        return std::nullopt;
    }
    auto document_id = upload::parse_document_id(*id);
    if (!document_id) {
        return std::nullopt;
    }

    ProcessingCompletionEvent result;
    result.document_id = std::move(*document_id);
    auto filename = message.find("filename");
    if (filename != message.end() && filename->is_string()) {
        result.filename = filename->get<std::string>();
    }
    return result;
}

} // namespace notification
