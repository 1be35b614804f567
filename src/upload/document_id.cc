#include "document_id.h"

namespace upload {

std::optional<DocumentId> parse_document_id(const nlohmann::json& value) {
    if (value.is_string()) {
        auto id = value.get<std::string>();
        if (id.empty()) {
            return std::nullopt;
        }
        return id;
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<std::uint64_t>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    return std::nullopt;
}

} // namespace upload
