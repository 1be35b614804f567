#pragma once

#include "upload_types.h"
#include <nlohmann/json.hpp>
#include <optional>

namespace upload {

// The server sends identifiers either as JSON strings or as integers; both map to the
// decimal/string form used on the client.
std::optional<DocumentId> parse_document_id(const nlohmann::json& value);

} // namespace upload
