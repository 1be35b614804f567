#pragma once

#include <cstddef>
#include <span>
#include <string_view>

using ConstDataBlock = std::span<const std::byte>;

namespace util {

inline ConstDataBlock as_bytes(std::string_view text) {
    return ConstDataBlock(reinterpret_cast<const std::byte*>(text.data()), text.size());
}

inline std::string_view as_string_view(ConstDataBlock data) {
    return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace util
