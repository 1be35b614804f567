#include "chunk_splitter.h"
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace upload {

std::uint64_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

ChunkRanges::ChunkRanges(std::uint64_t total_size, std::uint64_t chunk_size)
    : total_size_(total_size)
    , chunk_size_(chunk_size)
    , count_(chunk_count(total_size, chunk_size)) {}

ByteRange ChunkRanges::operator[](std::uint64_t index) const {
    if (index >= count_) {
        throw std::out_of_range("chunk index out of range");
    }
    const std::uint64_t start = index * chunk_size_;
    return ByteRange{start, std::min(start + chunk_size_, total_size_)};
}

std::optional<std::vector<std::byte>> read_chunk(const std::filesystem::path& path,
                                                 const ByteRange& range) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("[read_chunk] Failed to open file: {}", path.string());
        return std::nullopt;
    }

    file.seekg(static_cast<std::streamoff>(range.start), std::ios::beg);
    std::vector<std::byte> buffer(static_cast<std::size_t>(range.size()));
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    const auto bytes_read = static_cast<std::uint64_t>(file.gcount());
    if (bytes_read != range.size()) {
        spdlog::error("[read_chunk] Short read on {}: expected {} bytes at offset {}, got {}",
                      path.string(),
                      range.size(),
                      range.start,
                      bytes_read);
        return std::nullopt;
    }
    return buffer;
}

} // namespace upload
