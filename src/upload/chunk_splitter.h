#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <vector>

namespace upload {

// Half-open byte range [start, end) of the source file.
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    std::uint64_t size() const { return end - start; }

    bool operator==(const ByteRange&) const = default;
};

std::uint64_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size);

// Lazily computed chunk ranges of a file. Holds only the two sizes, so iterating again
// or copying the object yields the same sequence.
class ChunkRanges {
  public:
    class iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = std::forward_iterator_tag;
        using value_type = ByteRange;
        using difference_type = std::ptrdiff_t;
        using reference = ByteRange;

        iterator() = default;

        ByteRange operator*() const { return (*ranges_)[index_]; }

        iterator& operator++() {
            ++index_;
            return *this;
        }

        iterator operator++(int) {
            iterator previous = *this;
            ++index_;
            return previous;
        }

        bool operator==(const iterator& other) const { return index_ == other.index_; }

      private:
        friend class ChunkRanges;
        iterator(const ChunkRanges* ranges, std::uint64_t index)
            : ranges_(ranges)
            , index_(index) {}

        const ChunkRanges* ranges_ = nullptr;
        std::uint64_t index_ = 0;
    };

    // Throws std::invalid_argument when chunk_size is zero.
    ChunkRanges(std::uint64_t total_size, std::uint64_t chunk_size);

    std::uint64_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    ByteRange operator[](std::uint64_t index) const;

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, count_); }

    std::uint64_t total_size() const { return total_size_; }
    std::uint64_t chunk_size() const { return chunk_size_; }

  private:
    std::uint64_t total_size_;
    std::uint64_t chunk_size_;
    std::uint64_t count_;
};

inline ChunkRanges split(std::uint64_t total_size, std::uint64_t chunk_size) {
    return ChunkRanges(total_size, chunk_size);
}

// Reads the bytes of one range; std::nullopt if the file cannot be read in full.
std::optional<std::vector<std::byte>> read_chunk(const std::filesystem::path& path,
                                                 const ByteRange& range);

} // namespace upload
