#pragma once

#include "upload_types.h"
#include "util/data_block.h"
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace upload {

using TransferResult = std::variant<DocumentId, TransportError>;

struct ChunkUpload {
    ConstDataBlock data;
    DocumentId document_id{kNewDocumentSentinel};
    std::uint64_t index = 0;
    std::uint64_t total = 0;
    std::string filename;
    // Present on chunk 0 only.
    std::optional<std::string> client_id;
};

class TransferClient {
  public:
    virtual ~TransferClient() = default;

    virtual boost::asio::awaitable<TransferResult> upload_whole(const SourceFile& file,
                                                                ConstDataBlock data,
                                                                const std::string& client_id)
        = 0;

    virtual boost::asio::awaitable<TransferResult> upload_chunk(const ChunkUpload& chunk) = 0;
};

} // namespace upload
