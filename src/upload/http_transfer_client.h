#pragma once

#include "core/net/http_client.h"
#include "core/net/multipart_form.h"
#include "transfer_client.h"
#include "util/client_config.h"
#include <string_view>

namespace upload {

// Talks to the ingestion endpoints:
//   POST {prefix}/documents/upload          file, client_id          -> {"id": ...}
//   POST {prefix}/documents/upload-chunked  file_chunk, document_id,
//        chunk_index, total_chunks, filename, client_id (chunk 0)    -> {"document_id": ...}
class HttpTransferClient : public TransferClient {
  public:
    explicit HttpTransferClient(const util::ClientConfig& config);

    boost::asio::awaitable<TransferResult> upload_whole(const SourceFile& file,
                                                        ConstDataBlock data,
                                                        const std::string& client_id) override;

    boost::asio::awaitable<TransferResult> upload_chunk(const ChunkUpload& chunk) override;

    std::string whole_upload_target() const { return api_prefix_ + "/documents/upload"; }
    std::string chunked_upload_target() const { return api_prefix_ + "/documents/upload-chunked"; }

  private:
    boost::asio::awaitable<TransferResult> post_form(std::string target,
                                                     const core::net::MultipartForm& form,
                                                     std::string_view id_field);

    core::net::HttpClient http_;
    std::string api_prefix_;
};

// Maps a response to the document identifier found under id_field, or to a TransportError
// carrying the status and the server's "detail".
TransferResult interpret_response(const core::net::HttpResponse& response,
                                  std::string_view id_field);

} // namespace upload
