#include "http_transfer_client.h"
#include "document_id.h"
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace upload {

HttpTransferClient::HttpTransferClient(const util::ClientConfig& config)
    : http_(config.server.host, config.server.port, config.request_timeout)
    , api_prefix_(config.server.api_prefix) {}

boost::asio::awaitable<TransferResult> HttpTransferClient::upload_whole(
    const SourceFile& file, ConstDataBlock data, const std::string& client_id) {
    core::net::MultipartForm form;
    form.add_file("file", file.filename, data);
    form.add_field("client_id", client_id);
    co_return co_await post_form(whole_upload_target(), form, "id");
}

boost::asio::awaitable<TransferResult> HttpTransferClient::upload_chunk(const ChunkUpload& chunk) {
    core::net::MultipartForm form;
    form.add_file("file_chunk", chunk.filename, chunk.data);
    form.add_field("document_id", chunk.document_id);
    form.add_field("chunk_index", std::to_string(chunk.index));
    form.add_field("total_chunks", std::to_string(chunk.total));
    form.add_field("filename", chunk.filename);
    if (chunk.client_id) {
        form.add_field("client_id", *chunk.client_id);
    }
    co_return co_await post_form(chunked_upload_target(), form, "document_id");
}

boost::asio::awaitable<TransferResult> HttpTransferClient::post_form(
    std::string target, const core::net::MultipartForm& form, std::string_view id_field) {
    try {
        auto response = co_await http_.post(target, form.build(), form.content_type());
        co_return interpret_response(response, id_field);
    } catch (const boost::system::system_error& e) {
        spdlog::error("[HttpTransferClient::post_form] {} failed: {}", target, e.code().message());
        co_return TransportError{0, e.code().message()};
    }
}

TransferResult interpret_response(const core::net::HttpResponse& response,
                                  std::string_view id_field) {
    const auto body = nlohmann::json::parse(response.body, nullptr, false);

    if (!response.ok()) {
        TransportError error{response.status, {}};
        if (body.is_object()) {
            auto detail = body.find("detail");
            if (detail != body.end() && !detail->is_null()) {
                error.detail = detail->is_string() ? detail->get<std::string>() : detail->dump();
            }
        }
        spdlog::error("[interpret_response] HTTP {}: {}",
                      response.status,
                      error.detail.empty() ? "<no detail>" : error.detail);
        return error;
    }

    if (body.is_object()) {
        auto id = body.find(std::string(id_field));
        if (id != body.end()) {
            if (auto document_id = parse_document_id(*id)) {
                return *document_id;
            }
        }
    }
    spdlog::error("[interpret_response] HTTP {} without a usable '{}' field",
                  response.status,
                  id_field);
    return TransportError{response.status, "Malformed server response"};
}

} // namespace upload
