#include "http_client.h"
#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

namespace core::net {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

HttpClient::HttpClient(std::string host, std::uint16_t port, std::chrono::milliseconds timeout)
    : host_(std::move(host))
    , port_(port)
    , timeout_(timeout) {}

boost::asio::awaitable<HttpResponse> HttpClient::post(std::string target,
                                                      std::string body,
                                                      std::string content_type) {
    auto ex = co_await boost::asio::this_coro::executor;

    tcp::resolver resolver(ex);
    auto const results = co_await resolver.async_resolve(host_,
                                                         std::to_string(port_),
                                                         boost::asio::use_awaitable);

    beast::tcp_stream stream(ex);
    if (timeout_.count() > 0) {
        stream.expires_after(timeout_);
    }
    co_await stream.async_connect(results, boost::asio::use_awaitable);

    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host_ + ":" + std::to_string(port_));
    req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " DocRelay");
    req.set(http::field::content_type, content_type);
    req.keep_alive(false);
    req.body() = std::move(body);
    req.prepare_payload();

    spdlog::debug("POST {} ({} bytes) to {}:{}", target, req.body().size(), host_, port_);
    co_await http::async_write(stream, req, boost::asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, boost::asio::use_awaitable);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("Shutdown after POST {} reported: {}", target, ec.message());
    }

    co_return HttpResponse{res.result_int(), std::move(res.body())};
}

} // namespace core::net
