#pragma once

#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace core::net {

struct HttpResponse {
    unsigned status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// One connection per request; the server side closes after responding.
class HttpClient {
  public:
    HttpClient(std::string host, std::uint16_t port, std::chrono::milliseconds timeout);
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Throws boost::system::system_error on resolve, connect, timeout and protocol failures.
    boost::asio::awaitable<HttpResponse> post(std::string target,
                                              std::string body,
                                              std::string content_type);

    const std::string& host() const { return host_; }
    std::uint16_t port() const { return port_; }

  private:
    std::string host_;
    std::uint16_t port_;
    std::chrono::milliseconds timeout_;
};

} // namespace core::net
