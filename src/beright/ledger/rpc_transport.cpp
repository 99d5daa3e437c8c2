#include "beright/ledger/rpc_transport.hpp"

#include <optional>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace beright::ledger {

namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

constexpr std::string_view HTTPS_PREFIX = "https://";
constexpr int HTTP_VERSION = 11;
constexpr unsigned HTTP_OK = 200;

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

/**
 * One HTTPS POST to the RPC endpoint. Each completion handler starts the
 * next step until the response is read or the deadline closes the stream.
 */
class HttpsSession {
public:
  HttpsSession(boost::asio::io_context& ioc,
               boost::asio::ssl::context& ssl_ctx,
               HttpsUrl url,
               std::string body,
               std::chrono::milliseconds timeout)
    : resolver_(ioc),
      stream_(ioc, ssl_ctx),
      url_(std::move(url)),
      body_(std::move(body)),
      timeout_(timeout) {}

  void start() {
    resolver_.async_resolve(url_.host, url_.port,
                            beast::bind_front_handler(&HttpsSession::on_resolve, this));
  }

  // Cancel outstanding operations after the deadline passed.
  void abort() {
    if (!result_) {
      result_ = std::unexpected(RpcFailure{.error = RpcError::Timeout,
                                           .detail = "deadline exceeded",
                                           .request_sent = request_sent_});
    }
    resolver_.cancel();
    beast::error_code ec;
    beast::get_lowest_layer(stream_).socket().close(ec);
  }

  [[nodiscard]] bool finished() const { return result_.has_value(); }

  [[nodiscard]] std::expected<std::string, RpcFailure> take_result() {
    return std::move(*result_);
  }

private:
  void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      fail(RpcError::ResolveFailed, ec);
      return;
    }
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    beast::get_lowest_layer(stream_).async_connect(
      results, beast::bind_front_handler(&HttpsSession::on_connect, this));
  }

  void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) {
      fail(RpcError::ConnectFailed, ec);
      return;
    }

    if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
      beast::error_code ssl_ec{static_cast<int>(::ERR_get_error()),
                               boost::asio::error::get_ssl_category()};
      fail(RpcError::SslHandshakeFailed, ssl_ec);
      return;
    }

    stream_.async_handshake(boost::asio::ssl::stream_base::client,
                            beast::bind_front_handler(&HttpsSession::on_handshake, this));
  }

  void on_handshake(beast::error_code ec) {
    if (ec) {
      fail(RpcError::SslHandshakeFailed, ec);
      return;
    }

    request_.version(HTTP_VERSION);
    request_.method(http::verb::post);
    request_.target(url_.target);
    request_.set(http::field::host, url_.host);
    request_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request_.set(http::field::content_type, "application/json");
    request_.set(http::field::connection, "close");
    request_.body() = body_;
    request_.prepare_payload();

    // From here on the node may receive the request.
    request_sent_ = true;
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&HttpsSession::on_write, this));
  }

  void on_write(beast::error_code ec, std::size_t) {
    if (ec) {
      fail(RpcError::WriteFailed, ec);
      return;
    }
    http::async_read(stream_, buffer_, response_,
                     beast::bind_front_handler(&HttpsSession::on_read, this));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec) {
      fail(RpcError::ReadFailed, ec);
      return;
    }
    if (response_.result_int() != HTTP_OK) {
      if (!result_) {
        result_ = std::unexpected(RpcFailure{.error = RpcError::HttpStatus,
                                             .detail = std::string(response_.reason().data(),
                                                                   response_.reason().size()),
                                             .request_sent = true,
                                             .http_status = response_.result_int()});
      }
      return;
    }
    if (!result_) {
      result_ = std::move(response_.body());
    }
  }

  void fail(RpcError err, beast::error_code ec) {
    if (result_) {
      return;
    }
    if (ec == beast::error::timeout) {
      err = RpcError::Timeout;
    }
    result_ = std::unexpected(
      RpcFailure{.error = err, .detail = ec.message(), .request_sent = request_sent_});
  }

  tcp::resolver resolver_;
  beast::ssl_stream<beast::tcp_stream> stream_;
  HttpsUrl url_;
  std::string body_;
  std::chrono::milliseconds timeout_;

  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  http::response<http::string_body> response_;
  bool request_sent_ = false;
  std::optional<std::expected<std::string, RpcFailure>> result_;
};

} // namespace

std::expected<HttpsUrl, RpcError> parse_https_url(std::string_view url) {
  if (!starts_with(url, HTTPS_PREFIX)) {
    return std::unexpected(RpcError::InvalidUrl);
  }

  std::string_view rest = url.substr(HTTPS_PREFIX.size());
  auto slash = rest.find('/');
  std::string_view host_port = rest.substr(0, slash);
  std::string_view target = slash == std::string_view::npos ? "/" : rest.substr(slash);

  if (host_port.empty()) {
    return std::unexpected(RpcError::InvalidUrl);
  }

  std::string_view host = host_port;
  std::string_view port = "443";
  auto colon = host_port.find(':');
  if (colon != std::string_view::npos) {
    host = host_port.substr(0, colon);
    port = host_port.substr(colon + 1);
  }

  if (host.empty() || port.empty()) {
    return std::unexpected(RpcError::InvalidUrl);
  }

  return HttpsUrl{std::string(host), std::string(port), std::string(target)};
}

const char* to_string(RpcError error) {
  switch (error) {
    case RpcError::InvalidUrl:
      return "invalid url";
    case RpcError::ResolveFailed:
      return "resolve failed";
    case RpcError::ConnectFailed:
      return "connect failed";
    case RpcError::SslHandshakeFailed:
      return "tls handshake failed";
    case RpcError::WriteFailed:
      return "write failed";
    case RpcError::ReadFailed:
      return "read failed";
    case RpcError::Timeout:
      return "timeout";
    case RpcError::HttpStatus:
      return "unexpected http status";
  }
  return "unknown rpc error";
}

HttpsRpcTransport::HttpsRpcTransport(std::string url, boost::asio::ssl::context& ssl_ctx)
  : url_(std::move(url)),
    ssl_ctx_(ssl_ctx) {}

std::expected<std::string, RpcFailure> HttpsRpcTransport::post(std::string_view body,
                                                               std::chrono::milliseconds timeout) {
  auto parsed = parse_https_url(url_);
  if (!parsed) {
    return std::unexpected(RpcFailure{.error = parsed.error(), .detail = url_});
  }

  boost::asio::io_context ioc;
  HttpsSession session(ioc, ssl_ctx_, std::move(*parsed), std::string(body), timeout);
  session.start();
  ioc.run_for(timeout);

  if (!session.finished()) {
    session.abort();
  }
  // Drain cancelled handlers before the session goes away.
  ioc.restart();
  ioc.run();
  return session.take_result();
}

} // namespace beright::ledger
