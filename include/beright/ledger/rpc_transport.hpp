#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

#include <boost/asio/ssl/context.hpp>

namespace beright::ledger
{

  /** Transport-level RPC failures. */
  enum class RpcError
  {
    InvalidUrl,
    ResolveFailed,
    ConnectFailed,
    SslHandshakeFailed,
    WriteFailed,
    ReadFailed,
    Timeout,
    HttpStatus
  };

  /** Transport failure; request_sent tells whether the node may have seen the request. */
  struct RpcFailure
  {
    RpcError error;
    std::string detail;
    bool request_sent = false;
    unsigned http_status = 0;
  };

  /** Parsed https:// URL parts. */
  struct HttpsUrl
  {
    std::string host;
    std::string port;
    std::string target;
  };

  /**
   * Parse https:// URL into host/port/target.
   * @param url RPC endpoint URL.
   * @return HttpsUrl or RpcError::InvalidUrl.
   */
  [[nodiscard]] std::expected<HttpsUrl, RpcError> parse_https_url(std::string_view url);

  /**
   * Convert RpcError to a string literal.
   * @param error Error to stringify.
   * @return String literal describing the error.
   */
  [[nodiscard]] const char *to_string(RpcError error);

  /** Request/response channel for JSON-RPC bodies. */
  class RpcTransport
  {
  public:
    virtual ~RpcTransport() = default;

    /**
     * POST a JSON-RPC body and return the response body.
     * @param body JSON request.
     * @param timeout Deadline for the whole exchange.
     * @return Response body or RpcFailure.
     */
    [[nodiscard]] virtual std::expected<std::string, RpcFailure> post(
        std::string_view body, std::chrono::milliseconds timeout) = 0;
  };

  /** JSON-RPC over HTTPS using Boost.Beast; one connection per call. */
  class HttpsRpcTransport : public RpcTransport
  {
  public:
    /**
     * Construct for an endpoint.
     * @param url https:// endpoint.
     * @param ssl_ctx TLS context shared by all calls.
     */
    HttpsRpcTransport(std::string url, boost::asio::ssl::context &ssl_ctx);

    [[nodiscard]] std::expected<std::string, RpcFailure> post(
        std::string_view body, std::chrono::milliseconds timeout) override;

  private:
    std::string url_;
    boost::asio::ssl::context &ssl_ctx_;
  };

} // namespace beright::ledger
