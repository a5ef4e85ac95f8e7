// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_RPC_HTTP_CLIENT_HPP
#define BRIDGERELAY_RPC_HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace bridgerelay {
namespace rpc {

// Socket, timeout or HTTP-level failure talking to a node
class RpcTransportError : public std::runtime_error {
public:
  explicit RpcTransportError(const std::string &msg)
      : std::runtime_error(msg) {}
};

/**
 * HttpEndpoint - parsed "http://host[:port][/path]"
 *
 * TLS is not supported; point the relayer at a local node or a
 * terminating proxy.
 */
struct HttpEndpoint {
  std::string host;
  uint16_t port{80};
  std::string path{"/"};

  static std::optional<HttpEndpoint> Parse(const std::string &url);
  std::string ToString() const;
};

/**
 * Abstract request/response transport for JSON-RPC payloads
 *
 * Allows dependency injection:
 * - HttpClient: HTTP POST over boost::asio TCP
 * - scripted transports in tests
 */
class RpcTransport {
public:
  virtual ~RpcTransport() = default;

  /**
   * Send one request body and return the response body
   * Throws RpcTransportError on any transport failure.
   */
  virtual std::string Post(const std::string &body) = 0;

  // For logging
  virtual std::string Describe() const = 0;
};

/**
 * HttpClient - one short-lived connection per request (Boost.Beast)
 *
 * Requests are HTTP/1.1 with "Connection: close". The whole exchange
 * (resolve, connect, write, read) must finish within `timeout`; anything
 * but a complete 200 response is an RpcTransportError.
 */
class HttpClient : public RpcTransport {
public:
  // Responses larger than this are treated as transport errors
  static constexpr size_t MAX_RESPONSE_SIZE = 64 * 1024 * 1024;

  HttpClient(HttpEndpoint endpoint, std::chrono::milliseconds timeout);

  std::string Post(const std::string &body) override;
  std::string Describe() const override { return endpoint_.ToString(); }

private:
  HttpEndpoint endpoint_;
  std::chrono::milliseconds timeout_;
};

} // namespace rpc
} // namespace bridgerelay

#endif // BRIDGERELAY_RPC_HTTP_CLIENT_HPP
