// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "rpc/http_client.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace bridgerelay {
namespace rpc {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::optional<HttpEndpoint> HttpEndpoint::Parse(const std::string &url) {
  static const std::string kScheme = "http://";
  if (url.compare(0, kScheme.size(), kScheme) != 0) {
    return std::nullopt;
  }

  std::string rest = url.substr(kScheme.size());
  HttpEndpoint ep;

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    ep.path = rest.substr(slash);
  }

  auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    auto port = util::ParseUInt64(authority.substr(colon + 1));
    if (!port || *port == 0 || *port > 65535) {
      return std::nullopt;
    }
    ep.port = static_cast<uint16_t>(*port);
    authority.resize(colon);
  }

  if (authority.empty()) {
    return std::nullopt;
  }
  ep.host = authority;
  return ep;
}

std::string HttpEndpoint::ToString() const {
  return "http://" + host + ":" + std::to_string(port) + path;
}

HttpClient::HttpClient(HttpEndpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {}

std::string HttpClient::Post(const std::string &body) {
  // io_context first: it must outlive the stream and any pending handlers
  net::io_context io_context;
  tcp::resolver resolver(io_context);
  beast::tcp_stream stream(io_context);
  beast::flat_buffer buffer;

  http::request<http::string_body> req{http::verb::post, endpoint_.path, 11};
  req.set(http::field::host, endpoint_.host);
  req.set(http::field::content_type, "application/json");
  req.set(http::field::accept, "application/json");
  req.keep_alive(false);
  req.body() = body;
  req.prepare_payload();

  http::response_parser<http::string_body> parser;
  parser.body_limit(MAX_RESPONSE_SIZE);

  boost::system::error_code result_ec;
  std::string failed_step;
  bool done = false;

  auto fail = [&](const char *step, const boost::system::error_code &ec) {
    failed_step = step;
    result_ec = ec;
    done = true;
  };

  // Covers connect, write and read; run_for() below also bounds the resolve
  stream.expires_after(timeout_);

  resolver.async_resolve(
      endpoint_.host, std::to_string(endpoint_.port),
      [&](const boost::system::error_code &ec,
          tcp::resolver::results_type results) {
        if (ec) {
          fail("resolve", ec);
          return;
        }
        stream.async_connect(
            results, [&](const boost::system::error_code &ec,
                         const tcp::endpoint &) {
              if (ec) {
                fail("connect", ec);
                return;
              }
              http::async_write(
                  stream, req,
                  [&](const boost::system::error_code &ec, std::size_t) {
                    if (ec) {
                      fail("write", ec);
                      return;
                    }
                    http::async_read(
                        stream, buffer, parser,
                        [&](const boost::system::error_code &ec, std::size_t) {
                          if (ec) {
                            fail("read", ec);
                            return;
                          }
                          done = true;
                        });
                  });
            });
      });

  io_context.run_for(timeout_);

  boost::system::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  if (!done || result_ec == beast::error::timeout) {
    LOG_RPC_DEBUG("request to {} timed out after {} ms", Describe(),
                  timeout_.count());
    throw RpcTransportError("timeout after " + std::to_string(timeout_.count()) +
                            " ms talking to " + Describe());
  }
  if (result_ec) {
    throw RpcTransportError(failed_step + " failed for " + Describe() + ": " +
                            result_ec.message());
  }

  auto response = parser.release();
  if (response.result() != http::status::ok) {
    throw RpcTransportError("HTTP status " +
                            std::to_string(response.result_int()) + " from " +
                            Describe());
  }
  return std::move(response.body());
}

} // namespace rpc
} // namespace bridgerelay
