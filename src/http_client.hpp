// http_client.hpp

#pragma once
#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace net = boost::asio;

struct HttpAddress {
  std::string host;
  std::string port;
};

// Accepts "host", "host:port", "[v6]:port", optionally prefixed with
// "http://".
HttpAddress parse_http_address(const std::string& address,
                               const std::string& default_port);

std::string url_encode(const std::string& value);

struct HttpStatusError : std::runtime_error {
  HttpStatusError(unsigned status, const std::string& target,
                  const std::string& body)
      : std::runtime_error("GET " + target + " returned status " +
                           std::to_string(status) +
                           (body.empty() ? "" : ": " + body)),
        status(status) {}

  unsigned status;
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Issues one GET and returns the body of a 2xx response. Network failures
// surface as boost::system::system_error, other statuses as
// HttpStatusError.
net::awaitable<std::string> http_get(const HttpAddress& address,
                                     const std::string& target,
                                     const HttpHeaders& headers,
                                     std::chrono::milliseconds timeout);
