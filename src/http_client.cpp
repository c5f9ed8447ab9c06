
#include "http_client.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cctype>

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

HttpAddress parse_http_address(const std::string& address,
                               const std::string& default_port) {
  std::string rest = address;
  const std::string scheme = "http://";
  if (rest.compare(0, scheme.size(), scheme) == 0) {
    rest = rest.substr(scheme.size());
  }
  while (!rest.empty() && rest.back() == '/') {
    rest.pop_back();
  }

  if (!rest.empty() && rest.front() == '[') {
    auto close = rest.find(']');
    if (close == std::string::npos) {
      throw std::invalid_argument("missing ']' in address '" + address + "'");
    }
    std::string host = rest.substr(1, close - 1);
    if (close + 1 < rest.size() && rest[close + 1] == ':') {
      return {host, rest.substr(close + 2)};
    }
    return {host, default_port};
  }

  auto colon = rest.rfind(':');
  if (colon != std::string::npos && rest.find(':') == colon) {
    return {rest.substr(0, colon), rest.substr(colon + 1)};
  }
  return {rest, default_port};
}

std::string url_encode(const std::string& value) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}

net::awaitable<std::string> http_get(const HttpAddress& address,
                                     const std::string& target,
                                     const HttpHeaders& headers,
                                     std::chrono::milliseconds timeout) {
  auto executor = co_await net::this_coro::executor;
  tcp::resolver resolver(executor);
  beast::tcp_stream stream(executor);

  auto endpoints = co_await resolver.async_resolve(
      address.host, address.port, net::use_awaitable);

  stream.expires_after(timeout);
  co_await stream.async_connect(endpoints, net::use_awaitable);

  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, address.host);
  req.set(http::field::user_agent, "dynamic_sd");
  req.set(http::field::accept, "application/json");
  for (const auto& [name, value] : headers) {
    req.set(name, value);
  }

  stream.expires_after(timeout);
  co_await http::async_write(stream, req, net::use_awaitable);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  co_await http::async_read(stream, buffer, res, net::use_awaitable);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    throw beast::system_error{ec};
  }

  if (res.result_int() / 100 != 2) {
    throw HttpStatusError(res.result_int(), target, res.body());
  }
  co_return res.body();
}
