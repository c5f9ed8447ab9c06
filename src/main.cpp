
#include "dynamic_upstreams.hpp"
#include "http_client.hpp"
#include "logger.hpp"

#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

net::io_context ioc;

Logger logger("dynamic_sd");

std::atomic<size_t> next_upstream{0};

http::response<http::string_body>
error_response(http::status status, unsigned version, const std::string& body) {
  http::response<http::string_body> resp{status, version};
  resp.set(http::field::server, "dynamic_sd");
  resp.set(http::field::content_type, "text/plain");
  resp.body() = body;
  resp.prepare_payload();
  return resp;
}

net::awaitable<void> handle_request(tcp::socket client_socket,
                                    const DynamicUpstreams& upstreams) {
  beast::flat_buffer buffer;
  http::request<http::string_body> client_req;

  try {
    co_await http::async_read(client_socket, buffer, client_req,
                              net::use_awaitable);
  } catch (std::exception& e) {
    logger.error("error reading client request", {{"error", e.what()}});
    co_return;
  }

  UpstreamStore::Snapshot snapshot;
  std::string unavailable;
  try {
    snapshot = upstreams.get_upstreams();
  } catch (const std::exception& e) {
    unavailable = e.what();
  }

  if (!snapshot) {
    logger.error("no upstream for request", {{"error", unavailable}});
    boost::system::error_code ec;
    co_await http::async_write(
        client_socket,
        error_response(http::status::service_unavailable, client_req.version(),
                       unavailable),
        net::redirect_error(net::use_awaitable, ec));
    co_return;
  }

  // The snapshot is immutable; round robin over whatever it holds.
  const auto& upstream = (*snapshot)[next_upstream++ % snapshot->size()];
  auto target = parse_http_address(upstream.dial(), "80");

  tcp::socket backend_socket(co_await net::this_coro::executor);
  http::response<http::string_body> backend_resp;
  bool backend_failed = false;

  try {
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto endpoints = co_await resolver.async_resolve(target.host, target.port,
                                                     net::use_awaitable);
    co_await net::async_connect(backend_socket, endpoints, net::use_awaitable);

    co_await http::async_write(backend_socket, client_req, net::use_awaitable);

    beast::flat_buffer backend_buffer;
    co_await http::async_read(backend_socket, backend_buffer, backend_resp,
                              net::use_awaitable);
  } catch (std::exception& e) {
    logger.error("error communicating with upstream",
                 {{"upstream", upstream.dial()}, {"error", e.what()}});
    backend_failed = true;
  }

  if (backend_failed) {
    boost::system::error_code ec;
    co_await http::async_write(
        client_socket,
        error_response(http::status::bad_gateway, client_req.version(),
                       "Bad Gateway: upstream connection failed"),
        net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      logger.error("error returning 502 response", {{"error", ec.message()}});
    }
    co_return;
  }

  try {
    co_await http::async_write(client_socket, backend_resp, net::use_awaitable);
  } catch (std::exception& e) {
    logger.error("error returning response to client", {{"error", e.what()}});
  }
}

void load_config(const std::string& path, DynamicUpstreams& upstreams) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }
  std::stringstream text;
  text << in.rdbuf();

  if (path.size() > 5 && path.compare(path.size() - 5, 5, ".json") == 0) {
    json j;
    try {
      j = json::parse(text.str());
    } catch (const json::parse_error& e) {
      throw ConfigError("parsing " + path + ": " + e.what());
    }
    upstreams.unmarshal_json(j);
  } else {
    auto d = ConfigDispenser::from_string(text.str(), path);
    upstreams.unmarshal(d);
  }
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0]
              << " <config> [listen_port] [--debug]" << std::endl;
    return 2;
  }

  std::string config_path = argv[1];
  unsigned short port = 8080;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--debug") {
      Logger::set_debug(true);
    } else {
      try {
        auto value = parse_uint(arg);
        if (value == 0 || value > 65535) {
          throw std::invalid_argument("out of range: " + arg);
        }
        port = static_cast<unsigned short>(value);
      } catch (const std::invalid_argument& e) {
        std::cerr << "invalid listen port: " << e.what() << std::endl;
        return 2;
      }
    }
  }

  DynamicUpstreams upstreams;
  try {
    load_config(config_path, upstreams);
    upstreams.validate();
    upstreams.provision(logger);
  } catch (std::exception& e) {
    logger.error("startup failed", {{"error", e.what()}});
    return 1;
  }

  try {
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int) {
      logger.info("shutting down");
      ioc.stop();
    });

    net::co_spawn(
        ioc,
        [port, &upstreams]() -> net::awaitable<void> {
          tcp::acceptor acceptor(co_await net::this_coro::executor,
                                 {tcp::v4(), port});
          logger.info("listening for client requests",
                      {{"port", std::to_string(port)}});

          while (true) {
            tcp::socket socket =
                co_await acceptor.async_accept(net::use_awaitable);
            net::co_spawn(ioc, handle_request(std::move(socket), upstreams),
                          net::detached);
          }
        },
        net::detached);
    ioc.run();
  } catch (std::exception& e) {
    logger.error("fatal error", {{"error", e.what()}});
  }

  try {
    upstreams.cleanup();
  } catch (std::exception& e) {
    logger.error("cleanup failed", {{"error", e.what()}});
    return 1;
  }
  return 0;
}
