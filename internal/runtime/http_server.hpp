#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace vera::gateway {
class Gateway;
}

namespace vera::runtime {

struct HttpServerOptions {
  std::string   bind_address   = "0.0.0.0";
  std::uint16_t port           = 5003;
  std::size_t   threads        = 4;
  std::uint64_t max_body_bytes = 10 * 1024 * 1024;
};

/*
  HTTP/1.1 front end of the emulated API.

  Async accept loop on a pool of io threads; each connection is a keep-alive
  session that reads one request, hands it to the gateway synchronously and
  writes the response. Bodies above max_body_bytes are answered with 413.
*/
class HttpServer {
 public:
  HttpServer(HttpServerOptions options, std::shared_ptr<gateway::Gateway> gateway);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts the io threads. Throws std::runtime_error when the
  // address cannot be bound.
  void Start();
  void Wait();
  void Stop();

  // Bound port; differs from the configured one when that was 0.
  std::uint16_t port() const {
    return bound_port_;
  }

 private:
  class Session;

  void DoAccept();

  HttpServerOptions                 options_;
  std::shared_ptr<gateway::Gateway> gateway_;

  boost::asio::io_context        ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::vector<std::thread>       threads_;
  std::uint16_t                  bound_port_ = 0;
  std::atomic<bool>              stopped_{false};
};

} // namespace vera::runtime
