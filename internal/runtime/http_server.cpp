#include "internal/runtime/http_server.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "internal/gateway/gateway.hpp"
#include "internal/observability/logging.hpp"

namespace vera::runtime {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace {

constexpr auto        kIdleTimeout  = std::chrono::seconds(60);
constexpr std::size_t kHeaderLimit  = 64 * 1024;
constexpr const char* kServerHeader = "vera";

} // namespace

// ------------------------------------------------------------
// Session
// ------------------------------------------------------------

class HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
 public:
  Session(tcp::socket&& socket, std::shared_ptr<gateway::Gateway> gateway, std::uint64_t max_body_bytes)
      : stream_(std::move(socket)), gateway_(std::move(gateway)), max_body_bytes_(max_body_bytes) {
  }

  void Run() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::DoRead, shared_from_this()));
  }

 private:
  void DoRead() {
    parser_.emplace();
    parser_->header_limit(kHeaderLimit);
    parser_->body_limit(max_body_bytes_);

    stream_.expires_after(kIdleTimeout);
    http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&Session::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
      Close();
      return;
    }
    if (ec == http::error::body_limit) {
      SendPlain(http::status::payload_too_large, "request body exceeds the configured limit");
      return;
    }
    if (ec) {
      VERA_LOG_DEBUG("http read failed", {observability::StringField("error", ec.message())});
      Close();
      return;
    }

    const auto& req = parser_->get();

    gateway::ApiRequest request;
    request.method = std::string(req.method_string());
    request.target = std::string(req.target());
    request.body   = req.body();
    for (const auto& field : req) {
      request.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }

    const auto result = gateway_->Handle(request);

    auto res = std::make_shared<http::response<http::string_body>>(static_cast<http::status>(result.status), req.version());
    res->set(http::field::server, kServerHeader);
    res->set(http::field::content_type, result.content_type);
    for (const auto& [name, value] : result.headers) {
      res->set(name, value);
    }
    res->keep_alive(req.keep_alive());
    res->body() = result.body;
    res->prepare_payload();
    Write(std::move(res));
  }

  void SendPlain(http::status status, std::string text) {
    auto res = std::make_shared<http::response<http::string_body>>(status, 11);
    res->set(http::field::server, kServerHeader);
    res->set(http::field::content_type, "text/plain");
    res->keep_alive(false);
    res->body() = std::move(text);
    res->prepare_payload();
    Write(std::move(res));
  }

  void Write(std::shared_ptr<http::response<http::string_body>> res) {
    const bool keep_alive = res->keep_alive();
    http::async_write(stream_, *res, [self = shared_from_this(), res, keep_alive](beast::error_code ec, std::size_t) {
      if (ec || !keep_alive) {
        self->Close();
        return;
      }
      self->DoRead();
    });
  }

  void Close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream                                        stream_;
  beast::flat_buffer                                       buffer_;
  std::optional<http::request_parser<http::string_body>>   parser_;
  std::shared_ptr<gateway::Gateway>                        gateway_;
  std::uint64_t                                            max_body_bytes_;
};

// ------------------------------------------------------------
// HttpServer
// ------------------------------------------------------------

HttpServer::HttpServer(HttpServerOptions options, std::shared_ptr<gateway::Gateway> gateway)
    : options_(std::move(options)),
      gateway_(std::move(gateway)),
      ioc_(static_cast<int>(options_.threads == 0 ? 1 : options_.threads)),
      acceptor_(net::make_strand(ioc_)) {
}

HttpServer::~HttpServer() {
  Stop();
  Wait();
}

void HttpServer::Start() {
  beast::error_code ec;
  const auto        address = net::ip::make_address(options_.bind_address, ec);
  if (ec) {
    throw std::runtime_error("invalid bind address '" + options_.bind_address + "': " + ec.message());
  }

  const tcp::endpoint endpoint{address, options_.port};
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("failed to listen on " + options_.bind_address + ":" + std::to_string(options_.port) + ": " + ec.message());
  }
  bound_port_ = acceptor_.local_endpoint().port();

  DoAccept();

  const auto threads = options_.threads == 0 ? 1 : options_.threads;
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back([this] { ioc_.run(); });
  }

  VERA_LOG_INFO("http server listening", {observability::StringField("address", options_.bind_address), observability::IntField("port", bound_port_),
                                          observability::IntField("threads", static_cast<std::int64_t>(threads))});
}

void HttpServer::DoAccept() {
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (stopped_) return;
      VERA_LOG_WARN("accept failed", {observability::StringField("error", ec.message())});
    } else {
      std::make_shared<Session>(std::move(socket), gateway_, options_.max_body_bytes)->Run();
    }
    if (!stopped_) DoAccept();
  });
}

void HttpServer::Wait() {
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void HttpServer::Stop() {
  if (stopped_.exchange(true)) return;
  net::post(acceptor_.get_executor(), [this] {
    beast::error_code ec;
    acceptor_.close(ec);
  });
  ioc_.stop();
}

} // namespace vera::runtime
