#include "http_server.hpp"
#include "logging.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

using Clock = std::chrono::steady_clock;

bool is_probe(const sharing::Request& req, std::string_view path) {
  if (req.method() != http::verb::get && req.method() != http::verb::head) return false;
  return std::string_view(req.target().data(), req.target().size()) == path;
}

sharing::Response plain(const sharing::Request& req, const char* content_type, std::string_view body) {
  sharing::Response res{http::status::ok, req.version()};
  res.set(http::field::content_type, content_type);
  res.set(http::field::cache_control, "no-store");
  res.keep_alive(req.keep_alive());
  if (req.method() != http::verb::head) {
    res.body().assign(body.begin(), body.end());
  }
  res.content_length(body.size());
  return res;
}

} // namespace

// One keep-alive connection. Requests are served one at a time.
class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket socket, sharing::Handler& handler, Config cfg)
    : stream_(std::move(socket)), handler_(handler), cfg_(std::move(cfg)) {}

  void start() {
    beast::error_code ec;
    stream_.socket().set_option(tcp::no_delay(true), ec);
    if (ec) logging::get()->debug("no_delay: {}", ec.message());
    read_next();
  }

private:
  void read_next() {
    parser_.emplace();
    parser_->body_limit(cfg_.max_request_body_bytes);
    stream_.expires_after(cfg_.idle_timeout);
    http::async_read(stream_, buffer_, *parser_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        self->on_request(ec);
      });
  }

  void on_request(beast::error_code ec) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout) return shutdown();
    if (ec) {
      logging::get()->debug("read failed: {}", ec.message());
      return;
    }

    started_ = Clock::now();
    if (cfg_.metrics) cfg_.metrics->IncInFlight();

    const sharing::Request& req = parser_->get();
    if (is_probe(req, "/metrics")) {
      res_ = plain(req, "text/plain; version=0.0.4",
                   cfg_.metrics ? cfg_.metrics->RenderPrometheus() : std::string());
    } else if (is_probe(req, "/health/process")) {
      res_ = plain(req, "text/plain; charset=utf-8", "ok\n");
    } else {
      res_ = handler_.handle(req, util::Context::with_timeout(cfg_.request_timeout));
    }

    method_.assign(req.method_string().data(), req.method_string().size());
    request_bytes_ = req.body().size();

    // the handler never runs past its deadline; the write gets the same budget
    stream_.expires_after(cfg_.request_timeout);
    const bool close = res_.need_eof();
    http::async_write(stream_, res_,
      [self = shared_from_this(), close](beast::error_code ec, std::size_t) {
        self->on_response(close, ec);
      });
  }

  void on_response(bool close, beast::error_code ec) {
    const double latency_ms = std::chrono::duration<double, std::milli>(Clock::now() - started_).count();
    if (cfg_.metrics) {
      cfg_.metrics->Observe(method_, res_.result_int(), request_bytes_, res_.body().size(), latency_ms);
      cfg_.metrics->DecInFlight();
    }
    logging::get()->debug("{} {} {:.2f}ms", method_, res_.result_int(), latency_ms);

    if (ec) {
      logging::get()->debug("write failed: {}", ec.message());
      return;
    }
    if (close) return shutdown();
    read_next();
  }

  void shutdown() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  sharing::Handler& handler_;
  Config cfg_;
  std::optional<http::request_parser<sharing::Request::body_type>> parser_;
  sharing::Response res_;
  Clock::time_point started_{};
  std::string method_;
  std::size_t request_bytes_ = 0;
};

Listener::Listener(asio::io_context& ioc, tcp::endpoint endpoint, sharing::Handler& handler, Config cfg)
  : ioc_(ioc), acceptor_(ioc), handler_(handler), cfg_(std::move(cfg)) {
  beast::error_code ec;
  auto check = [&ec](const char* what) {
    if (ec) throw boost::system::system_error(ec, what);
  };
  acceptor_.open(endpoint.protocol(), ec);
  check("open");
  acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  check("set_option");
  acceptor_.bind(endpoint, ec);
  check("bind");
  acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  check("listen");
}

void Listener::run() {
  do_accept();
}

void Listener::do_accept() {
  // each session gets its own strand so handlers of one connection never overlap
  acceptor_.async_accept(asio::make_strand(ioc_),
    [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
      self->on_accept(ec, std::move(socket));
    });
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    logging::get()->warn("accept failed: {}", ec.message());
  } else {
    std::make_shared<Session>(std::move(socket), handler_, cfg_)->start();
  }
  do_accept();
}

} // namespace server
