#pragma once

#include "metrics.hpp"
#include "handler.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct Config {
  std::string listen_host = "0.0.0.0";
  unsigned short listen_port = 8080;
  // share links are GET/HEAD only; bodies are read and dropped
  std::size_t max_request_body_bytes = 64u * 1024u;
  std::chrono::milliseconds request_timeout{30000};
  // a connection waiting this long for the next request is closed
  std::chrono::seconds idle_timeout{60};
  Metrics* metrics = nullptr;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
  // Throws boost::system::system_error when the endpoint cannot be bound.
  Listener(asio::io_context& ioc, tcp::endpoint endpoint, sharing::Handler& handler, Config cfg);

  void run();

private:
  void do_accept();
  void on_accept(boost::system::error_code ec, tcp::socket socket);

  asio::io_context& ioc_;
  tcp::acceptor acceptor_;
  sharing::Handler& handler_;
  Config cfg_;
};

} // namespace server
