#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace docqa_api {
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server() = default;

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

  const std::string &host() const {
    return host_;
  }
  int port() const {
    return port_;
  }

  // Splits "host:port"; throws std::invalid_argument on a malformed address
  static std::pair<std::string, int> parse_address(const std::string &address);

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};
}  // namespace docqa_api
