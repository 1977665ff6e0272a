#include "docqa_api/server.hpp"

#include <stdexcept>

namespace docqa_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(static_cast<uint16_t>(port_)).bindaddr(host_).multithreaded().run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}

std::pair<std::string, int> Server::parse_address(const std::string &address) {
  size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw std::invalid_argument("Expected host:port, got '" + address + "'");
  }
  std::string host = address.substr(0, colon);
  int port = std::stoi(address.substr(colon + 1));
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Port out of range in '" + address + "'");
  }
  return {host, port};
}
}  // namespace docqa_api
