#include "docqa_api/server.hpp"

namespace docqa_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

void Server::start(unsigned int threads) {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this, threads] {
    app_.port(static_cast<uint16_t>(port_)).bindaddr(host_).concurrency(threads).run();
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
}  // namespace docqa_api
