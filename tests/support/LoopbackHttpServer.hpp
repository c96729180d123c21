// Repository: LumenSync
// Component: Loopback HTTP server (test only)
// Purpose: Answers plain-HTTP requests on 127.0.0.1 with scripted raw
//          responses, one per request, and records what it received.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_TESTS_SUPPORT_LOOPBACK_HTTP_SERVER_HPP_
#define LUMENSYNC_TESTS_SUPPORT_LOOPBACK_HTTP_SERVER_HPP_

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace lumensync::tests {

class LoopbackHttpServer {
 public:
  LoopbackHttpServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) throw std::runtime_error("socket() failed");
    int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_fd_, 4) != 0) {
      ::close(listen_fd_);
      throw std::runtime_error("bind/listen on loopback failed");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~LoopbackHttpServer() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();
    ::close(listen_fd_);
  }

  LoopbackHttpServer(const LoopbackHttpServer&) = delete;
  LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

  uint16_t port() const { return port_; }

  // Raw bytes written back for the next request. Queue before Start().
  void QueueResponse(std::string raw) { responses_.push_back(std::move(raw)); }

  static std::string Response(int status, const std::string& reason, const std::string& body,
                              const std::string& extra_headers = "") {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n" + extra_headers +
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
  }

  void Start() {
    thread_ = std::thread([this] { Serve(); });
  }

  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  int connections() const { return connections_.load(); }

 private:
  static bool WaitReadable(int fd, int timeout_ms) {
    pollfd pfd{fd, POLLIN, 0};
    return ::poll(&pfd, 1, timeout_ms) > 0;
  }

  static size_t ContentLength(const std::string& head) {
    std::string lower(head);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t pos = lower.find("content-length:");
    if (pos == std::string::npos) return 0;
    return static_cast<size_t>(std::strtoul(lower.c_str() + pos + 15, nullptr, 10));
  }

  // False when the peer closed before a full request arrived.
  bool ReadRequest(int fd, std::string& request) {
    request.clear();
    char buf[2048];
    while (!stop_.load()) {
      size_t head_end = request.find("\r\n\r\n");
      if (head_end != std::string::npos &&
          request.size() >= head_end + 4 + ContentLength(request.substr(0, head_end))) {
        return true;
      }
      if (!WaitReadable(fd, 50)) continue;
      ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) return false;
      request.append(buf, static_cast<size_t>(n));
    }
    return false;
  }

  void Serve() {
    while (!stop_.load() && !responses_.empty()) {
      if (!WaitReadable(listen_fd_, 50)) continue;
      int conn = ::accept(listen_fd_, nullptr, nullptr);
      if (conn < 0) continue;
      connections_.fetch_add(1);

      std::string request;
      while (!responses_.empty() && ReadRequest(conn, request)) {
        {
          std::lock_guard<std::mutex> lock(mutex_);
          requests_.push_back(request);
        }
        const std::string response = responses_.front();
        responses_.pop_front();
        ::send(conn, response.data(), response.size(), MSG_NOSIGNAL);
        if (response.find("Connection: close") != std::string::npos) break;
      }
      ::close(conn);
    }
  }

  int listen_fd_ = -1;
  uint16_t port_ = 0;
  std::deque<std::string> responses_;
  std::thread thread_;
  std::atomic<bool> stop_{false};
  std::atomic<int> connections_{0};

  mutable std::mutex mutex_;
  std::vector<std::string> requests_;
};

}  // namespace lumensync::tests

#endif  // LUMENSYNC_TESTS_SUPPORT_LOOPBACK_HTTP_SERVER_HPP_
