#pragma once

#include "request_handler.hpp"
#include <sys/socket.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace serveit {

struct ListenAddress {
    sockaddr_storage storage{};
    socklen_t length = 0;
};

// Parse a numeric IPv4 or IPv6 interface address. Returns false if the
// interface is not a valid literal.
bool parse_listen_address(const std::string& interface, uint16_t port, ListenAddress& out);

struct RequestLine {
    std::string method;
    std::string target;   // path only, query stripped
    std::string version;
};

// Parse "METHOD target VERSION" from the head of a raw request.
bool parse_request_line(const std::string& request, RequestLine& out);

// Minimal HTTP/1.1 server: one request per connection, one thread per
// connection.
class HttpServer {
public:
    HttpServer(std::string interface, uint16_t port,
               std::shared_ptr<const RequestHandler> handler,
               size_t max_request_bytes = 8192);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Bound port; differs from the requested one when started with port 0
    uint16_t port() const { return bound_port_; }

    // Runs one connection task. Defaults to a detached std::thread; may throw
    // std::system_error, in which case the connection is dropped. Set before
    // start().
    using ConnectionLauncher = std::function<void(std::function<void()> task)>;
    void set_connection_launcher(ConnectionLauncher launcher) { launcher_ = std::move(launcher); }

private:
    void server_thread(int listen_fd);

    std::string interface_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    std::shared_ptr<const RequestHandler> handler_;
    size_t max_request_bytes_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
    ConnectionLauncher launcher_;
};

} // namespace serveit
