#include "http_server.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>

namespace serveit {

namespace {

bool send_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = send(fd, data, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

void send_response(int fd, const HttpResponse& resp) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status << " " << status_text(resp.status) << "\r\n"
        << "Content-Type: " << resp.content_type << "\r\n"
        << "Content-Length: " << resp.body.size() << "\r\n";
    for (const auto& [name, value] : resp.extra_headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "Connection: close\r\n"
        << "\r\n";

    std::string header = oss.str();
    if (!send_all(fd, header.data(), header.size()) ||
        !send_all(fd, resp.body.data(), resp.body.size())) {
        spdlog::debug("HTTP: Client went away while sending response");
    }
}

HttpResponse simple_response(int status, const std::string& body) {
    HttpResponse resp;
    resp.status = status;
    resp.content_type = "text/plain; charset=utf-8";
    resp.body = body;
    return resp;
}

// Read until the end of the request head or max_bytes, whichever comes first
bool read_request_head(int fd, size_t max_bytes, std::string& out) {
    char buf[4096];
    while (out.find("\r\n\r\n") == std::string::npos) {
        if (out.size() >= max_bytes) {
            return false;
        }
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            // Peer closed early; a complete request line is still usable
            return out.find("\r\n") != std::string::npos;
        }
        out.append(buf, static_cast<size_t>(n));
    }
    return true;
}

// Closing with unread input makes the kernel send RST, which can destroy the
// response before the client reads it
void drain_input(int fd) {
    shutdown(fd, SHUT_WR);
    char buf[4096];
    while (recv(fd, buf, sizeof(buf), 0) > 0) {
    }
}

void handle_client(int client_fd, const RequestHandler& handler, size_t max_request_bytes) {
    std::string request;
    if (!read_request_head(client_fd, max_request_bytes, request)) {
        if (!request.empty()) {
            spdlog::warn("HTTP: Rejecting oversized or truncated request head ({} bytes)", request.size());
            send_response(client_fd, simple_response(400, "Bad request"));
            drain_input(client_fd);
        }
        return;
    }

    RequestLine line;
    if (!parse_request_line(request, line)) {
        send_response(client_fd, simple_response(400, "Bad request"));
        return;
    }

    HttpResponse resp;
    if (line.method != "GET") {
        resp = simple_response(405, "Only GET supported");
        resp.extra_headers.emplace_back("Allow", "GET");
    } else {
        resp = handler.handle(line.target);
    }

    spdlog::info("{} {} -> {} ({} bytes)", line.method, line.target, resp.status, resp.body.size());
    send_response(client_fd, resp);
}

} // namespace

bool parse_listen_address(const std::string& interface, uint16_t port, ListenAddress& out) {
    out = ListenAddress{};

    auto* v4 = reinterpret_cast<sockaddr_in*>(&out.storage);
    if (inet_pton(AF_INET, interface.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(port);
        out.length = sizeof(sockaddr_in);
        return true;
    }

    // Accept both "::1" and "[::1]"
    std::string host = interface;
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    out = ListenAddress{};
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&out.storage);
    if (inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(port);
        out.length = sizeof(sockaddr_in6);
        return true;
    }
    return false;
}

bool parse_request_line(const std::string& request, RequestLine& out) {
    auto first_line_end = request.find("\r\n");
    if (first_line_end == std::string::npos) return false;

    std::string first_line = request.substr(0, first_line_end);
    auto method_end = first_line.find(' ');
    if (method_end == std::string::npos || method_end == 0) return false;

    auto path_start = method_end + 1;
    auto path_end = first_line.find(' ', path_start);
    if (path_end == std::string::npos || path_end == path_start) return false;

    out.method = first_line.substr(0, method_end);
    out.target = first_line.substr(path_start, path_end - path_start);
    out.version = first_line.substr(path_end + 1);
    if (out.version.compare(0, 5, "HTTP/") != 0) return false;

    // Strip query string
    auto query = out.target.find('?');
    if (query != std::string::npos) {
        out.target = out.target.substr(0, query);
    }
    return true;
}

HttpServer::HttpServer(std::string interface, uint16_t port,
                       std::shared_ptr<const RequestHandler> handler,
                       size_t max_request_bytes)
    : interface_(std::move(interface))
    , port_(port)
    , handler_(std::move(handler))
    , max_request_bytes_(max_request_bytes)
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    ListenAddress addr;
    if (!parse_listen_address(interface_, port_, addr)) {
        spdlog::error("HTTP: Invalid interface address '{}'", interface_);
        return false;
    }

    server_fd_ = socket(addr.storage.ss_family, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr.storage), addr.length) < 0) {
        spdlog::error("HTTP: Failed to bind to {}:{}: {}", interface_, port_, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 64) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_storage bound{};
    socklen_t bound_len = sizeof(bound);
    bound_port_ = port_;
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        if (bound.ss_family == AF_INET) {
            bound_port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            bound_port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        }
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this, server_fd_);
    spdlog::info("HTTP server listening on http://{}:{} (root: {})",
                 interface_, bound_port_, handler_->root().string());
    return true;
}

void HttpServer::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        // Wakes the blocked accept(); the fd is closed only after the join
        shutdown(server_fd_, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

void HttpServer::server_thread(int listen_fd) {
    while (running_.load()) {
        sockaddr_storage client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (running_.load()) {
                spdlog::debug("HTTP: Accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        timeval timeout{};
        timeout.tv_sec = 10;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        // The connection thread keeps its own reference to the handler so it
        // may outlive this server object
        auto handler = handler_;
        size_t max_bytes = max_request_bytes_;
        auto task = [handler, client_fd, max_bytes]() {
            handle_client(client_fd, *handler, max_bytes);
            close(client_fd);
        };

        try {
            if (launcher_) {
                launcher_(task);
            } else {
                std::thread(task).detach();
            }
        } catch (const std::system_error& e) {
            spdlog::warn("HTTP: Cannot start connection thread: {}", e.what());
            close(client_fd);
        }
    }
}

} // namespace serveit
