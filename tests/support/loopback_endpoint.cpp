/**
 * @file loopback_endpoint.cpp
 * @brief LoopbackEndpoint implementation on POSIX sockets.
 * @author Dimitris Kafetzis
 */

#include "support/loopback_endpoint.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace remote_shipper::fakes {

namespace {

constexpr int POLL_INTERVAL_MS = 100;
constexpr int IO_TIMEOUT_MS = 5000;

std::string to_lower(std::string text) {
    for (auto& c : text) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return text;
}

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t");
    auto end = text.find_last_not_of(" \t\r");
    if (start == std::string::npos) return {};
    return text.substr(start, end - start + 1);
}

/**
 * @brief Read more bytes into @p buffer; false on close, error, or timeout.
 */
bool read_some(int fd, std::string& buffer) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, IO_TIMEOUT_MS) <= 0) return false;

    char chunk[4096];
    auto received = ::recv(fd, chunk, sizeof(chunk), 0);
    if (received <= 0) return false;
    buffer.append(chunk, static_cast<size_t>(received));
    return true;
}

bool send_all(int fd, const std::string& data) {
    size_t sent_total = 0;
    while (sent_total < data.size()) {
        auto sent = ::send(fd, data.data() + sent_total, data.size() - sent_total, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && errno == EINTR) continue;
            return false;
        }
        sent_total += static_cast<size_t>(sent);
    }
    return true;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Status";
    }
}

}  // anonymous namespace

LoopbackEndpoint::LoopbackEndpoint() = default;

LoopbackEndpoint::~LoopbackEndpoint() {
    stop();
}

Result<void> LoopbackEndpoint::start() {
    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        return Error{ErrorKind::Transport,
                     "Failed to create server socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0
        || ::listen(server_fd_, 16) < 0) {
        auto reason = std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Transport, "Bind/listen failed: " + reason};
    }

    socklen_t len = sizeof(addr);
    ::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    serve_thread_ = std::jthread([this](std::stop_token stop) { serve(stop); });
    return Result<void>{};
}

void LoopbackEndpoint::stop() {
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

void LoopbackEndpoint::set_response(int status, std::string body) {
    std::lock_guard lock(mutex_);
    status_ = status;
    response_body_ = std::move(body);
}

std::string LoopbackEndpoint::url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
}

std::vector<CapturedRequest> LoopbackEndpoint::requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
}

void LoopbackEndpoint::serve(std::stop_token stop) {
    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, POLL_INTERVAL_MS);  // wake up for stop checks
        if (ready <= 0) continue;

        int client_fd = ::accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) continue;

        handle(client_fd);
        ::shutdown(client_fd, SHUT_RDWR);
        ::close(client_fd);
    }
}

void LoopbackEndpoint::handle(int fd) {
    std::string buffer;
    size_t header_end = std::string::npos;
    while ((header_end = buffer.find("\r\n\r\n")) == std::string::npos) {
        if (!read_some(fd, buffer)) return;
    }

    CapturedRequest request;
    size_t line_start = 0;
    bool first = true;
    while (line_start < header_end) {
        size_t line_end = buffer.find("\r\n", line_start);
        std::string line = buffer.substr(line_start, line_end - line_start);
        line_start = line_end + 2;

        if (first) {
            auto sp1 = line.find(' ');
            auto sp2 = line.find(' ', sp1 + 1);
            request.method = line.substr(0, sp1);
            request.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
            first = false;
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        request.headers[to_lower(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }

    size_t content_length = 0;
    if (auto len = request.header("content-length"); !len.empty()) {
        content_length = std::stoul(len);
    }
    request.body = buffer.substr(header_end + 4);
    while (request.body.size() < content_length) {
        if (!read_some(fd, request.body)) return;
    }

    int status = 0;
    std::string body;
    {
        std::lock_guard lock(mutex_);
        requests_.push_back(std::move(request));
        status = status_;
        body = response_body_;
    }

    std::string response = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status)
        + "\r\nContent-Type: text/plain\r\nContent-Length: " + std::to_string(body.size())
        + "\r\nConnection: close\r\n\r\n" + body;
    send_all(fd, response);
}

}  // namespace remote_shipper::fakes
