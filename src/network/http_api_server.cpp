#include "network/http_api_server.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "util/logger.hpp"

namespace piiguard {
namespace network {

namespace {
// Upper bound on the request line plus headers.
constexpr size_t kMaxHeadBytes = 16 * 1024;
constexpr int kAcceptPollMillis = 200;
constexpr int kRecvTimeoutSeconds = 30;
} // namespace

bool HttpApiServer::Start() {
    if (m_running.load())
        return false;

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        util::logger::error("HttpApiServer: socket() failed: " + std::string(std::strerror(errno)));
        return false;
    }
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(m_port));
    if (inet_pton(AF_INET, m_host.c_str(), &addr.sin_addr) != 1) {
        util::logger::error("HttpApiServer: invalid listen address '" + m_host + "'");
        close(fd);
        return false;
    }
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        util::logger::error("HttpApiServer: cannot bind " + m_host + ":" + std::to_string(m_port) + ": " +
                            std::strerror(errno));
        close(fd);
        return false;
    }
    if (listen(fd, 64) < 0) {
        util::logger::error("HttpApiServer: listen() failed: " + std::string(std::strerror(errno)));
        close(fd);
        return false;
    }
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
        m_port = ntohs(addr.sin_port);

    m_serverFd = fd;
    m_pool = std::make_unique<util::ThreadPool>(m_workers);
    m_running = true;
    m_thread = std::thread([this]() { run(); });
    util::logger::info("HttpApiServer: listening on " + m_host + ":" + std::to_string(m_port) + " with " +
                       std::to_string(m_workers) + " workers");
    return true;
}

void HttpApiServer::Stop() {
    if (!m_running.exchange(false))
        return;
    if (m_thread.joinable())
        m_thread.join();
    // Drains the connections already accepted.
    m_pool.reset();
    if (m_serverFd >= 0) {
        close(m_serverFd);
        m_serverFd = -1;
    }
    util::logger::info("HttpApiServer: stopped");
}

void HttpApiServer::run() {
    while (m_running.load()) {
        pollfd pfd{};
        pfd.fd = m_serverFd;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, kAcceptPollMillis);
        if (ready <= 0)
            continue;

        int client = accept(m_serverFd, nullptr, nullptr);
        if (client < 0)
            continue;
        timeval tv{};
        tv.tv_sec = kRecvTimeoutSeconds;
        setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        try {
            m_pool->enqueue([this, client]() {
                HandleConnection(client);
                close(client);
            });
        } catch (const std::exception& ex) {
            util::logger::error(std::string("HttpApiServer: cannot schedule connection: ") + ex.what());
            close(client);
        }
    }
}

void HttpApiServer::HandleConnection(int fd) const {
    service::Request req;
    std::string error;
    service::Response resp;

    switch (readRequest(fd, req, error)) {
    case ReadStatus::Closed:
        return;
    case ReadStatus::Malformed:
        resp = service::Response::error(400, error);
        break;
    case ReadStatus::TooLarge:
        resp = service::Response::error(413, error);
        break;
    case ReadStatus::Ok:
        resp = m_manager.HandleRequest(req);
        util::logger::info("HttpApiServer: " + req.method + " " + req.route + " -> " +
                           std::to_string(resp.statusCode));
        break;
    }

    if (!sendAll(fd, resp.toHttp()))
        util::logger::warn("HttpApiServer: client went away before the response was sent");
}

HttpApiServer::ReadStatus HttpApiServer::readRequest(int fd, service::Request& req, std::string& error) const {
    std::string data;
    char buffer[4096];
    size_t headEnd = std::string::npos;

    while ((headEnd = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > kMaxHeadBytes) {
            error = "Request header too large";
            return ReadStatus::Malformed;
        }
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            if (data.empty())
                return ReadStatus::Closed;
            error = "Incomplete request";
            return ReadStatus::Malformed;
        }
        data.append(buffer, static_cast<size_t>(n));
    }

    size_t contentLength = 0;
    try {
        req = service::parseRequestHead(data.substr(0, headEnd));
        contentLength = req.contentLength();
    } catch (const std::exception& ex) {
        error = ex.what();
        return ReadStatus::Malformed;
    }

    if (contentLength > m_maxContentLength) {
        error = "Request body too large. Maximum size: " + std::to_string(m_maxContentLength / (1024 * 1024)) +
                "MB";
        return ReadStatus::TooLarge;
    }

    req.body = data.substr(headEnd + 4);
    while (req.body.size() < contentLength) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            error = "Incomplete request body";
            return ReadStatus::Malformed;
        }
        req.body.append(buffer, static_cast<size_t>(n));
    }
    req.body.resize(contentLength);
    return ReadStatus::Ok;
}

bool HttpApiServer::sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0)
            return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace network
} // namespace piiguard
