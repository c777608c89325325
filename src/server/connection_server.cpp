#include "server/connection_server.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace arbexec {

namespace {
    constexpr int ACCEPT_POLL_INTERVAL_MS = 200;

    std::string peer_to_string(const sockaddr_storage& addr) {
        char host[INET6_ADDRSTRLEN] = {0};
        uint16_t port = 0;

        if (addr.ss_family == AF_INET) {
            const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
            inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
            port = ntohs(in->sin_port);
        } else if (addr.ss_family == AF_INET6) {
            const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
            inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
            port = ntohs(in6->sin6_port);
        } else {
            return "unknown";
        }
        return std::string(host) + ":" + std::to_string(port);
    }
}

ConnectionServer::ConnectionServer(const ServerConfig& config, std::shared_ptr<ArbitrageEngine> engine)
    : config_(config)
    , engine_(std::move(engine))
{
}

ConnectionServer::~ConnectionServer() {
    stop();
}

void ConnectionServer::start() {
    if (running_.load()) {
        spdlog::warn("ConnectionServer already running");
        return;
    }

    open_listener();
    running_ = true;
    accept_thread_ = std::thread(&ConnectionServer::accept_loop, this);

    spdlog::info("Listening on {}:{} (framing={}, max_connections={})",
                 config_.host, port(), framing_to_string(config_.framing),
                 config_.max_connections > 0 ? std::to_string(config_.max_connections) : "unlimited");
}

void ConnectionServer::open_listener() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(config_.port);
    int rc = getaddrinfo(config_.host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0) {
        throw IoError("Failed to resolve " + config_.host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    int fd = -1;
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = strerror(errno);
            continue;
        }

        int reuse = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        if (bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 &&
            listen(fd, config_.listen_backlog) == 0) {
            break;
        }

        last_error = strerror(errno);
        close(fd);
        fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        throw IoError("Failed to listen on " + config_.host + ":" + port_str + ": " + last_error);
    }

    sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) < 0) {
        std::string error = strerror(errno);
        close(fd);
        throw IoError("getsockname failed: " + error);
    }

    if (bound.ss_family == AF_INET6) {
        bound_port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
    } else {
        bound_port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    }
    listen_fd_ = fd;
}

void ConnectionServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    spdlog::info("Stopping server...");

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }

    std::list<Session> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& session : sessions_) {
            spdlog::debug("[{}] Shutting down connection from {} ({})", session.handler->id(),
                          session.handler->peer(), conn_state_to_string(session.handler->state()));
            session.handler->shutdown();
        }
        sessions.swap(sessions_);
    }

    for (auto& session : sessions) {
        if (session.thread.joinable()) {
            session.thread.join();
        }
    }

    spdlog::info("Server stopped. {} connections served", connections_accepted_.load());
}

void ConnectionServer::accept_loop() {
    while (running_.load()) {
        struct pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ready = poll(&pfd, 1, ACCEPT_POLL_INTERVAL_MS);
        reap_finished_sessions();

        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("Listener poll failed: {}", strerror(errno));
            continue;
        }
        if (ready == 0) {
            continue;
        }

        sockaddr_storage peer_addr{};
        socklen_t peer_len = sizeof(peer_addr);
        int fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer_addr), &peer_len);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && running_.load()) {
                spdlog::error("Accept failed: {}", strerror(errno));
            }
            continue;
        }

        std::string peer = peer_to_string(peer_addr);

        if (config_.max_connections > 0 &&
            active_connections() >= static_cast<size_t>(config_.max_connections)) {
            spdlog::warn("Rejecting {}: {} connections already open", peer, config_.max_connections);
            connections_rejected_++;
            METRIC_COUNTER(metric::CONNECTIONS_REJECTED).increment();
            close(fd);
            continue;
        }

        spawn_session(fd, peer);
    }
}

void ConnectionServer::spawn_session(int fd, const std::string& peer) {
    bool owned = false;
    try {
        auto handler = std::make_shared<ConnectionHandler>(fd, peer, config_, *engine_);
        owned = true;  // The handler closes fd from here on
        connections_accepted_++;
        METRIC_COUNTER(metric::CONNECTIONS_ACCEPTED).increment();

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        Session session;
        session.handler = handler;
        session.thread = std::thread([handler]() { handler->run(); });
        sessions_.push_back(std::move(session));
    } catch (const std::exception& e) {
        spdlog::error("Failed to set up connection from {}: {}", peer, e.what());
        if (!owned) {
            close(fd);
        }
    }
}

void ConnectionServer::reap_finished_sessions() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->handler->is_closed()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t ConnectionServer::active_connections() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    size_t active = 0;
    for (const auto& session : sessions_) {
        if (!session.handler->is_closed()) {
            active++;
        }
    }
    return active;
}

} // namespace arbexec
