#pragma once

#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <cstdint>
#include "config/config.hpp"
#include "execution/arbitrage_engine.hpp"
#include "server/connection_handler.hpp"

namespace arbexec {

/**
 * TCP front end. One accept thread, one thread per connection.
 * A slow handler never delays accepting or serving other connections.
 */
class ConnectionServer {
public:
    ConnectionServer(const ServerConfig& config, std::shared_ptr<ArbitrageEngine> engine);
    ~ConnectionServer();

    ConnectionServer(const ConnectionServer&) = delete;
    ConnectionServer& operator=(const ConnectionServer&) = delete;

    // Bind, listen and start the accept thread. Throws IoError.
    void start();

    // Close the listener, shut down every connection and join all threads
    void stop();

    bool is_running() const { return running_.load(); }

    // Bound port, resolved after start() when configured as 0
    uint16_t port() const { return bound_port_.load(); }

    // Stats
    size_t active_connections() const;
    int64_t connections_accepted() const { return connections_accepted_.load(); }
    int64_t connections_rejected() const { return connections_rejected_.load(); }

private:
    struct Session {
        std::shared_ptr<ConnectionHandler> handler;
        std::thread thread;
    };

    const ServerConfig& config_;
    std::shared_ptr<ArbitrageEngine> engine_;

    int listen_fd_{-1};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex sessions_mutex_;
    std::list<Session> sessions_;

    std::atomic<int64_t> connections_accepted_{0};
    std::atomic<int64_t> connections_rejected_{0};

    void open_listener();
    void accept_loop();
    void spawn_session(int fd, const std::string& peer);
    void reap_finished_sessions();
};

} // namespace arbexec
