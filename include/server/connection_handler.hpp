#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include "common/types.hpp"
#include "config/config.hpp"
#include "protocol/message_framer.hpp"
#include "execution/arbitrage_engine.hpp"

namespace arbexec {

/**
 * Serves one accepted TCP connection until the peer closes it, an I/O
 * error occurs, the idle timeout fires, or shutdown() is called.
 *
 * Open -> Reading -> Decoding -> Executing -> Encoding -> Writing -> Open ...
 *
 * Requests on a connection are handled strictly in arrival order.
 * Business failures and malformed payloads are answered with an error
 * response; only transport problems end the loop.
 */
class ConnectionHandler {
public:
    ConnectionHandler(int fd, std::string peer, const ServerConfig& config, ArbitrageEngine& engine);
    ~ConnectionHandler();

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    // Blocking loop, returns once the connection is closed
    void run();

    // Unblocks run() from another thread
    void shutdown();

    ConnectionState state() const { return state_.load(); }
    bool is_closed() const { return state_.load() == ConnectionState::CLOSED; }

    const std::string& id() const { return id_; }
    const std::string& peer() const { return peer_; }

private:
    enum class ReadOutcome {
        DATA,
        PEER_CLOSED,
        IDLE_TIMEOUT,
        ERROR
    };

    int fd_;
    std::mutex fd_mutex_;
    std::string id_;
    std::string peer_;
    const ServerConfig& config_;
    ArbitrageEngine& engine_;
    MessageFramer framer_;
    std::vector<char> read_buffer_;

    std::atomic<ConnectionState> state_{ConnectionState::OPEN};
    std::atomic<int64_t> requests_handled_{0};

    void serve();
    ReadOutcome read_some(size_t& bytes_read);
    bool handle_frame(const MessageFramer::Frame& frame);
    bool write_all(const std::string& data);
    void close_socket();
    void set_state(ConnectionState s);
};

} // namespace arbexec
