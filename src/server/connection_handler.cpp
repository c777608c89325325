#include "server/connection_handler.hpp"
#include "common/errors.hpp"
#include "utils/crypto.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace arbexec {

ConnectionHandler::ConnectionHandler(int fd, std::string peer, const ServerConfig& config,
                                     ArbitrageEngine& engine)
    : fd_(fd)
    , id_(crypto::connection_id())
    , peer_(std::move(peer))
    , config_(config)
    , engine_(engine)
    , framer_(config.framing, static_cast<size_t>(config.max_frame_bytes))
    , read_buffer_(static_cast<size_t>(config.read_buffer_bytes))
{
}

ConnectionHandler::~ConnectionHandler() {
    close_socket();
}

void ConnectionHandler::run() {
    spdlog::info("[{}] Connection opened from {}", id_, peer_);

    try {
        serve();
    } catch (const std::exception& e) {
        spdlog::error("[{}] Handler terminated: {}", id_, e.what());
    }

    close_socket();
    spdlog::info("[{}] Connection closed after {} requests", id_, requests_handled_.load());
}

void ConnectionHandler::serve() {
    while (true) {
        set_state(ConnectionState::READING);

        size_t bytes_read = 0;
        ReadOutcome outcome = read_some(bytes_read);

        if (outcome == ReadOutcome::PEER_CLOSED) {
            spdlog::info("[{}] Peer closed connection", id_);
            return;
        }
        if (outcome == ReadOutcome::IDLE_TIMEOUT) {
            spdlog::info("[{}] Idle for {}ms, closing", id_, config_.idle_timeout_ms);
            return;
        }
        if (outcome == ReadOutcome::ERROR) {
            return;
        }

        for (const auto& frame : framer_.feed(read_buffer_.data(), bytes_read)) {
            if (!handle_frame(frame)) {
                return;
            }
        }

        set_state(ConnectionState::OPEN);
    }
}

void ConnectionHandler::shutdown() {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

ConnectionHandler::ReadOutcome ConnectionHandler::read_some(size_t& bytes_read) {
    int timeout = config_.idle_timeout_ms > 0 ? config_.idle_timeout_ms : -1;

    while (true) {
        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int ready = poll(&pfd, 1, timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("[{}] poll failed: {}", id_, strerror(errno));
            return ReadOutcome::ERROR;
        }
        if (ready == 0) {
            return ReadOutcome::IDLE_TIMEOUT;
        }

        ssize_t n = recv(fd_, read_buffer_.data(), read_buffer_.size(), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("[{}] Read failed: {}", id_, strerror(errno));
            return ReadOutcome::ERROR;
        }
        if (n == 0) {
            return ReadOutcome::PEER_CLOSED;
        }

        bytes_read = static_cast<size_t>(n);
        return ReadOutcome::DATA;
    }
}

bool ConnectionHandler::handle_frame(const MessageFramer::Frame& frame) {
    set_state(ConnectionState::DECODING);

    ArbitrageResponse response;
    try {
        if (frame.oversized) {
            throw DecodeError("frame exceeds " + std::to_string(framer_.max_frame_bytes()) + " bytes");
        }
        ArbitrageRequest request = protocol::decode_request(frame.payload);

        set_state(ConnectionState::EXECUTING);
        response = engine_.execute(request);
    } catch (const DecodeError& e) {
        spdlog::warn("[{}] {}", id_, e.what());
        METRIC_COUNTER(metric::DECODE_ERRORS).increment();
        response = ArbitrageResponse::failure(e.what());
    }

    set_state(ConnectionState::ENCODING);
    std::string wire = protocol::encode_response(response) + framer_.terminator();

    set_state(ConnectionState::WRITING);
    if (!write_all(wire)) {
        return false;
    }

    requests_handled_++;
    return true;
}

bool ConnectionHandler::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("[{}] Write failed: {}", id_, strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void ConnectionHandler::close_socket() {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    state_ = ConnectionState::CLOSED;
}

void ConnectionHandler::set_state(ConnectionState s) {
    state_ = s;
    spdlog::trace("[{}] -> {}", id_, conn_state_to_string(s));
}

} // namespace arbexec
