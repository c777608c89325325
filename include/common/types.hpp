#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace arbexec {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

using Rate = double;
using Notional = double;
using Gas = uint64_t;

// Response status
enum class ResponseStatus {
    SUCCESS,
    ERROR
};

inline std::string status_to_string(ResponseStatus s) {
    return s == ResponseStatus::SUCCESS ? "success" : "error";
}

inline std::optional<ResponseStatus> status_from_string(const std::string& s) {
    if (s == "success") return ResponseStatus::SUCCESS;
    if (s == "error") return ResponseStatus::ERROR;
    return std::nullopt;
}

// How inbound bytes are split into request payloads
enum class FramingMode {
    LINE,  // Newline-delimited JSON
    READ   // One message per socket read
};

inline std::string framing_to_string(FramingMode m) {
    return m == FramingMode::LINE ? "line" : "read";
}

inline std::optional<FramingMode> framing_from_string(const std::string& s) {
    if (s == "line") return FramingMode::LINE;
    if (s == "read") return FramingMode::READ;
    return std::nullopt;
}

// Per-connection handler state
enum class ConnectionState {
    OPEN,
    READING,
    DECODING,
    EXECUTING,
    ENCODING,
    WRITING,
    CLOSED
};

inline std::string conn_state_to_string(ConnectionState s) {
    switch (s) {
        case ConnectionState::OPEN: return "OPEN";
        case ConnectionState::READING: return "READING";
        case ConnectionState::DECODING: return "DECODING";
        case ConnectionState::EXECUTING: return "EXECUTING";
        case ConnectionState::ENCODING: return "ENCODING";
        case ConnectionState::WRITING: return "WRITING";
        case ConnectionState::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

} // namespace arbexec
