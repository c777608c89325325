#pragma once

#include <string>
#include <stdexcept>
#include "common/types.hpp"

namespace arbexec {

enum class ErrorKind {
    UNSUPPORTED_EXCHANGE,
    BELOW_THRESHOLD,
    EXECUTION_FAILED,
    DECODE,
    TIMEOUT,
    IO
};

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::UNSUPPORTED_EXCHANGE: return "UNSUPPORTED_EXCHANGE";
        case ErrorKind::BELOW_THRESHOLD: return "BELOW_THRESHOLD";
        case ErrorKind::EXECUTION_FAILED: return "EXECUTION_FAILED";
        case ErrorKind::DECODE: return "DECODE";
        case ErrorKind::TIMEOUT: return "TIMEOUT";
        case ErrorKind::IO: return "IO";
    }
    return "UNKNOWN";
}

/**
 * Base for every failure the request pipeline can report.
 * The message is what ends up in ArbitrageResponse::error_message.
 */
class ArbitrageError : public std::runtime_error {
public:
    ArbitrageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class UnsupportedExchangeError : public ArbitrageError {
public:
    explicit UnsupportedExchangeError(const std::string& exchange_id)
        : ArbitrageError(ErrorKind::UNSUPPORTED_EXCHANGE, "unsupported exchange: " + exchange_id)
        , exchange_id_(exchange_id)
    {
    }

    const std::string& exchange_id() const { return exchange_id_; }

private:
    std::string exchange_id_;
};

class BelowThresholdError : public ArbitrageError {
public:
    BelowThresholdError(Rate difference, Rate threshold);

    Rate difference() const { return difference_; }
    Rate threshold() const { return threshold_; }

private:
    Rate difference_;
    Rate threshold_;
};

class ExecutionFailedError : public ArbitrageError {
public:
    explicit ExecutionFailedError(const std::string& detail = "")
        : ArbitrageError(ErrorKind::EXECUTION_FAILED,
                         detail.empty() ? "arbitrage execution failed"
                                        : "arbitrage execution failed: " + detail)
    {
    }
};

class DecodeError : public ArbitrageError {
public:
    explicit DecodeError(const std::string& detail)
        : ArbitrageError(ErrorKind::DECODE, "decode failed: " + detail)
    {
    }
};

class RequestTimeoutError : public ArbitrageError {
public:
    explicit RequestTimeoutError(int64_t timeout_ms)
        : ArbitrageError(ErrorKind::TIMEOUT,
                         "request timed out after " + std::to_string(timeout_ms) + "ms")
    {
    }
};

// Socket setup failures. Per-connection read/write errors never surface as this.
class IoError : public ArbitrageError {
public:
    explicit IoError(const std::string& message)
        : ArbitrageError(ErrorKind::IO, message)
    {
    }
};

} // namespace arbexec
