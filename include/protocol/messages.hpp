#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace arbexec {

/**
 * Inbound arbitrage opportunity. Created per request, never shared.
 */
struct ArbitrageRequest {
    std::string strategy_id;     // Caller correlation id, logs only
    std::string symbol;
    std::string primary_exchange;
    std::string secondary_exchange;
    Notional amount{0.0};
    int priority{0};             // Advisory only
    std::string timestamp;       // Opaque to the engine
};

/**
 * Outbound outcome. Exactly one of profit / error_message is set.
 */
struct ArbitrageResponse {
    ResponseStatus status{ResponseStatus::ERROR};
    std::optional<double> profit;
    std::string execution_time{"0ms"};
    std::optional<Gas> gas_used;
    std::optional<std::string> error_message;

    static ArbitrageResponse success(double profit, int64_t execution_ms, Gas gas_used);
    static ArbitrageResponse failure(const std::string& message);

    bool is_success() const { return status == ResponseStatus::SUCCESS; }

    bool operator==(const ArbitrageResponse& other) const;
};

namespace protocol {

// Only request kind the engine accepts in the optional "type" field
inline constexpr const char* REQUEST_TYPE = "funding_rate_arbitrage";

/**
 * Strict decode: payload must be a JSON object carrying every request
 * field with the right JSON type and nothing else (except "type").
 * Throws DecodeError.
 */
ArbitrageRequest decode_request(const std::string& payload);
std::string encode_request(const ArbitrageRequest& request);

// Absent optional fields are omitted, not written as null
std::string encode_response(const ArbitrageResponse& response);

// Accepts omitted or null optional fields. Throws DecodeError.
ArbitrageResponse decode_response(const std::string& payload);

} // namespace protocol
} // namespace arbexec
