#include "protocol/messages.hpp"
#include "common/errors.hpp"
#include "utils/time_utils.hpp"
#include <cmath>
#include <limits>
#include <set>
#include <nlohmann/json.hpp>

namespace arbexec {

ArbitrageResponse ArbitrageResponse::success(double profit, int64_t execution_ms, Gas gas_used) {
    ArbitrageResponse response;
    response.status = ResponseStatus::SUCCESS;
    response.profit = profit;
    response.execution_time = time_utils::format_execution_time(execution_ms);
    response.gas_used = gas_used;
    return response;
}

ArbitrageResponse ArbitrageResponse::failure(const std::string& message) {
    ArbitrageResponse response;
    response.status = ResponseStatus::ERROR;
    response.execution_time = time_utils::format_execution_time(0);
    response.error_message = message;
    return response;
}

bool ArbitrageResponse::operator==(const ArbitrageResponse& other) const {
    return status == other.status &&
           profit == other.profit &&
           execution_time == other.execution_time &&
           gas_used == other.gas_used &&
           error_message == other.error_message;
}

namespace protocol {

namespace {

    nlohmann::json parse_object(const std::string& payload) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(payload);
        } catch (const nlohmann::json::parse_error& e) {
            throw DecodeError(e.what());
        }
        if (!j.is_object()) {
            throw DecodeError("payload must be a JSON object");
        }
        return j;
    }

    const nlohmann::json& require(const nlohmann::json& j, const char* field) {
        auto it = j.find(field);
        if (it == j.end()) {
            throw DecodeError(std::string("missing field '") + field + "'");
        }
        return *it;
    }

    std::string require_string(const nlohmann::json& j, const char* field) {
        const auto& value = require(j, field);
        if (!value.is_string()) {
            throw DecodeError(std::string("field '") + field + "' must be a string");
        }
        return value.get<std::string>();
    }

    bool is_absent(const nlohmann::json& j, const char* field) {
        auto it = j.find(field);
        return it == j.end() || it->is_null();
    }

} // namespace

ArbitrageRequest decode_request(const std::string& payload) {
    static const std::set<std::string> known_fields{
        "type", "strategy_id", "symbol", "primary_exchange", "secondary_exchange",
        "amount", "priority", "timestamp"
    };

    nlohmann::json j = parse_object(payload);

    for (const auto& item : j.items()) {
        if (known_fields.count(item.key()) == 0) {
            throw DecodeError("unknown field '" + item.key() + "'");
        }
    }

    if (j.contains("type")) {
        std::string type = require_string(j, "type");
        if (type != REQUEST_TYPE) {
            throw DecodeError("unsupported request type '" + type + "'");
        }
    }

    ArbitrageRequest request;
    request.strategy_id = require_string(j, "strategy_id");
    request.symbol = require_string(j, "symbol");
    request.primary_exchange = require_string(j, "primary_exchange");
    request.secondary_exchange = require_string(j, "secondary_exchange");
    request.timestamp = require_string(j, "timestamp");

    const auto& amount = require(j, "amount");
    if (!amount.is_number()) {
        throw DecodeError("field 'amount' must be a number");
    }
    request.amount = amount.get<double>();
    if (!std::isfinite(request.amount) || request.amount <= 0.0) {
        throw DecodeError("field 'amount' must be positive");
    }

    const auto& priority = require(j, "priority");
    if (!priority.is_number_integer()) {
        throw DecodeError("field 'priority' must be an integer");
    }
    bool in_range = false;
    if (priority.is_number_unsigned()) {
        in_range = priority.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
    } else {
        int64_t value = priority.get<int64_t>();
        in_range = value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
    }
    if (!in_range) {
        throw DecodeError("field 'priority' out of range");
    }
    request.priority = static_cast<int>(priority.get<int64_t>());

    return request;
}

std::string encode_request(const ArbitrageRequest& request) {
    nlohmann::json j{
        {"strategy_id", request.strategy_id},
        {"symbol", request.symbol},
        {"primary_exchange", request.primary_exchange},
        {"secondary_exchange", request.secondary_exchange},
        {"amount", request.amount},
        {"priority", request.priority},
        {"timestamp", request.timestamp}
    };
    return j.dump();
}

std::string encode_response(const ArbitrageResponse& response) {
    nlohmann::json j;
    j["status"] = status_to_string(response.status);
    if (response.profit) j["profit"] = *response.profit;
    j["execution_time"] = response.execution_time;
    if (response.gas_used) j["gas_used"] = *response.gas_used;
    if (response.error_message) j["error_message"] = *response.error_message;
    // Replace invalid UTF-8 echoed from a malformed request instead of throwing
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ArbitrageResponse decode_response(const std::string& payload) {
    nlohmann::json j = parse_object(payload);

    ArbitrageResponse response;
    std::string status_str = require_string(j, "status");
    auto status = status_from_string(status_str);
    if (!status) {
        throw DecodeError("unknown status '" + status_str + "'");
    }
    response.status = *status;
    response.execution_time = require_string(j, "execution_time");

    try {
        if (!is_absent(j, "profit")) response.profit = j.at("profit").get<double>();
        if (!is_absent(j, "gas_used")) response.gas_used = j.at("gas_used").get<Gas>();
        if (!is_absent(j, "error_message")) response.error_message = j.at("error_message").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(e.what());
    }

    return response;
}

} // namespace protocol
} // namespace arbexec
