#include <gtest/gtest.h>
#include "protocol/messages.hpp"
#include "common/errors.hpp"
#include <nlohmann/json.hpp>

using namespace arbexec;

namespace {

const char* VALID_REQUEST = R"({
    "strategy_id": "funding_BTCUSDT_1700000000.0",
    "symbol": "BTCUSDT",
    "primary_exchange": "binance",
    "secondary_exchange": "bybit",
    "amount": 10000,
    "priority": 1,
    "timestamp": "2024-01-01T00:00:00"
})";

std::string decode_error_for(const std::string& payload) {
    try {
        protocol::decode_request(payload);
    } catch (const DecodeError& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(MessagesTest, DecodeRequest_AllFields) {
    auto request = protocol::decode_request(VALID_REQUEST);

    EXPECT_EQ(request.strategy_id, "funding_BTCUSDT_1700000000.0");
    EXPECT_EQ(request.symbol, "BTCUSDT");
    EXPECT_EQ(request.primary_exchange, "binance");
    EXPECT_EQ(request.secondary_exchange, "bybit");
    EXPECT_DOUBLE_EQ(request.amount, 10000.0);
    EXPECT_EQ(request.priority, 1);
    EXPECT_EQ(request.timestamp, "2024-01-01T00:00:00");
}

TEST(MessagesTest, DecodeRequest_AcceptsFundingRateType) {
    std::string payload = R"({"type":"funding_rate_arbitrage","strategy_id":"s","symbol":"ETHUSDT",)"
                          R"("primary_exchange":"okx","secondary_exchange":"binance",)"
                          R"("amount":250.5,"priority":7,"timestamp":"t"})";
    auto request = protocol::decode_request(payload);
    EXPECT_EQ(request.symbol, "ETHUSDT");
    EXPECT_DOUBLE_EQ(request.amount, 250.5);
}

TEST(MessagesTest, DecodeRequest_RejectsOtherType) {
    std::string payload = R"({"type":"spot_arbitrage","strategy_id":"s","symbol":"X",)"
                          R"("primary_exchange":"a","secondary_exchange":"b",)"
                          R"("amount":1,"priority":1,"timestamp":"t"})";
    EXPECT_NE(decode_error_for(payload).find("unsupported request type"), std::string::npos);
}

TEST(MessagesTest, DecodeRequest_RejectsMissingField) {
    std::string payload = R"({"strategy_id":"s","symbol":"X","primary_exchange":"a",)"
                          R"("secondary_exchange":"b","amount":1,"timestamp":"t"})";
    EXPECT_NE(decode_error_for(payload).find("missing field 'priority'"), std::string::npos);
}

TEST(MessagesTest, DecodeRequest_RejectsUnknownField) {
    std::string payload = R"({"strategy_id":"s","symbol":"X","primary_exchange":"a",)"
                          R"("secondary_exchange":"b","amount":1,"priority":1,"timestamp":"t","leverage":10})";
    EXPECT_NE(decode_error_for(payload).find("unknown field 'leverage'"), std::string::npos);
}

TEST(MessagesTest, DecodeRequest_RejectsWrongTypes) {
    std::string string_amount = R"({"strategy_id":"s","symbol":"X","primary_exchange":"a",)"
                                R"("secondary_exchange":"b","amount":"1","priority":1,"timestamp":"t"})";
    EXPECT_NE(decode_error_for(string_amount).find("'amount' must be a number"), std::string::npos);

    std::string float_priority = R"({"strategy_id":"s","symbol":"X","primary_exchange":"a",)"
                                 R"("secondary_exchange":"b","amount":1,"priority":1.5,"timestamp":"t"})";
    EXPECT_NE(decode_error_for(float_priority).find("'priority' must be an integer"), std::string::npos);

    std::string huge_priority = R"({"strategy_id":"s","symbol":"X","primary_exchange":"a",)"
                                R"("secondary_exchange":"b","amount":1,"priority":4294967297,"timestamp":"t"})";
    EXPECT_NE(decode_error_for(huge_priority).find("'priority' out of range"), std::string::npos);

    std::string negative_priority = R"({"strategy_id":"s","symbol":"X","primary_exchange":"a",)"
                                    R"("secondary_exchange":"b","amount":1,"priority":-2147483649,"timestamp":"t"})";
    EXPECT_NE(decode_error_for(negative_priority).find("'priority' out of range"), std::string::npos);

    std::string numeric_symbol = R"({"strategy_id":"s","symbol":42,"primary_exchange":"a",)"
                                 R"("secondary_exchange":"b","amount":1,"priority":1,"timestamp":"t"})";
    EXPECT_NE(decode_error_for(numeric_symbol).find("'symbol' must be a string"), std::string::npos);
}

TEST(MessagesTest, DecodeRequest_RejectsNonPositiveAmount) {
    std::string zero = R"({"strategy_id":"s","symbol":"X","primary_exchange":"a",)"
                       R"("secondary_exchange":"b","amount":0,"priority":1,"timestamp":"t"})";
    std::string negative = R"({"strategy_id":"s","symbol":"X","primary_exchange":"a",)"
                           R"("secondary_exchange":"b","amount":-5,"priority":1,"timestamp":"t"})";
    EXPECT_NE(decode_error_for(zero).find("must be positive"), std::string::npos);
    EXPECT_NE(decode_error_for(negative).find("must be positive"), std::string::npos);
}

TEST(MessagesTest, DecodeRequest_RejectsMalformedText) {
    EXPECT_THROW(protocol::decode_request("{\"strategy_id\": \"abc\", \"sym"), DecodeError);
    EXPECT_THROW(protocol::decode_request("not json at all"), DecodeError);
    EXPECT_THROW(protocol::decode_request("[1, 2, 3]"), DecodeError);
    EXPECT_THROW(protocol::decode_request(""), DecodeError);
}

TEST(MessagesTest, DecodeError_MessageIsPrefixed) {
    std::string message = decode_error_for("{oops");
    EXPECT_EQ(message.rfind("decode failed: ", 0), 0u);
}

TEST(MessagesTest, EncodeRequest_DecodesBack) {
    ArbitrageRequest request;
    request.strategy_id = "abc";
    request.symbol = "SOLUSDT";
    request.primary_exchange = "okx";
    request.secondary_exchange = "bybit";
    request.amount = 1234.5;
    request.priority = 3;
    request.timestamp = "2024-05-01T12:00:00";

    auto decoded = protocol::decode_request(protocol::encode_request(request));
    EXPECT_EQ(decoded.strategy_id, request.strategy_id);
    EXPECT_EQ(decoded.secondary_exchange, request.secondary_exchange);
    EXPECT_DOUBLE_EQ(decoded.amount, request.amount);
    EXPECT_EQ(decoded.priority, request.priority);
}

TEST(MessagesTest, SuccessResponse_OmitsErrorFields) {
    auto response = ArbitrageResponse::success(2.85, 3, 20'000'000'000ULL);
    auto j = nlohmann::json::parse(protocol::encode_response(response));

    EXPECT_EQ(j["status"], "success");
    EXPECT_DOUBLE_EQ(j["profit"].get<double>(), 2.85);
    EXPECT_EQ(j["execution_time"], "3ms");
    EXPECT_EQ(j["gas_used"].get<uint64_t>(), 20'000'000'000ULL);
    EXPECT_FALSE(j.contains("error_message"));
}

TEST(MessagesTest, FailureResponse_OmitsSuccessFields) {
    auto response = ArbitrageResponse::failure("unsupported exchange: kraken");
    auto j = nlohmann::json::parse(protocol::encode_response(response));

    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["execution_time"], "0ms");
    EXPECT_EQ(j["error_message"], "unsupported exchange: kraken");
    EXPECT_FALSE(j.contains("profit"));
    EXPECT_FALSE(j.contains("gas_used"));
}

TEST(MessagesTest, ResponseRoundTrip_PreservesPopulatedFields) {
    auto success = ArbitrageResponse::success(17.125, 42, 123456);
    EXPECT_EQ(protocol::decode_response(protocol::encode_response(success)), success);

    auto failure = ArbitrageResponse::failure("arbitrage execution failed");
    EXPECT_EQ(protocol::decode_response(protocol::encode_response(failure)), failure);
}

TEST(MessagesTest, DecodeResponse_AcceptsNullOptionals) {
    auto response = protocol::decode_response(
        R"({"status":"error","profit":null,"execution_time":"0ms","gas_used":null,"error_message":"boom"})");

    EXPECT_FALSE(response.is_success());
    EXPECT_FALSE(response.profit.has_value());
    EXPECT_FALSE(response.gas_used.has_value());
    ASSERT_TRUE(response.error_message.has_value());
    EXPECT_EQ(*response.error_message, "boom");
}

TEST(MessagesTest, DecodeResponse_RejectsUnknownStatus) {
    EXPECT_THROW(protocol::decode_response(R"({"status":"pending","execution_time":"0ms"})"), DecodeError);
}

TEST(MessagesTest, EncodeResponse_SurvivesInvalidUtf8InMessage) {
    auto response = ArbitrageResponse::failure(std::string("decode failed: bad byte \xff"));
    std::string wire;
    EXPECT_NO_THROW(wire = protocol::encode_response(response));
    EXPECT_NO_THROW(nlohmann::json::parse(wire));
}
