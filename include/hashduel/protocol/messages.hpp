/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace hashduel::protocol {

// Operation names exposed by the authority
namespace method {
inline constexpr const char* kGetCurrentTransactionId = "GetCurrentTransactionId";
inline constexpr const char* kGetChallenge = "GetChallenge";
inline constexpr const char* kGetStatus = "GetStatus";
inline constexpr const char* kSubmitSolution = "SubmitSolution";
inline constexpr const char* kGetWinner = "GetWinner";
inline constexpr const char* kGetDetails = "GetDetails";
} // namespace method

// JSON-RPC error codes. These never overlap the business sentinels (-1, 0, 1, 2).
enum class RpcErrc : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

struct RpcErrorInfo {
    int code{0};
    std::string message;
};

struct Response {
    nlohmann::json id;     // null when the request could not be parsed
    nlohmann::json result; // null on error
    std::optional<RpcErrorInfo> error;
};

// Each builder returns one JSON object followed by '\n'.
std::string build_request(std::uint64_t id, std::string_view method, nlohmann::json params);
std::string build_result(const nlohmann::json& id, nlohmann::json result);
std::string build_error(const nlohmann::json& id, RpcErrc code, std::string_view message);

// Parse one response line. Empty if it is not valid JSON or lacks id/result/error.
std::optional<Response> parse_response(std::string_view line);

} // namespace hashduel::protocol
