/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/protocol/messages.hpp>

using nlohmann::json;

namespace hashduel::protocol {

static inline std::string dump_line(const json& j) {
    std::string s = j.dump();
    s.push_back('\n');
    return s;
}

std::string build_request(std::uint64_t id, std::string_view method, json params) {
    json j;
    j["id"] = id;
    j["method"] = std::string(method);
    j["params"] = params.is_null() ? json::object() : std::move(params);
    return dump_line(j);
}

std::string build_result(const json& id, json result) {
    json j;
    j["id"] = id;
    j["result"] = std::move(result);
    j["error"] = nullptr;
    return dump_line(j);
}

std::string build_error(const json& id, RpcErrc code, std::string_view message) {
    json j;
    j["id"] = id;
    j["result"] = nullptr;
    j["error"] = {{"code", static_cast<int>(code)}, {"message", std::string(message)}};
    return dump_line(j);
}

std::optional<Response> parse_response(std::string_view line) {
    json j = json::parse(line.begin(), line.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("id")) return std::nullopt;

    Response r;
    r.id = j.at("id");
    if (j.contains("error") && !j.at("error").is_null()) {
        const auto& e = j.at("error");
        if (!e.is_object() || !e.contains("code") || !e.at("code").is_number_integer()) return std::nullopt;
        RpcErrorInfo info;
        info.code = e.at("code").get<int>();
        if (e.contains("message") && e.at("message").is_string()) {
            info.message = e.at("message").get<std::string>();
        }
        r.error = std::move(info);
        return r;
    }
    if (!j.contains("result")) return std::nullopt;
    r.result = j.at("result");
    return r;
}

} // namespace hashduel::protocol
