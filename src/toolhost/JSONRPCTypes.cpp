//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.cpp
// Purpose: JSON-RPC 2.0 message construction and id helpers.
//==========================================================================================================

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

std::string IdToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return "null";
        }
    }, id);
}

JSONValue IdToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        return JSONValue(v);
    }, id);
}

std::string JSONRPCMessage::Serialize() const {
    return SerializeJSON(ToJSON());
}

JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = MakeJSON(jsonrpc);
    obj["id"] = MakeJSON(IdToJSON(id));
    obj["method"] = MakeJSON(method);
    if (params.has_value()) {
        obj["params"] = MakeJSON(params.value());
    }
    return JSONValue(std::move(obj));
}

JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = MakeJSON(jsonrpc);
    obj["id"] = MakeJSON(IdToJSON(id));
    if (error.has_value()) {
        obj["error"] = MakeJSON(error.value());
    } else {
        obj["result"] = MakeJSON(result.has_value() ? result.value() : JSONValue(JSONValue::Object{}));
    }
    return JSONValue(std::move(obj));
}

JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = MakeJSON(jsonrpc);
    obj["method"] = MakeJSON(method);
    if (params.has_value()) {
        obj["params"] = MakeJSON(params.value());
    }
    return JSONValue(std::move(obj));
}

JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = MakeJSON(static_cast<int64_t>(code));
    errorObj["message"] = MakeJSON(message);
    if (data.has_value()) {
        errorObj["data"] = MakeJSON(data.value());
    }
    return JSONValue(std::move(errorObj));
}

JSONRPCResponse CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                    const std::optional<JSONValue>& data) {
    return JSONRPCResponse(id, CreateErrorObject(code, message, data), true);
}

} // namespace toolhost
