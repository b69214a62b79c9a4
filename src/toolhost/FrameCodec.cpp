//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameCodec.cpp
// Purpose: Newline framer and JSON-RPC frame encode/decode.
//========================================================================================================

#include "toolhost/FrameCodec.h"

#include "logging/Logger.h"

namespace toolhost {

namespace {

using errors::ErrorCode;

Result<DecodedMessage> malformed(const std::string& why) {
    return Result<DecodedMessage>::Failure(errors::makeError(ErrorCode::MalformedFrame, why));
}

bool readId(const JSONValue& v, JSONRPCId& out) {
    if (const auto* s = std::get_if<std::string>(&v.value)) { out = *s; return true; }
    if (const auto* n = std::get_if<int64_t>(&v.value)) { out = *n; return true; }
    if (v.IsNull()) { out = nullptr; return true; }
    return false;
}

std::optional<JSONValue> memberCopy(const JSONValue& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v) return std::nullopt;
    return *v;
}

} // namespace

std::string FrameCodec::Encode(const JSONRPCMessage& message) {
    std::string frame = message.Serialize();
    frame.push_back('\n');
    return frame;
}

Result<DecodedMessage> FrameCodec::Decode(const std::string& line) {
    std::string text = line;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    if (text.empty()) {
        return malformed("empty frame");
    }

    std::string parseError;
    auto doc = ParseJSON(text, &parseError);
    if (!doc.has_value()) {
        return malformed("invalid JSON: " + parseError);
    }
    if (!doc->IsObject()) {
        return malformed("frame is not a JSON object");
    }

    const JSONValue* idVal = FindMember(*doc, "id");
    const JSONValue* methodVal = FindMember(*doc, "method");

    if (methodVal) {
        const auto* method = std::get_if<std::string>(&methodVal->value);
        if (!method || method->empty()) {
            return malformed("method is not a non-empty string");
        }
        if (idVal) {
            JSONRPCRequest req;
            if (!readId(*idVal, req.id)) {
                return malformed("request id has an unsupported type");
            }
            req.method = *method;
            req.params = memberCopy(*doc, "params");
            return Result<DecodedMessage>::Success(DecodedMessage(std::move(req)));
        }
        JSONRPCNotification note;
        note.method = *method;
        note.params = memberCopy(*doc, "params");
        return Result<DecodedMessage>::Success(DecodedMessage(std::move(note)));
    }

    const JSONValue* resultVal = FindMember(*doc, "result");
    const JSONValue* errorVal = FindMember(*doc, "error");
    if (!resultVal && !errorVal) {
        return malformed("frame is neither request, notification nor response");
    }
    if (!idVal) {
        return malformed("response without id");
    }
    JSONRPCResponse resp;
    if (!readId(*idVal, resp.id)) {
        return malformed("response id has an unsupported type");
    }
    if (errorVal) {
        resp.error = *errorVal;
    } else {
        resp.result = *resultVal;
    }
    return Result<DecodedMessage>::Success(DecodedMessage(std::move(resp)));
}

LineFramer::DecodeResult LineFramer::tryDecodeEx(const std::string& buffer) {
    std::size_t start = 0;
    while (true) {
        std::size_t eol = buffer.find('\n', start);
        if (eol == std::string::npos) {
            const std::size_t pending = buffer.size() - start;
            if (discarding) {
                return { DecodeStatus::Incomplete, std::nullopt, buffer.size() };
            }
            if (pending > maxLineLength) {
                LOG_WARN("Dropping stdout line longer than {} bytes", maxLineLength);
                discarding = true;
                return { DecodeStatus::LineTooLong, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, start };
        }
        if (discarding) {
            discarding = false;
            start = eol + 1;
            continue;
        }
        std::size_t end = eol;
        if (end > start && buffer[end - 1] == '\r') {
            --end;
        }
        if (end == start) {
            start = eol + 1;
            continue;
        }
        if (end - start > maxLineLength) {
            LOG_WARN("Dropping stdout line of {} bytes (max={})", end - start, maxLineLength);
            return { DecodeStatus::LineTooLong, std::nullopt, eol + 1 };
        }
        return { DecodeStatus::Ok, buffer.substr(start, end - start), eol + 1 };
    }
}

std::optional<std::string> LineFramer::tryDecode(std::string& buffer) {
    while (true) {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        if (r.status == DecodeStatus::Incomplete || buffer.empty()) {
            return std::nullopt;
        }
    }
}

} // namespace toolhost
