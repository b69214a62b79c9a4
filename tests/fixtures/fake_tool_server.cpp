//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: fake_tool_server.cpp
// Purpose: Scriptable stdio tool server used by the toolhost tests
//==========================================================================================================
//
// Options:
//   --tools=a,b,c        Restrict the advertised tools (default: all of them)
//   --hang-first-call    Never answer the first tools/call
//   --noise              Write a non-JSON line before every reply
//   --no-handshake       Never answer initialize
//   --exit-immediately   Print to stderr and exit with status 3 before reading anything
//   --stderr-chatter     Write a stderr line for every request
//   --page-size=N        Split tools/list into pages of N using nextCursor
//
// Tools: ping, echo, env, fail, sleep, is_error, multi, raw, crash, client_ping, client_unknown

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "toolhost/FrameCodec.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/JSONValue.h"

using namespace toolhost;

namespace {

struct Options {
    std::set<std::string> tools{"ping", "echo", "env", "fail", "sleep", "is_error", "multi", "raw", "crash",
                                "client_ping", "client_unknown"};
    bool hangFirstCall{false};
    bool noise{false};
    bool noHandshake{false};
    bool exitImmediately{false};
    bool stderrChatter{false};
    std::size_t pageSize{0};
};

Options parseOptions(int argc, char** argv) {
    Options o;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--tools=", 0) == 0) {
            o.tools.clear();
            std::stringstream ss(a.substr(8));
            std::string t;
            while (std::getline(ss, t, ',')) {
                if (!t.empty()) o.tools.insert(t);
            }
        } else if (a == "--hang-first-call") {
            o.hangFirstCall = true;
        } else if (a == "--noise") {
            o.noise = true;
        } else if (a == "--no-handshake") {
            o.noHandshake = true;
        } else if (a == "--exit-immediately") {
            o.exitImmediately = true;
        } else if (a == "--stderr-chatter") {
            o.stderrChatter = true;
        } else if (a.rfind("--page-size=", 0) == 0) {
            o.pageSize = static_cast<std::size_t>(std::strtoul(a.c_str() + 12, nullptr, 10));
        }
    }
    return o;
}

class FakeServer {
public:
    explicit FakeServer(Options o) : opts(std::move(o)) {}

    int Run() {
        std::string line;
        while (std::getline(std::cin, line)) {
            auto decoded = FrameCodec::Decode(line);
            if (!decoded.ok()) {
                std::cerr << "fake_tool_server: bad frame: " << line << std::endl;
                continue;
            }
            if (auto* req = std::get_if<JSONRPCRequest>(&decoded.value)) {
                if (opts.stderrChatter) {
                    std::cerr << "fake_tool_server: handling " << req->method << std::endl;
                }
                handleRequest(*req);
            }
        }
        return 0;
    }

private:
    void send(const JSONRPCMessage& msg) {
        if (opts.noise) {
            std::cout << "this line is not json" << std::endl;
        }
        std::cout << FrameCodec::Encode(msg) << std::flush;
    }

    static JSONValue textResult(const std::string& text) {
        JSONValue::Object item;
        item["type"] = MakeJSON("text");
        item["text"] = MakeJSON(text);
        JSONValue::Array content;
        content.push_back(MakeJSON(std::move(item)));
        JSONValue::Object result;
        result["content"] = MakeJSON(std::move(content));
        return JSONValue(std::move(result));
    }

    void handleRequest(const JSONRPCRequest& req) {
        if (req.method == "initialize") {
            if (opts.noHandshake) {
                return;
            }
            JSONValue::Object info;
            info["name"] = MakeJSON("fake-tool-server");
            info["version"] = MakeJSON("1.0.0");
            JSONValue::Object result;
            result["protocolVersion"] = MakeJSON("2024-11-05");
            result["capabilities"] = MakeJSON(JSONValue::Object{});
            result["serverInfo"] = MakeJSON(std::move(info));
            send(JSONRPCResponse(req.id, JSONValue(std::move(result))));
        } else if (req.method == "ping") {
            send(JSONRPCResponse(req.id, JSONValue(JSONValue::Object{})));
        } else if (req.method == "tools/list") {
            handleList(req);
        } else if (req.method == "tools/call") {
            handleCall(req);
        } else {
            send(CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found"));
        }
    }

    void handleList(const JSONRPCRequest& req) {
        std::vector<std::string> names(opts.tools.begin(), opts.tools.end());
        std::size_t start = 0;
        if (req.params.has_value()) {
            if (auto cursor = GetString(req.params.value(), "cursor")) {
                start = static_cast<std::size_t>(std::strtoul(cursor->c_str(), nullptr, 10));
            }
        }
        std::size_t end = names.size();
        if (opts.pageSize > 0 && start + opts.pageSize < end) {
            end = start + opts.pageSize;
        }
        JSONValue::Array tools;
        for (std::size_t i = start; i < end && i < names.size(); ++i) {
            JSONValue::Object schema;
            schema["type"] = MakeJSON("object");
            JSONValue::Object tool;
            tool["name"] = MakeJSON(names[i]);
            tool["description"] = MakeJSON("fake " + names[i]);
            tool["inputSchema"] = MakeJSON(std::move(schema));
            tools.push_back(MakeJSON(std::move(tool)));
        }
        JSONValue::Object result;
        result["tools"] = MakeJSON(std::move(tools));
        if (end < names.size()) {
            result["nextCursor"] = MakeJSON(std::to_string(end));
        }
        send(JSONRPCResponse(req.id, JSONValue(std::move(result))));
    }

    // Sends a request to the client and waits for its reply on stdin.
    std::optional<JSONRPCResponse> askClient(const std::string& method) {
        JSONRPCRequest out(JSONRPCId(std::string("srv-1")), method, JSONValue(JSONValue::Object{}));
        std::cout << FrameCodec::Encode(out) << std::flush;
        std::string line;
        while (std::getline(std::cin, line)) {
            auto decoded = FrameCodec::Decode(line);
            if (!decoded.ok()) continue;
            if (auto* resp = std::get_if<JSONRPCResponse>(&decoded.value)) {
                return *resp;
            }
        }
        return std::nullopt;
    }

    void handleCall(const JSONRPCRequest& req) {
        ++calls;
        if (opts.hangFirstCall && calls == 1) {
            return;
        }
        const JSONValue params = req.params.value_or(JSONValue(JSONValue::Object{}));
        const std::string name = GetString(params, "name").value_or("");
        const JSONValue* argsPtr = FindMember(params, "arguments");
        const JSONValue args = argsPtr ? *argsPtr : JSONValue(JSONValue::Object{});

        if (opts.tools.count(name) == 0) {
            send(CreateErrorResponse(req.id, JSONRPCErrorCodes::ToolNotFound, "Unknown tool: " + name));
            return;
        }
        if (name == "ping") {
            send(JSONRPCResponse(req.id, textResult("pong")));
        } else if (name == "echo") {
            auto text = GetString(args, "text");
            send(JSONRPCResponse(req.id, textResult(text.has_value() ? text.value() : SerializeJSON(args))));
        } else if (name == "env") {
            const char* v = std::getenv(GetString(args, "name").value_or("").c_str());
            send(JSONRPCResponse(req.id, textResult(v ? v : "")));
        } else if (name == "fail") {
            send(CreateErrorResponse(req.id, JSONRPCErrorCodes::ServerError, "boom"));
        } else if (name == "sleep") {
            const int64_t ms = GetInteger(args, "ms").value_or(100);
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            send(JSONRPCResponse(req.id, textResult("slept")));
        } else if (name == "is_error") {
            JSONValue result = textResult("bad input");
            std::get<JSONValue::Object>(result.value)["isError"] = MakeJSON(true);
            send(JSONRPCResponse(req.id, std::move(result)));
        } else if (name == "multi") {
            JSONValue::Array content;
            for (const char* t : {"first", "second"}) {
                JSONValue::Object item;
                item["type"] = MakeJSON("text");
                item["text"] = MakeJSON(t);
                content.push_back(MakeJSON(std::move(item)));
            }
            JSONValue::Object image;
            image["type"] = MakeJSON("image");
            image["data"] = MakeJSON("AAAA");
            content.push_back(MakeJSON(std::move(image)));
            JSONValue::Object result;
            result["content"] = MakeJSON(std::move(content));
            send(JSONRPCResponse(req.id, JSONValue(std::move(result))));
        } else if (name == "raw") {
            JSONValue::Object result;
            result["value"] = MakeJSON(int64_t{42});
            send(JSONRPCResponse(req.id, JSONValue(std::move(result))));
        } else if (name == "crash") {
            std::cerr << "fake_tool_server: crashing on request" << std::endl;
            std::_Exit(1);
        } else if (name == "client_ping") {
            auto reply = askClient("ping");
            const bool ok = reply.has_value() && !reply->IsError() && reply->result.has_value() && reply->result->IsObject();
            send(JSONRPCResponse(req.id, textResult(ok ? "client answered ping" : "no ping reply")));
        } else if (name == "client_unknown") {
            auto reply = askClient("roots/list");
            int64_t code = 0;
            if (reply.has_value() && reply->error.has_value()) {
                code = GetInteger(reply->error.value(), "code").value_or(0);
            }
            send(JSONRPCResponse(req.id, textResult("client error " + std::to_string(code))));
        }
    }

    Options opts;
    int calls{0};
};

} // namespace

int main(int argc, char** argv) {
    Options opts = parseOptions(argc, argv);
    if (opts.exitImmediately) {
        std::cerr << "fake_tool_server: refusing to start" << std::endl;
        return 3;
    }
    FakeServer server(std::move(opts));
    return server.Run();
}
