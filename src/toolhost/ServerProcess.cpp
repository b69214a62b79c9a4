//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerProcess.cpp
// Purpose: Tool-server connection: child lifecycle, stdout dispatch, stderr drain and JSON-RPC calls.
//==========================================================================================================

#include "toolhost/ServerProcess.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <utility>

#include "logging/Logger.h"
#include "toolhost/ChildProcess.hpp"
#include "toolhost/FrameCodec.h"
#include "toolhost/OutputPump.hpp"
#include "toolhost/RequestCorrelator.h"

namespace toolhost {

using errors::ErrorCode;

namespace {

constexpr std::size_t kLogExcerpt = 200;
constexpr int kMaxListPages = 64;

std::string excerpt(const std::string& s) {
    if (s.size() <= kLogExcerpt) {
        return s;
    }
    return s.substr(0, kLogExcerpt) + "...";
}

std::string trimTrailing(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        out.push_back(' ');
        out += a;
    }
    return out;
}

// Joined "text" fields of result.content; the serialized result when there are none.
std::string extractText(const JSONValue& result) {
    std::string text;
    bool any = false;
    if (const auto* content = GetArray(result, "content")) {
        for (const auto& item : *content) {
            if (!item) continue;
            auto t = GetString(*item, "text");
            if (!t.has_value()) continue;
            if (any) text.push_back('\n');
            text += t.value();
            any = true;
        }
    }
    return any ? text : SerializeJSON(result);
}

} // namespace

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Starting: return "Starting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Failed: return "Failed";
        case ConnectionState::Stopped: return "Stopped";
    }
    return "Unknown";
}

class ServerProcess::Impl {
public:
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    ServerProcessOptions options;

    ChildProcess child;
    RequestCorrelator correlator;
    std::atomic<ConnectionState> state{ConnectionState::Starting};
    std::atomic<bool> startCalled{false};
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> childGone{false};
    std::atomic<std::size_t> malformedFrames{0};
    std::mutex lifecycleMutex;

    mutable std::mutex infoMutex;
    Implementation serverInfo;

    // Declared last so the pumps stop before anything they call into is destroyed
    OutputPump stdoutPump;
    OutputPump stderrPump;

    Impl(std::string n, std::string cmd, std::vector<std::string> a, std::map<std::string, std::string> e,
         ServerProcessOptions o)
        : name(std::move(n)), command(std::move(cmd)), args(std::move(a)), env(std::move(e)),
          options(std::move(o)),
          correlator(name, [this](const std::string& frame) { return writeFrame(frame); }) {}

    ~Impl() {
        stdoutPump.Stop();
        stderrPump.Stop();
    }

    std::optional<errors::ToolhostError> writeFrame(const std::string& frame) {
        auto err = child.WriteStdin(frame, options.writeTimeout);
        if (err.has_value() && err->code == ErrorCode::ProcessExited) {
            // stdin is gone (or torn); no later request can be delivered
            LOG_WARN("[{}] connection unusable: {}", name, err->message);
            correlator.Close(err.value());
        }
        return err;
    }

    void onStdoutLine(const std::string& line) {
        auto decoded = FrameCodec::Decode(line);
        if (!decoded.ok()) {
            ++malformedFrames;
            LOG_WARN("[{}] ignoring malformed frame ({}): {}", name, decoded.error->message, excerpt(line));
            return;
        }
        if (auto* resp = std::get_if<JSONRPCResponse>(&decoded.value)) {
            correlator.Deliver(std::move(*resp));
        } else if (auto* note = std::get_if<JSONRPCNotification>(&decoded.value)) {
            LOG_DEBUG("[{}] notification {} dropped", name, note->method);
        } else if (auto* req = std::get_if<JSONRPCRequest>(&decoded.value)) {
            answerServerRequest(*req);
        }
    }

    void answerServerRequest(const JSONRPCRequest& req) {
        JSONRPCResponse resp;
        if (req.method == Methods::Ping) {
            resp = JSONRPCResponse(req.id, JSONValue(JSONValue::Object{}));
        } else {
            LOG_DEBUG("[{}] rejecting server request {}", name, req.method);
            resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }
        if (auto err = writeFrame(FrameCodec::Encode(resp))) {
            LOG_WARN("[{}] could not answer {}: {}", name, req.method, err->message);
        }
    }

    void onStdoutEof() {
        childGone = true;
        if (!stopRequested.load()) {
            LOG_WARN("[{}] stdout closed; tool server has exited", name);
        }
        correlator.Close(errors::makeError(ErrorCode::ProcessExited,
                                           std::format("[{}] tool server exited", name)));
    }

    void onStderrLine(const std::string& line) {
        LOG_WARN("[{}] stderr: {}", name, line);
    }

    // Kills the child and releases threads and pipes. Safe to call more than once.
    void teardown(std::chrono::milliseconds grace, const errors::ToolhostError& reason) {
        correlator.Close(reason);
        child.CloseStdin();
        if (!child.Terminate(grace)) {
            LOG_WARN("[{}] did not exit within {} ms; killed", name, static_cast<long long>(grace.count()));
        }
        stdoutPump.Stop();
        stderrPump.Stop();
        child.CloseOutputs();
    }

    errors::ToolhostError failStart(ErrorCode code, const std::string& message) {
        LOG_ERROR("[{}] {}", name, message);
        teardown(std::chrono::milliseconds(500), errors::makeError(code, message));
        state = ConnectionState::Failed;
        return errors::makeError(code, std::format("[{}] {}", name, message));
    }

    std::optional<errors::ToolhostError> start(std::chrono::milliseconds timeout) {
        FUNC_SCOPE();
        {
            std::lock_guard<std::mutex> lk(lifecycleMutex);
            if (startCalled.exchange(true) || state.load() != ConnectionState::Starting) {
                return errors::makeError(ErrorCode::SpawnFailed, std::format("[{}] already started or stopped", name));
            }
        }
        LOG_INFO("[{}] starting: {}{}", name, command, joinArgs(args));

        ProcessSpec spec;
        spec.command = command;
        spec.args = args;
        spec.env = env;
        if (auto err = child.Spawn(spec)) {
            state = ConnectionState::Failed;
            LOG_ERROR("[{}] spawn failed: {}", name, err->message);
            return errors::makeError(ErrorCode::SpawnFailed, std::format("[{}] {}", name, err->message));
        }

        if (child.WaitExit(options.spawnGrace)) {
            std::string errText = trimTrailing(child.ReadAvailableStderr());
            const int status = child.ExitCode().value_or(-1);
            child.CloseOutputs();
            state = ConnectionState::Failed;
            std::string message = std::format("exited during startup with status {}", status);
            if (!errText.empty()) {
                message += ": " + excerpt(errText);
            }
            LOG_ERROR("[{}] {}", name, message);
            return errors::makeError(ErrorCode::SpawnFailed, std::format("[{}] {}", name, message));
        }

        stderrPump.Start(child.StderrFd(), [this](const std::string& line) { onStderrLine(line); });
        stdoutPump.Start(child.StdoutFd(),
                         [this](const std::string& line) { onStdoutLine(line); },
                         [this]() { onStdoutEof(); });

        JSONValue::Object clientInfo;
        clientInfo["name"] = MakeJSON(options.clientInfo.name);
        clientInfo["version"] = MakeJSON(options.clientInfo.version);
        JSONValue::Object params;
        params["protocolVersion"] = MakeJSON(options.protocolVersion);
        params["capabilities"] = MakeJSON(JSONValue::Object{});
        params["clientInfo"] = MakeJSON(std::move(clientInfo));

        auto init = correlator.Send(Methods::Initialize, JSONValue(std::move(params)), timeout);
        if (!init.ok()) {
            return failStart(ErrorCode::HandshakeFailed, "initialize failed: " + init.error->message);
        }
        if (init.value.IsError()) {
            auto err = errors::toolErrorFromErrorValue(init.value.error.value());
            return failStart(ErrorCode::HandshakeFailed, "initialize rejected: " + err.message);
        }
        if (!init.value.result.has_value() || !init.value.result->IsObject()) {
            return failStart(ErrorCode::HandshakeFailed, "initialize result is not an object");
        }
        const JSONValue& result = init.value.result.value();
        {
            std::lock_guard<std::mutex> lk(infoMutex);
            if (const JSONValue* info = FindMember(result, "serverInfo")) {
                serverInfo.name = GetString(*info, "name").value_or("");
                serverInfo.version = GetString(*info, "version").value_or("");
            }
        }
        auto negotiated = GetString(result, "protocolVersion");
        if (negotiated.has_value() && negotiated.value() != options.protocolVersion) {
            LOG_WARN("[{}] server answered with protocol {} (requested {})", name, negotiated.value(), options.protocolVersion);
        }

        JSONRPCNotification initialized(Methods::Initialized, JSONValue(JSONValue::Object{}));
        if (auto err = writeFrame(FrameCodec::Encode(initialized))) {
            return failStart(ErrorCode::HandshakeFailed, "initialized notification failed: " + err->message);
        }

        {
            std::lock_guard<std::mutex> lk(lifecycleMutex);
            if (!stopRequested.load() && !childGone.load()) {
                state = ConnectionState::Connected;
            }
        }
        if (state.load() != ConnectionState::Connected) {
            return failStart(ErrorCode::HandshakeFailed, "connection closed during handshake");
        }
        LOG_INFO("[{}] connected (server '{}' {})", name, serverInfo.name, serverInfo.version);
        return std::nullopt;
    }

    std::optional<errors::ToolhostError> stop(std::chrono::milliseconds timeout) {
        FUNC_SCOPE();
        std::lock_guard<std::mutex> lk(lifecycleMutex);
        const ConnectionState s = state.load();
        if (s == ConnectionState::Stopped || s == ConnectionState::Failed) {
            return std::nullopt;
        }
        stopRequested = true;
        if (!startCalled.load()) {
            state = ConnectionState::Stopped;
            return std::nullopt;
        }
        const auto reason = errors::makeError(ErrorCode::ServerNotConnected, std::format("[{}] connection stopped", name));
        if (s == ConnectionState::Starting) {
            // Start() owns the transition to Failed; unblock it and kill the child.
            correlator.Close(reason);
            child.CloseStdin();
            (void)child.Terminate(timeout);
            return std::nullopt;
        }
        state = ConnectionState::Stopped;
        LOG_INFO("[{}] stopping", name);
        teardown(timeout, reason);
        return std::nullopt;
    }
};

ServerProcess::ServerProcess(std::string name, std::string command, std::vector<std::string> args,
                             std::map<std::string, std::string> env, ServerProcessOptions options)
    : pImpl(std::make_unique<Impl>(std::move(name), std::move(command), std::move(args), std::move(env),
                                   std::move(options))) {}

ServerProcess::~ServerProcess() {
    if (pImpl) {
        (void)pImpl->stop(std::chrono::milliseconds(1000));
    }
}

std::optional<errors::ToolhostError> ServerProcess::Start(std::chrono::milliseconds timeout) {
    return pImpl->start(timeout);
}

Result<std::vector<ToolDescriptor>> ServerProcess::ListTools(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    using R = Result<std::vector<ToolDescriptor>>;
    if (pImpl->state.load() != ConnectionState::Connected) {
        return R::Failure(errors::makeError(ErrorCode::ServerNotConnected,
                                            std::format("[{}] not connected", pImpl->name)));
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> cursor;
    for (int page = 0; page < kMaxListPages; ++page) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            left = std::chrono::milliseconds(1);
        }
        JSONValue::Object params;
        if (cursor.has_value()) {
            params["cursor"] = MakeJSON(cursor.value());
        }
        auto resp = pImpl->correlator.Send(Methods::ListTools, JSONValue(std::move(params)), left);
        if (!resp.ok()) {
            LOG_WARN("[{}] tools/list failed: {}", pImpl->name, resp.error->message);
            return R::Failure(resp.error.value());
        }
        if (resp.value.IsError()) {
            auto err = errors::toolErrorFromErrorValue(resp.value.error.value());
            LOG_WARN("[{}] tools/list rejected: {}", pImpl->name, err.message);
            return R::Failure(err);
        }
        const JSONValue::Array* entries = resp.value.result ? GetArray(*resp.value.result, "tools") : nullptr;
        if (!entries) {
            LOG_WARN("[{}] tools/list result has no tools array", pImpl->name);
            return R::Failure(errors::makeError(ErrorCode::MalformedFrame,
                                                std::format("[{}] tools/list result has no tools array", pImpl->name)));
        }
        for (const auto& entry : *entries) {
            auto d = entry ? ToolDescriptorFromJSON(pImpl->name, *entry) : std::nullopt;
            if (!d.has_value()) {
                LOG_WARN("[{}] skipping tool entry without a name", pImpl->name);
                continue;
            }
            tools.push_back(std::move(d.value()));
        }
        cursor = GetString(*resp.value.result, "nextCursor");
        if (!cursor.has_value() || cursor->empty()) {
            break;
        }
    }
    LOG_DEBUG("[{}] tools/list returned {} tools", pImpl->name, tools.size());
    return R::Success(std::move(tools));
}

Result<std::string> ServerProcess::CallTool(const std::string& tool, const JSONValue& arguments,
                                            std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    using R = Result<std::string>;
    if (pImpl->state.load() != ConnectionState::Connected) {
        return R::Failure(errors::makeError(ErrorCode::ServerNotConnected,
                                            std::format("[{}] not connected", pImpl->name)));
    }
    JSONValue::Object params;
    params["name"] = MakeJSON(tool);
    params["arguments"] = MakeJSON(arguments.IsNull() ? JSONValue(JSONValue::Object{}) : arguments);

    auto resp = pImpl->correlator.Send(Methods::CallTool, JSONValue(std::move(params)), timeout);
    if (!resp.ok()) {
        auto err = resp.error.value();
        if (err.code == ErrorCode::RequestTimeout) {
            err.code = ErrorCode::CallTimeout;
            err.message = std::format("[{}] {} timed out after {} ms", pImpl->name, tool, static_cast<long long>(timeout.count()));
        }
        return R::Failure(err);
    }
    if (resp.value.IsError()) {
        auto err = errors::toolErrorFromErrorValue(resp.value.error.value());
        LOG_WARN("[{}] {} returned error {}: {}", pImpl->name, tool, err.rpcCode.value_or(0), err.message);
        return R::Failure(err);
    }
    const JSONValue result = resp.value.result.value_or(JSONValue(JSONValue::Object{}));
    std::string text = extractText(result);
    if (GetBool(result, "isError").value_or(false)) {
        return R::Failure(errors::makeError(ErrorCode::ToolError, text));
    }
    return R::Success(std::move(text));
}

std::optional<errors::ToolhostError> ServerProcess::Stop(std::chrono::milliseconds timeout) {
    return pImpl->stop(timeout);
}

ConnectionState ServerProcess::State() const {
    return pImpl->state.load();
}

const std::string& ServerProcess::Name() const {
    return pImpl->name;
}

bool ServerProcess::IsUsable() const {
    return pImpl->state.load() == ConnectionState::Connected && !pImpl->correlator.IsClosed();
}

Implementation ServerProcess::ServerInfo() const {
    std::lock_guard<std::mutex> lk(pImpl->infoMutex);
    return pImpl->serverInfo;
}

int ServerProcess::Pid() const {
    return static_cast<int>(pImpl->child.Pid());
}

std::size_t ServerProcess::MalformedFrameCount() const {
    return pImpl->malformedFrames.load();
}

void ServerProcessTestHooks::feedStdoutLine(ServerProcess& p, const std::string& line) {
    p.pImpl->onStdoutLine(line);
}

} // namespace toolhost
