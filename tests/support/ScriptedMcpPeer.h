//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ScriptedMcpPeer.h
// Purpose: In-memory MCP server peer for InMemoryProcess based tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcpm/JSONRPCTypes.h"
#include "mcpm/adapters/InMemoryProcessAdapter.hpp"

namespace mcpm::testing {

// Behaviour knobs shared with the test body; the peer reads them on every line.
struct PeerScript {
    std::atomic<bool> answerInitialize{true};
    std::atomic<bool> failToolsList{false};
    std::atomic<bool> exitOnInitialize{false};
    std::atomic<int> initializeCount{0};
    std::atomic<int> toolCalls{0};
    std::atomic<int> toolsListCount{0};
    std::vector<std::string> tools{"echo", "fail"};
    bool advertiseResources{true};
    bool advertisePrompts{false};
};

inline JSONValue toolsListResult(const std::vector<std::string>& names) {
    JSONValue::Array arr;
    for (const auto& n : names) {
        arr.push_back(std::make_shared<JSONValue>(MakeObject({
            {"name", JSONValue(n)},
            {"description", JSONValue("scripted " + n)},
            {"inputSchema", MakeObject({{"type", JSONValue("object")}})},
        })));
    }
    return MakeObject({{"tools", JSONValue(std::move(arr))}});
}

//==========================================================================================================
// MakeScriptedPeer
// Purpose: Answers initialize, tools/list, tools/call (echo, fail), resources/list and ping.
//==========================================================================================================
inline adapters::InMemoryProcess::Peer MakeScriptedPeer(std::shared_ptr<PeerScript> script) {
    return [script](const std::string& line, adapters::InMemoryProcess& proc) {
        JSONValue msg = ParseJSON(line);
        auto method = GetStringMember(msg, "method");
        if (!method.has_value() || FindMember(msg, "id") == nullptr) {
            return;
        }
        JSONRPCRequest req;
        req.FromValue(msg);
        const JSONValue params = req.params.value_or(JSONValue(JSONValue::Object{}));
        if (*method == "initialize") {
            script->initializeCount++;
            if (script->exitOnInitialize) {
                proc.SimulateExit(1);
                return;
            }
            if (!script->answerInitialize) {
                return;
            }
            JSONValue caps = MakeObject({{"tools", JSONValue(JSONValue::Object{})}});
            if (script->advertiseResources) {
                SetMember(caps, "resources", JSONValue(JSONValue::Object{}));
            }
            if (script->advertisePrompts) {
                SetMember(caps, "prompts", JSONValue(JSONValue::Object{}));
            }
            proc.EmitStdout(JSONRPCResponse(req.id, MakeObject({
                {"protocolVersion", JSONValue("2025-11-25")},
                {"capabilities", caps},
                {"serverInfo", MakeObject({{"name", JSONValue("scripted")}, {"version", JSONValue("0.1")}})},
            })).Serialize());
        } else if (*method == "tools/list") {
            script->toolsListCount++;
            if (script->failToolsList) {
                proc.EmitStdout(CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "no tools")->Serialize());
                return;
            }
            proc.EmitStdout(JSONRPCResponse(req.id, toolsListResult(script->tools)).Serialize());
        } else if (*method == "tools/call") {
            script->toolCalls++;
            const std::string name = GetStringMember(params, "name").value_or("");
            if (name == "fail") {
                proc.EmitStdout(
                    CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "bad arguments")->Serialize());
                return;
            }
            const JSONValue* args = FindMember(params, "arguments");
            JSONValue::Array content;
            content.push_back(std::make_shared<JSONValue>(MakeObject({
                {"type", JSONValue("text")},
                {"text", JSONValue(args ? GetStringMember(*args, "text").value_or("") : std::string())},
            })));
            proc.EmitStdout(JSONRPCResponse(req.id, MakeObject({{"content", JSONValue(std::move(content))}})).Serialize());
        } else if (*method == "resources/list") {
            proc.EmitStdout(JSONRPCResponse(req.id, MakeObject({{"resources", JSONValue(JSONValue::Array{})}})).Serialize());
        } else if (*method == "ping") {
            proc.EmitStdout(JSONRPCResponse(req.id, JSONValue(JSONValue::Object{})).Serialize());
        } else {
            proc.EmitStdout(
                CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "unknown " + *method)->Serialize());
        }
    };
}

// Polls `pred` until it holds or `limit` elapses.
template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace mcpm::testing
