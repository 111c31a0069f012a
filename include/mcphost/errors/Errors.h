//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed transport errors and JSON-RPC error mapping helpers for the MCP host
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Error payload reported by a peer inside a JSON-RPC error envelope.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

//==========================================================================================================
// ErrorCode
// Purpose: Failure kinds surfaced by transports and the orchestrator through futures.
//==========================================================================================================
enum class ErrorCode {
    SpawnFailure,
    HandshakeTimeout,
    HandshakeRejected,
    RequestTimeout,
    RequestRejected,
    ProcessExited,
    Stopped,
    NotConnected,
    InvalidConfig
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::SpawnFailure: return "SpawnFailure";
        case ErrorCode::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorCode::HandshakeRejected: return "HandshakeRejected";
        case ErrorCode::RequestTimeout: return "RequestTimeout";
        case ErrorCode::RequestRejected: return "RequestRejected";
        case ErrorCode::ProcessExited: return "ProcessExited";
        case ErrorCode::Stopped: return "Stopped";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

//==========================================================================================================
// TransportError
// Purpose: Exception stored into request/start futures. Rejections carry the peer's McpError.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    TransportError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), errorCode(code) {}
    TransportError(ErrorCode code, const std::string& message, McpError peer)
        : std::runtime_error(message), errorCode(code), peerError(std::move(peer)) {}

    ErrorCode code() const noexcept { return errorCode; }
    const std::optional<McpError>& peer() const noexcept { return peerError; }

private:
    ErrorCode errorCode;
    std::optional<McpError> peerError;
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Servers in the wild send loosely shaped errors, so a missing message or code is tolerated:
// code falls back to InternalError and message to the serialized object.
//
// Returns:
//   std::nullopt when the input is not an object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!errVal.isObject()) {
        return std::nullopt;
    }
    McpError e;
    e.code = JSONRPCErrorCodes::InternalError;
    const JSONValue* code = errVal.find("code");
    if (code && std::holds_alternative<int64_t>(code->value)) {
        e.code = static_cast<int>(std::get<int64_t>(code->value));
    } else if (code && std::holds_alternative<double>(code->value)) {
        e.code = static_cast<int>(std::get<double>(code->value));
    }
    const JSONValue* msg = errVal.find("message");
    if (msg && msg->isString()) {
        e.message = std::get<std::string>(msg->value);
    } else {
        e.message = SerializeJSON(errVal);
    }
    if (const JSONValue* data = errVal.find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Returns the TransportError code carried by an exception_ptr, if any.
inline std::optional<ErrorCode> errorCodeOf(const std::exception_ptr& ep) {
    if (!ep) {
        return std::nullopt;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const TransportError& e) {
        return e.code();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace errors
} // namespace mcphost
