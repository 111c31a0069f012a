//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for Content-Length message framing on child process stdio
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace mcphost {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge,
        NoHeader
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // header+sep or full frame bytes to drop when appropriate
        std::size_t frameSize{0};           // header+sep+declared body once a usable header was read
        std::size_t declaredLength{0};      // Content-Length value (also set for BodyTooLarge)
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;

    //====================================================================================================
    // tryDecodeEx
    // Purpose: Inspects the start of buffer for one header-framed message without modifying it.
    // Notes:
    //   The header block ends at the first blank line, "\r\n\r\n" or "\n\n", whichever occurs first.
    //   NoHeader means neither separator is present yet.
    //====================================================================================================
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 1024 * 1024);

} // namespace mcphost
