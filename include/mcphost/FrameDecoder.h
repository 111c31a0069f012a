//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameDecoder.h
// Purpose: Incremental decoder turning arbitrary stdout chunks into parsed JSON-RPC envelopes
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "mcphost/ContentFramer.h"
#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// FrameDecoder
// Purpose: Buffers a byte stream and yields every complete message in arrival order.
// Notes:
//   - Content-Length header blocks are decoded whenever a header separator is buffered.
//   - A value starting with '{' or '[' is framed by bracket balance when no separator is buffered,
//     or when it completes before the first separator.
//   - Header blocks without a length are discarded and decoding resumes after them.
//   - Bodies declared larger than the framer limit are skipped byte-for-byte.
//   - Malformed bodies are logged and dropped. Feed() never throws on stream content.
//   - Not thread-safe; a transport feeds it from its own io thread.
//==========================================================================================================
class FrameDecoder {
public:
    struct Limits {
        std::size_t maxBuffer = 1024 * 1024;       // ceiling while no frame is yielded
        std::size_t overflowKeep = 64 * 1024;      // trailing window kept past maxBuffer
        std::size_t noiseThreshold = 8 * 1024;     // header-less noise ceiling
        std::size_t noiseKeep = 1024;              // trailing window kept past noiseThreshold
        std::size_t maxContentLength = 1024 * 1024;
    };

    struct Stats {
        uint64_t framesDecoded{0};
        uint64_t framesDropped{0};
        uint64_t bytesDiscarded{0};
    };

    explicit FrameDecoder(std::string label = std::string());
    FrameDecoder(std::string label, Limits limits);

    //======================================================================================================
    // Feed
    // Purpose: Appends a chunk and decodes as many messages as are complete.
    // Returns:
    //   Parsed envelopes in stream order (possibly empty).
    //======================================================================================================
    std::vector<JSONValue> Feed(const char* data, std::size_t size);
    std::vector<JSONValue> Feed(const std::string& chunk) { return Feed(chunk.data(), chunk.size()); }

    // Drops buffered bytes and any pending body skip; stats are kept.
    void Reset();

    std::size_t Buffered() const { return buffer.size(); }
    const Stats& GetStats() const { return stats; }

    // Raises chunk/header diagnostics from DEBUG to INFO.
    void SetVerbose(bool v) { verbose = v; }

private:
    void decodeAvailable(std::vector<JSONValue>& out);
    void acceptBody(const std::string& body, std::vector<JSONValue>& out);
    void discardFront(std::size_t n);
    void enforceBounds(bool frameInProgress, bool rawInProgress);

    std::string label;
    Limits limits;
    std::unique_ptr<IContentFramer> framer;
    std::string buffer;
    std::size_t skipRemaining{0};
    Stats stats;
    bool verbose{false};
};

} // namespace mcphost
