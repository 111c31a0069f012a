//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameDecoder.cpp
// Purpose: Stream decoder combining header framing, raw JSON fallback and buffer bounds
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcphost/FrameDecoder.h"
#include "mcphost/JsonScanner.h"

namespace mcphost {

namespace {

std::string escapeHead(const char* data, std::size_t size, std::size_t maxLen) {
    std::string out;
    const std::size_t n = std::min(size, maxLen);
    out.reserve(n + 8);
    for (std::size_t i = 0; i < n; ++i) {
        char c = data[i];
        if (c == '\r') { out += "\\r"; }
        else if (c == '\n') { out += "\\n"; }
        else { out.push_back(c); }
    }
    return out;
}

std::size_t firstSeparator(const std::string& buf) {
    const std::size_t crlf = buf.find("\r\n\r\n");
    const std::size_t lf = buf.find("\n\n");
    return std::min(crlf, lf);
}

bool hasLengthMarker(const std::string& buf) {
    static const std::string key = "content-length:";
    auto it = std::search(buf.begin(), buf.end(), key.begin(), key.end(),
                          [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == b; });
    return it != buf.end();
}

} // namespace

FrameDecoder::FrameDecoder(std::string label) : FrameDecoder(std::move(label), Limits{}) {}

FrameDecoder::FrameDecoder(std::string label, Limits limits)
    : label(std::move(label)), limits(limits), framer(MakeContentLengthFramer(limits.maxContentLength)) {}

std::vector<JSONValue> FrameDecoder::Feed(const char* data, std::size_t size) {
    std::vector<JSONValue> out;
    if (size == 0) {
        return out;
    }
    if (verbose) {
        LOG_INFO("[{}] stdout chunk({}) buf={}->{} head='{}'", label, size, buffer.size(), buffer.size() + size,
                 escapeHead(data, size, 80));
    } else {
        LOG_DEBUG("[{}] stdout chunk({}) buf={}->{} head='{}'", label, size, buffer.size(), buffer.size() + size,
                  escapeHead(data, size, 80));
    }
    buffer.append(data, size);
    decodeAvailable(out);
    return out;
}

void FrameDecoder::Reset() {
    buffer.clear();
    skipRemaining = 0;
}

void FrameDecoder::discardFront(std::size_t n) {
    n = std::min(n, buffer.size());
    buffer.erase(0, n);
    stats.bytesDiscarded += n;
}

void FrameDecoder::acceptBody(const std::string& body, std::vector<JSONValue>& out) {
    try {
        out.push_back(ParseJSON(body));
        ++stats.framesDecoded;
    } catch (const std::exception& e) {
        ++stats.framesDropped;
        LOG_ERROR("[{}] JSON parse error in frame body ({} bytes): {}", label, body.size(), e.what());
    }
}

void FrameDecoder::decodeAvailable(std::vector<JSONValue>& out) {
    bool frameInProgress = false;
    bool rawInProgress = false;
    while (!buffer.empty()) {
        if (skipRemaining > 0) {
            const std::size_t n = std::min(skipRemaining, buffer.size());
            discardFront(n);
            skipRemaining -= n;
            if (skipRemaining > 0) {
                break;
            }
            continue;
        }

        std::size_t first = 0;
        while (first < buffer.size() && std::isspace(static_cast<unsigned char>(buffer[first]))) ++first;
        if (first == buffer.size()) {
            break;
        }

        // Header framing wins once a separator exists; a raw value is taken only when it completes before it.
        const std::size_t sep = firstSeparator(buffer);
        if (buffer[first] == '{' || buffer[first] == '[') {
            ScanResult scan = ScanBalancedJson(buffer, first);
            if (scan.status == ScanStatus::Complete && (sep == std::string::npos || scan.end <= sep)) {
                std::string slice = buffer.substr(scan.begin, scan.end - scan.begin);
                buffer.erase(0, scan.end);
                if (verbose) {
                    LOG_INFO("[{}] header-less JSON value ({} bytes)", label, slice.size());
                } else {
                    LOG_DEBUG("[{}] header-less JSON value ({} bytes)", label, slice.size());
                }
                acceptBody(slice, out);
                continue;
            }
            if (sep == std::string::npos) {
                rawInProgress = scan.status == ScanStatus::Incomplete;
                break;
            }
        }

        IContentFramer::DecodeResult r = framer->tryDecodeEx(buffer);
        switch (r.status) {
            case IContentFramer::DecodeStatus::Ok: {
                if (verbose) {
                    LOG_INFO("[{}] stdout frame: Content-Length {}", label, r.declaredLength);
                } else {
                    LOG_DEBUG("[{}] stdout frame: Content-Length {}", label, r.declaredLength);
                }
                buffer.erase(0, r.bytesConsumed);
                acceptBody(r.payload.value_or(std::string()), out);
                continue;
            }
            case IContentFramer::DecodeStatus::Incomplete:
                frameInProgress = true;
                break;
            case IContentFramer::DecodeStatus::InvalidHeader: {
                const std::string head = buffer.substr(0, r.bytesConsumed);
                const bool blank = std::all_of(head.begin(), head.end(), [](unsigned char c) { return std::isspace(c) != 0; });
                if (!blank) {
                    if (verbose) {
                        LOG_INFO("[{}] ignoring non-protocol stdout before header: '{}'", label,
                                 escapeHead(head.data(), head.size(), 200));
                    } else {
                        LOG_DEBUG("[{}] ignoring non-protocol stdout before header: '{}'", label,
                                  escapeHead(head.data(), head.size(), 200));
                    }
                }
                discardFront(r.bytesConsumed);
                continue;
            }
            case IContentFramer::DecodeStatus::BodyTooLarge:
                LOG_WARN("[{}] dropping oversized frame (Content-Length {})", label, r.declaredLength);
                discardFront(r.bytesConsumed);
                skipRemaining = r.declaredLength;
                ++stats.framesDropped;
                continue;
            case IContentFramer::DecodeStatus::NoHeader:
                break;
        }
        break;
    }
    enforceBounds(frameInProgress, rawInProgress);
}

void FrameDecoder::enforceBounds(bool frameInProgress, bool rawInProgress) {
    // A header with an accepted length already bounds the buffer by maxContentLength.
    if (frameInProgress) {
        return;
    }
    if (buffer.size() > limits.maxBuffer) {
        LOG_WARN("[{}] stdout buffer exceeded {} bytes without a frame, keeping trailing {}", label,
                 limits.maxBuffer, limits.overflowKeep);
        discardFront(buffer.size() - limits.overflowKeep);
        return;
    }
    if (!rawInProgress && buffer.size() > limits.noiseThreshold && !hasLengthMarker(buffer)) {
        if (verbose) {
            LOG_INFO("[{}] stdout (no header yet) preview: '{}'", label, escapeHead(buffer.data(), buffer.size(), 128));
        } else {
            LOG_DEBUG("[{}] stdout (no header yet) preview: '{}'", label, escapeHead(buffer.data(), buffer.size(), 128));
        }
        discardFront(buffer.size() - limits.noiseKeep);
    }
}

} // namespace mcphost
