//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length framer tolerant of LF-only separators used by non-conforming servers
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcphost/ContentFramer.h"

namespace mcphost {

namespace {

// Locates "content-length:" anywhere in the header block (case-insensitive) and parses the digits
// after optional whitespace. Returns false when no usable field exists.
bool findContentLength(const std::string& header, unsigned long long& out, bool& overflow) {
    static const std::string key = "content-length:";
    std::string lower(header.size(), '\0');
    std::transform(header.begin(), header.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    std::size_t pos = 0;
    while ((pos = lower.find(key, pos)) != std::string::npos) {
        std::size_t i = pos + key.size();
        while (i < lower.size() && std::isspace(static_cast<unsigned char>(lower[i]))) ++i;
        std::size_t digitsStart = i;
        unsigned long long v = 0;
        overflow = false;
        while (i < lower.size() && std::isdigit(static_cast<unsigned char>(lower[i]))) {
            unsigned int d = static_cast<unsigned int>(lower[i] - '0');
            if (v > (std::numeric_limits<unsigned long long>::max() - d) / 10) {
                overflow = true;
            } else {
                v = v * 10 + d;
            }
            ++i;
        }
        if (i > digitsStart) {
            out = v;
            return true;
        }
        pos = i;
    }
    return false;
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t headerEnd = buffer.find("\r\n\r\n");
        std::size_t sepLen = 4;
        std::size_t lfEnd = buffer.find("\n\n");
        if (lfEnd != std::string::npos && (headerEnd == std::string::npos || lfEnd < headerEnd)) {
            headerEnd = lfEnd;
            sepLen = 2;
        }
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::NoHeader, std::nullopt, 0 };
        }

        const std::size_t headerAndSep = headerEnd + sepLen;
        const std::string header = buffer.substr(0, headerEnd);
        unsigned long long v64 = 0;
        bool overflow = false;
        if (!findContentLength(header, v64, overflow)) {
            bool blank = std::all_of(header.begin(), header.end(), [](unsigned char ch){ return std::isspace(ch) != 0; });
            if (!blank) {
                LOG_DEBUG("Missing Content-Length header (dropping {} header bytes)", headerAndSep);
            }
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }
        if (overflow || v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
            LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
            DecodeResult r{ DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
            r.declaredLength = overflow ? std::numeric_limits<std::size_t>::max() : static_cast<std::size_t>(v64);
            return r;
        }

        const std::size_t contentLength = static_cast<std::size_t>(v64);
        const std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            DecodeResult r{ DecodeStatus::Incomplete, std::nullopt, 0 };
            r.frameSize = frameTotal;
            r.declaredLength = contentLength;
            return r;
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        DecodeResult r{ DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
        r.frameSize = frameTotal;
        r.declaredLength = contentLength;
        return r;
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace mcphost
