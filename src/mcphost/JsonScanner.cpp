//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonScanner.cpp
// Purpose: Balanced JSON scanner used for header-less fallback framing
//==========================================================================================================

#include "mcphost/JsonScanner.h"

namespace mcphost {

namespace {
bool isJsonWs(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}
} // namespace

ScanResult ScanBalancedJson(const std::string& buffer, std::size_t from) {
    ScanResult r;
    std::size_t i = from;
    while (i < buffer.size() && isJsonWs(buffer[i])) ++i;
    r.begin = i;
    if (i >= buffer.size()) {
        r.status = ScanStatus::Incomplete;
        return r;
    }
    if (buffer[i] != '{' && buffer[i] != '[') {
        r.status = ScanStatus::NotJson;
        return r;
    }

    std::size_t depth = 0;
    bool inString = false;
    bool escaped = false;
    for (; i < buffer.size(); ++i) {
        const char ch = buffer[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                inString = false;
            }
            continue;
        }
        if (ch == '"') {
            inString = true;
        } else if (ch == '{' || ch == '[') {
            ++depth;
        } else if (ch == '}' || ch == ']') {
            --depth;
            if (depth == 0) {
                r.status = ScanStatus::Complete;
                r.end = i + 1;
                return r;
            }
        }
    }
    r.status = ScanStatus::Incomplete;
    return r;
}

} // namespace mcphost
