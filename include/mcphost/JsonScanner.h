//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonScanner.h
// Purpose: Depth-counting scanner that isolates one balanced JSON object/array from a byte buffer
//==========================================================================================================
#pragma once

#include <cstddef>
#include <string>

namespace mcphost {

enum class ScanStatus {
    Complete,   // [begin, end) holds a balanced value
    Incomplete, // an opener was found but the value is not closed yet
    NotJson     // first non-whitespace byte is not '{' or '['; begin points at it
};

struct ScanResult {
    ScanStatus status{ScanStatus::NotJson};
    std::size_t begin{0};
    std::size_t end{0};
};

//==========================================================================================================
// ScanBalancedJson
// Purpose: Skips whitespace from `from`, requires '{' or '[', then tracks bracket depth outside of
//          string literals (honouring backslash escapes) until depth returns to zero.
// Notes:
//   The scanner only balances brackets; it does not validate the value. Callers parse the slice.
//   An all-whitespace tail reports Incomplete with begin == buffer.size().
//==========================================================================================================
ScanResult ScanBalancedJson(const std::string& buffer, std::size_t from = 0);

} // namespace mcphost
