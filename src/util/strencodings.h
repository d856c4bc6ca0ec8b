// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_UTIL_STRENCODINGS_H
#define POOLNODE_UTIL_STRENCODINGS_H

#include <string>

/**
 * Escape a string for use inside a JSON string literal
 *
 * Quotes, backslashes and every control character below 0x20 are escaped;
 * the ones without a short form are written as \u00XX.
 */
std::string EscapeJSON(const std::string& str);

#endif // POOLNODE_UTIL_STRENCODINGS_H
