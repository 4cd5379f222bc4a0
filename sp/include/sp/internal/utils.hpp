/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace sp::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers
int  hexval(char c);
bool hex_to_bytes(const std::string& hex, std::string& out);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);
bool is_hex_string(const std::string& s);

// Base64. The url variant uses the RFC 4648 section 5 alphabet without padding.
std::string base64_encode(const std::string& data);
std::string base64url_encode(const std::string& data);
bool base64url_decode(const std::string& in, std::string& out);

// Lower-case copy (ASCII only)
std::string lower_copy(std::string s);

// Case-insensitive ASCII comparison
bool iequals(const std::string& a, const std::string& b);

} // namespace sp::internal
