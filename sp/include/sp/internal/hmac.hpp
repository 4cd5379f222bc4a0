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

namespace sp::internal {

constexpr std::size_t kMacLen = 20;

// HMAC-SHA1(key, msg) -> 20 bytes (binary) as std::string
bool hmac_sha1_bin(const std::string& key_bin,
                   const std::string& msg,
                   std::string& out_bin);

} // namespace sp::internal
