/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/hmac.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace sp::internal {

bool hmac_sha1_bin(const std::string& key_bin,
                   const std::string& msg,
                   std::string& out_bin)
{
    unsigned int mac_len = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned char* p = HMAC(EVP_sha1(),
                            key_bin.data(), (int)key_bin.size(),
                            reinterpret_cast<const unsigned char*>(msg.data()),
                            msg.size(),
                            mac, &mac_len);
    if (!p || mac_len != kMacLen) return false;
    out_bin.assign(reinterpret_cast<const char*>(mac), kMacLen);
    return true;
}

} // namespace sp::internal
