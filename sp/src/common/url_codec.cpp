/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/url_codec.hpp"
#include "sp/internal/hmac.hpp"
#include "sp/internal/utils.hpp"

#include <openssl/crypto.h>

namespace sp::internal {

const char* signature_error_name(SignatureError e) {
    switch (e) {
    case SignatureError::None:         return "NONE";
    case SignatureError::Malformed:    return "MALFORMED_TOKEN";
    case SignatureError::BadSignature: return "BAD_SIGNATURE";
    }
    return "UNKNOWN";
}

std::string encode_url_b64(const std::string& key, const std::string& url) {
    std::string mac;
    if (!hmac_sha1_bin(key, url, mac)) return {};
    return "/" + base64url_encode(mac) + "/" + base64url_encode(url);
}

std::string encode_url_hex(const std::string& key, const std::string& url) {
    std::string mac;
    if (!hmac_sha1_bin(key, url, mac)) return {};
    return "/" + bytes_to_hex(reinterpret_cast<const unsigned char*>(mac.data()), mac.size()) +
           "/" + bytes_to_hex(reinterpret_cast<const unsigned char*>(url.data()), url.size());
}

DecodeResult decode_url(const std::string& key,
                        const std::string& enc_sig,
                        const std::string& enc_url)
{
    DecodeResult dr;
    if (enc_sig.empty() || enc_url.empty()) {
        dr.error = SignatureError::Malformed;
        return dr;
    }

    std::string sig_bin, url;
    const bool hex = enc_sig.size() == kMacLen * 2 &&
                     is_hex_string(enc_sig) && is_hex_string(enc_url);
    bool decoded = false;
    if (hex) {
        decoded = hex_to_bytes(enc_sig, sig_bin) && hex_to_bytes(enc_url, url);
    } else {
        // Only the canonical spelling of each segment is accepted
        decoded = base64url_decode(enc_sig, sig_bin) && base64url_decode(enc_url, url) &&
                  base64url_encode(sig_bin) == enc_sig && base64url_encode(url) == enc_url;
    }
    if (!decoded || sig_bin.size() != kMacLen || url.empty()) {
        dr.error = SignatureError::Malformed;
        return dr;
    }

    std::string expected;
    if (!hmac_sha1_bin(key, url, expected) ||
        CRYPTO_memcmp(expected.data(), sig_bin.data(), kMacLen) != 0)
    {
        dr.error = SignatureError::BadSignature;
        return dr;
    }

    dr.ok = true;
    dr.url = std::move(url);
    return dr;
}

} // namespace sp::internal
