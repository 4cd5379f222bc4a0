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

namespace sp::internal {

enum class SignatureError {
    None,
    Malformed,     // token segments do not decode, or the tag has the wrong size
    BadSignature   // well-formed, but the tag does not authenticate the url
};

struct DecodeResult {
    bool ok = false;
    SignatureError error = SignatureError::None;
    std::string url;
};

const char* signature_error_name(SignatureError e);

/**
 * Proxy path encoding: "/<sig>/<url>", where <sig> is HMAC-SHA1(key, url).
 * Both parts are either base64url (no padding) or lowercase hex.
 */
std::string encode_url_b64(const std::string& key, const std::string& url);
std::string encode_url_hex(const std::string& key, const std::string& url);

// Default encoding (base64url).
inline std::string encode_url(const std::string& key, const std::string& url) {
    return encode_url_b64(key, url);
}

// Verify the two path segments. Hex is assumed when both segments are hex
// and the signature has the hex length of a tag, base64url otherwise.
DecodeResult decode_url(const std::string& key,
                        const std::string& enc_sig,
                        const std::string& enc_url);

} // namespace sp::internal
