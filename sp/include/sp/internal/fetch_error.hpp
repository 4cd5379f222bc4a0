/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once

namespace sp::internal {

enum class FetchError {
    None,
    Timeout,               // request deadline elapsed
    TooManyRedirects,
    BlockedRedirect,       // a Location target failed URL validation
    DeniedAddress,         // every resolved address was filtered
    MalformedContentType,
    DisallowedContentType,
    SizeExceeded,
    UpstreamUnavailable,   // resolve/connect/TLS/protocol failure
    UpstreamStatus         // upstream answered with an unusable status
};

const char* fetch_error_name(FetchError e);

} // namespace sp::internal
