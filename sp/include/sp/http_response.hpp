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
#include <vector>
#include <utility>
#include <cstddef>

namespace sp {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * Sink for one response. write_head is called exactly once, before any
 * write_body. abort() tells the transport that the response cannot be
 * completed and the connection must be cut instead of finished.
 */
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    // headers must include Content-Length when a body follows
    virtual bool write_head(int status, const HeaderList& headers) = 0;
    virtual bool write_body(const char* data, std::size_t len) = 0;
    virtual void abort() = 0;
};

const char* status_text(int status);

} // namespace sp
