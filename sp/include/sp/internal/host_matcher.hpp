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
#include "sp/internal/glob_trie.hpp"

namespace sp::internal {

/**
 * Allow/deny list of glob patterns.
 *   "*.example.org"        host glob, case-insensitive
 *   "example.org/img/*"    host/path glob, host part case-insensitive,
 *                          path part case-sensitive
 */
class HostMatcher {
public:
    HostMatcher();

    // Throws std::runtime_error naming the first unusable pattern.
    explicit HostMatcher(const std::vector<std::string>& patterns);

    bool add_pattern(const std::string& pattern);

    // host is expected lower-case; path starts with '/'.
    bool matches(const std::string& host, const std::string& path) const;

    bool empty() const { return _hosts.empty() && _paths.empty(); }
    std::size_t size() const { return _hosts.size() + _paths.size(); }

private:
    GlobTrie _hosts;
    GlobTrie _paths;
};

} // namespace sp::internal
