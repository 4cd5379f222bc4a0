/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/host_matcher.hpp"
#include "sp/internal/utils.hpp"
#include <stdexcept>

namespace sp::internal {

HostMatcher::HostMatcher()
    : _hosts(/*icase=*/true), _paths(/*icase=*/false) {}

HostMatcher::HostMatcher(const std::vector<std::string>& patterns)
    : HostMatcher()
{
    for (const auto& p : patterns) {
        if (!add_pattern(p)) {
            throw std::runtime_error("invalid host pattern: '" + p + "'");
        }
    }
}

bool HostMatcher::add_pattern(const std::string& pattern) {
    const std::size_t slash = pattern.find('/');
    if (slash == std::string::npos) {
        return _hosts.add_path(pattern);
    }
    if (slash == 0) return false;
    return _paths.add_path(lower_copy(pattern.substr(0, slash)) + pattern.substr(slash));
}

bool HostMatcher::matches(const std::string& host, const std::string& path) const {
    if (host.empty()) return false;
    if (_hosts.check_path(host)) return true;
    if (_paths.empty()) return false;
    return _paths.check_path(lower_copy(host) + (path.empty() ? "/" : path));
}

} // namespace sp::internal
