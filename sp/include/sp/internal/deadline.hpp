/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <limits>

namespace sp::internal {

// One wall-clock budget shared by every step of a fetch.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    explicit Deadline(int timeout_ms)
        : _at(clock::now() + std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0)) {}

    // Remaining milliseconds, clamped to [0, INT_MAX].
    [[nodiscard]] int remaining_ms() const noexcept {
        using namespace std::chrono;
        const auto now = clock::now();
        if (now >= _at) return 0;
        const auto ms = duration_cast<milliseconds>(_at - now).count();
        if (ms <= 0) return 0;
        if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
            return std::numeric_limits<int>::max();
        }
        return static_cast<int>(ms);
    }

    [[nodiscard]] bool expired() const noexcept { return remaining_ms() <= 0; }
    clock::time_point at() const noexcept { return _at; }

private:
    clock::time_point _at;
};

} // namespace sp::internal
