/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <map>
#include <memory>
#include <string>
#include <cstddef>

namespace sp::internal {

/**
 * Character-level trie over printable ASCII patterns where '*' matches a run
 * of zero or more characters. Built once at startup, then only read; lookups
 * from many threads at once are safe because they never modify a node.
 *
 * Matching a single '*' followed by a distinctive suffix is linear in the
 * candidate length. Candidates with long ambiguous runs against several
 * possible continuations may be retried from many positions (worst case
 * quadratic per wildcard).
 */
class GlobPathNode {
public:
    explicit GlobPathNode(bool icase) : _icase(icase) {}

    GlobPathNode(const GlobPathNode&) = delete;
    GlobPathNode& operator=(const GlobPathNode&) = delete;

    // Insert a pattern below this node. Returns false (tree unchanged) if the
    // pattern is empty or holds a byte outside 0x21..0x7E.
    bool add_path(const std::string& pattern);

    // Match s[index..] against the patterns below this node.
    bool check_path(const std::string& s, std::size_t index) const;

private:
    // Wildcard key; disjoint from every printable character.
    static constexpr char kGlobChar = '\x01';

    char fold(char c) const {
        if (_icase && c >= 'A' && c <= 'Z') return static_cast<char>(c + 32);
        return c;
    }

    bool glob_consume(const std::string& s, std::size_t index) const;

    std::map<char, std::unique_ptr<GlobPathNode>> _subtrees;
    // The only child, while there is exactly one
    const GlobPathNode* _one_shot = nullptr;
    char _node_char = 0;
    bool _is_glob = false;
    // End of some pattern, even if longer patterns continue from here
    bool _can_match = false;
    bool _has_glob_child = false;
    bool _icase;
};

// Owning handle for a tree of GlobPathNode.
class GlobTrie {
public:
    explicit GlobTrie(bool icase);

    GlobTrie(GlobTrie&&) noexcept = default;
    GlobTrie& operator=(GlobTrie&&) noexcept = default;

    // Throws std::logic_error when the root was never built (moved-from trie).
    bool add_path(const std::string& pattern);
    bool check_path(const std::string& s) const;

    bool icase() const { return _icase; }
    std::size_t size() const { return _count; }
    bool empty() const { return _count == 0; }

private:
    std::unique_ptr<GlobPathNode> _root;
    std::size_t _count = 0;
    bool _icase;
};

} // namespace sp::internal
