/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/glob_trie.hpp"
#include <stdexcept>

namespace sp::internal {

static bool valid_pattern(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x21 || u > 0x7E) return false;
    }
    return true;
}

bool GlobPathNode::add_path(const std::string& pattern) {
    if (!valid_pattern(pattern)) return false;

    GlobPathNode* cur = this;
    char prev = 0;
    for (char raw : pattern) {
        const char part = fold(raw);
        if (part == '*' && prev == '*') continue; // "**" is the same as "*"
        prev = part;

        const char c = (part == '*') ? kGlobChar : part;
        auto& slot = cur->_subtrees[c];
        if (!slot) {
            slot = std::make_unique<GlobPathNode>(_icase);
            slot->_node_char = c;
        }

        cur->_one_shot = (cur->_subtrees.size() == 1) ? slot.get() : nullptr;

        GlobPathNode* parent = cur;
        cur = slot.get();
        if (c == kGlobChar) {
            parent->_has_glob_child = true;
            cur->_is_glob = true;
        }
    }

    cur->_can_match = true;
    return true;
}

bool GlobPathNode::glob_consume(const std::string& s, std::size_t index) const {
    // Nothing follows the glob: it swallows the rest.
    if (_can_match) return true;

    // With a single follow-on char (e.g. ".../*/..."), skip ahead to it
    const bool one_shot_lookahead = (_one_shot != nullptr);
    bool one_shot_step = one_shot_lookahead;

    const std::size_t mlen = s.size();
    for (std::size_t i = index; i < mlen; ++i) {
        const char part = fold(s[i]);

        if (one_shot_step) {
            if (part != _one_shot->_node_char) continue;
            one_shot_step = false;
        }

        auto it = _subtrees.find(part);
        if (it != _subtrees.end() && it->second->check_path(s, i + 1)) {
            return true;
        }

        if (i == mlen - 1) {
            return _can_match;
        }

        // Branch did not pan out; keep consuming.
        if (one_shot_lookahead) one_shot_step = true;
    }

    return false;
}

bool GlobPathNode::check_path(const std::string& s, std::size_t index) const {
    const GlobPathNode* cur = this;
    const std::size_t mlen = s.size();
    for (std::size_t i = index; i < mlen; ++i) {
        const char part = fold(s[i]);
        if (part == kGlobChar) return false;

        // A glob child may match from here (including zero chars), try it first
        if (cur->_has_glob_child) {
            auto g = cur->_subtrees.find(kGlobChar);
            if (g != cur->_subtrees.end() && g->second->glob_consume(s, i)) {
                return true;
            }
        }

        if (cur->_one_shot) {
            // the single candidate was the glob we just tried
            if (cur->_one_shot->_node_char == kGlobChar) return false;
            if (cur->_one_shot->_node_char == part) {
                cur = cur->_one_shot;
                continue;
            }
            return false;
        }

        auto it = cur->_subtrees.find(part);
        if (it == cur->_subtrees.end()) return false;
        cur = it->second.get();
    }

    if (cur->_can_match || cur->_is_glob) return true;

    // trailing glob that was never entered matches zero chars
    if (cur->_has_glob_child) {
        auto g = cur->_subtrees.find(kGlobChar);
        return g != cur->_subtrees.end() && g->second->_can_match;
    }
    return false;
}

GlobTrie::GlobTrie(bool icase)
    : _root(std::make_unique<GlobPathNode>(icase)), _icase(icase) {}

bool GlobTrie::add_path(const std::string& pattern) {
    if (!_root) {
        throw std::logic_error("glob trie: add_path on a tree without a root node");
    }
    if (!_root->add_path(pattern)) return false;
    ++_count;
    return true;
}

bool GlobTrie::check_path(const std::string& s) const {
    if (!_root || _count == 0) return false;
    return _root->check_path(s, 0);
}

} // namespace sp::internal
