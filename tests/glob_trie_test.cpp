/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/glob_trie.hpp"
#include "sp/internal/host_matcher.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>

using sp::internal::GlobTrie;
using sp::internal::HostMatcher;

TEST(GlobTrie, Literal)
{
    GlobTrie t(true);
    ASSERT_TRUE(t.add_path("example.com"));
    EXPECT_TRUE(t.check_path("example.com"));
    EXPECT_FALSE(t.check_path("example.co"));
    EXPECT_FALSE(t.check_path("example.com.au"));
    EXPECT_FALSE(t.check_path("www.example.com"));
}

TEST(GlobTrie, LeadingWildcard)
{
    GlobTrie t(true);
    ASSERT_TRUE(t.add_path("*.example.com"));
    EXPECT_TRUE(t.check_path("www.example.com"));
    EXPECT_TRUE(t.check_path("a.b.example.com"));
    EXPECT_TRUE(t.check_path(".example.com"));
    EXPECT_FALSE(t.check_path("example.com"));
    EXPECT_FALSE(t.check_path("www.example.org"));
    EXPECT_FALSE(t.check_path("www.example.com.evil"));
}

TEST(GlobTrie, MiddleWildcard)
{
    GlobTrie t(true);
    ASSERT_TRUE(t.add_path("img*.example.com"));
    EXPECT_TRUE(t.check_path("img.example.com"));
    EXPECT_TRUE(t.check_path("img01.example.com"));
    EXPECT_TRUE(t.check_path("img.cdn.example.com"));
    EXPECT_FALSE(t.check_path("im.example.com"));
    EXPECT_FALSE(t.check_path("img01.example.org"));
}

TEST(GlobTrie, TrailingWildcardMatchesZeroChars)
{
    GlobTrie t(true);
    ASSERT_TRUE(t.add_path("abc*"));
    EXPECT_TRUE(t.check_path("abc"));
    EXPECT_TRUE(t.check_path("abcd"));
    EXPECT_TRUE(t.check_path("abc.def/ghi"));
    EXPECT_FALSE(t.check_path("ab"));
    EXPECT_FALSE(t.check_path("xabc"));
}

TEST(GlobTrie, RepeatedWildcardsCollapse)
{
    GlobTrie t(true);
    ASSERT_TRUE(t.add_path("a**b"));
    EXPECT_TRUE(t.check_path("ab"));
    EXPECT_TRUE(t.check_path("axxb"));
    EXPECT_TRUE(t.check_path("axbxb"));
    EXPECT_FALSE(t.check_path("axbx"));
}

TEST(GlobTrie, CaseFolding)
{
    GlobTrie icase(true);
    ASSERT_TRUE(icase.add_path("Example.COM"));
    EXPECT_TRUE(icase.check_path("example.com"));
    EXPECT_TRUE(icase.check_path("EXAMPLE.com"));

    GlobTrie icase2(true);
    ASSERT_TRUE(icase2.add_path("example.com"));
    EXPECT_TRUE(icase2.check_path("Example.COM"));

    GlobTrie exact(false);
    ASSERT_TRUE(exact.add_path("Example.COM"));
    EXPECT_TRUE(exact.check_path("Example.COM"));
    EXPECT_FALSE(exact.check_path("example.com"));
}

TEST(GlobTrie, SharedPrefixes)
{
    GlobTrie t(true);
    ASSERT_TRUE(t.add_path("foo.example.com"));
    ASSERT_TRUE(t.add_path("foo.example.net"));
    ASSERT_TRUE(t.add_path("foo*"));
    EXPECT_EQ(t.size(), 3u);
    EXPECT_TRUE(t.check_path("foo.example.com"));
    EXPECT_TRUE(t.check_path("foo.example.net"));
    EXPECT_TRUE(t.check_path("foobar"));
    EXPECT_TRUE(t.check_path("foo"));
    EXPECT_FALSE(t.check_path("fo"));
}

TEST(GlobTrie, PrefixIsNotAMatch)
{
    GlobTrie t(true);
    ASSERT_TRUE(t.add_path("example.com"));
    ASSERT_TRUE(t.add_path("example.com.au"));
    EXPECT_TRUE(t.check_path("example.com"));
    EXPECT_TRUE(t.check_path("example.com.au"));
    EXPECT_FALSE(t.check_path("example.com.a"));
}

TEST(GlobTrie, RejectsUnprintablePatterns)
{
    GlobTrie t(true);
    EXPECT_FALSE(t.add_path(""));
    EXPECT_FALSE(t.add_path("exa mple.com"));
    EXPECT_FALSE(t.add_path(std::string("a\x01") + "b"));
    EXPECT_FALSE(t.add_path("caf\xc3\xa9.com"));
    EXPECT_TRUE(t.empty());
    EXPECT_FALSE(t.check_path("exa mple.com"));
}

TEST(GlobTrie, SentinelInCandidateNeverMatches)
{
    GlobTrie t(true);
    ASSERT_TRUE(t.add_path("a*"));
    EXPECT_TRUE(t.check_path("ab"));
    EXPECT_FALSE(t.check_path(std::string("\x01")));
}

TEST(GlobTrie, EmptyTreeMatchesNothing)
{
    GlobTrie t(true);
    EXPECT_FALSE(t.check_path("example.com"));
    EXPECT_FALSE(t.check_path(""));
}

TEST(GlobTrie, MovedFromTreeThrowsOnInsert)
{
    GlobTrie a(true);
    ASSERT_TRUE(a.add_path("example.com"));
    GlobTrie b(std::move(a));
    EXPECT_TRUE(b.check_path("example.com"));
    EXPECT_THROW(a.add_path("other.com"), std::logic_error);
    EXPECT_FALSE(a.check_path("example.com"));
}

TEST(HostMatcher, HostAndPathPatterns)
{
    HostMatcher m({"*.cdn.example.com", "Images.Example.org/public/*"});
    EXPECT_EQ(m.size(), 2u);
    EXPECT_TRUE(m.matches("img.cdn.example.com", "/a.png"));
    EXPECT_TRUE(m.matches("images.example.org", "/public/cat.gif"));
    EXPECT_FALSE(m.matches("images.example.org", "/private/cat.gif"));
    // path part is case-sensitive
    EXPECT_FALSE(m.matches("images.example.org", "/PUBLIC/cat.gif"));
    EXPECT_FALSE(m.matches("example.com", "/"));
    EXPECT_FALSE(m.matches("", "/"));
}

TEST(HostMatcher, InvalidPatternThrows)
{
    EXPECT_THROW(HostMatcher({"good.example.com", "bad pattern"}), std::runtime_error);
    EXPECT_THROW(HostMatcher({"/only/a/path"}), std::runtime_error);
}

TEST(HostMatcher, EmptyMatcher)
{
    HostMatcher m;
    EXPECT_TRUE(m.empty());
    EXPECT_FALSE(m.matches("example.com", "/"));
}
