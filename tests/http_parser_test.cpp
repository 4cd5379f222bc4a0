/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/http_parser.hpp"
#include "sp/http_response.hpp"

#include <gtest/gtest.h>

using namespace sp::internal;

TEST(HttpParser, RequestHead)
{
    sp::HttpRequest r;
    ASSERT_TRUE(parse_request_head("GET /sig/url?x=1 HTTP/1.1\r\n"
                                   "Host: proxy\r\n"
                                   "Accept: image/webp\r\n"
                                   "accept: image/*", r));
    EXPECT_EQ(r.method, "GET");
    EXPECT_EQ(r.path, "/sig/url");
    EXPECT_EQ(r.query, "x=1");
    EXPECT_EQ(r.httpver, "HTTP/1.1");
    EXPECT_EQ(hdr_ci(r, "ACCEPT"), "image/webp, image/*");
    EXPECT_EQ(hdr_ci(r, "host"), "proxy");
    EXPECT_FALSE(has_hdr_ci(r.headers, "Cookie"));
}

TEST(HttpParser, RejectsBadRequestLines)
{
    sp::HttpRequest r;
    EXPECT_FALSE(parse_request_line("GET /a HTTP/2.0", r));
    EXPECT_FALSE(parse_request_line("GET http://x/ HTTP/1.1", r));
    EXPECT_FALSE(parse_request_line("GET /a HTTP/1.1 extra", r));
    EXPECT_FALSE(parse_request_line("G(T /a HTTP/1.1", r));
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\n folded: yes", r));
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\nBad Name: x", r));
}

TEST(HttpParser, ResponseHead)
{
    int status = 0;
    std::string reason;
    HeaderMap h;
    ASSERT_TRUE(parse_response_head("HTTP/1.1 302 Found\r\n"
                                    "Location: /next\r\n"
                                    "Cache-Control: a\r\n"
                                    "cache-control: b", status, reason, h));
    EXPECT_EQ(status, 302);
    EXPECT_EQ(reason, "Found");
    EXPECT_EQ(hdr_ci(h, "location"), "/next");
    EXPECT_EQ(hdr_ci(h, "Cache-Control"), "a, b");

    EXPECT_FALSE(parse_response_head("ICY 200 OK", status, reason, h));
    EXPECT_FALSE(parse_response_head("HTTP/1.1 abc OK", status, reason, h));
}

TEST(MediaType, Valid)
{
    std::string mt;
    ASSERT_TRUE(parse_media_type("image/png", mt));
    EXPECT_EQ(mt, "image/png");
    ASSERT_TRUE(parse_media_type(" Image/SVG+XML ; charset=utf-8", mt));
    EXPECT_EQ(mt, "image/svg+xml");
    ASSERT_TRUE(parse_media_type("video/mp4; codecs=\"avc1.42E01E, mp4a.40.2\"", mt));
    EXPECT_EQ(mt, "video/mp4");
    ASSERT_TRUE(parse_media_type("text/html;", mt));
    EXPECT_EQ(mt, "text/html");
}

TEST(MediaType, Invalid)
{
    std::string mt;
    EXPECT_FALSE(parse_media_type("what", mt));
    EXPECT_FALSE(parse_media_type("", mt));
    EXPECT_FALSE(parse_media_type("image/", mt));
    EXPECT_FALSE(parse_media_type("/png", mt));
    EXPECT_FALSE(parse_media_type("image/png; charset", mt));
    EXPECT_FALSE(parse_media_type("image/png; a=\"unterminated", mt));
    EXPECT_FALSE(parse_media_type("image png", mt));
}

TEST(ContentLength, Parse)
{
    std::int64_t v = -1;
    ASSERT_TRUE(parse_content_length("0", v));
    EXPECT_EQ(v, 0);
    ASSERT_TRUE(parse_content_length("5242880", v));
    EXPECT_EQ(v, 5242880);
    EXPECT_FALSE(parse_content_length("", v));
    EXPECT_FALSE(parse_content_length("-1", v));
    EXPECT_FALSE(parse_content_length("+1", v));
    EXPECT_FALSE(parse_content_length("1 2", v));
    EXPECT_FALSE(parse_content_length("99999999999999999999", v));
}

TEST(StatusText, Known)
{
    EXPECT_STREQ(sp::status_text(504), "Gateway Timeout");
    EXPECT_STREQ(sp::status_text(404), "Not Found");
}
