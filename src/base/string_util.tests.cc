/**
 * Copyright (c) 2025, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "base/string_util.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("startswith")
{
    std::string hw("hello");

    CHECK(startswith(hw, "he") == true);
    CHECK(startswith(hw, "hello") == true);
    CHECK(startswith(hw, "hello!") == false);
    CHECK(startswith(hw, "lo") == false);
}

TEST_CASE("trim")
{
    CHECK(trim("") == "");
    CHECK(trim("  ") == "");
    CHECK(trim(" bytes 0-1/2\r\n") == "bytes 0-1/2");
    CHECK(trim("abc") == "abc");
    CHECK(trim(" caf\xc3\xa9\xa0") == "caf\xc3\xa9\xa0");
    CHECK(trim("\xff value \xff") == "\xff value \xff");
}

TEST_CASE("strcaseeq")
{
    CHECK(strcaseeq("Content-Range", "content-range"));
    CHECK_FALSE(strcaseeq("Content-Range", "Content-Length"));
    CHECK_FALSE(strcaseeq("abc", "abcd"));
}

TEST_CASE("is_http_url")
{
    CHECK(is_http_url("http://example.com/log.txt"));
    CHECK(is_http_url("HTTPS://example.com:8080/var/log/syslog"));
    CHECK_FALSE(is_http_url("ftp://example.com/log.txt"));
    CHECK_FALSE(is_http_url("/var/log/syslog"));
    CHECK_FALSE(is_http_url("http://"));
}

TEST_CASE("scan_unsigned")
{
    {
        auto res = scan_unsigned("12345");
        REQUIRE(res.isOk());
        CHECK(res.unwrap() == 12345);
    }
    {
        auto res = scan_unsigned("0");
        REQUIRE(res.isOk());
        CHECK(res.unwrap() == 0);
    }
    CHECK(scan_unsigned("").isErr());
    CHECK(scan_unsigned("-1").isErr());
    CHECK(scan_unsigned("+1").isErr());
    CHECK(scan_unsigned("12a").isErr());
    CHECK(scan_unsigned(" 12").isErr());
    CHECK(scan_unsigned("*").isErr());
    CHECK(scan_unsigned("99999999999999999999999").isErr());
}
