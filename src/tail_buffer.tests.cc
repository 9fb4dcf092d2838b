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

#include "tail_buffer.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace rangetail;
using merge_mode_t = tail_buffer::merge_mode_t;

TEST_CASE("tail_buffer window keeps the whole file")
{
    tail_buffer tb;
    auto res = tb.merge(new_bytes{"hello\nworld", 11}, merge_mode_t::window, 10);

    REQUIRE(res.isOk());
    CHECK(res.unwrap() == "hello\nworld");
    CHECK(tb.get_data() == "hello\nworld");
}

TEST_CASE("tail_buffer whole file larger than the budget")
{
    SUBCASE("kept verbatim on a first load")
    {
        tail_buffer tb;
        auto res = tb.merge(
            new_bytes{"hello\nworld", 11}, merge_mode_t::window, 5, false);

        REQUIRE(res.isOk());
        CHECK(tb.get_data() == "hello\nworld");
    }
    SUBCASE("trimmed at a line boundary otherwise")
    {
        tail_buffer tb;
        auto res
            = tb.merge(new_bytes{"hello\nworld", 11}, merge_mode_t::window, 5);

        REQUIRE(res.isOk());
        CHECK(res.unwrap() == "hello\nworld");
        CHECK(tb.get_data() == "world");
    }
}

TEST_CASE("tail_buffer window clips the partial first line")
{
    tail_buffer tb;
    auto res = tb.merge(new_bytes{"lo\nworld\n", 12}, merge_mode_t::window, 10);

    REQUIRE(res.isOk());
    CHECK(res.unwrap() == "world\n");
    CHECK(tb.get_data() == "world\n");
}

TEST_CASE("tail_buffer window without a line terminator")
{
    tail_buffer tb;
    auto res = tb.merge(new_bytes{"abcdefgh", 100}, merge_mode_t::window, 10);

    REQUIRE(res.isOk());
    CHECK(tb.get_data() == "abcdefgh");
}

TEST_CASE("tail_buffer window response too long")
{
    tail_buffer tb;
    auto res = tb.merge(new_bytes{"hello\nworld", 20}, merge_mode_t::window, 5);

    REQUIRE(res.isErr());
    CHECK(res.unwrapErr() == malformed_kind_t::response_too_long);
    CHECK(tb.empty());
}

TEST_CASE("tail_buffer continuation drops the anchor byte")
{
    tail_buffer tb;

    REQUIRE(tb.merge(new_bytes{"a\n", 2}, merge_mode_t::window, 100).isOk());

    auto res1 = tb.merge(new_bytes{"\npart", 7}, merge_mode_t::continuation, 100);
    REQUIRE(res1.isOk());
    CHECK(res1.unwrap() == "part");

    auto res2
        = tb.merge(new_bytes{"tial\n", 11}, merge_mode_t::continuation, 100);
    REQUIRE(res2.isOk());
    CHECK(res2.unwrap() == "ial\n");
    CHECK(tb.get_data() == "a\npartial\n");
    CHECK(tb.line_count() == 2);
}

TEST_CASE("tail_buffer continuation with only the anchor byte")
{
    tail_buffer tb;

    REQUIRE(tb.merge(new_bytes{"abc\n", 4}, merge_mode_t::window, 100).isOk());
    for (int lpc = 0; lpc < 5; lpc++) {
        auto res = tb.merge(new_bytes{"\n", 4}, merge_mode_t::continuation, 100);

        REQUIRE(res.isOk());
        CHECK(res.unwrap().empty());
        CHECK(tb.get_data() == "abc\n");
    }
}

TEST_CASE("tail_buffer continuation trims at a line boundary")
{
    tail_buffer tb;

    REQUIRE(
        tb.merge(new_bytes{"world\n", 6}, merge_mode_t::window, 10).isOk());

    auto res
        = tb.merge(new_bytes{"\nmore\n", 11}, merge_mode_t::continuation, 10);
    REQUIRE(res.isOk());
    CHECK(res.unwrap() == "more\n");
    CHECK(tb.get_data() == "more\n");
    CHECK(tb.size() <= 10);
}

TEST_CASE("tail_buffer trim_to")
{
    SUBCASE("nothing to do")
    {
        tail_buffer tb;

        REQUIRE(tb.merge(new_bytes{"abc", 3}, merge_mode_t::window, 10).isOk());
        tb.trim_to(3);
        CHECK(tb.get_data() == "abc");
    }
    SUBCASE("terminator right before the cut")
    {
        tail_buffer tb;

        REQUIRE(
            tb.merge(new_bytes{"abc\ndef", 7}, merge_mode_t::window, 10).isOk());
        tb.trim_to(3);
        CHECK(tb.get_data() == "def");
    }
    SUBCASE("terminator after the cut")
    {
        tail_buffer tb;

        REQUIRE(tb.merge(new_bytes{"ab\ncd\nef", 8}, merge_mode_t::window, 10)
                    .isOk());
        tb.trim_to(6);
        CHECK(tb.get_data() == "cd\nef");
    }
    SUBCASE("no terminator")
    {
        tail_buffer tb;

        REQUIRE(tb.merge(new_bytes{"abcdefghij", 10}, merge_mode_t::window, 10)
                    .isOk());
        tb.trim_to(4);
        CHECK(tb.get_data() == "ghij");
    }
}

TEST_CASE("tail_buffer line_count")
{
    tail_buffer tb;

    CHECK(tb.line_count() == 0);
    REQUIRE(tb.merge(new_bytes{"a\nb", 3}, merge_mode_t::window, 10).isOk());
    CHECK(tb.line_count() == 2);
    tb.clear();
    CHECK(tb.empty());
}
