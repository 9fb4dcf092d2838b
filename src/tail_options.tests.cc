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

#include "tail_options.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace rangetail;
using namespace std::chrono_literals;

TEST_CASE("tail_options defaults")
{
    tail_options opts;

    CHECK(opts.to_load_bytes == 30 * 1024);
    CHECK(opts.to_poll_interval == 1000ms);
    CHECK_FALSE(opts.to_paused);
    CHECK_FALSE(opts.to_debug);
    CHECK_FALSE(opts.to_head_probe);
    CHECK(opts.to_stall_timeout == 30s);
}

TEST_CASE("tail_options validate")
{
    SUBCASE("valid")
    {
        auto opts = tail_options()
                        .with_url("https://example.com/app.log")
                        .with_load_bytes(1024)
                        .with_poll_interval(250ms);

        CHECK(opts.validate().isOk());
    }
    SUBCASE("missing url")
    {
        auto res = tail_options().validate();

        REQUIRE(res.isErr());
        CHECK(res.unwrapErr() == "url must not be empty");
    }
    SUBCASE("not http")
    {
        auto res = tail_options().with_url("file:///var/log/syslog").validate();

        REQUIRE(res.isErr());
    }
    SUBCASE("zero load bytes")
    {
        auto res = tail_options()
                       .with_url("http://example.com/app.log")
                       .with_load_bytes(0)
                       .validate();

        REQUIRE(res.isErr());
    }
    SUBCASE("zero poll interval")
    {
        auto res = tail_options()
                       .with_url("http://example.com/app.log")
                       .with_poll_interval(0ms)
                       .validate();

        REQUIRE(res.isErr());
    }
    SUBCASE("zero stall timeout")
    {
        auto res = tail_options()
                       .with_url("http://example.com/app.log")
                       .with_stall_timeout(0s)
                       .validate();

        REQUIRE(res.isErr());
        CHECK(res.unwrapErr()
              == "stall-timeout must be a positive integer, not 0");
    }
    SUBCASE("zero connect timeout")
    {
        auto res = tail_options()
                       .with_url("http://example.com/app.log")
                       .with_connect_timeout(0s)
                       .validate();

        REQUIRE(res.isErr());
    }
}

TEST_CASE("validate_load_bytes")
{
    {
        auto res = validate_load_bytes(512);
        REQUIRE(res.isOk());
        CHECK(res.unwrap() == 512);
    }
    {
        auto res = validate_load_bytes(-1);
        REQUIRE(res.isErr());
        CHECK(res.unwrapErr() == "load-bytes must be a positive integer, not -1");
    }
    CHECK(validate_load_bytes(0).isErr());
}

TEST_CASE("validate_poll_interval")
{
    {
        auto res = validate_poll_interval(1500);
        REQUIRE(res.isOk());
        CHECK(res.unwrap() == 1500ms);
    }
    CHECK(validate_poll_interval(0).isErr());
    CHECK(validate_poll_interval(-100).isErr());
}
