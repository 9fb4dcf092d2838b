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

#include "range_response.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace rangetail;

static http_response
make_response(long status,
              std::string body,
              http_headers headers = {},
              std::string reason = "")
{
    http_response retval;

    retval.hr_status = status;
    retval.hr_reason = std::move(reason);
    retval.hr_headers = std::move(headers);
    retval.hr_body = std::move(body);

    return retval;
}

TEST_CASE("parse_content_range")
{
    SUBCASE("full range")
    {
        auto res = parse_content_range("bytes 99-120/121");
        REQUIRE(res.isOk());
        auto cr = res.unwrap();
        CHECK(cr.cr_start.value() == 99);
        CHECK(cr.cr_end.value() == 120);
        CHECK(cr.cr_total.value() == 121);
    }
    SUBCASE("unsatisfied range")
    {
        auto res = parse_content_range("bytes */47");
        REQUIRE(res.isOk());
        auto cr = res.unwrap();
        CHECK_FALSE(cr.cr_start.has_value());
        CHECK_FALSE(cr.cr_end.has_value());
        CHECK(cr.cr_total.value() == 47);
    }
    SUBCASE("without a unit")
    {
        auto res = parse_content_range("0-9/10");
        REQUIRE(res.isOk());
        CHECK(res.unwrap().cr_total.value() == 10);
    }
    SUBCASE("unknown total")
    {
        CHECK(parse_content_range("bytes 0-9/*").isErr());
    }
    SUBCASE("missing total")
    {
        CHECK(parse_content_range("bytes 0-9").isErr());
    }
    SUBCASE("garbage")
    {
        CHECK(parse_content_range("bytes a-b/10").isErr());
        CHECK(parse_content_range("bytes 0-9/ten").isErr());
        CHECK(parse_content_range("bytes 09/10").isErr());
        CHECK(parse_content_range("").isErr());
    }
}

TEST_CASE("interpret first load")
{
    auto plan = range_planner::plan(std::nullopt, 10);

    SUBCASE("206 with content")
    {
        auto resp = make_response(
            206, "lo\nworld\n", {{"Content-Range", "bytes 3-11/12"}});
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<new_bytes>());
        CHECK(outcome.get<new_bytes>().nb_body == "lo\nworld\n");
        CHECK(outcome.get<new_bytes>().nb_reported_total_size == 12);
    }
    SUBCASE("200 for the whole file")
    {
        auto resp = make_response(
            200, "hello\nworld", {{"Content-Length", "11"}});
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<new_bytes>());
        CHECK(outcome.get<new_bytes>().nb_reported_total_size == 11);
    }
    SUBCASE("200 without a Content-Length")
    {
        auto resp = make_response(200, "abc\n");
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<new_bytes>());
        CHECK(outcome.get<new_bytes>().nb_reported_total_size == 4);
    }
    SUBCASE("200 with a bad Content-Length")
    {
        auto resp = make_response(200, "abc\n", {{"Content-Length", "-4"}});
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<malformed_response>());
        CHECK(outcome.get<malformed_response>().mr_kind
              == malformed_kind_t::invalid_header);
    }
    SUBCASE("one byte file is not an anchor")
    {
        auto resp
            = make_response(206, "x", {{"Content-Range", "bytes 0-0/1"}});
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<new_bytes>());
        CHECK(outcome.get<new_bytes>().nb_body == "x");
    }
    SUBCASE("416 means the file is empty")
    {
        auto resp
            = make_response(416, "", {{"Content-Range", "bytes */0"}});
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<truncated>());
        CHECK(outcome.get<truncated>().t_new_size.value() == 0);
    }
}

TEST_CASE("interpret anchored request")
{
    auto plan = range_planner::plan(100, 10);

    SUBCASE("anchor byte only")
    {
        auto resp = make_response(
            206, "\n", {{"Content-Range", "bytes 99-99/100"}});
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<unchanged>());
        CHECK(outcome.get<unchanged>().u_reported_total_size == 100);
    }
    SUBCASE("new content")
    {
        auto resp = make_response(
            206, "\nabc\n", {{"content-range", "bytes 99-103/104"}});
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<new_bytes>());
        CHECK(outcome.get<new_bytes>().nb_body == "\nabc\n");
        CHECK(outcome.get<new_bytes>().nb_reported_total_size == 104);
    }
    SUBCASE("200 instead of 206")
    {
        auto resp = make_response(
            200, "whole file\n", {{"Content-Length", "11"}}, "OK");
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<malformed_response>());
        const auto& mr = outcome.get<malformed_response>();
        CHECK(mr.mr_kind == malformed_kind_t::non_206);
        CHECK(mr.mr_status == 200);
        CHECK(mr.mr_body_length == 11);
        CHECK(mr.to_message()
              == "server did not send a partial response -- 200 OK");
    }
    SUBCASE("416 is a truncation")
    {
        auto resp = make_response(416, "", {{"Content-Range", "bytes */47"}});
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<truncated>());
        CHECK(outcome.get<truncated>().t_new_size.value() == 47);
    }
    SUBCASE("416 without a total")
    {
        auto resp = make_response(416, "");
        auto outcome = range_response_interpreter::interpret(resp, plan);

        REQUIRE(outcome.is<truncated>());
        CHECK_FALSE(outcome.get<truncated>().t_new_size.has_value());
    }
}

TEST_CASE("interpret 206 without a Content-Range")
{
    auto plan = range_planner::plan(100, 10);
    auto resp = make_response(206,
                              "\nabc\n",
                              {
                                  {"Content-Type", "text/plain"},
                                  {"Content-Length", "5"},
                                  {"Server", "test"},
                              },
                              "Partial Content");
    auto outcome = range_response_interpreter::interpret(resp, plan);

    REQUIRE(outcome.is<malformed_response>());
    const auto& mr = outcome.get<malformed_response>();
    CHECK(mr.mr_kind == malformed_kind_t::missing_header);
    CHECK(mr.mr_status == 206);
    CHECK(mr.mr_headers.size() == 3);
    CHECK(mr.mr_headers.get("server").value() == "test");
    CHECK(mr.mr_headers.get("content-type").value() == "text/plain");
    CHECK(std::string(to_string(mr.mr_kind)) == "missing-header");
}

TEST_CASE("interpret 206 with an invalid Content-Range")
{
    auto plan = range_planner::plan(100, 10);
    auto resp = make_response(
        206, "\nabc\n", {{"Content-Range", "bytes 99-103/*"}});
    auto outcome = range_response_interpreter::interpret(resp, plan);

    REQUIRE(outcome.is<malformed_response>());
    CHECK(outcome.get<malformed_response>().mr_kind
          == malformed_kind_t::invalid_header);
}

TEST_CASE("interpret unexpected status")
{
    auto plan = range_planner::plan(std::nullopt, 10);
    auto resp = make_response(404, "not found", {}, "Not Found");
    auto outcome = range_response_interpreter::interpret(resp, plan);

    REQUIRE(outcome.is<malformed_response>());
    const auto& mr = outcome.get<malformed_response>();
    CHECK(mr.mr_kind == malformed_kind_t::unexpected_status);
    CHECK(mr.to_message() == "unexpected server response -- 404 Not Found");
}

TEST_CASE("interpret transport failure")
{
    auto outcome = range_response_interpreter::from_transport_failure(
        "Couldn't connect to server");

    REQUIRE(outcome.is<transport_failure>());
    CHECK(outcome.get<transport_failure>().tf_cause
          == "Couldn't connect to server");
}

TEST_CASE("interpret_size_probe")
{
    {
        auto res = range_response_interpreter::interpret_size_probe(
            make_response(200, "", {{"Content-Length", "4096"}}));
        REQUIRE(res.isOk());
        CHECK(res.unwrap() == 4096);
    }
    {
        auto res = range_response_interpreter::interpret_size_probe(
            make_response(200, ""));
        REQUIRE(res.isErr());
        CHECK(res.unwrapErr().mr_kind == malformed_kind_t::missing_header);
    }
    {
        auto res = range_response_interpreter::interpret_size_probe(
            make_response(405, "", {}, "Method Not Allowed"));
        REQUIRE(res.isErr());
        CHECK(res.unwrapErr().mr_kind == malformed_kind_t::unexpected_status);
    }
}
