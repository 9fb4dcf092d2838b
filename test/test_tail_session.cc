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

#include <memory>

#include "config.h"
#include "doctest/doctest.h"
#include "fake_transport.hh"
#include "tail_session.hh"

using namespace rangetail;
using namespace std::chrono_literals;

static const std::string TEST_URL = "http://example.com/app.log";

struct session_fixture {
    explicit session_fixture(file_size_t load_bytes,
                             tail_options opts = tail_options())
        : sf_transport(std::make_shared<scripted_transport>())
    {
        opts.with_url(TEST_URL).with_load_bytes(load_bytes);
        this->sf_session
            = std::make_shared<tail_session>(opts, this->sf_transport);
        this->sf_session->get_listeners().attach(&this->sf_listener);
    }

    ~session_fixture()
    {
        this->sf_session->get_listeners().detach(&this->sf_listener);
    }

    std::shared_ptr<scripted_transport> sf_transport;
    std::shared_ptr<tail_session> sf_session;
    recording_listener sf_listener;
};

TEST_CASE("tail_session initial state")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    CHECK(ts.get_url() == TEST_URL);
    CHECK(ts.is_first_load());
    CHECK_FALSE(ts.get_known_file_size().has_value());
    CHECK_FALSE(ts.is_paused());
    CHECK_FALSE(ts.is_loading());
    CHECK(ts.is_open());
    CHECK(ts.get_state() == tail_session::state_t::idle);
    CHECK(std::string(to_string(ts.get_state())) == "idle");
    CHECK(ts.get_buffer().empty());
}

TEST_CASE("tail_session whole file on first load")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->respond(200, "hello\nworld", {{"Content-Length", "11"}});

    CHECK(ts.poll() == 1000);

    REQUIRE(sf.sf_transport->request_count() == 1);
    const auto& req = sf.sf_transport->st_requests.front();
    CHECK(req.hr_method == http_method_t::GET);
    CHECK(req.hr_url == TEST_URL);
    CHECK(req.hr_headers.get("Range").value() == "bytes=-10");
    CHECK(req.hr_headers.get("Cache-Control").value() == "no-cache");

    CHECK(ts.get_buffer().get_data() == "hello\nworld");
    CHECK_FALSE(ts.is_first_load());
    CHECK(ts.get_known_file_size().value() == 11);
    REQUIRE(sf.sf_listener.rl_appended.size() == 1);
    CHECK(sf.sf_listener.rl_appended[0] == "hello\nworld");
    CHECK(ts.get_stats().s_bytes_appended == 11);
}

TEST_CASE("tail_session whole file larger than the budget")
{
    session_fixture sf(5);
    auto& ts = *sf.sf_session;

    sf.sf_transport->respond(200, "hello\nworld", {{"Content-Length", "11"}});

    CHECK(ts.poll() == 1000);
    CHECK(ts.get_buffer().get_data() == "hello\nworld");
    CHECK(sf.sf_listener.rl_malformed.empty());
    CHECK(ts.get_known_file_size().value() == 11);
}

TEST_CASE("tail_session window response too long")
{
    session_fixture sf(5);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("hello\nworld", "bytes 9-19/20");

    CHECK(ts.poll() == 1000);
    REQUIRE(sf.sf_listener.rl_malformed.size() == 1);
    CHECK(sf.sf_listener.rl_malformed[0].mr_kind
          == malformed_kind_t::response_too_long);
    CHECK(sf.sf_listener.rl_malformed[0].mr_body_length == 11);
    CHECK(sf.sf_listener.rl_appended.empty());
    CHECK(ts.get_buffer().empty());
    CHECK(ts.is_first_load());
    CHECK_FALSE(ts.get_known_file_size().has_value());
}

TEST_CASE("tail_session clipped first load and unchanged cycles")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("0123\n5678\n", "bytes 90-99/100");
    CHECK(ts.poll() == 1000);
    CHECK(ts.get_buffer().get_data() == "5678\n");
    CHECK(ts.get_known_file_size().value() == 100);
    CHECK(ts.must_get_206() == false);

    for (int lpc = 0; lpc < 3; lpc++) {
        sf.sf_transport->partial("\n", "bytes 99-99/100");
        CHECK(ts.poll() == 1000);
        CHECK(sf.sf_transport->last_range() == "bytes=99-");
        CHECK(ts.must_get_206());
        CHECK(ts.get_buffer().get_data() == "5678\n");
        CHECK(ts.get_known_file_size().value() == 100);
    }

    CHECK(sf.sf_listener.rl_appended.size() == 1);
    CHECK(sf.sf_listener.rl_truncations.empty());
    CHECK(sf.sf_listener.rl_malformed.empty());
}

TEST_CASE("tail_session continuation keeps partial lines")
{
    session_fixture sf(100);
    auto& ts = *sf.sf_session;

    sf.sf_transport->respond(200, "a\n", {{"Content-Length", "2"}})
        .partial("\npart", "bytes 1-5/6")
        .partial("tial\n", "bytes 5-9/10");

    CHECK(ts.poll() == 1000);
    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->last_range() == "bytes=1-");
    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->last_range() == "bytes=5-");

    CHECK(ts.get_buffer().get_data() == "a\npartial\n");
    CHECK(sf.sf_listener.joined() == ts.get_buffer().get_data());
    CHECK(sf.sf_listener.rl_appended.size() == 3);
    CHECK(ts.get_known_file_size().value() == 10);
    CHECK(ts.get_stats().s_bytes_appended == 10);
}

TEST_CASE("tail_session continuation stays within the budget")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("0123\n5678\n", "bytes 90-99/100")
        .partial("\nabc\ndefg\n", "bytes 99-108/109")
        .partial("\nhi", "bytes 108-110/111");

    CHECK(ts.poll() == 1000);
    CHECK(ts.poll() == 1000);
    CHECK(ts.get_buffer().size() <= 10);
    CHECK(ts.get_buffer().get_data() == "abc\ndefg\n");
    CHECK(ts.poll() == 1000);
    CHECK(ts.get_buffer().size() <= 10);
    CHECK(ts.get_buffer().get_data() == "defg\nhi");
    CHECK(ts.get_known_file_size().value() == 111);
}

TEST_CASE("tail_session truncation without a reported size")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("0123\n5678\n", "bytes 90-99/100")
        .respond(416, "", {}, "Range Not Satisfiable")
        .respond(200, "", {{"Content-Length", "6"}})
        .partial("abc\nd\n", "bytes 0-5/6");

    CHECK(ts.poll() == 1000);
    CHECK(ts.poll() == 1000);

    REQUIRE(sf.sf_listener.rl_truncations.size() == 1);
    CHECK(sf.sf_listener.rl_truncations[0].t_previous == 100);
    CHECK_FALSE(sf.sf_listener.rl_truncations[0].t_observed.has_value());
    CHECK_FALSE(ts.get_known_file_size().has_value());
    CHECK(ts.needs_size_probe());
    CHECK_FALSE(ts.is_paused());
    CHECK(ts.get_stats().s_truncations == 1);

    CHECK(ts.poll() == 0);
    CHECK(sf.sf_transport->st_requests.back().hr_method
          == http_method_t::HEAD);
    CHECK_FALSE(ts.needs_size_probe());
    CHECK(ts.get_size_hint().value() == 6);

    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->last_range() == "bytes=-6");
    CHECK(ts.get_known_file_size().value() == 6);
    CHECK(ts.get_buffer().get_data() == "abc\nd\n");
    CHECK_FALSE(ts.get_size_hint().has_value());
    CHECK(sf.sf_transport->remaining() == 0);
}

TEST_CASE("tail_session truncation with a reported size")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("0123\n5678\n", "bytes 90-99/100")
        .respond(416, "", {{"Content-Range", "bytes */47"}});

    CHECK(ts.poll() == 1000);
    CHECK(ts.poll() == 1000);

    REQUIRE(sf.sf_listener.rl_truncations.size() == 1);
    CHECK(sf.sf_listener.rl_truncations[0].t_observed.value() == 47);
    CHECK_FALSE(ts.get_known_file_size().has_value());
    CHECK_FALSE(ts.needs_size_probe());
    CHECK(ts.get_size_hint().value() == 47);

    sf.sf_transport->partial("xx\nyyyyy\n", "bytes 37-46/47");
    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->last_range() == "bytes=-10");
    CHECK(ts.get_known_file_size().value() == 47);
}

TEST_CASE("tail_session truncation discards the old partial line")
{
    session_fixture sf(100);
    auto& ts = *sf.sf_session;

    sf.sf_transport->respond(200, "a\nbc", {{"Content-Length", "4"}})
        .respond(416, "", {{"Content-Range", "bytes */3"}})
        .partial("xy\n", "bytes 0-2/3");

    CHECK(ts.poll() == 1000);
    CHECK(ts.get_buffer().get_data() == "a\nbc");

    CHECK(ts.poll() == 1000);
    REQUIRE(sf.sf_listener.rl_truncations.size() == 1);
    CHECK(ts.get_buffer().empty());

    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->last_range() == "bytes=-3");
    CHECK(ts.get_buffer().get_data() == "xy\n");
    REQUIRE(sf.sf_listener.rl_appended.size() == 2);
    CHECK(sf.sf_listener.rl_appended[1] == "xy\n");
}

TEST_CASE("tail_session smaller total is a truncation")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("0123\n5678\n", "bytes 90-99/100")
        .partial("\n", "bytes 99-99/60");

    CHECK(ts.poll() == 1000);
    CHECK(ts.poll() == 1000);

    REQUIRE(sf.sf_listener.rl_truncations.size() == 1);
    CHECK(sf.sf_listener.rl_truncations[0].t_previous == 100);
    CHECK(sf.sf_listener.rl_truncations[0].t_observed.value() == 60);
    CHECK_FALSE(ts.get_known_file_size().has_value());
}

TEST_CASE("tail_session empty remote file")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->respond(416, "", {{"Content-Range", "bytes */0"}});

    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_listener.rl_truncations.empty());
    CHECK(sf.sf_listener.rl_malformed.empty());
    CHECK(ts.is_first_load());
    CHECK_FALSE(ts.get_known_file_size().has_value());

    sf.sf_transport->respond(200, "first\n", {{"Content-Length", "6"}});
    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->last_range() == "bytes=-10");
    CHECK(ts.get_buffer().get_data() == "first\n");
}

TEST_CASE("tail_session 206 without a Content-Range")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("0123\n5678\n", "bytes 90-99/100")
        .respond(206,
                 "\nabc\n",
                 {{"Content-Type", "text/plain"}, {"Content-Length", "5"}},
                 "Partial Content");

    CHECK(ts.poll() == 1000);
    CHECK(ts.poll() == 1000);

    REQUIRE(sf.sf_listener.rl_malformed.size() == 1);
    const auto& mr = sf.sf_listener.rl_malformed[0];
    CHECK(mr.mr_kind == malformed_kind_t::missing_header);
    CHECK(mr.mr_status == 206);
    CHECK(mr.mr_headers.size() == 2);
    CHECK(mr.mr_headers.get("Content-Type").value() == "text/plain");
    CHECK(ts.get_known_file_size().value() == 100);
    CHECK(ts.get_buffer().get_data() == "5678\n");
    CHECK_FALSE(ts.is_paused());
}

TEST_CASE("tail_session non-206 reply to an anchored request")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("0123\n5678\n", "bytes 90-99/100")
        .respond(200, std::string(100, 'x'), {{"Content-Length", "100"}}, "OK");

    CHECK(ts.poll() == 1000);
    CHECK(ts.poll() == 1000);

    REQUIRE(sf.sf_listener.rl_malformed.size() == 1);
    CHECK(sf.sf_listener.rl_malformed[0].mr_kind == malformed_kind_t::non_206);
    CHECK(ts.get_buffer().get_data() == "5678\n");
    CHECK(ts.get_stats().s_errors == 1);
}

TEST_CASE("tail_session fetch error pauses the session")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    SUBCASE("error result")
    {
        sf.sf_transport->fail("Couldn't resolve host name");

        CHECK(ts.poll() == -1);
        REQUIRE(sf.sf_listener.rl_fetch_errors.size() == 1);
        CHECK(sf.sf_listener.rl_fetch_errors[0]
              == "Couldn't resolve host name");
    }
    SUBCASE("exception")
    {
        sf.sf_transport->raise("connection reset");

        CHECK(ts.poll() == -1);
        REQUIRE(sf.sf_listener.rl_fetch_errors.size() == 1);
        CHECK(sf.sf_listener.rl_fetch_errors[0] == "connection reset");
    }

    CHECK(ts.is_paused());
    CHECK(ts.is_dormant());
    CHECK_FALSE(ts.is_loading());
    CHECK(ts.get_state() == tail_session::state_t::idle);
    CHECK(sf.sf_listener.rl_malformed.empty());
    CHECK(sf.sf_listener.rl_truncations.empty());
    CHECK(ts.get_stats().s_errors == 1);
    CHECK(ts.is_first_load());

    // paused sessions do not issue requests
    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->request_count() == 1);

    ts.set_paused(false);
    sf.sf_transport->respond(200, "back\n", {{"Content-Length", "5"}});
    CHECK(ts.poll() == 1000);
    CHECK(ts.get_buffer().get_data() == "back\n");
}

TEST_CASE("tail_session pause and resume")
{
    session_fixture sf(10, tail_options().with_paused(true));
    auto& ts = *sf.sf_session;

    CHECK(ts.is_paused());
    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->request_count() == 0);
    CHECK(ts.get_stats().s_cycles == 0);

    ts.set_paused(false);
    sf.sf_transport->respond(200, "abc\n", {{"Content-Length", "4"}});
    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->request_count() == 1);
    CHECK(ts.get_stats().s_cycles == 1);
}

TEST_CASE("tail_session pause during a request")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->st_on_perform
        = [&ts](const http_request&) { ts.set_paused(true); };
    sf.sf_transport->respond(200, "abc\n", {{"Content-Length", "4"}});

    CHECK(ts.poll() == 1000);
    CHECK(ts.is_paused());
    CHECK(ts.get_buffer().get_data() == "abc\n");
    CHECK(sf.sf_listener.rl_appended.size() == 1);
}

TEST_CASE("tail_session poll while a request is in flight")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;
    std::vector<long> nested_results;
    std::vector<bool> loading;

    sf.sf_transport->st_on_perform = [&](const http_request&) {
        loading.emplace_back(ts.is_loading());
        nested_results.emplace_back(ts.poll());
        nested_results.emplace_back(ts.poll());
    };
    sf.sf_transport->respond(200, "abc\n", {{"Content-Length", "4"}});

    CHECK(ts.poll() == 1000);
    CHECK(sf.sf_transport->request_count() == 1);
    REQUIRE(nested_results.size() == 2);
    CHECK(nested_results[0] == -1);
    CHECK(nested_results[1] == -1);
    REQUIRE(loading.size() == 1);
    CHECK(loading[0]);
    CHECK_FALSE(ts.is_loading());
}

TEST_CASE("tail_session head probe")
{
    SUBCASE("size known")
    {
        session_fixture sf(10, tail_options().with_head_probe(true));
        auto& ts = *sf.sf_session;

        CHECK(ts.needs_size_probe());
        sf.sf_transport->respond(200, "", {{"Content-Length", "4"}})
            .respond(200, "abc\n", {{"Content-Length", "4"}});

        CHECK(ts.poll() == 0);
        REQUIRE(sf.sf_transport->request_count() == 1);
        CHECK(sf.sf_transport->st_requests[0].hr_method == http_method_t::HEAD);
        CHECK_FALSE(
            sf.sf_transport->st_requests[0].hr_headers.contains("Range"));
        CHECK(ts.get_size_hint().value() == 4);

        CHECK(ts.poll() == 1000);
        CHECK(sf.sf_transport->last_range() == "bytes=-4");
        CHECK(ts.get_buffer().get_data() == "abc\n");
    }
    SUBCASE("probe not supported")
    {
        session_fixture sf(10, tail_options().with_head_probe(true));
        auto& ts = *sf.sf_session;

        sf.sf_transport->respond(405, "", {}, "Method Not Allowed")
            .respond(200, "abc\n", {{"Content-Length", "4"}});

        CHECK(ts.poll() == 1000);
        REQUIRE(sf.sf_listener.rl_malformed.size() == 1);
        CHECK(sf.sf_listener.rl_malformed[0].mr_kind
              == malformed_kind_t::unexpected_status);
        CHECK_FALSE(ts.needs_size_probe());

        CHECK(ts.poll() == 1000);
        CHECK(sf.sf_transport->last_range() == "bytes=-10");
    }
}

TEST_CASE("tail_session close")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    ts.close();
    CHECK_FALSE(ts.is_open());
    ts.close();
    CHECK_FALSE(ts.is_open());
    CHECK(ts.poll() == -1);
    CHECK(sf.sf_transport->request_count() == 0);
}

TEST_CASE("tail_session settings")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    CHECK(ts.set_load_bytes(-1).isErr());
    CHECK(ts.set_load_bytes(0).isErr());
    CHECK(ts.get_load_bytes() == 10);
    CHECK(ts.set_load_bytes(20).isOk());
    CHECK(ts.get_load_bytes() == 20);

    CHECK(ts.set_poll_interval(0).isErr());
    CHECK(ts.get_poll_interval() == 1000ms);
    CHECK(ts.set_poll_interval(250).isOk());
    CHECK(ts.get_poll_interval() == 250ms);

    ts.set_debug(true);
    CHECK(ts.is_debug());

    sf.sf_transport->respond(200, "abc\n", {{"Content-Length", "4"}});
    CHECK(ts.poll() == 250);
    CHECK(sf.sf_transport->last_range() == "bytes=-20");
    CHECK(sf.sf_transport->st_requests.back().hr_verbose);
}

TEST_CASE("tail_session known size only shrinks with a truncation")
{
    session_fixture sf(10);
    auto& ts = *sf.sf_session;

    sf.sf_transport->partial("0123\n5678\n", "bytes 90-99/100")
        .partial("\nab\n", "bytes 99-102/103")
        .respond(416, "", {{"Content-Range", "bytes */5"}})
        .partial("ab\ncd", "bytes 0-4/5")
        .partial("d\n", "bytes 4-5/6");

    std::vector<std::optional<file_size_t>> sizes;
    std::vector<size_t> truncations;
    for (int lpc = 0; lpc < 5; lpc++) {
        CHECK(ts.poll() == 1000);
        sizes.emplace_back(ts.get_known_file_size());
        truncations.emplace_back(sf.sf_listener.rl_truncations.size());
    }

    CHECK(sizes[0].value() == 100);
    CHECK(sizes[1].value() == 103);
    CHECK_FALSE(sizes[2].has_value());
    CHECK(truncations[2] == 1);
    CHECK(sizes[3].value() == 5);
    CHECK(sizes[4].value() == 6);
    CHECK(truncations[4] == 1);
    CHECK(sf.sf_transport->remaining() == 0);
}
