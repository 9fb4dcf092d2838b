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
#include "tail_looper.hh"

using namespace rangetail;
using namespace std::chrono_literals;

/**
 * A looper with a clock that only moves when the loop waits.
 */
class manual_looper : public tail_looper {
public:
    mstime_t ml_now{1000000};
    std::vector<std::chrono::milliseconds> ml_waits;

protected:
    mstime_t current_time() const override { return this->ml_now; }

    void wait_for(std::chrono::milliseconds duration) override
    {
        this->ml_waits.emplace_back(duration);
        this->ml_now += duration.count();
    }
};

static std::shared_ptr<tail_session>
make_session(const std::shared_ptr<scripted_transport>& transport,
             const std::string& url,
             tail_options opts = tail_options())
{
    opts.with_url(url).with_load_bytes(10);

    return std::make_shared<tail_session>(opts, transport);
}

TEST_CASE("tail_looper schedules by poll interval")
{
    manual_looper looper;
    auto transport = std::make_shared<scripted_transport>();
    auto ts = make_session(transport, "http://example.com/a.log");
    auto start = looper.ml_now;

    transport->respond(200, "abc\n", {{"Content-Length", "4"}})
        .partial("\n", "bytes 3-3/4");

    looper.add_session(ts);
    CHECK(looper.session_count() == 1);
    CHECK(looper.is_scheduled(ts.get()));
    CHECK(looper.next_deadline().value() == start);

    looper.loop_body();
    CHECK(transport->request_count() == 1);
    CHECK(looper.next_deadline().value() == start + 1000);

    looper.loop_body();
    CHECK(transport->request_count() == 1);

    looper.ml_now += 999;
    looper.loop_body();
    CHECK(transport->request_count() == 1);

    looper.ml_now += 1;
    looper.loop_body();
    CHECK(transport->request_count() == 2);
    CHECK(transport->last_range() == "bytes=3-");
    CHECK(transport->remaining() == 0);
}

TEST_CASE("tail_looper process_for")
{
    manual_looper looper;
    auto transport = std::make_shared<scripted_transport>();
    auto ts = make_session(transport, "http://example.com/a.log");

    transport->respond(200, "abc\n", {{"Content-Length", "4"}})
        .partial("\n", "bytes 3-3/4")
        .partial("\n", "bytes 3-3/4")
        .partial("\nd\n", "bytes 3-5/6");

    looper.add_session(ts);
    looper.process_for(3500ms);

    CHECK(transport->request_count() == 4);
    CHECK(transport->remaining() == 0);
    CHECK(ts->get_buffer().get_data() == "abc\nd\n");
    CHECK(ts->get_known_file_size().value() == 6);
    REQUIRE(looper.ml_waits.size() == 4);
    CHECK(looper.ml_waits[0] == 1000ms);
    CHECK(looper.ml_waits[3] == 500ms);
}

TEST_CASE("tail_looper head probe runs the fetch right away")
{
    manual_looper looper;
    auto transport = std::make_shared<scripted_transport>();
    auto ts = make_session(transport,
                           "http://example.com/a.log",
                           tail_options().with_head_probe(true));
    auto start = looper.ml_now;

    transport->respond(200, "", {{"Content-Length", "4"}})
        .respond(200, "abc\n", {{"Content-Length", "4"}});

    looper.add_session(ts);
    looper.loop_body();
    CHECK(transport->request_count() == 1);
    CHECK(looper.next_deadline().value() == start);

    looper.loop_body();
    CHECK(transport->request_count() == 2);
    CHECK(transport->last_range() == "bytes=-4");
    CHECK(looper.next_deadline().value() == start + 1000);
}

TEST_CASE("tail_looper fetch error makes the session dormant")
{
    manual_looper looper;
    auto transport = std::make_shared<scripted_transport>();
    auto ts = make_session(transport, "http://example.com/a.log");
    recording_listener rl;

    ts->get_listeners().attach(&rl);
    transport->fail("Connection refused")
        .respond(200, "abc\n", {{"Content-Length", "4"}});

    looper.add_session(ts);
    looper.loop_body();
    CHECK(rl.rl_fetch_errors.size() == 1);
    CHECK(ts->is_dormant());
    CHECK(ts->is_paused());
    CHECK_FALSE(looper.is_scheduled(ts.get()));
    CHECK(looper.session_count() == 1);

    looper.ml_now += 60000;
    looper.loop_body();
    CHECK(transport->request_count() == 1);

    ts->set_paused(false);
    looper.loop_body();
    CHECK_FALSE(ts->is_dormant());
    CHECK(transport->request_count() == 2);
    CHECK(ts->get_buffer().get_data() == "abc\n");
    CHECK(looper.is_scheduled(ts.get()));

    ts->get_listeners().detach(&rl);
}

TEST_CASE("tail_looper sessions are independent")
{
    manual_looper looper;
    auto bad_transport = std::make_shared<scripted_transport>();
    auto good_transport = std::make_shared<scripted_transport>();
    auto bad = make_session(bad_transport, "http://example.com/bad.log");
    auto good = make_session(good_transport, "http://example.com/good.log");

    bad_transport->fail("Could not resolve host");
    good_transport->respond(200, "abc\n", {{"Content-Length", "4"}})
        .partial("\nd\n", "bytes 3-5/6");

    looper.add_session(bad);
    looper.add_session(good);
    looper.loop_body();
    looper.ml_now += 1000;
    looper.loop_body();

    CHECK(bad->is_dormant());
    CHECK(bad_transport->request_count() == 1);
    CHECK(good_transport->request_count() == 2);
    CHECK(good->get_buffer().get_data() == "abc\nd\n");
}

TEST_CASE("tail_looper slow transfer does not starve other sessions")
{
    manual_looper looper;
    auto slow_transport = std::make_shared<scripted_transport>();
    auto fast_transport = std::make_shared<scripted_transport>();
    auto slow = make_session(slow_transport, "http://example.com/slow.log");
    auto fast = make_session(fast_transport, "http://example.com/fast.log");
    auto start = looper.ml_now;

    // the transfer takes longer than the poll interval and then times out
    slow_transport->st_on_perform
        = [&looper](const http_request&) { looper.ml_now += 30000; };
    slow_transport->fail("Operation too slow");
    fast_transport->respond(200, "abc\n", {{"Content-Length", "4"}})
        .partial("\nd\n", "bytes 3-5/6");

    looper.add_session(slow);
    looper.add_session(fast);
    looper.loop_body();

    CHECK(slow->is_dormant());
    CHECK(fast_transport->request_count() == 1);
    CHECK(looper.next_deadline().value() == start + 30000 + 1000);

    looper.ml_now += 1000;
    looper.loop_body();
    CHECK(fast_transport->request_count() == 2);
    CHECK(fast->get_buffer().get_data() == "abc\nd\n");
    CHECK(slow_transport->request_count() == 1);
}

TEST_CASE("tail_looper close_session")
{
    manual_looper looper;
    auto transport = std::make_shared<scripted_transport>();
    auto ts = make_session(transport, "http://example.com/a.log");

    looper.add_session(ts);
    looper.close_session("http://example.com/a.log");

    CHECK_FALSE(ts->is_open());
    CHECK(looper.empty());
    CHECK_FALSE(looper.is_scheduled(ts.get()));
    CHECK_FALSE(looper.next_deadline().has_value());

    looper.close_session("http://example.com/a.log");
    looper.close_session(ts);
    looper.loop_body();
    CHECK(transport->request_count() == 0);
}

TEST_CASE("tail_looper closed session never fires")
{
    manual_looper looper;
    auto transport_a = std::make_shared<scripted_transport>();
    auto transport_b = std::make_shared<scripted_transport>();
    auto ts_a = make_session(transport_a, "http://example.com/a.log");
    auto ts_b = make_session(transport_b, "http://example.com/b.log");
    recording_listener rl;

    rl.rl_on_data = [&ts_b](tail_session&) { ts_b->close(); };
    ts_a->get_listeners().attach(&rl);
    transport_a->respond(200, "abc\n", {{"Content-Length", "4"}});

    looper.add_session(ts_a);
    looper.add_session(ts_b);
    looper.loop_body();

    CHECK(transport_a->request_count() == 1);
    CHECK(transport_b->request_count() == 0);
    CHECK(looper.session_count() == 1);
    CHECK_FALSE(looper.is_scheduled(ts_b.get()));

    ts_a->get_listeners().detach(&rl);
}

TEST_CASE("tail_looper close during the cycle")
{
    manual_looper looper;
    auto transport = std::make_shared<scripted_transport>();
    auto ts = make_session(transport, "http://example.com/a.log");

    transport->st_on_perform = [&ts](const http_request&) { ts->close(); };
    transport->respond(200, "abc\n", {{"Content-Length", "4"}});

    looper.add_session(ts);
    looper.loop_body();

    CHECK(transport->request_count() == 1);
    CHECK(looper.empty());
    CHECK_FALSE(looper.is_scheduled(ts.get()));
}

TEST_CASE("tail_looper run until stopped")
{
    manual_looper looper;
    auto transport = std::make_shared<scripted_transport>();
    auto ts = make_session(transport, "http://example.com/a.log");
    recording_listener rl;

    rl.rl_on_data = [&looper](tail_session&) { looper.stop(); };
    ts->get_listeners().attach(&rl);
    transport->respond(200, "abc\n", {{"Content-Length", "4"}});

    looper.add_session(ts);
    looper.run();

    CHECK_FALSE(looper.is_looping());
    CHECK(transport->request_count() == 1);
    CHECK(rl.rl_appended.size() == 1);

    ts->get_listeners().detach(&rl);
}

TEST_CASE("tail_looper run ends when there are no sessions")
{
    manual_looper looper;
    auto transport = std::make_shared<scripted_transport>();
    auto ts = make_session(transport, "http://example.com/a.log");

    transport->st_on_perform = [&ts](const http_request&) { ts->close(); };
    transport->respond(200, "abc\n", {{"Content-Length", "4"}});

    looper.add_session(ts);
    looper.run();

    CHECK(looper.empty());
    CHECK(looper.is_looping());
}
