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

#include <algorithm>
#include <thread>

#include "tail_looper.hh"

#include "base/rangetail_log.hh"
#include "config.h"

using namespace std::chrono_literals;

namespace rangetail {

void
tail_looper::add_session(const std::shared_ptr<tail_session>& ts)
{
    require(ts != nullptr);
    require(std::find(this->tl_all_sessions.begin(),
                      this->tl_all_sessions.end(),
                      ts)
            == this->tl_all_sessions.end());

    log_info("%s:new tail session %p", ts->get_url().c_str(), ts.get());
    this->tl_all_sessions.emplace_back(ts);
    this->schedule(this->current_time(), ts);
}

void
tail_looper::close_session(const std::string& url)
{
    log_info("attempting to close session -- %s", url.c_str());

    auto sessions = this->tl_all_sessions;
    auto found = false;

    for (const auto& ts : sessions) {
        if (ts->get_url() == url) {
            this->close_session(ts);
            found = true;
        }
    }

    if (!found) {
        log_debug("no open session with the url -- %s", url.c_str());
    }
}

void
tail_looper::close_session(const std::shared_ptr<tail_session>& ts)
{
    ts->close();
    this->check_for_closed_sessions();
}

bool
tail_looper::is_scheduled(const tail_session* ts) const
{
    return std::any_of(
        this->tl_poll_queue.begin(),
        this->tl_poll_queue.end(),
        [ts](const poll_entry& pe) { return pe.second.get() == ts; });
}

std::optional<mstime_t>
tail_looper::next_deadline() const
{
    if (this->tl_poll_queue.empty()) {
        return std::nullopt;
    }

    return this->tl_poll_queue.front().first;
}

void
tail_looper::schedule(mstime_t when, const std::shared_ptr<tail_session>& ts)
{
    this->tl_poll_queue.emplace_back(when, ts);
    std::stable_sort(this->tl_poll_queue.begin(),
                     this->tl_poll_queue.end(),
                     [](const poll_entry& lhs, const poll_entry& rhs) {
                         return lhs.first < rhs.first;
                     });
}

void
tail_looper::check_for_closed_sessions()
{
    auto is_closed = [](const std::shared_ptr<tail_session>& ts) {
        return !ts->is_open();
    };

    this->tl_poll_queue.erase(
        std::remove_if(this->tl_poll_queue.begin(),
                       this->tl_poll_queue.end(),
                       [&is_closed](const poll_entry& pe) {
                           return is_closed(pe.second);
                       }),
        this->tl_poll_queue.end());

    auto all_iter = std::remove_if(this->tl_all_sessions.begin(),
                                   this->tl_all_sessions.end(),
                                   is_closed);
    for (auto iter = all_iter; iter != this->tl_all_sessions.end(); ++iter) {
        log_info("%s:tail session %p closed, deleting...",
                 (*iter)->get_url().c_str(),
                 iter->get());
    }
    this->tl_all_sessions.erase(all_iter, this->tl_all_sessions.end());
}

void
tail_looper::check_for_woken_sessions(mstime_t current_time)
{
    for (const auto& ts : this->tl_all_sessions) {
        if (ts->is_open() && ts->is_dormant() && !ts->is_paused()) {
            log_info("%s:session resumed, scheduling", ts->get_url().c_str());
            ts->set_dormant(false);
            this->schedule(current_time, ts);
        }
    }
}

void
tail_looper::fire_due_sessions(mstime_t current_time)
{
    std::vector<std::shared_ptr<tail_session>> due;

    while (!this->tl_poll_queue.empty()
           && this->tl_poll_queue.front().first <= current_time)
    {
        due.emplace_back(this->tl_poll_queue.front().second);
        this->tl_poll_queue.erase(this->tl_poll_queue.begin());
    }

    for (const auto& ts : due) {
        // a callback from an earlier session may have closed this one
        if (!ts->is_open()) {
            continue;
        }

        auto delay_ms = ts->poll();
        if (!ts->is_open()) {
            continue;
        }
        if (delay_ms < 0) {
            log_info("%s:tail session %p is dormant",
                     ts->get_url().c_str(),
                     ts.get());
            ts->set_dormant(true);
            continue;
        }

        log_trace("%s:tail session %p is polling, requeueing in %ld",
                  ts->get_url().c_str(),
                  ts.get(),
                  delay_ms);
        this->schedule(this->current_time() + delay_ms, ts);
    }
}

void
tail_looper::loop_body()
{
    mstime_t current_time = this->current_time();

    this->check_for_closed_sessions();
    this->check_for_woken_sessions(current_time);
    this->fire_due_sessions(current_time);
    this->check_for_closed_sessions();
}

std::chrono::milliseconds
tail_looper::compute_timeout(mstime_t current_time) const
{
    std::chrono::milliseconds retval = 1s;

    if (!this->tl_poll_queue.empty()) {
        retval = std::max(0ms,
                          std::chrono::milliseconds(
                              this->tl_poll_queue.front().first - current_time));
    }

    return retval;
}

void
tail_looper::wait_for(std::chrono::milliseconds duration)
{
    std::this_thread::sleep_for(duration);
}

void
tail_looper::process_for(std::chrono::milliseconds duration)
{
    auto end_time = this->current_time() + duration.count();

    while (this->tl_looping) {
        this->loop_body();

        auto current_time = this->current_time();
        if (current_time >= end_time) {
            break;
        }

        auto timeout = std::min(this->compute_timeout(current_time),
                                to_ms(end_time - current_time));
        if (timeout > 0ms) {
            this->wait_for(timeout);
        }
    }
}

void
tail_looper::run()
{
    log_info("BEGIN tail looper");
    while (this->tl_looping && !this->empty()) {
        this->loop_body();

        // wake up regularly so that a stop() is noticed
        auto timeout
            = std::min(this->compute_timeout(this->current_time()), 250ms);
        if (timeout > 0ms) {
            this->wait_for(timeout);
        }
    }
    log_info("END tail looper");
}

}  // namespace rangetail
