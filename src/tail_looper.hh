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

#ifndef rangetail_tail_looper_hh
#define rangetail_tail_looper_hh

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "base/time_util.hh"
#include "tail_session.hh"

namespace rangetail {

/**
 * Drives the poll cycles of any number of tail_sessions from a single
 * thread.  Each session is kept in a queue ordered by the time its next
 * cycle is due.  Sessions never share state, so one that fails does not
 * affect the others.
 */
class tail_looper {
public:
    tail_looper() = default;

    tail_looper(const tail_looper&) = delete;
    tail_looper& operator=(const tail_looper&) = delete;

    virtual ~tail_looper() = default;

    /**
     * Add a session to the loop, its first cycle is due immediately.
     */
    void add_session(const std::shared_ptr<tail_session>& ts);

    /**
     * Close the sessions for the given URL and drop any pending cycles.
     * Closing a session that is already closed does nothing.
     */
    void close_session(const std::string& url);

    void close_session(const std::shared_ptr<tail_session>& ts);

    bool empty() const { return this->tl_all_sessions.empty(); }

    size_t session_count() const { return this->tl_all_sessions.size(); }

    bool is_scheduled(const tail_session* ts) const;

    std::optional<mstime_t> next_deadline() const;

    /**
     * Run the cycles that are due.
     */
    void loop_body();

    /**
     * Keep running cycles as they come due for the given amount of time.
     */
    void process_for(std::chrono::milliseconds duration);

    /**
     * Run until stop() is called or there are no more sessions.
     */
    void run();

    void stop() { this->tl_looping = false; }

    bool is_looping() const { return this->tl_looping; }

protected:
    virtual mstime_t current_time() const { return getmstime(); }

    virtual void wait_for(std::chrono::milliseconds duration);

    std::chrono::milliseconds compute_timeout(mstime_t current_time) const;

private:
    using poll_entry = std::pair<mstime_t, std::shared_ptr<tail_session>>;

    void schedule(mstime_t when, const std::shared_ptr<tail_session>& ts);
    void check_for_closed_sessions();
    void check_for_woken_sessions(mstime_t current_time);
    void fire_due_sessions(mstime_t current_time);

    std::vector<std::shared_ptr<tail_session>> tl_all_sessions;
    std::vector<poll_entry> tl_poll_queue;
    std::atomic<bool> tl_looping{true};
};

}  // namespace rangetail

#endif
