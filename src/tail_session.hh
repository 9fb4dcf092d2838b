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

#ifndef rangetail_tail_session_hh
#define rangetail_tail_session_hh

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "base/bus.hh"
#include "http_transport.hh"
#include "range_planner.hh"
#include "range_response.hh"
#include "result.h"
#include "tail_buffer.hh"
#include "tail_listener.hh"
#include "tail_options.hh"

namespace rangetail {

/**
 * The state of tailing a single remote file.  Each call to poll() runs one
 * request/response cycle against the transport and returns how long to
 * wait before the next one.  Scheduling is left to the caller, normally a
 * tail_looper.
 */
class tail_session {
public:
    enum class state_t {
        idle,
        requesting,
        applying,
        failed,
    };

    struct stats {
        uint64_t s_cycles{0};
        uint64_t s_requests{0};
        uint64_t s_bytes_appended{0};
        uint64_t s_truncations{0};
        uint64_t s_errors{0};
    };

    tail_session(tail_options opts, std::shared_ptr<http_transport> transport);

    tail_session(const tail_session&) = delete;
    tail_session& operator=(const tail_session&) = delete;

    const std::string& get_url() const { return this->ts_options.to_url; }

    file_size_t get_load_bytes() const { return this->ts_options.to_load_bytes; }

    Result<void, std::string> set_load_bytes(int64_t value);

    std::chrono::milliseconds get_poll_interval() const
    {
        return this->ts_options.to_poll_interval;
    }

    Result<void, std::string> set_poll_interval(int64_t value);

    /**
     * Pausing takes effect at the next cycle boundary, a request that is
     * in flight is completed and applied.
     */
    void set_paused(bool paused);

    bool is_paused() const { return this->ts_paused; }

    bool is_loading() const { return this->ts_loading; }

    void set_debug(bool debug) { this->ts_options.to_debug = debug; }

    bool is_debug() const { return this->ts_options.to_debug; }

    bool is_first_load() const { return this->ts_first_load; }

    bool must_get_206() const { return this->ts_must_get_206; }

    std::optional<file_size_t> get_known_file_size() const
    {
        return this->ts_known_file_size;
    }

    std::optional<file_size_t> get_size_hint() const
    {
        return this->ts_size_hint;
    }

    bool needs_size_probe() const { return this->ts_needs_size_probe; }

    /**
     * True when a transport failure paused the session and there is no
     * cycle scheduled for it.  Clearing the paused flag wakes it up.
     */
    bool is_dormant() const { return this->ts_dormant; }

    void set_dormant(bool dormant) { this->ts_dormant = dormant; }

    void close();

    bool is_open() const { return this->ts_open; }

    state_t get_state() const { return this->ts_state; }

    const tail_buffer& get_buffer() const { return this->ts_buffer; }

    const stats& get_stats() const { return this->ts_stats; }

    bus<tail_listener>& get_listeners() { return this->ts_listeners; }

    /**
     * Run one cycle.  A call while a request is already in flight does
     * nothing.
     *
     * @return The number of milliseconds to wait before the next cycle, or
     *   -1 if no further cycle should be scheduled.
     */
    long poll();

private:
    long probe_size();

    Result<http_response, std::string> perform(const http_request& req);

    void apply(const range_request_plan& plan,
               const http_response& resp,
               const range_outcome& outcome);

    void apply_new_bytes(const range_request_plan& plan,
                         const http_response& resp,
                         const new_bytes& nb);

    void detected_truncation(std::optional<file_size_t> observed_size);

    void failed(const std::string& cause);

    void notify_malformed(const rangetail::malformed_response& mr);

    void log_cycle(const std::string& msg) const;

    long next_delay() const;

    tail_options ts_options;
    std::shared_ptr<http_transport> ts_transport;
    bus<tail_listener> ts_listeners;
    tail_buffer ts_buffer;
    std::optional<file_size_t> ts_known_file_size;
    std::optional<file_size_t> ts_size_hint;
    bool ts_first_load{true};
    bool ts_must_get_206{false};
    bool ts_paused{false};
    bool ts_loading{false};
    bool ts_needs_size_probe{false};
    bool ts_dormant{false};
    bool ts_open{true};
    state_t ts_state{state_t::idle};
    stats ts_stats;
};

const char* to_string(tail_session::state_t state);

}  // namespace rangetail

#endif
