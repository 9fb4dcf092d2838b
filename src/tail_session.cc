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

#include <exception>

#include "tail_session.hh"

#include "base/rangetail_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace rangetail {

const char*
to_string(tail_session::state_t state)
{
    switch (state) {
        case tail_session::state_t::idle:
            return "idle";
        case tail_session::state_t::requesting:
            return "requesting";
        case tail_session::state_t::applying:
            return "applying";
        case tail_session::state_t::failed:
            return "failed";
    }

    return "unknown";
}

tail_session::tail_session(tail_options opts,
                           std::shared_ptr<http_transport> transport)
    : ts_options(std::move(opts)), ts_transport(std::move(transport)),
      ts_paused(ts_options.to_paused),
      ts_needs_size_probe(ts_options.to_head_probe)
{
    require(this->ts_transport != nullptr);
    require_gt(this->ts_options.to_load_bytes, 0);
    require_gt(this->ts_options.to_poll_interval.count(), 0);
}

Result<void, std::string>
tail_session::set_load_bytes(int64_t value)
{
    auto load_res = validate_load_bytes(value);
    if (load_res.isErr()) {
        return Err(load_res.unwrapErr());
    }

    this->ts_options.to_load_bytes = load_res.unwrap();
    return Ok();
}

Result<void, std::string>
tail_session::set_poll_interval(int64_t value)
{
    auto poll_res = validate_poll_interval(value);
    if (poll_res.isErr()) {
        return Err(poll_res.unwrapErr());
    }

    this->ts_options.to_poll_interval = poll_res.unwrap();
    return Ok();
}

void
tail_session::set_paused(bool paused)
{
    if (this->ts_paused != paused) {
        log_info("%s:%s",
                 this->get_url().c_str(),
                 paused ? "pausing" : "resuming");
    }
    this->ts_paused = paused;
}

void
tail_session::close()
{
    if (!this->ts_open) {
        return;
    }

    log_info("%s:closing session", this->get_url().c_str());
    this->ts_open = false;
}

void
tail_session::log_cycle(const std::string& msg) const
{
    auto level = this->ts_options.to_debug ? rangetail_log_level_t::INFO
                                           : rangetail_log_level_t::DEBUG;

    log_msg_wrapper(level, "%s:%s", this->get_url().c_str(), msg.c_str());
}

long
tail_session::next_delay() const
{
    if (!this->ts_open) {
        return -1;
    }

    return this->ts_options.to_poll_interval.count();
}

Result<http_response, std::string>
tail_session::perform(const http_request& req)
{
    this->ts_loading = true;
    this->ts_state = state_t::requesting;
    this->ts_stats.s_requests += 1;

    try {
        auto retval = this->ts_transport->perform(req);

        this->ts_loading = false;
        return retval;
    } catch (const std::exception& e) {
        this->ts_loading = false;
        return Err(std::string(e.what()));
    }
}

long
tail_session::poll()
{
    if (!this->ts_open) {
        return -1;
    }

    if (this->ts_loading) {
        log_debug("%s:request already in flight, ignoring poll",
                  this->get_url().c_str());
        return -1;
    }

    if (this->ts_paused) {
        log_trace("%s:paused, skipping cycle", this->get_url().c_str());
        return this->next_delay();
    }

    this->ts_stats.s_cycles += 1;
    if (this->ts_needs_size_probe) {
        return this->probe_size();
    }

    auto plan = range_planner::plan(this->ts_known_file_size,
                                    this->ts_options.to_load_bytes,
                                    this->ts_size_hint);
    this->ts_must_get_206 = plan.rp_must_get_206;

    http_request req;

    req.hr_method = http_method_t::GET;
    req.hr_url = this->ts_options.to_url;
    req.hr_headers.add("Range", plan.to_header_value());
    req.hr_headers.add("Cache-Control", "no-cache");
    req.hr_verbose = this->ts_options.to_debug;

    this->log_cycle(fmt::format(FMT_STRING("requesting range {} (first={} "
                                           "must-206={})"),
                                plan.to_header_value(),
                                plan.rp_first_load,
                                plan.rp_must_get_206));

    auto perform_res = this->perform(req);
    if (perform_res.isErr()) {
        this->apply(plan,
                    http_response{},
                    range_response_interpreter::from_transport_failure(
                        perform_res.unwrapErr()));
        return -1;
    }

    this->ts_state = state_t::applying;
    auto resp = perform_res.unwrap();
    auto outcome = range_response_interpreter::interpret(resp, plan);

    this->apply(plan, resp, outcome);
    this->ts_state = state_t::idle;

    return this->next_delay();
}

long
tail_session::probe_size()
{
    http_request req;

    req.hr_method = http_method_t::HEAD;
    req.hr_url = this->ts_options.to_url;
    req.hr_headers.add("Cache-Control", "no-cache");
    req.hr_verbose = this->ts_options.to_debug;

    this->log_cycle("probing the size of the remote file");

    auto perform_res = this->perform(req);
    if (perform_res.isErr()) {
        this->failed(perform_res.unwrapErr());
        return -1;
    }

    this->ts_state = state_t::applying;
    this->ts_needs_size_probe = false;

    auto resp = perform_res.unwrap();
    auto size_res = range_response_interpreter::interpret_size_probe(resp);
    if (size_res.isErr()) {
        // fall back to a plain suffix request on the next cycle
        this->notify_malformed(size_res.unwrapErr());
        this->ts_state = state_t::idle;
        return this->next_delay();
    }

    this->ts_size_hint = size_res.unwrap();
    this->log_cycle(fmt::format(FMT_STRING("remote file size is {}"),
                                this->ts_size_hint.value()));
    this->ts_state = state_t::idle;

    // The probe does not use up a range request, go right to it.
    return this->ts_open ? 0 : -1;
}

void
tail_session::failed(const std::string& cause)
{
    log_error("%s:fetch failed -- %s", this->get_url().c_str(), cause.c_str());

    this->ts_state = state_t::failed;
    this->ts_stats.s_errors += 1;
    this->ts_paused = true;
    this->ts_dormant = true;
    this->ts_listeners.notify(
        [this, &cause](tail_listener& tl) { tl.fetch_error(*this, cause); });
    this->ts_state = state_t::idle;
}

void
tail_session::notify_malformed(const rangetail::malformed_response& mr)
{
    log_warning("%s:%s -- %s",
                this->get_url().c_str(),
                to_string(mr.mr_kind),
                mr.to_message().c_str());
    for (const auto& hdr : mr.mr_headers) {
        log_debug("  %s: %s", hdr.hh_name.c_str(), hdr.hh_value.c_str());
    }

    this->ts_stats.s_errors += 1;
    this->ts_listeners.notify(
        [this, &mr](tail_listener& tl) { tl.malformed_response(*this, mr); });
}

void
tail_session::detected_truncation(std::optional<file_size_t> observed_size)
{
    auto previous_size = this->ts_known_file_size.value_or(0);

    log_warning("%s:file truncated -- previous size %llu",
                this->get_url().c_str(),
                (unsigned long long) previous_size);

    // Forget the old size and content, the next cycle loads a fresh window
    // of the shrunken file.
    this->ts_known_file_size = std::nullopt;
    this->ts_buffer.clear();
    this->ts_size_hint = observed_size;
    this->ts_needs_size_probe = !observed_size.has_value();
    this->ts_stats.s_truncations += 1;
    this->ts_listeners.notify([this, previous_size, &observed_size](
                                  tail_listener& tl) {
        tl.truncated(*this, previous_size, observed_size);
    });
}

void
tail_session::apply_new_bytes(const range_request_plan& plan,
                              const http_response& resp,
                              const new_bytes& nb)
{
    if (plan.rp_has_anchor && this->ts_known_file_size
        && nb.nb_reported_total_size < this->ts_known_file_size.value())
    {
        this->detected_truncation(nb.nb_reported_total_size);
        return;
    }

    auto mode = plan.rp_has_anchor ? tail_buffer::merge_mode_t::continuation
                                   : tail_buffer::merge_mode_t::window;
    auto merge_res = this->ts_buffer.merge(
        nb, mode, this->ts_options.to_load_bytes, !this->ts_first_load);

    if (merge_res.isErr()) {
        rangetail::malformed_response mr;

        mr.mr_kind = merge_res.unwrapErr();
        mr.mr_status = resp.hr_status;
        mr.mr_reason = resp.hr_reason;
        mr.mr_headers = resp.hr_headers;
        mr.mr_body_length = nb.nb_body.size();
        mr.mr_detail = fmt::format(FMT_STRING("requested at most {} bytes"),
                                   this->ts_options.to_load_bytes);
        this->notify_malformed(mr);
        return;
    }

    this->ts_known_file_size = nb.nb_reported_total_size;
    this->ts_size_hint = std::nullopt;
    this->ts_first_load = false;

    auto appended = merge_res.unwrap();
    this->log_cycle(fmt::format(FMT_STRING("appended {} bytes, file size {}, "
                                           "buffer size {} ({} lines)"),
                                appended.size(),
                                nb.nb_reported_total_size,
                                this->ts_buffer.size(),
                                this->ts_buffer.line_count()));
    if (appended.empty()) {
        return;
    }

    this->ts_stats.s_bytes_appended += appended.size();
    this->ts_listeners.notify([this, &appended](tail_listener& tl) {
        tl.data_appended(*this, appended);
    });
}

void
tail_session::apply(const range_request_plan& plan,
                    const http_response& resp,
                    const range_outcome& outcome)
{
    outcome.match(
        [&](const new_bytes& nb) { this->apply_new_bytes(plan, resp, nb); },
        [&](const unchanged& u) {
            if (this->ts_known_file_size
                && u.u_reported_total_size < this->ts_known_file_size.value())
            {
                this->detected_truncation(u.u_reported_total_size);
                return;
            }
            this->log_cycle("no new data");
        },
        [&](const truncated& t) {
            if (!plan.rp_has_anchor) {
                // Even the suffix request could not be satisfied, the remote
                // file is empty.
                this->log_cycle("remote file is empty");
                this->ts_size_hint = std::nullopt;
                return;
            }
            this->detected_truncation(t.t_new_size);
        },
        [&](const rangetail::malformed_response& mr) {
            this->notify_malformed(mr);
        },
        [&](const transport_failure& tf) { this->failed(tf.tf_cause); });
}

}  // namespace rangetail
