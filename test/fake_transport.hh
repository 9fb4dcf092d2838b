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

#ifndef rangetail_fake_transport_hh
#define rangetail_fake_transport_hh

#include <deque>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "http_transport.hh"
#include "tail_listener.hh"

/**
 * A transport that answers requests from a script instead of the network.
 */
class scripted_transport : public rangetail::http_transport {
public:
    struct reply {
        std::optional<rangetail::http_response> r_response;
        std::string r_error;
        bool r_throw{false};
    };

    scripted_transport& respond(long status,
                                std::string body,
                                rangetail::http_headers headers = {},
                                std::string reason = "")
    {
        rangetail::http_response resp;

        resp.hr_status = status;
        resp.hr_reason = std::move(reason);
        resp.hr_headers = std::move(headers);
        resp.hr_body = std::move(body);
        this->st_replies.emplace_back(reply{std::move(resp), "", false});
        return *this;
    }

    scripted_transport& partial(std::string body, std::string content_range)
    {
        return this->respond(206,
                             std::move(body),
                             {{"Content-Range", std::move(content_range)}},
                             "Partial Content");
    }

    scripted_transport& fail(std::string cause)
    {
        this->st_replies.emplace_back(
            reply{std::nullopt, std::move(cause), false});
        return *this;
    }

    scripted_transport& raise(std::string what)
    {
        this->st_replies.emplace_back(
            reply{std::nullopt, std::move(what), true});
        return *this;
    }

    Result<rangetail::http_response, std::string> perform(
        const rangetail::http_request& req) override
    {
        this->st_requests.emplace_back(req);
        if (this->st_on_perform) {
            this->st_on_perform(req);
        }

        if (this->st_replies.empty()) {
            return Err(std::string("no scripted reply"));
        }

        auto next = std::move(this->st_replies.front());
        this->st_replies.pop_front();
        if (next.r_throw) {
            throw std::runtime_error(next.r_error);
        }
        if (next.r_response) {
            return Ok(std::move(next.r_response.value()));
        }
        return Err(std::move(next.r_error));
    }

    size_t request_count() const { return this->st_requests.size(); }

    size_t remaining() const { return this->st_replies.size(); }

    std::string last_range() const
    {
        if (this->st_requests.empty()) {
            return "";
        }
        return this->st_requests.back().hr_headers.get("Range").value_or("");
    }

    std::vector<rangetail::http_request> st_requests;
    std::deque<reply> st_replies;
    std::function<void(const rangetail::http_request&)> st_on_perform;
};

/**
 * Keeps a copy of every notification sent by a session.
 */
class recording_listener : public rangetail::tail_listener {
public:
    struct truncation {
        rangetail::file_size_t t_previous;
        std::optional<rangetail::file_size_t> t_observed;
    };

    void data_appended(rangetail::tail_session& ts,
                       const std::string& slice) override
    {
        this->rl_appended.emplace_back(slice);
        if (this->rl_on_data) {
            this->rl_on_data(ts);
        }
    }

    void fetch_error(rangetail::tail_session& ts,
                     const std::string& cause) override
    {
        this->rl_fetch_errors.emplace_back(cause);
    }

    void malformed_response(
        rangetail::tail_session& ts,
        const rangetail::malformed_response& mr) override
    {
        this->rl_malformed.emplace_back(mr);
    }

    void truncated(rangetail::tail_session& ts,
                   rangetail::file_size_t previous_size,
                   std::optional<rangetail::file_size_t> observed_size) override
    {
        this->rl_truncations.emplace_back(
            truncation{previous_size, observed_size});
    }

    std::string joined() const
    {
        std::string retval;

        for (const auto& slice : this->rl_appended) {
            retval.append(slice);
        }
        return retval;
    }

    std::vector<std::string> rl_appended;
    std::vector<std::string> rl_fetch_errors;
    std::vector<rangetail::malformed_response> rl_malformed;
    std::vector<truncation> rl_truncations;
    std::function<void(rangetail::tail_session&)> rl_on_data;
};

#endif
