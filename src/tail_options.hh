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

#ifndef rangetail_tail_options_hh
#define rangetail_tail_options_hh

#include <chrono>
#include <cstdint>
#include <string>

#include "range_planner.hh"
#include "result.h"

namespace rangetail {

struct tail_options {
    static constexpr file_size_t DEFAULT_LOAD_BYTES = 30 * 1024;
    static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{1000};
    static constexpr std::chrono::seconds DEFAULT_CONNECT_TIMEOUT{10};
    static constexpr std::chrono::seconds DEFAULT_STALL_TIMEOUT{30};

    std::string to_url;
    file_size_t to_load_bytes{DEFAULT_LOAD_BYTES};
    std::chrono::milliseconds to_poll_interval{DEFAULT_POLL_INTERVAL};
    bool to_paused{false};
    bool to_debug{false};
    bool to_head_probe{false};
    std::chrono::seconds to_connect_timeout{DEFAULT_CONNECT_TIMEOUT};
    std::chrono::seconds to_stall_timeout{DEFAULT_STALL_TIMEOUT};

    tail_options& with_url(std::string val)
    {
        this->to_url = std::move(val);

        return *this;
    }

    tail_options& with_load_bytes(file_size_t val)
    {
        this->to_load_bytes = val;

        return *this;
    }

    tail_options& with_poll_interval(std::chrono::milliseconds val)
    {
        this->to_poll_interval = val;

        return *this;
    }

    tail_options& with_paused(bool val)
    {
        this->to_paused = val;

        return *this;
    }

    tail_options& with_debug(bool val)
    {
        this->to_debug = val;

        return *this;
    }

    tail_options& with_head_probe(bool val)
    {
        this->to_head_probe = val;

        return *this;
    }

    tail_options& with_connect_timeout(std::chrono::seconds val)
    {
        this->to_connect_timeout = val;

        return *this;
    }

    tail_options& with_stall_timeout(std::chrono::seconds val)
    {
        this->to_stall_timeout = val;

        return *this;
    }

    /**
     * Check that the options can be used to create a session.
     */
    Result<void, std::string> validate() const;
};

Result<void, std::string> validate_url(const std::string& url);

Result<file_size_t, std::string> validate_load_bytes(int64_t value);

Result<std::chrono::milliseconds, std::string> validate_poll_interval(
    int64_t value);

}  // namespace rangetail

#endif
