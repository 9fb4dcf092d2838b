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

#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"

namespace rangetail {

Result<void, std::string>
validate_url(const std::string& url)
{
    if (url.empty()) {
        return Err(std::string("url must not be empty"));
    }

    if (!is_http_url(url)) {
        return Err(fmt::format(
            FMT_STRING("url must use the http or https scheme, not \"{}\""),
            url));
    }

    return Ok();
}

Result<file_size_t, std::string>
validate_load_bytes(int64_t value)
{
    if (value <= 0) {
        return Err(fmt::format(
            FMT_STRING("load-bytes must be a positive integer, not {}"),
            value));
    }

    return Ok(static_cast<file_size_t>(value));
}

Result<std::chrono::milliseconds, std::string>
validate_poll_interval(int64_t value)
{
    if (value <= 0) {
        return Err(fmt::format(
            FMT_STRING("poll-interval must be a positive integer, not {}"),
            value));
    }

    return Ok(std::chrono::milliseconds(value));
}

Result<void, std::string>
tail_options::validate() const
{
    auto url_res = validate_url(this->to_url);
    if (url_res.isErr()) {
        return url_res;
    }

    if (this->to_load_bytes == 0) {
        return Err(std::string("load-bytes must be a positive integer, not 0"));
    }

    auto poll_res = validate_poll_interval(this->to_poll_interval.count());
    if (poll_res.isErr()) {
        return Err(poll_res.unwrapErr());
    }

    if (this->to_connect_timeout.count() <= 0) {
        return Err(fmt::format(
            FMT_STRING("connect-timeout must be a positive integer, not {}"),
            this->to_connect_timeout.count()));
    }
    if (this->to_stall_timeout.count() <= 0) {
        return Err(fmt::format(
            FMT_STRING("stall-timeout must be a positive integer, not {}"),
            this->to_stall_timeout.count()));
    }

    return Ok();
}

}  // namespace rangetail
