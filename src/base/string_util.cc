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

#include <regex>

#include "string_util.hh"

#include "config.h"
#include "fmt/format.h"
#include "scn/scan.h"

bool
is_http_url(const std::string& str)
{
    static const auto url_re = std::regex("^https?://[^/?#]+.*",
                                          std::regex_constants::icase);

    return std::regex_match(str, url_re);
}

bool
is_all_digits(std::string_view sv)
{
    if (sv.empty()) {
        return false;
    }

    for (const auto ch : sv) {
        if (!isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }

    return true;
}

Result<uint64_t, std::string>
scan_unsigned(std::string_view sv)
{
    if (!is_all_digits(sv)) {
        return Err(
            fmt::format(FMT_STRING("expecting a non-negative integer, found "
                                   "\"{}\""),
                        sv));
    }

    auto scan_res = scn::scan_value<uint64_t>(sv);
    if (!scan_res || !scan_res->range().empty()) {
        return Err(fmt::format(
            FMT_STRING("integer value is out of range -- \"{}\""), sv));
    }

    return Ok(scan_res->value());
}
