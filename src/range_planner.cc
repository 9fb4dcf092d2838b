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

#include "range_planner.hh"

#include "base/rangetail_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace rangetail {

range_request_plan
range_planner::plan(std::optional<file_size_t> known_file_size,
                    file_size_t load_bytes,
                    std::optional<file_size_t> size_hint)
{
    require_gt(load_bytes, 0);

    range_request_plan retval;

    if (!known_file_size || known_file_size.value() == 0) {
        auto suffix_len = load_bytes;

        if (size_hint && size_hint.value() > 0) {
            suffix_len = std::min(load_bytes, size_hint.value());
        }
        retval.rp_range_spec = fmt::format(FMT_STRING("-{}"), suffix_len);
        retval.rp_first_load = true;
        retval.rp_must_get_206 = false;
        retval.rp_has_anchor = false;
    } else {
        // Re-request the last byte we already have.  An unchanged file then
        // answers with that single byte instead of a 416, which is kept
        // for detecting truncation.
        auto size = known_file_size.value();

        retval.rp_range_spec = fmt::format(FMT_STRING("{}-"), size - 1);
        retval.rp_first_load = false;
        retval.rp_must_get_206 = size > 1;
        retval.rp_has_anchor = true;
    }

    return retval;
}

}  // namespace rangetail
