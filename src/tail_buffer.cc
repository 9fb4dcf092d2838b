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

#include "tail_buffer.hh"

#include "base/rangetail_log.hh"
#include "config.h"

namespace rangetail {

Result<std::string, malformed_kind_t>
tail_buffer::merge(const new_bytes& nb,
                   merge_mode_t mode,
                   file_size_t load_bytes,
                   bool trim_after)
{
    const auto& body = nb.nb_body;
    std::string appended;

    switch (mode) {
        case merge_mode_t::window: {
            auto whole_file = nb.nb_reported_total_size <= body.size();

            // The too-long check comes first.  A body that is the complete
            // file is accepted as-is even when it is larger than the budget.
            if (body.size() > load_bytes && !whole_file) {
                return Err(malformed_kind_t::response_too_long);
            }

            if (whole_file) {
                appended = body;
            } else {
                auto nl = body.find('\n');

                if (nl == std::string::npos) {
                    appended = body;
                } else {
                    appended = body.substr(nl + 1);
                }
            }
            break;
        }
        case merge_mode_t::continuation:
            if (!body.empty()) {
                appended = body.substr(1);
            }
            break;
    }

    this->tb_data.append(appended);
    if (trim_after && this->tb_data.size() > load_bytes) {
        this->trim_to(load_bytes);
    }

    return Ok(std::move(appended));
}

void
tail_buffer::trim_to(file_size_t max_size)
{
    if (this->tb_data.size() <= max_size) {
        return;
    }

    // A terminator just before the cut point is already a line boundary.
    auto cut_point = this->tb_data.size() - max_size;
    auto nl = this->tb_data.find('\n', cut_point - 1);

    if (nl == std::string::npos) {
        log_debug("no line terminator in the last %llu bytes, cutting "
                  "mid-line",
                  (unsigned long long) max_size);
        this->tb_data.erase(0, cut_point);
    } else {
        this->tb_data.erase(0, nl + 1);
    }

    ensure(this->tb_data.size() <= max_size);
}

size_t
tail_buffer::line_count() const
{
    auto retval = (size_t) std::count(
        this->tb_data.begin(), this->tb_data.end(), '\n');

    if (!this->tb_data.empty() && this->tb_data.back() != '\n') {
        retval += 1;
    }

    return retval;
}

}  // namespace rangetail
