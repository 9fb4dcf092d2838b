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

#ifndef rangetail_range_planner_hh
#define rangetail_range_planner_hh

#include <cstdint>
#include <optional>
#include <string>

namespace rangetail {

using file_size_t = uint64_t;

/**
 * The byte range to request in the next cycle and what the response to it
 * should look like.
 */
struct range_request_plan {
    /** The range without the unit, e.g. "-30720" or "1234-". */
    std::string rp_range_spec;
    /** A suffix request for the last N bytes of the file. */
    bool rp_first_load{false};
    /** The server must answer with a 206, a 200 is a protocol violation. */
    bool rp_must_get_206{false};
    /** The first byte of the response was already seen in a prior cycle. */
    bool rp_has_anchor{false};

    std::string to_header_value() const
    {
        return "bytes=" + this->rp_range_spec;
    }
};

class range_planner {
public:
    /**
     * @param known_file_size The size of the remote file as of the last
     *   successful response.
     * @param load_bytes The maximum number of bytes to load on a window
     *   load.
     * @param size_hint The size of the file as reported by a size probe,
     *   used to avoid asking for more than the file holds.
     */
    static range_request_plan plan(std::optional<file_size_t> known_file_size,
                                   file_size_t load_bytes,
                                   std::optional<file_size_t> size_hint
                                   = std::nullopt);
};

}  // namespace rangetail

#endif
