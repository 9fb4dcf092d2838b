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

#ifndef rangetail_tail_buffer_hh
#define rangetail_tail_buffer_hh

#include <string>

#include "range_planner.hh"
#include "range_response.hh"
#include "result.h"

namespace rangetail {

/**
 * The window of the most recent content of the remote file.  Content is
 * only ever discarded from the front and, once trimmed, the window starts
 * at the beginning of a line.
 */
class tail_buffer {
public:
    enum class merge_mode_t {
        /** A suffix load with no overlap with what was already seen. */
        window,
        /** The body starts with the anchor byte from the previous cycle. */
        continuation,
    };

    /**
     * Merge the body of a response into the buffer.
     *
     * @param nb The body and the total size of the file reported with it.
     * @param mode How the body relates to the content already retained.
     * @param load_bytes The capacity of the buffer.
     * @param trim_after Trim the buffer to its capacity after the merge.
     * @return The content that was appended, excluding the anchor byte.
     */
    Result<std::string, malformed_kind_t> merge(const new_bytes& nb,
                                                merge_mode_t mode,
                                                file_size_t load_bytes,
                                                bool trim_after = true);

    /**
     * Discard content from the front so that no more than max_size bytes
     * remain, preferring to cut just after a line terminator.
     */
    void trim_to(file_size_t max_size);

    const std::string& get_data() const { return this->tb_data; }

    size_t size() const { return this->tb_data.size(); }

    bool empty() const { return this->tb_data.empty(); }

    size_t line_count() const;

    void clear() { this->tb_data.clear(); }

private:
    std::string tb_data;
};

}  // namespace rangetail

#endif
