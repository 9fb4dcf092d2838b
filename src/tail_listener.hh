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

#ifndef rangetail_tail_listener_hh
#define rangetail_tail_listener_hh

#include <optional>
#include <string>

#include "range_planner.hh"
#include "range_response.hh"

namespace rangetail {

class tail_session;

/**
 * Receives the notifications of a tail_session.  Attach an implementation
 * to the session's bus.  The callbacks are invoked on the thread that runs
 * the session's poll cycle.
 */
class tail_listener {
public:
    virtual ~tail_listener() = default;

    /** New content was appended to the remote file. */
    virtual void data_appended(tail_session& ts, const std::string& slice) {}

    /** No response was obtained, the session is now paused. */
    virtual void fetch_error(tail_session& ts, const std::string& cause) {}

    virtual void malformed_response(tail_session& ts,
                                    const rangetail::malformed_response& mr)
    {
    }

    /**
     * The remote file became shorter than previously observed.
     *
     * @param previous_size The size known before this cycle.
     * @param observed_size The new size, if the server reported it.
     */
    virtual void truncated(tail_session& ts,
                           file_size_t previous_size,
                           std::optional<file_size_t> observed_size)
    {
    }
};

}  // namespace rangetail

#endif
