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

#ifndef rangetail_range_response_hh
#define rangetail_range_response_hh

#include <optional>
#include <string>

#include "http_transport.hh"
#include "mapbox/variant.hpp"
#include "range_planner.hh"
#include "result.h"

namespace rangetail {

enum class malformed_kind_t {
    missing_header,
    invalid_header,
    unexpected_status,
    non_206,
    response_too_long,
};

const char* to_string(malformed_kind_t kind);

struct new_bytes {
    std::string nb_body;
    file_size_t nb_reported_total_size{0};
};

/** Only the anchor byte came back, the file has not grown. */
struct unchanged {
    file_size_t u_reported_total_size{0};
};

struct truncated {
    /** The size reported by the server, if it sent one with the 416. */
    std::optional<file_size_t> t_new_size;
};

struct malformed_response {
    malformed_kind_t mr_kind{malformed_kind_t::unexpected_status};
    long mr_status{0};
    std::string mr_reason;
    http_headers mr_headers;
    size_t mr_body_length{0};
    std::string mr_detail;

    std::string to_message() const;
};

struct transport_failure {
    std::string tf_cause;
};

using range_outcome = mapbox::util::variant<new_bytes,
                                            unchanged,
                                            truncated,
                                            malformed_response,
                                            transport_failure>;

/**
 * The parsed value of a Content-Range header.  The start and end are not
 * present in the unsatisfied-range form, where only the total is given.
 */
struct content_range {
    std::optional<file_size_t> cr_start;
    std::optional<file_size_t> cr_end;
    std::optional<file_size_t> cr_total;
};

Result<content_range, std::string> parse_content_range(
    const std::string& value);

class range_response_interpreter {
public:
    static range_outcome interpret(const http_response& resp,
                                   const range_request_plan& plan);

    static range_outcome from_transport_failure(std::string cause)
    {
        return transport_failure{std::move(cause)};
    }

    /**
     * Interpret the response to a HEAD request that is meant to discover
     * the size of the remote file.
     */
    static Result<file_size_t, malformed_response> interpret_size_probe(
        const http_response& resp);
};

}  // namespace rangetail

#endif
