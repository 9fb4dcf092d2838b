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

#include "range_response.hh"

#include "base/rangetail_log.hh"
#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"

namespace rangetail {

const char*
to_string(malformed_kind_t kind)
{
    switch (kind) {
        case malformed_kind_t::missing_header:
            return "missing-header";
        case malformed_kind_t::invalid_header:
            return "invalid-header";
        case malformed_kind_t::unexpected_status:
            return "unexpected-status";
        case malformed_kind_t::non_206:
            return "non-206";
        case malformed_kind_t::response_too_long:
            return "response-too-long";
    }

    return "unknown";
}

std::string
malformed_response::to_message() const
{
    switch (this->mr_kind) {
        case malformed_kind_t::missing_header:
            return fmt::format(
                FMT_STRING("server response is missing a required header -- "
                           "{}; received {} header(s)"),
                this->mr_detail,
                this->mr_headers.size());
        case malformed_kind_t::invalid_header:
            return fmt::format(FMT_STRING("server sent an invalid header -- {}"),
                               this->mr_detail);
        case malformed_kind_t::unexpected_status:
            return fmt::format(
                FMT_STRING("unexpected server response -- {} {}"),
                this->mr_status,
                this->mr_reason);
        case malformed_kind_t::non_206:
            return fmt::format(
                FMT_STRING("server did not send a partial response -- {} {}"),
                this->mr_status,
                this->mr_reason);
        case malformed_kind_t::response_too_long:
            return fmt::format(
                FMT_STRING("server response too long -- {} bytes; {}"),
                this->mr_body_length,
                this->mr_detail);
    }

    return this->mr_detail;
}

static malformed_response
make_malformed(malformed_kind_t kind,
               const http_response& resp,
               std::string detail)
{
    malformed_response retval;

    retval.mr_kind = kind;
    retval.mr_status = resp.hr_status;
    retval.mr_reason = resp.hr_reason;
    retval.mr_headers = resp.hr_headers;
    retval.mr_body_length = resp.hr_body.size();
    retval.mr_detail = std::move(detail);

    return retval;
}

Result<content_range, std::string>
parse_content_range(const std::string& value)
{
    content_range retval;
    auto spec = trim(value);

    if (startswith(spec, "bytes ")) {
        spec = trim(spec.substr(6));
    } else if (startswith(spec, "bytes=")) {
        spec = trim(spec.substr(6));
    }

    auto slash = spec.find('/');
    if (slash == std::string::npos) {
        return Err(fmt::format(
            FMT_STRING("Content-Range is missing the total length -- \"{}\""),
            value));
    }

    auto range_part = spec.substr(0, slash);
    auto total_part = spec.substr(slash + 1);

    auto total_res = scan_unsigned(total_part);
    if (total_res.isErr()) {
        return Err(fmt::format(FMT_STRING("invalid Content-Range total -- {}"),
                               total_res.unwrapErr()));
    }
    retval.cr_total = total_res.unwrap();

    if (range_part != "*") {
        auto dash = range_part.find('-');
        if (dash == std::string::npos) {
            return Err(fmt::format(
                FMT_STRING("invalid Content-Range byte range -- \"{}\""),
                value));
        }

        auto start_res = scan_unsigned(range_part.substr(0, dash));
        auto end_res = scan_unsigned(range_part.substr(dash + 1));
        if (start_res.isErr() || end_res.isErr()) {
            return Err(fmt::format(
                FMT_STRING("invalid Content-Range byte range -- \"{}\""),
                value));
        }
        retval.cr_start = start_res.unwrap();
        retval.cr_end = end_res.unwrap();
    }

    return Ok(retval);
}

static range_outcome
bytes_or_unchanged(const http_response& resp,
                   const range_request_plan& plan,
                   file_size_t total)
{
    if (plan.rp_has_anchor && resp.hr_body.size() == 1) {
        return unchanged{total};
    }

    return new_bytes{resp.hr_body, total};
}

range_outcome
range_response_interpreter::interpret(const http_response& resp,
                                      const range_request_plan& plan)
{
    switch (resp.hr_status) {
        case 206: {
            auto cr_opt = resp.hr_headers.get("Content-Range");

            if (!cr_opt) {
                return make_malformed(malformed_kind_t::missing_header,
                                      resp,
                                      "Content-Range");
            }

            auto cr_res = parse_content_range(cr_opt.value());
            if (cr_res.isErr()) {
                return make_malformed(
                    malformed_kind_t::invalid_header, resp, cr_res.unwrapErr());
            }

            auto cr = cr_res.unwrap();
            return bytes_or_unchanged(resp, plan, cr.cr_total.value());
        }
        case 200: {
            if (plan.rp_must_get_206) {
                return make_malformed(
                    malformed_kind_t::non_206,
                    resp,
                    fmt::format(FMT_STRING("expecting partial content for "
                                           "range {}"),
                                plan.rp_range_spec));
            }

            file_size_t total = resp.hr_body.size();
            auto cl_opt = resp.hr_headers.get("Content-Length");
            if (cl_opt) {
                auto cl_res = scan_unsigned(trim(cl_opt.value()));
                if (cl_res.isErr()) {
                    return make_malformed(
                        malformed_kind_t::invalid_header,
                        resp,
                        fmt::format(FMT_STRING("invalid Content-Length -- {}"),
                                    cl_res.unwrapErr()));
                }
                total = cl_res.unwrap();
            } else {
                log_debug("200 response without a Content-Length, using the "
                          "body length %zu",
                          resp.hr_body.size());
            }

            return bytes_or_unchanged(resp, plan, total);
        }
        case 416: {
            truncated retval;
            auto cr_opt = resp.hr_headers.get("Content-Range");

            if (cr_opt) {
                auto cr_res = parse_content_range(cr_opt.value());
                if (cr_res.isOk()) {
                    retval.t_new_size = cr_res.unwrap().cr_total;
                } else {
                    log_debug("ignoring bad Content-Range on 416 -- %s",
                              cr_res.unwrapErr().c_str());
                }
            }

            return retval;
        }
        default:
            return make_malformed(malformed_kind_t::unexpected_status,
                                  resp,
                                  fmt::format(FMT_STRING("HTTP {}"),
                                              resp.hr_status));
    }
}

Result<file_size_t, malformed_response>
range_response_interpreter::interpret_size_probe(const http_response& resp)
{
    if (resp.hr_status != 200) {
        return Err(make_malformed(malformed_kind_t::unexpected_status,
                                  resp,
                                  fmt::format(FMT_STRING("HTTP {}"),
                                              resp.hr_status)));
    }

    auto cl_opt = resp.hr_headers.get("Content-Length");
    if (!cl_opt) {
        return Err(make_malformed(
            malformed_kind_t::missing_header, resp, "Content-Length"));
    }

    auto cl_res = scan_unsigned(trim(cl_opt.value()));
    if (cl_res.isErr()) {
        return Err(make_malformed(
            malformed_kind_t::invalid_header,
            resp,
            fmt::format(FMT_STRING("invalid Content-Length -- {}"),
                        cl_res.unwrapErr())));
    }

    return Ok(cl_res.unwrap());
}

}  // namespace rangetail
