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

#ifndef rangetail_http_transport_hh
#define rangetail_http_transport_hh

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "result.h"

namespace rangetail {

enum class http_method_t {
    GET,
    HEAD,
};

const char* to_string(http_method_t method);

struct http_header {
    std::string hh_name;
    std::string hh_value;
};

/**
 * The headers of a request or response, kept in the order they were
 * received.  Lookups are case-insensitive.
 */
class http_headers {
public:
    using iterator = std::vector<http_header>::const_iterator;

    http_headers() = default;

    http_headers(std::initializer_list<http_header> headers)
        : h_headers(headers)
    {
    }

    void add(std::string name, std::string value)
    {
        this->h_headers.emplace_back(
            http_header{std::move(name), std::move(value)});
    }

    std::optional<std::string> get(const std::string& name) const;

    bool contains(const std::string& name) const
    {
        return this->get(name).has_value();
    }

    void clear() { this->h_headers.clear(); }

    bool empty() const { return this->h_headers.empty(); }

    size_t size() const { return this->h_headers.size(); }

    iterator begin() const { return this->h_headers.begin(); }

    iterator end() const { return this->h_headers.end(); }

private:
    std::vector<http_header> h_headers;
};

struct http_request {
    http_method_t hr_method{http_method_t::GET};
    std::string hr_url;
    http_headers hr_headers;
    bool hr_verbose{false};
};

struct http_response {
    long hr_status{0};
    std::string hr_reason;
    http_headers hr_headers;
    std::string hr_body;
};

/**
 * Something that can send a single HTTP request and wait for the complete
 * response.  An Err is returned only when no response could be obtained at
 * all, any HTTP status is an Ok.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    virtual Result<http_response, std::string> perform(
        const http_request& req) = 0;
};

}  // namespace rangetail

#endif
