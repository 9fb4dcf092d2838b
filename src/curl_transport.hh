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

#ifndef rangetail_curl_transport_hh
#define rangetail_curl_transport_hh

#include <chrono>
#include <string>

#include <curl/curl.h>

#include "base/auto_mem.hh"
#include "http_transport.hh"

namespace rangetail {

/**
 * An http_transport backed by a libcurl easy handle.  The handle is reused
 * across requests so that connections to the server are kept alive.
 */
class curl_transport : public http_transport {
public:
    explicit curl_transport(std::string name);

    curl_transport(const curl_transport&) = delete;
    curl_transport(curl_transport&&) = delete;
    void operator=(curl_transport&&) = delete;

    const std::string& get_name() const { return this->ct_name; }

    void set_connect_timeout(std::chrono::seconds timeout)
    {
        this->ct_connect_timeout = timeout;
    }

    /**
     * A transfer that receives nothing for this long is aborted.
     */
    void set_stall_timeout(std::chrono::seconds timeout)
    {
        this->ct_stall_timeout = timeout;
    }

    /**
     * The upper bound on the duration of a whole request.
     */
    void set_transfer_timeout(std::chrono::seconds timeout)
    {
        this->ct_transfer_timeout = timeout;
    }

    Result<http_response, std::string> perform(
        const http_request& req) override;

private:
    static int debug_cb(
        CURL* handle, curl_infotype type, char* data, size_t size, void* userp);

    static size_t string_cb(void* data, size_t size, size_t nmemb, void* userp);

    static size_t header_cb(char* data, size_t size, size_t nmemb, void* userp);

    void log_transfer_info() const;

    const std::string ct_name;
    auto_mem<CURL> ct_handle;
    char ct_error_buffer[CURL_ERROR_SIZE];
    std::chrono::seconds ct_connect_timeout{10};
    std::chrono::seconds ct_stall_timeout{30};
    std::chrono::seconds ct_transfer_timeout{120};
    int ct_completions{0};
};

}  // namespace rangetail

#endif
