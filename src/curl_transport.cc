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

#include <ctype.h>

#include "curl_transport.hh"

#include "base/rangetail_log.hh"
#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"

namespace rangetail {

curl_transport::curl_transport(std::string name)
    : ct_name(std::move(name)), ct_handle(curl_easy_cleanup)
{
    this->ct_handle.reset(curl_easy_init());
    this->ct_error_buffer[0] = '\0';
}

int
curl_transport::debug_cb(
    CURL* handle, curl_infotype type, char* data, size_t size, void* userp)
{
    auto* ct = (curl_transport*) userp;
    bool write_to_log;

    switch (type) {
        case CURLINFO_TEXT:
        case CURLINFO_HEADER_IN:
        case CURLINFO_HEADER_OUT:
            write_to_log = true;
            break;
        default:
            write_to_log = false;
            break;
    }

    if (write_to_log) {
        while (size > 0 && isspace((unsigned char) data[size - 1])) {
            size -= 1;
        }
        log_info("%s:%.*s", ct->get_name().c_str(), (int) size, data);
    }

    return 0;
}

size_t
curl_transport::string_cb(void* data, size_t size, size_t nmemb, void* userp)
{
    auto realsize = size * nmemb;
    auto& body = *static_cast<std::string*>(userp);

    body.append((char*) data, ((char*) data) + realsize);

    return realsize;
}

size_t
curl_transport::header_cb(char* data, size_t size, size_t nmemb, void* userp)
{
    auto realsize = size * nmemb;
    auto& resp = *static_cast<http_response*>(userp);
    auto line = std::string(data, realsize);

    while (!line.empty() && is_line_ending(line.back())) {
        line.pop_back();
    }

    if (startswith(line, "HTTP/")) {
        // A new status line, the previous headers belonged to a redirect
        // or an interim response.
        resp.hr_headers.clear();
        resp.hr_reason.clear();

        auto first_sp = line.find(' ');
        if (first_sp != std::string::npos) {
            auto second_sp = line.find(' ', first_sp + 1);
            if (second_sp != std::string::npos) {
                resp.hr_reason = trim(line.substr(second_sp + 1));
            }
        }
        return realsize;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return realsize;
    }

    resp.hr_headers.add(trim(line.substr(0, colon)),
                        trim(line.substr(colon + 1)));

    return realsize;
}

void
curl_transport::log_transfer_info() const
{
    double total_time = 0, download_size = 0;

    curl_easy_getinfo(this->ct_handle, CURLINFO_TOTAL_TIME, &total_time);
    curl_easy_getinfo(this->ct_handle, CURLINFO_SIZE_DOWNLOAD, &download_size);
    log_debug("%s: total_time=%f download_size=%f completions=%d",
              this->ct_name.c_str(),
              total_time,
              download_size,
              this->ct_completions);
}

Result<http_response, std::string>
curl_transport::perform(const http_request& req)
{
    if (this->ct_handle.empty()) {
        return Err(std::string("unable to initialize libcurl handle"));
    }

    http_response retval;
    auto_mem<struct curl_slist> header_list(curl_slist_free_all);

    for (const auto& hdr : req.hr_headers) {
        auto line = fmt::format(FMT_STRING("{}: {}"), hdr.hh_name, hdr.hh_value);
        auto* new_list = curl_slist_append(header_list.in(), line.c_str());

        if (new_list == nullptr) {
            return Err(std::string("unable to allocate request headers"));
        }
        header_list.release();
        header_list = new_list;
    }

    curl_easy_reset(this->ct_handle);
    this->ct_error_buffer[0] = '\0';
    curl_easy_setopt(this->ct_handle, CURLOPT_URL, req.hr_url.c_str());
    curl_easy_setopt(
        this->ct_handle, CURLOPT_ERRORBUFFER, this->ct_error_buffer);
    curl_easy_setopt(this->ct_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(this->ct_handle, CURLOPT_FOLLOWLOCATION, 1L);
    // byte offsets are only meaningful for the unencoded representation
    curl_easy_setopt(this->ct_handle, CURLOPT_ACCEPT_ENCODING, "identity");
    curl_easy_setopt(this->ct_handle,
                     CURLOPT_CONNECTTIMEOUT,
                     (long) this->ct_connect_timeout.count());
    // abort a transfer that stops making progress so it cannot hold up the
    // other sessions on the looper
    curl_easy_setopt(this->ct_handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(this->ct_handle,
                     CURLOPT_LOW_SPEED_TIME,
                     (long) this->ct_stall_timeout.count());
    curl_easy_setopt(this->ct_handle,
                     CURLOPT_TIMEOUT,
                     (long) this->ct_transfer_timeout.count());
    curl_easy_setopt(
        this->ct_handle, CURLOPT_USERAGENT, "rangetail/" PACKAGE_VERSION);
    curl_easy_setopt(this->ct_handle, CURLOPT_HTTPHEADER, header_list.in());
    curl_easy_setopt(this->ct_handle, CURLOPT_WRITEFUNCTION, string_cb);
    curl_easy_setopt(this->ct_handle, CURLOPT_WRITEDATA, &retval.hr_body);
    curl_easy_setopt(this->ct_handle, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(this->ct_handle, CURLOPT_HEADERDATA, &retval);
    if (req.hr_method == http_method_t::HEAD) {
        curl_easy_setopt(this->ct_handle, CURLOPT_NOBODY, 1L);
    }
    if (req.hr_verbose) {
        curl_easy_setopt(this->ct_handle, CURLOPT_VERBOSE, 1L);
        curl_easy_setopt(this->ct_handle, CURLOPT_DEBUGFUNCTION, debug_cb);
        curl_easy_setopt(this->ct_handle, CURLOPT_DEBUGDATA, this);
    }

    auto rc = curl_easy_perform(this->ct_handle);
    this->ct_completions += 1;
    if (rc != CURLE_OK) {
        log_error("%s:curl failure -- %d %s",
                  this->ct_name.c_str(),
                  rc,
                  curl_easy_strerror(rc));
        if (this->ct_error_buffer[0]) {
            return Err(fmt::format(FMT_STRING("{} -- {}"),
                                   curl_easy_strerror(rc),
                                   this->ct_error_buffer));
        }
        return Err(std::string(curl_easy_strerror(rc)));
    }

    curl_easy_getinfo(this->ct_handle, CURLINFO_RESPONSE_CODE, &retval.hr_status);
    this->log_transfer_info();
    log_debug("%s:%s %s -> %ld %s",
              this->ct_name.c_str(),
              to_string(req.hr_method),
              req.hr_url.c_str(),
              retval.hr_status,
              retval.hr_reason.c_str());

    return Ok(std::move(retval));
}

}  // namespace rangetail
