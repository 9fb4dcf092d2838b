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

#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "CLI/CLI.hpp"
#include "base/rangetail_log.hh"
#include "config.h"
#include "curl_transport.hh"
#include "fmt/format.h"
#include "tail_looper.hh"
#include "tail_options.hh"
#include "tail_session.hh"

using namespace std::chrono_literals;

static volatile sig_atomic_t stop_requested = 0;

static void
sigstop(int sig)
{
    stop_requested = 1;
}

namespace {

/**
 * Copies appended data to stdout and reports problems on stderr.
 */
class console_listener : public rangetail::tail_listener {
public:
    explicit console_listener(bool show_url) : cl_show_url(show_url) {}

    void data_appended(rangetail::tail_session& ts,
                       const std::string& slice) override
    {
        if (this->cl_show_url && this->cl_last_url != ts.get_url()) {
            fmt::print(FMT_STRING("==> {} <==\n"), ts.get_url());
            this->cl_last_url = ts.get_url();
        }
        fwrite(slice.data(), 1, slice.size(), stdout);
        fflush(stdout);
    }

    void fetch_error(rangetail::tail_session& ts,
                     const std::string& cause) override
    {
        fmt::print(stderr,
                   FMT_STRING("rangetail: {}: fetching the file failed, "
                              "giving up -- {}\n"),
                   ts.get_url(),
                   cause);
    }

    void malformed_response(
        rangetail::tail_session& ts,
        const rangetail::malformed_response& mr) override
    {
        fmt::print(stderr,
                   FMT_STRING("rangetail: {}: {}\n"),
                   ts.get_url(),
                   mr.to_message());
        if (mr.mr_kind == rangetail::malformed_kind_t::missing_header) {
            for (const auto& hdr : mr.mr_headers) {
                fmt::print(stderr,
                           FMT_STRING("rangetail:   {}: {}\n"),
                           hdr.hh_name,
                           hdr.hh_value);
            }
        }
    }

    void truncated(rangetail::tail_session& ts,
                   rangetail::file_size_t previous_size,
                   std::optional<rangetail::file_size_t> observed_size) override
    {
        if (observed_size) {
            fmt::print(stderr,
                       FMT_STRING("rangetail: {}: file truncated ({} -> {} "
                                  "bytes)\n"),
                       ts.get_url(),
                       previous_size,
                       observed_size.value());
        } else {
            fmt::print(stderr,
                       FMT_STRING("rangetail: {}: file truncated (was {} "
                                  "bytes)\n"),
                       ts.get_url(),
                       previous_size);
        }
    }

private:
    bool cl_show_url;
    std::string cl_last_url;
};

}  // namespace

int
main(int argc, char* argv[])
{
    std::vector<std::string> urls;
    std::string debug_log_name;
    int64_t load_bytes = rangetail::tail_options::DEFAULT_LOAD_BYTES;
    int64_t poll_interval
        = rangetail::tail_options::DEFAULT_POLL_INTERVAL.count();
    int64_t connect_timeout
        = rangetail::tail_options::DEFAULT_CONNECT_TIMEOUT.count();
    int64_t stall_timeout
        = rangetail::tail_options::DEFAULT_STALL_TIMEOUT.count();
    bool head_probe = false;
    bool debug = false;

    CLI::App app{"Tail a remote file over HTTP using range requests"};

    app.add_option("-d", debug_log_name, "Write debug messages to the given file.")
        ->type_name("FILE");
    app.add_option("-b,--load-bytes",
                   load_bytes,
                   "The maximum number of bytes to keep from the end of the "
                   "file.")
        ->capture_default_str();
    app.add_option("-i,--poll-interval",
                   poll_interval,
                   "The number of milliseconds to wait between requests.")
        ->capture_default_str();
    app.add_option("--connect-timeout",
                   connect_timeout,
                   "The number of seconds to wait for a connection.")
        ->capture_default_str();
    app.add_option("--stall-timeout",
                   stall_timeout,
                   "The number of seconds a transfer may go without "
                   "receiving data before it is aborted.")
        ->capture_default_str();
    app.add_flag("--head-probe",
                 head_probe,
                 "Send a HEAD request to find the file size before the first "
                 "range request.");
    app.add_flag("--debug",
                 debug,
                 "Log the details of every request, to stderr if no debug "
                 "log file was given.");
    app.add_option("url", urls, "The URLs of the files to tail.")->required();
    app.set_version_flag("-V,--version", VCS_PACKAGE_STRING);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (!debug_log_name.empty()) {
        if (!log_open_file(debug_log_name)) {
            fmt::print(stderr,
                       FMT_STRING("rangetail: unable to open debug log -- {}: "
                                  "{}\n"),
                       debug_log_name,
                       strerror(errno));
            return EXIT_FAILURE;
        }
        rangetail_log_level = rangetail_log_level_t::DEBUG;
    }
    if (debug) {
        rangetail_log_level = rangetail_log_level_t::DEBUG;
    }

    log_argv(argc, argv);
    if (debug) {
        log_open_stderr();
    }
    log_host_info();
    log_info("libcurl version=%s", curl_version());

    auto load_res = rangetail::validate_load_bytes(load_bytes);
    auto poll_res = rangetail::validate_poll_interval(poll_interval);
    if (load_res.isErr()) {
        fmt::print(stderr, FMT_STRING("rangetail: {}\n"), load_res.unwrapErr());
        return EXIT_FAILURE;
    }
    if (poll_res.isErr()) {
        fmt::print(stderr, FMT_STRING("rangetail: {}\n"), poll_res.unwrapErr());
        return EXIT_FAILURE;
    }
    if (connect_timeout <= 0) {
        fmt::print(stderr,
                   FMT_STRING("rangetail: connect-timeout must be a positive "
                              "integer, not {}\n"),
                   connect_timeout);
        return EXIT_FAILURE;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        fmt::print(stderr, FMT_STRING("rangetail: unable to initialize libcurl\n"));
        return EXIT_FAILURE;
    }

    console_listener listener(urls.size() > 1);
    rangetail::tail_looper looper;
    std::vector<std::shared_ptr<rangetail::tail_session>> sessions;
    auto retval = EXIT_SUCCESS;

    for (const auto& url : urls) {
        auto opts = rangetail::tail_options{}
                        .with_url(url)
                        .with_load_bytes(load_res.unwrap())
                        .with_poll_interval(poll_res.unwrap())
                        .with_head_probe(head_probe)
                        .with_debug(debug)
                        .with_connect_timeout(
                            std::chrono::seconds(connect_timeout))
                        .with_stall_timeout(
                            std::chrono::seconds(stall_timeout));
        auto valid_res = opts.validate();
        if (valid_res.isErr()) {
            fmt::print(stderr,
                       FMT_STRING("rangetail: {}\n"),
                       valid_res.unwrapErr());
            retval = EXIT_FAILURE;
            break;
        }

        auto transport = std::make_shared<rangetail::curl_transport>(url);
        transport->set_connect_timeout(opts.to_connect_timeout);
        transport->set_stall_timeout(opts.to_stall_timeout);

        auto ts = std::make_shared<rangetail::tail_session>(opts, transport);
        ts->get_listeners().attach(&listener);
        sessions.emplace_back(ts);
        looper.add_session(ts);
    }

    if (retval == EXIT_SUCCESS) {
        signal(SIGINT, sigstop);
        signal(SIGTERM, sigstop);

        while (!stop_requested && !looper.empty()) {
            looper.process_for(250ms);

            auto all_dormant = std::all_of(
                sessions.begin(), sessions.end(), [](const auto& ts) {
                    return ts->is_dormant();
                });
            if (all_dormant) {
                retval = EXIT_FAILURE;
                break;
            }
        }
    }

    for (const auto& ts : sessions) {
        ts->get_listeners().detach(&listener);
        looper.close_session(ts);
    }
    curl_global_cleanup();
    log_close_file();

    return retval;
}
