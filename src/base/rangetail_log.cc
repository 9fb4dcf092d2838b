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
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include "config.h"

#ifdef HAVE_EXECINFO_H
#    include <execinfo.h>
#endif

#include <cstdlib>
#include <mutex>
#include <thread>

#include <sys/param.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/utsname.h>

#include "opt_util.hh"
#include "rangetail_log.hh"

static constexpr size_t MAX_LOG_LINE_SIZE = 2 * 1024;

std::optional<FILE*> rangetail_log_file;
rangetail_log_level_t rangetail_log_level = rangetail_log_level_t::INFO;

// NOTE: This mutex is leaked so that it is not destroyed during exit.
// Otherwise, any attempts to log will fail.
static std::mutex*
rangetail_log_mutex()
{
    static auto* retval = new std::mutex();

    return retval;
}

struct thid {
    static uint32_t COUNTER;

    thid() noexcept : t_id(COUNTER++) {}

    uint32_t t_id;
};

uint32_t thid::COUNTER = 0;

thread_local thid current_thid;

static const char* LEVEL_NAMES[] = {
    "T",
    "D",
    "I",
    "W",
    "E",
};

const char*
log_level_name(rangetail_log_level_t level)
{
    return LEVEL_NAMES[static_cast<uint32_t>(level)];
}

bool
log_open_file(const std::string& path)
{
    auto* file = fopen(path.c_str(), "ae");

    if (file == nullptr) {
        return false;
    }

    std::lock_guard<std::mutex> log_lock(*rangetail_log_mutex());

    rangetail_log_file | [](auto old_file) {
        if (old_file != stderr) {
            fclose(old_file);
        }
    };
    rangetail_log_file = file;

    return true;
}

bool
log_open_stderr()
{
    std::lock_guard<std::mutex> log_lock(*rangetail_log_mutex());

    if (rangetail_log_file) {
        return false;
    }
    rangetail_log_file = stderr;

    return true;
}

void
log_close_file()
{
    std::lock_guard<std::mutex> log_lock(*rangetail_log_mutex());

    rangetail_log_file | [](auto file) {
        if (file != stderr) {
            fclose(file);
        }
    };
    rangetail_log_file = std::nullopt;
}

void
log_argv(int argc, char* argv[])
{
    getenv_opt("RANGETAIL_LOG_PATH") | [](auto log_path) {
        if (!rangetail_log_file) {
            log_open_file(log_path);
        }
    };

    log_info("argv[%d] =", argc);
    for (int lpc = 0; lpc < argc; lpc++) {
        log_info("    [%d] = %s", lpc, argv[lpc]);
    }
}

void
log_host_info()
{
    char cwd[MAXPATHLEN];
    struct utsname un;

    uname(&un);

    log_info("uname:");
    log_info("  sysname=%s", un.sysname);
    log_info("  nodename=%s", un.nodename);
    log_info("  machine=%s", un.machine);
    log_info("  release=%s", un.release);
    log_info("  version=%s", un.version);
    log_info("Environment:");
    log_info("  HOME=%s", getenv("HOME"));
    log_info("  LANG=%s", getenv("LANG"));
    log_info("  PATH=%s", getenv("PATH"));
    log_info("  http_proxy=%s", getenv("http_proxy"));
    log_info("  https_proxy=%s", getenv("https_proxy"));
    log_info("Process:");
    log_info("  pid=%d", getpid());
    log_info("  ppid=%d", getppid());
    log_info("  uid=%d", getuid());
    log_info("  euid=%d", geteuid());
    if (getcwd(cwd, sizeof(cwd)) == nullptr) {
        log_info("  ERROR: getcwd failed");
    } else {
        log_info("  cwd=%s", cwd);
    }
    log_info("Executable:");
    log_info("  version=%s", VCS_PACKAGE_STRING);
}

void
log_msg(rangetail_log_level_t level,
        const char* src_file,
        int line_number,
        const char* fmt,
        ...)
{
    struct timeval curr_time;
    struct tm localtm;
    ssize_t prefix_size;
    va_list args;
    ssize_t rc;

    if (level < rangetail_log_level) {
        return;
    }

    std::lock_guard<std::mutex> log_lock(*rangetail_log_mutex());

    if (!rangetail_log_file) {
        return;
    }

    {
        // get the base name of the file.  NB: can't use basename() since it
        // can modify its argument
        const char* last_slash = src_file;

        for (int lpc = 0; src_file[lpc]; lpc++) {
            if (src_file[lpc] == '/' || src_file[lpc] == '\\') {
                last_slash = &src_file[lpc + 1];
            }
        }

        src_file = last_slash;
    }

    char line[MAX_LOG_LINE_SIZE];

    va_start(args, fmt);
    gettimeofday(&curr_time, nullptr);
    localtime_r(&curr_time.tv_sec, &localtm);
    auto gmtoff = std::abs(localtm.tm_gmtoff) / 60;
    prefix_size
        = snprintf(line,
                   MAX_LOG_LINE_SIZE,
                   "%4d-%02d-%02dT%02d:%02d:%02d.%03d%c%02d:%02d %s t%u %s:%d ",
                   localtm.tm_year + 1900,
                   localtm.tm_mon + 1,
                   localtm.tm_mday,
                   localtm.tm_hour,
                   localtm.tm_min,
                   localtm.tm_sec,
                   (int) (curr_time.tv_usec / 1000),
                   localtm.tm_gmtoff < 0 ? '-' : '+',
                   (int) gmtoff / 60,
                   (int) gmtoff % 60,
                   log_level_name(level),
                   current_thid.t_id,
                   src_file,
                   line_number);
    rc = vsnprintf(
        &line[prefix_size], MAX_LOG_LINE_SIZE - prefix_size, fmt, args);
    if (rc >= (ssize_t) (MAX_LOG_LINE_SIZE - prefix_size)) {
        rc = MAX_LOG_LINE_SIZE - prefix_size - 1;
    }
    line[prefix_size + rc] = '\n';
    rangetail_log_file | [&](auto file) {
        fwrite(line, 1, prefix_size + rc + 1, file);
        fflush(file);
    };
    va_end(args);
}

static void
log_backtrace()
{
#ifdef HAVE_EXECINFO_H
    int frame_count;
    void* frames[128];

    frame_count = backtrace(frames, 128);
    auto bt = backtrace_symbols(frames, frame_count);
    for (int lpc = 0; lpc < frame_count; lpc++) {
        log_msg(rangetail_log_level_t::ERROR, __FILE__, __LINE__, "%s", bt[lpc]);
    }
    free(bt);
#endif
}

void
log_abort()
{
    log_backtrace();
    raise(SIGABRT);
    _exit(1);
}
