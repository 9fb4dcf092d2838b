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

#ifndef rangetail_string_util_hh
#define rangetail_string_util_hh

#include <cstdint>
#include <string>
#include <string_view>

#include <ctype.h>
#include <string.h>
#include <strings.h>

#include "result.h"

inline bool
is_line_ending(char ch)
{
    return ch == '\r' || ch == '\n';
}

inline bool
startswith(const char* str, const char* prefix)
{
    return strncmp(str, prefix, strlen(prefix)) == 0;
}

inline bool
startswith(const std::string& str, const char* prefix)
{
    return startswith(str.c_str(), prefix);
}

inline bool
strcaseeq(const std::string& lhs, const std::string& rhs)
{
    return lhs.size() == rhs.size() && strcasecmp(lhs.c_str(), rhs.c_str()) == 0;
}

inline std::string
trim(const std::string& str)
{
    std::string::size_type start, end;

    for (start = 0; start < str.size() && isspace((unsigned char) str[start]);
         start++)
        ;
    for (end = str.size(); end > 0 && isspace((unsigned char) str[end - 1]);
         end--)
        ;

    return str.substr(start, end - start);
}

bool is_http_url(const std::string& str);

/**
 * @return True if the string is not empty and only contains ASCII digits.
 */
bool is_all_digits(std::string_view sv);

/**
 * Strictly parse a non-negative decimal integer.  Signs, whitespace, and
 * any other characters are rejected.
 */
Result<uint64_t, std::string> scan_unsigned(std::string_view sv);

#endif
