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

#include "range_planner.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace rangetail;

TEST_CASE("range_planner unknown size")
{
    auto plan = range_planner::plan(std::nullopt, 30 * 1024);

    CHECK(plan.rp_range_spec == "-30720");
    CHECK(plan.to_header_value() == "bytes=-30720");
    CHECK(plan.rp_first_load);
    CHECK_FALSE(plan.rp_must_get_206);
    CHECK_FALSE(plan.rp_has_anchor);
}

TEST_CASE("range_planner zero size is a first load")
{
    auto plan = range_planner::plan(0, 100);

    CHECK(plan.rp_range_spec == "-100");
    CHECK(plan.rp_first_load);
    CHECK_FALSE(plan.rp_has_anchor);
}

TEST_CASE("range_planner size hint")
{
    SUBCASE("smaller than the budget")
    {
        auto plan = range_planner::plan(std::nullopt, 100, 42);

        CHECK(plan.rp_range_spec == "-42");
        CHECK(plan.rp_first_load);
    }
    SUBCASE("larger than the budget")
    {
        auto plan = range_planner::plan(std::nullopt, 100, 4096);

        CHECK(plan.rp_range_spec == "-100");
    }
    SUBCASE("zero is ignored")
    {
        auto plan = range_planner::plan(std::nullopt, 100, 0);

        CHECK(plan.rp_range_spec == "-100");
    }
}

TEST_CASE("range_planner anchor")
{
    auto plan = range_planner::plan(100, 10);

    CHECK(plan.rp_range_spec == "99-");
    CHECK(plan.to_header_value() == "bytes=99-");
    CHECK_FALSE(plan.rp_first_load);
    CHECK(plan.rp_must_get_206);
    CHECK(plan.rp_has_anchor);
}

TEST_CASE("range_planner one byte file")
{
    auto plan = range_planner::plan(1, 10);

    CHECK(plan.rp_range_spec == "0-");
    CHECK_FALSE(plan.rp_first_load);
    CHECK_FALSE(plan.rp_must_get_206);
    CHECK(plan.rp_has_anchor);
}
