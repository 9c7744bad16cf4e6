// Copyright (C) 2016 iNuron NV
//
// This file is part of Open vStorage Open Source Edition (OSE),
// as available from
//
//      http://www.openvstorage.org and
//      http://www.openvstorage.com.
//
// This file is free software; you can redistribute it and/or modify it
// under the terms of the GNU Affero General Public License v3 (GNU AGPLv3)
// as published by the Free Software Foundation, in version 3 as it comes in
// the LICENSE.txt file of the Open vStorage OSE distribution.
// Open vStorage is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY of any kind.

#include "../FilterBuilder.h"

#include <gtest/gtest.h>

namespace lvmcoordtest
{

using namespace lvmcoord;

class FilterBuilderTest
    : public testing::Test
{};

TEST_F(FilterBuilderTest, devices)
{
    EXPECT_EQ(R"(["a|^/dev/mapper/a$|^/dev/mapper/b$|", "r|.*|"])",
              FilterBuilder::build(DeviceList{ "/dev/mapper/a",
                                               "/dev/mapper/b" }));
}

TEST_F(FilterBuilderTest, order_does_not_matter)
{
    const DeviceList devs{ "/dev/mapper/c",
                           "/dev/mapper/a",
                           "/dev/mapper/b" };
    DeviceList rdevs(devs.rbegin(),
                     devs.rend());

    EXPECT_EQ(FilterBuilder::build(devs),
              FilterBuilder::build(rdevs));
    EXPECT_EQ(R"(["a|^/dev/mapper/a$|^/dev/mapper/b$|^/dev/mapper/c$|", "r|.*|"])",
              FilterBuilder::build(devs));
}

TEST_F(FilterBuilderTest, no_devices)
{
    EXPECT_EQ(R"(["r|.*|"])",
              FilterBuilder::build(DeviceList()));
    EXPECT_EQ(R"(["r|.*|"])",
              FilterBuilder::build(DeviceSnapshot()));
}

TEST_F(FilterBuilderTest, empty_identifiers_are_dropped)
{
    EXPECT_EQ(R"(["r|.*|"])",
              FilterBuilder::build(DeviceList{ "",
                                               "   ",
                                               "\t" }));
}

TEST_F(FilterBuilderTest, whitespace_and_duplicates)
{
    const DeviceSnapshot snap(FilterBuilder::normalize(DeviceList{ " /dev/mapper/a",
                                                                   "/dev/mapper/a ",
                                                                   "/dev/mapper/a" }));
    ASSERT_EQ(1U, snap.size());
    EXPECT_EQ("/dev/mapper/a", *snap.begin());

    EXPECT_EQ(R"(["a|^/dev/mapper/a$|", "r|.*|"])",
              FilterBuilder::build(snap));
}

TEST_F(FilterBuilderTest, extra_devices)
{
    EXPECT_EQ(R"(["a|^/dev/a$|^/dev/b$|^/dev/c$|", "r|.*|"])",
              FilterBuilder::build(DeviceList{ "/dev/b" },
                                   DeviceList{ "/dev/c",
                                               "/dev/a" }));

    // extra devices alone are enough for an accept rule
    EXPECT_EQ(R"(["a|^/dev/a$|", "r|.*|"])",
              FilterBuilder::build(DeviceList(),
                                   DeviceList{ "/dev/a" }));
}

TEST_F(FilterBuilderTest, extra_devices_overlap)
{
    const DeviceSnapshot snap(FilterBuilder::normalize(DeviceList{ "/dev/a",
                                                                   "/dev/b" },
                                                       DeviceList{ "/dev/b",
                                                                   " /dev/a" }));
    EXPECT_EQ(DeviceSnapshot({ "/dev/a", "/dev/b" }),
              snap);
}

TEST_F(FilterBuilderTest, backslashes)
{
    EXPECT_EQ(R"(["a|^\\x20\\x24\\x7c\\x22\\x28$|", "r|.*|"])",
              FilterBuilder::build(DeviceList{ R"(\x20\x24\x7c\x22\x28)" }));
}

TEST_F(FilterBuilderTest, regex_metacharacters)
{
    EXPECT_EQ(R"(/dev/mapper/a\\.b)",
              FilterBuilder::escape("/dev/mapper/a.b"));
    EXPECT_EQ(R"(/dev/mapper/\\[x\\]\\*\\+\\?)",
              FilterBuilder::escape("/dev/mapper/[x]*+?"));
    EXPECT_EQ(R"(\\(\\)\\{\\}\\^\\$\\|)",
              FilterBuilder::escape("(){}^$|"));
    EXPECT_EQ("/dev/mapper/plain-name_1",
              FilterBuilder::escape("/dev/mapper/plain-name_1"));
}

}

// Local Variables: **
// mode: c++ **
// End: **
