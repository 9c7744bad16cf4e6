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

#include "../ConfigBuilder.h"
#include "../FilterBuilder.h"

#include <sstream>

#include <gtest/gtest.h>

namespace lvmcoordtest
{

using namespace lvmcoord;

class ConfigBuilderTest
    : public testing::Test
{
protected:
    static std::string
    expected(const std::string& filter,
             unsigned locking_type)
    {
        std::stringstream ss;
        ss << "devices { "
            " preferred_names=[\"^/dev/mapper/\"] "
            " ignore_suspended_devices=1 "
            " write_cache_state=0 "
            " disable_after_error_count=3 "
            " filter=" << filter << " "
            "} "
            "global { "
            " locking_type=" << locking_type << " "
            " prioritise_write_locks=1 "
            " wait_for_locks=1 "
            " use_lvmetad=0 "
            "} "
            "backup { "
            " retain_min=50 "
            " retain_days=0 "
            "}";
        return ss.str();
    }
};

TEST_F(ConfigBuilderTest, exclusive)
{
    const std::string filter(R"(["a|^/dev/mapper/a$|^/dev/mapper/b$|", "r|.*|"])");
    EXPECT_EQ(expected(filter, 1),
              ConfigBuilder::build(filter,
                                   LockingMode::Exclusive));
}

TEST_F(ConfigBuilderTest, shared)
{
    const std::string filter(R"(["a|^/dev/mapper/a$|^/dev/mapper/b$|", "r|.*|"])");
    EXPECT_EQ(expected(filter, 4),
              ConfigBuilder::build(filter,
                                   LockingMode::Shared));
}

TEST_F(ConfigBuilderTest, golden)
{
    EXPECT_EQ("devices {  preferred_names=[\"^/dev/mapper/\"]  "
              "ignore_suspended_devices=1  write_cache_state=0  "
              "disable_after_error_count=3  filter=[\"r|.*|\"] } "
              "global {  locking_type=1  prioritise_write_locks=1  "
              "wait_for_locks=1  use_lvmetad=0 } "
              "backup {  retain_min=50  retain_days=0 }",
              ConfigBuilder::build(FilterBuilder::build(DeviceList()),
                                   LockingMode::Exclusive));
}

TEST_F(ConfigBuilderTest, deterministic)
{
    const std::string filter(FilterBuilder::build(DeviceList{ "/dev/mapper/x" }));
    EXPECT_EQ(ConfigBuilder::build(filter,
                                   LockingMode::Shared),
              ConfigBuilder::build(filter,
                                   LockingMode::Shared));
    EXPECT_NE(ConfigBuilder::build(filter,
                                   LockingMode::Shared),
              ConfigBuilder::build(filter,
                                   LockingMode::Exclusive));
}

TEST_F(ConfigBuilderTest, lock_types)
{
    EXPECT_EQ(1U, lock_type(LockingMode::Exclusive));
    EXPECT_EQ(4U, lock_type(LockingMode::Shared));
}

TEST_F(ConfigBuilderTest, locking_mode_streaming)
{
    std::stringstream ss;
    ss << LockingMode::Exclusive << " " << LockingMode::Shared;
    EXPECT_EQ("exclusive shared", ss.str());

    LockingMode m1 = LockingMode::Shared;
    LockingMode m2 = LockingMode::Exclusive;
    ss >> m1 >> m2;
    ASSERT_FALSE(ss.fail());
    EXPECT_EQ(LockingMode::Exclusive, m1);
    EXPECT_EQ(LockingMode::Shared, m2);

    std::stringstream bad("readonly");
    bad >> m1;
    EXPECT_TRUE(bad.fail());
}

}

// Local Variables: **
// mode: c++ **
// End: **
