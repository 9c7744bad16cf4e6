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

#include "FakeDeviceView.h"

#include "../CommandCache.h"
#include "../ConfigBuilder.h"
#include "../FilterBuilder.h"

#include <gtest/gtest.h>

namespace lvmcoordtest
{

using namespace lvmcoord;

class CommandCacheTest
    : public testing::Test
{
protected:
    CommandCacheTest()
        : view_(DeviceList{ "/dev/mapper/a",
                            "/dev/mapper/b" })
    {}

    FakeDeviceView view_;
};

TEST_F(CommandCacheTest, build)
{
    CommandCache cache;
    EXPECT_FALSE(cache.current());

    const CommandCache::EntryPtr e(cache.get_or_build(view_,
                                                      LockingMode::Exclusive));
    ASSERT_TRUE(e != nullptr);

    EXPECT_EQ(DeviceSnapshot({ "/dev/mapper/a", "/dev/mapper/b" }),
              e->snapshot);
    EXPECT_EQ(LockingMode::Exclusive, e->mode);
    EXPECT_EQ(R"(["a|^/dev/mapper/a$|^/dev/mapper/b$|", "r|.*|"])",
              e->filter);
    EXPECT_EQ(ConfigBuilder::build(e->filter,
                                   LockingMode::Exclusive),
              e->config);
    EXPECT_EQ(e, cache.current());
}

TEST_F(CommandCacheTest, cached)
{
    CommandCache cache;

    const CommandCache::EntryPtr e1(cache.get_or_build(view_,
                                                       LockingMode::Exclusive));
    EXPECT_EQ(1U, view_.queries());

    // a change of devices is not noticed unless asked for
    view_.set_devices(DeviceList{ "/dev/mapper/c" });

    const CommandCache::EntryPtr e2(cache.get_or_build(view_,
                                                       LockingMode::Exclusive));
    EXPECT_EQ(1U, view_.queries());
    EXPECT_EQ(e1, e2);
}

TEST_F(CommandCacheTest, other_mode)
{
    CommandCache cache;

    const CommandCache::EntryPtr e1(cache.get_or_build(view_,
                                                       LockingMode::Exclusive));
    const CommandCache::EntryPtr e2(cache.get_or_build(view_,
                                                       LockingMode::Shared));
    EXPECT_NE(e1, e2);
    EXPECT_EQ(e1->filter, e2->filter);
    EXPECT_EQ(LockingMode::Shared, e2->mode);
    EXPECT_NE(std::string::npos, e2->config.find(" locking_type=4 "));
    EXPECT_EQ(2U, view_.queries());
}

TEST_F(CommandCacheTest, invalidate)
{
    CommandCache cache;

    const CommandCache::EntryPtr e1(cache.get_or_build(view_,
                                                       LockingMode::Exclusive));
    cache.invalidate();
    EXPECT_FALSE(cache.current());

    // the old entry stays usable
    EXPECT_EQ(R"(["a|^/dev/mapper/a$|^/dev/mapper/b$|", "r|.*|"])",
              e1->filter);

    view_.set_devices(DeviceList{ "/dev/mapper/c" });

    const CommandCache::EntryPtr e2(cache.get_or_build(view_,
                                                       LockingMode::Exclusive));
    EXPECT_EQ(2U, view_.queries());
    EXPECT_EQ(R"(["a|^/dev/mapper/c$|", "r|.*|"])",
              e2->filter);
}

TEST_F(CommandCacheTest, staleness)
{
    CommandCache cache;

    const CommandCache::EntryPtr e(cache.get_or_build(view_,
                                                      LockingMode::Shared));
    EXPECT_FALSE(cache.is_stale(*e,
                                view_));

    // same set, different order and whitespace
    view_.set_devices(DeviceList{ " /dev/mapper/b",
                                  "/dev/mapper/a" });
    EXPECT_FALSE(cache.is_stale(*e,
                                view_));

    view_.set_devices(DeviceList{ "/dev/mapper/a",
                                  "/dev/mapper/b",
                                  "/dev/mapper/c" });
    EXPECT_TRUE(cache.is_stale(*e,
                               view_));

    view_.set_devices(DeviceList{ "/dev/mapper/a" });
    EXPECT_TRUE(cache.is_stale(*e,
                               view_));
}

TEST_F(CommandCacheTest, refresh)
{
    CommandCache cache;

    const CommandCache::EntryPtr e1(cache.get_or_build(view_,
                                                       LockingMode::Shared));

    view_.set_devices(DeviceList{ "/dev/mapper/c" });

    const CommandCache::EntryPtr e2(cache.refresh(view_,
                                                  LockingMode::Shared));
    EXPECT_NE(e1, e2);
    EXPECT_EQ(e2, cache.current());
    EXPECT_EQ(DeviceSnapshot({ "/dev/mapper/c" }),
              e2->snapshot);
    EXPECT_FALSE(cache.is_stale(*e2,
                                view_));
}

TEST_F(CommandCacheTest, extra_devices)
{
    CommandCache cache(DeviceList{ "/dev/sda2" });

    const CommandCache::EntryPtr e(cache.get_or_build(view_,
                                                      LockingMode::Exclusive));
    EXPECT_EQ(DeviceSnapshot({ "/dev/mapper/a", "/dev/mapper/b", "/dev/sda2" }),
              e->snapshot);
    EXPECT_FALSE(cache.is_stale(*e,
                                view_));

    view_.set_devices(DeviceList());

    const CommandCache::EntryPtr f(cache.refresh(view_,
                                                 LockingMode::Exclusive));
    EXPECT_EQ(R"(["a|^/dev/sda2$|", "r|.*|"])",
              f->filter);
}

TEST_F(CommandCacheTest, explicit_devices)
{
    CommandCache cache(DeviceList{ "/dev/sda2" });

    const CommandCache::EntryPtr e(cache.build_entry(DeviceList{ "/dev/mapper/x" },
                                                     LockingMode::Shared));
    EXPECT_EQ(R"(["a|^/dev/mapper/x$|^/dev/sda2$|", "r|.*|"])",
              e->filter);
    EXPECT_EQ(LockingMode::Shared, e->mode);

    EXPECT_EQ(0U, view_.queries());
    EXPECT_FALSE(cache.current());
}

TEST_F(CommandCacheTest, view_failure)
{
    CommandCache cache;

    view_.set_failing(true);

    EXPECT_THROW(cache.get_or_build(view_,
                                    LockingMode::Exclusive),
                 DeviceViewException);
    EXPECT_FALSE(cache.current());

    view_.set_failing(false);

    const CommandCache::EntryPtr e(cache.get_or_build(view_,
                                                      LockingMode::Exclusive));
    EXPECT_EQ(e, cache.current());

    view_.set_failing(true);

    EXPECT_THROW(cache.is_stale(*e,
                                view_),
                 DeviceViewException);
    EXPECT_EQ(e, cache.current());
}

TEST_F(CommandCacheTest, empty_view)
{
    CommandCache cache;
    view_.set_devices(DeviceList());

    const CommandCache::EntryPtr e(cache.get_or_build(view_,
                                                      LockingMode::Exclusive));
    EXPECT_TRUE(e->snapshot.empty());
    EXPECT_EQ(R"(["r|.*|"])",
              e->filter);
}

}

// Local Variables: **
// mode: c++ **
// End: **
