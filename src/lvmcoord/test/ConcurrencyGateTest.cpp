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

#include "../ConcurrencyGate.h"

#include <atomic>

#include <boost/chrono.hpp>
#include <boost/thread/thread.hpp>

#include <gtest/gtest.h>

namespace lvmcoordtest
{

using namespace lvmcoord;

class ConcurrencyGateTest
    : public testing::Test
{};

TEST_F(ConcurrencyGateTest, slots)
{
    ConcurrencyGate gate(3);

    EXPECT_EQ(3U, gate.capacity());
    EXPECT_EQ(3U, gate.available());

    gate.acquire();
    EXPECT_EQ(2U, gate.available());

    {
        ConcurrencyGate::Slot s1(gate);
        ConcurrencyGate::Slot s2(gate);
        EXPECT_EQ(0U, gate.available());
    }

    EXPECT_EQ(2U, gate.available());

    gate.release();
    EXPECT_EQ(3U, gate.available());
}

TEST_F(ConcurrencyGateTest, blocks_when_exhausted)
{
    ConcurrencyGate gate(1);
    gate.acquire();

    std::atomic<bool> acquired(false);

    boost::thread t([&]
                    {
                        ConcurrencyGate::Slot s(gate);
                        acquired = true;
                    });

    boost::this_thread::sleep_for(boost::chrono::milliseconds(100));
    EXPECT_FALSE(acquired);

    gate.release();
    t.join();

    EXPECT_TRUE(acquired);
    EXPECT_EQ(1U, gate.available());
}

TEST_F(ConcurrencyGateTest, bounded)
{
    const size_t capacity = 4;
    ConcurrencyGate gate(capacity);

    std::atomic<size_t> running(0);
    std::atomic<size_t> max_running(0);

    boost::thread_group threads;

    for (size_t i = 0; i < 16; ++i)
    {
        threads.create_thread([&]
                              {
                                  ConcurrencyGate::Slot s(gate);
                                  const size_t r = ++running;

                                  size_t m = max_running;
                                  while (r > m and
                                         not max_running.compare_exchange_weak(m, r))
                                  {}

                                  boost::this_thread::sleep_for(boost::chrono::milliseconds(20));
                                  --running;
                              });
    }

    threads.join_all();

    EXPECT_GE(capacity, max_running.load());
    EXPECT_LT(0U, max_running.load());
    EXPECT_EQ(capacity, gate.available());
}

}

// Local Variables: **
// mode: c++ **
// End: **
