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

#include "CommandCache.h"
#include "ModeCoordinator.h"

#include <boost/thread/lock_guard.hpp>

#include <youtils/Assert.h>

namespace lvmcoord
{

#define LOCK()                                          \
    boost::lock_guard<decltype(lock_)> lg__(lock_)

ModeCoordinator::ModeCoordinator(const LockingMode initial,
                                 CommandCache& cache)
    : mode_(initial)
    , switching_(false)
    , in_flight_(0)
    , cache_(cache)
{}

LockingMode
ModeCoordinator::enter()
{
    boost::unique_lock<decltype(lock_)> u(lock_);

    cond_.wait(u,
               [&]() -> bool
               {
                   return not switching_;
               });

    ++in_flight_;
    return mode_;
}

void
ModeCoordinator::leave()
{
    LOCK();

    VERIFY(in_flight_ > 0);
    if (--in_flight_ == 0)
    {
        cond_.notify_all();
    }
}

void
ModeCoordinator::set_mode(const LockingMode mode)
{
    boost::unique_lock<decltype(lock_)> u(lock_);

    cond_.wait(u,
               [&]() -> bool
               {
                   return not switching_;
               });

    if (mode_ == mode)
    {
        return;
    }

    LOG_INFO("switching from " << mode_ << " to " << mode << ", " <<
             in_flight_ << " commands in flight");

    switching_ = true;

    cond_.wait(u,
               [&]() -> bool
               {
                   return in_flight_ == 0;
               });

    cache_.invalidate();
    mode_ = mode;
    switching_ = false;

    cond_.notify_all();

    LOG_INFO("switched to " << mode_);
}

LockingMode
ModeCoordinator::mode() const
{
    LOCK();
    return mode_;
}

size_t
ModeCoordinator::in_flight() const
{
    LOCK();
    return in_flight_;
}

bool
ModeCoordinator::switching() const
{
    LOCK();
    return switching_;
}

}

// Local Variables: **
// mode: c++ **
// End: **
