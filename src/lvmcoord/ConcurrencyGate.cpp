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

#include "ConcurrencyGate.h"

#include <boost/thread/lock_guard.hpp>

#include <youtils/Assert.h>

namespace lvmcoord
{

#define LOCK()                                          \
    boost::lock_guard<decltype(lock_)> lg__(lock_)

ConcurrencyGate::ConcurrencyGate(const size_t capacity)
    : capacity_(capacity)
    , available_(capacity)
{
    VERIFY(capacity_ > 0);
}

void
ConcurrencyGate::acquire()
{
    boost::unique_lock<decltype(lock_)> u(lock_);

    cond_.wait(u,
               [&]() -> bool
               {
                   return available_ > 0;
               });

    --available_;
}

void
ConcurrencyGate::release()
{
    {
        LOCK();

        VERIFY(available_ < capacity_);
        ++available_;
    }

    cond_.notify_one();
}

size_t
ConcurrencyGate::available() const
{
    LOCK();
    return available_;
}

}

// Local Variables: **
// mode: c++ **
// End: **
