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

#ifndef LVMCOORD_TEST_FAKE_DEVICE_VIEW_H_
#define LVMCOORD_TEST_FAKE_DEVICE_VIEW_H_

#include "../DeviceView.h"

#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>

namespace lvmcoordtest
{

class FakeDeviceView
    : public lvmcoord::DeviceView
{
public:
    explicit FakeDeviceView(const lvmcoord::DeviceList& devices = lvmcoord::DeviceList())
        : devices_(devices)
        , fail_(false)
        , queries_(0)
    {}

    ~FakeDeviceView() = default;

    lvmcoord::DeviceList
    devices() override final
    {
        boost::lock_guard<decltype(lock_)> g(lock_);

        ++queries_;
        if (fail_)
        {
            throw lvmcoord::DeviceViewException("device view unavailable");
        }

        return devices_;
    }

    void
    set_devices(const lvmcoord::DeviceList& devices)
    {
        boost::lock_guard<decltype(lock_)> g(lock_);
        devices_ = devices;
    }

    void
    set_failing(bool fail)
    {
        boost::lock_guard<decltype(lock_)> g(lock_);
        fail_ = fail;
    }

    size_t
    queries() const
    {
        boost::lock_guard<decltype(lock_)> g(lock_);
        return queries_;
    }

private:
    mutable boost::mutex lock_;
    lvmcoord::DeviceList devices_;
    bool fail_;
    size_t queries_;
};

}

#endif // !LVMCOORD_TEST_FAKE_DEVICE_VIEW_H_

// Local Variables: **
// mode: c++ **
// End: **
