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
#include "ConfigBuilder.h"
#include "DeviceView.h"
#include "FilterBuilder.h"

#include <boost/thread/lock_guard.hpp>

namespace lvmcoord
{

#define LOCK()                                          \
    boost::lock_guard<decltype(lock_)> lg__(lock_)

CommandCache::Entry::Entry(DeviceSnapshot snap,
                           const LockingMode m)
    : snapshot(std::move(snap))
    , mode(m)
    , filter(FilterBuilder::build(snapshot))
    , config(ConfigBuilder::build(filter,
                                  mode))
{}

CommandCache::CommandCache(const DeviceList& extra_devices)
    : generation_(0)
    , extra_devices_(extra_devices)
{}

DeviceSnapshot
CommandCache::snapshot_(DeviceView& view) const
{
    return FilterBuilder::normalize(view.devices(),
                                    extra_devices_);
}

CommandCache::EntryPtr
CommandCache::get_or_build(DeviceView& view,
                           const LockingMode mode)
{
    uint64_t gen;

    {
        LOCK();
        if (entry_ and entry_->mode == mode)
        {
            return entry_;
        }

        gen = generation_;
    }

    auto entry(std::make_shared<const Entry>(snapshot_(view),
                                             mode));

    LOCK();

    if (gen == generation_)
    {
        entry_ = entry;
    }

    return entry;
}

CommandCache::EntryPtr
CommandCache::refresh(DeviceView& view,
                      const LockingMode mode)
{
    auto entry(std::make_shared<const Entry>(snapshot_(view),
                                             mode));

    LOG_INFO("filter rebuilt: " << entry->filter);

    LOCK();

    ++generation_;
    entry_ = entry;

    return entry;
}

void
CommandCache::invalidate()
{
    LOCK();

    ++generation_;
    entry_ = nullptr;
}

bool
CommandCache::is_stale(const Entry& entry,
                       DeviceView& view) const
{
    return snapshot_(view) != entry.snapshot;
}

CommandCache::EntryPtr
CommandCache::build_entry(const DeviceList& devices,
                          const LockingMode mode) const
{
    return std::make_shared<const Entry>(FilterBuilder::normalize(devices,
                                                                  extra_devices_),
                                         mode);
}

CommandCache::EntryPtr
CommandCache::current() const
{
    LOCK();
    return entry_;
}

}

// Local Variables: **
// mode: c++ **
// End: **
