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

#ifndef LVMCOORD_COMMAND_CACHE_H_
#define LVMCOORD_COMMAND_CACHE_H_

#include "LockingMode.h"
#include "Types.h"

#include <cstdint>
#include <memory>
#include <string>

#include <boost/thread/mutex.hpp>

#include <youtils/Logging.h>

namespace lvmcoord
{

class DeviceView;

// Caches the --config text built from the devices visible at build time.
// The cached entry is replaced as a whole; holders of an older entry keep
// using it unaffected.
class CommandCache
{
public:
    struct Entry
    {
        Entry(DeviceSnapshot snap,
              const LockingMode m);

        const DeviceSnapshot snapshot;
        const LockingMode mode;
        const std::string filter;
        const std::string config;
    };

    using EntryPtr = std::shared_ptr<const Entry>;

    explicit CommandCache(const DeviceList& extra_devices = DeviceList());

    ~CommandCache() = default;

    CommandCache(const CommandCache&) = delete;

    CommandCache&
    operator=(const CommandCache&) = delete;

    // Returns the cached entry if there is one for the given mode, otherwise
    // builds one from the devices reported by the view and caches it.
    // Errors from the view are passed on and nothing is cached.
    EntryPtr
    get_or_build(DeviceView& view,
                 const LockingMode mode);

    // Unconditionally rebuilds the entry from the view and caches it.
    EntryPtr
    refresh(DeviceView& view,
            const LockingMode mode);

    void
    invalidate();

    // Whether the devices reported by the view now differ from the ones
    // the entry was built from.
    bool
    is_stale(const Entry& entry,
             DeviceView& view) const;

    // An entry for an explicit device list that is not cached.
    EntryPtr
    build_entry(const DeviceList& devices,
                const LockingMode mode) const;

    EntryPtr
    current() const;

    const DeviceList&
    extra_devices() const
    {
        return extra_devices_;
    }

private:
    DECLARE_LOGGER("CommandCache");

    mutable boost::mutex lock_;
    EntryPtr entry_;
    // bumped by invalidate() so a build that raced with it is not cached
    uint64_t generation_;

    const DeviceList extra_devices_;

    DeviceSnapshot
    snapshot_(DeviceView& view) const;
};

}

#endif // !LVMCOORD_COMMAND_CACHE_H_

// Local Variables: **
// mode: c++ **
// End: **
