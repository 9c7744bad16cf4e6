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

#ifndef LVMCOORD_MODE_COORDINATOR_H_
#define LVMCOORD_MODE_COORDINATOR_H_

#include "LockingMode.h"

#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

#include <youtils/Logging.h>

namespace lvmcoord
{

class CommandCache;

// Tracks the commands in flight and switches the locking mode between
// them: a switch waits for all running commands to finish while newly
// arriving ones wait for the switch to complete.
class ModeCoordinator
{
public:
    ModeCoordinator(const LockingMode initial,
                    CommandCache& cache);

    ~ModeCoordinator() = default;

    ModeCoordinator(const ModeCoordinator&) = delete;

    ModeCoordinator&
    operator=(const ModeCoordinator&) = delete;

    // Blocks while a switch is in progress; the returned mode stays valid
    // until the matching leave().
    LockingMode
    enter();

    void
    leave();

    // Waits for the commands in flight to drain, so it must not be called
    // while holding a Guard.
    void
    set_mode(const LockingMode mode);

    LockingMode
    mode() const;

    size_t
    in_flight() const;

    bool
    switching() const;

    class Guard
    {
    public:
        explicit Guard(ModeCoordinator& coordinator)
            : coordinator_(coordinator)
            , mode_(coordinator_.enter())
        {}

        ~Guard()
        {
            coordinator_.leave();
        }

        Guard(const Guard&) = delete;

        Guard&
        operator=(const Guard&) = delete;

        LockingMode
        mode() const
        {
            return mode_;
        }

    private:
        ModeCoordinator& coordinator_;
        const LockingMode mode_;
    };

private:
    DECLARE_LOGGER("ModeCoordinator");

    mutable boost::mutex lock_;
    boost::condition_variable cond_;

    LockingMode mode_;
    bool switching_;
    size_t in_flight_;

    CommandCache& cache_;
};

}

#endif // !LVMCOORD_MODE_COORDINATOR_H_

// Local Variables: **
// mode: c++ **
// End: **
