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

#ifndef LVMCOORD_CONCURRENCY_GATE_H_
#define LVMCOORD_CONCURRENCY_GATE_H_

#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

#include <youtils/Logging.h>

namespace lvmcoord
{

// Limits the number of lvm processes running at the same time.
class ConcurrencyGate
{
public:
    explicit ConcurrencyGate(const size_t capacity);

    ~ConcurrencyGate() = default;

    ConcurrencyGate(const ConcurrencyGate&) = delete;

    ConcurrencyGate&
    operator=(const ConcurrencyGate&) = delete;

    // Blocks until a slot is free.
    void
    acquire();

    void
    release();

    size_t
    available() const;

    size_t
    capacity() const
    {
        return capacity_;
    }

    class Slot
    {
    public:
        explicit Slot(ConcurrencyGate& gate)
            : gate_(gate)
        {
            gate_.acquire();
        }

        ~Slot()
        {
            gate_.release();
        }

        Slot(const Slot&) = delete;

        Slot&
        operator=(const Slot&) = delete;

    private:
        ConcurrencyGate& gate_;
    };

private:
    DECLARE_LOGGER("ConcurrencyGate");

    mutable boost::mutex lock_;
    boost::condition_variable cond_;

    const size_t capacity_;
    size_t available_;
};

}

#endif // !LVMCOORD_CONCURRENCY_GATE_H_

// Local Variables: **
// mode: c++ **
// End: **
