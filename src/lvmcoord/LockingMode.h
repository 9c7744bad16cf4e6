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

#ifndef LVMCOORD_LOCKING_MODE_H_
#define LVMCOORD_LOCKING_MODE_H_

#include <iosfwd>

namespace lvmcoord
{

// Exclusive: this node is the only one allowed to modify lvm metadata.
// Shared: metadata is read without locking and may change underneath.
enum class LockingMode
{
    Exclusive,
    Shared,
};

// lvm's global/locking_type for the mode.
unsigned
lock_type(const LockingMode);

std::ostream&
operator<<(std::ostream&,
           const LockingMode);

std::istream&
operator>>(std::istream&,
           LockingMode&);

}

#endif // !LVMCOORD_LOCKING_MODE_H_

// Local Variables: **
// mode: c++ **
// End: **
