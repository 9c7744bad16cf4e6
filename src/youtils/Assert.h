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

#ifndef YT_ASSERT_H_
#define YT_ASSERT_H_

#include "IOException.h"
#include "Logging.h"

#include <assert.h>

// Checked in release builds too: logs, asserts in debug builds and throws.
#define VERIFY(x)                                                       \
    do                                                                  \
    {                                                                   \
        if (not (x))                                                    \
        {                                                               \
            LOG_FATAL(__PRETTY_FUNCTION__ << ": " #x);                  \
            assert(x);                                                  \
            throw fungi::IOException("ASSERT: " #x, __PRETTY_FUNCTION__); \
        }                                                               \
    }                                                                   \
    while (false)

#define ASSERT(x) assert(x)

#define UNREACHABLE __builtin_unreachable();

#endif // !YT_ASSERT_H_

// Local Variables: **
// mode: c++ **
// End: **
