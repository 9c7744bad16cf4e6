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

#ifndef YT_CATCHERS_H_
#define YT_CATCHERS_H_

#include <exception>

// body sees the exception description as `const char* EWHAT'
#define CATCH_STD_ALL_EWHAT(body)                                       \
    catch (std::exception& e)                                           \
    {                                                                   \
        const char* EWHAT = e.what();                                   \
        body                                                            \
    }                                                                   \
    catch (...)                                                         \
    {                                                                   \
        const char* EWHAT = "unknown exception";                        \
        body                                                            \
    }

#define CATCH_STD_ALL_LOGLEVEL_RETHROW(msg, loglevel)                   \
    CATCH_STD_ALL_EWHAT(                                                \
        LOG_##loglevel(msg << ": " << EWHAT);                           \
        throw; )

#define CATCH_STD_ALL_LOG_RETHROW(msg)                                  \
    CATCH_STD_ALL_LOGLEVEL_RETHROW(msg, ERROR)

#endif // !YT_CATCHERS_H_

// Local Variables: **
// mode: c++ **
// End: **
