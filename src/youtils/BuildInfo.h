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

#ifndef YT_BUILD_INFO_H_
#define YT_BUILD_INFO_H_

// The definitions are generated by the build from BuildInfo.cpp.in.

struct BuildInfo
{
    static const char* version;

    static const char* revision;

    static const char* build_type;

    static const char* buildTime;
};

#endif // !YT_BUILD_INFO_H_

// Local Variables: **
// mode: c++ **
// End: **
