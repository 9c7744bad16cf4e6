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

#include "LockingMode.h"

#include <iostream>
#include <string>
#include <vector>

#include <boost/bimap.hpp>

#include <youtils/Assert.h>
#include <youtils/StreamUtils.h>

namespace lvmcoord
{

namespace yt = youtils;

namespace
{

DECLARE_LOGGER("LockingMode");

void
reminder(LockingMode) __attribute__((unused));

void
reminder(LockingMode m)
{
    switch (m)
    {
    case LockingMode::Exclusive:
    case LockingMode::Shared:
        // If the compiler yells at you that you've forgotten dealing with an enum
        // value here chances are that it's also missing from the translations map
        // and from lock_type() below. If so add it NOW.
        break;
    }
}

using TranslationsMap = boost::bimap<LockingMode, std::string>;

TranslationsMap
init_translations()
{
    const std::vector<TranslationsMap::value_type> initv{
        { LockingMode::Exclusive, "exclusive" },
        { LockingMode::Shared, "shared" },
    };

    return TranslationsMap(initv.begin(),
                           initv.end());
}

}

unsigned
lock_type(const LockingMode m)
{
    switch (m)
    {
    case LockingMode::Exclusive:
        return 1;
    case LockingMode::Shared:
        return 4;
    }

    VERIFY(0 == "invalid LockingMode");
    UNREACHABLE;
}

std::ostream&
operator<<(std::ostream& os,
           const LockingMode m)
{
    static const TranslationsMap translations(init_translations());
    return yt::StreamUtils::stream_out(translations.left,
                                       os,
                                       m);
}

std::istream&
operator>>(std::istream& is,
           LockingMode& m)
{
    static const TranslationsMap translations(init_translations());
    return yt::StreamUtils::stream_in(translations.right,
                                      is,
                                      m);
}

}

// Local Variables: **
// mode: c++ **
// End: **
