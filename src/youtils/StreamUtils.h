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

#ifndef YT_STREAM_UTILS_H_
#define YT_STREAM_UTILS_H_

#include "Logging.h"

#include <iostream>
#include <string>
#include <type_traits>

namespace youtils
{

struct StreamUtils
{
    // Enum <-> string translations kept in a map-like container
    // (typically the two views of a boost::bimap).
    template<typename M>
    static std::ostream&
    stream_out(const M& m,
               std::ostream& os,
               const typename M::key_type& k)
    {
        const auto it = m.find(k);
        if (it != m.end())
        {
            os << it->second;
        }
        else
        {
            os.setstate(std::ios_base::failbit);
        }

        return os;
    }

    template<typename M>
    static std::istream&
    stream_in(const M& m,
              std::istream& is,
              typename std::remove_const<typename M::mapped_type>::type& t)
    {
        std::string s;
        is >> s;

        const auto it = m.find(s);
        if (it != m.end())
        {
            t = it->second;
        }
        else
        {
            LOG_ERROR("Cannot parse \"" << s << "\"");
            is.setstate(std::ios_base::failbit);
        }

        return is;
    }

    // "[a, b, c]"
    template<typename S>
    static std::ostream&
    stream_out_sequence(std::ostream& os,
                        const S& seq)
    {
        const char* sep = "";

        os << "[";
        for (const auto& s : seq)
        {
            os << sep << s;
            sep = ", ";
        }
        os << "]";

        return os;
    }

    DECLARE_LOGGER("StreamUtils");
};

}

#endif // !YT_STREAM_UTILS_H_

// Local Variables: **
// mode: c++ **
// End: **
