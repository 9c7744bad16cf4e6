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

#ifndef YT_SCOPE_EXIT_H_
#define YT_SCOPE_EXIT_H_

#include <type_traits>
#include <utility>

namespace youtils
{

// Runs f when leaving the scope, no matter how. f must not throw.
template<typename F>
class ScopeExit
{
public:
    explicit ScopeExit(F f)
        : f_(std::move(f))
        , armed_(true)
    {}

    ScopeExit(ScopeExit&& other)
        : f_(std::move(other.f_))
        , armed_(other.armed_)
    {
        other.armed_ = false;
    }

    ~ScopeExit()
    {
        if (armed_)
        {
            f_();
        }
    }

    ScopeExit(const ScopeExit&) = delete;

    ScopeExit&
    operator=(const ScopeExit&) = delete;

    void
    dismiss()
    {
        armed_ = false;
    }

private:
    F f_;
    bool armed_;
};

template<typename F>
ScopeExit<typename std::decay<F>::type>
make_scope_exit(F&& f)
{
    return ScopeExit<typename std::decay<F>::type>(std::forward<F>(f));
}

}

#endif // !YT_SCOPE_EXIT_H_

// Local Variables: **
// mode: c++ **
// End: **
