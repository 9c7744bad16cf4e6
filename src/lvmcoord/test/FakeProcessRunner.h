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

#ifndef LVMCOORD_TEST_FAKE_PROCESS_RUNNER_H_
#define LVMCOORD_TEST_FAKE_PROCESS_RUNNER_H_

#include "../ProcessRunner.h"

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

#include <boost/chrono.hpp>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

#include <youtils/ScopeExit.h>

namespace lvmcoordtest
{

// Records the command lines it is asked to run and answers with whatever
// the handler returns for the n-th (0 based) call.
class FakeProcessRunner
    : public lvmcoord::ProcessRunner
{
public:
    using Args = std::vector<std::string>;
    using Handler = std::function<lvmcoord::CommandResult(size_t,
                                                          const Args&)>;

    explicit FakeProcessRunner(Handler handler = succeed(""),
                               boost::chrono::milliseconds delay = boost::chrono::milliseconds(0))
        : handler_(std::move(handler))
        , delay_(delay)
        , running_(0)
        , max_running_(0)
    {}

    ~FakeProcessRunner() = default;

    lvmcoord::CommandResult
    run(const Args& args,
        const Privileged privileged) override final
    {
        size_t n;

        {
            boost::lock_guard<decltype(lock_)> g(lock_);
            n = calls_.size();
            calls_.push_back(args);
            privileged_.push_back(privileged);
            ++running_;
            max_running_ = std::max(max_running_, running_);
        }

        auto on_exit(youtils::make_scope_exit([&]
                                              {
                                                  boost::lock_guard<decltype(lock_)> g(lock_);
                                                  --running_;
                                              }));

        if (delay_.count() > 0)
        {
            boost::this_thread::sleep_for(delay_);
        }

        return handler_(n,
                        args);
    }

    static lvmcoord::CommandResult
    result(int status,
           const std::string& out = "",
           const std::string& err = "")
    {
        lvmcoord::CommandResult res;
        res.status = status;
        res.out = out;
        res.err = err;
        return res;
    }

    static Handler
    succeed(const std::string& out = "")
    {
        return [out](size_t, const Args&)
        {
            return result(0, out);
        };
    }

    static Handler
    fail(int status = 5)
    {
        return [status](size_t, const Args&)
        {
            return result(status, "", "  Volume group \"vg\" not found");
        };
    }

    // fails the first n calls
    static Handler
    fail_times(size_t n)
    {
        return [n](size_t call, const Args&)
        {
            return call < n ?
                result(5, "", "  Checksum error") :
                result(0, "ok");
        };
    }

    std::vector<Args>
    calls() const
    {
        boost::lock_guard<decltype(lock_)> g(lock_);
        return calls_;
    }

    size_t
    count() const
    {
        boost::lock_guard<decltype(lock_)> g(lock_);
        return calls_.size();
    }

    std::vector<Privileged>
    privileged() const
    {
        boost::lock_guard<decltype(lock_)> g(lock_);
        return privileged_;
    }

    size_t
    max_running() const
    {
        boost::lock_guard<decltype(lock_)> g(lock_);
        return max_running_;
    }

private:
    mutable boost::mutex lock_;
    const Handler handler_;
    const boost::chrono::milliseconds delay_;
    std::vector<Args> calls_;
    std::vector<Privileged> privileged_;
    size_t running_;
    size_t max_running_;
};

// "<filter>" from a --config text
inline std::string
filter_of(const std::string& config)
{
    const std::string key(" filter=");
    const size_t b = config.find(key);
    if (b == std::string::npos)
    {
        return std::string();
    }

    const size_t start = b + key.size();
    const size_t e = config.find(" } global", start);
    return config.substr(start, e - start);
}

// the --config argument of a recorded lvm command line
inline std::string
config_of(const FakeProcessRunner::Args& args)
{
    return args.size() > 3 ? args[3] : std::string();
}

}

#endif // !LVMCOORD_TEST_FAKE_PROCESS_RUNNER_H_

// Local Variables: **
// mode: c++ **
// End: **
