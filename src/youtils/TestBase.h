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

#ifndef YT_TEST_BASE_H_
#define YT_TEST_BASE_H_

#include "Logging.h"

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

namespace youtilstest
{

// Fixture providing each test with its own scratch directory below the
// system temp dir. It is created before and removed after every test.
class TestBase
    : public testing::Test
{
protected:
    virtual void
    SetUp() override;

    virtual void
    TearDown() override;

    const boost::filesystem::path&
    directory() const
    {
        return directory_;
    }

private:
    DECLARE_LOGGER("TestBase");

    boost::filesystem::path directory_;
};

}

#endif // !YT_TEST_BASE_H_

// Local Variables: **
// mode: c++ **
// End: **
