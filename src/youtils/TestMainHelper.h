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

#ifndef YT_TEST_MAIN_HELPER_H_
#define YT_TEST_MAIN_HELPER_H_

#include "MainHelper.h"

namespace youtils
{

// Base for the main of gtest binaries: the standard logging options are
// handled by MainHelper, the remaining ones are handed to gtest.
class TestMainHelper
    : public MainHelper
{
protected:
    TestMainHelper(int argc,
                   char** argv);

    virtual ~TestMainHelper() = default;

    void
    log_google_test_help(std::ostream&);

    void
    init_google_test();

    virtual int
    run() override;

private:
    static void
    sighand(int);
};

}

#endif // !YT_TEST_MAIN_HELPER_H_

// Local Variables: **
// mode: c++ **
// End: **
