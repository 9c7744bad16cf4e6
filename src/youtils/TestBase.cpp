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

#include "TestBase.h"

namespace youtilstest
{

namespace fs = boost::filesystem;

void
TestBase::SetUp()
{
    const testing::TestInfo* info =
        testing::UnitTest::GetInstance()->current_test_info();

    directory_ = fs::temp_directory_path() /
        fs::unique_path(std::string(info->test_case_name()) + "-%%%%-%%%%");
    fs::create_directories(directory_);
}

void
TestBase::TearDown()
{
    boost::system::error_code ec;
    fs::remove_all(directory_,
                   ec);
    if (ec)
    {
        LOG_ERROR("Failed to remove " << directory_ << ": " << ec.message());
    }
}

}

// Local Variables: **
// mode: c++ **
// End: **
