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

#include "../DirectoryDeviceView.h"
#include "../FilterBuilder.h"

#include <boost/filesystem/fstream.hpp>

#include <youtils/TestBase.h>

namespace lvmcoordtest
{

using namespace lvmcoord;

namespace fs = boost::filesystem;

class DirectoryDeviceViewTest
    : public youtilstest::TestBase
{
protected:
    virtual void
    SetUp() override final
    {
        TestBase::SetUp();
        dir_ = directory() / "mapper";
        fs::create_directories(dir_);
    }

    void
    touch(const std::string& name)
    {
        fs::ofstream f(dir_ / name);
    }

    fs::path dir_;
};

TEST_F(DirectoryDeviceViewTest, empty)
{
    DirectoryDeviceView view(dir_);
    EXPECT_TRUE(view.devices().empty());
}

TEST_F(DirectoryDeviceViewTest, entries)
{
    touch("control");
    touch("360014051f8a0a3a1");
    touch("360014051f8a0a3a2");

    DirectoryDeviceView view(dir_);

    EXPECT_EQ(DeviceSnapshot({ (dir_ / "360014051f8a0a3a1").string(),
                               (dir_ / "360014051f8a0a3a2").string() }),
              FilterBuilder::normalize(view.devices()));
}

TEST_F(DirectoryDeviceViewTest, missing_directory)
{
    DirectoryDeviceView view(dir_ / "does-not-exist");
    EXPECT_THROW(view.devices(),
                 DeviceViewException);
}

}

// Local Variables: **
// mode: c++ **
// End: **
