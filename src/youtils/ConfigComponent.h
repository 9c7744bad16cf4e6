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

#ifndef YT_CONFIG_COMPONENT_H_
#define YT_CONFIG_COMPONENT_H_

#include "BooleanEnum.h"
#include "ConfigurationReport.h"
#include "InitializedParam.h"
#include "Logging.h"

#include <sstream>

#include <boost/filesystem.hpp>
#include <boost/property_tree/ptree_fwd.hpp>

BOOLEAN_ENUM(VerifyConfig);

namespace youtils
{

// Base of all classes that are configured from a section of the JSON
// configuration.
class ConfigComponent
{
protected:
    // Just to make sure derived classes have a constructor from a property tree
    explicit ConfigComponent(const boost::property_tree::ptree&);

public:
    ConfigComponent() = delete;

    ConfigComponent(const ConfigComponent&) = default;

    ConfigComponent&
    operator=(const ConfigComponent&) = default;

    virtual ~ConfigComponent() = default;

    virtual const char*
    componentName() const = 0;

    virtual void
    persist(boost::property_tree::ptree&,
            const ReportDefault) const = 0;

    // Returns false and adds to the report if the configuration in the
    // ptree is not acceptable.
    virtual bool
    checkConfig(const boost::property_tree::ptree&,
                ConfigurationReport&) const = 0;

    static void
    verify_property_tree(const boost::property_tree::ptree&);

    static boost::property_tree::ptree
    read_config(std::stringstream&,
                VerifyConfig);

    static boost::property_tree::ptree
    read_config_file(const boost::filesystem::path&,
                     VerifyConfig);

private:
    DECLARE_LOGGER("ConfigComponent");
};

}

#endif // !YT_CONFIG_COMPONENT_H_

// Local Variables: **
// mode: c++ **
// End: **
