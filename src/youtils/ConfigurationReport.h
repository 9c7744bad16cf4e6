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

#ifndef YT_CONFIGURATION_REPORT_H_
#define YT_CONFIGURATION_REPORT_H_

#include <iostream>
#include <list>
#include <string>

namespace youtils
{

class ConfigurationProblem
{
public:
    ConfigurationProblem(const std::string& param_name,
                         const std::string& component_name,
                         const std::string& problem)
        : param_name_(param_name)
        , component_name_(component_name)
        , problem_(problem)
    {}

    // P is an InitializedParam
    template<typename P>
    ConfigurationProblem(const P& /* param */,
                         const std::string& problem)
        : param_name_(P::name())
        , component_name_(P::section_name())
        , problem_(problem)
    {}

    ~ConfigurationProblem() = default;

    ConfigurationProblem(const ConfigurationProblem&) = default;

    ConfigurationProblem&
    operator=(const ConfigurationProblem&) = default;

    bool
    operator==(const ConfigurationProblem& other) const
    {
        return param_name_ == other.param_name_ and
            component_name_ == other.component_name_ and
            problem_ == other.problem_;
    }

    const std::string&
    param_name() const
    {
        return param_name_;
    }

    const std::string&
    component_name() const
    {
        return component_name_;
    }

    const std::string&
    problem() const
    {
        return problem_;
    }

private:
    std::string param_name_;
    std::string component_name_;
    std::string problem_;
};

using ConfigurationReport = std::list<ConfigurationProblem>;

inline std::ostream&
operator<<(std::ostream& os,
           const ConfigurationProblem& p)
{
    return os << p.component_name() << "." << p.param_name() << ": " << p.problem();
}

}

#endif // !YT_CONFIGURATION_REPORT_H_

// Local Variables: **
// mode: c++ **
// End: **
