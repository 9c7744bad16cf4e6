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

#include "InitializedParam.h"

#include <iostream>
#include <set>

#include <boost/property_tree/json_parser.hpp>

namespace initialized_params
{

namespace bpt = boost::property_tree;

std::list<ParameterInfo*>&
ParameterInfo::get_parameter_info_list()
{
    static std::list<ParameterInfo*> parameter_infos;
    return parameter_infos;
}

void
ParameterInfo::verify_property_tree(const bpt::ptree& ptree)
{
    bpt::ptree pt(ptree);
    std::set<std::string> sections;

    // Two passes as nested keys cannot be removed directly:
    // (1) drop all known keys from their sections
    // (2) drop all sections that became empty
    // Anything left over is unknown.
    for (const auto info : get_parameter_info_list())
    {
        sections.insert(info->section_name);
        auto it = pt.find(info->section_name);
        if (it != pt.not_found())
        {
            it->second.erase(info->name);
        }
    }

    for (const auto& s : sections)
    {
        auto it = pt.find(s);
        if (it != pt.not_found() and it->second.empty())
        {
            pt.erase(pt.to_iterator(it));
        }
    }

    if (not pt.empty())
    {
        std::stringstream ss;
        bpt::json_parser::write_json(ss, pt);
        LOG_ERROR("property tree contains unknown entries:\n" << ss.str());

        throw UnknownParameterException("unknown parameters in property tree");
    }
}

void
ParameterInfo::document(std::ostream& os)
{
    for (const auto info : get_parameter_info_list())
    {
        if (T(info->document_))
        {
            os << info->section_name << "." << info->name << ": " <<
                info->doc_string;
            if (info->has_default)
            {
                os << " (default: " << info->def_ << ")";
            }
            os << std::endl;
        }
    }
}

}

// Local Variables: **
// mode: c++ **
// End: **
