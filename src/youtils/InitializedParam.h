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

#ifndef YT_INITIALIZED_PARAM_H_
#define YT_INITIALIZED_PARAM_H_

#include "Assert.h"
#include "BooleanEnum.h"
#include "Catchers.h"
#include "IOException.h"
#include "Logging.h"
#include "StreamUtils.h"

#include <atomic>
#include <list>
#include <sstream>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

BOOLEAN_ENUM(ShowDocumentation);
BOOLEAN_ENUM(ReportDefault);
BOOLEAN_ENUM(HasDefault);

namespace initialized_params
{

MAKE_EXCEPTION(MissingParameterException, fungi::IOException);
MAKE_EXCEPTION(MalformedParameterException, fungi::IOException);
MAKE_EXCEPTION(UnknownParameterException, fungi::IOException);

template<typename T>
struct SectionName;

template<typename T>
struct HasDefaultValue;

template<typename T>
struct Value
{
    using type = T;
};

template<typename T>
struct Value<std::atomic<T>>
{
    using type = T;
};

template<typename T>
struct ValueAccessor
{
    static const T&
    get(const T& t)
    {
        return t;
    }
};

template<typename T>
struct ValueAccessor<std::atomic<T>>
{
    static T
    get(const std::atomic<T>& a)
    {
        return a.load();
    }
};

template<typename T>
struct PropertyTreeAccessor
{
    static boost::optional<T>
    get_optional(const boost::property_tree::ptree& pt,
                 const std::string& path)
    {
        return pt.get_optional<T>(path);
    }

    static void
    put(boost::property_tree::ptree& pt,
        const std::string& path,
        const T& t)
    {
        pt.put<T>(path, t);
    }
};

// Specialize for the element type of vector parameters.
template<typename T>
struct PropertyTreeVectorAccessor;

template<>
struct PropertyTreeVectorAccessor<std::string>
{
    static std::string
    get(const boost::property_tree::ptree& pt)
    {
        return pt.get_value<std::string>();
    }

    static void
    put(boost::property_tree::ptree& pt,
        const std::string& s)
    {
        pt.put_value(s);
    }
};

// Vectors are stored as JSON arrays, i.e. children with empty keys.
template<typename T>
struct PropertyTreeAccessor<std::vector<T>>
{
    using Vector = std::vector<T>;
    using PTreeVectorAccessor = PropertyTreeVectorAccessor<T>;

    DECLARE_LOGGER("PropertyTreeAccessor");

    static boost::optional<Vector>
    get_optional(const boost::property_tree::ptree& pt,
                 const std::string& path)
    {
        const auto maybe_child(pt.get_child_optional(path));
        if (maybe_child == boost::none)
        {
            return boost::none;
        }

        Vector v;
        for (const auto& c : *maybe_child)
        {
            v.push_back(PTreeVectorAccessor::get(c.second));
        }

        if (v.empty())
        {
            const auto s(maybe_child->get_value_optional<std::string>());
            if (s and not s->empty())
            {
                LOG_ERROR(path << ": expected a list, found \"" << *s << "\"");
                throw MalformedParameterException("Expected a list, found a value",
                                                  path.c_str());
            }
        }

        return v;
    }

    static void
    put(boost::property_tree::ptree& pt,
        const std::string& path,
        const Vector& vec)
    {
        boost::property_tree::ptree child;

        for (const auto& v : vec)
        {
            boost::property_tree::ptree p;
            PTreeVectorAccessor::put(p, v);
            child.push_back(std::make_pair(std::string(), p));
        }

        pt.put_child(path,
                     child);
    }
};

template<typename T>
std::string
value_to_string(const T& t)
{
    std::stringstream ss;
    ss << t;
    return ss.str();
}

template<typename T>
std::string
value_to_string(const std::vector<T>& vec)
{
    std::stringstream ss;
    youtils::StreamUtils::stream_out_sequence(ss,
                                              vec);
    return ss.str();
}

template<typename T>
std::string
value_to_string(const boost::optional<T>& t)
{
    return t ? value_to_string(*t) : std::string("--");
}

// A configuration value read from section_name().name() of a property tree.
// Parameters without a default must be present.
template<typename T,
         const char* param_name>
class InitializedParam
{
public:
    using ValueType = typename Value<T>::type;
    using MaybeType = boost::optional<ValueType>;

    using Accessor = ValueAccessor<T>;
    using PTreeAccessor = PropertyTreeAccessor<ValueType>;

    explicit InitializedParam(const boost::property_tree::ptree& pt)
    try
        : value_(get_(pt,
                      was_defaulted_))
    {
        VERIFY(not was_defaulted_ or has_default_value());
    }
    CATCH_STD_ALL_LOG_RETHROW("Failed to extract param " << param_name <<
                              " from " << path());

    explicit InitializedParam(const ValueType& val)
        : value_(val)
        , was_defaulted_(false)
    {}

    InitializedParam(const InitializedParam& other)
        : value_(Accessor::get(other.value_))
        , was_defaulted_(other.was_defaulted_)
    {}

    ~InitializedParam() = default;

    InitializedParam&
    operator=(const InitializedParam&) = delete;

    void
    persist(boost::property_tree::ptree& pt,
            const ReportDefault report_default = ReportDefault::F) const
    {
        if (not was_defaulted_ or
            report_default == ReportDefault::T)
        {
            PTreeAccessor::put(pt,
                               path(),
                               Accessor::get(value_));
        }
    }

    const T&
    value() const
    {
        return value_;
    }

    static const char*
    section_name()
    {
        return SectionName<InitializedParam>::value;
    }

    static const char*
    name()
    {
        return param_name;
    }

    static std::string
    path()
    {
        return std::string(section_name()) + "." + std::string(name());
    }

    static bool
    has_default_value()
    {
        return HasDefaultValue<InitializedParam>::value;
    }

    bool
    was_defaulted() const
    {
        return was_defaulted_;
    }

    static const MaybeType default_value_;

private:
    DECLARE_LOGGER("InitializedParam");

    T value_;
    bool was_defaulted_;

    static ValueType
    get_(const boost::property_tree::ptree& pt,
         bool& was_defaulted)
    {
        was_defaulted = false;

        const auto maybe_t(PTreeAccessor::get_optional(pt,
                                                       path()));
        if (maybe_t != boost::none)
        {
            return *maybe_t;
        }

        // a key that is present but did not parse also ends up here
        if (pt.get_child_optional(path()) != boost::none)
        {
            throw MalformedParameterException("found key but failed to parse value",
                                              path().c_str());
        }

        if (has_default_value())
        {
            VERIFY(default_value_ != boost::none);
            was_defaulted = true;
            return *default_value_;
        }
        else
        {
            throw MissingParameterException("parameter not present in ptree",
                                            path().c_str());
        }
    }
};

// Registry of all defined parameters, used for documentation and to detect
// unknown (e.g. misspelled) keys in a configuration.
struct ParameterInfo
{
    template<typename P>
    ParameterInfo(const std::string& doc,
                  const ShowDocumentation document,
                  const P* /* dummy */)
        : name(P::name())
        , has_default(P::has_default_value())
        , section_name(P::section_name())
        , doc_string(doc)
        , def_(value_to_string(P::default_value_))
        , document_(document)
    {
        get_parameter_info_list().push_back(this);
    }

    static std::list<ParameterInfo*>&
    get_parameter_info_list();

    static void
    verify_property_tree(const boost::property_tree::ptree& pt);

    static void
    document(std::ostream& os);

    const std::string name;
    const bool has_default;
    const std::string section_name;
    const std::string doc_string;
    const std::string def_;
    const ShowDocumentation document_;

private:
    DECLARE_LOGGER("ParameterInfo");
};

#define STRING_NAME(name) name##_string
#define PARAMETER_TYPE(name) name##_pt
#define PARAMETER_INFO_NAME(name) name##_info

#define DECLARE_INITIALIZED_PARAM_TRAITS(name, has_default)             \
    template<>                                                          \
    struct SectionName<PARAMETER_TYPE(name)>                            \
    {                                                                   \
        static const char* value;                                       \
    };                                                                  \
                                                                        \
    template<>                                                          \
    struct HasDefaultValue<PARAMETER_TYPE(name)>                        \
    {                                                                   \
        static constexpr bool value = has_default == HasDefault::T;     \
    }

#define DECLARE_INITIALIZED_PARAM_(name, type, has_default)             \
    extern const char STRING_NAME(name)[];                              \
    using PARAMETER_TYPE(name) = InitializedParam<type, STRING_NAME(name)>; \
    DECLARE_INITIALIZED_PARAM_TRAITS(name, has_default)

#define DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(name, type)      \
    DECLARE_INITIALIZED_PARAM_(name, type, HasDefault::T)

#define DECLARE_INITIALIZED_PARAM(name, type)           \
    DECLARE_INITIALIZED_PARAM_(name, type, HasDefault::F)

#define DEFINE_INITIALIZED_PARAM_DEFAULT(name, value)   \
    template<>                                          \
    const PARAMETER_TYPE(name)::MaybeType               \
    PARAMETER_TYPE(name)::default_value_ = value

#define DEFINE_INITIALIZED_PARAM_(name, s_name, p_name, doc, show_doc, def) \
    const char STRING_NAME(name)[] = p_name;                            \
                                                                        \
    DEFINE_INITIALIZED_PARAM_DEFAULT(name, def);                        \
                                                                        \
    const char* SectionName<PARAMETER_TYPE(name)>::value = s_name;      \
                                                                        \
    namespace                                                           \
    {                                                                   \
        ParameterInfo PARAMETER_INFO_NAME(name)(doc,                    \
                                                show_doc,               \
                                                static_cast<const PARAMETER_TYPE(name)*>(nullptr)); \
    }

#define DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(name, s_name, p_name, doc, show_doc, def) \
    static_assert(HasDefaultValue<PARAMETER_TYPE(name)>::value,         \
                  #name " does not support a default value");           \
    DEFINE_INITIALIZED_PARAM_(name, s_name, p_name, doc, show_doc, def)

#define DEFINE_INITIALIZED_PARAM(name, s_name, p_name, doc, show_doc)   \
    static_assert(not HasDefaultValue<PARAMETER_TYPE(name)>::value,     \
                  #name " expects a default value");                    \
    DEFINE_INITIALIZED_PARAM_(name, s_name, p_name, doc, show_doc, boost::none)

}

#define DECLARE_PARAMETER(name)                         \
    initialized_params::PARAMETER_TYPE(name) name

#endif // !YT_INITIALIZED_PARAM_H_

// Local Variables: **
// mode: c++ **
// End: **
