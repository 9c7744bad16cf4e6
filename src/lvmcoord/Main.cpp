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

#include "CommandExecutor.h"
#include "DirectoryDeviceView.h"
#include "ExecutorConfig.h"
#include "PStreamProcessRunner.h"

#include <algorithm>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <youtils/ConfigComponent.h>
#include <youtils/InitializedParam.h>
#include <youtils/Logging.h>
#include <youtils/MainHelper.h>

namespace
{

namespace bpt = boost::property_tree;
namespace ip = initialized_params;
namespace lc = lvmcoord;
namespace po = boost::program_options;
namespace yt = youtils;

class LvmCoordMain
    : public yt::MainHelper
{
    using Args = std::pair<constructor_type, lc::LvmCommand>;

public:
    LvmCoordMain(int argc,
                 char** argv)
        : LvmCoordMain(split_args(argc,
                                  argv))
    {}

    virtual ~LvmCoordMain() = default;

    virtual void
    parse_command_line_arguments()
    {
        parse_unparsed_options(opts_,
                               yt::AllowUnregisteredOptions::F,
                               vm_);
    }

    virtual int
    run()
    {
        if (vm_.count("document-config"))
        {
            ip::ParameterInfo::document(std::cout);
            return 0;
        }

        bpt::ptree pt;
        if (config_file_)
        {
            pt = yt::ConfigComponent::read_config_file(*config_file_,
                                                       VerifyConfig::T);
        }

        if (mode_)
        {
            const ip::PARAMETER_TYPE(lvm_initial_locking_mode) mode(*mode_);
            mode.persist(pt);
        }

        const lc::ExecutorConfig cfg(pt);

        yt::ConfigurationReport report;
        if (not cfg.checkConfig(pt,
                                report))
        {
            for (const auto& p : report)
            {
                LOG_ERROR(p);
                std::cerr << p << std::endl;
            }
            return 1;
        }

        if (vm_.count("dump-default-config"))
        {
            bpt::ptree out;
            cfg.persist(out,
                        ReportDefault::T);
            bpt::json_parser::write_json(std::cout,
                                         out);
            return 0;
        }

        lc::DirectoryDeviceView view(cfg.device_directory());
        lc::PStreamProcessRunner runner(cfg.use_sudo() ? UseSudo::T : UseSudo::F,
                                        cfg.sudo_binary());
        lc::CommandExecutor executor(cfg,
                                     view,
                                     runner);

        if (vm_.count("show-config"))
        {
            std::cout << executor.config() << std::endl;
            return 0;
        }

        if (lvm_args_.empty())
        {
            std::cerr << "no lvm command given" << std::endl;
            return 1;
        }

        const lc::CommandResult res(executor.run(lvm_args_,
                                                 devices_));

        std::cout << res.out;
        std::cerr << res.err;

        return res.status;
    }

    virtual void
    log_extra_help(std::ostream& os)
    {
        os << opts_ << std::endl <<
            "Everything after '--' is passed on to lvm, e.g." << std::endl <<
            "  lvmcoord_exec --mode shared -- vgs -o +tags" << std::endl;
    }

    virtual void
    setup_logging()
    {
        MainHelper::setup_logging("lvmcoord_exec");
    }

private:
    DECLARE_LOGGER("LvmCoordMain");

    explicit LvmCoordMain(const Args& args)
        : yt::MainHelper(args.first)
        , lvm_args_(args.second)
        , opts_("lvmcoord_exec options")
    {
        opts_.add_options()
            ("config-file,C",
             po::value<std::string>()->notifier([&](const std::string& s)
                                                {
                                                    config_file_ = s;
                                                }),
             "config file (JSON)")
            ("mode",
             po::value<lc::LockingMode>()->notifier([&](const lc::LockingMode m)
                                                    {
                                                        mode_ = m;
                                                    }),
             "locking mode: exclusive|shared (overrides the config file)")
            ("device",
             po::value<lc::DeviceList>(&devices_)->composing(),
             "restrict the first attempt to this device, can be given multiple times")
            ("show-config",
             "print the --config argument that would be passed to lvm and exit")
            ("dump-default-config",
             "print the effective configuration (including defaults) as JSON and exit")
            ("document-config",
             "print the documentation of all configuration parameters and exit");
    }

    // Everything after "--" belongs to lvm and must not be seen by our
    // own option parsing.
    static Args
    split_args(int argc,
               char** argv)
    {
        const constructor_type all(fromArgcArgv(argc,
                                                argv));
        const auto& v = all.second;
        const auto it = std::find(v.begin(),
                                  v.end(),
                                  std::string("--"));

        lc::LvmCommand lvm_args;
        if (it != v.end())
        {
            lvm_args.assign(it + 1,
                            v.end());
        }

        return Args(constructor_type(all.first,
                                     std::vector<std::string>(v.begin(),
                                                              it)),
                    lvm_args);
    }

    const lc::LvmCommand lvm_args_;
    po::options_description opts_;
    boost::optional<std::string> config_file_;
    boost::optional<lc::LockingMode> mode_;
    lc::DeviceList devices_;
};

}

MAIN(LvmCoordMain)

// Local Variables: **
// mode: c++ **
// End: **
