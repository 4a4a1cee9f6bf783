/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include "CCmdLineParser.h"

#include <boost/program_options.hpp>

#include <iostream>

namespace cval {
namespace placebo {

const std::string CCmdLineParser::DESCRIPTION = "Usage: placebo [options]\n"
                                                "Options:";

bool CCmdLineParser::parse(int argc,
                           const char* const* argv,
                           std::string& configFile,
                           std::string& logProperties,
                           std::string& logFile,
                           std::string& outputFileName,
                           std::size_t& threads,
                           bool& threadsSet,
                           bool& strict) {
    try {
        boost::program_options::options_description desc(DESCRIPTION);
        // clang-format off
        desc.add_options()
            ("help", "Display this information and exit")
            ("config", boost::program_options::value<std::string>(),
                        "Optional placebo test config file - not present means use the defaults")
            ("logProperties", boost::program_options::value<std::string>(),
                        "Optional logger properties file")
            ("logFile", boost::program_options::value<std::string>(),
                        "Optional file to log to - not present means log to STDERR")
            ("output", boost::program_options::value<std::string>(),
                        "Optional file to write the summary to - not present means write to STDOUT")
            ("threads", boost::program_options::value<std::size_t>(),
                        "Optional number of threads to use, 0 for one per hardware thread - overrides the config file")
            ("strict",
                        "Also fail if any placebo distribution has zero spread")
        ;
        // clang-format on

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc),
                                      vm);
        boost::program_options::notify(vm);

        if (vm.count("help") > 0) {
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("config") > 0) {
            configFile = vm["config"].as<std::string>();
        }
        if (vm.count("logProperties") > 0) {
            logProperties = vm["logProperties"].as<std::string>();
        }
        if (vm.count("logFile") > 0) {
            logFile = vm["logFile"].as<std::string>();
        }
        if (vm.count("output") > 0) {
            outputFileName = vm["output"].as<std::string>();
        }
        if (vm.count("threads") > 0) {
            threads = vm["threads"].as<std::size_t>();
            threadsSet = true;
        }
        if (vm.count("strict") > 0) {
            strict = true;
        }
    } catch (std::exception& e) {
        std::cerr << "Error processing command line: " << e.what() << std::endl;
        return false;
    }

    return true;
}
}
}
