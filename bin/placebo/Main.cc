/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
//! \brief
//! Run placebo tests of the difference-in-differences estimator on
//! simulated and transformed panel datasets.
//!
//! DESCRIPTION:\n
//! Reads an optional INI configuration describing the simulated datasets
//! and the transforms to apply to them, runs the leave-one-out placebo
//! test and writes the summary table as CSV to STDOUT or a file.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Standalone program.
//!
#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <validation/CDifferenceInDifferences.h>
#include <validation/CPlaceboTest.h>
#include <validation/CPlaceboTestConfig.h>
#include <validation/CPlaceboTestResult.h>

#include "CCmdLineParser.h"

#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <stdlib.h>

int main(int argc, char** argv) {
    // Read command line options
    std::string configFile;
    std::string logProperties;
    std::string logFile;
    std::string outputFileName;
    std::size_t threads{0};
    bool threadsSet{false};
    bool strict{false};
    if (cval::placebo::CCmdLineParser::parse(argc, argv, configFile, logProperties,
                                             logFile, outputFileName, threads,
                                             threadsSet, strict) == false) {
        return EXIT_FAILURE;
    }

    if (cval::core::CLogger::instance().reconfigure(logFile, logProperties) == false) {
        LOG_FATAL(<< "Could not reconfigure logging");
        return EXIT_FAILURE;
    }

    cval::validation::CPlaceboTestConfig config;
    if (!configFile.empty() && config.init(configFile) == false) {
        LOG_FATAL(<< "Placebo test config file '" << configFile << "' could not be loaded");
        return EXIT_FAILURE;
    }
    if (threadsSet == false) {
        threads = config.threads();
    }

    std::ofstream outputFile;
    if (!outputFileName.empty()) {
        outputFile.open(outputFileName);
        if (!outputFile.is_open()) {
            LOG_FATAL(<< "Could not open output file '" << outputFileName << "'");
            return EXIT_FAILURE;
        }
    }
    std::ostream& output = outputFileName.empty() ? std::cout : outputFile;

    try {
        cval::core::startDefaultAsyncExecutor(threads);

        cval::validation::CPlaceboTest placebo{
            std::make_shared<cval::validation::CDifferenceInDifferences>(),
            config.datasets()};
        placebo.progressCallback([](double fractionalProgress) {
            LOG_TRACE(<< "progress = " << fractionalProgress);
        });

        auto summary = placebo.execute().summarise();
        bool valid{cval::validation::CPlaceboTestResult::validate(summary, strict)};

        if (cval::validation::CPlaceboTestResult::writeCsv(summary, output) == false) {
            LOG_FATAL(<< "Failed to write placebo test summary");
            cval::core::stopDefaultAsyncExecutor();
            return EXIT_FAILURE;
        }
        cval::core::stopDefaultAsyncExecutor();

        if (valid == false) {
            LOG_FATAL(<< "Placebo test summary failed validation");
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        LOG_FATAL(<< "Placebo test failed: " << e.what());
        cval::core::stopDefaultAsyncExecutor();
        return EXIT_FAILURE;
    }

    // This message makes it easier to spot process crashes in a log file
    LOG_DEBUG(<< "Placebo test exiting");

    return EXIT_SUCCESS;
}
