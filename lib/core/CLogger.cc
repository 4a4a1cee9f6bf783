/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CLogger.h>

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>
#include <boost/make_shared.hpp>

#include <array>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {
// To ensure the singleton is constructed before multiple threads may require it
// call instance() during the static initialisation phase of the program.  Of
// course, the instance may already be constructed before this if another static
// object has used it.
const cval::core::CLogger& DO_NOT_USE_THIS_VARIABLE = cval::core::CLogger::instance();

const std::array<std::string, 6> LEVEL_NAMES{"TRACE", "DEBUG", "INFO",
                                              "WARN",  "ERROR", "FATAL"};

using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
}

namespace cval {
namespace core {

CLogger::CLogger()
    : m_Reconfigured(false), m_Level(E_Debug), m_FileAttributeName("File"),
      m_LineAttributeName("Line"), m_FunctionAttributeName("Function") {
    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<ELevel, char>("Severity");
    boost::log::register_simple_filter_factory<ELevel, char>("Severity");
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

void CLogger::reset() {
    m_Reconfigured = false;

    // When the logger first starts up, log everything at DEBUG and above to
    // stderr.  Having this hardcoded configuration means that the unit tests
    // and other utility programs just work with minimal effort.
    this->addTextSink(TOStreamPtr(&std::clog, boost::null_deleter()));
    this->setLoggingLevel(E_Debug);
}

void CLogger::addTextSink(const TOStreamPtr& strm) {
    namespace expr = boost::log::expressions;

    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(strm);
    backend->auto_flush(true);

    auto sink = boost::make_shared<TTextSink>(backend);

    // The pattern includes the process ID to make it easier to see if a
    // process dies and restarts
    sink->set_formatter(
        expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S,%f")
        << " [" << expr::attr<boost::log::attributes::current_process_id::value_type>("ProcessID")
        << "] " << expr::attr<ELevel>("Severity") << ' '
        << expr::attr<std::string>(m_FileAttributeName) << '@'
        << expr::attr<int>(m_LineAttributeName) << ' ' << expr::smessage);

    boost::shared_ptr<boost::log::core> core{boost::log::core::get()};
    core->remove_all_sinks();
    core->add_sink(sink);
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return false;
    }
    m_Level = level;
    boost::log::core::get()->set_filter(boost::log::expressions::attr<ELevel>("Severity") >= level);
    return true;
}

const std::string& CLogger::levelToString(ELevel level) {
    return LEVEL_NAMES[static_cast<std::size_t>(level)];
}

bool CLogger::reconfigure(const std::string& logFile, const std::string& propertiesFile) {
    if (logFile.empty()) {
        if (propertiesFile.empty()) {
            // Both empty is OK - it just means we keep logging to stderr
            return true;
        }
        return this->reconfigureFromFile(propertiesFile);
    }
    return this->reconfigureLogToFile(logFile);
}

bool CLogger::reconfigureLogToFile(const std::string& logFile) {
    auto strm = boost::make_shared<std::ofstream>(logFile, std::ios::out | std::ios::app);
    if (strm->is_open() == false) {
        LOG_ERROR(<< "Cannot log to file " << logFile
                  << " as it could not be opened for writing");
        return false;
    }

    this->addTextSink(strm);
    this->setLoggingLevel(m_Level);
    m_Reconfigured = true;

    LOG_DEBUG(<< "Logger is logging to file " << logFile);

    return true;
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream strm(propertiesFile);
    if (strm.is_open() == false) {
        LOG_ERROR(<< "Unable to read logger properties file " << propertiesFile);
        return false;
    }
    if (this->reconfigureFromSettings(strm) == false) {
        return false;
    }

    LOG_DEBUG(<< "Logger re-initialised using properties file " << propertiesFile);

    return true;
}

bool CLogger::reconfigureFromSettings(std::istream& settingsStrm) {
    boost::shared_ptr<boost::log::core> core{boost::log::core::get()};
    core->remove_all_sinks();
    core->reset_filter();
    try {
        boost::log::init_from_stream(settingsStrm);
    } catch (const std::exception& e) {
        this->reset();
        LOG_ERROR(<< "Failed to reconfigure logger from settings: " << e.what());
        return false;
    }
    m_Reconfigured = true;
    return true;
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    if (strm >> name) {
        for (std::size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
            if (name == LEVEL_NAMES[i]) {
                level = static_cast<CLogger::ELevel>(i);
                return strm;
            }
        }
        strm.setstate(std::ios::failbit);
    }
    return strm;
}
}
}
