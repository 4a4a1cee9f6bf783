/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CLogger_h
#define INCLUDED_cval_core_CLogger_h

#include <core/CNonCopyable.h>
#include <core/ImportExport.h>
#include <core/LogMacros.h>

#include <boost/log/sources/severity_logger.hpp>
#include <boost/shared_ptr.hpp>

#include <iosfwd>
#include <memory>
#include <string>

namespace cval {
namespace core {

//! \brief
//! Core logging class.
//!
//! DESCRIPTION:\n
//! Access to the actual logging commands should be through macros.
//!
//! Errors that mean something has gone wrong, but the program will
//! continue to run, for example a placebo iteration producing a
//! degenerate statistic, should be logged with the LOG_ERROR macro.
//!
//! Errors that mean a program is not going to work at all and will
//! soon exit should be logged with the LOG_FATAL macro.  The LOG_FATAL
//! macro itself does not change the program flow in any way, so other
//! code must still be written to effect the shutdown of the program.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Wrapper around Boost.Log.
//!
//! Singleton for simplicity.
//!
//! By default, logging is to stderr.  The logger can be told to
//! reinitialise itself from a Boost.Log settings file, or to append
//! to a log file instead of stderr.
//!
//! The TRACE level of logging can be useful when a unit test needs
//! to log more detailed information.
//!
class CORE_EXPORT CLogger : private CNonCopyable {
public:
    //! Used to set the level we should log at
    enum ELevel { E_Trace, E_Debug, E_Info, E_Warn, E_Error, E_Fatal };

    using TLevelSeverityLogger = boost::log::sources::severity_logger_mt<ELevel>;

public:
    //! Access to singleton - use MACROS to get to this when logging
    //! messages
    static CLogger& instance();

    //! Reconfigure to either a log file or a settings file.  If both
    //! are supplied the log file takes precedence.
    bool reconfigure(const std::string& logFile, const std::string& propertiesFile);

    //! Tell the logger to append to \p logFile rather than stderr.
    bool reconfigureLogToFile(const std::string& logFile);

    //! Tell the logger to reconfigure itself by reading a specified
    //! Boost.Log settings file, if the file exists.
    bool reconfigureFromFile(const std::string& propertiesFile);

    //! Set the logging level on the fly - useful when unit tests need to
    //! log at a lower level than the shipped programs
    bool setLoggingLevel(ELevel level);

    //! Map the level enum to a string.
    static const std::string& levelToString(ELevel level);

    //! Has the logger been reconfigured?
    bool hasBeenReconfigured() const;

    //! Access to underlying logger (must only be called from macros)
    TLevelSeverityLogger& logger();

    //! Attribute names for efficient access to our custom attributes
    boost::log::attribute_name fileAttributeName() const;
    boost::log::attribute_name lineAttributeName() const;
    boost::log::attribute_name functionAttributeName() const;

    //! Reset the logger, this is primarily a helper for unit testing as
    //! CLogger is a singleton, so we can not just create new instances
    void reset();

private:
    using TOStreamPtr = boost::shared_ptr<std::ostream>;

private:
    //! Constructor for a singleton is private.
    CLogger();
    ~CLogger();

    //! Replace all sinks with a single text sink writing to \p strm.
    void addTextSink(const TOStreamPtr& strm);

    //! Helper for other reconfiguration methods
    bool reconfigureFromSettings(std::istream& settingsStrm);

private:
    TLevelSeverityLogger m_Logger;

    //! Has the logger ever been reconfigured?  Only ever set from the
    //! thread that configures logging at startup.
    volatile bool m_Reconfigured;

    //! The minimum level that is written.
    ELevel m_Level;

    //! Custom Boost.Log attribute names
    boost::log::attribute_name m_FileAttributeName;
    boost::log::attribute_name m_LineAttributeName;
    boost::log::attribute_name m_FunctionAttributeName;
};

CORE_EXPORT std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level);
CORE_EXPORT std::istream& operator>>(std::istream& strm, CLogger::ELevel& level);
}
}

#endif // INCLUDED_cval_core_CLogger_h
