/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_placebo_CCmdLineParser_h
#define INCLUDED_cval_placebo_CCmdLineParser_h

#include <cstddef>
#include <string>

namespace cval {
namespace placebo {

//! \brief
//! Very simple command line parser.
//!
//! DESCRIPTION:\n
//! Very simple command line parser.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Put in a class rather than main to allow testing.
//!
class CCmdLineParser {
public:
    //! Parse the arguments and return options if appropriate.
    //!
    //! \p threads is only overwritten and \p threadsSet only set to true
    //! if the option is present, so that the configuration file value can
    //! be used otherwise.
    static bool parse(int argc,
                      const char* const* argv,
                      std::string& configFile,
                      std::string& logProperties,
                      std::string& logFile,
                      std::string& outputFileName,
                      std::size_t& threads,
                      bool& threadsSet,
                      bool& strict);

private:
    static const std::string DESCRIPTION;
};
}
}

#endif // INCLUDED_cval_placebo_CCmdLineParser_h
