/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CStreamUtils_h
#define INCLUDED_cval_core_CStreamUtils_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <iosfwd>
#include <string>

namespace cval {
namespace core {

//! \brief Stream utility functions.
class CORE_EXPORT CStreamUtils : private CNonInstantiatable {
public:
    //! boost::ini_parser doesn't like UTF-8 ini files that begin
    //! with byte order markers.  This function advances the read
    //! position of the stream over a UTF-8 BOM, but only if one
    //! exists.
    static void skipUtf8Bom(std::istream& strm);

    //! Strip leading and trailing whitespace from \p str in place.
    static void trimWhitespace(std::string& str);
};
}
}

#endif // INCLUDED_cval_core_CStreamUtils_h
