/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStreamUtils.h>

#include <core/CLogger.h>

#include <istream>

namespace cval {
namespace core {

void CStreamUtils::skipUtf8Bom(std::istream& strm) {
    if (strm.tellg() != std::streampos(0)) {
        return;
    }
    std::ios_base::iostate origState(strm.rdstate());
    // The 3 bytes 0xEF, 0xBB, 0xBF form a UTF-8 byte order marker (BOM)
    if (strm.get() == 0xEF && strm.get() == 0xBB && strm.get() == 0xBF) {
        LOG_DEBUG(<< "Skipping UTF-8 BOM");
        return;
    }
    // Put the stream back how it was so subsequent code can report errors
    strm.clear(origState);
    strm.seekg(0);
}

void CStreamUtils::trimWhitespace(std::string& str) {
    static const char* const WHITESPACE{" \t\r\n\f\v"};
    std::size_t last{str.find_last_not_of(WHITESPACE)};
    if (last == std::string::npos) {
        str.clear();
        return;
    }
    str.erase(last + 1);
    str.erase(0, str.find_first_not_of(WHITESPACE));
}
}
}
