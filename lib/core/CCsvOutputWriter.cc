/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CCsvOutputWriter.h>

#include <core/CLogger.h>

#include <ostream>

namespace cval {
namespace core {

const char CCsvOutputWriter::COMMA(',');
const char CCsvOutputWriter::QUOTE('"');
const char CCsvOutputWriter::RECORD_END('\n');

CCsvOutputWriter::CCsvOutputWriter(std::ostream& strmOut, char separator)
    : m_StrmOut(strmOut), m_Separator(separator) {
    if (m_Separator == QUOTE || m_Separator == RECORD_END) {
        LOG_ERROR(<< "CSV output writer will not generate parsable output because "
                     "separator character ("
                  << m_Separator << ") is the same as the quote or record end characters");
    }
}

CCsvOutputWriter::~CCsvOutputWriter() {
    m_StrmOut.flush();
}

bool CCsvOutputWriter::fieldNames(const TStrVec& fieldNames) {
    if (m_FieldNames.empty() == false) {
        LOG_ERROR(<< "Attempt to set field names for the second time");
        return false;
    }
    if (fieldNames.empty()) {
        LOG_ERROR(<< "Attempt to set empty field names");
        return false;
    }
    m_FieldNames = fieldNames;
    this->writeRecord(m_FieldNames);
    return true;
}

bool CCsvOutputWriter::writeRow(const TStrVec& values) {
    if (m_FieldNames.empty()) {
        LOG_ERROR(<< "Attempt to write data before field names");
        return false;
    }
    if (values.size() != m_FieldNames.size()) {
        LOG_ERROR(<< "Row has " << values.size() << " values but there are "
                  << m_FieldNames.size() << " fields");
        return false;
    }
    this->writeRecord(values);
    return true;
}

void CCsvOutputWriter::writeRecord(const TStrVec& fields) {
    m_WorkRecord.clear();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            m_WorkRecord += m_Separator;
        }
        this->appendField(fields[i]);
    }
    m_WorkRecord += RECORD_END;
    m_StrmOut << m_WorkRecord;
}

void CCsvOutputWriter::appendField(const std::string& field) {
    bool needOuterQuotes(false);
    for (char curChar : field) {
        if (curChar == m_Separator || curChar == QUOTE || curChar == RECORD_END) {
            needOuterQuotes = true;
            break;
        }
    }

    if (needOuterQuotes) {
        m_WorkRecord += QUOTE;
        for (char curChar : field) {
            if (curChar == QUOTE) {
                m_WorkRecord += QUOTE;
            }
            m_WorkRecord += curChar;
        }
        m_WorkRecord += QUOTE;
    } else {
        m_WorkRecord += field;
    }
}
}
}
