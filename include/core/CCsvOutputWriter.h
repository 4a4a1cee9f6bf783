/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_cval_core_CCsvOutputWriter_h
#define INCLUDED_cval_core_CCsvOutputWriter_h

#include <core/CNonCopyable.h>
#include <core/ImportExport.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace cval {
namespace core {

//! \brief
//! Write rows in CSV format.
//!
//! DESCRIPTION:\n
//! Write a header row of field names followed by data rows to a stream
//! in the Excel style CSV format:
//! - Fields are only quoted if they contain a quote, the separator or
//!   the record end character
//! - Quotes are escaped by doubling them up
//!
//! IMPLEMENTATION DECISIONS:\n
//! Each record is built in a work string before it is written so an
//! invalid write has no effect on the output stream.
class CORE_EXPORT CCsvOutputWriter : private CNonCopyable {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! CSV separator
    static const char COMMA;
    //! CSV quote character
    static const char QUOTE;
    //! CSV record end character
    static const char RECORD_END;

public:
    explicit CCsvOutputWriter(std::ostream& strmOut, char separator = COMMA);

    //! Destructor flushes the stream
    ~CCsvOutputWriter();

    //! Set and write the field names. This is only allowed once.
    bool fieldNames(const TStrVec& fieldNames);

    //! Write a row which must have one value per field.
    bool writeRow(const TStrVec& values);

private:
    //! Append a field to the work record, quoting it if required, and
    //! escaping embedded quotes
    void appendField(const std::string& field);

    //! Append \p fields to the work record and write it.
    void writeRecord(const TStrVec& fields);

private:
    std::ostream& m_StrmOut;
    TStrVec m_FieldNames;
    std::string m_WorkRecord;
    const char m_Separator;
};
}
}

#endif // INCLUDED_cval_core_CCsvOutputWriter_h
