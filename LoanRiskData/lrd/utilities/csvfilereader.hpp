/*
 Copyright (C) 2025 The LoanRisk Authors
 All rights reserved.

 This file is part of LoanRisk, a free-software/open-source library
 for loan portfolio cash flow projection and risk analysis.

 LoanRisk is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file lrd/utilities/csvfilereader.hpp
    \brief utility class to access CSV files
    \ingroup utilities
*/

#pragma once

#include <ql/types.hpp>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace loanrisk {
namespace data {

class CSVReader {
public:
    /*! Ctor for CSVReader base class
        \param firstLineContainsHeaders if true, the first non-empty line is read as column headers
        \param delimiters               field separators
        \param escapeCharacters         escape characters inside fields
        \param quoteCharacters          characters used to quote fields
        \param eolMarker                line separator
        \param commentCharacter         lines starting with this character are skipped, '\0' disables
    */
    CSVReader(const bool firstLineContainsHeaders, const std::string& delimiters = ",;\t",
              const std::string& escapeCharacters = "\\", const std::string& quoteCharacters = "\"",
              const char eolMarker = '\n', const char commentCharacter = '#');
    virtual ~CSVReader() {}

    /*! Set stream for function */
    void setStream(std::istream* stream);
    /*! Returns the fields, if a header line is present, otherwise throws */
    const std::vector<std::string>& fields() const;
    /*! Return true if a field is present */
    bool hasField(const std::string& field) const;
    /*! Returns the number of columns */
    QuantLib::Size numberOfColumns() const;
    /*! Go to next line in file, returns false if there are no more lines */
    bool next();
    /*! Number of the current data line */
    QuantLib::Size currentLine() const;
    /*! Get content of field in current data line, throws if field is not present */
    std::string get(const std::string& field) const;
    /*! Get content of column in current data line, throws if column is out of range */
    std::string get(const QuantLib::Size column) const;
    /*! Close the stream */
    virtual void close() {}

private:
    bool readLine(std::string& line);
    std::vector<std::string> tokenize(const std::string& line) const;

    bool firstLineContainsHeaders_;
    std::string delimiters_, escapeCharacters_, quoteCharacters_;
    char eolMarker_;
    char commentCharacter_;
    std::istream* stream_;
    std::vector<std::string> headers_, data_;
    QuantLib::Size numberOfColumns_;
    QuantLib::Size currentLine_;
};

class CSVFileReader : public CSVReader {
public:
    /*! Ctor for CSVFileReader, opens the file immediately and throws if it cannot be opened */
    CSVFileReader(const std::string& fileName, const bool firstLineContainsHeaders,
                  const std::string& delimiters = ",;\t", const std::string& escapeCharacters = "\\",
                  const std::string& quoteCharacters = "\"", const char eolMarker = '\n',
                  const char commentCharacter = '#');
    /*! Close the file */
    void close() override;

private:
    std::string fileName_;
    std::unique_ptr<std::ifstream> file_;
};

class CSVBufferReader : public CSVReader {
public:
    /*! Ctor for CSVBufferReader reading from an in-memory string */
    CSVBufferReader(const std::string& CSVBuffer, const bool firstLineContainsHeaders,
                    const std::string& delimiters = ",;\t", const std::string& escapeCharacters = "\\",
                    const std::string& quoteCharacters = "\"", const char eolMarker = '\n',
                    const char commentCharacter = '#');

private:
    std::unique_ptr<std::istringstream> bufferStream_;
};

} // namespace data
} // namespace loanrisk
