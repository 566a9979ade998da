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

#include <lrd/utilities/csvfilereader.hpp>
#include <lrd/utilities/log.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/tokenizer.hpp>

#include <ql/errors.hpp>
#include <ql/utilities/null.hpp>

#include <algorithm>

using QuantLib::Null;
using QuantLib::Size;
using std::string;
using std::vector;

namespace loanrisk {
namespace data {

CSVReader::CSVReader(const bool firstLineContainsHeaders, const string& delimiters, const string& escapeCharacters,
                     const string& quoteCharacters, const char eolMarker, const char commentCharacter)
    : firstLineContainsHeaders_(firstLineContainsHeaders), delimiters_(delimiters),
      escapeCharacters_(escapeCharacters), quoteCharacters_(quoteCharacters), eolMarker_(eolMarker),
      commentCharacter_(commentCharacter), stream_(nullptr), numberOfColumns_(Null<Size>()),
      currentLine_(Null<Size>()) {}

void CSVReader::setStream(std::istream* stream) {
    stream_ = stream;
    headers_.clear();
    data_.clear();
    numberOfColumns_ = Null<Size>();
    currentLine_ = Null<Size>();
    if (firstLineContainsHeaders_) {
        string line;
        bool found = false;
        while (!found && std::getline(*stream_, line, eolMarker_)) {
            boost::trim(line);
            found = !line.empty();
        }
        QL_REQUIRE(found, "CSVReader: expected header line, got empty stream");
        // a report written with a comment character marks its header line with it
        if (commentCharacter_ != '\0' && line[0] == commentCharacter_)
            line.erase(0, 1);
        headers_ = tokenize(line);
        for (auto& h : headers_)
            boost::trim(h);
        numberOfColumns_ = headers_.size();
    }
}

const vector<string>& CSVReader::fields() const {
    QL_REQUIRE(firstLineContainsHeaders_, "CSVReader: no headers were specified");
    return headers_;
}

bool CSVReader::hasField(const string& field) const {
    QL_REQUIRE(firstLineContainsHeaders_, "CSVReader: no headers were specified");
    return std::find(headers_.begin(), headers_.end(), field) != headers_.end();
}

Size CSVReader::numberOfColumns() const { return numberOfColumns_; }

bool CSVReader::readLine(string& line) {
    while (std::getline(*stream_, line, eolMarker_)) {
        boost::trim(line);
        if (line.empty() || (commentCharacter_ != '\0' && line[0] == commentCharacter_))
            continue;
        return true;
    }
    return false;
}

vector<string> CSVReader::tokenize(const string& line) const {
    boost::escaped_list_separator<char> separator(escapeCharacters_, delimiters_, quoteCharacters_);
    boost::tokenizer<boost::escaped_list_separator<char>> tokenizer(line, separator);
    return vector<string>(tokenizer.begin(), tokenizer.end());
}

bool CSVReader::next() {
    QL_REQUIRE(stream_ != nullptr, "CSVReader: stream is not set");
    string line;
    if (!readLine(line))
        return false;
    data_ = tokenize(line);
    for (auto& d : data_)
        boost::trim(d);
    currentLine_ = currentLine_ == Null<Size>() ? 0 : currentLine_ + 1;
    if (numberOfColumns_ == Null<Size>())
        numberOfColumns_ = data_.size();
    QL_REQUIRE(data_.size() == numberOfColumns_, "CSVReader: data line #" << currentLine_ << " has "
                                                                           << data_.size() << " fields, expected "
                                                                           << numberOfColumns_);
    return true;
}

Size CSVReader::currentLine() const { return currentLine_; }

string CSVReader::get(const string& field) const {
    QL_REQUIRE(currentLine_ != Null<Size>(), "CSVReader: invalid current line, is next() called?");
    auto it = std::find(headers_.begin(), headers_.end(), field);
    QL_REQUIRE(it != headers_.end(), "CSVReader: field \"" << field << "\" not found.");
    return data_.at(static_cast<Size>(std::distance(headers_.begin(), it)));
}

string CSVReader::get(const Size column) const {
    QL_REQUIRE(currentLine_ != Null<Size>(), "CSVReader: invalid current line, is next() called?");
    QL_REQUIRE(column < data_.size(), "CSVReader: column " << column << " out of bounds 0..." << data_.size());
    return data_[column];
}

CSVFileReader::CSVFileReader(const string& fileName, const bool firstLineContainsHeaders, const string& delimiters,
                             const string& escapeCharacters, const string& quoteCharacters, const char eolMarker,
                             const char commentCharacter)
    : CSVReader(firstLineContainsHeaders, delimiters, escapeCharacters, quoteCharacters, eolMarker,
                commentCharacter),
      fileName_(fileName) {
    file_ = std::make_unique<std::ifstream>(fileName);
    QL_REQUIRE(file_->is_open(), "CSVFileReader: error opening file " << fileName);
    DLOG("CSVFileReader: opened " << fileName);
    setStream(file_.get());
}

void CSVFileReader::close() {
    if (file_ && file_->is_open())
        file_->close();
}

CSVBufferReader::CSVBufferReader(const string& CSVBuffer, const bool firstLineContainsHeaders,
                                 const string& delimiters, const string& escapeCharacters,
                                 const string& quoteCharacters, const char eolMarker, const char commentCharacter)
    : CSVReader(firstLineContainsHeaders, delimiters, escapeCharacters, quoteCharacters, eolMarker,
                commentCharacter) {
    bufferStream_ = std::make_unique<std::istringstream>(CSVBuffer);
    setStream(bufferStream_.get());
}

} // namespace data
} // namespace loanrisk
