// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "tsv_reader.hpp"

#include <utility>
#include <cerrno>
#include <system_error>

#include <boost/filesystem/operations.hpp>

#include "utils/string_utils.hpp"
#include "exceptions/missing_file_error.hpp"
#include "exceptions/malformed_file_error.hpp"
#include "exceptions/file_open_error.hpp"

namespace varcanon { namespace io {

TsvReader::TsvReader(Path file_path)
: file_path_ {std::move(file_path)}
, file_ {nullptr, HtsFileDeleter {}}
, line_ {new kstring_t {0, 0, nullptr}, KStringDeleter {}}
, header_ {}
, line_number_ {0}
{
    if (!boost::filesystem::exists(file_path_)) {
        throw MissingFileError {file_path_, "tsv"};
    }
    file_.reset(hts_open(file_path_.c_str(), "r"));
    if (!file_) {
        throw FileOpenError {file_path_, "tsv", std::make_error_code(static_cast<std::errc>(errno))};
    }
    if (!read_line(header_)) {
        throw MalformedFileError {file_path_, "tsv", "the file is empty"};
    }
}

const TsvReader::Path& TsvReader::path() const noexcept
{
    return file_path_;
}

const TsvReader::Row& TsvReader::header() const noexcept
{
    return header_;
}

bool TsvReader::read(Row& row)
{
    while (read_line(row)) {
        if (!(row.size() == 1 && row.front().empty())) return true; // skip blank lines
    }
    return false;
}

std::size_t TsvReader::line_number() const noexcept
{
    return line_number_;
}

bool TsvReader::read_line(Row& fields)
{
    const auto status = hts_getline(file_.get(), KS_SEP_LINE, line_.get());
    if (status == -1) return false;
    if (status < -1) {
        throw MalformedFileError {file_path_, "tsv", "could not read line " + std::to_string(line_number_ + 1)};
    }
    ++line_number_;
    std::string line {line_->s, line_->l};
    if (!line.empty() && line.back() == '\r') line.pop_back();
    fields = utils::split(line, std::string {"\t"});
    return true;
}

} // namespace io
} // namespace varcanon
