// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "malformed_file_error.hpp"

#include <utility>

namespace varcanon {

MalformedFileError::MalformedFileError(Path file, std::string kind)
: file_ {std::move(file)}
, kind_ {std::move(kind)}
, reason_ {}
{}

MalformedFileError::MalformedFileError(Path file, std::string kind, std::string reason)
: file_ {std::move(file)}
, kind_ {std::move(kind)}
, reason_ {std::move(reason)}
{}

const MalformedFileError::Path& MalformedFileError::file() const noexcept
{
    return file_;
}

std::string MalformedFileError::do_where() const
{
    return "read";
}

std::string MalformedFileError::do_why() const
{
    auto result = file_.string() + " is not a valid " + kind_ + " file";
    if (reason_) result += ": " + *reason_;
    return result;
}

std::string MalformedFileError::do_help() const
{
    return "check the file is a complete " + kind_ + " file written by a supported tool";
}

} // namespace varcanon
