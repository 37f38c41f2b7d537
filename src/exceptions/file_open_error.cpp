// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "file_open_error.hpp"

#include <utility>

namespace varcanon {

FileOpenError::FileOpenError(Path file, std::string kind)
: file_ {std::move(file)}
, kind_ {std::move(kind)}
, error_ {}
{}

FileOpenError::FileOpenError(Path file, std::string kind, std::error_code error)
: file_ {std::move(file)}
, kind_ {std::move(kind)}
, error_ {error}
{}

std::string FileOpenError::do_where() const
{
    return "open";
}

std::string FileOpenError::do_why() const
{
    auto result = "could not open the " + kind_ + " file " + file_.string();
    if (error_ && *error_) result += " (" + error_->message() + ")";
    return result;
}

std::string FileOpenError::do_help() const
{
    return "check the file permissions and that no other process holds the file";
}

} // namespace varcanon
