// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "missing_file_error.hpp"

#include <utility>

namespace varcanon {

MissingFileError::MissingFileError(Path file, std::string kind)
: file_ {std::move(file)}
, kind_ {std::move(kind)}
, source_ {}
{}

const MissingFileError::Path& MissingFileError::file() const noexcept
{
    return file_;
}

void MissingFileError::set_source(std::string source)
{
    source_ = std::move(source);
}

std::string MissingFileError::do_where() const
{
    return source_ ? *source_ : "open";
}

std::string MissingFileError::do_why() const
{
    auto result = "the " + kind_ + " file " + file_.string();
    if (source_) result += " given in " + *source_;
    return result + " does not exist";
}

std::string MissingFileError::do_help() const
{
    return "check the path is spelled correctly and is readable";
}

} // namespace varcanon
