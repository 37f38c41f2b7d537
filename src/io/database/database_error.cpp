// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "database_error.hpp"

#include <utility>
#include <sstream>

namespace varcanon { namespace database {

DatabaseError::DatabaseError(std::string where, std::string message, std::string sql)
: where_ {std::move(where)}
, message_ {std::move(message)}
, sql_ {std::move(sql)}
{}

const std::string& DatabaseError::sql() const noexcept
{
    return sql_;
}

std::string DatabaseError::do_where() const
{
    return where_;
}

std::string DatabaseError::do_why() const
{
    std::ostringstream ss {};
    ss << "the database reported '" << message_ << "'";
    if (!sql_.empty()) {
        ss << " while executing '" << sql_ << "'";
    }
    return ss.str();
}

std::string DatabaseError::do_help() const
{
    return "check the database path is writable, has free space, and is not used by another process";
}

} // namespace database
} // namespace varcanon
