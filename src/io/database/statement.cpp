// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "statement.hpp"

#include <utility>
#include <cstdint>

#include "database_error.hpp"

namespace varcanon { namespace database {

Statement::Statement(sqlite3* connection, std::string sql)
: connection_ {connection}
, sql_ {std::move(sql)}
, stmt_ {nullptr, StatementDeleter {}}
{
    sqlite3_stmt* stmt {nullptr};
    const auto result = sqlite3_prepare_v2(connection_, sql_.c_str(), static_cast<int>(sql_.size()), &stmt, nullptr);
    stmt_.reset(stmt);
    check(result, "Statement::prepare");
}

const std::string& Statement::sql() const noexcept
{
    return sql_;
}

Statement& Statement::bind(const int index, const int value)
{
    check(sqlite3_bind_int(stmt_.get(), index, value), "Statement::bind");
    return *this;
}

Statement& Statement::bind(const int index, const long value)
{
    check(sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value)), "Statement::bind");
    return *this;
}

Statement& Statement::bind(const int index, const unsigned value)
{
    return bind(index, static_cast<long>(value));
}

Statement& Statement::bind(const int index, const double value)
{
    check(sqlite3_bind_double(stmt_.get(), index, value), "Statement::bind");
    return *this;
}

Statement& Statement::bind(const int index, const std::string& value)
{
    check(sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
          "Statement::bind");
    return *this;
}

Statement& Statement::bind_null(const int index)
{
    check(sqlite3_bind_null(stmt_.get(), index), "Statement::bind_null");
    return *this;
}

bool Statement::step()
{
    const auto result = sqlite3_step(stmt_.get());
    if (result == SQLITE_ROW) return true;
    if (result == SQLITE_DONE) return false;
    check(result, "Statement::step");
    return false;
}

void Statement::execute()
{
    while (step());
}

void Statement::reset()
{
    // sqlite3_reset repeats the error of the last step, which has already been reported
    sqlite3_reset(stmt_.get());
    check(sqlite3_clear_bindings(stmt_.get()), "Statement::reset");
}

int Statement::column_count() const noexcept
{
    return sqlite3_column_count(stmt_.get());
}

bool Statement::column_is_null(const int column) const noexcept
{
    return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

int Statement::column_int(const int column) const noexcept
{
    return sqlite3_column_int(stmt_.get(), column);
}

long Statement::column_long(const int column) const noexcept
{
    return static_cast<long>(sqlite3_column_int64(stmt_.get(), column));
}

double Statement::column_double(const int column) const noexcept
{
    return sqlite3_column_double(stmt_.get(), column);
}

std::string Statement::column_text(const int column) const
{
    const auto text = sqlite3_column_text(stmt_.get(), column);
    if (text == nullptr) return {};
    return std::string {reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), column))};
}

void Statement::check(const int result, const char* where) const
{
    if (result != SQLITE_OK) {
        throw DatabaseError {where, sqlite3_errmsg(connection_), sql_};
    }
}

} // namespace database
} // namespace varcanon
