// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "table_lifecycle.hpp"

#include <utility>
#include <sstream>
#include <iostream>
#include <iterator>
#include <algorithm>

#include "utils/string_utils.hpp"
#include "logging/logging.hpp"

namespace varcanon { namespace database {

namespace {

std::string quote(const std::string& identifier)
{
    return '"' + identifier + '"';
}

std::string quote_join(const std::vector<std::string>& identifiers)
{
    std::vector<std::string> quoted(identifiers.size());
    std::transform(std::cbegin(identifiers), std::cend(identifiers), std::begin(quoted), quote);
    return utils::join(quoted, ", ");
}

std::vector<std::string> column_names(const TableSchema& schema)
{
    std::vector<std::string> result(schema.columns.size());
    std::transform(std::cbegin(schema.columns), std::cend(schema.columns), std::begin(result),
                   [] (const Column& column) { return column.name; });
    return result;
}

} // namespace

std::string make_create_sql(const TableSchema& schema)
{
    std::ostringstream ss {};
    ss << "CREATE TABLE " << quote(schema.name) << " (";
    for (const auto& column : schema.columns) {
        ss << quote(column.name) << ' ' << column.type << ", ";
    }
    ss << "PRIMARY KEY (" << quote_join(schema.primary_key) << "))";
    return ss.str();
}

std::string make_upsert_sql(const TableSchema& schema)
{
    const std::vector<std::string> placeholders(schema.columns.size(), "?");
    return "INSERT OR REPLACE INTO " + quote(schema.name) + " (" + quote_join(column_names(schema)) + ")"
           + " VALUES (" + utils::join(placeholders, ", ") + ")";
}

std::string make_index_sql(const TableSchema& schema)
{
    return "CREATE INDEX IF NOT EXISTS " + quote(schema.name + "_" + utils::join(schema.index, "_") + "_idx")
           + " ON " + quote(schema.name) + " (" + quote_join(schema.index) + ")";
}

TableLifecycle::TableLifecycle(Session& session, TableSchema schema)
: session_ {session}
, schema_ {std::move(schema)}
, phase_ {Phase::declared}
, upsert_ {}
{}

const TableSchema& TableLifecycle::schema() const noexcept
{
    return schema_;
}

TableLifecycle::Phase TableLifecycle::phase() const noexcept
{
    return phase_;
}

void TableLifecycle::recreate()
{
    if (phase_ != Phase::declared) {
        throw TableLifecycleError {schema_.name, phase_, Phase::recreated};
    }
    logging::InfoLogger log {};
    stream(log) << "Re-creating table " << schema_.name;
    session_.execute("DROP TABLE IF EXISTS " + quote(schema_.name));
    session_.execute(make_create_sql(schema_));
    phase_ = Phase::recreated;
}

Statement& TableLifecycle::populate()
{
    if (phase_ != Phase::recreated && phase_ != Phase::populated) {
        throw TableLifecycleError {schema_.name, phase_, Phase::populated};
    }
    if (!upsert_) {
        upsert_ = std::make_unique<Statement>(session_.prepare(make_upsert_sql(schema_)));
    }
    phase_ = Phase::populated;
    return *upsert_;
}

void TableLifecycle::index()
{
    if (phase_ != Phase::recreated && phase_ != Phase::populated) {
        throw TableLifecycleError {schema_.name, phase_, Phase::indexed};
    }
    upsert_.reset();
    if (!schema_.index.empty()) {
        session_.execute(make_index_sql(schema_));
    }
    phase_ = Phase::indexed;
}

std::ostream& operator<<(std::ostream& os, const TableLifecycle::Phase phase)
{
    using Phase = TableLifecycle::Phase;
    switch (phase) {
        case Phase::declared: os << "declared"; break;
        case Phase::recreated: os << "recreated"; break;
        case Phase::populated: os << "populated"; break;
        case Phase::indexed: os << "indexed"; break;
    }
    return os;
}

TableLifecycleError::TableLifecycleError(std::string table, Phase current, Phase requested)
: table_ {std::move(table)}
, current_ {current}
, requested_ {requested}
{}

std::string TableLifecycleError::do_where() const
{
    return "TableLifecycle";
}

std::string TableLifecycleError::do_why() const
{
    std::ostringstream ss {};
    ss << "table " << table_ << " cannot be " << requested_ << " while it is " << current_;
    return ss.str();
}

} // namespace database
} // namespace varcanon
