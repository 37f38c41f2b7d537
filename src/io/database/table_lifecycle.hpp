// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef table_lifecycle_hpp
#define table_lifecycle_hpp

#include <string>
#include <vector>
#include <memory>
#include <iosfwd>

#include "exceptions/program_error.hpp"
#include "session.hpp"
#include "statement.hpp"

namespace varcanon { namespace database {

struct Column
{
    std::string name, type;
};

struct TableSchema
{
    std::string name;
    std::vector<Column> columns;
    std::vector<std::string> primary_key;
    std::vector<std::string> index;
};

std::string make_create_sql(const TableSchema& schema);
std::string make_upsert_sql(const TableSchema& schema);
std::string make_index_sql(const TableSchema& schema);

/**
 Drives a table through recreate -> populate -> index. Each phase may only be
 entered from the one before it, except that populate may be repeated.
 */
class TableLifecycle
{
public:
    enum class Phase { declared, recreated, populated, indexed };
    
    TableLifecycle() = delete;
    
    TableLifecycle(Session& session, TableSchema schema);
    
    TableLifecycle(const TableLifecycle&)            = delete;
    TableLifecycle& operator=(const TableLifecycle&) = delete;
    TableLifecycle(TableLifecycle&&)                 = default;
    TableLifecycle& operator=(TableLifecycle&&)      = delete;
    
    ~TableLifecycle() = default;
    
    const TableSchema& schema() const noexcept;
    Phase phase() const noexcept;
    
    // Drops any existing table of the same name and creates it empty
    void recreate();
    // The returned statement upserts one row, with parameters in column order
    Statement& populate();
    void index();
    
private:
    Session& session_;
    TableSchema schema_;
    Phase phase_;
    std::unique_ptr<Statement> upsert_;
};

std::ostream& operator<<(std::ostream& os, TableLifecycle::Phase phase);

class TableLifecycleError : public ProgramError
{
public:
    using Phase = TableLifecycle::Phase;
    
    TableLifecycleError(std::string table, Phase current, Phase requested);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    
    std::string table_;
    Phase current_, requested_;
};

} // namespace database
} // namespace varcanon

#endif
