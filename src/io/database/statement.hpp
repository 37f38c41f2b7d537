// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef statement_hpp
#define statement_hpp

#include <string>
#include <memory>

#include <sqlite3.h>

namespace varcanon { namespace database {

/**
 A prepared SQL statement. Parameters are bound by 1-based index and the
 statement can be reused after reset().
 */
class Statement
{
public:
    Statement() = delete;
    
    Statement(sqlite3* connection, std::string sql);
    
    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&&)                 = default;
    Statement& operator=(Statement&&)      = default;
    
    ~Statement() = default;
    
    const std::string& sql() const noexcept;
    
    Statement& bind(int index, int value);
    Statement& bind(int index, long value);
    Statement& bind(int index, unsigned value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bind_null(int index);
    
    // Returns true while there are result rows
    bool step();
    // Steps until done
    void execute();
    // Clears bindings too
    void reset();
    
    int column_count() const noexcept;
    bool column_is_null(int column) const noexcept;
    int column_int(int column) const noexcept;
    long column_long(int column) const noexcept;
    double column_double(int column) const noexcept;
    std::string column_text(int column) const;
    
private:
    struct StatementDeleter
    {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    
    sqlite3* connection_;
    std::string sql_;
    std::unique_ptr<sqlite3_stmt, StatementDeleter> stmt_;
    
    void check(int result, const char* where) const;
};

} // namespace database
} // namespace varcanon

#endif
