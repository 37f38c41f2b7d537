// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef session_hpp
#define session_hpp

#include <string>
#include <memory>

#include <boost/filesystem/path.hpp>

#include <sqlite3.h>

#include "statement.hpp"

namespace varcanon { namespace database {

/**
 Owns one connection to an SQLite database. A Session is passed explicitly to
 every operation that reads or writes tables; it must not be shared between
 threads.
 */
class Session
{
public:
    using Path = boost::filesystem::path;
    
    Session() = delete;
    
    // Creates the database if it does not exist
    Session(Path db_path);
    
    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&)                 = default;
    Session& operator=(Session&&)      = default;
    
    ~Session() = default;
    
    const Path& path() const noexcept;
    
    void execute(const std::string& sql);
    
    Statement prepare(std::string sql);
    
    bool has_table(const std::string& name);
    
    void begin();
    void commit();
    void rollback() noexcept;
    
private:
    struct ConnectionDeleter
    {
        void operator()(sqlite3* connection) const { sqlite3_close_v2(connection); }
    };
    
    Path db_path_;
    std::unique_ptr<sqlite3, ConnectionDeleter> connection_;
};

/**
 Scoped transaction. Rolled back on destruction unless committed.
 */
class Transaction
{
public:
    Transaction() = delete;
    
    Transaction(Session& session);
    
    Transaction(const Transaction&)            = delete;
    Transaction& operator=(const Transaction&) = delete;
    
    ~Transaction() noexcept;
    
    void commit();
    
private:
    Session& session_;
    bool committed_;
};

} // namespace database
} // namespace varcanon

#endif
