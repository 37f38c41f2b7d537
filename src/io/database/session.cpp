// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "session.hpp"

#include <utility>

#include "database_error.hpp"
#include "logging/logging.hpp"

namespace varcanon { namespace database {

Session::Session(Path db_path)
: db_path_ {std::move(db_path)}
, connection_ {nullptr, ConnectionDeleter {}}
{
    sqlite3* connection {nullptr};
    const auto result = sqlite3_open_v2(db_path_.c_str(), &connection,
                                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    connection_.reset(connection);
    if (result != SQLITE_OK) {
        const std::string message {connection ? sqlite3_errmsg(connection) : sqlite3_errstr(result)};
        throw DatabaseError {"Session::open", message + " (" + db_path_.string() + ")"};
    }
}

const Session::Path& Session::path() const noexcept
{
    return db_path_;
}

void Session::execute(const std::string& sql)
{
    char* message {nullptr};
    if (sqlite3_exec(connection_.get(), sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string error_message {message ? message : sqlite3_errmsg(connection_.get())};
        sqlite3_free(message);
        throw DatabaseError {"Session::execute", std::move(error_message), sql};
    }
}

Statement Session::prepare(std::string sql)
{
    return Statement {connection_.get(), std::move(sql)};
}

bool Session::has_table(const std::string& name)
{
    auto query = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    query.bind(1, name);
    return query.step();
}

void Session::begin()
{
    execute("BEGIN TRANSACTION");
}

void Session::commit()
{
    execute("COMMIT");
}

void Session::rollback() noexcept
{
    if (sqlite3_exec(connection_.get(), "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
        logging::WarningLogger log {};
        stream(log) << "Failed to roll back transaction on " << db_path_.string() << ": "
            << sqlite3_errmsg(connection_.get());
    }
}

// Transaction

Transaction::Transaction(Session& session)
: session_ {session}
, committed_ {false}
{
    session_.begin();
}

Transaction::~Transaction() noexcept
{
    if (!committed_) session_.rollback();
}

void Transaction::commit()
{
    session_.commit();
    committed_ = true;
}

} // namespace database
} // namespace varcanon
