// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>

#include "test_common.hpp"
#include "io/database/session.hpp"
#include "io/database/statement.hpp"
#include "io/database/table_lifecycle.hpp"
#include "io/database/database_error.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(io)
BOOST_AUTO_TEST_SUITE(database)

using varcanon::database::Session;
using varcanon::database::Statement;
using varcanon::database::Transaction;
using varcanon::database::TableSchema;
using varcanon::database::TableLifecycle;
using varcanon::database::TableLifecycleError;
using varcanon::database::DatabaseError;

namespace {

TableSchema make_test_schema()
{
    return TableSchema {
        "test_var",
        {{"release", "VARCHAR(10) NOT NULL"}, {"start", "INTEGER NOT NULL"}, {"score", "DOUBLE NOT NULL"}},
        {"release", "start"},
        {"release", "start"}
    };
}

long count_rows(Session& session, const std::string& table)
{
    auto query = session.prepare("SELECT COUNT(*) FROM \"" + table + "\"");
    BOOST_REQUIRE(query.step());
    return query.column_long(0);
}

} // namespace

BOOST_AUTO_TEST_CASE(schema_sql_quotes_identifiers)
{
    const auto schema = make_test_schema();
    BOOST_CHECK_EQUAL(varcanon::database::make_create_sql(schema),
                      "CREATE TABLE \"test_var\" (\"release\" VARCHAR(10) NOT NULL, \"start\" INTEGER NOT NULL, "
                      "\"score\" DOUBLE NOT NULL, PRIMARY KEY (\"release\", \"start\"))");
    BOOST_CHECK_EQUAL(varcanon::database::make_upsert_sql(schema),
                      "INSERT OR REPLACE INTO \"test_var\" (\"release\", \"start\", \"score\") VALUES (?, ?, ?)");
    BOOST_CHECK_EQUAL(varcanon::database::make_index_sql(schema),
                      "CREATE INDEX IF NOT EXISTS \"test_var_release_start_idx\" ON \"test_var\" (\"release\", \"start\")");
}

BOOST_AUTO_TEST_CASE(sessions_create_missing_databases)
{
    TemporaryFile db {};
    BOOST_CHECK(!fs::exists(db.path()));
    Session session {db.path()};
    session.execute("CREATE TABLE t (x INTEGER)");
    BOOST_CHECK(fs::exists(db.path()));
    BOOST_CHECK(session.has_table("t"));
    BOOST_CHECK(!session.has_table("u"));
}

BOOST_AUTO_TEST_CASE(statements_bind_and_read_back_values)
{
    TemporaryFile db {};
    Session session {db.path()};
    session.execute("CREATE TABLE t (i INTEGER, d DOUBLE, s TEXT, n TEXT)");
    auto insert = session.prepare("INSERT INTO t VALUES (?, ?, ?, ?)");
    insert.bind(1, 3000000000L).bind(2, 0.125).bind(3, std::string {"GRCh37"}).bind_null(4);
    insert.execute();
    auto query = session.prepare("SELECT i, d, s, n FROM t");
    BOOST_REQUIRE(query.step());
    BOOST_CHECK_EQUAL(query.column_count(), 4);
    BOOST_CHECK_EQUAL(query.column_long(0), 3000000000L);
    BOOST_CHECK_CLOSE(query.column_double(1), 0.125, 1e-9);
    BOOST_CHECK_EQUAL(query.column_text(2), "GRCh37");
    BOOST_CHECK(query.column_is_null(3));
    BOOST_CHECK(!query.step());
}

BOOST_AUTO_TEST_CASE(bad_sql_is_a_database_error)
{
    TemporaryFile db {};
    Session session {db.path()};
    BOOST_CHECK_THROW(session.execute("CREATE NONSENSE"), DatabaseError);
    BOOST_CHECK_THROW(session.prepare("SELECT * FROM no_such_table"), DatabaseError);
}

BOOST_AUTO_TEST_CASE(uncommitted_transactions_are_rolled_back)
{
    TemporaryFile db {};
    Session session {db.path()};
    session.execute("CREATE TABLE t (x INTEGER)");
    {
        Transaction transaction {session};
        session.execute("INSERT INTO t VALUES (1)");
    }
    BOOST_CHECK_EQUAL(count_rows(session, "t"), 0);
    {
        Transaction transaction {session};
        session.execute("INSERT INTO t VALUES (1)");
        transaction.commit();
    }
    BOOST_CHECK_EQUAL(count_rows(session, "t"), 1);
}

BOOST_AUTO_TEST_CASE(lifecycle_phases_must_follow_in_order)
{
    TemporaryFile db {};
    Session session {db.path()};
    TableLifecycle table {session, make_test_schema()};
    BOOST_CHECK_EQUAL(table.phase(), TableLifecycle::Phase::declared);
    BOOST_CHECK_THROW(table.populate(), TableLifecycleError);
    BOOST_CHECK_THROW(table.index(), TableLifecycleError);
    table.recreate();
    BOOST_CHECK_THROW(table.recreate(), TableLifecycleError);
    table.populate();
    table.populate();
    BOOST_CHECK_EQUAL(table.phase(), TableLifecycle::Phase::populated);
    table.index();
    BOOST_CHECK_EQUAL(table.phase(), TableLifecycle::Phase::indexed);
    BOOST_CHECK_THROW(table.populate(), TableLifecycleError);
    BOOST_CHECK_THROW(table.index(), TableLifecycleError);
}

BOOST_AUTO_TEST_CASE(upserts_replace_rows_with_the_same_primary_key)
{
    TemporaryFile db {};
    Session session {db.path()};
    TableLifecycle table {session, make_test_schema()};
    table.recreate();
    auto& upsert = table.populate();
    upsert.bind(1, std::string {"GRCh37"}).bind(2, 10L).bind(3, 0.5);
    upsert.execute();
    upsert.reset();
    upsert.bind(1, std::string {"GRCh37"}).bind(2, 10L).bind(3, 0.75);
    upsert.execute();
    upsert.reset();
    upsert.bind(1, std::string {"GRCh38"}).bind(2, 10L).bind(3, 0.25);
    upsert.execute();
    upsert.reset();
    table.index();
    BOOST_CHECK_EQUAL(count_rows(session, "test_var"), 2);
    auto query = session.prepare("SELECT score FROM test_var WHERE release = 'GRCh37'");
    BOOST_REQUIRE(query.step());
    BOOST_CHECK_CLOSE(query.column_double(0), 0.75, 1e-9);
}

BOOST_AUTO_TEST_CASE(recreating_a_table_drops_its_old_rows)
{
    TemporaryFile db {};
    Session session {db.path()};
    {
        TableLifecycle table {session, make_test_schema()};
        table.recreate();
        auto& upsert = table.populate();
        upsert.bind(1, std::string {"GRCh37"}).bind(2, 1L).bind(3, 0.5);
        upsert.execute();
        table.index();
    }
    TableLifecycle table {session, make_test_schema()};
    table.recreate();
    BOOST_CHECK_EQUAL(count_rows(session, "test_var"), 0);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
