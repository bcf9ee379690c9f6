#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "sqlkv/pg_client.h"
#include "sqlkv/statements.h"

TEST_CASE("schema statements", "[statements]")
{
    REQUIRE(sqlkv::stmt::CreateTable(256, 1024) ==
            "CREATE TABLE IF NOT EXISTS kvstore (k CHAR(256), v CHAR(1024), "
            "PRIMARY KEY (k))");
    REQUIRE(sqlkv::stmt::CreateIndex() ==
            "CREATE INDEX IF NOT EXISTS kvstore_k ON kvstore (k)");
}

TEST_CASE("compound write statements", "[statements]")
{
    REQUIRE(sqlkv::stmt::DeleteKeys(1) == "DELETE FROM kvstore WHERE k IN (?)");
    REQUIRE(sqlkv::stmt::DeleteKeys(3) ==
            "DELETE FROM kvstore WHERE k IN (?, ?, ?)");
    REQUIRE(sqlkv::stmt::UpsertRows(2) ==
            "INSERT INTO kvstore (k, v) VALUES (?, ?), (?, ?) "
            "ON CONFLICT (k) DO UPDATE SET v = excluded.v");
}

TEST_CASE("ignite statements", "[statements]")
{
    using sqlkv::SqlDialect;
    REQUIRE(sqlkv::stmt::CreateTable(256, 1024, SqlDialect::Ignite, "users") ==
            "CREATE TABLE IF NOT EXISTS kvstore (k CHAR(256), v CHAR(1024), "
            "PRIMARY KEY (k)) WITH \"template=partitioned, backups=1, "
            "affinityKey=k, CACHE_NAME=users_kvstore\"");
    REQUIRE(sqlkv::stmt::UpsertRow(SqlDialect::Ignite) ==
            "MERGE INTO kvstore (k, v) VALUES (?, ?)");
    REQUIRE(sqlkv::stmt::UpsertRows(3, SqlDialect::Ignite) ==
            "MERGE INTO kvstore (k, v) VALUES (?, ?), (?, ?), (?, ?)");

    REQUIRE(sqlkv::stmt::UpsertRow(SqlDialect::Postgres) ==
            sqlkv::stmt::upsert_row);
    REQUIRE(sqlkv::stmt::UpsertRows(2, SqlDialect::Postgres) ==
            sqlkv::stmt::UpsertRows(2));
}

TEST_CASE("scan statements", "[statements]")
{
    std::vector<std::string> args;
    REQUIRE(sqlkv::stmt::Scan(sqlkv::ScanRange(), args) ==
            "SELECT k, v FROM kvstore ORDER BY k ASC");
    REQUIRE(args.empty());

    REQUIRE(sqlkv::stmt::Scan(sqlkv::ScanRange().Gte("a").Lt("c"), args) ==
            "SELECT k, v FROM kvstore WHERE k >= ? AND k < ? ORDER BY k ASC");
    REQUIRE(args == std::vector<std::string>{"61", "63"});

    args.clear();
    REQUIRE(sqlkv::stmt::Scan(sqlkv::ScanRange().Lte("c").Reverse(), args) ==
            "SELECT k, v FROM kvstore WHERE k <= ? ORDER BY k DESC");
    REQUIRE(args == std::vector<std::string>{"63"});

    args.clear();
    REQUIRE(sqlkv::stmt::Scan(sqlkv::ScanRange().Gt("a").Limit(5), args) ==
            "SELECT k, v FROM kvstore WHERE k > ? ORDER BY k ASC LIMIT ?");
    REQUIRE(args == std::vector<std::string>{"61", "5"});
}

TEST_CASE("clear statements", "[statements]")
{
    std::vector<std::string> args;
    REQUIRE(sqlkv::stmt::Clear(sqlkv::ScanRange(), args) ==
            "DELETE FROM kvstore");
    REQUIRE(args.empty());

    REQUIRE(sqlkv::stmt::Clear(sqlkv::ScanRange().Gt("a").Lte("b"), args) ==
            "DELETE FROM kvstore WHERE k > ? AND k <= ?");
    REQUIRE(args == std::vector<std::string>{"61", "62"});

    args.clear();
    REQUIRE(sqlkv::stmt::Clear(sqlkv::ScanRange().Reverse().Limit(2), args) ==
            "DELETE FROM kvstore WHERE k IN (SELECT k FROM kvstore "
            "ORDER BY k DESC LIMIT ?)");
    REQUIRE(args == std::vector<std::string>{"2"});
}

TEST_CASE("postgres placeholders", "[statements]")
{
    REQUIRE(sqlkv::PgClient::RewritePlaceholders(
                "SELECT v FROM kvstore WHERE k = ?") ==
            "SELECT v FROM kvstore WHERE k = $1");
    REQUIRE(sqlkv::PgClient::RewritePlaceholders(sqlkv::stmt::UpsertRows(2)) ==
            "INSERT INTO kvstore (k, v) VALUES ($1, $2), ($3, $4) "
            "ON CONFLICT (k) DO UPDATE SET v = excluded.v");
    REQUIRE(sqlkv::PgClient::RewritePlaceholders(
                "SELECT '?', \"a?\" WHERE k = ?") ==
            "SELECT '?', \"a?\" WHERE k = $1");
}

TEST_CASE("postgres transient errors", "[statements]")
{
    REQUIRE(sqlkv::PgClient::IsTransientSqlState("08006"));
    REQUIRE(sqlkv::PgClient::IsTransientSqlState("40001"));
    REQUIRE(sqlkv::PgClient::IsTransientSqlState("57P01"));
    REQUIRE_FALSE(sqlkv::PgClient::IsTransientSqlState("23505"));
    REQUIRE_FALSE(sqlkv::PgClient::IsTransientSqlState("42P01"));
    REQUIRE_FALSE(sqlkv::PgClient::IsTransientSqlState(""));
}
