#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sqlkv/types.h"

namespace sqlkv
{
/**
 * SQL text of every statement the store issues against the backing table
 * kvstore(k, v). Placeholders are '?', arguments are encoded by Codec.
 */
namespace stmt
{
constexpr char table_name[] = "kvstore";
constexpr char index_name[] = "kvstore_k";

constexpr std::string_view select_value = "SELECT v FROM kvstore WHERE k = ?";
constexpr std::string_view upsert_row =
    "INSERT INTO kvstore (k, v) VALUES (?, ?) "
    "ON CONFLICT (k) DO UPDATE SET v = excluded.v";
constexpr std::string_view merge_row =
    "MERGE INTO kvstore (k, v) VALUES (?, ?)";
constexpr std::string_view delete_row = "DELETE FROM kvstore WHERE k = ?";

/**
 * @brief Ignite tables are partitioned, keep one backup and are backed by the
 * cache <cache>_kvstore.
 */
std::string CreateTable(uint32_t key_size,
                        uint32_t value_size,
                        SqlDialect dialect = SqlDialect::Postgres,
                        std::string_view cache = {});
std::string CreateIndex();

/**
 * @brief DELETE ... WHERE k IN (?, ...) with n placeholders.
 */
std::string DeleteKeys(size_t n);
std::string_view UpsertRow(SqlDialect dialect);
/**
 * @brief Multi-row upsert of n (k, v) pairs: INSERT ... ON CONFLICT, or MERGE
 * INTO for Ignite.
 */
std::string UpsertRows(size_t n, SqlDialect dialect = SqlDialect::Postgres);

/**
 * @brief SELECT k, v over a range. The encoded bounds are appended to args
 * in placeholder order.
 */
std::string Scan(const ScanRange &range, std::vector<std::string> &args);
/**
 * @brief DELETE over a range. With a limit, the rows removed are the first
 * ones in the range's direction.
 */
std::string Clear(const ScanRange &range, std::vector<std::string> &args);
}  // namespace stmt
}  // namespace sqlkv
