#include "sqlkv/statements.h"

#include "sqlkv/codec.h"

namespace sqlkv
{
namespace stmt
{
namespace
{
void AppendPlaceholders(std::string &sql, size_t n, std::string_view group)
{
    for (size_t i = 0; i < n; i++)
    {
        if (i > 0)
        {
            sql.append(", ");
        }
        sql.append(group);
    }
}

void AppendRangeClause(std::string &sql,
                       const ScanRange &range,
                       std::vector<std::string> &args)
{
    bool first = true;
    auto add = [&](const char *pred, const std::string &bound)
    {
        sql.append(first ? " WHERE " : " AND ");
        sql.append(pred);
        args.emplace_back(Codec::EncodeBound(bound));
        first = false;
    };

    if (range.gt_)
    {
        add("k > ?", *range.gt_);
    }
    else if (range.gte_)
    {
        add("k >= ?", *range.gte_);
    }
    if (range.lt_)
    {
        add("k < ?", *range.lt_);
    }
    else if (range.lte_)
    {
        add("k <= ?", *range.lte_);
    }
}

void AppendOrderLimit(std::string &sql,
                      const ScanRange &range,
                      std::vector<std::string> &args)
{
    sql.append(range.reverse_ ? " ORDER BY k DESC" : " ORDER BY k ASC");
    if (range.limit_ > 0)
    {
        sql.append(" LIMIT ?");
        args.emplace_back(std::to_string(range.limit_));
    }
}
}  // namespace

std::string CreateTable(uint32_t key_size,
                        uint32_t value_size,
                        SqlDialect dialect,
                        std::string_view cache)
{
    std::string sql = "CREATE TABLE IF NOT EXISTS ";
    sql.append(table_name);
    sql.append(" (k CHAR(");
    sql.append(std::to_string(key_size));
    sql.append("), v CHAR(");
    sql.append(std::to_string(value_size));
    sql.append("), PRIMARY KEY (k))");
    if (dialect == SqlDialect::Ignite)
    {
        sql.append(" WITH \"template=partitioned, backups=1, affinityKey=k, "
                   "CACHE_NAME=");
        sql.append(cache);
        sql.append("_kvstore\"");
    }
    return sql;
}

std::string CreateIndex()
{
    std::string sql = "CREATE INDEX IF NOT EXISTS ";
    sql.append(index_name);
    sql.append(" ON ");
    sql.append(table_name);
    sql.append(" (k)");
    return sql;
}

std::string DeleteKeys(size_t n)
{
    std::string sql = "DELETE FROM kvstore WHERE k IN (";
    AppendPlaceholders(sql, n, "?");
    sql.push_back(')');
    return sql;
}

std::string_view UpsertRow(SqlDialect dialect)
{
    return dialect == SqlDialect::Ignite ? merge_row : upsert_row;
}

std::string UpsertRows(size_t n, SqlDialect dialect)
{
    if (dialect == SqlDialect::Ignite)
    {
        std::string sql = "MERGE INTO kvstore (k, v) VALUES ";
        AppendPlaceholders(sql, n, "(?, ?)");
        return sql;
    }
    std::string sql = "INSERT INTO kvstore (k, v) VALUES ";
    AppendPlaceholders(sql, n, "(?, ?)");
    sql.append(" ON CONFLICT (k) DO UPDATE SET v = excluded.v");
    return sql;
}

std::string Scan(const ScanRange &range, std::vector<std::string> &args)
{
    std::string sql = "SELECT k, v FROM kvstore";
    AppendRangeClause(sql, range, args);
    AppendOrderLimit(sql, range, args);
    return sql;
}

std::string Clear(const ScanRange &range, std::vector<std::string> &args)
{
    if (range.limit_ == 0)
    {
        std::string sql = "DELETE FROM kvstore";
        AppendRangeClause(sql, range, args);
        return sql;
    }
    std::string sql = "DELETE FROM kvstore WHERE k IN (SELECT k FROM kvstore";
    AppendRangeClause(sql, range, args);
    AppendOrderLimit(sql, range, args);
    sql.push_back(')');
    return sql;
}

}  // namespace stmt
}  // namespace sqlkv
