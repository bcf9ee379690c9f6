#pragma once

#include <sqlite3.h>

#include <string>
#include <string_view>
#include <vector>

#include "sqlkv/sql_client.h"

namespace sqlkv
{
/**
 * @brief Embedded backend. Each cache is a database file
 * <data_path>/<cache>.db, or an in-memory database if data_path is empty.
 * Host and port of the location are ignored.
 */
class SqliteClient : public SqlClient
{
public:
    explicit SqliteClient(const KvOptions *opts);
    SqliteClient(const SqliteClient &) = delete;
    SqliteClient &operator=(const SqliteClient &) = delete;
    ~SqliteClient() override;

    KvError Connect(const Location &loc) override;
    void Disconnect() override;
    KvError OpenCache(std::string_view cache) override;
    KvError Query(std::string_view sql,
                  const std::vector<std::string> &args,
                  ResultSet *rows) override;

    std::string DatabasePath(std::string_view cache) const;

private:
    KvError ToKvError(int rc);
    void CloseDB();

    const KvOptions *options_;
    sqlite3 *db_{nullptr};
    bool connected_{false};
};
}  // namespace sqlkv
