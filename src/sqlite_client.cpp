#include "sqlkv/sqlite_client.h"

#include <glog/logging.h>

#include <filesystem>
#include <memory>
#include <system_error>

#include "sqlkv/kv_options.h"

namespace fs = std::filesystem;

namespace sqlkv
{
namespace
{
constexpr char memory_db[] = ":memory:";
constexpr int busy_timeout_ms = 200;

struct StmtDeleter
{
    void operator()(sqlite3_stmt *stmt) const
    {
        sqlite3_finalize(stmt);
    }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;
}  // namespace

SqliteClient::SqliteClient(const KvOptions *opts) : options_(opts)
{
}

SqliteClient::~SqliteClient()
{
    CloseDB();
}

KvError SqliteClient::Connect(const Location &loc)
{
    SetState(ConnState::Connecting);
    if (!options_->data_path.empty())
    {
        std::error_code ec;
        fs::create_directories(options_->data_path, ec);
        if (ec)
        {
            last_error_ = ec.message();
            LOG(ERROR) << "failed to create " << options_->data_path << ": "
                       << last_error_;
            SetState(ConnState::Disconnected, last_error_);
            return KvError::InvalidArgs;
        }
    }
    DLOG(INFO) << "sqlite client serves " << loc;
    connected_ = true;
    SetState(ConnState::Connected);
    return KvError::NoError;
}

void SqliteClient::Disconnect()
{
    CloseDB();
    if (connected_)
    {
        connected_ = false;
        SetState(ConnState::Disconnected, "closed by client");
    }
}

std::string SqliteClient::DatabasePath(std::string_view cache) const
{
    if (options_->data_path.empty())
    {
        return memory_db;
    }
    fs::path path(options_->data_path);
    path.append(cache);
    path += ".db";
    return path.string();
}

KvError SqliteClient::OpenCache(std::string_view cache)
{
    if (!connected_)
    {
        return KvError::TryAgain;
    }
    CloseDB();

    const std::string path = DatabasePath(cache);
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        last_error_ = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        LOG(ERROR) << "failed to open sqlite database " << path << ": "
                   << last_error_;
        CloseDB();
        return KvError::InitFailed;
    }
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    if (path != memory_db)
    {
        char *err_msg = nullptr;
        rc = sqlite3_exec(
            db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            LOG(WARNING) << "failed to enable WAL on " << path << ": "
                         << (err_msg ? err_msg : sqlite3_errstr(rc));
            sqlite3_free(err_msg);
        }
    }
    LOG(INFO) << "sqlite cache " << cache << " opened at " << path;
    return KvError::NoError;
}

KvError SqliteClient::Query(std::string_view sql,
                            const std::vector<std::string> &args,
                            ResultSet *rows)
{
    if (!connected_)
    {
        return KvError::TryAgain;
    }
    if (db_ == nullptr)
    {
        last_error_ = "no cache opened";
        return KvError::BackendErr;
    }

    sqlite3_stmt *raw = nullptr;
    int rc = sqlite3_prepare_v2(
        db_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
    StmtPtr stmt(raw);
    if (rc != SQLITE_OK)
    {
        return ToKvError(rc);
    }

    for (size_t i = 0; i < args.size(); i++)
    {
        rc = sqlite3_bind_text(stmt.get(),
                               static_cast<int>(i + 1),
                               args[i].data(),
                               static_cast<int>(args[i].size()),
                               SQLITE_TRANSIENT);
        if (rc != SQLITE_OK)
        {
            return ToKvError(rc);
        }
    }

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        if (rows == nullptr)
        {
            continue;
        }
        int ncols = sqlite3_column_count(stmt.get());
        SqlRow &row = rows->emplace_back();
        row.reserve(ncols);
        for (int col = 0; col < ncols; col++)
        {
            auto text = reinterpret_cast<const char *>(
                sqlite3_column_text(stmt.get(), col));
            int len = sqlite3_column_bytes(stmt.get(), col);
            row.emplace_back(text ? std::string(text, len) : std::string());
        }
    }
    if (rc != SQLITE_DONE)
    {
        return ToKvError(rc);
    }
    return KvError::NoError;
}

KvError SqliteClient::ToKvError(int rc)
{
    last_error_ = sqlite3_errmsg(db_);
    switch (rc & 0xff)
    {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        return KvError::TryAgain;
    default:
        return KvError::BackendErr;
    }
}

void SqliteClient::CloseDB()
{
    if (db_ == nullptr)
    {
        return;
    }
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK)
    {
        LOG(ERROR) << "failed to close sqlite database: " << sqlite3_errstr(rc);
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}

}  // namespace sqlkv
