#include "sqlkv/sql_client.h"

#include <utility>

#ifdef SQLKV_WITH_IGNITE
#include "sqlkv/ignite_client.h"
#endif
#include "sqlkv/pg_client.h"
#include "sqlkv/sqlite_client.h"

namespace sqlkv
{
std::unique_ptr<SqlClient> SqlClient::Create(std::string_view scheme,
                                             const KvOptions *opts)
{
    if (scheme == "sqlite")
    {
        return std::make_unique<SqliteClient>(opts);
    }
    if (scheme == "postgres" || scheme == "postgresql")
    {
        return std::make_unique<PgClient>(opts);
    }
#ifdef SQLKV_WITH_IGNITE
    if (scheme == "ignite")
    {
        return std::make_unique<IgniteClient>(opts);
    }
#endif
    return nullptr;
}

void SqlClient::SetStateObserver(StateObserver observer)
{
    observer_ = std::move(observer);
}

void SqlClient::SetState(ConnState state, std::string_view reason)
{
    if (observer_)
    {
        observer_(state, reason);
    }
}

}  // namespace sqlkv
