#pragma once

#include <ignite/thin/cache/cache_client.h>
#include <ignite/thin/ignite_client.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sqlkv/sql_client.h"

namespace sqlkv
{
/**
 * @brief Apache Ignite backend over the C++ thin client.
 *
 * Every cache of the location is an Ignite cache created on demand, and
 * statements run as SQL fields queries in the PUBLIC schema. The thin client
 * connects synchronously, so Connect() reports CONNECTING then CONNECTED or
 * DISCONNECTED before it returns. A network failure drops the client, and
 * PollState() starts a new one at most once per reconnect_interval_ms.
 */
class IgniteClient : public SqlClient
{
public:
    explicit IgniteClient(const KvOptions *opts);
    IgniteClient(const IgniteClient &) = delete;
    IgniteClient &operator=(const IgniteClient &) = delete;
    ~IgniteClient() override;

    KvError Connect(const Location &loc) override;
    void Disconnect() override;
    void PollState() override;
    KvError OpenCache(std::string_view cache) override;
    KvError Query(std::string_view sql,
                  const std::vector<std::string> &args,
                  ResultSet *rows) override;
    SqlDialect Dialect() const override
    {
        return SqlDialect::Ignite;
    }

private:
    using KvCache = ignite::thin::cache::CacheClient<std::string, std::string>;

    void StartClient();
    void ConnectionLost(std::string_view reason);
    KvError SelectCache();

    const KvOptions *options_;
    Location loc_;
    std::string cache_name_;
    std::unique_ptr<ignite::thin::IgniteClient> client_;
    std::unique_ptr<KvCache> cache_;
    ConnState state_{ConnState::Disconnected};
    std::chrono::steady_clock::time_point next_attempt_;
    bool active_{false};
};
}  // namespace sqlkv
