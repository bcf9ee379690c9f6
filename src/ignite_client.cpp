#include "sqlkv/ignite_client.h"

#include <glog/logging.h>
#include <ignite/ignite_error.h>
#include <ignite/thin/cache/query/query_fields_cursor.h>
#include <ignite/thin/cache/query/query_fields_row.h>
#include <ignite/thin/cache/query/query_sql_fields.h>
#include <ignite/thin/ignite_client_configuration.h>

#include <string>
#include <utility>

#include "sqlkv/kv_options.h"

namespace sqlkv
{
namespace
{
constexpr uint16_t default_port = 10800;
constexpr char sql_schema[] = "PUBLIC";

bool IsNetworkError(const ignite::IgniteError &err)
{
    return err.GetCode() == ignite::IgniteError::IGNITE_ERR_NETWORK_FAILURE ||
           err.GetCode() ==
               ignite::IgniteError::IGNITE_ERR_SECURE_CONNECTION_FAILURE;
}
}  // namespace

IgniteClient::IgniteClient(const KvOptions *opts) : options_(opts)
{
}

IgniteClient::~IgniteClient()
{
    cache_.reset();
    client_.reset();
}

KvError IgniteClient::Connect(const Location &loc)
{
    if (loc.host_.empty())
    {
        last_error_ = "missing host";
        return KvError::InvalidArgs;
    }
    loc_ = loc;
    if (loc_.port_ == 0)
    {
        loc_.port_ = default_port;
    }
    active_ = true;
    StartClient();
    return KvError::NoError;
}

void IgniteClient::Disconnect()
{
    active_ = false;
    cache_.reset();
    client_.reset();
    if (state_ != ConnState::Disconnected)
    {
        state_ = ConnState::Disconnected;
        SetState(ConnState::Disconnected, "closed by client");
    }
}

void IgniteClient::PollState()
{
    if (active_ && state_ == ConnState::Disconnected &&
        std::chrono::steady_clock::now() >= next_attempt_)
    {
        StartClient();
    }
}

void IgniteClient::StartClient()
{
    cache_.reset();
    client_.reset();
    state_ = ConnState::Connecting;
    SetState(ConnState::Connecting);

    ignite::thin::IgniteClientConfiguration cfg;
    cfg.SetEndPoints(loc_.host_ + ":" + std::to_string(loc_.port_));
    if (!loc_.user_.empty())
    {
        cfg.SetUser(loc_.user_);
        cfg.SetPassword(loc_.password_);
    }
    try
    {
        client_ = std::make_unique<ignite::thin::IgniteClient>(
            ignite::thin::IgniteClient::Start(cfg));
    }
    catch (const ignite::IgniteError &err)
    {
        ConnectionLost(err.GetText());
        return;
    }

    state_ = ConnState::Connected;
    if (!cache_name_.empty())
    {
        KvError err = SelectCache();
        if (err != KvError::NoError)
        {
            if (state_ == ConnState::Connected)
            {
                ConnectionLost(last_error_);
            }
            return;
        }
    }
    SetState(ConnState::Connected);
}

void IgniteClient::ConnectionLost(std::string_view reason)
{
    // reason may point into last_error_.
    std::string msg(reason);
    last_error_ = msg;
    cache_.reset();
    client_.reset();
    next_attempt_ = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options_->reconnect_interval_ms);
    state_ = ConnState::Disconnected;
    SetState(ConnState::Disconnected, msg);
}

KvError IgniteClient::OpenCache(std::string_view cache)
{
    if (state_ != ConnState::Connected)
    {
        return KvError::TryAgain;
    }
    cache_name_ = cache;
    return SelectCache();
}

KvError IgniteClient::SelectCache()
{
    try
    {
        cache_ = std::make_unique<KvCache>(
            client_->GetOrCreateCache<std::string, std::string>(
                cache_name_.c_str()));
    }
    catch (const ignite::IgniteError &err)
    {
        last_error_ = err.GetText();
        LOG(ERROR) << "ignite cache " << cache_name_
                   << " could not be initialized: " << last_error_;
        if (IsNetworkError(err))
        {
            ConnectionLost(last_error_);
            return KvError::TryAgain;
        }
        return KvError::BackendErr;
    }
    return KvError::NoError;
}

KvError IgniteClient::Query(std::string_view sql,
                            const std::vector<std::string> &args,
                            ResultSet *rows)
{
    if (state_ != ConnState::Connected || cache_ == nullptr)
    {
        return KvError::TryAgain;
    }

    ignite::thin::cache::query::SqlFieldsQuery qry{std::string(sql)};
    qry.SetSchema(sql_schema);
    for (const std::string &arg : args)
    {
        qry.AddArgument(arg);
    }
    try
    {
        ignite::thin::cache::query::QueryFieldsCursor cursor =
            cache_->Query(qry);
        if (rows == nullptr)
        {
            return KvError::NoError;
        }
        while (cursor.HasNext())
        {
            ignite::thin::cache::query::QueryFieldsRow fields =
                cursor.GetNext();
            SqlRow &row = rows->emplace_back();
            while (fields.HasNext())
            {
                row.emplace_back(fields.GetNext<std::string>());
            }
        }
    }
    catch (const ignite::IgniteError &err)
    {
        last_error_ = err.GetText();
        if (IsNetworkError(err))
        {
            ConnectionLost(last_error_);
            return KvError::TryAgain;
        }
        return KvError::BackendErr;
    }
    return KvError::NoError;
}

}  // namespace sqlkv
