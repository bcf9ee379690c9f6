#include "sqlkv/connection.h"

#include <glog/logging.h>

#include <chrono>
#include <string>
#include <thread>
#include <utility>

#include "sqlkv/kv_options.h"
#include "sqlkv/query_executor.h"
#include "sqlkv/statements.h"

namespace sqlkv
{
Connection::Connection(const KvOptions *opts, std::unique_ptr<SqlClient> client)
    : options_(opts), client_(std::move(client)), injected_(client_ != nullptr)
{
}

Connection::~Connection()
{
    Close();
}

KvError Connection::Open(std::string_view location_suffix)
{
    if (open_.load(std::memory_order_acquire))
    {
        return KvError::NoError;
    }
    KvError err = options_->Validate();
    if (err != KvError::NoError)
    {
        LOG(ERROR) << "invalid store options";
        return err;
    }

    // The suffix extends the configured location.
    std::string str = options_->location;
    str.append(location_suffix);
    Location loc = Location::FromString(str);
    if (!loc.IsValid())
    {
        LOG(ERROR) << "invalid location " << str;
        return KvError::InvalidArgs;
    }

    if (!injected_)
    {
        client_ = SqlClient::Create(loc.scheme_, options_);
        if (client_ == nullptr)
        {
            LOG(ERROR) << "unsupported scheme " << loc.scheme_ << " in "
                       << loc;
            return KvError::InvalidArgs;
        }
    }
    location_ = std::move(loc);
    closing_.store(false, std::memory_order_relaxed);
    client_->SetStateObserver([this](ConnState state, std::string_view reason)
                              { OnStateChange(state, reason); });

    LOG(INFO) << "opening store at " << location_;
    err = client_->Connect(location_);
    if (err == KvError::NoError)
    {
        err = WaitConnected();
    }
    if (err != KvError::NoError)
    {
        LOG(ERROR) << "failed to connect to " << location_ << ": "
                   << ErrorString(err) << " " << client_->LastError();
        client_->Disconnect();
        return err;
    }

    err = client_->OpenCache(location_.cache_);
    if (err == KvError::NoError)
    {
        err = Bootstrap();
    }
    if (err != KvError::NoError)
    {
        LOG(ERROR) << "failed to initialize cache " << location_.cache_
                   << ": " << client_->LastError();
        client_->Disconnect();
        return KvError::InitFailed;
    }

    open_.store(true, std::memory_order_release);
    return KvError::NoError;
}

KvError Connection::WaitConnected()
{
    using namespace std::chrono;
    const auto deadline =
        steady_clock::now() + milliseconds(options_->connect_timeout_ms);
    const milliseconds interval(options_->poll_interval_ms);
    while (true)
    {
        client_->PollState();
        if (State() == ConnState::Connected)
        {
            return KvError::NoError;
        }
        if (steady_clock::now() >= deadline)
        {
            return KvError::Timeout;
        }
        std::this_thread::sleep_for(interval);
    }
}

KvError Connection::Bootstrap()
{
    QueryExecutor exec(options_, this);
    KvError err = exec.Execute(stmt::CreateTable(options_->key_size,
                                                 options_->value_size,
                                                 client_->Dialect(),
                                                 location_.cache_),
                               {});
    CHECK_KV_ERR(err);
    return exec.Execute(stmt::CreateIndex(), {});
}

void Connection::BeginClose()
{
    closing_.store(true, std::memory_order_release);
}

void Connection::Close()
{
    closing_.store(true, std::memory_order_release);
    if (!open_.exchange(false, std::memory_order_acq_rel))
    {
        return;
    }
    client_->Disconnect();
    if (!injected_)
    {
        client_.reset();
    }
    state_.store(ConnState::Disconnected, std::memory_order_release);
    LOG(INFO) << "store at " << location_ << " is closed";
}

bool Connection::IsOpen() const
{
    return open_.load(std::memory_order_acquire);
}

bool Connection::IsClosing() const
{
    return closing_.load(std::memory_order_acquire);
}

ConnState Connection::State() const
{
    return state_.load(std::memory_order_acquire);
}

void Connection::Poll()
{
    client_->PollState();
}

SqlClient *Connection::Client() const
{
    return client_.get();
}

const Location &Connection::GetLocation() const
{
    return location_;
}

void Connection::OnStateChange(ConnState state, std::string_view reason)
{
    ConnState prev = state_.exchange(state, std::memory_order_acq_rel);
    if (prev == state)
    {
        return;
    }
    switch (state)
    {
    case ConnState::Connected:
        LOG(INFO) << "connected to " << location_;
        break;
    case ConnState::Connecting:
        VLOG(1) << "connecting to " << location_;
        break;
    case ConnState::Disconnected:
        LOG(WARNING) << "disconnected from " << location_
                     << (reason.empty() ? "" : ": ") << reason;
        break;
    }
}

}  // namespace sqlkv
