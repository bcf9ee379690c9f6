#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sqlkv/error.h"
#include "sqlkv/types.h"

namespace sqlkv
{
struct KvOptions;

enum class ConnState : uint8_t
{
    Disconnected = 0,
    Connecting,
    Connected
};

constexpr const char *ConnStateString(ConnState state)
{
    switch (state)
    {
    case ConnState::Disconnected:
        return "DISCONNECTED";
    case ConnState::Connecting:
        return "CONNECTING";
    case ConnState::Connected:
        return "CONNECTED";
    }
    return "UNKNOWN";
}

using SqlRow = std::vector<std::string>;
using ResultSet = std::vector<SqlRow>;
using StateObserver = std::function<void(ConnState, std::string_view reason)>;

/**
 * @brief Statement-executing backend consumed by the store.
 *
 * Statements use '?' for positional parameters, all parameters and all result
 * columns are text. A client pushes every connection state transition to the
 * registered observer. Apart from the observer, a client is used by one
 * thread at a time.
 */
class SqlClient
{
public:
    virtual ~SqlClient() = default;

    /**
     * @brief Create the client serving the scheme of a location.
     * Schemes: sqlite, postgres (or postgresql), and ignite when built with
     * the Apache Ignite thin client.
     * @return nullptr if the scheme is not supported.
     */
    static std::unique_ptr<SqlClient> Create(std::string_view scheme,
                                             const KvOptions *opts);

    virtual void SetStateObserver(StateObserver observer);

    /**
     * @brief Start connecting to the backend. Completion is reported through
     * the state observer.
     */
    virtual KvError Connect(const Location &loc) = 0;
    virtual void Disconnect() = 0;
    /**
     * @brief Let the client make connection progress (finish a pending
     * connect, reconnect after a drop). Never blocks.
     */
    virtual void PollState()
    {
    }

    /**
     * @brief Create the cache if missing and direct subsequent statements to
     * it. Requires a connected client.
     */
    virtual KvError OpenCache(std::string_view cache) = 0;

    /**
     * @brief Run one statement.
     * @param rows Receives the result rows if not nullptr.
     * @return TryAgain/Busy for transient failures (including a lost
     * connection), BackendErr for statement failures.
     */
    virtual KvError Query(std::string_view sql,
                          const std::vector<std::string> &args,
                          ResultSet *rows) = 0;

    /**
     * @brief Flavor of the statements this client accepts.
     */
    virtual SqlDialect Dialect() const
    {
        return SqlDialect::Postgres;
    }

    const std::string &LastError() const
    {
        return last_error_;
    }

protected:
    void SetState(ConnState state, std::string_view reason = {});

    StateObserver observer_{nullptr};
    std::string last_error_;
};
}  // namespace sqlkv
