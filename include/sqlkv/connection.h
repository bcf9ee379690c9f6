#pragma once

#include <atomic>
#include <memory>
#include <string_view>

#include "sqlkv/error.h"
#include "sqlkv/sql_client.h"
#include "sqlkv/types.h"

namespace sqlkv
{
struct KvOptions;

/**
 * @brief Owns the backend client of a store and tracks the connection state
 * it pushes.
 */
class Connection
{
public:
    /**
     * @param client Client to use instead of the one matching the location
     * scheme. Kept across Close()/Open().
     */
    Connection(const KvOptions *opts, std::unique_ptr<SqlClient> client);
    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;
    ~Connection();

    /**
     * @brief Connect to options.location + location_suffix, select the cache
     * and create the backing table if missing. No-op if already open.
     */
    KvError Open(std::string_view location_suffix);
    /**
     * @brief Make statements waiting for a connected backend give up.
     */
    void BeginClose();
    void Close();
    bool IsOpen() const;
    bool IsClosing() const;

    ConnState State() const;
    /**
     * @brief Let the client make connection progress.
     */
    void Poll();

    SqlClient *Client() const;
    const Location &GetLocation() const;

private:
    void OnStateChange(ConnState state, std::string_view reason);
    KvError WaitConnected();
    KvError Bootstrap();

    const KvOptions *options_;
    std::unique_ptr<SqlClient> client_;
    const bool injected_;
    Location location_;
    std::atomic<ConnState> state_{ConnState::Disconnected};
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
};
}  // namespace sqlkv
