#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "sqlkv/error.h"
#include "sqlkv/sql_client.h"

namespace sqlkv
{
struct KvOptions;
class Connection;

/**
 * @brief Runs statements once the backend is connected, retrying transient
 * failures.
 *
 * While the connection is not CONNECTED, the caller re-checks it every
 * poll_interval_ms. Inside a worker task the wait yields to other tasks,
 * elsewhere it sleeps the calling thread. A statement gets at most
 * max_attempts attempts and the connected-state wait is repeated before each
 * of them.
 */
class QueryExecutor
{
public:
    QueryExecutor(const KvOptions *opts, Connection *conn);

    /**
     * @return NoError, NotRunning if the store closes while waiting, Timeout
     * if op_timeout_ms elapses while waiting, otherwise BackendErr.
     */
    KvError Execute(std::string_view sql,
                    const std::vector<std::string> &args,
                    ResultSet *rows = nullptr);

    SqlDialect Dialect() const;

    /**
     * @brief Backend message of the latest failed attempt.
     */
    const std::string &LastError() const
    {
        return last_error_;
    }

private:
    KvError WaitConnected();
    void Sleep(std::chrono::milliseconds dur);

    const KvOptions *options_;
    Connection *conn_;
    std::string last_error_;
};
}  // namespace sqlkv
