#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "sqlkv/sql_client.h"

namespace sqlkv
{
enum class PgPoll : uint8_t
{
    Pending = 0,
    Ok,
    Failed
};

/**
 * @brief Outcome of one statement sent through a PgDriver.
 */
struct PgExecResult
{
    bool ok_{false};
    /**
     * @brief Five character SQLSTATE of a failed statement, empty if the
     * server sent none.
     */
    std::string sqlstate_;
    std::string message_;
};

/**
 * @brief The libpq calls PgClient is built on, one connection at a time.
 */
class PgDriver
{
public:
    virtual ~PgDriver() = default;

    /**
     * @brief Start a non-blocking connect, dropping any previous connection.
     * @return false if the connect could not even be started.
     */
    virtual bool StartConnect(const Location &loc,
                              const std::string &database) = 0;
    /**
     * @brief Advance the handshake if its socket is ready. Never blocks.
     */
    virtual PgPoll PollConnect() = 0;
    /**
     * @brief The connection is gone (CONNECTION_BAD).
     */
    virtual bool IsBroken() const = 0;
    virtual void Finish() = 0;
    virtual std::string ErrorMessage() const = 0;
    /**
     * @return false if the identifier cannot be quoted.
     */
    virtual bool QuoteIdentifier(std::string_view ident,
                                 std::string &quoted) = 0;
    /**
     * @brief Run a statement with $n placeholders and text parameters.
     */
    virtual PgExecResult Exec(const std::string &sql,
                              const std::vector<std::string> &args,
                              ResultSet *rows) = 0;

    static std::unique_ptr<PgDriver> LibPq();
};

/**
 * @brief PostgreSQL backend over libpq.
 *
 * The connection is established without blocking: Connect() only starts it,
 * and PollState() drives it to completion. A connection found broken by a
 * statement is reported as DISCONNECTED and re-established by later
 * PollState() calls, at most once per reconnect_interval_ms. Each cache is a
 * schema, selected through search_path after every (re)connect.
 */
class PgClient : public SqlClient
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @param driver libpq is used if nullptr.
     * @param clock steady_clock::now is used if empty.
     */
    explicit PgClient(const KvOptions *opts,
                      std::unique_ptr<PgDriver> driver = nullptr,
                      Clock clock = nullptr);
    PgClient(const PgClient &) = delete;
    PgClient &operator=(const PgClient &) = delete;
    ~PgClient() override;

    KvError Connect(const Location &loc) override;
    void Disconnect() override;
    void PollState() override;
    KvError OpenCache(std::string_view cache) override;
    KvError Query(std::string_view sql,
                  const std::vector<std::string> &args,
                  ResultSet *rows) override;

    /**
     * @brief Rewrite '?' placeholders to $1, $2, ... leaving quoted literals
     * and identifiers untouched.
     */
    static std::string RewritePlaceholders(std::string_view sql);
    static bool IsTransientSqlState(std::string_view sqlstate);

private:
    void StartConnect();
    void ContinueConnect();
    void ConnectionLost(std::string_view reason);
    KvError SelectCache();
    KvError Exec(const std::string &sql,
                 const std::vector<std::string> &args,
                 ResultSet *rows);

    const KvOptions *options_;
    std::unique_ptr<PgDriver> driver_;
    Clock clock_;
    Location loc_;
    std::string cache_;
    ConnState state_{ConnState::Disconnected};
    std::chrono::steady_clock::time_point next_attempt_;
    bool active_{false};
};
}  // namespace sqlkv
