#include "sqlkv/pg_client.h"

#include <libpq-fe.h>
#include <poll.h>

#include <memory>
#include <string>
#include <utility>

#include "sqlkv/kv_options.h"

namespace sqlkv
{
namespace
{
constexpr uint16_t default_port = 5432;

struct ResultDeleter
{
    void operator()(PGresult *res) const
    {
        PQclear(res);
    }
};
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

std::string TrimMessage(const char *msg)
{
    std::string str(msg ? msg : "");
    while (!str.empty() && (str.back() == '\n' || str.back() == ' '))
    {
        str.pop_back();
    }
    return str;
}

class LibPqDriver : public PgDriver
{
public:
    LibPqDriver() = default;
    LibPqDriver(const LibPqDriver &) = delete;
    LibPqDriver &operator=(const LibPqDriver &) = delete;
    ~LibPqDriver() override
    {
        Finish();
    }

    bool StartConnect(const Location &loc, const std::string &database) override
    {
        Finish();
        const std::string port = std::to_string(loc.port_);
        const char *keywords[] = {
            "host", "port", "user", "password", "dbname", nullptr};
        const char *values[] = {
            loc.host_.c_str(),
            port.c_str(),
            loc.user_.empty() ? nullptr : loc.user_.c_str(),
            loc.password_.empty() ? nullptr : loc.password_.c_str(),
            database.c_str(),
            nullptr};
        conn_ = PQconnectStartParams(keywords, values, 0);
        poll_status_ = PGRES_POLLING_WRITING;
        return conn_ != nullptr && PQstatus(conn_) != CONNECTION_BAD;
    }

    PgPoll PollConnect() override
    {
        // Only advance the handshake once the socket is ready for it.
        pollfd pfd;
        pfd.fd = PQsocket(conn_);
        pfd.events = poll_status_ == PGRES_POLLING_READING ? POLLIN : POLLOUT;
        pfd.revents = 0;
        if (pfd.fd >= 0 && ::poll(&pfd, 1, 0) == 0)
        {
            return PgPoll::Pending;
        }

        poll_status_ = PQconnectPoll(conn_);
        switch (poll_status_)
        {
        case PGRES_POLLING_OK:
            return PgPoll::Ok;
        case PGRES_POLLING_FAILED:
            return PgPoll::Failed;
        default:
            return PgPoll::Pending;
        }
    }

    bool IsBroken() const override
    {
        return conn_ == nullptr || PQstatus(conn_) == CONNECTION_BAD;
    }

    void Finish() override
    {
        if (conn_ != nullptr)
        {
            PQfinish(conn_);
            conn_ = nullptr;
        }
    }

    std::string ErrorMessage() const override
    {
        return conn_ ? TrimMessage(PQerrorMessage(conn_))
                     : std::string("out of memory");
    }

    bool QuoteIdentifier(std::string_view ident, std::string &quoted) override
    {
        char *str = PQescapeIdentifier(conn_, ident.data(), ident.size());
        if (str == nullptr)
        {
            return false;
        }
        quoted = str;
        PQfreemem(str);
        return true;
    }

    PgExecResult Exec(const std::string &sql,
                      const std::vector<std::string> &args,
                      ResultSet *rows) override
    {
        std::vector<const char *> values;
        values.reserve(args.size());
        for (const std::string &arg : args)
        {
            values.push_back(arg.c_str());
        }

        ResultPtr res(PQexecParams(conn_,
                                   sql.c_str(),
                                   static_cast<int>(values.size()),
                                   nullptr,
                                   values.data(),
                                   nullptr,
                                   nullptr,
                                   0));
        ExecStatusType status =
            res ? PQresultStatus(res.get()) : PGRES_FATAL_ERROR;
        PgExecResult result;
        if (status == PGRES_COMMAND_OK)
        {
            result.ok_ = true;
            return result;
        }
        if (status == PGRES_TUPLES_OK)
        {
            if (rows != nullptr)
            {
                int ntuples = PQntuples(res.get());
                int nfields = PQnfields(res.get());
                rows->reserve(rows->size() + ntuples);
                for (int i = 0; i < ntuples; i++)
                {
                    SqlRow &row = rows->emplace_back();
                    row.reserve(nfields);
                    for (int j = 0; j < nfields; j++)
                    {
                        row.emplace_back(PQgetvalue(res.get(), i, j),
                                         PQgetlength(res.get(), i, j));
                    }
                }
            }
            result.ok_ = true;
            return result;
        }

        result.message_ = TrimMessage(res ? PQresultErrorMessage(res.get())
                                          : PQerrorMessage(conn_));
        const char *sqlstate =
            res ? PQresultErrorField(res.get(), PG_DIAG_SQLSTATE) : nullptr;
        if (sqlstate != nullptr)
        {
            result.sqlstate_ = sqlstate;
        }
        return result;
    }

private:
    PGconn *conn_{nullptr};
    PostgresPollingStatusType poll_status_{PGRES_POLLING_WRITING};
};
}  // namespace

std::unique_ptr<PgDriver> PgDriver::LibPq()
{
    return std::make_unique<LibPqDriver>();
}

PgClient::PgClient(const KvOptions *opts,
                   std::unique_ptr<PgDriver> driver,
                   Clock clock)
    : options_(opts), driver_(std::move(driver)), clock_(std::move(clock))
{
    if (driver_ == nullptr)
    {
        driver_ = PgDriver::LibPq();
    }
    if (!clock_)
    {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

PgClient::~PgClient()
{
    driver_->Finish();
}

KvError PgClient::Connect(const Location &loc)
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
    StartConnect();
    return KvError::NoError;
}

void PgClient::Disconnect()
{
    active_ = false;
    driver_->Finish();
    if (state_ != ConnState::Disconnected)
    {
        state_ = ConnState::Disconnected;
        SetState(ConnState::Disconnected, "closed by client");
    }
}

void PgClient::PollState()
{
    if (!active_)
    {
        return;
    }
    switch (state_)
    {
    case ConnState::Connected:
        if (driver_->IsBroken())
        {
            ConnectionLost(driver_->ErrorMessage());
        }
        break;
    case ConnState::Connecting:
        ContinueConnect();
        break;
    case ConnState::Disconnected:
        if (clock_() >= next_attempt_)
        {
            StartConnect();
        }
        break;
    }
}

void PgClient::StartConnect()
{
    if (!driver_->StartConnect(loc_, options_->database))
    {
        ConnectionLost(driver_->ErrorMessage());
        return;
    }
    state_ = ConnState::Connecting;
    SetState(ConnState::Connecting);
}

void PgClient::ContinueConnect()
{
    switch (driver_->PollConnect())
    {
    case PgPoll::Ok:
    {
        state_ = ConnState::Connected;
        if (!cache_.empty())
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
        break;
    }
    case PgPoll::Failed:
        ConnectionLost(driver_->ErrorMessage());
        break;
    case PgPoll::Pending:
        break;
    }
}

void PgClient::ConnectionLost(std::string_view reason)
{
    // reason may point into last_error_.
    std::string msg(reason);
    last_error_ = msg;
    driver_->Finish();
    next_attempt_ =
        clock_() + std::chrono::milliseconds(options_->reconnect_interval_ms);
    state_ = ConnState::Disconnected;
    SetState(ConnState::Disconnected, msg);
}

KvError PgClient::OpenCache(std::string_view cache)
{
    if (state_ != ConnState::Connected)
    {
        return KvError::TryAgain;
    }
    cache_ = cache;
    return SelectCache();
}

KvError PgClient::SelectCache()
{
    std::string quoted;
    if (!driver_->QuoteIdentifier(cache_, quoted))
    {
        last_error_ = driver_->ErrorMessage();
        return KvError::InvalidArgs;
    }

    KvError err =
        Exec("CREATE SCHEMA IF NOT EXISTS " + quoted, {}, nullptr);
    CHECK_KV_ERR(err);
    return Exec("SET search_path TO " + quoted, {}, nullptr);
}

KvError PgClient::Query(std::string_view sql,
                        const std::vector<std::string> &args,
                        ResultSet *rows)
{
    if (state_ != ConnState::Connected)
    {
        return KvError::TryAgain;
    }
    return Exec(RewritePlaceholders(sql), args, rows);
}

KvError PgClient::Exec(const std::string &sql,
                       const std::vector<std::string> &args,
                       ResultSet *rows)
{
    PgExecResult res = driver_->Exec(sql, args, rows);
    if (res.ok_)
    {
        return KvError::NoError;
    }

    last_error_ = std::move(res.message_);
    if (driver_->IsBroken())
    {
        ConnectionLost(last_error_);
        return KvError::TryAgain;
    }
    if (IsTransientSqlState(res.sqlstate_))
    {
        return KvError::TryAgain;
    }
    return KvError::BackendErr;
}

bool PgClient::IsTransientSqlState(std::string_view sqlstate)
{
    if (sqlstate.size() != 5)
    {
        return false;
    }
    std::string_view cls = sqlstate.substr(0, 2);
    // 08: connection exception, 40: transaction rollback (serialization
    // failure, deadlock), 53: insufficient resources, 57: operator
    // intervention.
    return cls == "08" || cls == "40" || cls == "53" || cls == "57";
}

std::string PgClient::RewritePlaceholders(std::string_view sql)
{
    std::string out;
    out.reserve(sql.size() + 16);
    uint32_t n = 0;
    char quote = 0;
    for (char c : sql)
    {
        if (quote != 0)
        {
            if (c == quote)
            {
                quote = 0;
            }
            out.push_back(c);
        }
        else if (c == '\'' || c == '"')
        {
            quote = c;
            out.push_back(c);
        }
        else if (c == '?')
        {
            out.push_back('$');
            out.append(std::to_string(++n));
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace sqlkv
