#include "sqlkv/query_executor.h"

#include <glog/logging.h>

#include <thread>

#include "sqlkv/connection.h"
#include "sqlkv/kv_options.h"
#include "sqlkv/tasks/task.h"

namespace sqlkv
{
QueryExecutor::QueryExecutor(const KvOptions *opts, Connection *conn)
    : options_(opts), conn_(conn)
{
}

SqlDialect QueryExecutor::Dialect() const
{
    return conn_->Client()->Dialect();
}

KvError QueryExecutor::Execute(std::string_view sql,
                               const std::vector<std::string> &args,
                               ResultSet *rows)
{
    for (uint16_t attempt = 1;; attempt++)
    {
        KvError err = WaitConnected();
        CHECK_KV_ERR(err);

        if (rows != nullptr)
        {
            rows->clear();
        }
        VLOG(1) << "statement '" << sql << "' with " << args.size()
                << " args, attempt " << attempt;
        err = conn_->Client()->Query(sql, args, rows);
        if (err == KvError::NoError)
        {
            return KvError::NoError;
        }
        last_error_ = conn_->Client()->LastError();

        if (!IsRetryableErr(err))
        {
            LOG(ERROR) << "statement '" << sql << "' failed: " << last_error_;
            return KvError::BackendErr;
        }
        if (attempt >= options_->max_attempts)
        {
            LOG(ERROR) << "statement '" << sql << "' failed after " << attempt
                       << " attempts: " << ErrorString(err) << " "
                       << last_error_;
            return KvError::BackendErr;
        }
        LOG(WARNING) << "attempt " << attempt << " of statement '" << sql
                     << "' failed: " << ErrorString(err) << " " << last_error_
                     << ", retrying";
    }
}

KvError QueryExecutor::WaitConnected()
{
    using namespace std::chrono;
    const auto start = steady_clock::now();
    const milliseconds interval(options_->poll_interval_ms);
    const milliseconds timeout(options_->op_timeout_ms);
    while (true)
    {
        if (conn_->IsClosing())
        {
            return KvError::NotRunning;
        }
        conn_->Poll();
        if (conn_->State() == ConnState::Connected)
        {
            return KvError::NoError;
        }
        if (timeout.count() > 0 && steady_clock::now() - start >= timeout)
        {
            last_error_ = "backend not connected";
            return KvError::Timeout;
        }
        Sleep(interval);
    }
}

void QueryExecutor::Sleep(std::chrono::milliseconds dur)
{
    KvTask *task = ThdTask();
    if (task != nullptr)
    {
        task->SleepFor(dur);
    }
    else
    {
        std::this_thread::sleep_for(dur);
    }
}

}  // namespace sqlkv
