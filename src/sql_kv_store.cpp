#include "sqlkv/sql_kv_store.h"

#include <glog/logging.h>

#include <thread>

#include "sqlkv/worker.h"

namespace sqlkv
{
SqlKvStore::SqlKvStore(const KvOptions &opts, std::unique_ptr<SqlClient> client)
    : options_(opts),
      codec_(opts.key_size, opts.value_size),
      conn_(&options_, std::move(client))
{
}

SqlKvStore::~SqlKvStore()
{
    Close();
}

KvError SqlKvStore::Open(std::string_view location_suffix)
{
    if (!IsStopped())
    {
        return KvError::NoError;
    }
    LOG(INFO) << "SqlKvStore is starting...";
    KvError err = conn_.Open(location_suffix);
    CHECK_KV_ERR(err);

    worker_ = std::make_unique<Worker>(this, &conn_);
    stopped_.store(false);
    worker_->Start();
    LOG(INFO) << "SqlKvStore is serving " << conn_.GetLocation();
    return KvError::NoError;
}

void SqlKvStore::Close()
{
    if (stopped_.exchange(true))
    {
        return;
    }
    while (senders_.load() != 0)
    {
        std::this_thread::yield();
    }
    // Tasks waiting for a connected backend give up with NotRunning.
    conn_.BeginClose();
    worker_->Stop();
    worker_.reset();
    conn_.Close();
    LOG(INFO) << "SqlKvStore is stopped.";
}

bool SqlKvStore::IsOpen() const
{
    return !IsStopped();
}

bool SqlKvStore::IsStopped() const
{
    return stopped_.load(std::memory_order_acquire);
}

bool SqlKvStore::SendRequest(KvRequest *req)
{
    req->err_ = KvError::NoError;
    req->err_msg_.clear();
    req->done_.store(false, std::memory_order_relaxed);

    senders_.fetch_add(1);
    bool ok = !stopped_.load() && worker_->AddRequest(req);
    senders_.fetch_sub(1);
    if (!ok)
    {
        req->err_ = KvError::NotRunning;
        req->done_.store(true, std::memory_order_release);
    }
    return ok;
}

bool SqlKvStore::ExecAsyn(KvRequest *req)
{
    req->user_data_ = 0;
    req->callback_ = nullptr;
    return SendRequest(req);
}

void SqlKvStore::ExecSync(KvRequest *req)
{
    req->callback_ = nullptr;
    if (SendRequest(req))
    {
        req->Wait();
    }
}

std::pair<std::string, KvError> SqlKvStore::Get(std::string_view key)
{
    ReadRequest req;
    req.SetArgs(key);
    ExecSync(&req);
    return {std::move(req.value_), req.Error()};
}

KvError SqlKvStore::Put(std::string_view key, std::string_view value)
{
    BatchWriteRequest req;
    req.AddWrite(std::string(key), std::string(value), WriteOp::Upsert);
    ExecSync(&req);
    return req.Error();
}

KvError SqlKvStore::Delete(std::string_view key)
{
    BatchWriteRequest req;
    req.AddWrite(std::string(key), {}, WriteOp::Delete);
    ExecSync(&req);
    return req.Error();
}

KvError SqlKvStore::Batch(std::vector<WriteDataEntry> batch)
{
    BatchWriteRequest req;
    req.SetArgs(std::move(batch));
    ExecSync(&req);
    return req.Error();
}

std::pair<KvIterator, KvError> SqlKvStore::NewIterator(const ScanRange &range)
{
    ScanRequest req;
    req.SetArgs(range);
    ExecSync(&req);
    if (req.Error() != KvError::NoError)
    {
        return {KvIterator(), req.Error()};
    }
    return {KvIterator(std::move(req.entries_)), KvError::NoError};
}

KvError SqlKvStore::Clear(const ScanRange &range)
{
    ClearRequest req;
    req.SetArgs(range);
    ExecSync(&req);
    return req.Error();
}

const KvOptions &SqlKvStore::Options() const
{
    return options_;
}

const Codec *SqlKvStore::GetCodec() const
{
    return &codec_;
}

const Location &SqlKvStore::GetLocation() const
{
    return conn_.GetLocation();
}

ConnState SqlKvStore::State() const
{
    return conn_.State();
}

KvError KvRequest::Error() const
{
    return err_;
}

std::string_view KvRequest::ErrMessage() const
{
    if (err_msg_.empty())
    {
        return ErrorString(err_);
    }
    return err_msg_;
}

uint64_t KvRequest::UserData() const
{
    return user_data_;
}

bool KvRequest::IsDone() const
{
    return done_.load(std::memory_order_acquire);
}

void KvRequest::Wait() const
{
    done_.wait(false, std::memory_order_acquire);
}

void KvRequest::SetDone(KvError err)
{
    err_ = err;
    if (callback_)
    {
        done_.store(true, std::memory_order_release);
        callback_(this);
        return;
    }
    done_.store(true, std::memory_order_release);
    done_.notify_all();
}

void ReadRequest::SetArgs(std::string_view key)
{
    key_ = key;
    value_.clear();
}

void ScanRequest::SetArgs(ScanRange range)
{
    range_ = std::move(range);
    entries_.clear();
}

void BatchWriteRequest::SetArgs(std::vector<WriteDataEntry> &&batch)
{
    batch_ = std::move(batch);
}

void BatchWriteRequest::AddWrite(std::string key,
                                 std::string value,
                                 WriteOp op)
{
    batch_.emplace_back(std::move(key), std::move(value), op);
}

void ClearRequest::SetArgs(ScanRange range)
{
    range_ = std::move(range);
}

}  // namespace sqlkv
