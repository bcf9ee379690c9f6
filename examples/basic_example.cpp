#include <cassert>
#include <condition_variable>
#include <mutex>

#include "sqlkv/sql_kv_store.h"

std::mutex m;
std::condition_variable cv;
bool ready = false;

void wake_up(sqlkv::KvRequest *req)
{
    std::unique_lock lk(m);
    ready = true;
    lk.unlock();
    cv.notify_one();
}

int main()
{
    sqlkv::KvOptions opts;
    opts.location = "sqlite://localhost/";
    opts.data_path = "/tmp/sqlkv";

    sqlkv::SqlKvStore store(opts);
    sqlkv::KvError err = store.Open("example");
    assert(err == sqlkv::KvError::NoError);

    {
        sqlkv::BatchWriteRequest req;
        std::vector<sqlkv::WriteDataEntry> entries;
        entries.emplace_back("key1", "val1", sqlkv::WriteOp::Upsert);
        entries.emplace_back("key2", "val2", sqlkv::WriteOp::Upsert);
        entries.emplace_back("key3", "val3", sqlkv::WriteOp::Upsert);
        req.SetArgs(std::move(entries));
        bool ok = store.ExecAsyn(&req, 0, wake_up);
        assert(ok);
        {
            std::unique_lock lk(m);
            cv.wait(lk, [] { return ready; });
        }
        assert(req.Error() == sqlkv::KvError::NoError);
    }

    {
        ready = false;
        sqlkv::ReadRequest req;
        req.SetArgs("key2");
        store.ExecAsyn(&req, 0, wake_up);
        {
            std::unique_lock lk(m);
            cv.wait(lk, [] { return ready; });
        }
        assert(req.Error() == sqlkv::KvError::NoError);
        assert(req.value_ == "val2");
    }

    {
        // Execute asynchronously
        ready = false;
        sqlkv::ScanRequest req;
        req.SetArgs(sqlkv::ScanRange().Gte("key1").Lt("key3"));
        store.ExecAsyn(&req, 0, wake_up);
        {
            std::unique_lock lk(m);
            cv.wait(lk, [] { return ready; });
        }
        assert(req.entries_.size() == 2);
        assert(req.entries_[0].key_ == "key1");
        assert(req.entries_[0].value_ == "val1");
        assert(req.entries_[1].key_ == "key2");
        assert(req.entries_[1].value_ == "val2");
    }

    {
        // Execute synchronously
        sqlkv::BatchWriteRequest req;
        std::vector<sqlkv::WriteDataEntry> entries;
        entries.emplace_back("key1", "", sqlkv::WriteOp::Delete);
        entries.emplace_back("key3", "val33", sqlkv::WriteOp::Upsert);
        req.SetArgs(std::move(entries));
        store.ExecSync(&req);
        assert(req.Error() == sqlkv::KvError::NoError);
    }

    {
        auto [iter, err] = store.NewIterator(sqlkv::ScanRange().Reverse());
        assert(err == sqlkv::KvError::NoError);
        assert(iter.Remaining() == 2);
        assert(iter.Key() == "key3");
        assert(iter.Value() == "val33");
        iter.Next();
        assert(iter.Key() == "key2");
    }

    err = store.Clear(sqlkv::ScanRange());
    assert(err == sqlkv::KvError::NoError);
    store.Close();
}
