#include "common.h"

#include <glog/logging.h>

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace test_util
{
std::string Key(uint64_t k)
{
    constexpr int sz = 12;
    std::stringstream ss;
    ss << std::setw(sz) << std::setfill('0') << k;
    std::string kstr = ss.str();
    CHECK(kstr.size() == sz);
    return kstr;
}

std::string Value(uint64_t val, uint32_t len)
{
    std::string s = std::to_string(val);
    if (s.size() < len)
    {
        s.resize(len, '#');
    }
    return s;
}

sqlkv::KvOptions MemOptions()
{
    sqlkv::KvOptions opts;
    opts.location = "sqlite://localhost/test";
    opts.poll_interval_ms = 5;
    opts.connect_timeout_ms = 1000;
    return opts;
}

std::vector<sqlkv::KvEntry> ScanAll(sqlkv::SqlKvStore *store,
                                    const sqlkv::ScanRange &range)
{
    std::vector<sqlkv::KvEntry> entries;
    auto [iter, err] = store->NewIterator(range);
    CHECK(err == sqlkv::KvError::NoError) << sqlkv::ErrorString(err);
    for (; iter.Valid(); iter.Next())
    {
        entries.push_back({std::string(iter.Key()), std::string(iter.Value())});
    }
    return entries;
}

MapVerifier::MapVerifier(sqlkv::SqlKvStore *store, bool validate)
    : auto_validate_(validate), store_(store)
{
}

MapVerifier::~MapVerifier()
{
    if (!answer_.empty() && store_->IsOpen())
    {
        Clean();
    }
}

void MapVerifier::Upsert(uint64_t begin, uint64_t end)
{
    LOG(INFO) << "Upsert(" << begin << ',' << end << ')';

    sqlkv::BatchWriteRequest req;
    for (size_t idx = begin; idx < end; ++idx)
    {
        req.AddWrite(
            Key(idx), Value(round_ + idx, val_size_), sqlkv::WriteOp::Upsert);
    }
    ExecWrite(&req);
}

void MapVerifier::Delete(uint64_t begin, uint64_t end)
{
    LOG(INFO) << "Delete(" << begin << ',' << end << ')';

    sqlkv::BatchWriteRequest req;
    for (size_t idx = begin; idx < end; ++idx)
    {
        req.AddWrite(Key(idx), {}, sqlkv::WriteOp::Delete);
    }
    ExecWrite(&req);
}

void MapVerifier::WriteRnd(uint64_t begin,
                           uint64_t end,
                           uint8_t del,
                           uint8_t density)
{
    constexpr uint8_t max = 100;
    del = del > max ? max : del;
    density = density > max ? max : density;
    LOG(INFO) << "WriteRnd(" << begin << ',' << end << ',' << int(del) << ','
              << int(density) << ')';

    sqlkv::BatchWriteRequest req;
    for (size_t idx = begin; idx < end; ++idx)
    {
        if ((rand() % max) >= density)
        {
            continue;
        }

        std::string key = Key(idx);
        if ((rand() % max) < del)
        {
            req.AddWrite(std::move(key), {}, sqlkv::WriteOp::Delete);
        }
        else
        {
            uint32_t len = (rand() % val_size_) + 1;
            req.AddWrite(std::move(key),
                         Value(round_ + idx, len),
                         sqlkv::WriteOp::Upsert);
        }
        // Rewrite some keys within the same batch.
        if ((rand() % max) < del)
        {
            req.AddWrite(Key(idx), Value(round_, 4), sqlkv::WriteOp::Upsert);
        }
    }
    ExecWrite(&req);
}

void MapVerifier::Clear(const sqlkv::ScanRange &range)
{
    LOG(INFO) << "Clear()";

    sqlkv::ClearRequest req;
    req.SetArgs(range);
    ExecWrite(&req);
}

void MapVerifier::Clean()
{
    Clear(sqlkv::ScanRange());
}

void MapVerifier::Read(uint64_t key)
{
    Read(Key(key));
}

void MapVerifier::Read(std::string_view key)
{
    LOG(INFO) << "Read(" << key << ')';

    sqlkv::ReadRequest req;
    req.SetArgs(key);
    store_->ExecSync(&req);
    if (req.Error() == sqlkv::KvError::NoError)
    {
        CHECK(answer_.at(std::string(key)) == req.value_);
    }
    else
    {
        CHECK(req.Error() == sqlkv::KvError::NotFound)
            << sqlkv::ErrorString(req.Error());
        CHECK(answer_.find(std::string(key)) == answer_.end());
    }
}

void MapVerifier::Scan(const sqlkv::ScanRange &range)
{
    LOG(INFO) << "Scan(reverse=" << range.reverse_
              << ", limit=" << range.limit_ << ')';

    sqlkv::ScanRequest req;
    req.SetArgs(range);
    store_->ExecSync(&req);
    CHECK(req.Error() == sqlkv::KvError::NoError)
        << sqlkv::ErrorString(req.Error());
    CHECK(req.entries_ == Select(range));
}

void MapVerifier::Validate()
{
    std::vector<sqlkv::KvEntry> entries = ScanAll(store_, sqlkv::ScanRange());
    CHECK(answer_.size() == entries.size());
    auto it = answer_.begin();
    for (const sqlkv::KvEntry &ent : entries)
    {
        CHECK(ent.key_ == it->first);
        CHECK(ent.value_ == it->second);
        it++;
    }
    CHECK(it == answer_.end());
}

void MapVerifier::ExecWrite(sqlkv::KvRequest *req)
{
    switch (req->Type())
    {
    case sqlkv::RequestType::BatchWrite:
    {
        const auto wreq = static_cast<sqlkv::BatchWriteRequest *>(req);
        for (const sqlkv::WriteDataEntry &ent : wreq->batch_)
        {
            if (ent.op_ == sqlkv::WriteOp::Upsert)
            {
                answer_[ent.key_] = ent.val_;
            }
            else
            {
                answer_.erase(ent.key_);
            }
        }
        break;
    }
    case sqlkv::RequestType::Clear:
    {
        const auto creq = static_cast<sqlkv::ClearRequest *>(req);
        for (const sqlkv::KvEntry &ent : Select(creq->range_))
        {
            answer_.erase(ent.key_);
        }
        break;
    }
    default:
        LOG(FATAL) << "not a write request";
    }

    store_->ExecSync(req);
    CHECK(req->Error() == sqlkv::KvError::NoError)
        << sqlkv::ErrorString(req->Error());

    if (auto_validate_)
    {
        Validate();
    }
    round_++;
}

void MapVerifier::SetAutoValidate(bool v)
{
    auto_validate_ = v;
}

void MapVerifier::SetValueSize(uint32_t val_size)
{
    val_size_ = val_size;
}

std::vector<sqlkv::KvEntry> MapVerifier::Select(
    const sqlkv::ScanRange &range) const
{
    auto in_range = [&range](const std::string &key)
    {
        if (range.gt_ && !(key > *range.gt_))
        {
            return false;
        }
        if (range.gte_ && key < *range.gte_)
        {
            return false;
        }
        if (range.lt_ && !(key < *range.lt_))
        {
            return false;
        }
        if (range.lte_ && key > *range.lte_)
        {
            return false;
        }
        return true;
    };

    std::vector<sqlkv::KvEntry> entries;
    auto collect = [&](auto begin, auto end)
    {
        for (auto it = begin; it != end; it++)
        {
            if (range.limit_ > 0 && entries.size() == range.limit_)
            {
                break;
            }
            if (in_range(it->first))
            {
                entries.push_back({it->first, it->second});
            }
        }
    };
    if (range.reverse_)
    {
        collect(answer_.rbegin(), answer_.rend());
    }
    else
    {
        collect(answer_.begin(), answer_.end());
    }
    return entries;
}

}  // namespace test_util
