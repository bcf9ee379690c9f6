#include "sqlkv/tasks/write_task.h"

#include <glog/logging.h>

#include <string_view>
#include <unordered_map>
#include <utility>

#include "sqlkv/codec.h"
#include "sqlkv/query_executor.h"
#include "sqlkv/statements.h"

namespace sqlkv
{
KvError BatchWriteTask::Apply(const std::vector<WriteDataEntry> &batch)
{
    del_keys_.clear();
    put_rows_.clear();
    if (batch.empty())
    {
        return KvError::NoError;
    }

    // Index of the last entry of every key.
    std::unordered_map<std::string_view, size_t> last;
    last.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); i++)
    {
        last[batch[i].key_] = i;
    }

    // Encode everything before issuing any statement, so that an invalid
    // entry leaves the store untouched.
    const Codec *codec = GetCodec();
    for (size_t i = 0; i < batch.size(); i++)
    {
        const WriteDataEntry &ent = batch[i];
        auto [key, err] = codec->EncodeKey(ent.key_);
        CHECK_KV_ERR(err);
        if (last[ent.key_] != i)
        {
            continue;
        }
        if (ent.op_ == WriteOp::Delete)
        {
            del_keys_.emplace_back(std::move(key));
            continue;
        }
        auto [val, err_val] = codec->EncodeValue(ent.val_);
        CHECK_KV_ERR(err_val);
        put_rows_.emplace_back(std::move(key));
        put_rows_.emplace_back(std::move(val));
    }
    DLOG(INFO) << "batch of " << batch.size() << " entries reduced to "
               << del_keys_.size() << " deletes and " << put_rows_.size() / 2
               << " upserts";

    KvError err = DeleteKeys();
    CHECK_KV_ERR(err);
    return UpsertRows();
}

KvError BatchWriteTask::DeleteKeys()
{
    switch (del_keys_.size())
    {
    case 0:
        return KvError::NoError;
    case 1:
        return Executor()->Execute(stmt::delete_row, del_keys_);
    default:
        return Executor()->Execute(stmt::DeleteKeys(del_keys_.size()),
                                   del_keys_);
    }
}

KvError BatchWriteTask::UpsertRows()
{
    QueryExecutor *exec = Executor();
    switch (put_rows_.size())
    {
    case 0:
        return KvError::NoError;
    case 2:
        return exec->Execute(stmt::UpsertRow(exec->Dialect()), put_rows_);
    default:
        return exec->Execute(
            stmt::UpsertRows(put_rows_.size() / 2, exec->Dialect()),
            put_rows_);
    }
}

KvError BatchWriteTask::Clear(const ScanRange &range)
{
    if (!range.IsValid())
    {
        return KvError::InvalidArgs;
    }
    std::vector<std::string> args;
    std::string sql = stmt::Clear(range, args);
    return Executor()->Execute(sql, args);
}

}  // namespace sqlkv
