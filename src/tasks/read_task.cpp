#include "sqlkv/tasks/read_task.h"

#include <utility>

#include "sqlkv/codec.h"
#include "sqlkv/query_executor.h"
#include "sqlkv/statements.h"

namespace sqlkv
{
KvError ReadTask::Read(std::string_view key, std::string &value)
{
    auto [encoded, err] = GetCodec()->EncodeKey(key);
    CHECK_KV_ERR(err);

    ResultSet rows;
    err = Executor()->Execute(stmt::select_value, {std::move(encoded)}, &rows);
    CHECK_KV_ERR(err);
    if (rows.empty())
    {
        return KvError::NotFound;
    }
    if (rows.front().size() != 1)
    {
        return KvError::Corrupted;
    }
    return Codec::Decode(rows.front().front(), value);
}

}  // namespace sqlkv
