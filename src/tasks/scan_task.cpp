#include "sqlkv/tasks/scan_task.h"

#include <string>

#include "sqlkv/codec.h"
#include "sqlkv/query_executor.h"
#include "sqlkv/statements.h"

namespace sqlkv
{
KvError ScanTask::Scan(const ScanRange &range, std::vector<KvEntry> &entries)
{
    entries.clear();
    if (!range.IsValid())
    {
        return KvError::InvalidArgs;
    }

    std::vector<std::string> args;
    std::string sql = stmt::Scan(range, args);
    ResultSet rows;
    KvError err = Executor()->Execute(sql, args, &rows);
    CHECK_KV_ERR(err);

    entries.reserve(rows.size());
    for (const SqlRow &row : rows)
    {
        if (row.size() != 2)
        {
            entries.clear();
            return KvError::Corrupted;
        }
        KvEntry &entry = entries.emplace_back();
        err = Codec::Decode(row[0], entry.key_);
        if (err == KvError::NoError)
        {
            err = Codec::Decode(row[1], entry.value_);
        }
        if (err != KvError::NoError)
        {
            entries.clear();
            return err;
        }
    }
    return KvError::NoError;
}

}  // namespace sqlkv
