#pragma once

#include <string>
#include <vector>

#include "sqlkv/error.h"
#include "sqlkv/tasks/task.h"
#include "sqlkv/types.h"

namespace sqlkv
{
class BatchWriteTask : public KvTask
{
public:
    /**
     * @brief Apply a batch of upserts and deletes. For each key only the last
     * entry of the batch takes effect. Deletes are issued before upserts, one
     * statement each at most.
     *
     * Not atomic: if the upsert statement fails the deletes stay applied.
     */
    KvError Apply(const std::vector<WriteDataEntry> &batch);

    /**
     * @brief Delete every entry within the range. With a limit, only the
     * first entries in the range's direction are deleted.
     */
    KvError Clear(const ScanRange &range);

    TaskType Type() const override
    {
        return TaskType::BatchWrite;
    }

private:
    KvError DeleteKeys();
    KvError UpsertRows();

    // Encoded arguments of the pending statements.
    std::vector<std::string> del_keys_;
    std::vector<std::string> put_rows_;
};
}  // namespace sqlkv
