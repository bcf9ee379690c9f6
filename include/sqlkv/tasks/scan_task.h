#pragma once

#include <vector>

#include "sqlkv/error.h"
#include "sqlkv/tasks/task.h"
#include "sqlkv/types.h"

namespace sqlkv
{
class ScanTask : public KvTask
{
public:
    /**
     * @brief Fetch every entry within the range, in the range's direction.
     */
    KvError Scan(const ScanRange &range, std::vector<KvEntry> &entries);

    TaskType Type() const override
    {
        return TaskType::Scan;
    }
};
}  // namespace sqlkv
