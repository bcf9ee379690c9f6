#pragma once

#include <string>
#include <string_view>

#include "sqlkv/error.h"
#include "sqlkv/tasks/task.h"

namespace sqlkv
{
class ReadTask : public KvTask
{
public:
    KvError Read(std::string_view key, std::string &value);

    TaskType Type() const override
    {
        return TaskType::Read;
    }
};
}  // namespace sqlkv
