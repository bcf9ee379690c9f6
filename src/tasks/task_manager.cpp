#include "sqlkv/tasks/task_manager.h"

#include <glog/logging.h>

namespace sqlkv
{
namespace
{
// Writes are serialized, a single batch write task is ever active.
constexpr uint32_t batch_write_pool_size = 1;
constexpr uint32_t read_pool_size = 64;
constexpr uint32_t scan_pool_size = 16;
}  // namespace

TaskManager::TaskManager()
    : batch_write_pool_(batch_write_pool_size),
      read_pool_(read_pool_size),
      scan_pool_(scan_pool_size)
{
}

BatchWriteTask *TaskManager::GetBatchWriteTask()
{
    num_active_++;
    return batch_write_pool_.GetTask();
}

ReadTask *TaskManager::GetReadTask()
{
    num_active_++;
    return read_pool_.GetTask();
}

ScanTask *TaskManager::GetScanTask()
{
    num_active_++;
    return scan_pool_.GetTask();
}

void TaskManager::FreeTask(KvTask *task)
{
    CHECK(task->status_ == TaskStatus::Idle);
    CHECK(task->req_ == nullptr);
    assert(num_active_ > 0);
    num_active_--;
    switch (task->Type())
    {
    case TaskType::Read:
        read_pool_.FreeTask(static_cast<ReadTask *>(task));
        break;
    case TaskType::Scan:
        scan_pool_.FreeTask(static_cast<ScanTask *>(task));
        break;
    case TaskType::BatchWrite:
        batch_write_pool_.FreeTask(static_cast<BatchWriteTask *>(task));
        break;
    }
}

size_t TaskManager::NumActive() const
{
    return num_active_;
}

}  // namespace sqlkv
