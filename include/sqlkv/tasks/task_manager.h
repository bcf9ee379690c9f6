#pragma once

#include <cassert>
#include <memory>
#include <vector>

#include "sqlkv/tasks/read_task.h"
#include "sqlkv/tasks/scan_task.h"
#include "sqlkv/tasks/write_task.h"

namespace sqlkv
{
class TaskManager
{
public:
    TaskManager();

    BatchWriteTask *GetBatchWriteTask();
    ReadTask *GetReadTask();
    ScanTask *GetScanTask();
    void FreeTask(KvTask *task);

    size_t NumActive() const;

private:
    template <typename T>
    class TaskPool
    {
    public:
        explicit TaskPool(uint32_t size)
        {
            if (size > 0)
            {
                init_pool_ = std::make_unique<T[]>(size);
                for (uint32_t i = 0; i < size; i++)
                {
                    FreeTask(&init_pool_[i]);
                }
            }
        }

        T *GetTask()
        {
            if (free_head_ != nullptr)
            {
                // Reuse a free task.
                T *task = free_head_;
                free_head_ = static_cast<T *>(task->next_);
                task->next_ = nullptr;
                assert(task->status_ == TaskStatus::Idle);
                return task;
            }
            auto &task = ext_pool_.emplace_back(std::make_unique<T>());
            return task.get();
        }

        void FreeTask(T *task)
        {
            task->status_ = TaskStatus::Idle;
            task->next_ = free_head_;
            free_head_ = task;
        }

    private:
        std::unique_ptr<T[]> init_pool_{nullptr};
        std::vector<std::unique_ptr<T>> ext_pool_;
        T *free_head_{nullptr};
    };

    TaskPool<BatchWriteTask> batch_write_pool_;
    TaskPool<ReadTask> read_pool_;
    TaskPool<ScanTask> scan_pool_;
    size_t num_active_{0};
};
}  // namespace sqlkv
