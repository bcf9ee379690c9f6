#pragma once

#include <boost/context/continuation.hpp>
#include <chrono>
#include <cstdint>

#include "sqlkv/error.h"

namespace sqlkv
{
class KvRequest;
class KvTask;
class Worker;
class QueryExecutor;
class Codec;
struct KvOptions;

inline thread_local Worker *worker{nullptr};

/**
 * @brief The task running on the calling thread, nullptr outside of a worker
 * task.
 */
KvTask *ThdTask();
const KvOptions *Options();
QueryExecutor *Executor();
const Codec *GetCodec();

enum class TaskStatus : uint8_t
{
    Idle = 0,
    Ongoing,
    Sleeping
};

enum struct TaskType
{
    Read = 0,
    Scan,
    BatchWrite
};

using boost::context::continuation;

class KvTask
{
public:
    virtual ~KvTask() = default;
    virtual TaskType Type() const = 0;
    void Yield();
    /**
     * @brief Re-schedules the task to run. Note: the resumed task does not run
     * in place.
     */
    void Resume();
    /**
     * @brief Suspend the task for at least dur. Other tasks of the worker keep
     * running meanwhile.
     */
    void SleepFor(std::chrono::milliseconds dur);

    TaskStatus status_{TaskStatus::Idle};
    std::chrono::steady_clock::time_point wake_at_;
    KvRequest *req_{nullptr};
    KvTask *next_{nullptr};
    continuation coro_;
};
}  // namespace sqlkv
