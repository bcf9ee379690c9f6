#include "sqlkv/tasks/task.h"

#include "sqlkv/worker.h"

namespace sqlkv
{
void KvTask::Yield()
{
    worker->main_ = worker->main_.resume();
}

void KvTask::Resume()
{
    if (status_ != TaskStatus::Ongoing)
    {
        status_ = TaskStatus::Ongoing;
        worker->scheduled_.push_back(this);
    }
}

void KvTask::SleepFor(std::chrono::milliseconds dur)
{
    wake_at_ = std::chrono::steady_clock::now() + dur;
    status_ = TaskStatus::Sleeping;
    worker->sleeping_.push_back(this);
    Yield();
}

KvTask *ThdTask()
{
    return worker != nullptr ? worker->running_ : nullptr;
}

const KvOptions *Options()
{
    return worker->Options();
}

QueryExecutor *Executor()
{
    return worker->Executor();
}

const Codec *GetCodec()
{
    return worker->GetCodec();
}

}  // namespace sqlkv
