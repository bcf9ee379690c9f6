#pragma once

#include <boost/context/pooled_fixedsize_stack.hpp>
#include <deque>
#include <thread>
#include <utility>
#include <vector>

#include "sqlkv/query_executor.h"
#include "sqlkv/sql_kv_store.h"
#include "sqlkv/tasks/task_manager.h"

// https://github.com/cameron314/concurrentqueue/issues/280
#undef BLOCK_SIZE
#include "concurrentqueue/concurrentqueue.h"

namespace sqlkv
{
/**
 * @brief The thread executing the requests of a store. Each request runs as a
 * coroutine task, so that a task waiting for a connected backend does not
 * hold up the others. Write requests run one at a time in submission order.
 */
class Worker
{
public:
    Worker(const SqlKvStore *store, Connection *conn);
    ~Worker();
    void Start();
    /**
     * @brief Wait for the queued and running requests to finish and join the
     * thread. The store must be stopped beforehand.
     */
    void Stop();
    bool AddRequest(KvRequest *req);

    const KvOptions *Options() const;
    QueryExecutor *Executor();
    const Codec *GetCodec() const;

    boost::context::continuation main_;
    KvTask *running_{nullptr};
    std::deque<KvTask *> scheduled_;
    std::deque<KvTask *> finished_;
    std::vector<KvTask *> sleeping_;

private:
    void WorkLoop();
    void ResumeSleeping();
    void ResumeScheduled();
    void PollFinished();

    void OnReceivedReq(KvRequest *req);
    void ProcessReq(KvRequest *req);
    void OnWriteFinished();

    template <typename F>
    void StartTask(KvTask *task, KvRequest *req, F lbd)
    {
        task->req_ = req;
        task->status_ = TaskStatus::Ongoing;
        running_ = task;
        task->coro_ = boost::context::callcc(
            std::allocator_arg,
            stack_pool_,
            [this, lbd](continuation &&sink)
            {
                main_ = std::move(sink);
                KvError err = lbd();
                KvTask *task = ThdTask();
                if (err == KvError::BackendErr)
                {
                    task->req_->err_msg_ = executor_.LastError();
                }
                task->req_->SetDone(err);
                task->req_ = nullptr;
                task->status_ = TaskStatus::Idle;
                finished_.push_back(task);
                return std::move(main_);
            });
        running_ = nullptr;
    }

    const SqlKvStore *store_;
    QueryExecutor executor_;
    moodycamel::ConcurrentQueue<KvRequest *> requests_;
    std::thread thd_;
    TaskManager task_mgr_;
    boost::context::pooled_fixedsize_stack stack_pool_;

    class PendingWriteQueue
    {
    public:
        void PushBack(WriteRequest *req);
        WriteRequest *PopFront();

    private:
        WriteRequest *head_{nullptr};
        WriteRequest *tail_{nullptr};
    };
    bool writing_{false};
    PendingWriteQueue pending_writes_;
};
}  // namespace sqlkv
