#include "sqlkv/worker.h"

#include <glog/logging.h>

#include <cassert>
#include <chrono>
#include <iterator>

namespace sqlkv
{
Worker::Worker(const SqlKvStore *store, Connection *conn)
    : store_(store),
      executor_(&store->Options(), conn),
      stack_pool_(store->Options().coroutine_stack_size)
{
}

Worker::~Worker()
{
    if (thd_.joinable())
    {
        thd_.join();
    }
}

void Worker::WorkLoop()
{
    while (true)
    {
        KvRequest *reqs[128];
        size_t nreqs = requests_.try_dequeue_bulk(reqs, std::size(reqs));
        for (size_t i = 0; i < nreqs; i++)
        {
            OnReceivedReq(reqs[i]);
        }

        ResumeSleeping();
        if (nreqs == 0 && scheduled_.empty() && finished_.empty())
        {
            if (task_mgr_.NumActive() == 0 && store_->IsStopped())
            {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }

        ResumeScheduled();
        PollFinished();
    }
}

void Worker::Start()
{
    thd_ = std::thread(
        [this]
        {
            worker = this;
            WorkLoop();
            worker = nullptr;
        });
}

void Worker::Stop()
{
    if (thd_.joinable())
    {
        thd_.join();
    }
    // Requests that raced with the stop.
    KvRequest *req;
    while (requests_.try_dequeue(req))
    {
        LOG(WARNING) << "request received after stop is rejected";
        req->SetDone(KvError::NotRunning);
    }
}

bool Worker::AddRequest(KvRequest *req)
{
    return requests_.enqueue(req);
}

const KvOptions *Worker::Options() const
{
    return &store_->Options();
}

QueryExecutor *Worker::Executor()
{
    return &executor_;
}

const Codec *Worker::GetCodec() const
{
    return store_->GetCodec();
}

void Worker::OnReceivedReq(KvRequest *req)
{
    if (auto wreq = dynamic_cast<WriteRequest *>(req); wreq != nullptr)
    {
        if (writing_)
        {
            // Wait on pending write queue because of other write task.
            pending_writes_.PushBack(wreq);
            return;
        }
        writing_ = true;
    }

    ProcessReq(req);
}

void Worker::ProcessReq(KvRequest *req)
{
    switch (req->Type())
    {
    case RequestType::Read:
    {
        ReadTask *task = task_mgr_.GetReadTask();
        auto lbd = [task, req]() -> KvError
        {
            auto read_req = static_cast<ReadRequest *>(req);
            return task->Read(read_req->key_, read_req->value_);
        };
        StartTask(task, req, lbd);
        break;
    }
    case RequestType::Scan:
    {
        ScanTask *task = task_mgr_.GetScanTask();
        auto lbd = [task, req]() -> KvError
        {
            auto scan_req = static_cast<ScanRequest *>(req);
            return task->Scan(scan_req->range_, scan_req->entries_);
        };
        StartTask(task, req, lbd);
        break;
    }
    case RequestType::BatchWrite:
    {
        BatchWriteTask *task = task_mgr_.GetBatchWriteTask();
        auto lbd = [task, req]() -> KvError
        {
            auto write_req = static_cast<BatchWriteRequest *>(req);
            return task->Apply(write_req->batch_);
        };
        StartTask(task, req, lbd);
        break;
    }
    case RequestType::Clear:
    {
        BatchWriteTask *task = task_mgr_.GetBatchWriteTask();
        auto lbd = [task, req]() -> KvError
        {
            auto clear_req = static_cast<ClearRequest *>(req);
            return task->Clear(clear_req->range_);
        };
        StartTask(task, req, lbd);
        break;
    }
    }
}

void Worker::ResumeSleeping()
{
    if (sleeping_.empty())
    {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    for (size_t i = 0; i < sleeping_.size();)
    {
        KvTask *task = sleeping_[i];
        if (task->wake_at_ <= now)
        {
            task->Resume();
            sleeping_[i] = sleeping_.back();
            sleeping_.pop_back();
        }
        else
        {
            i++;
        }
    }
}

void Worker::ResumeScheduled()
{
    while (!scheduled_.empty())
    {
        KvTask *task = scheduled_.front();
        scheduled_.pop_front();
        assert(task->status_ == TaskStatus::Ongoing);
        running_ = task;
        task->coro_ = task->coro_.resume();
    }
    running_ = nullptr;
}

void Worker::PollFinished()
{
    while (!finished_.empty())
    {
        KvTask *task = finished_.front();
        finished_.pop_front();
        bool is_write = task->Type() == TaskType::BatchWrite;
        task_mgr_.FreeTask(task);
        if (is_write)
        {
            OnWriteFinished();
        }
    }
}

void Worker::OnWriteFinished()
{
    WriteRequest *req = pending_writes_.PopFront();
    if (req == nullptr)
    {
        writing_ = false;
        return;
    }
    // Continue execute the next pending write request.
    ProcessReq(req);
}

void Worker::PendingWriteQueue::PushBack(WriteRequest *req)
{
    req->next_ = nullptr;
    if (tail_ == nullptr)
    {
        assert(head_ == nullptr);
        head_ = tail_ = req;
    }
    else
    {
        assert(head_ != nullptr);
        tail_->next_ = req;
        tail_ = req;
    }
}

WriteRequest *Worker::PendingWriteQueue::PopFront()
{
    WriteRequest *req = head_;
    if (req != nullptr)
    {
        head_ = req->next_;
        if (head_ == nullptr)
        {
            tail_ = nullptr;
        }
        req->next_ = nullptr;
    }
    return req;
}

}  // namespace sqlkv
