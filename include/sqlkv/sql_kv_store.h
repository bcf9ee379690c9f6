#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sqlkv/codec.h"
#include "sqlkv/connection.h"
#include "sqlkv/error.h"
#include "sqlkv/kv_iterator.h"
#include "sqlkv/kv_options.h"
#include "sqlkv/sql_client.h"
#include "sqlkv/types.h"

namespace sqlkv
{
class Worker;

enum class RequestType : uint8_t
{
    Read,
    Scan,
    BatchWrite,
    Clear
};

class KvRequest
{
public:
    virtual ~KvRequest() = default;
    virtual RequestType Type() const = 0;
    KvError Error() const;
    /**
     * @brief Backend detail of a failed request if any, otherwise the
     * description of the error.
     */
    std::string_view ErrMessage() const;
    uint64_t UserData() const;

    /**
     * @brief Test if this request is done.
     */
    bool IsDone() const;
    /**
     * @brief Block until done. Only for requests sent without a callback.
     */
    void Wait() const;

protected:
    void SetDone(KvError err);

    uint64_t user_data_{0};
    std::function<void(KvRequest *)> callback_{nullptr};
    std::atomic<bool> done_{false};
    KvError err_{KvError::NoError};
    std::string err_msg_;

    friend class Worker;
    friend class SqlKvStore;
};

class ReadRequest : public KvRequest
{
public:
    RequestType Type() const override
    {
        return RequestType::Read;
    }
    void SetArgs(std::string_view key);

    // input
    std::string_view key_;
    // output
    std::string value_;
};

class ScanRequest : public KvRequest
{
public:
    RequestType Type() const override
    {
        return RequestType::Scan;
    }
    void SetArgs(ScanRange range);

    // input
    ScanRange range_;
    // output
    std::vector<KvEntry> entries_;
};

/**
 * @brief Base of the requests modifying the store. They are applied in the
 * order they are sent.
 */
class WriteRequest : public KvRequest
{
public:
    // Pointer to the next pending write request.
    WriteRequest *next_{nullptr};
};

class BatchWriteRequest : public WriteRequest
{
public:
    RequestType Type() const override
    {
        return RequestType::BatchWrite;
    }
    void SetArgs(std::vector<WriteDataEntry> &&batch);
    void AddWrite(std::string key, std::string value, WriteOp op);

    // input
    std::vector<WriteDataEntry> batch_;
};

class ClearRequest : public WriteRequest
{
public:
    RequestType Type() const override
    {
        return RequestType::Clear;
    }
    void SetArgs(ScanRange range);

    // input
    ScanRange range_;
};

/**
 * @brief Ordered byte key-value store kept in a table of a SQL backend.
 *
 * Open() connects to the backend and creates the backing table. Requests are
 * then executed by a single worker thread until Close().
 */
class SqlKvStore
{
public:
    /**
     * @param client Backend client to use instead of the one matching the
     * scheme of the location.
     */
    explicit SqlKvStore(const KvOptions &opts,
                        std::unique_ptr<SqlClient> client = nullptr);
    SqlKvStore(const SqlKvStore &) = delete;
    SqlKvStore(SqlKvStore &&) = delete;
    ~SqlKvStore();

    /**
     * @brief Open the store at options.location + location_suffix.
     * Opening an opened store is a no-op.
     */
    KvError Open(std::string_view location_suffix = {});
    void Close();
    bool IsOpen() const;
    bool IsStopped() const;

    /**
     * @brief Send a request to the worker. The callback is invoked on the
     * worker thread once the request is done.
     * @return false if the store is not opened. The request is then done
     * with NotRunning and the callback is not invoked.
     */
    template <typename F>
    bool ExecAsyn(KvRequest *req, uint64_t data, F callback)
    {
        req->user_data_ = data;
        req->callback_ = std::move(callback);
        return SendRequest(req);
    }
    bool ExecAsyn(KvRequest *req);
    void ExecSync(KvRequest *req);

    std::pair<std::string, KvError> Get(std::string_view key);
    KvError Put(std::string_view key, std::string_view value);
    KvError Delete(std::string_view key);
    KvError Batch(std::vector<WriteDataEntry> batch);
    /**
     * @brief Query a range. The returned iterator hands out the entries in
     * the range's direction.
     */
    std::pair<KvIterator, KvError> NewIterator(const ScanRange &range);
    KvError Clear(const ScanRange &range);

    const KvOptions &Options() const;
    const Codec *GetCodec() const;
    const Location &GetLocation() const;
    ConnState State() const;

private:
    bool SendRequest(KvRequest *req);

    KvOptions options_;
    Codec codec_;
    Connection conn_;
    std::unique_ptr<Worker> worker_;
    std::atomic<bool> stopped_{true};
    // Callers between the stopped_ check and the enqueue of a request.
    std::atomic<uint32_t> senders_{0};
    friend class Worker;
};
}  // namespace sqlkv
