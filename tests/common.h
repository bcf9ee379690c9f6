#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "sqlkv/sql_kv_store.h"

namespace test_util
{
std::string Key(uint64_t k);
std::string Value(uint64_t val, uint32_t len = 0);

/**
 * @brief Options of a store kept in an in-memory SQLite database, polling the
 * connection state every 5ms.
 */
sqlkv::KvOptions MemOptions();

std::vector<sqlkv::KvEntry> ScanAll(sqlkv::SqlKvStore *store,
                                    const sqlkv::ScanRange &range);

/**
 * @brief Mirrors every write sent to the store in a std::map and checks that
 * the store reads back the same content.
 */
class MapVerifier
{
public:
    explicit MapVerifier(sqlkv::SqlKvStore *store, bool validate = true);
    ~MapVerifier();
    void Upsert(uint64_t begin, uint64_t end);
    void Delete(uint64_t begin, uint64_t end);
    void WriteRnd(uint64_t begin,
                  uint64_t end,
                  uint8_t del = 20,
                  uint8_t density = 25);
    void Clear(const sqlkv::ScanRange &range);
    void Clean();
    void ExecWrite(sqlkv::KvRequest *req);

    void Read(uint64_t key);
    void Read(std::string_view key);
    void Scan(const sqlkv::ScanRange &range);

    void Validate();
    void SetAutoValidate(bool v);
    void SetValueSize(uint32_t val_size);

    /**
     * @brief Entries of the model within the range, in the range's
     * direction.
     */
    std::vector<sqlkv::KvEntry> Select(const sqlkv::ScanRange &range) const;

private:
    uint64_t round_{0};
    std::map<std::string, std::string> answer_;
    bool auto_validate_{true};
    uint32_t val_size_{12};

    sqlkv::SqlKvStore *store_;
};
}  // namespace test_util
