#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "sqlkv/error.h"

namespace sqlkv
{
/**
 * @brief SQL flavor of a backend. SQLite shares the PostgreSQL upsert syntax.
 */
enum class SqlDialect : uint8_t
{
    Postgres = 0,
    Ignite
};

/**
 * @brief Target of a store: scheme://[user[:password]@]host[:port]/cache
 */
struct Location
{
    friend bool operator==(const Location &lhs, const Location &rhs)
    {
        return lhs.scheme_ == rhs.scheme_ && lhs.host_ == rhs.host_ &&
               lhs.port_ == rhs.port_ && lhs.cache_ == rhs.cache_ &&
               lhs.user_ == rhs.user_ && lhs.password_ == rhs.password_;
    }
    friend std::ostream &operator<<(std::ostream &os, const Location &loc);

    /**
     * @brief Parse a location string. Returns an invalid location (see
     * IsValid) if the string is malformed.
     */
    static Location FromString(std::string_view str);
    std::string ToString() const;
    bool IsValid() const;

    static constexpr char scheme_separator[] = "://";

    std::string scheme_;
    std::string user_;
    std::string password_;
    std::string host_;
    uint16_t port_{0};
    std::string cache_;
};

enum class WriteOp : uint8_t
{
    Upsert = 0,
    Delete
};

struct WriteDataEntry
{
    WriteDataEntry() = default;
    WriteDataEntry(std::string key, std::string val, WriteOp op);

    std::string key_;
    std::string val_;
    WriteOp op_{WriteOp::Upsert};
};

struct KvEntry
{
    friend bool operator==(const KvEntry &lhs, const KvEntry &rhs)
    {
        return lhs.key_ == rhs.key_ && lhs.value_ == rhs.value_;
    }

    std::string key_;
    std::string value_;
};

/**
 * @brief Bounds, direction and size of a range query.
 * At most one of gt_/gte_ and at most one of lt_/lte_ may be set. Absent
 * bounds leave that side open.
 */
struct ScanRange
{
    ScanRange &Gt(std::string key);
    ScanRange &Gte(std::string key);
    ScanRange &Lt(std::string key);
    ScanRange &Lte(std::string key);
    ScanRange &Reverse(bool reverse = true);
    ScanRange &Limit(size_t limit);

    bool IsValid() const;
    bool HasBounds() const;

    std::optional<std::string> gt_;
    std::optional<std::string> gte_;
    std::optional<std::string> lt_;
    std::optional<std::string> lte_;
    bool reverse_{false};
    /**
     * @brief Max amount of entries, 0 for no limit.
     */
    size_t limit_{0};
};

}  // namespace sqlkv
