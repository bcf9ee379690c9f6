#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "sqlkv/types.h"

namespace sqlkv
{
/**
 * @brief Forward-only cursor over the result of one range query.
 *
 * The whole result is fetched before the iterator is handed out. It is not
 * restartable: query again for a fresh view of the store.
 */
class KvIterator
{
public:
    KvIterator() = default;
    explicit KvIterator(std::vector<KvEntry> entries);

    bool Valid() const;
    void Next();
    std::string_view Key() const;
    std::string_view Value() const;
    /**
     * @brief Number of entries not handed out yet, the current one included.
     */
    size_t Remaining() const;

private:
    std::vector<KvEntry> entries_;
    size_t pos_{0};
};
}  // namespace sqlkv
