#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "sqlkv/error.h"

namespace sqlkv
{
/**
 * @brief Maps logical key/value bytes to the text stored in the CHAR columns
 * of the backing table, and back.
 *
 * Bytes are written as lowercase hexadecimal. The encoded form compares the
 * same way as the raw bytes (unsigned, lexicographic), so ORDER BY and range
 * predicates evaluated by the backend follow the logical key order. Changing
 * the encoding invalidates every table written with the previous one.
 */
class Codec
{
public:
    Codec(uint32_t key_width, uint32_t value_width)
        : key_width_(key_width), value_width_(value_width)
    {
    }

    static std::string Encode(std::string_view bytes);
    static void EncodeTo(std::string_view bytes, std::string &dst);
    static KvError Decode(std::string_view text, std::string &bytes);

    /**
     * @brief Encode a key, rejecting empty keys and keys whose encoded form
     * does not fit the key column.
     */
    std::pair<std::string, KvError> EncodeKey(std::string_view key) const;
    std::pair<std::string, KvError> EncodeValue(std::string_view value) const;

    /**
     * @brief Encode a range bound. Bounds are only compared against, so any
     * length is accepted.
     */
    static std::string EncodeBound(std::string_view bound)
    {
        return Encode(bound);
    }

    uint32_t MaxKeyBytes() const
    {
        return key_width_ / 2;
    }
    uint32_t MaxValueBytes() const
    {
        return value_width_ / 2;
    }

private:
    uint32_t key_width_;
    uint32_t value_width_;
};
}  // namespace sqlkv
