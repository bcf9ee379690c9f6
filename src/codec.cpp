#include "sqlkv/codec.h"

namespace sqlkv
{
namespace
{
constexpr char hex_digits[] = "0123456789abcdef";

inline int HexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    return -1;
}
}  // namespace

std::string Codec::Encode(std::string_view bytes)
{
    std::string text;
    EncodeTo(bytes, text);
    return text;
}

void Codec::EncodeTo(std::string_view bytes, std::string &dst)
{
    dst.reserve(dst.size() + bytes.size() * 2);
    for (char c : bytes)
    {
        uint8_t b = static_cast<uint8_t>(c);
        dst.push_back(hex_digits[b >> 4]);
        dst.push_back(hex_digits[b & 0x0f]);
    }
}

KvError Codec::Decode(std::string_view text, std::string &bytes)
{
    // CHAR(n) columns come back blank padded from some backends.
    size_t end = text.find_last_not_of(' ');
    text = end == std::string_view::npos ? std::string_view{}
                                         : text.substr(0, end + 1);
    if (text.size() % 2 != 0)
    {
        return KvError::Corrupted;
    }

    bytes.clear();
    bytes.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2)
    {
        int hi = HexValue(text[i]);
        int lo = HexValue(text[i + 1]);
        if (hi < 0 || lo < 0)
        {
            return KvError::Corrupted;
        }
        bytes.push_back(static_cast<char>((hi << 4) | lo));
    }
    return KvError::NoError;
}

std::pair<std::string, KvError> Codec::EncodeKey(std::string_view key) const
{
    if (key.empty())
    {
        return {{}, KvError::InvalidArgs};
    }
    if (key.size() > MaxKeyBytes())
    {
        return {{}, KvError::ValueTooLarge};
    }
    return {Encode(key), KvError::NoError};
}

std::pair<std::string, KvError> Codec::EncodeValue(
    std::string_view value) const
{
    if (value.size() > MaxValueBytes())
    {
        return {{}, KvError::ValueTooLarge};
    }
    return {Encode(value), KvError::NoError};
}

}  // namespace sqlkv
