#include "sqlkv/types.h"

#include <charconv>
#include <iterator>
#include <utility>

namespace sqlkv
{
std::ostream &operator<<(std::ostream &out, const Location &loc)
{
    // Password is never printed.
    out << loc.scheme_ << Location::scheme_separator;
    if (!loc.user_.empty())
    {
        out << loc.user_ << '@';
    }
    out << loc.host_;
    if (loc.port_ != 0)
    {
        out << ':' << loc.port_;
    }
    out << '/' << loc.cache_;
    return out;
}

Location Location::FromString(std::string_view str)
{
    Location loc;
    size_t p = str.find(scheme_separator);
    if (p == std::string_view::npos || p == 0)
    {
        return {};
    }
    loc.scheme_ = str.substr(0, p);
    str.remove_prefix(p + std::size(scheme_separator) - 1);

    p = str.find('/');
    if (p == std::string_view::npos)
    {
        return {};
    }
    std::string_view authority = str.substr(0, p);
    loc.cache_ = str.substr(p + 1);

    p = authority.rfind('@');
    if (p != std::string_view::npos)
    {
        std::string_view userinfo = authority.substr(0, p);
        authority.remove_prefix(p + 1);
        size_t colon = userinfo.find(':');
        loc.user_ = userinfo.substr(0, colon);
        if (colon != std::string_view::npos)
        {
            loc.password_ = userinfo.substr(colon + 1);
        }
    }

    p = authority.rfind(':');
    if (p != std::string_view::npos)
    {
        std::string_view port = authority.substr(p + 1);
        uint16_t num = 0;
        auto [end, ec] =
            std::from_chars(port.data(), port.data() + port.size(), num);
        if (ec != std::errc() || end != port.data() + port.size())
        {
            return {};
        }
        loc.port_ = num;
        authority = authority.substr(0, p);
    }
    loc.host_ = authority;
    return loc;
}

std::string Location::ToString() const
{
    std::string str = scheme_ + scheme_separator;
    if (!user_.empty())
    {
        str.append(user_);
        str.push_back('@');
    }
    str.append(host_);
    if (port_ != 0)
    {
        str.push_back(':');
        str.append(std::to_string(port_));
    }
    str.push_back('/');
    str.append(cache_);
    return str;
}

bool Location::IsValid() const
{
    return !scheme_.empty() && !cache_.empty() &&
           cache_.find('/') == std::string::npos;
}

WriteDataEntry::WriteDataEntry(std::string key, std::string val, WriteOp op)
    : key_(std::move(key)), val_(std::move(val)), op_(op)
{
}

ScanRange &ScanRange::Gt(std::string key)
{
    gt_ = std::move(key);
    return *this;
}

ScanRange &ScanRange::Gte(std::string key)
{
    gte_ = std::move(key);
    return *this;
}

ScanRange &ScanRange::Lt(std::string key)
{
    lt_ = std::move(key);
    return *this;
}

ScanRange &ScanRange::Lte(std::string key)
{
    lte_ = std::move(key);
    return *this;
}

ScanRange &ScanRange::Reverse(bool reverse)
{
    reverse_ = reverse;
    return *this;
}

ScanRange &ScanRange::Limit(size_t limit)
{
    limit_ = limit;
    return *this;
}

bool ScanRange::IsValid() const
{
    return !(gt_ && gte_) && !(lt_ && lte_);
}

bool ScanRange::HasBounds() const
{
    return gt_ || gte_ || lt_ || lte_;
}

}  // namespace sqlkv
