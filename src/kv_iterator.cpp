#include "sqlkv/kv_iterator.h"

#include <cassert>
#include <utility>

namespace sqlkv
{
KvIterator::KvIterator(std::vector<KvEntry> entries)
    : entries_(std::move(entries))
{
}

bool KvIterator::Valid() const
{
    return pos_ < entries_.size();
}

void KvIterator::Next()
{
    assert(Valid());
    pos_++;
}

std::string_view KvIterator::Key() const
{
    assert(Valid());
    return entries_[pos_].key_;
}

std::string_view KvIterator::Value() const
{
    assert(Valid());
    return entries_[pos_].value_;
}

size_t KvIterator::Remaining() const
{
    return entries_.size() - pos_;
}

}  // namespace sqlkv
