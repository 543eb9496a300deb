// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_DETAIL_INDEX_TABLE_HPP_INCLUDED
#define SYMKEY_DETAIL_INDEX_TABLE_HPP_INCLUDED

#include <symkey/_detail/assert.hpp>
#include <symkey/_detail/config.hpp>
#include <vector>

#if 0
// The table only stores indices; keys live in an array owned by the caller.
struct IndexTableTraits
{
    // Hash of the key stored at `index`.
    std::size_t hash_entry(Index index) const;

    std::size_t hash(const Key& key) const;
    bool is_equal(Index index, const Key& key) const;
};
#endif

namespace symkey::_detail
{
/// Maps keys to indices into an external array of entries.
///
/// Open addressing with linear probing over a power of two number of slots, which is grown once
/// half of them are in use. Entries are never removed, so there are no tombstones.
template <typename Index>
class index_table
{
    static_assert(std::is_unsigned_v<Index>);
    static constexpr std::size_t min_capacity = 8;

public:
    static constexpr auto npos = Index(-1);

    index_table() = default;

    index_table(index_table&& other) noexcept
    : _slots(SYMKEY_MOV(other._slots)), _size(other._size)
    {
        other._slots.clear();
        other._size = 0;
    }

    index_table& operator=(index_table&& other) noexcept
    {
        _slots = SYMKEY_MOV(other._slots);
        _size  = other._size;

        other._slots.clear();
        other._size = 0;
        return *this;
    }

    //=== access ===//
    std::size_t size() const
    {
        return _size;
    }
    std::size_t capacity() const
    {
        return _slots.size();
    }

    /// The index stored for `key`, or `npos`.
    template <typename Key, typename Traits>
    Index find(const Key& key, const Traits& traits) const
    {
        if (_size == 0)
            return npos;

        auto mask = _slots.size() - 1;
        for (auto slot = traits.hash(key) & mask;; slot = (slot + 1) & mask)
        {
            auto index = _slots[slot];
            if (index == npos || traits.is_equal(index, key))
                return index;
        }
    }

    //=== modifiers ===//
    /// Adds `index`, whose key must not be in the table yet.
    template <typename Traits>
    void insert(Index index, const Traits& traits)
    {
        SYMKEY_PRECONDITION(index != npos);
        if (2 * (_size + 1) > _slots.size())
            rehash(_slots.empty() ? min_capacity : 2 * _slots.size(), traits);

        place(index, traits);
        ++_size;
    }

    /// Grows the table so that `count` indices fit without another rehash.
    template <typename Traits>
    void reserve(std::size_t count, const Traits& traits)
    {
        auto capacity = _slots.empty() ? min_capacity : _slots.size();
        while (capacity < 2 * count)
            capacity *= 2;

        if (capacity != _slots.size())
            rehash(capacity, traits);
    }

private:
    template <typename Traits>
    void place(Index index, const Traits& traits)
    {
        auto mask = _slots.size() - 1;
        auto slot = traits.hash_entry(index) & mask;
        while (_slots[slot] != npos)
            slot = (slot + 1) & mask;
        _slots[slot] = index;
    }

    template <typename Traits>
    void rehash(std::size_t new_capacity, const Traits& traits)
    {
        std::vector<Index> old(new_capacity, npos);
        _slots.swap(old);

        for (auto index : old)
            if (index != npos)
                place(index, traits);
    }

    std::vector<Index> _slots;
    std::size_t        _size = 0;
};
} // namespace symkey::_detail

#endif // SYMKEY_DETAIL_INDEX_TABLE_HPP_INCLUDED
