// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_LOOKUP_TABLE_HPP_INCLUDED
#define SYMKEY_LOOKUP_TABLE_HPP_INCLUDED

#include <symkey/_detail/assert.hpp>
#include <symkey/_detail/config.hpp>
#include <symkey/_detail/index_table.hpp>
#include <symkey/key.hpp>
#include <vector>

namespace symkey
{
/// A hash table from keys of one kind to values.
///
/// Entries are kept in insertion order; the hash table itself only holds their indices. Pointers
/// returned by `lookup()` are invalidated by the next insertion.
template <typename KeyTraits, typename Value>
class lookup_table
{
    using index_type = std::uint32_t;

public:
    using key_type    = typename KeyTraits::key_type;
    using stored_type = typename KeyTraits::stored_type;

    struct entry
    {
        stored_type key;
        Value       value;
    };
    using iterator = typename std::vector<entry>::const_iterator;

    //=== access ===//
    bool empty() const
    {
        return _entries.empty();
    }
    std::size_t size() const
    {
        return _entries.size();
    }
    /// The number of hash slots, which is at least twice the size.
    std::size_t capacity() const
    {
        return _index.capacity();
    }

    /// Iterates over the entries in the order they were inserted.
    iterator begin() const
    {
        return _entries.begin();
    }
    iterator end() const
    {
        return _entries.end();
    }

    //=== lookup ===//
    bool contains(const key_type& key) const
    {
        return find(key) != table::npos;
    }

    /// The value stored for `key`, or `nullptr`.
    const Value* lookup(const key_type& key) const
    {
        auto index = find(key);
        return index == table::npos ? nullptr : &_entries[index].value;
    }
    Value* lookup(const key_type& key)
    {
        auto index = find(key);
        return index == table::npos ? nullptr : &_entries[index].value;
    }

    //=== modifiers ===//
    void reserve(std::size_t count)
    {
        _entries.reserve(count);
        _index.reserve(count, traits{&_entries});
    }

    /// Adds `key` with a value constructed from `args`, unless `key` is already present.
    /// Returns whether it was added.
    template <typename... Args>
    bool insert(const key_type& key, Args&&... args)
    {
        if (contains(key))
            return false;

        append(key, SYMKEY_FWD(args)...);
        return true;
    }

    /// Adds `key`, or replaces the value it already has.
    /// Returns whether it was added.
    template <typename... Args>
    bool insert_or_update(const key_type& key, Args&&... args)
    {
        if (auto value = lookup(key))
        {
            *value = Value(SYMKEY_FWD(args)...);
            return false;
        }

        append(key, SYMKEY_FWD(args)...);
        return true;
    }

private:
    using table = _detail::index_table<index_type>;

    struct traits
    {
        const std::vector<entry>* entries;

        std::size_t hash_entry(index_type index) const
        {
            return KeyTraits::hash((*entries)[index].key);
        }
        std::size_t hash(const key_type& key) const
        {
            return KeyTraits::hash(key);
        }
        bool is_equal(index_type index, const key_type& key) const
        {
            return KeyTraits::is_equal((*entries)[index].key, key);
        }
    };

    index_type find(const key_type& key) const
    {
        return _index.find(key, traits{&_entries});
    }

    template <typename... Args>
    void append(const key_type& key, Args&&... args)
    {
        auto index = index_type(_entries.size());
        SYMKEY_PRECONDITION(index == _entries.size() && index != table::npos);

        _entries.push_back(entry{KeyTraits::store(key), Value(SYMKEY_FWD(args)...)});
        _index.insert(index, traits{&_entries});
    }

    std::vector<entry> _entries;
    table              _index;
};

template <typename Value>
using text_table = lookup_table<text_key_traits, Value>;

template <typename Symbol, typename Value>
using interned_table = lookup_table<interned_key_traits<Symbol>, Value>;

template <typename Value>
using integer_table = lookup_table<integer_key_traits, Value>;
} // namespace symkey

#endif // SYMKEY_LOOKUP_TABLE_HPP_INCLUDED
