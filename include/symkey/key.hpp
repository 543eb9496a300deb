// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_KEY_HPP_INCLUDED
#define SYMKEY_KEY_HPP_INCLUDED

#include <string>
#include <string_view>
#include <symkey/_detail/assert.hpp>
#include <symkey/hash_algorithm.hpp>
#include <symkey/symbol.hpp>

#if 0
struct KeyTraits
{
    static constexpr key_kind kind;

    using key_type    = K; // what lookups take
    using stored_type = S; // what the table keeps, owns its data

    static stored_type store(const key_type& key);

    // `stored_type` must be usable where a `key_type` is expected.
    static bool is_equal(const stored_type& entry, const key_type& key);
    static std::size_t hash(const key_type& key);
};
#endif

namespace symkey
{
enum class key_kind
{
    text,
    interned,
    integer,
};

constexpr const char* key_kind_name(key_kind kind)
{
    switch (kind)
    {
    case key_kind::text:
        return "String";
    case key_kind::interned:
        return "Symbol";
    case key_kind::integer:
        return "Integer";
    }
    return "unknown";
}
} // namespace symkey

//=== key traits ===//
namespace symkey
{
/// Text compared by content; every lookup hashes and compares all characters.
struct text_key_traits
{
    static constexpr auto kind = key_kind::text;

    using key_type    = std::string_view;
    using stored_type = std::string;

    static stored_type store(key_type key)
    {
        return stored_type(key);
    }

    static bool is_equal(const stored_type& entry, key_type key)
    {
        return entry == key;
    }
    static std::size_t hash(key_type key)
    {
        return default_hash_algorithm().hash_chars(key.data(), key.size()).finish();
    }
};

/// Symbols compared by identity; the hash is the symbol index itself.
template <typename Symbol>
struct interned_key_traits
{
    static constexpr auto kind = key_kind::interned;

    using key_type    = Symbol;
    using stored_type = Symbol;

    static stored_type store(key_type key)
    {
        SYMKEY_PRECONDITION(key);
        return key;
    }

    static bool is_equal(stored_type entry, key_type key)
    {
        return entry == key;
    }
    static std::size_t hash(key_type key)
    {
        return static_cast<std::size_t>(key.id());
    }
};

/// Integers compared numerically.
struct integer_key_traits
{
    static constexpr auto kind = key_kind::integer;

    using key_type    = std::int64_t;
    using stored_type = std::int64_t;

    static stored_type store(key_type key)
    {
        return key;
    }

    static bool is_equal(stored_type entry, key_type key)
    {
        return entry == key;
    }
    static std::size_t hash(key_type key)
    {
        return default_hash_algorithm().hash_scalar(key).finish();
    }
};
} // namespace symkey

//=== identity ===//
namespace symkey
{
/// An opaque token for the object behind a key.
///
/// Two values that are one object, or that are the same immediate value, have equal tokens.
/// Distinct live text objects always have distinct tokens.
using identity_token = std::uintptr_t;

/// Every text object is its own object: the token is its address.
inline identity_token identity_of(const std::string& text)
{
    return reinterpret_cast<identity_token>(&text);
}

/// Equal symbols are the same interned object: the token is the symbol index.
template <typename Id, typename IndexType>
constexpr identity_token identity_of(symbol<Id, IndexType> sym)
{
    return static_cast<identity_token>(sym.id());
}

/// Integers are immediate values: the token is the value shifted left with the low bit set, so it
/// is odd and never equals the address of a text object.
///
/// The shift drops the top bit, so only values in the 63 bit range
/// `[-2^62, 2^62)` map to distinct tokens.
constexpr identity_token identity_of(std::int64_t value)
{
    return (static_cast<identity_token>(value) << 1) | 1u;
}
} // namespace symkey

#endif // SYMKEY_KEY_HPP_INCLUDED
