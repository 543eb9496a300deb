// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_SYMBOL_HPP_INCLUDED
#define SYMKEY_SYMBOL_HPP_INCLUDED

#include <string_view>
#include <symkey/_detail/assert.hpp>
#include <symkey/_detail/config.hpp>
#include <symkey/_detail/index_table.hpp>
#include <symkey/hash_algorithm.hpp>
#include <vector>

namespace symkey
{
template <typename Id, typename IndexType>
class symbol;

/// Gives every distinct string one symbol; interning equal strings again yields the same symbol.
///
/// Symbols are numbered densely in the order they were first interned. The `Id` tag keeps symbols
/// of different interners apart.
template <typename Id, typename IndexType = std::uint32_t>
class symbol_interner
{
    // Where the characters of a symbol start in `_chars`, and how many there are.
    struct span
    {
        std::size_t offset;
        std::size_t length;
    };

    struct traits
    {
        const symbol_interner* self;

        std::size_t hash_entry(IndexType index) const
        {
            return hash(self->view_of(index));
        }
        std::size_t hash(std::string_view str) const
        {
            return default_hash_algorithm().hash_chars(str.data(), str.size()).finish();
        }
        bool is_equal(IndexType index, std::string_view str) const
        {
            return self->view_of(index) == str;
        }
    };

public:
    using symbol = symkey::symbol<Id, IndexType>;

    symbol_interner()                                  = default;
    symbol_interner(const symbol_interner&)            = delete;
    symbol_interner& operator=(const symbol_interner&) = delete;
    symbol_interner(symbol_interner&&)                 = default;
    symbol_interner& operator=(symbol_interner&&)      = default;

    //=== interning ===//
    /// Interns all `str.size()` characters of `str`, including any null characters.
    symbol intern(std::string_view str)
    {
        auto existing = _table.find(str, traits{this});
        if (existing != table::npos)
            return symbol(existing);

        auto index = IndexType(_spans.size());
        SYMKEY_PRECONDITION(index == _spans.size() && index != table::npos);

        _spans.push_back({_chars.size(), str.size()});
        _chars.insert(_chars.end(), str.begin(), str.end());
        _chars.push_back('\0');

        _table.insert(index, traits{this});
        return symbol(index);
    }
    template <std::size_t N>
    symbol intern(const char (&literal)[N])
    {
        SYMKEY_PRECONDITION(literal[N - 1] == '\0');
        return intern(std::string_view(literal, N - 1));
    }

    //=== access ===//
    /// The number of distinct symbols interned so far.
    std::size_t size() const
    {
        return _spans.size();
    }

    /// The characters of `sym`; they are followed by a null character that is not part of it.
    std::string_view view(symbol sym) const
    {
        SYMKEY_PRECONDITION(sym && sym.id() < _spans.size());
        return view_of(sym.id());
    }
    const char* c_str(symbol sym) const
    {
        return view(sym).data();
    }

private:
    using table = _detail::index_table<IndexType>;

    std::string_view view_of(IndexType index) const
    {
        auto span = _spans[index];
        return std::string_view(_chars.data() + span.offset, span.length);
    }

    std::vector<char> _chars;
    std::vector<span> _spans;
    table             _table;
};

/// A string interned by `symbol_interner<Id, IndexType>`.
///
/// Two symbols of the same interner are equal exactly when their strings are equal, so comparing
/// them compares their indices only.
template <typename Id, typename IndexType>
class symbol
{
    static_assert(std::is_unsigned_v<IndexType>);

public:
    using index_type = IndexType;

    /// A symbol that refers to no string.
    constexpr symbol() : _index(IndexType(-1)) {}

    constexpr explicit operator bool() const
    {
        return _index != IndexType(-1);
    }

    constexpr IndexType id() const
    {
        return _index;
    }

    friend constexpr bool operator==(symbol lhs, symbol rhs)
    {
        return lhs._index == rhs._index;
    }
    friend constexpr bool operator!=(symbol lhs, symbol rhs)
    {
        return lhs._index != rhs._index;
    }

private:
    constexpr explicit symbol(IndexType index) : _index(index) {}

    IndexType _index;

    friend symbol_interner<Id, IndexType>;
};
} // namespace symkey

#endif // SYMKEY_SYMBOL_HPP_INCLUDED
