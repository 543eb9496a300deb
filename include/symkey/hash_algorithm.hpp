// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_HASH_ALGORITHM_HPP_INCLUDED
#define SYMKEY_HASH_ALGORITHM_HPP_INCLUDED

#include <cstdint>
#include <symkey/_detail/config.hpp>

namespace symkey
{
/// FNV-1a 64 bit hash.
///
/// Text is always hashed with its length, so strings that contain a null character hash every
/// character.
class default_hash_algorithm
{
    static constexpr std::uint64_t fnv_basis = 14695981039346656037ull;
    static constexpr std::uint64_t fnv_prime = 1099511628211ull;

public:
    explicit default_hash_algorithm() : _hash(fnv_basis) {}

    default_hash_algorithm&& hash_bytes(const unsigned char* ptr, std::size_t size)
    {
        for (auto i = std::size_t(0); i != size; ++i)
        {
            _hash ^= ptr[i];
            _hash *= fnv_prime;
        }
        return SYMKEY_MOV(*this);
    }

    template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
    default_hash_algorithm&& hash_scalar(T value)
    {
        return hash_bytes(reinterpret_cast<const unsigned char*>(&value), sizeof(T));
    }

    default_hash_algorithm&& hash_chars(const char* str, std::size_t length)
    {
        return hash_bytes(reinterpret_cast<const unsigned char*>(str), length);
    }

    std::uint64_t finish() &&
    {
        return _hash;
    }

private:
    std::uint64_t _hash;
};
} // namespace symkey

#endif // SYMKEY_HASH_ALGORITHM_HPP_INCLUDED
