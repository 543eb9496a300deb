// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#include <symkey/hash_algorithm.hpp>

#include <doctest/doctest.h>
#include <string_view>
#include <vector>

namespace
{
std::uint64_t hash_text(std::string_view str)
{
    return symkey::default_hash_algorithm().hash_chars(str.data(), str.size()).finish();
}
} // namespace

TEST_CASE("default_hash_algorithm")
{
    SUBCASE("empty input is the offset basis")
    {
        CHECK(symkey::default_hash_algorithm().finish() == 14695981039346656037ull);
        CHECK(hash_text("") == 14695981039346656037ull);
    }
    SUBCASE("known FNV-1a values")
    {
        CHECK(hash_text("a") == 0xaf63dc4c8601ec8cull);
        CHECK(hash_text("foobar") == 0x85944171f73967e8ull);
    }
    SUBCASE("chars only hashes the given length")
    {
        const char text[] = "ruby on rails";
        CHECK(symkey::default_hash_algorithm().hash_chars(text, 4).finish() == hash_text("ruby"));
    }
    SUBCASE("null characters are hashed")
    {
        CHECK(hash_text(std::string_view("a\0b", 3)) != hash_text("a"));
        CHECK(hash_text(std::string_view("a\0", 2)) != hash_text("a"));
        CHECK(hash_text(std::string_view("a\0b", 3)) == hash_text(std::string_view("a\0b", 3)));
    }
    SUBCASE("long input equals byte by byte hashing")
    {
        std::vector<unsigned char> bytes(1 << 20);
        for (auto i = std::size_t(0); i != bytes.size(); ++i)
            bytes[i] = static_cast<unsigned char>(i * 31);

        auto whole = symkey::default_hash_algorithm().hash_bytes(bytes.data(), bytes.size()).finish();

        symkey::default_hash_algorithm chained;
        for (auto byte : bytes)
            chained.hash_bytes(&byte, 1);
        CHECK(whole == SYMKEY_MOV(chained).finish());
    }
    SUBCASE("scalars")
    {
        auto one = symkey::default_hash_algorithm().hash_scalar(std::int64_t(1)).finish();
        auto two = symkey::default_hash_algorithm().hash_scalar(std::int64_t(2)).finish();
        CHECK(one != two);
        CHECK(one == symkey::default_hash_algorithm().hash_scalar(std::int64_t(1)).finish());
    }
}
