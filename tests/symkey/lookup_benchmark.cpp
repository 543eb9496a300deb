// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#include <symkey/lookup_benchmark.hpp>

#include <cstdio>
#include <doctest/doctest.h>
#include <string>
#include <vector>

namespace
{
symkey::benchmark_config small_config()
{
    symkey::benchmark_config config;
    config.iterations = 1000;
    return config;
}

std::vector<std::string> read_lines(std::FILE* file)
{
    std::rewind(file);

    std::vector<std::string> lines;
    std::string              line;
    for (auto c = std::fgetc(file); c != EOF; c = std::fgetc(file))
    {
        if (c == '\n')
        {
            lines.push_back(line);
            line.clear();
        }
        else
            line.push_back(char(c));
    }
    return lines;
}
} // namespace

TEST_CASE("lookup_benchmark")
{
    symkey::lookup_benchmark bench(small_config());

    SUBCASE("setup")
    {
        CHECK(bench.config().iterations == 1000);
        CHECK(bench.by_text().size() == 1);
        CHECK(bench.by_symbol().size() == 1);
        CHECK(bench.by_integer().size() == 1);
        CHECK(bench.symbols().size() == 1);

        auto description = bench.config().description;
        CHECK(*bench.by_text().lookup("ruby") == description);
        CHECK(*bench.by_integer().lookup(1) == description);
        CHECK(bench.runner().results().empty());
    }
    SUBCASE("literal keys")
    {
        using symkey::lookup_benchmark;
        static_assert(lookup_benchmark::integer_literal == 1);
        static_assert(sizeof(lookup_benchmark::text_literal) == sizeof("ruby"));

        auto description = bench.config().description;
        REQUIRE(bench.by_text().lookup(lookup_benchmark::text_literal) != nullptr);
        CHECK(*bench.by_text().lookup(lookup_benchmark::text_literal) == description);
        REQUIRE(bench.by_integer().lookup(lookup_benchmark::integer_literal) != nullptr);
        CHECK(*bench.by_integer().lookup(lookup_benchmark::integer_literal) == description);

        auto sym = bench.by_symbol().begin()->key;
        CHECK(bench.symbols().view(sym) == lookup_benchmark::text_literal);
    }
    SUBCASE("run")
    {
        const char* labels[] = {"literal string",  "literal symbol",  "literal integer",
                                "variable string", "variable symbol", "variable integer"};

        for (auto round = 0; round != 2; ++round)
        {
            bench.run();

            auto& results = bench.runner().results();
            REQUIRE(results.size() == 6);
            for (auto i = 0u; i != 6; ++i)
            {
                CHECK(results[i].label == labels[i]);
                CHECK(results[i].elapsed.count() >= 0);
            }
        }

        // Only reads.
        CHECK(bench.by_text().size() == 1);
        CHECK(bench.by_symbol().size() == 1);
        CHECK(bench.by_integer().size() == 1);
        CHECK(bench.symbols().size() == 1);
    }
    SUBCASE("sample_identity")
    {
        for (auto round = 0; round != 3; ++round)
        {
            auto text = bench.sample_identity(symkey::key_kind::text);
            CHECK(text.first != text.second);

            auto interned = bench.sample_identity(symkey::key_kind::interned);
            CHECK(interned.first == interned.second);

            auto integer = bench.sample_identity(symkey::key_kind::integer);
            CHECK(integer.first == integer.second);
            CHECK(integer.first == symkey::identity_of(std::int64_t(1)));
        }
    }
    SUBCASE("print_identity_diagnostics")
    {
        auto file = std::tmpfile();
        REQUIRE(file != nullptr);
        bench.print_identity_diagnostics(file);
        auto lines = read_lines(file);
        std::fclose(file);

        REQUIRE(lines.size() == 6);
        const char* kinds[] = {"String", "String", "Symbol", "Symbol", "Integer", "Integer"};
        for (auto i = 0u; i != 6; ++i)
        {
            auto prefix = std::string(kinds[i]) + ": ";
            CHECK(lines[i].rfind(prefix, 0) == 0);
            CHECK(lines[i].find(" vs ") != std::string::npos);
        }

        auto ids = [](const std::string& line) {
            auto colon = line.find(": ");
            auto vs    = line.find(" vs ");
            return std::make_pair(line.substr(colon + 2, vs - colon - 2), line.substr(vs + 4));
        };
        CHECK(ids(lines[0]).first != ids(lines[0]).second);
        CHECK(ids(lines[2]).first == ids(lines[2]).second);
        CHECK(ids(lines[4]).first == ids(lines[4]).second);
        CHECK(ids(lines[4]).first == "3");
    }
    SUBCASE("report")
    {
        bench.run();

        auto file = std::tmpfile();
        REQUIRE(file != nullptr);
        bench.print_report(file);
        auto lines = read_lines(file);
        std::fclose(file);

        REQUIRE(lines.size() == 6);
        CHECK(lines[0].rfind("literal string:", 0) == 0);
        CHECK(lines[5].rfind("variable integer:", 0) == 0);
    }
}
