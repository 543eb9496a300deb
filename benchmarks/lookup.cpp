// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#include <benchmark/benchmark.h>
#include <cstdint>
#include <string>
#include <string_view>

#include <symkey/lookup_table.hpp>
#include <symkey/symbol.hpp>

// The same six lookups as the symkey executable, measured by the benchmark library's harness.

namespace
{
using interner = symkey::symbol_interner<struct bench_symbol_id>;
using symbol   = interner::symbol;

constexpr const char text_literal[] = "ruby";
constexpr auto       integer_literal = std::int64_t(1);
constexpr auto       description     = "A dynamic, open source programming language";

void literal_string(benchmark::State& state)
{
    symkey::text_table<std::string> table;
    table.insert(text_literal, description);

    for (auto _ : state)
        benchmark::DoNotOptimize(table.lookup(std::string(text_literal)));
}
BENCHMARK(literal_string);

void literal_symbol(benchmark::State& state)
{
    interner                                   symbols;
    symkey::interned_table<symbol, std::string> table;
    table.insert(symbols.intern(text_literal), description);

    for (auto _ : state)
        benchmark::DoNotOptimize(table.lookup(symbols.intern(text_literal)));
}
BENCHMARK(literal_symbol);

void literal_integer(benchmark::State& state)
{
    symkey::integer_table<std::string> table;
    table.insert(integer_literal, description);

    for (auto _ : state)
        benchmark::DoNotOptimize(table.lookup(integer_literal));
}
BENCHMARK(literal_integer);

void variable_string(benchmark::State& state)
{
    symkey::text_table<std::string> table;
    std::string                     key(text_literal);
    table.insert(key, description);

    for (auto _ : state)
        benchmark::DoNotOptimize(table.lookup(key));
}
BENCHMARK(variable_string);

void variable_symbol(benchmark::State& state)
{
    interner                                   symbols;
    symkey::interned_table<symbol, std::string> table;
    auto                                       key = symbols.intern(text_literal);
    table.insert(key, description);

    for (auto _ : state)
        benchmark::DoNotOptimize(table.lookup(key));
}
BENCHMARK(variable_symbol);

void variable_integer(benchmark::State& state)
{
    symkey::integer_table<std::string> table;
    auto                               key = integer_literal;
    table.insert(key, description);

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(key);
        benchmark::DoNotOptimize(table.lookup(key));
    }
}
BENCHMARK(variable_integer);
} // namespace

BENCHMARK_MAIN();
