// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_LOOKUP_BENCHMARK_HPP_INCLUDED
#define SYMKEY_LOOKUP_BENCHMARK_HPP_INCLUDED

#include <cinttypes>
#include <cstdio>
#include <initializer_list>
#include <string>
#include <symkey/benchmark_runner.hpp>
#include <symkey/key.hpp>
#include <symkey/lookup_table.hpp>
#include <symkey/symbol.hpp>

namespace symkey
{
struct benchmark_config
{
    std::size_t iterations  = 1'000'000;
    const char* description = "A dynamic, open source programming language";
};

/// The two identity tokens of independently created instances of equal keys.
struct identity_sample
{
    identity_token first;
    identity_token second;
};

/// Compares lookups by text, symbol and integer key in three single-entry tables.
///
/// A literal key is evaluated anew on every lookup from a compile-time constant: the text is copied
/// into a fresh string, the symbol is interned again, the integer is an immediate operand. A
/// variable key is created once and read from memory on every lookup.
class lookup_benchmark
{
public:
    using interner = symbol_interner<lookup_benchmark>;
    using symbol   = interner::symbol;

    static constexpr const char   text_literal[] = "ruby";
    static constexpr std::int64_t integer_literal = 1;

    explicit lookup_benchmark(benchmark_config config = {})
    : _config(config), _text_key(text_literal), _integer_key(integer_literal)
    {
        _symbol_key = _symbols.intern(text_literal);

        _by_text.insert(_text_key, _config.description);
        _by_symbol.insert(_symbol_key, _config.description);
        _by_integer.insert(_integer_key, _config.description);
    }

    lookup_benchmark(const lookup_benchmark&)            = delete;
    lookup_benchmark& operator=(const lookup_benchmark&) = delete;

    /// Runs the six scenarios, replacing the results of a previous run.
    void run()
    {
        _runner.clear();

        auto iterations = _config.iterations;
        _runner.run_scenario("literal string", iterations,
                             [&] { return _by_text.lookup(std::string(text_literal)); });
        _runner.run_scenario("literal symbol", iterations,
                             [&] { return _by_symbol.lookup(_symbols.intern(text_literal)); });
        _runner.run_scenario("literal integer", iterations,
                             [&] { return _by_integer.lookup(integer_literal); });

        _runner.run_scenario("variable string", iterations,
                             [&] { return _by_text.lookup(_text_key); });
        _runner.run_scenario("variable symbol", iterations,
                             [&] { return _by_symbol.lookup(_symbol_key); });
        _runner.run_scenario("variable integer", iterations,
                             [&] { return _by_integer.lookup(_integer_key); });
    }

    void print_report(std::FILE* out) const
    {
        _runner.print_report(out);
    }

    /// Creates two instances of each key kind from the same literal and compares their identity.
    identity_sample sample_identity(key_kind kind)
    {
        switch (kind)
        {
        case key_kind::text:
        {
            std::string first(text_literal);
            std::string second(text_literal);
            return {identity_of(first), identity_of(second)};
        }
        case key_kind::interned:
        {
            auto first  = _symbols.intern(text_literal);
            auto second = _symbols.intern(text_literal);
            return {identity_of(first), identity_of(second)};
        }
        case key_kind::integer:
            break;
        }

        std::int64_t first  = integer_literal;
        std::int64_t second = integer_literal;
        return {identity_of(first), identity_of(second)};
    }

    /// Writes two `<kind>: <id> vs <id>` lines per key kind.
    void print_identity_diagnostics(std::FILE* out)
    {
        for (auto kind : {key_kind::text, key_kind::interned, key_kind::integer})
            for (auto round = 0; round != 2; ++round)
            {
                auto sample = sample_identity(kind);
                std::fprintf(out, "%s: %" PRIuPTR " vs %" PRIuPTR "\n", key_kind_name(kind),
                             sample.first, sample.second);
            }
    }

    //=== access ===//
    const benchmark_config& config() const
    {
        return _config;
    }
    const benchmark_runner& runner() const
    {
        return _runner;
    }

    const interner& symbols() const
    {
        return _symbols;
    }
    const text_table<std::string>& by_text() const
    {
        return _by_text;
    }
    const interned_table<symbol, std::string>& by_symbol() const
    {
        return _by_symbol;
    }
    const integer_table<std::string>& by_integer() const
    {
        return _by_integer;
    }

private:
    benchmark_config _config;
    interner         _symbols;

    text_table<std::string>             _by_text;
    interned_table<symbol, std::string> _by_symbol;
    integer_table<std::string>          _by_integer;

    std::string  _text_key;
    symbol       _symbol_key;
    std::int64_t _integer_key;

    benchmark_runner _runner;
};
} // namespace symkey

#endif // SYMKEY_LOOKUP_BENCHMARK_HPP_INCLUDED
