// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_BENCHMARK_RUNNER_HPP_INCLUDED
#define SYMKEY_BENCHMARK_RUNNER_HPP_INCLUDED

#include <benchmark/benchmark.h>
#include <chrono>
#include <cstdio>
#include <string>
#include <symkey/_detail/config.hpp>
#include <vector>

namespace symkey
{
struct timing_result
{
    std::string              label;
    std::chrono::nanoseconds elapsed;
};
} // namespace symkey

namespace symkey::_detail
{
template <typename Fn>
SYMKEY_NOINLINE std::chrono::nanoseconds time_loop(std::size_t iterations, Fn& fn)
{
    using clock = std::chrono::steady_clock;

    auto start = clock::now();
    for (auto i = std::size_t(0); i != iterations; ++i)
    {
        if constexpr (std::is_void_v<decltype(fn())>)
        {
            fn();
        }
        else
        {
            auto result = fn();
            benchmark::DoNotOptimize(result);
        }
    }
    auto end = clock::now();

    return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
}
} // namespace symkey::_detail

namespace symkey
{
/// Times scenarios and keeps their results in the order they ran.
class benchmark_runner
{
public:
    /// Invokes `fn` `iterations` times back to back and records the total time as `label`.
    template <typename Fn>
    const timing_result& run_scenario(std::string label, std::size_t iterations, Fn&& fn)
    {
        auto elapsed = _detail::time_loop(iterations, fn);
        _results.push_back({SYMKEY_MOV(label), elapsed});
        return _results.back();
    }

    const std::vector<timing_result>& results() const
    {
        return _results;
    }

    void clear()
    {
        _results.clear();
    }

    /// Writes one `<label>: <seconds>` line per result.
    void print_report(std::FILE* out) const
    {
        auto width = std::size_t(0);
        for (auto& result : _results)
            if (result.label.size() > width)
                width = result.label.size();

        for (auto& result : _results)
        {
            auto seconds = std::chrono::duration<double>(result.elapsed).count();
            std::fprintf(out, "%s:%*s %.6fs\n", result.label.c_str(),
                         int(width - result.label.size()), "", seconds);
        }
    }

private:
    std::vector<timing_result> _results;
};
} // namespace symkey

#endif // SYMKEY_BENCHMARK_RUNNER_HPP_INCLUDED
