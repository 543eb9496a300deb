// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#include <cstdio>

#include <symkey/lookup_benchmark.hpp>

int main()
{
    symkey::lookup_benchmark bench;

    bench.run();
    bench.print_report(stdout);

    std::printf("\n");
    bench.print_identity_diagnostics(stdout);
}
