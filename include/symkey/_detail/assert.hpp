// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_DETAIL_ASSERT_HPP_INCLUDED
#define SYMKEY_DETAIL_ASSERT_HPP_INCLUDED

#include <symkey/_detail/config.hpp>

// Checks on table and interner usage; on by default in debug builds.
#ifndef SYMKEY_ENABLE_ASSERT
#    ifdef NDEBUG
#        define SYMKEY_ENABLE_ASSERT 0
#    else
#        define SYMKEY_ENABLE_ASSERT 1
#    endif
#endif

#if SYMKEY_ENABLE_ASSERT

#    include <cstdio>
#    include <cstdlib>

namespace symkey::_detail
{
[[noreturn]] inline void precondition_violated(const char* expr, const char* file, int line)
{
    std::fprintf(stderr, "%s:%d: symkey precondition violated: %s\n", file, line, expr);
    std::abort();
}
} // namespace symkey::_detail

#    define SYMKEY_PRECONDITION(Expr)                                                              \
        ((Expr) ? void(0)                                                                          \
                : ::symkey::_detail::precondition_violated(#Expr, __FILE__, __LINE__))

#else

#    define SYMKEY_PRECONDITION(Expr) static_cast<void>(sizeof(Expr))

#endif

#endif // SYMKEY_DETAIL_ASSERT_HPP_INCLUDED
