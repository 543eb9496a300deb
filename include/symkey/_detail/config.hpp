// Copyright (C) 2022 Jonathan Müller and symkey contributors
// SPDX-License-Identifier: BSL-1.0

#ifndef SYMKEY_DETAIL_CONFIG_HPP_INCLUDED
#define SYMKEY_DETAIL_CONFIG_HPP_INCLUDED

#include <cstddef>
#include <cstdint>
#include <type_traits>

//=== utility traits===//
#define SYMKEY_MOV(...) static_cast<std::remove_reference_t<decltype(__VA_ARGS__)>&&>(__VA_ARGS__)
#define SYMKEY_FWD(...) static_cast<decltype(__VA_ARGS__)>(__VA_ARGS__)

//=== noinline ===//
// Keeps a measured loop out of line from its caller.
#ifndef SYMKEY_NOINLINE
#    if defined(__has_cpp_attribute)
#        if __has_cpp_attribute(gnu::noinline)
#            define SYMKEY_NOINLINE [[gnu::noinline]]
#        endif
#    endif
#
#    ifndef SYMKEY_NOINLINE
#        define SYMKEY_NOINLINE
#    endif
#endif

#endif // SYMKEY_DETAIL_CONFIG_HPP_INCLUDED
