/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_DETAIL_SSE2_HPP
#define BLOCKBLOOM_DETAIL_SSE2_HPP

#if !defined(BLOCKBLOOM_DISABLE_SIMD)
#if defined(BLOCKBLOOM_ENABLE_SSE2)|| \
    defined(__SSE2__)|| \
    defined(_M_X64)||(defined(_M_IX86_FP)&&_M_IX86_FP>=2)
#define BLOCKBLOOM_SSE2
#endif
#endif

#if defined(BLOCKBLOOM_SSE2)
#include <emmintrin.h>
#endif

#endif
