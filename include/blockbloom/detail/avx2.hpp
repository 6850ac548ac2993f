/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_DETAIL_AVX2_HPP
#define BLOCKBLOOM_DETAIL_AVX2_HPP

#if !defined(BLOCKBLOOM_DISABLE_SIMD)
#if defined(BLOCKBLOOM_ENABLE_AVX2)||defined(__AVX2__)
#define BLOCKBLOOM_AVX2
#endif
#endif

#if defined(BLOCKBLOOM_AVX2)
#include <immintrin.h>
#endif

#endif
