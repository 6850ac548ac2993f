/* Bitwise combination of block arrays.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_DETAIL_SET_OPS_HPP
#define BLOCKBLOOM_DETAIL_SET_OPS_HPP

#include <blockbloom/block.hpp>
#include <blockbloom/detail/avx2.hpp>
#include <blockbloom/detail/sse2.hpp>
#include <boost/config.hpp>
#include <cstddef>

namespace blockbloom{
namespace detail{

/* Each operation provides a scalar overload on words and, where the
 * corresponding instruction set is enabled, overloads on SSE2/AVX2 registers.
 */

struct or_op
{
  static BOOST_FORCEINLINE block::word_type apply(
    block::word_type x,block::word_type y)noexcept{return x|y;}

#if defined(BLOCKBLOOM_SSE2)
  static BOOST_FORCEINLINE __m128i apply(__m128i x,__m128i y)noexcept
  {
    return _mm_or_si128(x,y);
  }
#endif

#if defined(BLOCKBLOOM_AVX2)
  static BOOST_FORCEINLINE __m256i apply(__m256i x,__m256i y)noexcept
  {
    return _mm256_or_si256(x,y);
  }
#endif
};

struct and_op
{
  static BOOST_FORCEINLINE block::word_type apply(
    block::word_type x,block::word_type y)noexcept{return x&y;}

#if defined(BLOCKBLOOM_SSE2)
  static BOOST_FORCEINLINE __m128i apply(__m128i x,__m128i y)noexcept
  {
    return _mm_and_si128(x,y);
  }
#endif

#if defined(BLOCKBLOOM_AVX2)
  static BOOST_FORCEINLINE __m256i apply(__m256i x,__m256i y)noexcept
  {
    return _mm256_and_si256(x,y);
  }
#endif
};

/* Reference implementation: word by word. */

template<typename Op>
void combine_portable(block* a,const block* b,std::size_t n)noexcept
{
  for(std::size_t i=0;i<n;++i){
    for(std::size_t j=0;j<block::num_words;++j){
      a[i].words[j]=Op::apply(a[i].words[j],b[i].words[j]);
    }
  }
}

#if defined(BLOCKBLOOM_AVX2)

/* Two blocks (four 256-bit registers per operand) per iteration. Blocks are
 * 64-byte aligned, so aligned loads and stores are safe.
 */

template<typename Op>
void combine_simd(block* a,const block* b,std::size_t n)noexcept
{
  static constexpr std::size_t regs_per_block=sizeof(block)/sizeof(__m256i);

  std::size_t i=0;
  for(;i+2<=n;i+=2){
    __m256i*       p=reinterpret_cast<__m256i*>(&a[i]);
    const __m256i* q=reinterpret_cast<const __m256i*>(&b[i]);
    __m256i x0=_mm256_load_si256(p+0),y0=_mm256_load_si256(q+0),
            x1=_mm256_load_si256(p+1),y1=_mm256_load_si256(q+1),
            x2=_mm256_load_si256(p+2),y2=_mm256_load_si256(q+2),
            x3=_mm256_load_si256(p+3),y3=_mm256_load_si256(q+3);
    _mm256_store_si256(p+0,Op::apply(x0,y0));
    _mm256_store_si256(p+1,Op::apply(x1,y1));
    _mm256_store_si256(p+2,Op::apply(x2,y2));
    _mm256_store_si256(p+3,Op::apply(x3,y3));
  }
  if(i<n){
    __m256i*       p=reinterpret_cast<__m256i*>(&a[i]);
    const __m256i* q=reinterpret_cast<const __m256i*>(&b[i]);
    for(std::size_t j=0;j<regs_per_block;++j){
      _mm256_store_si256(
        p+j,Op::apply(_mm256_load_si256(p+j),_mm256_load_si256(q+j)));
    }
  }
}

#elif defined(BLOCKBLOOM_SSE2)

/* Two blocks (eight 128-bit registers per operand) per iteration. */

template<typename Op>
void combine_simd(block* a,const block* b,std::size_t n)noexcept
{
  static constexpr std::size_t regs_per_block=sizeof(block)/sizeof(__m128i);

  std::size_t i=0;
  for(;i+2<=n;i+=2){
    __m128i*       p=reinterpret_cast<__m128i*>(&a[i]);
    const __m128i* q=reinterpret_cast<const __m128i*>(&b[i]);
    for(std::size_t j=0;j<2*regs_per_block;j+=4){
      __m128i x0=_mm_load_si128(p+j+0),y0=_mm_load_si128(q+j+0),
              x1=_mm_load_si128(p+j+1),y1=_mm_load_si128(q+j+1),
              x2=_mm_load_si128(p+j+2),y2=_mm_load_si128(q+j+2),
              x3=_mm_load_si128(p+j+3),y3=_mm_load_si128(q+j+3);
      _mm_store_si128(p+j+0,Op::apply(x0,y0));
      _mm_store_si128(p+j+1,Op::apply(x1,y1));
      _mm_store_si128(p+j+2,Op::apply(x2,y2));
      _mm_store_si128(p+j+3,Op::apply(x3,y3));
    }
  }
  if(i<n){
    __m128i*       p=reinterpret_cast<__m128i*>(&a[i]);
    const __m128i* q=reinterpret_cast<const __m128i*>(&b[i]);
    for(std::size_t j=0;j<regs_per_block;++j){
      _mm_store_si128(p+j,Op::apply(_mm_load_si128(p+j),_mm_load_si128(q+j)));
    }
  }
}

#endif

#if defined(BLOCKBLOOM_AVX2)||defined(BLOCKBLOOM_SSE2)
#define BLOCKBLOOM_SIMD_SET_OPS
#endif

template<typename Op>
void combine(block* a,const block* b,std::size_t n)noexcept
{
#if defined(BLOCKBLOOM_SIMD_SET_OPS)
  combine_simd<Op>(a,b,n);
#else
  combine_portable<Op>(a,b,n);
#endif
}

} /* namespace detail */
} /* namespace blockbloom */
#endif
