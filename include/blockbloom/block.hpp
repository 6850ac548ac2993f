/* Cache-line sized shard of a blocked Bloom filter.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_BLOCK_HPP
#define BLOCKBLOOM_BLOCK_HPP

#include <blockbloom/detail/bit.hpp>
#include <boost/atomic/atomic_ref.hpp>
#include <boost/config.hpp>
#include <boost/cstdint.hpp>
#include <boost/memory_order.hpp>
#include <climits>
#include <cstddef>

namespace blockbloom{

/* Number of bits per block, and thus the minimum number of bits of a filter.
 * Matches the L1 cache line size of x86-64 and most ARM64 parts.
 */

static constexpr std::size_t block_bits=512;

/* A block is an ordinary Bloom filter of block_bits bits. Every bit index
 * passed to the member functions below is taken modulo block_bits.
 *
 * Words are 32 bits wide and bit i lives in word i/32, position i%32. Written
 * out in little-endian order, bit i is bit i%8 of byte i/8, which is the same
 * layout 64-bit words would produce.
 */

struct alignas(64) block
{
  using word_type=boost::uint32_t;
  static constexpr std::size_t word_bits=sizeof(word_type)*CHAR_BIT;
  static constexpr std::size_t num_words=block_bits/word_bits;

  BOOST_FORCEINLINE bool get_bit(boost::uint32_t i)const noexcept
  {
    return (load_word(word_index(i))&bit_mask(i))!=0;
  }

  BOOST_FORCEINLINE void set_bit(boost::uint32_t i)noexcept
  {
    words[word_index(i)]|=bit_mask(i);
  }

  /* Lock-free version of set_bit. The word is loaded first and nothing is
   * written if the bit is already set, which is the common case once a
   * filter has been in use for a while. compare_exchange_weak refreshes old
   * on failure, so the loop ends either with our CAS succeeding or with
   * another thread's write observed.
   */

  BOOST_FORCEINLINE void set_bit_atomic(boost::uint32_t i)noexcept
  {
    const word_type              bit=bit_mask(i);
    boost::atomic_ref<word_type> w(words[word_index(i)]);
    word_type                    old=w.load(boost::memory_order_relaxed);
    while(!(old&bit)){
      if(w.compare_exchange_weak(
        old,old|bit,boost::memory_order_relaxed))return;
    }
  }

  /* Relaxed atomic load: plain reads may then run concurrently with
   * set_bit_atomic without a data race.
   */

  BOOST_FORCEINLINE word_type load_word(std::size_t n)const noexcept
  {
    return boost::atomic_ref<word_type>(const_cast<word_type&>(words[n])).
      load(boost::memory_order_relaxed);
  }

  std::size_t popcount()const noexcept
  {
    std::size_t res=0;
    for(std::size_t n=0;n<num_words;++n){
      res+=(std::size_t)detail::popcount32(words[n]);
    }
    return res;
  }

  bool none()const noexcept
  {
    for(std::size_t n=0;n<num_words;++n){
      if(load_word(n))return false;
    }
    return true;
  }

  static constexpr std::size_t word_index(boost::uint32_t i)noexcept
  {
    return (i/word_bits)%num_words;
  }

  static constexpr word_type bit_mask(boost::uint32_t i)noexcept
  {
    return word_type(1)<<(i%word_bits);
  }

  word_type words[num_words];
};

static_assert(sizeof(block)*CHAR_BIT==block_bits,"block must have no padding");

} /* namespace blockbloom */
#endif
