/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_DETAIL_DOUBLE_HASHING_HPP
#define BLOCKBLOOM_DETAIL_DOUBLE_HASHING_HPP

#include <boost/config.hpp>
#include <boost/cstdint.hpp>
#include <cstddef>

namespace blockbloom{
namespace detail{

/* reduce_range maps x to [0,n) as the high half of the extended product x*n
 * (https://lemire.me/blog/2016/06/27/a-fast-alternative-to-the-modulo-reduction/).
 * n<=2^32 so the product fits in 64 bits. No division takes place, so n==0
 * is harmless and yields 0.
 */

inline std::size_t reduce_range(boost::uint32_t x,boost::uint64_t n)noexcept
{
  return (std::size_t)(((boost::uint64_t)x*n)>>32);
}

/* double_hashing expands a 64-bit hash into a block index and a sequence of
 * in-block bit positions. The upper and lower halves of the hash act as two
 * independent hashes h1, h2. h1 selects the block and is also the first bit
 * position; subsequent positions follow the enhanced double hashing
 * recurrence of Dillinger and Manolios
 * (https://www.ccs.neu.edu/home/pete/pub/bloom-filters-verification.pdf):
 *
 *   h1 <- h1+h2, h2 <- h2+i
 *
 * with i the 0-based iteration number, all arithmetic mod 2^32.
 */

class double_hashing
{
public:
  explicit double_hashing(boost::uint64_t hash)noexcept:
    h1{(boost::uint32_t)(hash>>32)},h2{(boost::uint32_t)hash}{}

  std::size_t block_index(std::size_t num_blocks)const noexcept
  {
    return reduce_range(h1,num_blocks);
  }

  BOOST_FORCEINLINE boost::uint32_t next_position()noexcept
  {
    boost::uint32_t pos=h1;
    h1+=h2;
    h2+=i++;
    return pos;
  }

private:
  boost::uint32_t h1;
  boost::uint32_t h2;
  boost::uint32_t i=0;
};

} /* namespace detail */
} /* namespace blockbloom */
#endif
