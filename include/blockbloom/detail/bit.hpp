/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_DETAIL_BIT_HPP
#define BLOCKBLOOM_DETAIL_BIT_HPP

#include <boost/config.hpp>
#include <boost/cstdint.hpp>

namespace blockbloom{
namespace detail{

inline int popcount32(boost::uint32_t x)noexcept
{
#if defined(BOOST_GCC)||defined(BOOST_CLANG)
  return __builtin_popcount(x);
#else
  x=x-((x>>1)&0x55555555u);
  x=(x&0x33333333u)+((x>>2)&0x33333333u);
  x=(x+(x>>4))&0x0F0F0F0Fu;
  return (int)((x*0x01010101u)>>24);
#endif
}

} /* namespace detail */
} /* namespace blockbloom */
#endif
