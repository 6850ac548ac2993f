/* Blocked Bloom filter over precomputed 64-bit hashes.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_FILTER_HPP
#define BLOCKBLOOM_FILTER_HPP

#include <blockbloom/block.hpp>
#include <blockbloom/detail/core.hpp>
#include <blockbloom/detail/double_hashing.hpp>
#include <blockbloom/detail/filter_printers.hpp>
#include <blockbloom/detail/set_ops.hpp>
#include <blockbloom/optimize.hpp>
#include <boost/config.hpp>
#include <boost/core/allocator_access.hpp>
#include <boost/cstdint.hpp>
#include <boost/throw_exception.hpp>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <stdexcept>

namespace blockbloom{

class loader;

#if defined(BOOST_MSVC)
#pragma warning(push)
#pragma warning(disable:4714) /* marked as __forceinline not inlined */
#endif

/* filter stores keys by their 64-bit hash, which callers compute with a
 * hash function of good quality: no mixing is done on top. The upper 32 bits
 * select a block and seed the positions set inside it, so hashes widened
 * from 32 bits give poor results.
 *
 * add and has are safe for a single writer. add_atomic may be called
 * concurrently with itself and with has; clear, fill, set operations and
 * assignment require exclusive access. See sync_filter for a fully
 * synchronized alternative.
 */

template<typename Allocator=std::allocator<unsigned char>>
class filter:detail::filter_core<Allocator>
{
  using super=detail::filter_core<Allocator>;

public:
  using allocator_type=typename super::allocator_type;
  using size_type=typename super::size_type;
  using difference_type=typename super::difference_type;

  /* Constructs an empty filter with at least bits bits (rounded up to a
   * multiple of block_bits, one block at the least) and hashes hash
   * functions, raised to 2 if lower.
   *
   * Throws std::length_error if bits>max_bits.
   */

  filter(
    boost::uint64_t bits,std::size_t hashes,
    const allocator_type& al=allocator_type()):
    super{blocks_for_bits(bits),hashes<2?std::size_t(2):hashes,al}{}

  filter(const filter&)=default;
  filter(filter&&)=default;
  filter(const filter& x,const allocator_type& al):super{x,al}{}
  filter(filter&& x,const allocator_type& al):super{std::move(x),al}{}

  filter& operator=(const filter&)=default;
  filter& operator=(filter&&)=default;

  using super::get_allocator;
  using super::num_blocks;
  using super::k;

  boost::uint64_t num_bits()const noexcept
  {
    return (boost::uint64_t)num_blocks()*block_bits;
  }

  BOOST_FORCEINLINE void add(boost::uint64_t hash)noexcept
  {
    if(!this->writable())return;

    detail::double_hashing dh{hash};
    block&                 b=super::blocks()[dh.block_index(num_blocks())];
    for(std::size_t i=1;i<k();++i)b.set_bit(dh.next_position());
  }

  /* Same effect as add, with each bit set through a compare-and-swap loop on
   * its word.
   */

  BOOST_FORCEINLINE void add_atomic(boost::uint64_t hash)noexcept
  {
    if(!this->writable())return;

    detail::double_hashing dh{hash};
    block&                 b=super::blocks()[dh.block_index(num_blocks())];
    for(std::size_t i=1;i<k();++i)b.set_bit_atomic(dh.next_position());
  }

  BOOST_FORCEINLINE bool has(boost::uint64_t hash)const noexcept
  {
    detail::double_hashing dh{hash};
    const block&           b=this->blocks()[dh.block_index(num_blocks())];
    for(std::size_t i=1;i<k();++i){
      if(!b.get_bit(dh.next_position()))return false;
    }
    return true;
  }

  void clear()noexcept{this->clear_bytes();}

  /* Sets every bit, after which has returns true for all hashes. */

  void fill()noexcept{this->fill_bytes();}

  bool empty()const noexcept
  {
    const block* p=this->blocks();
    for(std::size_t n=0;n<num_blocks();++n){
      if(!p[n].none())return false;
    }
    return true;
  }

  /* Maximum likelihood estimate of the number of distinct hashes added,
   * computed per block from its fill ratio. Infinite if any block is
   * saturated. Meaningless after intersect_with.
   */

  double cardinality()const noexcept
  {
    const double kk=(double)(k()-1);
    const double denom=kk*std::log1p(-1.0/(double)block_bits);
    const block* p=this->blocks();

    double res=0.0;
    for(std::size_t n=0;n<num_blocks();++n){
      std::size_t ones=p[n].popcount();
      if(ones==block_bits)return std::numeric_limits<double>::infinity();
      res+=std::log1p(-(double)ones/(double)block_bits)/denom;
    }
    return res;
  }

  /* Expected false positive rate of *this after capacity distinct hashes
   * have been added.
   */

  double fpr_rate(boost::uint64_t capacity)const
  {
    return blockbloom::fpr_rate(capacity,num_bits(),k());
  }

  /* In-place set operations. Both filters must have the same number of
   * blocks and hash functions, otherwise std::invalid_argument is thrown and
   * *this is left untouched.
   */

  filter& union_with(const filter& x)
  {
    return combine<detail::or_op>(x);
  }

  filter& intersect_with(const filter& x)
  {
    return combine<detail::and_op>(x);
  }

  filter& operator|=(const filter& x){return union_with(x);}
  filter& operator&=(const filter& x){return intersect_with(x);}

  void swap(filter& x)noexcept(
    boost::allocator_propagate_on_container_swap<
      allocator_type>::type::value||
    boost::allocator_is_always_equal<allocator_type>::type::value)
  {
    super::swap(x);
  }

  /* Raw access to the num_blocks() blocks. */

  block*       blocks()noexcept{return super::blocks();}
  const block* blocks()const noexcept{return super::blocks();}

  friend bool operator==(const filter& x,const filter& y)
  {
    return static_cast<const super&>(x)==static_cast<const super&>(y);
  }

  friend bool operator!=(const filter& x,const filter& y)
  {
    return !(x==y);
  }

private:
  friend class loader;

  static std::size_t blocks_for_bits(boost::uint64_t bits)
  {
    if(bits>max_bits){
      BOOST_THROW_EXCEPTION(std::length_error(
        "number of bits exceeds the maximum size of a Bloom filter"));
    }
    if(bits==0)bits=1;
    return (std::size_t)((bits+block_bits-1)/block_bits);
  }

  template<typename Op>
  filter& combine(const filter& x)
  {
    if(num_blocks()!=x.num_blocks()||k()!=x.k()){
      BOOST_THROW_EXCEPTION(std::invalid_argument(
        "incompatible filters: different number of blocks or hashes"));
    }
    if(this!=&x&&this->writable()){
      detail::combine<Op>(super::blocks(),x.blocks(),num_blocks());
    }
    return *this;
  }
};

#if defined(BOOST_MSVC)
#pragma warning(pop) /* C4714 */
#endif

template<typename Allocator>
void swap(filter<Allocator>& x,filter<Allocator>& y)
  noexcept(noexcept(x.swap(y)))
{
  x.swap(y);
}

/* Constructs an empty filter sized with optimize(cfg). */

template<typename Allocator=std::allocator<unsigned char>>
filter<Allocator> make_optimized(
  const config& cfg,const Allocator& al=Allocator())
{
  sizing s=optimize(cfg);
  return filter<Allocator>{s.bits,s.hashes,al};
}

} /* namespace blockbloom */
#endif
