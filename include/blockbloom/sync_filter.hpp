/* Fully synchronized blocked Bloom filter.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_SYNC_FILTER_HPP
#define BLOCKBLOOM_SYNC_FILTER_HPP

#include <blockbloom/filter.hpp>
#include <blockbloom/io.hpp>
#include <blockbloom/optimize.hpp>
#include <boost/cstdint.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>

namespace blockbloom{

/* sync_filter behaves as a filter guarded by a mutex that every member
 * function holds for its whole duration, so any mix of operations from any
 * number of threads is safe. When only add and has run concurrently,
 * filter::add_atomic on a plain filter is considerably faster.
 */

template<typename Allocator=std::allocator<unsigned char>>
class sync_filter
{
  using lock_guard=std::lock_guard<std::mutex>;

public:
  using filter_type=filter<Allocator>;
  using allocator_type=typename filter_type::allocator_type;

  sync_filter(
    boost::uint64_t bits,std::size_t hashes,
    const allocator_type& al=allocator_type()):
    f{bits,hashes,al}{}

  explicit sync_filter(
    const config& cfg,const allocator_type& al=allocator_type()):
    f{make_optimized(cfg,al)}{}

  explicit sync_filter(const filter_type& x):f{x}{}
  explicit sync_filter(filter_type&& x):f{std::move(x)}{}

  sync_filter(const sync_filter&)=delete;
  sync_filter& operator=(const sync_filter&)=delete;

  void add(boost::uint64_t hash)
  {
    lock_guard lck{mtx};
    f.add(hash);
  }

  bool has(boost::uint64_t hash)const
  {
    lock_guard lck{mtx};
    return f.has(hash);
  }

  void clear()
  {
    lock_guard lck{mtx};
    f.clear();
  }

  void fill()
  {
    lock_guard lck{mtx};
    f.fill();
  }

  bool empty()const
  {
    lock_guard lck{mtx};
    return f.empty();
  }

  boost::uint64_t num_bits()const
  {
    lock_guard lck{mtx};
    return f.num_bits();
  }

  std::size_t num_blocks()const
  {
    lock_guard lck{mtx};
    return f.num_blocks();
  }

  std::size_t k()const
  {
    lock_guard lck{mtx};
    return f.k();
  }

  double cardinality()const
  {
    lock_guard lck{mtx};
    return f.cardinality();
  }

  double fpr_rate(boost::uint64_t capacity)const
  {
    lock_guard lck{mtx};
    return f.fpr_rate(capacity);
  }

  /* x itself is not locked. */

  void union_with(const filter_type& x)
  {
    lock_guard lck{mtx};
    f.union_with(x);
  }

  void intersect_with(const filter_type& x)
  {
    lock_guard lck{mtx};
    f.intersect_with(x);
  }

  /* Copy of the current state. */

  filter_type snapshot()const
  {
    lock_guard lck{mtx};
    return f;
  }

  boost::uint64_t dump(
    std::ostream& os,const std::string& comment,
    boost::system::error_code& ec)const
  {
    lock_guard lck{mtx};
    return blockbloom::dump(os,f,comment,ec);
  }

  boost::uint64_t dump(std::ostream& os,const std::string& comment)const
  {
    lock_guard lck{mtx};
    return blockbloom::dump(os,f,comment);
  }

  void load(loader& l,boost::system::error_code& ec)
  {
    lock_guard lck{mtx};
    l.load(f,ec);
  }

  void load(loader& l)
  {
    lock_guard lck{mtx};
    l.load(f);
  }

  friend bool operator==(const sync_filter& x,const filter_type& y)
  {
    lock_guard lck{x.mtx};
    return x.f==y;
  }

  friend bool operator==(const filter_type& x,const sync_filter& y)
  {
    return y==x;
  }

  friend bool operator!=(const sync_filter& x,const filter_type& y)
  {
    return !(x==y);
  }

  friend bool operator!=(const filter_type& x,const sync_filter& y)
  {
    return !(y==x);
  }

private:
  mutable std::mutex mtx;
  filter_type        f;
};

} /* namespace blockbloom */
#endif
