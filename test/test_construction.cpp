/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#include <blockbloom/filter.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/mp11/algorithm.hpp>
#include <stdexcept>
#include <utility>
#include <vector>
#include "test_types.hpp"
#include "test_utilities.hpp"

using namespace test_utilities;

template<typename Filter>
void test_shape()
{
  using filter=Filter;

  {
    filter f(0,0);
    BOOST_TEST_EQ(f.num_bits(),blockbloom::block_bits);
    BOOST_TEST_EQ(f.num_blocks(),1u);
    BOOST_TEST_EQ(f.k(),2u);
  }
  {
    filter f(1,1);
    BOOST_TEST_EQ(f.num_bits(),blockbloom::block_bits);
    BOOST_TEST_EQ(f.k(),2u);
  }
  {
    filter f(blockbloom::block_bits,3);
    BOOST_TEST_EQ(f.num_bits(),blockbloom::block_bits);
    BOOST_TEST_EQ(f.k(),3u);
  }
  {
    filter f(blockbloom::block_bits+1,7);
    BOOST_TEST_EQ(f.num_bits(),2*blockbloom::block_bits);
    BOOST_TEST_EQ(f.num_blocks(),2u);
  }
  for(boost::uint64_t bits:{100u,1024u,10000u,1000000u}){
    filter f(bits,4);
    BOOST_TEST_GE(f.num_bits(),bits);
    BOOST_TEST_LT(f.num_bits(),bits+blockbloom::block_bits);
    BOOST_TEST_EQ(f.num_bits()%blockbloom::block_bits,0u);
    BOOST_TEST(f.empty());
  }

  BOOST_TEST_THROWS(
    filter(blockbloom::max_bits+1,2),std::length_error);
}

template<typename Filter>
void test_construction()
{
  using filter=realloc_filter<Filter,stateful_allocator<unsigned char>>;
  using allocator_type=typename filter::allocator_type;

  auto input=random_hashes(10,1);

  {
    filter f(1000,5);
    BOOST_TEST_GE(f.num_bits(),1000u);
    BOOST_TEST_EQ(f.k(),5u);
    BOOST_TEST_EQ(f.get_allocator().state,0);
  }
  {
    filter f(1000,5,allocator_type{2025});
    BOOST_TEST_GE(f.num_bits(),1000u);
    BOOST_TEST_EQ(f.get_allocator().state,2025);
  }
  {
    filter f1(1000,5,allocator_type{2025});
    add(f1,input);
    filter f2(f1);
    BOOST_TEST_EQ(f2.num_bits(),f1.num_bits());
    BOOST_TEST_EQ(f2.k(),f1.k());
    BOOST_TEST_EQ(f2.get_allocator().state,2025);
    BOOST_TEST(f1==f2);
    check_has(f2,input);
  }
  {
    filter f1(1000,5,allocator_type{2025});
    add(f1,input);
    auto p=f1.get_allocator().last_allocation;
    filter f2(std::move(f1));
    BOOST_TEST_EQ(f1.num_blocks(),0u);
    BOOST_TEST_GE(f2.num_bits(),1000u);
    BOOST_TEST_EQ(f2.get_allocator().state,2025);
    check_has(f2,input);
    BOOST_TEST(f2.get_allocator().last_allocation==p);
  }
  {
    filter f1(1000,5,allocator_type{2025});
    add(f1,input);
    filter f2(f1,allocator_type{1492});
    BOOST_TEST_EQ(f1.get_allocator().state,2025);
    BOOST_TEST_EQ(f2.get_allocator().state,1492);
    BOOST_TEST(f1==f2);
    check_has(f2,input);
  }
  {
    filter f1(1000,5,allocator_type{2025});
    add(f1,input);
    auto p1=f1.get_allocator().last_allocation;
    filter f2(std::move(f1),allocator_type{1492});
    BOOST_TEST_EQ(f1.num_blocks(),0u);
    BOOST_TEST_EQ(f1.get_allocator().state,2025);
    BOOST_TEST_GE(f2.num_bits(),1000u);
    BOOST_TEST_EQ(f2.get_allocator().state,1492);
    check_has(f2,input);
    BOOST_TEST(f2.get_allocator().last_allocation!=nullptr);
    BOOST_TEST(f2.get_allocator().last_allocation!=p1);

    filter f3(1000,5,allocator_type{2025});
    add(f3,input);
    filter f4(std::move(f3),allocator_type{2025});
    BOOST_TEST_EQ(f3.num_blocks(),0u);
    BOOST_TEST_GE(f4.num_bits(),1000u);
    check_has(f4,input);
    BOOST_TEST(f4.get_allocator().last_allocation==nullptr);
  }
}

template<typename Filter>
void test_assignment()
{
  using filter=Filter;

  auto input=random_hashes(100,2);

  {
    filter f1(5000,6);
    add(f1,input);
    filter f2(1000,3);
    f2=f1;
    BOOST_TEST(f2==f1);
    BOOST_TEST_EQ(f2.k(),6u);
    check_has(f2,input);

    filter f3(1000,3);
    f3=std::move(f2);
    BOOST_TEST(f3==f1);
    BOOST_TEST_EQ(f2.num_blocks(),0u);
    check_has(f3,input);

    f2=f3; /* moved-from objects can be assigned to */
    BOOST_TEST(f2==f1);
  }
  {
    filter f1(5000,6);
    add(f1,input);
    filter f2(1000,3);
    auto   bits1=f1.num_bits(),bits2=f2.num_bits();
    swap(f1,f2);
    BOOST_TEST_EQ(f1.num_bits(),bits2);
    BOOST_TEST_EQ(f1.k(),3u);
    BOOST_TEST(f1.empty());
    BOOST_TEST_EQ(f2.num_bits(),bits1);
    BOOST_TEST_EQ(f2.k(),6u);
    check_has(f2,input);
  }
}

/* A moved-from filter has no blocks: has answers true, writers do
 * nothing.
 */

template<typename Filter>
void test_moved_from()
{
  using filter=Filter;

  filter f1(1000,4);
  filter f2(std::move(f1));
  BOOST_TEST_EQ(f1.num_blocks(),0u);
  BOOST_TEST_EQ(f1.num_bits(),0u);
  f1.add(42);
  f1.add_atomic(42);
  f1.clear();
  f1.fill();
  BOOST_TEST(f1.has(42));
  BOOST_TEST(f1.empty());
  BOOST_TEST_EQ(f1.cardinality(),0.0);
}

void test_make_optimized()
{
  blockbloom::config cfg{100000,0.01,0};
  auto               s=blockbloom::optimize(cfg);
  auto               f=blockbloom::make_optimized(cfg);
  BOOST_TEST_EQ(f.num_bits(),s.bits);
  BOOST_TEST_EQ(f.k(),s.hashes<2?std::size_t(2):s.hashes);

  stateful_allocator<unsigned char> al{7};
  auto f2=blockbloom::make_optimized(cfg,al);
  BOOST_TEST_EQ(f2.get_allocator().state,7);
  BOOST_TEST_EQ(f2.num_bits(),s.bits);
}

struct lambda
{
  template<typename T>
  void operator()(T)
  {
    using filter=typename T::type;

    test_shape<filter>();
    test_construction<filter>();
    test_assignment<filter>();
    test_moved_from<filter>();
  }
};

int main()
{
  boost::mp11::mp_for_each<identity_test_types>(lambda{});
  test_make_optimized();
  return boost::report_errors();
}
