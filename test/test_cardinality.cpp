/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#include <blockbloom/filter.hpp>
#include <boost/core/lightweight_test.hpp>
#include <cmath>
#include <cstring>
#include <limits>
#include "test_utilities.hpp"

using namespace test_utilities;

static bool close_to(double x,double y,double delta)
{
  return std::fabs(x-y)<=delta;
}

/* Estimates within 9% of the true count at every step, and within 0.8% on
 * average every capacity keys.
 */

void test_cardinality()
{
  const std::size_t capacity=10000;

  auto f=blockbloom::make_optimized(
    blockbloom::config{capacity,0.0015,0});
  BOOST_TEST_EQ(f.cardinality(),0.0);

  splitmix64  rng{0x81feae2b};
  double      sum_n=0.0,sum_nhat=0.0;
  std::size_t misses=0;
  for(std::size_t n=1;n<=5*capacity;++n){
    f.add(rng());

    double nhat=f.cardinality();
    if(!close_to(nhat/(double)n,1.0,0.09))++misses;

    sum_n+=(double)n;
    sum_nhat+=nhat;
    if(n%capacity==0){
      BOOST_TEST(close_to(sum_nhat/sum_n,1.0,0.008));
    }
  }
  BOOST_TEST_EQ(misses,0u);
}

void test_cardinality_single_key()
{
  blockbloom::filter<> f(blockbloom::block_bits,2);
  f.add(12345);

  /* a single bit set in a single block */

  BOOST_TEST(close_to(f.cardinality(),1.0,1e-12));
}

void test_cardinality_full()
{
  {
    blockbloom::filter<> f(blockbloom::block_bits,2);
    f.fill();
    BOOST_TEST_EQ(f.cardinality(),std::numeric_limits<double>::infinity());
  }
  {
    /* one saturated block is enough */

    blockbloom::filter<> f(100*blockbloom::block_bits,5);
    f.add(1);
    f.add(2);
    std::memset(&f.blocks()[37],0xFF,sizeof(blockbloom::block));
    BOOST_TEST_EQ(f.cardinality(),std::numeric_limits<double>::infinity());

    f.clear();
    BOOST_TEST_EQ(f.cardinality(),0.0);
  }
}

int main()
{
  test_cardinality();
  test_cardinality_single_key();
  test_cardinality_full();
  return boost::report_errors();
}
